/**
 * @file WavWriter.cpp
 * @brief WAV encoding
 */

#include "WavWriter.h"
#include "Log.h"

#include <fstream>

namespace Tapir { namespace Voice {

namespace {

void appendTag(Bytes& out, const char* tag) {
    for (int i = 0; i < 4; i++) {
        out.append(static_cast<uint8_t>(tag[i]));
    }
}

void appendLE16(Bytes& out, uint16_t value) {
    out.append(static_cast<uint8_t>(value & 0xFF));
    out.append(static_cast<uint8_t>((value >> 8) & 0xFF));
}

void appendLE32(Bytes& out, uint32_t value) {
    out.append(static_cast<uint8_t>(value & 0xFF));
    out.append(static_cast<uint8_t>((value >> 8) & 0xFF));
    out.append(static_cast<uint8_t>((value >> 16) & 0xFF));
    out.append(static_cast<uint8_t>((value >> 24) & 0xFF));
}

} // namespace

Bytes WavWriter::encode(const std::vector<int16_t>& samples, uint32_t sample_rate) {
    const uint16_t channels = 1;
    const uint16_t bits_per_sample = 16;
    const uint16_t block_align = channels * bits_per_sample / 8;
    const uint32_t byte_rate = sample_rate * block_align;
    const uint32_t data_size = static_cast<uint32_t>(samples.size() * block_align);

    Bytes out(HEADER_SIZE + data_size);

    // RIFF chunk
    appendTag(out, "RIFF");
    appendLE32(out, 36 + data_size);
    appendTag(out, "WAVE");

    // fmt chunk
    appendTag(out, "fmt ");
    appendLE32(out, 16);
    appendLE16(out, 1);                 // PCM
    appendLE16(out, channels);
    appendLE32(out, sample_rate);
    appendLE32(out, byte_rate);
    appendLE16(out, block_align);
    appendLE16(out, bits_per_sample);

    // data chunk
    appendTag(out, "data");
    appendLE32(out, data_size);
    for (int16_t sample : samples) {
        appendLE16(out, static_cast<uint16_t>(sample));
    }

    return out;
}

bool WavWriter::write(const std::string& path, const std::vector<int16_t>& samples, uint32_t sample_rate) {
    Bytes wav = encode(samples, sample_rate);

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        ERROR("WavWriter: Failed to open " + path);
        return false;
    }
    file.write(reinterpret_cast<const char*>(wav.data()), static_cast<std::streamsize>(wav.size()));
    if (!file) {
        ERROR("WavWriter: Failed to write " + path);
        return false;
    }

    INFO("WavWriter: Wrote " + std::to_string(samples.size()) + " samples to " + path);
    return true;
}

}} // namespace Tapir::Voice
