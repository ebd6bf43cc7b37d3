/**
 * @file FrameDecoder.cpp
 * @brief PCM16 decoder and decoder factory
 */

#include "FrameDecoder.h"
#include "Log.h"

#ifdef TAPIR_HAVE_OPUS
#include "OpusFrameDecoder.h"
#endif

#include <algorithm>
#include <cstdio>
#include <cctype>

namespace Tapir { namespace Voice {

Pcm16FrameDecoder::Pcm16FrameDecoder(uint32_t sample_rate, size_t samples_per_frame)
    : _sample_rate(sample_rate), _samples_per_frame(samples_per_frame) {
}

bool Pcm16FrameDecoder::decode(const Bytes& coded, std::vector<int16_t>& samples) {
    if (coded.size() != _samples_per_frame * 2) {
        char buf[80];
        snprintf(buf, sizeof(buf), "Pcm16FrameDecoder: Frame is %zu bytes, expected %zu",
                 coded.size(), _samples_per_frame * 2);
        TRACE(buf);
        return false;
    }

    const uint8_t* data = coded.data();
    samples.resize(_samples_per_frame);
    for (size_t i = 0; i < _samples_per_frame; i++) {
        uint16_t bits = static_cast<uint16_t>(data[i * 2] | (data[i * 2 + 1] << 8));
        int32_t value = bits;
        if (value >= 0x8000) {
            value -= 0x10000;
        }
        samples[i] = static_cast<int16_t>(value);
    }
    return true;
}

//=============================================================================
// Factory
//=============================================================================

namespace {

std::string lower(const std::string& text) {
    std::string result = text;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

} // namespace

std::unique_ptr<IFrameDecoder> FrameDecoderFactory::create(const std::string& codec, uint32_t sample_rate) {
    std::string name = lower(codec);
    size_t samples_per_frame = sample_rate * Stream::FRAME_DURATION_MS / 1000;

    if (name == "pcm16" || name == "pcm") {
        return std::unique_ptr<IFrameDecoder>(new Pcm16FrameDecoder(sample_rate, samples_per_frame));
    }

#ifdef TAPIR_HAVE_OPUS
    if (name == "opus") {
        std::unique_ptr<OpusFrameDecoder> decoder(new OpusFrameDecoder(sample_rate, samples_per_frame));
        if (!decoder->isValid()) {
            ERROR("FrameDecoderFactory: Opus decoder failed to initialize");
            return nullptr;
        }
        return std::move(decoder);
    }
#endif

    ERROR("FrameDecoderFactory: Unsupported codec '" + codec + "'");
    return nullptr;
}

bool FrameDecoderFactory::isSupported(const std::string& codec) {
    std::string name = lower(codec);
    if (name == "pcm16" || name == "pcm") {
        return true;
    }
#ifdef TAPIR_HAVE_OPUS
    if (name == "opus") {
        return true;
    }
#endif
    return false;
}

}} // namespace Tapir::Voice
