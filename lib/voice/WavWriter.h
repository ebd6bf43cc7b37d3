/**
 * @file WavWriter.h
 * @brief 16-bit mono PCM WAV encoding for clip replay and export
 */
#pragma once

#include "VoiceTypes.h"
#include "Bytes.h"

#include <string>
#include <vector>
#include <cstdint>

namespace Tapir { namespace Voice {

namespace WavWriter {

    static constexpr size_t HEADER_SIZE = 44;

    /**
     * @brief Encode samples as a RIFF/WAVE file image (44-byte header + data)
     */
    Bytes encode(const std::vector<int16_t>& samples, uint32_t sample_rate = Stream::SAMPLE_RATE);

    /**
     * @brief Write a WAV file
     * @return false if the file could not be written
     */
    bool write(const std::string& path, const std::vector<int16_t>& samples,
               uint32_t sample_rate = Stream::SAMPLE_RATE);

} // namespace WavWriter

}} // namespace Tapir::Voice
