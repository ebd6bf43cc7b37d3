/**
 * @file FrameDecoder.h
 * @brief Per-frame audio decoders for VOICE_DATA payloads
 *
 * One coded frame in, one fixed-length block of samples out. Decoders may
 * keep state between frames (Opus does); reset() is called at the start of
 * every session.
 */
#pragma once

#include "VoiceTypes.h"
#include "Bytes.h"

#include <memory>
#include <string>
#include <vector>
#include <cstdint>

namespace Tapir { namespace Voice {

class IFrameDecoder {
public:
    virtual ~IFrameDecoder() = default;

    /**
     * @brief Decode one coded frame
     * @param coded The frame bytes following the packet header
     * @param samples Receives exactly samplesPerFrame() samples on success
     * @return false if the frame could not be decoded
     */
    virtual bool decode(const Bytes& coded, std::vector<int16_t>& samples) = 0;

    virtual void reset() = 0;

    virtual uint32_t sampleRate() const = 0;
    virtual size_t samplesPerFrame() const = 0;
    virtual std::string name() const = 0;
};

/**
 * @brief Uncompressed 16-bit little-endian PCM frames
 */
class Pcm16FrameDecoder : public IFrameDecoder {
public:
    explicit Pcm16FrameDecoder(uint32_t sample_rate = Stream::SAMPLE_RATE,
                               size_t samples_per_frame = Stream::SAMPLES_PER_FRAME);

    virtual bool decode(const Bytes& coded, std::vector<int16_t>& samples) override;
    virtual void reset() override {}

    virtual uint32_t sampleRate() const override { return _sample_rate; }
    virtual size_t samplesPerFrame() const override { return _samples_per_frame; }
    virtual std::string name() const override { return "pcm16"; }

private:
    uint32_t _sample_rate;
    size_t _samples_per_frame;
};

/**
 * @brief Factory for decoders by codec name ("pcm16", "opus")
 */
class FrameDecoderFactory {
public:
    /**
     * @return nullptr if the codec is unknown or was not built in
     */
    static std::unique_ptr<IFrameDecoder> create(const std::string& codec,
                                                 uint32_t sample_rate = Stream::SAMPLE_RATE);

    static bool isSupported(const std::string& codec);
};

}} // namespace Tapir::Voice
