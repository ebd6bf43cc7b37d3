/**
 * @file OpusFrameDecoder.h
 * @brief libopus-backed frame decoder (mono)
 */
#pragma once

#include "FrameDecoder.h"

struct OpusDecoder;

namespace Tapir { namespace Voice {

class OpusFrameDecoder : public IFrameDecoder {
public:
    OpusFrameDecoder(uint32_t sample_rate = Stream::SAMPLE_RATE,
                     size_t samples_per_frame = Stream::SAMPLES_PER_FRAME);
    virtual ~OpusFrameDecoder();

    OpusFrameDecoder(const OpusFrameDecoder&) = delete;
    OpusFrameDecoder& operator=(const OpusFrameDecoder&) = delete;

    bool isValid() const { return _decoder != nullptr; }

    virtual bool decode(const Bytes& coded, std::vector<int16_t>& samples) override;
    virtual void reset() override;

    virtual uint32_t sampleRate() const override { return _sample_rate; }
    virtual size_t samplesPerFrame() const override { return _samples_per_frame; }
    virtual std::string name() const override { return "opus"; }

private:
    OpusDecoder* _decoder = nullptr;
    uint32_t _sample_rate;
    size_t _samples_per_frame;
};

}} // namespace Tapir::Voice
