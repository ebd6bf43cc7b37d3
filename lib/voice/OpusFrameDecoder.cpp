/**
 * @file OpusFrameDecoder.cpp
 * @brief libopus-backed frame decoder
 */

#include "OpusFrameDecoder.h"
#include "Log.h"

#include <opus.h>

namespace Tapir { namespace Voice {

OpusFrameDecoder::OpusFrameDecoder(uint32_t sample_rate, size_t samples_per_frame)
    : _sample_rate(sample_rate), _samples_per_frame(samples_per_frame) {
    int error = OPUS_OK;
    _decoder = opus_decoder_create(static_cast<opus_int32>(sample_rate), 1, &error);
    if (error != OPUS_OK) {
        ERROR(std::string("OpusFrameDecoder: Create failed: ") + opus_strerror(error));
        _decoder = nullptr;
    }
}

OpusFrameDecoder::~OpusFrameDecoder() {
    if (_decoder) {
        opus_decoder_destroy(_decoder);
    }
}

bool OpusFrameDecoder::decode(const Bytes& coded, std::vector<int16_t>& samples) {
    if (!_decoder || coded.size() == 0) {
        return false;
    }

    samples.assign(_samples_per_frame, 0);
    int decoded = opus_decode(_decoder, coded.data(), static_cast<opus_int32>(coded.size()),
                              samples.data(), static_cast<int>(_samples_per_frame), 0);
    if (decoded < 0) {
        TRACE(std::string("OpusFrameDecoder: Decode failed: ") + opus_strerror(decoded));
        return false;
    }

    // Short output is padded with the zeros already in place
    return true;
}

void OpusFrameDecoder::reset() {
    if (_decoder) {
        opus_decoder_ctl(_decoder, OPUS_RESET_STATE);
    }
}

}} // namespace Tapir::Voice
