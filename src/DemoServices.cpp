/**
 * @file DemoServices.cpp
 * @brief Offline speech service stand-ins
 */

#include "DemoServices.h"
#include "Log.h"

#include <cmath>
#include <cstdio>

namespace Tapir {

Voice::CollaboratorResult SignalTranscriber::transcribe(const std::vector<int16_t>& samples,
                                                        uint32_t sample_rate,
                                                        std::string& transcript) {
    if (samples.empty() || sample_rate == 0) {
        transcript = "[BLANK_AUDIO]";
        return Voice::CollaboratorResult::SUCCESS;
    }

    double sum = 0;
    for (int16_t sample : samples) {
        sum += static_cast<double>(sample) * sample;
    }
    double rms = std::sqrt(sum / samples.size());
    double seconds = static_cast<double>(samples.size()) / sample_rate;

    if (rms < SILENCE_RMS) {
        transcript = "[BLANK_AUDIO]";
        return Voice::CollaboratorResult::SUCCESS;
    }

    char buf[64];
    snprintf(buf, sizeof(buf), "tone, %.2f seconds", seconds);
    transcript = buf;
    return Voice::CollaboratorResult::SUCCESS;
}

bool ConsoleSynthesizer::synthesize(const std::string& text, Audio::AudioOutput output) {
    _last_spoken = text;
    INFO(std::string("Speaking on ") + Audio::outputToString(output) + ": \"" + text + "\"");
    return true;
}

void ConsoleSynthesizer::stop() {
    DEBUG("ConsoleSynthesizer: Playback stopped");
}

} // namespace Tapir
