/**
 * @file DemoServices.h
 * @brief Offline stand-ins for the speech services used by tapir_host
 *
 * The real deployment talks to cloud speech-to-text, chat and TTS services.
 * These keep the host runnable without credentials: the transcriber
 * describes the captured audio, the synthesizer logs what it would say.
 */
#pragma once

#include "VoiceCollaborators.h"
#include "AudioRouter.h"

#include <string>
#include <vector>

namespace Tapir {

/**
 * @brief Describes the clip ("tone, 1.00 seconds") or reports silence
 */
class SignalTranscriber : public Voice::ITranscriber {
public:
    static constexpr double SILENCE_RMS = 64.0;

    virtual Voice::CollaboratorResult transcribe(const std::vector<int16_t>& samples,
                                                 uint32_t sample_rate,
                                                 std::string& transcript) override;
};

class ConsoleSynthesizer : public Audio::ISpeechSynthesizer {
public:
    virtual bool synthesize(const std::string& text, Audio::AudioOutput output) override;
    virtual void stop() override;

    const std::string& lastSpoken() const { return _last_spoken; }

private:
    std::string _last_spoken;
};

} // namespace Tapir
