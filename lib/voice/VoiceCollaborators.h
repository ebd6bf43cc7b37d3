/**
 * @file VoiceCollaborators.h
 * @brief External services the voice pipeline hands finished recordings to
 *
 * Implementations wrap speech-to-text and chat services. They may block;
 * the pipeline calls them from its processing step without holding locks.
 * An exception thrown from either is caught by the pipeline and treated
 * like FAILED.
 */
#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace Tapir { namespace Voice {

enum class CollaboratorResult : uint8_t {
    SUCCESS,
    NO_CREDENTIAL,      // Service not configured; not an error for the session
    FAILED
};

inline const char* collaboratorResultToString(CollaboratorResult result) {
    switch (result) {
        case CollaboratorResult::SUCCESS:       return "SUCCESS";
        case CollaboratorResult::NO_CREDENTIAL: return "NO_CREDENTIAL";
        case CollaboratorResult::FAILED:        return "FAILED";
        default:                                return "UNKNOWN";
    }
}

class ITranscriber {
public:
    virtual ~ITranscriber() = default;

    virtual CollaboratorResult transcribe(const std::vector<int16_t>& samples,
                                          uint32_t sample_rate,
                                          std::string& transcript) = 0;
};

class IResponder {
public:
    virtual ~IResponder() = default;

    virtual CollaboratorResult respond(const std::string& text, std::string& response) = 0;
};

}} // namespace Tapir::Voice
