/**
 * @file VoicePipeline.h
 * @brief Push-to-talk session state machine
 *
 *   IDLE --VOICE_START--> LISTENING --VOICE_END--> PROCESSING --response--> SPEAKING
 *     ^                                               |                        |
 *     +------------------- no response ---------------+------------------------+
 *
 * Registered with the message dispatcher as an interceptor so VOICE_START,
 * VOICE_DATA and VOICE_END are consumed ahead of generic handling. Data
 * packets are decoded one frame at a time into the session's sample buffer;
 * sequence numbers are checked against the expected value and discontinuities
 * are counted, never fatal. A frame that fails to decode contributes silence.
 *
 * VOICE_END runs processing synchronously on the calling thread: transcribe,
 * respond (falling back to echoing the transcript), speak, back to IDLE.
 * cancel() may be called from any thread or from inside a collaborator; the
 * processing step checks a session generation after every collaborator call
 * and stops as soon as it changes.
 *
 * Collaborators are not owned and may be null: no transcriber yields an empty
 * transcript, no responder yields the echo fallback, no speech output skips
 * playback.
 */
#pragma once

#include "VoiceTypes.h"
#include "VoiceCollaborators.h"
#include "FrameDecoder.h"
#include "AudioTypes.h"
#include "MessageDispatcher.h"
#include "Bytes.h"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace Tapir { namespace Voice {

class VoicePipeline : public BLE::IMessageInterceptor {
public:
    using Listener = std::function<void(const VoiceEvent& event)>;
    using ListenerId = uint32_t;

    struct Callbacks {
        using OnStateChanged = std::function<void(VoiceState from, VoiceState to)>;
        using OnText = std::function<void(const std::string& text)>;
    };

public:
    /**
     * @param decoder Frame decoder; PCM16 at 16 kHz when null
     */
    explicit VoicePipeline(std::unique_ptr<IFrameDecoder> decoder = nullptr);
    virtual ~VoicePipeline() = default;

    VoicePipeline(const VoicePipeline&) = delete;
    VoicePipeline& operator=(const VoicePipeline&) = delete;

    //=========================================================================
    // Collaborators
    //=========================================================================

    void setTranscriber(ITranscriber* transcriber);
    void setResponder(IResponder* responder);
    void setSpeechOutput(Audio::ISpeechOutput* output);
    void setDecoder(std::unique_ptr<IFrameDecoder> decoder);

    //=========================================================================
    // Inbound stream
    //=========================================================================

    /**
     * @brief Claim VOICE_START, VOICE_DATA and VOICE_END
     */
    virtual bool intercept(const BLE::Message& message) override;

    /**
     * @brief Open a new session (IDLE or LISTENING)
     * @return false if the pipeline is busy processing or speaking
     */
    bool onVoiceStart();

    /**
     * @brief Account and decode one data packet
     * @return false if the packet was dropped
     */
    bool onVoiceData(const Bytes& payload);

    /**
     * @brief Finish the session and run processing to completion
     * @return false if there was no session to finish
     */
    bool onVoiceEnd();

    /**
     * @brief Abandon the session or halt playback, back to IDLE
     * @return false if already idle
     */
    bool cancel();

    //=========================================================================
    // Observers
    //=========================================================================

    ListenerId subscribe(Listener listener);
    void unsubscribe(ListenerId id);

    void setOnStateChanged(Callbacks::OnStateChanged callback);
    void setOnTranscript(Callbacks::OnText callback);
    void setOnResponse(Callbacks::OnText callback);

    //=========================================================================
    // Inspection
    //=========================================================================

    VoiceState state() const;
    bool hasSession() const;
    uint16_t expectedSequence() const;
    uint32_t sequenceGaps() const;
    LiveStats liveStats() const;
    VoiceStatus status() const;

    /**
     * @brief The most recently finished session (ended == true)
     * @return false if none has finished yet
     */
    bool lastSession(VoiceSession& session) const;

    bool hasClipForPlayback() const;
    std::vector<int16_t> lastClip() const;
    Bytes lastClipWav() const;
    VoiceClipInfo lastClipInfo() const;
    VoiceResult lastResult() const;
    uint32_t sampleRate() const;

private:
    bool setState(uint32_t generation, VoiceState state);
    void accountSequence(uint16_t sequence);
    void runProcessing(uint32_t generation, const std::vector<int16_t>& samples, uint32_t sample_rate);
    void processSession(uint32_t generation, const std::vector<int16_t>& samples, uint32_t sample_rate);
    std::string transcribe(const std::vector<int16_t>& samples, uint32_t sample_rate);
    std::string respond(const std::string& transcript);
    void speak(const std::string& response);
    bool isCurrent(uint32_t generation) const;
    void finishSession(uint32_t generation);
    void emit(const VoiceEvent& event);
    void emitError(const std::string& description);
    void notifyStateChanged(const Callbacks::OnStateChanged& callback, VoiceState from, VoiceState to);
    void notifyText(const Callbacks::OnText& callback, const std::string& text, const char* what);

    static bool isUsableTranscript(const std::string& transcript);

    std::unique_ptr<IFrameDecoder> _decoder;
    ITranscriber* _transcriber = nullptr;
    IResponder* _responder = nullptr;
    Audio::ISpeechOutput* _speech = nullptr;

    VoiceState _state = VoiceState::IDLE;
    uint32_t _generation = 0;
    std::unique_ptr<VoiceSession> _session;

    bool _has_last_session = false;
    VoiceSession _last_session;
    bool _has_clip_info = false;
    VoiceClipInfo _last_clip_info;
    bool _has_result = false;
    VoiceResult _last_result;

    std::map<ListenerId, Listener> _listeners;
    ListenerId _next_listener_id = 1;
    Callbacks::OnStateChanged _on_state_changed = nullptr;
    Callbacks::OnText _on_transcript = nullptr;
    Callbacks::OnText _on_response = nullptr;

    mutable std::recursive_mutex _mutex;
};

}} // namespace Tapir::Voice
