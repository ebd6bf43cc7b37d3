/**
 * @file VoicePipeline.cpp
 * @brief Push-to-talk session state machine implementation
 */

#include "VoicePipeline.h"
#include "WavWriter.h"
#include "Log.h"
#include "Utilities/OS.h"

#include <exception>
#include <cstdio>

namespace Tapir { namespace Voice {

static const char* FALLBACK_PREFIX = "You said: ";

VoicePipeline::VoicePipeline(std::unique_ptr<IFrameDecoder> decoder)
    : _decoder(std::move(decoder)) {
    if (!_decoder) {
        _decoder.reset(new Pcm16FrameDecoder());
    }
}

//=============================================================================
// Collaborators
//=============================================================================

void VoicePipeline::setTranscriber(ITranscriber* transcriber) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    _transcriber = transcriber;
}

void VoicePipeline::setResponder(IResponder* responder) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    _responder = responder;
}

void VoicePipeline::setSpeechOutput(Audio::ISpeechOutput* output) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    _speech = output;
}

void VoicePipeline::setDecoder(std::unique_ptr<IFrameDecoder> decoder) {
    if (!decoder) return;
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    if (_state == VoiceState::LISTENING) {
        WARNING("VoicePipeline: Decoder changed mid-session, takes effect now");
    }
    _decoder = std::move(decoder);
}

//=============================================================================
// Inbound stream
//=============================================================================

bool VoicePipeline::intercept(const BLE::Message& message) {
    switch (message.type) {
        case BLE::MessageType::VOICE_START:
            onVoiceStart();
            return true;
        case BLE::MessageType::VOICE_DATA:
            onVoiceData(message.payload);
            return true;
        case BLE::MessageType::VOICE_END:
            onVoiceEnd();
            return true;
        default:
            return false;
    }
}

bool VoicePipeline::onVoiceStart() {
    uint32_t generation;
    {
        std::lock_guard<std::recursive_mutex> lock(_mutex);
        if (_state == VoiceState::PROCESSING || _state == VoiceState::SPEAKING) {
            WARNING(std::string("VoicePipeline: Start while ") + stateToString(_state) + ", dropping");
            return false;
        }
        if (_state == VoiceState::LISTENING && _session) {
            WARNING("VoicePipeline: Start while listening, discarding " +
                    std::to_string(_session->packetCount()) + " packets");
        }

        generation = ++_generation;
        _session.reset(new VoiceSession());
        _session->start_time = RNS::Utilities::OS::time();
        _decoder->reset();
    }

    setState(generation, VoiceState::LISTENING);
    INFO("VoicePipeline: Session started");

    VoiceEvent event;
    event.type = VoiceEventType::START;
    emit(event);
    return true;
}

bool VoicePipeline::onVoiceData(const Bytes& payload) {
    VoiceDataPacket packet;
    if (!VoiceDataPacket::parse(payload, packet)) {
        WARNING("VoicePipeline: Data packet too short (" + std::to_string(payload.size()) + " bytes)");
        return false;
    }

    {
        std::lock_guard<std::recursive_mutex> lock(_mutex);
        if (_state != VoiceState::LISTENING || !_session) {
            WARNING(std::string("VoicePipeline: Data while ") + stateToString(_state) + ", dropping");
            return false;
        }

        accountSequence(packet.sequence);
        _session->total_bytes += packet.coded.size();

        std::vector<int16_t> frame;
        if (!_decoder->decode(packet.coded, frame)) {
            _session->decode_failures++;
            frame.assign(_decoder->samplesPerFrame(), 0);
            char buf[80];
            snprintf(buf, sizeof(buf), "VoicePipeline: Decode failed for seq %u, inserting silence",
                     packet.sequence);
            WARNING(buf);
        }
        _session->samples.insert(_session->samples.end(), frame.begin(), frame.end());
        _session->packets.push_back(packet);
    }

    VoiceEvent event;
    event.type = VoiceEventType::DATA;
    event.sequence = packet.sequence;
    event.data = packet.coded;
    emit(event);
    return true;
}

void VoicePipeline::accountSequence(uint16_t sequence) {
    uint16_t expected = _session->expected_sequence;
    if (sequence != expected) {
        uint16_t forward = static_cast<uint16_t>(sequence - expected);
        uint16_t backward = static_cast<uint16_t>(expected - sequence);
        char buf[96];
        if (forward <= backward) {
            _session->sequence_gaps += forward;
            snprintf(buf, sizeof(buf), "VoicePipeline: Sequence gap, expected %u got %u (%u missing)",
                     expected, sequence, forward);
        }
        else {
            _session->sequence_gaps += backward;
            _session->late_packets++;
            snprintf(buf, sizeof(buf), "VoicePipeline: Late packet, expected %u got %u (%u behind)",
                     expected, sequence, backward);
        }
        WARNING(buf);
    }
    _session->expected_sequence = static_cast<uint16_t>(sequence + 1);
}

bool VoicePipeline::onVoiceEnd() {
    uint32_t generation;
    uint32_t sample_rate;
    std::vector<int16_t> samples;
    {
        std::lock_guard<std::recursive_mutex> lock(_mutex);
        if (_state != VoiceState::LISTENING || !_session) {
            WARNING(std::string("VoicePipeline: End while ") + stateToString(_state) + ", dropping");
            return false;
        }

        _session->ended = true;
        _session->end_time = RNS::Utilities::OS::time();

        sample_rate = _decoder->sampleRate();
        _last_clip_info.timestamp = _session->start_time;
        _last_clip_info.duration = _session->end_time - _session->start_time;
        _last_clip_info.packet_count = static_cast<uint32_t>(_session->packetCount());
        _last_clip_info.total_bytes = _session->total_bytes;
        _last_clip_info.sequence_gaps = _session->sequence_gaps;
        _last_clip_info.sample_rate = sample_rate;
        _has_clip_info = true;

        _last_session = *_session;
        _has_last_session = true;
        samples = _session->samples;
        generation = _generation;

        char buf[160];
        snprintf(buf, sizeof(buf),
                 "VoicePipeline: Session ended: %zu packets, %zu bytes, %u gaps, %u late, %u decode failures, %.2fs",
                 _session->packetCount(), _session->total_bytes, _session->sequence_gaps,
                 _session->late_packets, _session->decode_failures, _last_clip_info.duration);
        INFO(buf);
    }

    if (!setState(generation, VoiceState::PROCESSING)) {
        return true;
    }

    VoiceEvent event;
    event.type = VoiceEventType::END;
    emit(event);

    runProcessing(generation, samples, sample_rate);
    return true;
}

bool VoicePipeline::cancel() {
    VoiceState from;
    Audio::ISpeechOutput* speech;
    Callbacks::OnStateChanged on_state_changed;
    {
        std::lock_guard<std::recursive_mutex> lock(_mutex);
        if (_state == VoiceState::IDLE) {
            DEBUG("VoicePipeline: Cancel while idle ignored");
            return false;
        }
        from = _state;
        ++_generation;
        _session.reset();
        _state = VoiceState::IDLE;
        speech = _speech;
        on_state_changed = _on_state_changed;
    }

    if (speech && (from == VoiceState::PROCESSING || from == VoiceState::SPEAKING)) {
        try {
            speech->stop();
        }
        catch (const std::exception& e) {
            ERROR(std::string("VoicePipeline: Stopping playback failed: ") + e.what());
        }
        catch (...) {
            ERROR("VoicePipeline: Stopping playback failed");
        }
    }

    INFO(std::string("VoicePipeline: Cancelled while ") + stateToString(from));
    notifyStateChanged(on_state_changed, from, VoiceState::IDLE);

    VoiceEvent event;
    event.type = VoiceEventType::CANCELLED;
    emit(event);
    return true;
}

//=============================================================================
// Processing
//=============================================================================

// Every exit returns the session to IDLE unless a newer session owns the state
void VoicePipeline::runProcessing(uint32_t generation, const std::vector<int16_t>& samples,
                                  uint32_t sample_rate) {
    try {
        processSession(generation, samples, sample_rate);
    }
    catch (const std::exception& e) {
        ERROR(std::string("VoicePipeline: Processing threw: ") + e.what());
        emitError(std::string("Processing failed: ") + e.what());
    }
    catch (...) {
        ERROR("VoicePipeline: Processing threw an unknown exception");
        emitError("Processing failed");
    }
    finishSession(generation);
}

void VoicePipeline::processSession(uint32_t generation, const std::vector<int16_t>& samples,
                                   uint32_t sample_rate) {
    std::string transcript = transcribe(samples, sample_rate);
    if (!isCurrent(generation)) {
        DEBUG("VoicePipeline: Cancelled during transcription");
        return;
    }

    Callbacks::OnText on_transcript;
    {
        std::lock_guard<std::recursive_mutex> lock(_mutex);
        on_transcript = _on_transcript;
    }
    notifyText(on_transcript, transcript, "transcript");

    VoiceEvent event;
    event.type = VoiceEventType::RESULT;
    event.text = transcript;
    emit(event);

    VoiceResult result;
    result.transcript = transcript;

    if (isUsableTranscript(transcript)) {
        std::string response = respond(transcript);
        if (!isCurrent(generation)) {
            DEBUG("VoicePipeline: Cancelled during response");
            return;
        }

        Callbacks::OnText on_response;
        {
            std::lock_guard<std::recursive_mutex> lock(_mutex);
            on_response = _on_response;
        }
        notifyText(on_response, response, "response");
        result.response = response;

        if (!setState(generation, VoiceState::SPEAKING)) {
            return;
        }
        speak(response);
    }
    else {
        DEBUG("VoicePipeline: No usable transcript, skipping response");
    }

    {
        std::lock_guard<std::recursive_mutex> lock(_mutex);
        if (_generation != generation) {
            DEBUG("VoicePipeline: Cancelled during playback");
            return;
        }
        _last_result = result;
        _has_result = true;
    }
}

std::string VoicePipeline::transcribe(const std::vector<int16_t>& samples, uint32_t sample_rate) {
    ITranscriber* transcriber;
    {
        std::lock_guard<std::recursive_mutex> lock(_mutex);
        transcriber = _transcriber;
    }
    if (!transcriber) {
        WARNING("VoicePipeline: No transcriber, transcript is empty");
        return "";
    }

    std::string transcript;
    try {
        CollaboratorResult result = transcriber->transcribe(samples, sample_rate, transcript);
        if (result == CollaboratorResult::NO_CREDENTIAL) {
            WARNING("VoicePipeline: Transcription not configured, transcript is empty");
            return "";
        }
        if (result != CollaboratorResult::SUCCESS) {
            ERROR(std::string("VoicePipeline: Transcription failed: ") + collaboratorResultToString(result));
            emitError("Transcription failed");
            return "";
        }
    }
    catch (const std::exception& e) {
        ERROR(std::string("VoicePipeline: Transcription threw: ") + e.what());
        emitError(std::string("Transcription failed: ") + e.what());
        return "";
    }
    catch (...) {
        ERROR("VoicePipeline: Transcription threw an unknown exception");
        emitError("Transcription failed");
        return "";
    }

    DEBUG("VoicePipeline: Transcript: " + transcript);
    return transcript;
}

std::string VoicePipeline::respond(const std::string& transcript) {
    std::string fallback = FALLBACK_PREFIX + transcript;

    IResponder* responder;
    {
        std::lock_guard<std::recursive_mutex> lock(_mutex);
        responder = _responder;
    }
    if (!responder) {
        DEBUG("VoicePipeline: No responder, echoing transcript");
        return fallback;
    }

    std::string response;
    try {
        CollaboratorResult result = responder->respond(transcript, response);
        if (result == CollaboratorResult::SUCCESS && !response.empty()) {
            return response;
        }
        if (result == CollaboratorResult::NO_CREDENTIAL) {
            WARNING("VoicePipeline: Responder not configured, echoing transcript");
        }
        else if (result == CollaboratorResult::SUCCESS) {
            WARNING("VoicePipeline: Empty response, echoing transcript");
        }
        else {
            ERROR(std::string("VoicePipeline: Response failed: ") + collaboratorResultToString(result));
            emitError("Response failed");
        }
    }
    catch (const std::exception& e) {
        ERROR(std::string("VoicePipeline: Responder threw: ") + e.what());
        emitError(std::string("Response failed: ") + e.what());
    }
    catch (...) {
        ERROR("VoicePipeline: Responder threw an unknown exception");
        emitError("Response failed");
    }
    return fallback;
}

void VoicePipeline::speak(const std::string& response) {
    Audio::ISpeechOutput* speech;
    {
        std::lock_guard<std::recursive_mutex> lock(_mutex);
        speech = _speech;
    }
    if (!speech) {
        DEBUG("VoicePipeline: No speech output, skipping playback");
        return;
    }

    try {
        if (!speech->speak(response, Audio::AudioContext::AI)) {
            WARNING("VoicePipeline: Speech output declined playback");
        }
    }
    catch (const std::exception& e) {
        ERROR(std::string("VoicePipeline: Speech output threw: ") + e.what());
        emitError(std::string("Playback failed: ") + e.what());
    }
    catch (...) {
        ERROR("VoicePipeline: Speech output threw an unknown exception");
        emitError("Playback failed");
    }
}

void VoicePipeline::finishSession(uint32_t generation) {
    {
        std::lock_guard<std::recursive_mutex> lock(_mutex);
        if (_generation != generation) {
            return;
        }
        _session.reset();
    }
    setState(generation, VoiceState::IDLE);
}

bool VoicePipeline::isUsableTranscript(const std::string& transcript) {
    // Bracketed text is a recognizer placeholder such as "[BLANK_AUDIO]"
    if (transcript.find('[') != std::string::npos) {
        return false;
    }
    return transcript.find_first_not_of(" \t\r\n") != std::string::npos;
}

//=============================================================================
// State and events
//=============================================================================

bool VoicePipeline::setState(uint32_t generation, VoiceState state) {
    VoiceState from;
    Callbacks::OnStateChanged on_state_changed;
    {
        std::lock_guard<std::recursive_mutex> lock(_mutex);
        if (_generation != generation) {
            return false;
        }
        from = _state;
        if (from == state) {
            return true;
        }
        _state = state;
        on_state_changed = _on_state_changed;
    }

    DEBUG(std::string("VoicePipeline: State ") + stateToString(from) + " -> " + stateToString(state));
    notifyStateChanged(on_state_changed, from, state);
    return true;
}

// Observer failures are logged and never change the session outcome
void VoicePipeline::notifyStateChanged(const Callbacks::OnStateChanged& callback, VoiceState from,
                                       VoiceState to) {
    if (!callback) {
        return;
    }
    try {
        callback(from, to);
    }
    catch (const std::exception& e) {
        WARNING(std::string("VoicePipeline: State observer threw: ") + e.what());
    }
    catch (...) {
        WARNING("VoicePipeline: State observer threw an unknown exception");
    }
}

void VoicePipeline::notifyText(const Callbacks::OnText& callback, const std::string& text, const char* what) {
    if (!callback) {
        return;
    }
    try {
        callback(text);
    }
    catch (const std::exception& e) {
        WARNING(std::string("VoicePipeline: ") + what + " observer threw: " + e.what());
    }
    catch (...) {
        WARNING(std::string("VoicePipeline: ") + what + " observer threw an unknown exception");
    }
}

bool VoicePipeline::isCurrent(uint32_t generation) const {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    return _generation == generation;
}

VoicePipeline::ListenerId VoicePipeline::subscribe(Listener listener) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    ListenerId id = _next_listener_id++;
    _listeners[id] = listener;
    return id;
}

void VoicePipeline::unsubscribe(ListenerId id) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    _listeners.erase(id);
}

void VoicePipeline::emit(const VoiceEvent& event) {
    std::map<ListenerId, Listener> listeners;
    {
        std::lock_guard<std::recursive_mutex> lock(_mutex);
        listeners = _listeners;
    }

    for (const auto& entry : listeners) {
        try {
            entry.second(event);
        }
        catch (const std::exception& e) {
            WARNING("VoicePipeline: Listener " + std::to_string(entry.first) + " threw on " +
                    eventTypeToString(event.type) + ": " + e.what());
        }
        catch (...) {
            WARNING("VoicePipeline: Listener " + std::to_string(entry.first) + " threw on " +
                    eventTypeToString(event.type));
        }
    }
}

void VoicePipeline::emitError(const std::string& description) {
    VoiceEvent event;
    event.type = VoiceEventType::ERROR;
    event.text = description;
    emit(event);
}

void VoicePipeline::setOnStateChanged(Callbacks::OnStateChanged callback) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    _on_state_changed = callback;
}

void VoicePipeline::setOnTranscript(Callbacks::OnText callback) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    _on_transcript = callback;
}

void VoicePipeline::setOnResponse(Callbacks::OnText callback) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    _on_response = callback;
}

//=============================================================================
// Inspection
//=============================================================================

VoiceState VoicePipeline::state() const {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    return _state;
}

bool VoicePipeline::hasSession() const {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    return _session != nullptr;
}

uint16_t VoicePipeline::expectedSequence() const {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    if (_session) return _session->expected_sequence;
    return _has_last_session ? _last_session.expected_sequence : 0;
}

uint32_t VoicePipeline::sequenceGaps() const {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    if (_session) return _session->sequence_gaps;
    return _has_last_session ? _last_session.sequence_gaps : 0;
}

LiveStats VoicePipeline::liveStats() const {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    LiveStats stats;
    if (!_session) {
        return stats;
    }
    stats.packet_count = static_cast<uint32_t>(_session->packetCount());
    stats.total_bytes = _session->total_bytes;
    stats.sequence_gaps = _session->sequence_gaps;
    stats.late_packets = _session->late_packets;
    double end = _session->ended ? _session->end_time : RNS::Utilities::OS::time();
    stats.elapsed = end - _session->start_time;
    return stats;
}

VoiceStatus VoicePipeline::status() const {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    VoiceStatus status;
    status.state = _state;
    status.has_session = _session != nullptr;
    status.packet_count = _session ? static_cast<uint32_t>(_session->packetCount()) : 0;
    status.has_result = _has_result;
    status.last_result = _last_result;
    status.has_clip_info = _has_clip_info;
    status.last_clip_info = _last_clip_info;
    status.has_clip_for_playback = _has_last_session && !_last_session.samples.empty();
    return status;
}

bool VoicePipeline::lastSession(VoiceSession& session) const {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    if (!_has_last_session) {
        return false;
    }
    session = _last_session;
    return true;
}

bool VoicePipeline::hasClipForPlayback() const {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    return _has_last_session && !_last_session.samples.empty();
}

std::vector<int16_t> VoicePipeline::lastClip() const {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    if (!_has_last_session) {
        return std::vector<int16_t>();
    }
    return _last_session.samples;
}

Bytes VoicePipeline::lastClipWav() const {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    if (!_has_last_session || _last_session.samples.empty()) {
        return Bytes();
    }
    return WavWriter::encode(_last_session.samples, _last_clip_info.sample_rate);
}

VoiceClipInfo VoicePipeline::lastClipInfo() const {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    return _last_clip_info;
}

VoiceResult VoicePipeline::lastResult() const {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    return _last_result;
}

uint32_t VoicePipeline::sampleRate() const {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    return _decoder->sampleRate();
}

}} // namespace Tapir::Voice
