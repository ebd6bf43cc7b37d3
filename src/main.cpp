// Tapir host
// Connects to a Tapir keypad, exchanges messages and runs a push-to-talk session

// Link
#include "TapirLink.h"
#include "LinkPlatform.h"
#include "platforms/SimulatedPlatform.h"

// Voice
#include "VoicePipeline.h"
#include "FrameDecoder.h"
#include "WavWriter.h"

// Audio routing
#include "AudioRouter.h"

// Application
#include "AppSettings.h"
#include "LogFile.h"
#include "DemoServices.h"

// Logging
#include <Log.h>
#include <Utilities/OS.h>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <set>
#include <string>
#include <thread>

using namespace Tapir;

namespace {

struct Options {
    std::string config_path;
    std::string wav_path;
    long frames = -1;                   // -1 = from settings
    std::set<uint16_t> dropped;
    bool verbose = false;
};

const uint32_t LOOP_INTERVAL_MS = 10;

void print_usage(const char* program) {
    std::printf("Usage: %s [--config <file>] [--wav <file>] [--frames <n>] [--drop <seq>]... [--verbose]\n",
                program);
    std::printf("  --config <file>   Settings file (INI); last device is saved back\n");
    std::printf("  --wav <file>      Write the captured clip as a WAV file\n");
    std::printf("  --frames <n>      Voice frames in the simulated push-to-talk session\n");
    std::printf("  --drop <seq>      Drop this sequence number (repeatable)\n");
    std::printf("  --verbose         Debug logging\n");
}

bool parse_args(int argc, char* argv[], Options& options) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            options.config_path = argv[++i];
        } else if (arg == "--wav" && i + 1 < argc) {
            options.wav_path = argv[++i];
        } else if (arg == "--frames" && i + 1 < argc) {
            char* end = nullptr;
            options.frames = std::strtol(argv[++i], &end, 10);
            if (*end != '\0' || options.frames < 0 || options.frames > 65535) {
                std::fprintf(stderr, "Invalid frame count: %s\n", argv[i]);
                return false;
            }
        } else if (arg == "--drop" && i + 1 < argc) {
            char* end = nullptr;
            long seq = std::strtol(argv[++i], &end, 10);
            if (*end != '\0' || seq < 0 || seq > 65535) {
                std::fprintf(stderr, "Invalid sequence number: %s\n", argv[i]);
                return false;
            }
            options.dropped.insert(static_cast<uint16_t>(seq));
        } else if (arg == "--verbose" || arg == "-v") {
            options.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            std::exit(0);
        } else {
            std::fprintf(stderr, "Unknown argument: %s\n", arg.c_str());
            print_usage(argv[0]);
            return false;
        }
    }
    return true;
}

void pump(BLE::TapirLink& link, uint32_t duration_ms) {
    double deadline = RNS::Utilities::OS::time() + duration_ms / 1000.0;
    while (RNS::Utilities::OS::time() < deadline) {
        link.loop();
        std::this_thread::sleep_for(std::chrono::milliseconds(LOOP_INTERVAL_MS));
    }
}

bool scan_and_connect(BLE::TapirLink& link, const AppSettings& settings) {
    if (link.autoConnect()) {
        return true;
    }

    if (!link.startScan()) {
        ERROR("Scan failed: " + link.statusText());
        return false;
    }

    // Stop at the first burst of results or when the scan times out
    double deadline = RNS::Utilities::OS::time() + settings.scan_timeout_ms / 1000.0;
    while (link.connection().state() == BLE::ConnectionState::SCANNING &&
           link.connection().scanResults().empty() &&
           RNS::Utilities::OS::time() < deadline) {
        link.loop();
        std::this_thread::sleep_for(std::chrono::milliseconds(LOOP_INTERVAL_MS));
    }

    std::vector<BLE::ScanResult> results = link.connection().scanResults();
    link.stopScan();
    if (results.empty()) {
        WARNING("No Tapir devices found");
        return false;
    }

    for (const BLE::ScanResult& result : results) {
        INFO("  Found " + result.name + " (" + result.id + ") RSSI " + std::to_string(result.effectiveRssi()));
    }

    BLE::OperationResult result = link.connect(results.front().id);
    if (result != BLE::OperationResult::SUCCESS) {
        ERROR(std::string("Connect failed: ") + BLE::resultToString(result) + " - " + link.statusText());
        return false;
    }
    return true;
}

void handle_message(const BLE::Message& message) {
    switch (message.type) {
        case BLE::MessageType::KEYPRESS: {
            BLE::KeyPress key;
            if (BLE::Messages::parseKeyPress(message, key)) {
                INFO("Key " + std::to_string(key.key_index) +
                     (key.event == BLE::KeyEvent::DOWN ? " down" : " up"));
            }
            break;
        }
        case BLE::MessageType::ECHO:
            INFO("Echo reply: " + message.payload.toString());
            break;
        case BLE::MessageType::ACK:
            DEBUG("Ack received");
            break;
        default:
            DEBUG(std::string("Unhandled message ") + BLE::messageTypeToString(message.type));
            break;
    }
}

void print_summary(const Voice::VoicePipeline& voice) {
    Voice::VoiceStatus status = voice.status();
    Voice::VoiceSession session;
    bool has_session = voice.lastSession(session);

    std::printf("\n=== Push-to-talk summary ===\n");
    std::printf("  State:          %s\n", Voice::stateToString(status.state));
    if (has_session) {
        std::printf("  Packets:        %zu\n", session.packetCount());
        std::printf("  Bytes:          %zu\n", session.total_bytes);
        std::printf("  Sequence gaps:  %u\n", session.sequence_gaps);
        std::printf("  Late packets:   %u\n", session.late_packets);
        std::printf("  Expected seq:   %u\n", session.expected_sequence);
        std::printf("  Samples:        %zu\n", session.samples.size());
        std::printf("  Duration:       %.2f s\n", status.last_clip_info.duration);
    } else {
        std::printf("  No session captured\n");
    }
    if (status.has_result) {
        std::printf("  Transcript:     %s\n", status.last_result.transcript.c_str());
        std::printf("  Response:       %s\n", status.last_result.response.c_str());
    }
    std::printf("\n");
}

} // namespace

int main(int argc, char* argv[]) {
    Options options;
    if (!parse_args(argc, argv, options)) {
        return 2;
    }

    // Load application settings
    AppSettings settings;
    if (!options.config_path.empty()) {
        settings.load(options.config_path);
    }
    if (options.verbose) {
        settings.log_level = RNS::LOG_DEBUG;
    }
    if (options.frames >= 0) {
        settings.session_frames = static_cast<uint32_t>(options.frames);
    }

    RNS::loglevel(settings.log_level);
    LogFile::init(settings.log_file);

    INFO("=== Tapir host ===");

    // Platform
    BLE::ILinkPlatform::Ptr platform = BLE::LinkPlatformFactory::create(settings.platform);
    if (!platform) {
        ERROR("Unknown platform '" + settings.platform + "'");
        LogFile::close();
        return 1;
    }
    std::shared_ptr<BLE::SimulatedPlatform> simulator =
        std::dynamic_pointer_cast<BLE::SimulatedPlatform>(platform);

    // Link
    BLE::TapirLink link(settings.linkConfig());
    link.setAutoConnect(settings.auto_connect);
    link.setLastPeerId(settings.last_device);

    // Voice pipeline
    std::unique_ptr<Voice::IFrameDecoder> decoder =
        Voice::FrameDecoderFactory::create(settings.codec, settings.sample_rate);
    if (!decoder) {
        WARNING("Falling back to pcm16 decoding");
    }
    Voice::VoicePipeline voice(std::move(decoder));
    SignalTranscriber transcriber;
    voice.setTranscriber(&transcriber);

    // Audio routing
    ConsoleSynthesizer synthesizer;
    Audio::AudioRouter router;
    router.setSynthesizer(&synthesizer);
    router.setHapticSender([&link](BLE::Haptic::Pattern pattern) {
        link.sendHaptic(pattern);
    });
    voice.setSpeechOutput(&router);

    voice.setOnStateChanged([](Voice::VoiceState from, Voice::VoiceState to) {
        INFO(std::string("Voice: ") + Voice::stateToString(from) + " -> " + Voice::stateToString(to));
    });

    // Dispatch: voice first, then headphone state, then everything else
    link.dispatcher().addInterceptor(&voice);
    link.dispatcher().addInterceptor(&router);
    link.dispatcher().setHandler(handle_message);
    link.connection().setOnStateChanged([&router](BLE::ConnectionState from, BLE::ConnectionState to) {
        router.setTapirConnected(to == BLE::ConnectionState::READY);
    });

    if (!link.start(platform)) {
        LogFile::close();
        return 1;
    }

    if (!scan_and_connect(link, settings)) {
        std::printf("Status: %s\n", link.statusText().c_str());
        link.stop();
        LogFile::close();
        return 1;
    }
    INFO("Status: " + link.statusText());

    // Remember the device for next time
    settings.last_device = link.getLastPeerId();
    if (!options.config_path.empty()) {
        settings.save(options.config_path);
    }

    // Exchange a few messages
    BLE::OperationResult result = link.sendEcho("hello tapir").get();
    if (result != BLE::OperationResult::SUCCESS) {
        WARNING(std::string("Echo failed: ") + BLE::resultToString(result));
    }
    link.sendLED(0, 0, 255, 0);
    link.sendTerminal(20, 2, Bytes("Tapir host          connected           "));
    router.alertNotification();
    pump(link, 200);

    // Push-to-talk
    if (simulator) {
        simulator->pressKey(0, BLE::KeyEvent::DOWN);
        simulator->simulatePushToTalk(settings.session_frames, options.dropped);
        simulator->pressKey(0, BLE::KeyEvent::UP);

        double deadline = RNS::Utilities::OS::time() + 5.0;
        do {
            link.loop();
            std::this_thread::sleep_for(std::chrono::milliseconds(LOOP_INTERVAL_MS));
        } while ((simulator->pendingNotifications() > 0 || voice.state() != Voice::VoiceState::IDLE) &&
                 RNS::Utilities::OS::time() < deadline);
        pump(link, 100);
    } else {
        INFO("Press and hold the talk key on the device; waiting 10 seconds");
        pump(link, 10000);
    }

    print_summary(voice);

    if (!options.wav_path.empty()) {
        if (voice.hasClipForPlayback()) {
            if (Voice::WavWriter::write(options.wav_path, voice.lastClip(), voice.sampleRate())) {
                INFO("Clip written to " + options.wav_path);
            } else {
                ERROR("Failed to write " + options.wav_path);
            }
        } else {
            WARNING("No clip captured, nothing written to " + options.wav_path);
        }
    }

    link.disconnect();
    link.stop();
    INFO("Status: " + link.statusText());
    LogFile::close();
    return 0;
}
