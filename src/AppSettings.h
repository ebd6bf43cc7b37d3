/**
 * @file AppSettings.h
 * @brief Host application settings (INI file)
 *
 * Format: one `key = value` per line, `#` or `;` comments, `[section]`
 * headers are accepted and ignored. Unknown keys are logged and skipped;
 * a value that does not parse keeps the default.
 */
#pragma once

#include "LinkTypes.h"
#include "Log.h"

#include <string>
#include <cstdint>

namespace Tapir {

struct AppSettings {
    // Logging
    RNS::LogLevel log_level;
    std::string log_file;           // Empty = stdout only

    // Link
    std::string platform;
    std::string name_filter;
    uint32_t scan_timeout_ms;
    uint32_t connect_timeout_ms;
    uint32_t write_timeout_ms;
    uint16_t requested_mtu;
    bool auto_connect;
    std::string last_device;

    // Voice
    std::string codec;
    uint32_t sample_rate;
    uint32_t session_frames;        // Simulated push-to-talk length

    // Defaults
    AppSettings() :
        log_level(RNS::LOG_NOTICE),
        platform("simulated"),
        name_filter("TAPIR"),
        scan_timeout_ms(BLE::Timing::SCAN_TIMEOUT_MS),
        connect_timeout_ms(BLE::Timing::CONNECT_TIMEOUT_MS),
        write_timeout_ms(BLE::Timing::WRITE_TIMEOUT_MS),
        requested_mtu(BLE::MTU::REQUESTED),
        auto_connect(true),
        codec("pcm16"),
        sample_rate(16000),
        session_frames(50)
    {}

    /**
     * @brief Read settings from a file; missing keys keep their defaults
     * @return false if the file could not be opened
     */
    bool load(const std::string& path);

    /**
     * @brief Write all settings back
     */
    bool save(const std::string& path) const;

    /**
     * @brief Apply one key/value pair
     * @return false for an unknown key or an unparseable value
     */
    bool set(const std::string& key, const std::string& value);

    /**
     * @brief Link configuration derived from these settings
     */
    BLE::LinkConfig linkConfig() const;
};

/**
 * @brief Parse a level name ("error", "debug", ...) or number
 */
bool parseLogLevel(const std::string& text, RNS::LogLevel& level);

} // namespace Tapir
