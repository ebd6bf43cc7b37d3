/**
 * @file AppSettings.cpp
 * @brief INI load/save for host application settings
 */

#include "AppSettings.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>

namespace Tapir {

namespace {

std::string trim(const std::string& text) {
    size_t start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(start, end - start + 1);
}

std::string lower(const std::string& text) {
    std::string result = text;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

bool parseUnsigned(const std::string& text, uint32_t max, uint32_t& value) {
    if (text.empty()) return false;
    char* end = nullptr;
    unsigned long parsed = std::strtoul(text.c_str(), &end, 10);
    if (*end != '\0' || text[0] == '-' || parsed > max) {
        return false;
    }
    value = static_cast<uint32_t>(parsed);
    return true;
}

bool parseBool(const std::string& text, bool& value) {
    std::string v = lower(text);
    if (v == "true" || v == "yes" || v == "on" || v == "1") {
        value = true;
        return true;
    }
    if (v == "false" || v == "no" || v == "off" || v == "0") {
        value = false;
        return true;
    }
    return false;
}

const char* levelName(RNS::LogLevel level) {
    switch (level) {
        case RNS::LOG_CRITICAL: return "critical";
        case RNS::LOG_ERROR:    return "error";
        case RNS::LOG_WARNING:  return "warning";
        case RNS::LOG_NOTICE:   return "notice";
        case RNS::LOG_INFO:     return "info";
        case RNS::LOG_VERBOSE:  return "verbose";
        case RNS::LOG_DEBUG:    return "debug";
        default:                return "trace";
    }
}

} // namespace

bool parseLogLevel(const std::string& text, RNS::LogLevel& level) {
    std::string v = lower(trim(text));
    if (v == "critical")      level = RNS::LOG_CRITICAL;
    else if (v == "error")    level = RNS::LOG_ERROR;
    else if (v == "warning")  level = RNS::LOG_WARNING;
    else if (v == "notice")   level = RNS::LOG_NOTICE;
    else if (v == "info")     level = RNS::LOG_INFO;
    else if (v == "verbose")  level = RNS::LOG_VERBOSE;
    else if (v == "debug")    level = RNS::LOG_DEBUG;
    else if (v == "trace")    level = static_cast<RNS::LogLevel>(RNS::LOG_DEBUG + 1);
    else {
        uint32_t numeric = 0;
        if (!parseUnsigned(v, RNS::LOG_DEBUG + 1, numeric)) {
            return false;
        }
        level = static_cast<RNS::LogLevel>(numeric);
    }
    return true;
}

bool AppSettings::set(const std::string& key, const std::string& value) {
    uint32_t number = 0;
    bool ok = true;

    if (key == "log_level") {
        ok = parseLogLevel(value, log_level);
    }
    else if (key == "log_file") {
        log_file = value;
    }
    else if (key == "platform") {
        platform = value;
    }
    else if (key == "name_filter") {
        name_filter = value;
    }
    else if (key == "scan_timeout_ms") {
        ok = parseUnsigned(value, 600000, number);
        if (ok) scan_timeout_ms = number;
    }
    else if (key == "connect_timeout_ms") {
        ok = parseUnsigned(value, 600000, number);
        if (ok) connect_timeout_ms = number;
    }
    else if (key == "write_timeout_ms") {
        ok = parseUnsigned(value, 600000, number);
        if (ok) write_timeout_ms = number;
    }
    else if (key == "requested_mtu") {
        ok = parseUnsigned(value, BLE::MTU::REQUESTED, number) && number >= BLE::MTU::MINIMUM;
        if (ok) requested_mtu = static_cast<uint16_t>(number);
    }
    else if (key == "auto_connect") {
        ok = parseBool(value, auto_connect);
    }
    else if (key == "last_device") {
        last_device = value;
    }
    else if (key == "codec") {
        codec = value;
    }
    else if (key == "sample_rate") {
        ok = parseUnsigned(value, 48000, number) && number >= 8000;
        if (ok) sample_rate = number;
    }
    else if (key == "session_frames") {
        ok = parseUnsigned(value, 65535, number);
        if (ok) session_frames = number;
    }
    else {
        WARNING("AppSettings: Unknown key '" + key + "' ignored");
        return false;
    }

    if (!ok) {
        WARNING("AppSettings: Bad value '" + value + "' for " + key + ", keeping default");
    }
    return ok;
}

bool AppSettings::load(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        WARNING("AppSettings: Cannot open " + path + ", using defaults");
        return false;
    }

    INFO("Loading application settings from " + path);

    std::string line;
    int line_number = 0;
    while (std::getline(file, line)) {
        line_number++;
        std::string text = trim(line);
        if (text.empty() || text[0] == '#' || text[0] == ';' || text[0] == '[') {
            continue;
        }

        size_t eq = text.find('=');
        if (eq == std::string::npos) {
            WARNING("AppSettings: Line " + std::to_string(line_number) + " has no '=', skipped");
            continue;
        }

        std::string key = lower(trim(text.substr(0, eq)));
        std::string value = trim(text.substr(eq + 1));
        set(key, value);
    }

    INFO("  Platform: " + platform);
    INFO("  Codec: " + codec + " @ " + std::to_string(sample_rate) + " Hz");
    INFO("  Last device: " + (last_device.empty() ? std::string("(none)") : last_device));
    return true;
}

bool AppSettings::save(const std::string& path) const {
    std::ofstream file(path, std::ios::trunc);
    if (!file) {
        ERROR("AppSettings: Cannot write " + path);
        return false;
    }

    file << "# tapir_host settings\n";
    file << "\n[logging]\n";
    file << "log_level = " << levelName(log_level) << "\n";
    file << "log_file = " << log_file << "\n";
    file << "\n[link]\n";
    file << "platform = " << platform << "\n";
    file << "name_filter = " << name_filter << "\n";
    file << "scan_timeout_ms = " << scan_timeout_ms << "\n";
    file << "connect_timeout_ms = " << connect_timeout_ms << "\n";
    file << "write_timeout_ms = " << write_timeout_ms << "\n";
    file << "requested_mtu = " << requested_mtu << "\n";
    file << "auto_connect = " << (auto_connect ? "true" : "false") << "\n";
    file << "last_device = " << last_device << "\n";
    file << "\n[voice]\n";
    file << "codec = " << codec << "\n";
    file << "sample_rate = " << sample_rate << "\n";
    file << "session_frames = " << session_frames << "\n";

    if (!file) {
        ERROR("AppSettings: Write to " + path + " failed");
        return false;
    }
    DEBUG("AppSettings: Saved to " + path);
    return true;
}

BLE::LinkConfig AppSettings::linkConfig() const {
    BLE::LinkConfig config;
    config.name_filter = name_filter;
    config.scan_timeout_ms = scan_timeout_ms;
    config.connect_timeout_ms = connect_timeout_ms;
    config.write_timeout_ms = write_timeout_ms;
    config.requested_mtu = requested_mtu;
    return config;
}

} // namespace Tapir
