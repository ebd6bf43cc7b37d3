/**
 * @file LogFile.cpp
 * @brief Rotating log file sink
 */

#include "LogFile.h"
#include "Utilities/OS.h"

namespace Tapir {

std::FILE* LogFile::_file = nullptr;
std::string LogFile::_path;
uint32_t LogFile::_bytes_written = 0;
double LogFile::_last_flush = 0;
uint32_t LogFile::_line_count = 0;

bool LogFile::init(const std::string& path) {
    RNS::setLogCallback(logCallback);

    if (path.empty()) {
        return true;
    }

    // Append to preserve history across runs
    _file = std::fopen(path.c_str(), "a");
    if (!_file) {
        std::fprintf(stderr, "[LogFile] Failed to open %s\n", path.c_str());
        return false;
    }
    _path = path;

    std::fseek(_file, 0, SEEK_END);
    long size = std::ftell(_file);
    _bytes_written = size > 0 ? static_cast<uint32_t>(size) : 0;

    std::fprintf(_file, "\n========================================\n");
    std::fprintf(_file, "=== tapir_host LOGGING STARTED ===\n");
    std::fprintf(_file, "========================================\n\n");
    std::fflush(_file);

    _last_flush = RNS::Utilities::OS::time();
    _line_count = 0;
    return true;
}

void LogFile::logCallback(const char* msg, RNS::LogLevel level) {
    // Always print to stdout as well
    std::printf("%s [%s] %s\n", RNS::getTimeString(), RNS::getLevelName(level), msg);
    std::fflush(stdout);

    if (_file) {
        writeToFile(msg, level);
    }
}

void LogFile::writeToFile(const char* msg, RNS::LogLevel level) {
    // Format: timestamp [LEVEL] message
    int written = std::fprintf(_file, "%s [%s] %s\n",
                               RNS::getTimeString(),
                               RNS::getLevelName(level),
                               msg);
    if (written > 0) {
        _bytes_written += written;
        _line_count++;
    }

    double now = RNS::Utilities::OS::time();
    bool should_flush = false;

    // Always flush errors and warnings immediately
    if (level <= RNS::LOG_WARNING) {
        should_flush = true;
    }
    else if (_line_count >= FLUSH_AFTER_LINES) {
        should_flush = true;
    }
    else if (now - _last_flush >= FLUSH_INTERVAL) {
        should_flush = true;
    }

    if (should_flush) {
        std::fflush(_file);
        _last_flush = now;
        _line_count = 0;
    }

    if (_bytes_written >= MAX_LOG_SIZE) {
        rotate();
    }
}

void LogFile::flush() {
    if (_file) {
        std::fflush(_file);
        _last_flush = RNS::Utilities::OS::time();
        _line_count = 0;
    }
}

void LogFile::marker(const char* msg) {
    if (_file) {
        std::fprintf(_file, "----------------------------------------\n");
        std::fprintf(_file, ">>> MARKER: %s <<<\n", msg);
        std::fprintf(_file, "----------------------------------------\n");
        std::fflush(_file);
    }
}

void LogFile::rotate() {
    if (!_file) return;

    std::fclose(_file);
    _file = nullptr;

    // Rotate: current -> .1 (replacing the previous .1)
    std::string previous = _path + ".1";
    std::remove(previous.c_str());
    if (std::rename(_path.c_str(), previous.c_str()) != 0) {
        std::fprintf(stderr, "[LogFile] Failed to rotate %s\n", _path.c_str());
    }

    _file = std::fopen(_path.c_str(), "w");
    if (!_file) {
        std::fprintf(stderr, "[LogFile] Failed to create new log file after rotation\n");
        return;
    }

    std::fprintf(_file, "=== LOG ROTATED ===\n\n");
    std::fflush(_file);
    _bytes_written = 0;
}

void LogFile::close() {
    if (_file) {
        std::fprintf(_file, "\n=== LOG CLOSED CLEANLY ===\n");
        std::fflush(_file);
        std::fclose(_file);
        _file = nullptr;
    }
    // Restore default logging
    RNS::setLogCallback(nullptr);
}

} // namespace Tapir
