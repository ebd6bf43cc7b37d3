/**
 * @file LogFile.h
 * @brief Log sink mirroring every line to stdout and a rotating file
 *
 * Writes through RNS::setLogCallback with frequent flushing, so the tail of
 * the log survives a crash. Two files form a ring: when the current file
 * passes MAX_LOG_SIZE it is renamed to "<path>.1" and a fresh file starts.
 *
 * Usage:
 *   LogFile::init("tapir_host.log");   // or init("") for stdout only
 *   // Logs are automatically written via RNS::setLogCallback
 *   LogFile::close();
 */
#pragma once

#include <Log.h>

#include <cstdio>
#include <cstdint>
#include <string>

namespace Tapir {

class LogFile {
public:
    /**
     * @brief Install the log callback and open the file if a path is given
     * @return false if the file could not be opened (stdout logging stays on)
     */
    static bool init(const std::string& path);

    static bool isActive() { return _file != nullptr; }

    /**
     * @brief Force buffered lines out to the file
     */
    static void flush();

    /**
     * @brief Write a marker line to help locate a point of interest
     */
    static void marker(const char* msg);

    /**
     * @brief Close the file and restore default logging
     */
    static void close();

    static constexpr uint32_t MAX_LOG_SIZE = 1024 * 1024;  // 1MB per log file
    static constexpr double FLUSH_INTERVAL = 1.0;           // Flush every second
    static constexpr uint32_t FLUSH_AFTER_LINES = 10;       // Or every 10 lines

private:
    static void logCallback(const char* msg, RNS::LogLevel level);
    static void writeToFile(const char* msg, RNS::LogLevel level);
    static void rotate();

    static std::FILE* _file;
    static std::string _path;
    static uint32_t _bytes_written;
    static double _last_flush;
    static uint32_t _line_count;
};

} // namespace Tapir
