// Copyright (c) 2024 microReticulum contributors
// SPDX-License-Identifier: MIT

#ifndef BLEBRIDGE_LOGFILE_H
#define BLEBRIDGE_LOGFILE_H

#include "Config.h"
#include <Log.h>

#include <stdio.h>
#include <string>

namespace BLEBridge {

/**
 * Log output
 *
 * Every log line goes to stderr; when a path is configured it is also
 * appended to a log file with frequent flushing. The file is rotated to
 * "<path>.1" once it reaches MAX_LOG_SIZE.
 *
 * Usage:
 *   LogFile::init("/var/log/blebridge.log");
 *   // Logs are automatically written via RNS::setLogCallback
 */
class LogFile {
public:
    /**
     * Install the log callback and open the file if a path is given.
     *
     * @return false if the file could not be opened (stderr logging stays active)
     */
    static bool init(const std::string& path = std::string());

    /**
     * Check if file logging is active
     */
    static bool isActive() { return _file != nullptr; }

    static void flush();

    /**
     * Close log file cleanly and restore default logging
     */
    static void close();

    /**
     * Map a level name ("debug", "info", ...) to a log level
     *
     * @return false for an unknown name
     */
    static bool parseLevel(const std::string& name, RNS::LogLevel& level);

private:
    static void logCallback(const char* msg, RNS::LogLevel level);
    static void writeToFile(const char* msg, RNS::LogLevel level);
    static void rotate();

    static std::string _path;
    static FILE* _file;
    static uint32_t _bytes_written;
    static uint32_t _line_count;
};

} // namespace BLEBridge

#endif // BLEBRIDGE_LOGFILE_H
