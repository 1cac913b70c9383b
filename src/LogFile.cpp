// Copyright (c) 2024 microReticulum contributors
// SPDX-License-Identifier: MIT

#include "LogFile.h"

#include <ctype.h>

using namespace BLEBridge;

// Static member initialization
std::string LogFile::_path;
FILE* LogFile::_file = nullptr;
uint32_t LogFile::_bytes_written = 0;
uint32_t LogFile::_line_count = 0;

bool LogFile::init(const std::string& path) {
    RNS::setLogCallback(logCallback);

    if (path.empty()) {
        return true;
    }

    _path = path;
    _file = fopen(_path.c_str(), "a");
    if (!_file) {
        fprintf(stderr, "[LogFile] Failed to open log file %s\n", _path.c_str());
        return false;
    }

    fseek(_file, 0, SEEK_END);
    long size = ftell(_file);
    _bytes_written = (size > 0) ? static_cast<uint32_t>(size) : 0;
    _line_count = 0;

    fprintf(_file, "\n=== LOGGING STARTED ===\n");
    fflush(_file);
    return true;
}

void LogFile::logCallback(const char* msg, RNS::LogLevel level) {
    // Always print to stderr as well
    fprintf(stderr, "%s [%s] %s\n", RNS::getTimeString(), RNS::getLevelName(level), msg);

    if (_file) {
        writeToFile(msg, level);
    }
}

void LogFile::writeToFile(const char* msg, RNS::LogLevel level) {
    int written = fprintf(_file, "%s [%s] %s\n", RNS::getTimeString(), RNS::getLevelName(level), msg);
    if (written > 0) {
        _bytes_written += static_cast<uint32_t>(written);
        _line_count++;
    }

    // Always flush errors and warnings immediately
    if (level <= RNS::LOG_WARNING || _line_count >= Logging::FLUSH_AFTER_LINES) {
        fflush(_file);
        _line_count = 0;
    }

    if (_bytes_written >= Logging::MAX_LOG_SIZE) {
        rotate();
    }
}

void LogFile::rotate() {
    if (!_file) return;

    fclose(_file);
    _file = nullptr;

    std::string previous = _path + ".1";
    remove(previous.c_str());
    rename(_path.c_str(), previous.c_str());

    _file = fopen(_path.c_str(), "w");
    if (!_file) {
        fprintf(stderr, "[LogFile] Failed to create new log file after rotation\n");
        return;
    }

    fprintf(_file, "=== LOG ROTATED ===\n");
    fflush(_file);
    _bytes_written = 0;
    _line_count = 0;
}

void LogFile::flush() {
    if (_file) {
        fflush(_file);
        _line_count = 0;
    }
}

void LogFile::close() {
    if (_file) {
        fprintf(_file, "=== LOG CLOSED CLEANLY ===\n");
        fclose(_file);
        _file = nullptr;
    }
    // Restore default logging
    RNS::setLogCallback(nullptr);
}

bool LogFile::parseLevel(const std::string& name, RNS::LogLevel& level) {
    std::string lower = name;
    for (auto& c : lower) {
        c = static_cast<char>(tolower(static_cast<unsigned char>(c)));
    }

    if (lower == "critical") level = RNS::LOG_CRITICAL;
    else if (lower == "error") level = RNS::LOG_ERROR;
    else if (lower == "warning" || lower == "warn") level = RNS::LOG_WARNING;
    else if (lower == "notice") level = RNS::LOG_NOTICE;
    else if (lower == "info") level = RNS::LOG_INFO;
    else if (lower == "verbose") level = RNS::LOG_VERBOSE;
    else if (lower == "debug") level = RNS::LOG_DEBUG;
    else if (lower == "trace") level = RNS::LOG_TRACE;
    else return false;
    return true;
}
