// Copyright (C) 2018-2024 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

/**
 * @brief a header file with the logging facility of the palette library
 * @file slog.hpp
 */

#pragma once

#include <iostream>
#include <stdexcept>
#include <string>

namespace slog {

enum class LogLevel { Debug = 0, Info, Warning, Error, Silent };

/// Messages below this level are dropped, shared by every translation unit
inline LogLevel& threshold() {
    static LogLevel level = LogLevel::Info;
    return level;
}

inline void setLevel(LogLevel level) {
    threshold() = level;
}

/// Accepts debug, info, warning, error and silent
inline LogLevel parseLevel(const std::string& name) {
    if (name == "debug") {
        return LogLevel::Debug;
    } else if (name == "info") {
        return LogLevel::Info;
    } else if (name == "warning") {
        return LogLevel::Warning;
    } else if (name == "error") {
        return LogLevel::Error;
    } else if (name == "silent") {
        return LogLevel::Silent;
    }
    throw std::invalid_argument("Unknown log level: " + name);
}

/**
 * @class LogStreamEndLine
 * @brief The LogStreamEndLine class implements an end line marker for a log stream
 */
class LogStreamEndLine {};

static constexpr LogStreamEndLine endl;

/**
 * @class LogStream
 * @brief The LogStream class prefixes every line with its severity and drops it below the threshold
 */
class LogStream {
    std::string _prefix;
    LogLevel _level;
    std::ostream* _log_stream;
    bool _new_line;

    bool enabled() const {
        return _level >= threshold();
    }

public:
    /**
     * @brief A constructor. Creates a LogStream object
     * @param prefix The prefix to print
     * @param level Severity of the messages written to this stream
     */
    LogStream(const std::string& prefix, LogLevel level, std::ostream& log_stream)
        : _prefix(prefix),
          _level(level),
          _new_line(true) {
        _log_stream = &log_stream;
    }

    template <class T>
    LogStream& operator<<(const T& arg) {
        if (!enabled()) {
            return *this;
        }
        if (_new_line) {
            (*_log_stream) << "[ " << _prefix << " ] ";
            _new_line = false;
        }

        (*_log_stream) << arg;
        return *this;
    }

    // Specializing for LogStreamEndLine to support slog::endl
    LogStream& operator<<(const LogStreamEndLine& /*arg*/) {
        if (!enabled()) {
            return *this;
        }
        _new_line = true;

        (*_log_stream) << std::endl;
        return *this;
    }
};

static LogStream debug("DEBUG", LogLevel::Debug, std::cout);
static LogStream info("INFO", LogLevel::Info, std::cout);
static LogStream warn("WARNING", LogLevel::Warning, std::cerr);
static LogStream err("ERROR", LogLevel::Error, std::cerr);

}  // namespace slog
