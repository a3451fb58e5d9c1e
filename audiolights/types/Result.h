#pragma once

#include <string>

/**
 * ErrorKind - Failure categories reported across module boundaries
 *
 * NONE means success. Everything else carries a human readable message.
 */
enum class ErrorKind {
    NONE,
    CONFIGURATION,   // Bad config value, empty layout, unknown key type
    AUDIO_SOURCE,    // Source could not be opened or failed while running
    TRANSPORT,       // Remote host rejected or never answered a light command
    PATTERN          // Unknown pattern name or index
};

/**
 * Result - Success/failure value returned by fallible operations
 *
 * Usage:
 *   Result r = config.validate();
 *   if (!r) { DEBUG_ERROR_F("%s\n", r.message.c_str()); return 1; }
 */
struct Result {
    ErrorKind kind = ErrorKind::NONE;
    std::string message;

    static Result ok() {
        return Result();
    }

    static Result fail(ErrorKind k, const std::string& msg) {
        Result r;
        r.kind = k;
        r.message = msg;
        return r;
    }

    bool isOk() const { return kind == ErrorKind::NONE; }
    explicit operator bool() const { return isOk(); }

    static const char* kindName(ErrorKind k) {
        switch (k) {
            case ErrorKind::NONE:          return "ok";
            case ErrorKind::CONFIGURATION: return "configuration";
            case ErrorKind::AUDIO_SOURCE:  return "audio source";
            case ErrorKind::TRANSPORT:     return "transport";
            case ErrorKind::PATTERN:       return "pattern";
            default:                       return "unknown";
        }
    }
};
