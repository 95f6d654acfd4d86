// ============================================================================
// File: src/core/Error.h
// Version: 1.0.0
// Project: MidiBeat - Beat-addressed MIDI conversion toolkit
// ============================================================================
//
// Description:
//   Every failure in MidiBeat is a MidiBeatException carrying an ErrorCode.
//   Throw sites use MIDIBEAT_THROW(code, message); callers that need to
//   react to a specific failure switch on getCode().
//
// ============================================================================

#pragma once

#include <stdexcept>
#include <string>

namespace midiBeat {

enum class ErrorCode {
    SUCCESS = 0,
    INVALID_ARGUMENT,           ///< Out-of-range value passed by the caller
    INTERNAL_ERROR,

    CONFIG_PARSE_ERROR,         ///< Configuration is not valid JSON
    INVALID_CONFIG,             ///< Configuration is JSON but not usable

    FILE_NOT_FOUND,
    FILE_READ_ERROR,
    FILE_WRITE_ERROR,

    // Standard MIDI File bytes
    MIDI_FILE_INVALID_FORMAT,   ///< Not an SMF, or an unsupported header
    MIDI_FILE_CORRUPTED,        ///< Truncated chunk, bad VLQ, bad running status

    // Beat representation
    INVALID_MIDI,               ///< Events that cannot become notes or tempo changes
    INVALID_TEMPO,              ///< bpm <= 0, not finite, or not encodable
    NEGATIVE_DURATION,          ///< Tempo integration produced end < start
    NO_TEMPO_DEFINED,           ///< Tempo query before the first tempo change

    FILTER_NOT_FOUND
};

inline const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS:                  return "SUCCESS";
        case ErrorCode::INVALID_ARGUMENT:         return "INVALID_ARGUMENT";
        case ErrorCode::INTERNAL_ERROR:           return "INTERNAL_ERROR";
        case ErrorCode::CONFIG_PARSE_ERROR:       return "CONFIG_PARSE_ERROR";
        case ErrorCode::INVALID_CONFIG:           return "INVALID_CONFIG";
        case ErrorCode::FILE_NOT_FOUND:           return "FILE_NOT_FOUND";
        case ErrorCode::FILE_READ_ERROR:          return "FILE_READ_ERROR";
        case ErrorCode::FILE_WRITE_ERROR:         return "FILE_WRITE_ERROR";
        case ErrorCode::MIDI_FILE_INVALID_FORMAT: return "MIDI_FILE_INVALID_FORMAT";
        case ErrorCode::MIDI_FILE_CORRUPTED:      return "MIDI_FILE_CORRUPTED";
        case ErrorCode::INVALID_MIDI:             return "INVALID_MIDI";
        case ErrorCode::INVALID_TEMPO:            return "INVALID_TEMPO";
        case ErrorCode::NEGATIVE_DURATION:        return "NEGATIVE_DURATION";
        case ErrorCode::NO_TEMPO_DEFINED:         return "NO_TEMPO_DEFINED";
        case ErrorCode::FILTER_NOT_FOUND:         return "FILTER_NOT_FOUND";
    }
    return "UNKNOWN_ERROR_CODE";
}

/**
 * @class MidiBeatException
 * @brief std::runtime_error tagged with an ErrorCode
 */
class MidiBeatException : public std::runtime_error {
public:
    MidiBeatException(ErrorCode code, const std::string& message)
        : std::runtime_error(message)
        , code_(code) {}

    ErrorCode getCode() const { return code_; }

    const char* getCodeString() const { return errorCodeToString(code_); }

private:
    ErrorCode code_;
};

#define MIDIBEAT_THROW(code, message) \
    throw midiBeat::MidiBeatException(code, message)

} // namespace midiBeat

// ============================================================================
// END OF FILE Error.h
// ============================================================================
