#pragma once

#include <string>
#include <string_view>

enum class ErrorCode {
    Decode,
    EmptyAudio,
    UnknownProfile,
    InvalidParameter,
    DuplicateProfile,
    RunnerBusy,
    UnknownRunner,
    UnknownAudio,
    UnknownJob,
    InvalidState,
    Io,
    Model,
};

struct Error {
    ErrorCode code;
    std::string message;

    // "DecodeError: <message>"
    std::string describe() const;
};

// Stable names used on the IPC wire, e.g. "RunnerBusyError".
std::string_view error_name(ErrorCode code);
