#include "errors.hpp"

std::string_view error_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Decode: return "DecodeError";
        case ErrorCode::EmptyAudio: return "EmptyAudioError";
        case ErrorCode::UnknownProfile: return "UnknownProfileError";
        case ErrorCode::InvalidParameter: return "InvalidParameterError";
        case ErrorCode::DuplicateProfile: return "DuplicateProfileError";
        case ErrorCode::RunnerBusy: return "RunnerBusyError";
        case ErrorCode::UnknownRunner: return "UnknownRunnerError";
        case ErrorCode::UnknownAudio: return "UnknownAudioError";
        case ErrorCode::UnknownJob: return "UnknownJobError";
        case ErrorCode::InvalidState: return "InvalidStateError";
        case ErrorCode::Io: return "IoError";
        case ErrorCode::Model: return "ModelError";
    }
    return "Error";
}

std::string Error::describe() const {
    std::string out(error_name(code));
    if (!message.empty()) {
        out += ": ";
        out += message;
    }
    return out;
}
