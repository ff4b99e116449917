#ifndef CORE_ERRORS_HPP
#define CORE_ERRORS_HPP

#include <string>
#include <utility>
#include <variant>

enum class ErrorKind {
    Validation,
    NoInterfaceFound,
    NoCapableHardware,
    PermissionDenied,
    AlreadyActive,
    InvalidState,
    Start,
    Stop,
    UnexpectedExit
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Validation: return "Invalid input";
        case ErrorKind::NoInterfaceFound: return "No wireless interface";
        case ErrorKind::NoCapableHardware: return "Hardware not supported";
        case ErrorKind::PermissionDenied: return "Permission denied";
        case ErrorKind::AlreadyActive: return "Hotspot already active";
        case ErrorKind::InvalidState: return "Invalid state";
        case ErrorKind::Start: return "Failed to start hotspot";
        case ErrorKind::Stop: return "Failed to stop hotspot";
        case ErrorKind::UnexpectedExit: return "Hotspot exited unexpectedly";
    }
    return "Error";
}

struct HotspotError {
    ErrorKind kind = ErrorKind::Start;
    std::string message;
    // Captured helper output, when a subprocess was involved.
    std::string output;

    HotspotError() = default;
    HotspotError(ErrorKind error_kind, std::string error_message, std::string process_output = "")
        : kind(error_kind), message(std::move(error_message)), output(std::move(process_output)) {}

    std::string describe() const {
        std::string text = std::string(error_kind_name(kind)) + ": " + message;
        if (!output.empty()) {
            text += "\n" + output;
        }
        return text;
    }
};

template <typename T>
using Result = std::variant<T, HotspotError>;

template <typename T>
const HotspotError* error_of(const Result<T>& result) {
    return std::get_if<HotspotError>(&result);
}

#endif
