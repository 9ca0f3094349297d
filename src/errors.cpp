#include "errors.h"

namespace rtvoice {

const char* describe(ErrorType type) {
    switch (type) {
        case ErrorType::None: return "None";
        case ErrorType::DeviceUnavailable: return "DeviceUnavailable";
        case ErrorType::PermissionDenied: return "PermissionDenied";
        case ErrorType::DeviceBusy: return "DeviceBusy";
        case ErrorType::UnsupportedConstraints: return "UnsupportedConstraints";
        case ErrorType::NotInitialized: return "NotInitialized";
        case ErrorType::ClosingInProgress: return "ClosingInProgress";
        case ErrorType::ConnectionFailed: return "ConnectionFailed";
        case ErrorType::ConnectionLost: return "ConnectionLost";
        case ErrorType::ProtocolError: return "ProtocolError";
        case ErrorType::ReconnectExhausted: return "ReconnectExhausted";
        case ErrorType::UpstreamError: return "UpstreamError";
        case ErrorType::MissingRequiredFields: return "MissingRequiredFields";
        case ErrorType::SchemaUnavailable: return "SchemaUnavailable";
        case ErrorType::ExecutorFailure: return "ExecutorFailure";
        case ErrorType::IOError: return "IOError";
        case ErrorType::NetworkError: return "NetworkError";
        case ErrorType::ParseError: return "ParseError";
        case ErrorType::InvalidState: return "InvalidState";
        case ErrorType::Timeout: return "Timeout";
        case ErrorType::Unknown: return "Unknown";
    }
    return "Unknown";
}

} // namespace rtvoice
