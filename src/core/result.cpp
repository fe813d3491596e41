#include <toolpipe/core/result.hpp>

#include <sstream>

namespace toolpipe {

Error Error::Make(ErrorCategory category, std::string operation,
                  std::string message) {
    Error error;
    error.operation = std::move(operation);
    error.message = std::move(message);
    error.category = category;
    return error;
}

std::string Error::KindName() const {
    switch (category) {
        case ErrorCategory::Framing:            return "FramingError";
        case ErrorCategory::ProtocolSequence:   return "ProtocolSequenceError";
        case ErrorCategory::VersionMismatch:    return "VersionMismatchError";
        case ErrorCategory::UnknownTool:        return "UnknownToolError";
        case ErrorCategory::ArgumentValidation: return "ArgumentValidationError";
        case ErrorCategory::Domain:             return "DomainError";
        case ErrorCategory::DuplicateTool:      return "DuplicateToolError";
        case ErrorCategory::Config:             return "ConfigError";
        case ErrorCategory::Database:           return "DatabaseError";
        case ErrorCategory::Transport:          return "TransportError";
        case ErrorCategory::Internal:           return "InternalError";
    }
    return "InternalError";
}

bool Error::IsFatal() const noexcept {
    switch (category) {
        case ErrorCategory::Framing:
        case ErrorCategory::ProtocolSequence:
        case ErrorCategory::VersionMismatch:
        case ErrorCategory::Transport:
            return true;
        default:
            return false;
    }
}

int Error::ExitCode() const noexcept {
    switch (category) {
        case ErrorCategory::Transport:        return 1;
        case ErrorCategory::Framing:          return 2;
        case ErrorCategory::ProtocolSequence: return 3;
        case ErrorCategory::VersionMismatch:  return 4;
        case ErrorCategory::Config:           return 5;
        case ErrorCategory::Database:         return 6;
        default:                              return 99;
    }
}

std::string Error::ToString() const {
    std::ostringstream oss;
    oss << operation;
    if (correlation_id.has_value()) {
        oss << " [id " << *correlation_id << "]";
    }
    oss << " (" << KindName() << "): " << message;
    return oss.str();
}

} // namespace toolpipe
