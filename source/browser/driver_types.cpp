#include "browser/driver_types.hpp"

namespace browser_driver {

const char *error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None:
        return "None";
    case ErrorKind::Attach:
        return "AttachError";
    case ErrorKind::NotAttached:
        return "NotAttachedError";
    case ErrorKind::Protocol:
        return "ProtocolError";
    case ErrorKind::Transport:
        return "TransportError";
    case ErrorKind::Timeout:
        return "TimeoutError";
    case ErrorKind::NavigationTimeout:
        return "NavigationTimeoutError";
    case ErrorKind::SelectorTimeout:
        return "SelectorTimeoutError";
    case ErrorKind::Evaluation:
        return "EvaluationError";
    }
    return "UnknownError";
}

} // namespace browser_driver
