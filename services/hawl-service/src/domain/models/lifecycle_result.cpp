#include "lifecycle_result.h"

namespace nisab::hawl::domain {

std::string toString(LifecycleErrorCode code) {
    switch (code) {
        case LifecycleErrorCode::InvalidTransition: return "INVALID_TRANSITION";
        case LifecycleErrorCode::DuplicateOpenWindow: return "DUPLICATE_OPEN_WINDOW";
        case LifecycleErrorCode::InsufficientJustification: return "INSUFFICIENT_JUSTIFICATION";
        case LifecycleErrorCode::RecordNotFound: return "RECORD_NOT_FOUND";
        case LifecycleErrorCode::InvalidInput: return "INVALID_INPUT";
    }
    return "INVALID_INPUT";
}

} // namespace nisab::hawl::domain
