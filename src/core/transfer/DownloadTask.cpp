#include "DownloadTask.hpp"

namespace qsde::core::transfer {

const char* toString(TransferState state) {
    switch (state) {
        case TransferState::Pending:    return "pending";
        case TransferState::Active:     return "active";
        case TransferState::Verifying:  return "verifying";
        case TransferState::Publishing: return "publishing";
        case TransferState::Succeeded:  return "succeeded";
        case TransferState::Failed:     return "failed";
        case TransferState::Cancelled:  return "cancelled";
    }
    return "unknown";
}

const char* toString(ErrorClass errorClass) {
    switch (errorClass) {
        case ErrorClass::Transient:         return "transient";
        case ErrorClass::PermanentRemote:   return "permanent_remote";
        case ErrorClass::LocalResource:     return "local_resource";
        case ErrorClass::IntegrityMismatch: return "integrity_mismatch";
    }
    return "unknown";
}

} // namespace qsde::core::transfer
