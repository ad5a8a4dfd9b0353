#include "coffer/transfer/transfer_types.hpp"

namespace coffer::transfer {

const char* transfer_status_name(TransferStatus status) {
    switch (status) {
        case TransferStatus::WAITING: return "waiting";
        case TransferStatus::TRANSFERRING: return "transferring";
        case TransferStatus::FINISHED: return "finished";
        case TransferStatus::FAILED: return "failed";
        case TransferStatus::CANCELLED: return "cancelled";
    }
    return "unknown";
}

} // namespace coffer::transfer
