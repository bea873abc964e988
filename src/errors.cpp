#include "errors.hpp"

namespace stock_control {

namespace {

std::string describeStorageCause(StorageError::Cause cause) {
    switch (cause) {
        case StorageError::Cause::Read:  return "Failed to read from storage: ";
        case StorageError::Cause::Write: return "Failed to write to storage: ";
        case StorageError::Cause::Parse: return "Failed to parse storage data: ";
    }
    return "Storage error: ";
}

} // namespace

const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidInput:      return "InvalidInput";
        case ErrorKind::ProductNotFound:   return "ProductNotFound";
        case ErrorKind::DuplicateSku:      return "DuplicateSku";
        case ErrorKind::InsufficientStock: return "InsufficientStock";
        case ErrorKind::StorageFailure:    return "StorageFailure";
    }
    return "Unknown";
}

InsufficientStockError::InsufficientStockError(const std::string& sku,
                                               std::int64_t requested,
                                               std::int64_t available)
    : InventoryError(ErrorKind::InsufficientStock,
                     "Insufficient stock for product '" + sku + "': requested "
                         + std::to_string(requested) + ", available "
                         + std::to_string(available))
    , mSku(sku)
    , mRequested(requested)
    , mAvailable(available) {}

StorageError::StorageError(Cause cause, const std::string& detail)
    : InventoryError(ErrorKind::StorageFailure, describeStorageCause(cause) + detail)
    , mCause(cause)
    , mDetail(detail) {}

} // namespace stock_control
