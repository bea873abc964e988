#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace stock_control {

enum class ErrorKind {
    InvalidInput,
    ProductNotFound,
    DuplicateSku,
    InsufficientStock,
    StorageFailure,
};

/// Human-readable name of an ErrorKind, e.g. "ProductNotFound".
const char* toString(ErrorKind kind);

/// Base for every error the inventory service reports to its caller.
class InventoryError : public std::runtime_error {
public:
    InventoryError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message)
        , mKind(kind) {}

    ErrorKind kind() const { return mKind; }

private:
    ErrorKind mKind;
};

class InvalidInputError : public InventoryError {
public:
    explicit InvalidInputError(const std::string& message)
        : InventoryError(ErrorKind::InvalidInput, "Invalid input: " + message)
        , mMessage(message) {}

    /// The rule that was broken, without the "Invalid input: " prefix.
    const std::string& message() const { return mMessage; }

private:
    std::string mMessage;
};

class ProductNotFoundError : public InventoryError {
public:
    explicit ProductNotFoundError(const std::string& sku)
        : InventoryError(ErrorKind::ProductNotFound, "Product not found: " + sku)
        , mSku(sku) {}

    const std::string& sku() const { return mSku; }

private:
    std::string mSku;
};

class DuplicateSkuError : public InventoryError {
public:
    explicit DuplicateSkuError(const std::string& sku)
        : InventoryError(ErrorKind::DuplicateSku,
                         "Product with SKU '" + sku + "' already exists")
        , mSku(sku) {}

    const std::string& sku() const { return mSku; }

private:
    std::string mSku;
};

class InsufficientStockError : public InventoryError {
public:
    InsufficientStockError(const std::string& sku,
                           std::int64_t requested,
                           std::int64_t available);

    const std::string& sku() const { return mSku; }
    std::int64_t requested() const { return mRequested; }
    std::int64_t available() const { return mAvailable; }

private:
    std::string  mSku;
    std::int64_t mRequested;
    std::int64_t mAvailable;
};

/// The persistence layer could not complete a read or a write.
class StorageError : public InventoryError {
public:
    enum class Cause {
        Read,
        Write,
        Parse,
    };

    StorageError(Cause cause, const std::string& detail);

    Cause cause() const { return mCause; }
    const std::string& detail() const { return mDetail; }

private:
    Cause       mCause;
    std::string mDetail;
};

} // namespace stock_control
