#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace stock_control {

using Clock     = std::chrono::system_clock;
using Timestamp = Clock::time_point;

/// A catalog entry.  `quantity` only ever changes through stock transactions.
struct Product {
    std::string  id;            // UUID, assigned once at creation
    std::string  sku;
    std::string  name;
    std::string  description;
    std::int64_t quantity      = 0;
    std::int64_t reorderPoint  = 0;

    /// Low stock is derived, never stored.
    bool isLowStock() const { return quantity <= reorderPoint; }
};

enum class TransactionType {
    Addition,
    Removal,
};

/// One immutable stock movement in the ledger.
struct Transaction {
    std::string                id;
    std::string                productSku;   // lookup key, may dangle after delete
    TransactionType            type = TransactionType::Addition;
    std::int64_t               quantity = 0;
    Timestamp                  timestamp{};
    std::optional<std::string> notes;
};

inline bool operator==(const Product& a, const Product& b) {
    return a.id == b.id && a.sku == b.sku && a.name == b.name
        && a.description == b.description && a.quantity == b.quantity
        && a.reorderPoint == b.reorderPoint;
}

inline bool operator!=(const Product& a, const Product& b) { return !(a == b); }

inline bool operator==(const Transaction& a, const Transaction& b) {
    return a.id == b.id && a.productSku == b.productSku && a.type == b.type
        && a.quantity == b.quantity && a.timestamp == b.timestamp
        && a.notes == b.notes;
}

inline bool operator!=(const Transaction& a, const Transaction& b) { return !(a == b); }

} // namespace stock_control
