#pragma once

#include "models.hpp"
#include "storage.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace stock_control {

/// Owns the in-memory product catalog and transaction ledger, enforces every
/// inventory rule and writes both collections back to storage after each
/// mutation.
///
/// Errors are reported by throwing InventoryError subclasses.  Validation
/// failures leave state untouched.  A StorageError raised while saving comes
/// after the in-memory change has been applied, and that change is kept:
/// memory may then be ahead of storage.
class InventoryService {
public:
    using TimeSource = std::function<Timestamp()>;

    /// Load both collections from @p storage.  @p now stamps new transactions
    /// and defaults to nowUtc().
    /// @throws StorageError if either collection cannot be loaded, or if the
    ///         stored products contain a duplicate SKU.
    explicit InventoryService(Storage& storage,
                              bool verbose = false,
                              TimeSource now = nullptr);

    /// @throws InvalidInputError  blank sku/name, negative quantity or reorder point
    /// @throws DuplicateSkuError  a product with @p sku already exists
    Product createProduct(const std::string& sku,
                          const std::string& name,
                          const std::string& description,
                          std::int64_t initialQuantity,
                          std::int64_t reorderPoint);

    /// Change only the supplied fields.  Quantity, id and sku are never touched.
    /// @throws ProductNotFoundError, InvalidInputError
    Product updateProduct(const std::string& sku,
                          const std::optional<std::string>& name,
                          const std::optional<std::string>& description,
                          const std::optional<std::int64_t>& reorderPoint);

    /// @throws ProductNotFoundError, InvalidInputError (quantity <= 0)
    void addStock(const std::string& sku,
                  std::int64_t quantity,
                  const std::optional<std::string>& notes = std::nullopt);

    /// @throws ProductNotFoundError, InvalidInputError (quantity <= 0),
    ///         InsufficientStockError (quantity exceeds what is held)
    void removeStock(const std::string& sku,
                     std::int64_t quantity,
                     const std::optional<std::string>& notes = std::nullopt);

    /// @throws ProductNotFoundError
    Product getProduct(const std::string& sku) const;

    /// All live products, ordered by SKU.
    std::vector<Product> listProducts() const;

    /// Products whose quantity is at or below their reorder point, ordered by SKU.
    std::vector<Product> listLowStock() const;

    /// Remove the product and every transaction recorded against its SKU.
    /// @throws ProductNotFoundError
    void deleteProduct(const std::string& sku);

    /// Transactions for @p sku in ascending timestamp order; empty for an
    /// unknown SKU.
    std::vector<Transaction> getTransactions(const std::string& sku) const;

    /// As getTransactions, restricted to start <= timestamp <= end.
    std::vector<Transaction> getTransactionsInRange(const std::string& sku,
                                                    Timestamp start,
                                                    Timestamp end) const;

private:
    Storage&                       mStorage;
    bool                           mVerbose;
    TimeSource                     mNow;
    std::map<std::string, Product> mProducts;      // keyed by SKU
    std::vector<Transaction>       mTransactions;  // insertion order

    Product& findProduct(const std::string& sku);
    const Product& findProduct(const std::string& sku) const;

    void recordTransaction(const std::string& sku,
                           TransactionType type,
                           std::int64_t quantity,
                           const std::optional<std::string>& notes);

    std::vector<Transaction> collectSorted(
        const std::function<bool(const Transaction&)>& predicate) const;

    /// Write products, then transactions.  Either may throw StorageError.
    void persistAll();
};

} // namespace stock_control
