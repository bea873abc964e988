#include "inventory_service.hpp"
#include "errors.hpp"
#include "util.hpp"

#include <algorithm>
#include <iostream>
#include <iterator>
#include <limits>
#include <utility>

namespace stock_control {

InventoryService::InventoryService(Storage& storage, bool verbose, TimeSource now)
    : mStorage(storage)
    , mVerbose(verbose)
    , mNow(now ? std::move(now) : TimeSource(nowUtc))
{
    for (auto& product : mStorage.loadProducts()) {
        const std::string sku = product.sku;
        if (!mProducts.emplace(sku, std::move(product)).second) {
            throw StorageError(StorageError::Cause::Parse,
                               "duplicate SKU '" + sku + "' in stored products");
        }
    }
    mTransactions = mStorage.loadTransactions();

    if (mVerbose) {
        std::cerr << "[InventoryService] Loaded " << mProducts.size()
                  << " products and " << mTransactions.size()
                  << " transactions\n";
    }
}

// ---------------------------------------------------------------------------
// Mutations
// ---------------------------------------------------------------------------

Product InventoryService::createProduct(const std::string& sku,
                                        const std::string& name,
                                        const std::string& description,
                                        std::int64_t initialQuantity,
                                        std::int64_t reorderPoint)
{
    if (isBlank(sku)) {
        throw InvalidInputError("SKU cannot be empty");
    }
    if (isBlank(name)) {
        throw InvalidInputError("Name cannot be empty");
    }
    if (initialQuantity < 0) {
        throw InvalidInputError("Quantity cannot be negative");
    }
    if (reorderPoint < 0) {
        throw InvalidInputError("Reorder point cannot be negative");
    }
    if (mProducts.count(sku) != 0) {
        throw DuplicateSkuError(sku);
    }

    Product product;
    product.id           = generateId();
    product.sku          = sku;
    product.name         = name;
    product.description  = description;
    product.quantity     = initialQuantity;
    product.reorderPoint = reorderPoint;

    mProducts.emplace(sku, product);

    if (mVerbose) {
        std::cerr << "[InventoryService] Created product sku=" << sku
                  << " id=" << product.id << " qty=" << initialQuantity << "\n";
    }

    persistAll();
    return product;
}

Product InventoryService::updateProduct(const std::string& sku,
                                        const std::optional<std::string>& name,
                                        const std::optional<std::string>& description,
                                        const std::optional<std::int64_t>& reorderPoint)
{
    Product& product = findProduct(sku);

    if (name && isBlank(*name)) {
        throw InvalidInputError("Name cannot be empty");
    }
    if (reorderPoint && *reorderPoint < 0) {
        throw InvalidInputError("Reorder point cannot be negative");
    }

    if (name)         product.name         = *name;
    if (description)  product.description  = *description;
    if (reorderPoint) product.reorderPoint = *reorderPoint;

    const Product updated = product;

    if (mVerbose) {
        std::cerr << "[InventoryService] Updated product sku=" << sku << "\n";
    }

    persistAll();
    return updated;
}

void InventoryService::addStock(const std::string& sku,
                                std::int64_t quantity,
                                const std::optional<std::string>& notes)
{
    Product& product = findProduct(sku);

    if (quantity <= 0) {
        throw InvalidInputError("Quantity must be positive");
    }
    if (product.quantity > std::numeric_limits<std::int64_t>::max() - quantity) {
        throw InvalidInputError("Quantity would overflow the stock level of '" + sku + "'");
    }

    product.quantity += quantity;
    recordTransaction(sku, TransactionType::Addition, quantity, notes);

    if (mVerbose) {
        std::cerr << "[InventoryService] add_stock sku=" << sku << " qty=" << quantity
                  << " -> " << product.quantity << "\n";
    }

    persistAll();
}

void InventoryService::removeStock(const std::string& sku,
                                   std::int64_t quantity,
                                   const std::optional<std::string>& notes)
{
    Product& product = findProduct(sku);

    if (quantity <= 0) {
        throw InvalidInputError("Quantity must be positive");
    }
    if (quantity > product.quantity) {
        throw InsufficientStockError(sku, quantity, product.quantity);
    }

    product.quantity -= quantity;
    recordTransaction(sku, TransactionType::Removal, quantity, notes);

    if (mVerbose) {
        std::cerr << "[InventoryService] remove_stock sku=" << sku << " qty=" << quantity
                  << " -> " << product.quantity
                  << (product.isLowStock() ? " (low stock)" : "") << "\n";
    }

    persistAll();
}

void InventoryService::deleteProduct(const std::string& sku)
{
    if (mProducts.erase(sku) == 0) {
        throw ProductNotFoundError(sku);
    }

    const auto before = mTransactions.size();
    mTransactions.erase(
        std::remove_if(mTransactions.begin(), mTransactions.end(),
                       [&sku](const Transaction& t) { return t.productSku == sku; }),
        mTransactions.end());

    if (mVerbose) {
        std::cerr << "[InventoryService] Deleted product sku=" << sku << " and "
                  << (before - mTransactions.size()) << " transactions\n";
    }

    persistAll();
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

Product InventoryService::getProduct(const std::string& sku) const
{
    return findProduct(sku);
}

std::vector<Product> InventoryService::listProducts() const
{
    std::vector<Product> products;
    products.reserve(mProducts.size());
    for (const auto& entry : mProducts) {
        products.push_back(entry.second);
    }
    return products;
}

std::vector<Product> InventoryService::listLowStock() const
{
    std::vector<Product> products;
    for (const auto& entry : mProducts) {
        if (entry.second.isLowStock()) {
            products.push_back(entry.second);
        }
    }
    return products;
}

std::vector<Transaction> InventoryService::getTransactions(const std::string& sku) const
{
    return collectSorted([&sku](const Transaction& t) {
        return t.productSku == sku;
    });
}

std::vector<Transaction> InventoryService::getTransactionsInRange(const std::string& sku,
                                                                  Timestamp start,
                                                                  Timestamp end) const
{
    return collectSorted([&](const Transaction& t) {
        return t.productSku == sku && t.timestamp >= start && t.timestamp <= end;
    });
}

// ---------------------------------------------------------------------------
// Private helpers
// ---------------------------------------------------------------------------

Product& InventoryService::findProduct(const std::string& sku)
{
    auto it = mProducts.find(sku);
    if (it == mProducts.end()) {
        throw ProductNotFoundError(sku);
    }
    return it->second;
}

const Product& InventoryService::findProduct(const std::string& sku) const
{
    auto it = mProducts.find(sku);
    if (it == mProducts.end()) {
        throw ProductNotFoundError(sku);
    }
    return it->second;
}

void InventoryService::recordTransaction(const std::string& sku,
                                         TransactionType type,
                                         std::int64_t quantity,
                                         const std::optional<std::string>& notes)
{
    Transaction t;
    t.id         = generateId();
    t.productSku = sku;
    t.type       = type;
    t.quantity   = quantity;
    t.timestamp  = mNow();
    t.notes      = notes;
    mTransactions.push_back(std::move(t));
}

std::vector<Transaction> InventoryService::collectSorted(
    const std::function<bool(const Transaction&)>& predicate) const
{
    std::vector<Transaction> result;
    std::copy_if(mTransactions.begin(), mTransactions.end(),
                 std::back_inserter(result), predicate);

    // Equal timestamps keep ledger order.
    std::stable_sort(result.begin(), result.end(),
                     [](const Transaction& a, const Transaction& b) {
                         return a.timestamp < b.timestamp;
                     });
    return result;
}

void InventoryService::persistAll()
{
    try {
        mStorage.saveProducts(listProducts());
        mStorage.saveTransactions(mTransactions);
    } catch (const StorageError& e) {
        std::cerr << "[InventoryService] Persist failed, memory is ahead of storage: "
                  << e.what() << "\n";
        throw;
    }
}

} // namespace stock_control
