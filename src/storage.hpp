#pragma once

#include "models.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace stock_control {

/// Durable home for the product set and the transaction ledger.
/// Both collections are loaded and saved whole; there is no incremental update.
/// Every method throws StorageError on failure.
class Storage {
public:
    virtual ~Storage() = default;

    /// Empty when nothing has been stored yet.
    virtual std::vector<Product> loadProducts() = 0;
    virtual std::vector<Transaction> loadTransactions() = 0;

    /// Overwrite the stored collection with @p products.
    virtual void saveProducts(const std::vector<Product>& products) = 0;
    virtual void saveTransactions(const std::vector<Transaction>& transactions) = 0;
};

/// Stores each collection as a pretty-printed JSON array in its own file.
class JsonFileStorage : public Storage {
public:
    static constexpr const char* kProductsFile     = "products.json";
    static constexpr const char* kTransactionsFile = "transactions.json";

    /// Files live at <dataDir>/products.json and <dataDir>/transactions.json.
    explicit JsonFileStorage(const std::filesystem::path& dataDir,
                             bool verbose = false);

    JsonFileStorage(const std::filesystem::path& productsPath,
                    const std::filesystem::path& transactionsPath,
                    bool verbose = false);

    std::vector<Product> loadProducts() override;
    std::vector<Transaction> loadTransactions() override;
    void saveProducts(const std::vector<Product>& products) override;
    void saveTransactions(const std::vector<Transaction>& transactions) override;

    const std::filesystem::path& productsPath() const { return mProductsPath; }
    const std::filesystem::path& transactionsPath() const { return mTransactionsPath; }

private:
    std::filesystem::path mProductsPath;
    std::filesystem::path mTransactionsPath;
    bool                  mVerbose;

    /// Contents of @p path, or an empty string if the file does not exist.
    std::string readFile(const std::filesystem::path& path) const;
    void writeFile(const std::filesystem::path& path, const std::string& contents) const;
};

} // namespace stock_control
