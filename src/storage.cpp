#include "storage.hpp"
#include "errors.hpp"
#include "mapping.hpp"
#include "util.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace stock_control {

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

JsonFileStorage::JsonFileStorage(const fs::path& dataDir, bool verbose)
    : mProductsPath(dataDir / kProductsFile)
    , mTransactionsPath(dataDir / kTransactionsFile)
    , mVerbose(verbose) {}

JsonFileStorage::JsonFileStorage(const fs::path& productsPath,
                                 const fs::path& transactionsPath,
                                 bool verbose)
    : mProductsPath(productsPath)
    , mTransactionsPath(transactionsPath)
    , mVerbose(verbose) {}

// ---------------------------------------------------------------------------
// Storage interface
// ---------------------------------------------------------------------------

std::vector<Product> JsonFileStorage::loadProducts() {
    const std::string contents = readFile(mProductsPath);
    if (isBlank(contents)) {
        return {};
    }

    std::vector<Product> products;
    try {
        products = parseProductList(nlohmann::json::parse(contents));
    } catch (const nlohmann::json::exception& e) {
        throw StorageError(StorageError::Cause::Parse,
                           "Failed to parse " + mProductsPath.string() + ": " + e.what());
    } catch (const std::runtime_error& e) {
        throw StorageError(StorageError::Cause::Parse,
                           "Failed to parse " + mProductsPath.string() + ": " + e.what());
    }

    if (mVerbose) {
        std::cerr << "[JsonFileStorage] Loaded " << products.size()
                  << " products from " << mProductsPath << "\n";
    }
    return products;
}

std::vector<Transaction> JsonFileStorage::loadTransactions() {
    const std::string contents = readFile(mTransactionsPath);
    if (isBlank(contents)) {
        return {};
    }

    std::vector<Transaction> transactions;
    try {
        transactions = parseTransactionList(nlohmann::json::parse(contents));
    } catch (const nlohmann::json::exception& e) {
        throw StorageError(StorageError::Cause::Parse,
                           "Failed to parse " + mTransactionsPath.string() + ": " + e.what());
    } catch (const std::runtime_error& e) {
        throw StorageError(StorageError::Cause::Parse,
                           "Failed to parse " + mTransactionsPath.string() + ": " + e.what());
    }

    if (mVerbose) {
        std::cerr << "[JsonFileStorage] Loaded " << transactions.size()
                  << " transactions from " << mTransactionsPath << "\n";
    }
    return transactions;
}

void JsonFileStorage::saveProducts(const std::vector<Product>& products) {
    std::string body;
    try {
        body = productListToJson(products).dump(2);
    } catch (const nlohmann::json::exception& e) {
        throw StorageError(StorageError::Cause::Write,
                           std::string("Failed to serialize products: ") + e.what());
    }
    writeFile(mProductsPath, body);

    if (mVerbose) {
        std::cerr << "[JsonFileStorage] Wrote " << products.size()
                  << " products to " << mProductsPath << "\n";
    }
}

void JsonFileStorage::saveTransactions(const std::vector<Transaction>& transactions) {
    std::string body;
    try {
        body = transactionListToJson(transactions).dump(2);
    } catch (const nlohmann::json::exception& e) {
        throw StorageError(StorageError::Cause::Write,
                           std::string("Failed to serialize transactions: ") + e.what());
    }
    writeFile(mTransactionsPath, body);

    if (mVerbose) {
        std::cerr << "[JsonFileStorage] Wrote " << transactions.size()
                  << " transactions to " << mTransactionsPath << "\n";
    }
}

// ---------------------------------------------------------------------------
// File helpers
// ---------------------------------------------------------------------------

std::string JsonFileStorage::readFile(const fs::path& path) const {
    std::error_code ec;
    const bool exists = fs::exists(path, ec);
    if (ec) {
        throw StorageError(StorageError::Cause::Read,
                           "Failed to read " + path.string() + ": " + ec.message());
    }
    if (!exists) {
        return {};
    }
    if (fs::is_directory(path, ec)) {
        throw StorageError(StorageError::Cause::Read,
                           "Failed to read " + path.string() + ": is a directory");
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw StorageError(StorageError::Cause::Read,
                           "Failed to read " + path.string() + ": cannot open file");
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        throw StorageError(StorageError::Cause::Read,
                           "Failed to read " + path.string() + ": I/O error");
    }
    return buffer.str();
}

void JsonFileStorage::writeFile(const fs::path& path, const std::string& contents) const {
    const fs::path parent = path.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            throw StorageError(StorageError::Cause::Write,
                               "Failed to create directory " + parent.string() + ": "
                                   + ec.message());
        }
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw StorageError(StorageError::Cause::Write,
                           "Failed to write " + path.string() + ": cannot open file");
    }

    out << contents;
    out.flush();
    if (!out) {
        throw StorageError(StorageError::Cause::Write,
                           "Failed to write " + path.string() + ": I/O error");
    }
}

} // namespace stock_control
