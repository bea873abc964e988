#pragma once

#include "models.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace stock_control {

/// "Addition" / "Removal".
std::string toString(TransactionType type);

/// Inverse of toString(TransactionType).
/// Throws std::invalid_argument for any other spelling.
TransactionType parseTransactionType(const std::string& text);

nlohmann::json productToJson(const Product& product);
nlohmann::json transactionToJson(const Transaction& transaction);

/// Map a stored product object into a Product.
/// Unlike a lenient API mapping, every key is required and type-checked.
/// Throws std::runtime_error describing the first offending field.
Product parseProduct(const nlohmann::json& node);

/// Map a stored transaction object into a Transaction.
/// `notes` may be absent or null; every other key is required.
/// Throws std::runtime_error describing the first offending field.
Transaction parseTransaction(const nlohmann::json& node);

/// Decode a whole collection.  The top level must be an array; a single bad
/// element fails the whole list (no partial results).
std::vector<Product>     parseProductList(const nlohmann::json& doc);
std::vector<Transaction> parseTransactionList(const nlohmann::json& doc);

nlohmann::json productListToJson(const std::vector<Product>& products);
nlohmann::json transactionListToJson(const std::vector<Transaction>& transactions);

} // namespace stock_control
