#include "mapping.hpp"
#include "util.hpp"

#include <limits>
#include <stdexcept>

namespace stock_control {

namespace {

const nlohmann::json& requireField(const nlohmann::json& node, const char* key) {
    if (!node.contains(key)) {
        throw std::runtime_error(std::string("missing field '") + key + "'");
    }
    return node[key];
}

std::string requireString(const nlohmann::json& node, const char* key) {
    const auto& field = requireField(node, key);
    if (!field.is_string()) {
        throw std::runtime_error(std::string("field '") + key + "' must be a string");
    }
    return field.get<std::string>();
}

std::int64_t requireCount(const nlohmann::json& node, const char* key) {
    const auto& field = requireField(node, key);
    if (!field.is_number_integer()) {
        throw std::runtime_error(std::string("field '") + key + "' must be an integer");
    }
    if (field.is_number_unsigned()) {
        const auto value = field.get<std::uint64_t>();
        if (value > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            throw std::runtime_error(std::string("field '") + key + "' is out of range");
        }
        return static_cast<std::int64_t>(value);
    }
    const auto value = field.get<std::int64_t>();
    if (value < 0) {
        throw std::runtime_error(std::string("field '") + key + "' must not be negative");
    }
    return value;
}

} // namespace

std::string toString(TransactionType type) {
    switch (type) {
        case TransactionType::Addition: return "Addition";
        case TransactionType::Removal:  return "Removal";
    }
    return "Unknown";
}

TransactionType parseTransactionType(const std::string& text) {
    if (text == "Addition") return TransactionType::Addition;
    if (text == "Removal")  return TransactionType::Removal;
    throw std::invalid_argument("Unknown transaction type: " + text);
}

nlohmann::json productToJson(const Product& product) {
    return {
        {"id",            product.id},
        {"sku",           product.sku},
        {"name",          product.name},
        {"description",   product.description},
        {"quantity",      product.quantity},
        {"reorder_point", product.reorderPoint}
    };
}

nlohmann::json transactionToJson(const Transaction& transaction) {
    nlohmann::json node = {
        {"id",               transaction.id},
        {"product_sku",      transaction.productSku},
        {"transaction_type", toString(transaction.type)},
        {"quantity",         transaction.quantity},
        {"timestamp",        formatTimestamp(transaction.timestamp)}
    };
    node["notes"] = transaction.notes ? nlohmann::json(*transaction.notes)
                                      : nlohmann::json(nullptr);
    return node;
}

Product parseProduct(const nlohmann::json& node) {
    if (!node.is_object()) {
        throw std::runtime_error("product record must be an object");
    }

    Product p;
    p.id           = requireString(node, "id");
    p.sku          = requireString(node, "sku");
    p.name         = requireString(node, "name");
    p.description  = requireString(node, "description");
    p.quantity     = requireCount(node, "quantity");
    p.reorderPoint = requireCount(node, "reorder_point");
    return p;
}

Transaction parseTransaction(const nlohmann::json& node) {
    if (!node.is_object()) {
        throw std::runtime_error("transaction record must be an object");
    }

    Transaction t;
    t.id         = requireString(node, "id");
    t.productSku = requireString(node, "product_sku");
    t.quantity   = requireCount(node, "quantity");

    try {
        t.type      = parseTransactionType(requireString(node, "transaction_type"));
        t.timestamp = parseTimestamp(requireString(node, "timestamp"));
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(e.what());
    }

    // notes is nullable.
    if (node.contains("notes") && !node["notes"].is_null()) {
        if (!node["notes"].is_string()) {
            throw std::runtime_error("field 'notes' must be a string or null");
        }
        t.notes = node["notes"].get<std::string>();
    }
    return t;
}

std::vector<Product> parseProductList(const nlohmann::json& doc) {
    if (!doc.is_array()) {
        throw std::runtime_error("expected a JSON array of products");
    }

    std::vector<Product> products;
    products.reserve(doc.size());
    for (std::size_t i = 0; i < doc.size(); ++i) {
        try {
            products.push_back(parseProduct(doc[i]));
        } catch (const std::runtime_error& e) {
            throw std::runtime_error("product #" + std::to_string(i) + ": " + e.what());
        }
    }
    return products;
}

std::vector<Transaction> parseTransactionList(const nlohmann::json& doc) {
    if (!doc.is_array()) {
        throw std::runtime_error("expected a JSON array of transactions");
    }

    std::vector<Transaction> transactions;
    transactions.reserve(doc.size());
    for (std::size_t i = 0; i < doc.size(); ++i) {
        try {
            transactions.push_back(parseTransaction(doc[i]));
        } catch (const std::runtime_error& e) {
            throw std::runtime_error("transaction #" + std::to_string(i) + ": " + e.what());
        }
    }
    return transactions;
}

nlohmann::json productListToJson(const std::vector<Product>& products) {
    nlohmann::json doc = nlohmann::json::array();
    for (const auto& p : products) {
        doc.push_back(productToJson(p));
    }
    return doc;
}

nlohmann::json transactionListToJson(const std::vector<Transaction>& transactions) {
    nlohmann::json doc = nlohmann::json::array();
    for (const auto& t : transactions) {
        doc.push_back(transactionToJson(t));
    }
    return doc;
}

} // namespace stock_control
