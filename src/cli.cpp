#include "cli.hpp"
#include "mapping.hpp"
#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <memory>
#include <ostream>
#include <sstream>
#include <stdexcept>

namespace stock_control {

namespace {

// ---------------------------------------------------------------------------
// Argument helpers
// ---------------------------------------------------------------------------

std::int64_t parseCount(const std::string& text, const std::string& what,
                        const char* requirement)
{
    const auto invalid = [&]() {
        return std::invalid_argument("Invalid " + what + " '" + text + "': must be a "
                                     + requirement);
    };

    if (text.empty() || !std::all_of(text.begin(), text.end(), [](unsigned char c) {
            return std::isdigit(c) != 0;
        })) {
        throw invalid();
    }

    std::int64_t value = 0;
    for (char c : text) {
        const int digit = c - '0';
        if (value > (std::numeric_limits<std::int64_t>::max() - digit) / 10) {
            throw invalid();
        }
        value = value * 10 + digit;
    }
    return value;
}

const std::string& optionValue(const std::vector<std::string>& args, std::size_t i,
                               const std::string& hint)
{
    if (i + 1 >= args.size()) {
        throw std::invalid_argument(args[i] + " requires a value" + hint);
    }
    return args[i + 1];
}

Command parseAddProduct(const std::vector<std::string>& args) {
    if (args.size() != 6) {
        throw std::invalid_argument(
            "Usage: add-product <sku> <name> <description> <quantity> <reorder_point>\n"
            "Example: add-product SKU001 \"Widget\" \"A useful widget\" 100 20");
    }

    Command cmd;
    cmd.type         = CommandType::AddProduct;
    cmd.sku          = args[1];
    cmd.name         = args[2];
    cmd.description  = args[3];
    cmd.quantity     = parseCount(args[4], "quantity", "non-negative integer");
    cmd.reorderPoint = parseCount(args[5], "reorder point", "non-negative integer");
    return cmd;
}

Command parseUpdateProduct(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        throw std::invalid_argument(
            "Usage: update-product <sku> [--name <name>] [--description <desc>] "
            "[--reorder-point <n>]\n"
            "Example: update-product SKU001 --name \"New Name\" --reorder-point 30");
    }

    Command cmd;
    cmd.type = CommandType::UpdateProduct;
    cmd.sku  = args[1];

    for (std::size_t i = 2; i < args.size(); i += 2) {
        const std::string& opt = args[i];
        if (opt == "--name") {
            cmd.newName = optionValue(args, i, "");
        } else if (opt == "--description") {
            cmd.newDescription = optionValue(args, i, "");
        } else if (opt == "--reorder-point") {
            cmd.newReorderPoint = parseCount(optionValue(args, i, ""), "reorder point",
                                             "non-negative integer");
        } else {
            throw std::invalid_argument(
                "Unknown option: '" + opt
                + "'. Valid options: --name, --description, --reorder-point");
        }
    }
    return cmd;
}

Command parseStockMovement(const std::vector<std::string>& args, CommandType type) {
    const std::string verb = (type == CommandType::AddStock) ? "add-stock" : "remove-stock";
    if (args.size() < 3) {
        const std::string example = (type == CommandType::AddStock)
            ? "add-stock SKU001 50 --notes \"Received shipment\""
            : "remove-stock SKU001 10 --notes \"Sold to customer\"";
        throw std::invalid_argument("Usage: " + verb + " <sku> <quantity> [--notes <notes>]\n"
                                    "Example: " + example);
    }

    Command cmd;
    cmd.type     = type;
    cmd.sku      = args[1];
    cmd.quantity = parseCount(args[2], "quantity", "positive integer");

    for (std::size_t i = 3; i < args.size(); i += 2) {
        if (args[i] == "--notes") {
            cmd.notes = optionValue(args, i, "");
        } else {
            throw std::invalid_argument("Unknown option: '" + args[i]
                                        + "'. Valid options: --notes");
        }
    }
    return cmd;
}

Command parseSkuOnly(const std::vector<std::string>& args, CommandType type,
                     const std::string& verb)
{
    if (args.size() != 2) {
        throw std::invalid_argument("Usage: " + verb + " <sku>\n"
                                    "Example: " + verb + " SKU001");
    }
    Command cmd;
    cmd.type = type;
    cmd.sku  = args[1];
    return cmd;
}

Command parseHistory(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        throw std::invalid_argument(
            "Usage: history <sku> [--start <datetime>] [--end <datetime>]\n"
            "Example: history SKU001 --start 2025-01-01T00:00:00 --end 2025-12-31T23:59:59");
    }

    Command cmd;
    cmd.type = CommandType::History;
    cmd.sku  = args[1];

    for (std::size_t i = 2; i < args.size(); i += 2) {
        if (args[i] == "--start") {
            cmd.start = parseDateTime(
                optionValue(args, i, " (e.g., 2025-01-01T00:00:00)"));
        } else if (args[i] == "--end") {
            cmd.end = parseDateTime(
                optionValue(args, i, " (e.g., 2025-12-31T23:59:59)"));
        } else {
            throw std::invalid_argument("Unknown option: '" + args[i]
                                        + "'. Valid options: --start, --end");
        }
    }
    return cmd;
}

// ---------------------------------------------------------------------------
// Rendering
// ---------------------------------------------------------------------------

std::string renderHistory(const std::string& sku, const std::vector<Transaction>& txns) {
    if (txns.empty()) {
        return "No transactions found for product '" + sku + "'.";
    }

    std::ostringstream out;
    out << "Transaction History for '" << sku << "' (" << txns.size()
        << " transactions):";
    for (const auto& t : txns) {
        std::string kind = toString(t.type);
        std::transform(kind.begin(), kind.end(), kind.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        out << "\n  " << formatDisplayTimestamp(t.timestamp) << " "
            << (t.type == TransactionType::Addition ? "+" : "-") << " "
            << t.quantity << " " << kind;
        if (t.notes) {
            out << " - " << *t.notes;
        }
    }
    return out.str();
}

} // namespace

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

Command parseCommand(const std::vector<std::string>& args) {
    if (args.empty()) {
        return Command{};
    }

    const std::string& verb = args[0];

    if (verb == "add-product")    return parseAddProduct(args);
    if (verb == "update-product") return parseUpdateProduct(args);
    if (verb == "add-stock")      return parseStockMovement(args, CommandType::AddStock);
    if (verb == "remove-stock")   return parseStockMovement(args, CommandType::RemoveStock);
    if (verb == "view-product")   return parseSkuOnly(args, CommandType::ViewProduct, verb);
    if (verb == "delete-product") return parseSkuOnly(args, CommandType::DeleteProduct, verb);
    if (verb == "history")        return parseHistory(args);

    Command cmd;
    if (verb == "list-products") {
        cmd.type = CommandType::ListProducts;
    } else if (verb == "low-stock") {
        cmd.type = CommandType::LowStock;
    } else if (verb == "help" || verb == "--help" || verb == "-h") {
        cmd.type = CommandType::Help;
    } else {
        throw std::invalid_argument("Unknown command: '" + verb
                                    + "'. Use 'help' to see available commands.");
    }
    return cmd;
}

std::string executeCommand(const Command& command, InventoryService& service) {
    std::ostringstream out;

    switch (command.type) {
    case CommandType::AddProduct: {
        const Product p = service.createProduct(command.sku, command.name,
                                                command.description, command.quantity,
                                                command.reorderPoint);
        out << "Product added successfully:\n"
            << "  ID: " << p.id << "\n"
            << "  SKU: " << p.sku << "\n"
            << "  Name: " << p.name << "\n"
            << "  Description: " << p.description << "\n"
            << "  Quantity: " << p.quantity << "\n"
            << "  Reorder Point: " << p.reorderPoint;
        break;
    }

    case CommandType::UpdateProduct: {
        const Product p = service.updateProduct(command.sku, command.newName,
                                                command.newDescription,
                                                command.newReorderPoint);
        out << "Product updated successfully:\n"
            << "  SKU: " << p.sku << "\n"
            << "  Name: " << p.name << "\n"
            << "  Description: " << p.description << "\n"
            << "  Quantity: " << p.quantity << "\n"
            << "  Reorder Point: " << p.reorderPoint;
        break;
    }

    case CommandType::AddStock: {
        service.addStock(command.sku, command.quantity, command.notes);
        out << "Stock added successfully:\n"
            << "  SKU: " << command.sku << "\n"
            << "  Added: " << command.quantity << "\n"
            << "  New Quantity: " << service.getProduct(command.sku).quantity;
        break;
    }

    case CommandType::RemoveStock: {
        service.removeStock(command.sku, command.quantity, command.notes);
        const Product p = service.getProduct(command.sku);
        out << "Stock removed successfully:\n"
            << "  SKU: " << command.sku << "\n"
            << "  Removed: " << command.quantity << "\n"
            << "  New Quantity: " << p.quantity;
        if (p.isLowStock()) {
            out << "\n  Warning: stock is at or below the reorder point ("
                << p.reorderPoint << ")";
        }
        break;
    }

    case CommandType::ViewProduct: {
        const Product p = service.getProduct(command.sku);
        out << "Product Details:\n"
            << "  ID: " << p.id << "\n"
            << "  SKU: " << p.sku << "\n"
            << "  Name: " << p.name << "\n"
            << "  Description: " << p.description << "\n"
            << "  Quantity: " << p.quantity << (p.isLowStock() ? " [LOW STOCK]" : "") << "\n"
            << "  Reorder Point: " << p.reorderPoint;
        break;
    }

    case CommandType::ListProducts: {
        const auto products = service.listProducts();
        if (products.empty()) {
            return "No products in inventory.";
        }
        out << "Products (" << products.size() << " total):";
        for (const auto& p : products) {
            out << "\n  " << p.sku << " - " << p.name << " (Qty: " << p.quantity
                << (p.isLowStock() ? " [LOW]" : "") << ")";
        }
        break;
    }

    case CommandType::LowStock: {
        const auto products = service.listLowStock();
        if (products.empty()) {
            return "No products with low stock.";
        }
        out << "Low Stock Products (" << products.size() << " total):";
        for (const auto& p : products) {
            out << "\n  " << p.sku << " - " << p.name << " (Qty: " << p.quantity
                << ", Reorder at: " << p.reorderPoint << ")";
        }
        break;
    }

    case CommandType::History: {
        // Unknown SKUs are an error here, not an empty history.
        service.getProduct(command.sku);

        std::vector<Transaction> txns;
        if (command.start || command.end) {
            txns = service.getTransactionsInRange(command.sku,
                                                  command.start.value_or(Timestamp::min()),
                                                  command.end.value_or(Timestamp::max()));
        } else {
            txns = service.getTransactions(command.sku);
        }
        return renderHistory(command.sku, txns);
    }

    case CommandType::DeleteProduct: {
        service.deleteProduct(command.sku);
        out << "Product '" << command.sku << "' deleted successfully.";
        break;
    }

    case CommandType::Help:
        return helpText();
    }

    return out.str();
}

std::string formatError(const InventoryError& error) {
    if (const auto* e = dynamic_cast<const ProductNotFoundError*>(&error)) {
        return "Error: Product '" + e->sku() + "' not found.";
    }
    if (const auto* e = dynamic_cast<const DuplicateSkuError*>(&error)) {
        return "Error: Product with SKU '" + e->sku() + "' already exists.";
    }
    if (const auto* e = dynamic_cast<const InsufficientStockError*>(&error)) {
        return "Error: Insufficient stock for '" + e->sku() + "'. Requested: "
             + std::to_string(e->requested()) + ", Available: "
             + std::to_string(e->available());
    }
    if (const auto* e = dynamic_cast<const InvalidInputError*>(&error)) {
        return "Error: " + e->message();
    }
    if (error.kind() == ErrorKind::StorageFailure) {
        return std::string("Error: Storage operation failed - ") + error.what();
    }
    return std::string("Error: ") + error.what();
}

std::string helpText() {
    return R"(Stock Control System - Inventory Management CLI

USAGE:
    stock_control [--data-dir <dir>] [--verbose] <COMMAND> [OPTIONS]

GLOBAL OPTIONS:
    --data-dir <dir>   Directory holding products.json and transactions.json
                       (default: $STOCK_CONTROL_DATA_DIR, else the current directory)
    --verbose          Print diagnostics to stderr

COMMANDS:
    add-product <sku> <name> <description> <quantity> <reorder_point>
        Add a new product to inventory
        Example: add-product SKU001 "Widget" "A useful widget" 100 20

    update-product <sku> [--name <name>] [--description <desc>] [--reorder-point <n>]
        Update an existing product's details
        Example: update-product SKU001 --name "New Widget" --reorder-point 30

    add-stock <sku> <quantity> [--notes <notes>]
        Add stock to a product
        Example: add-stock SKU001 50 --notes "Received shipment"

    remove-stock <sku> <quantity> [--notes <notes>]
        Remove stock from a product
        Example: remove-stock SKU001 10 --notes "Sold to customer"

    view-product <sku>
        View details of a specific product

    list-products
        List all products in inventory

    low-stock
        List products with stock at or below reorder point

    history <sku> [--start <datetime>] [--end <datetime>]
        View transaction history for a product
        Datetime format: YYYY-MM-DDTHH:MM:SS (UTC)
        Example: history SKU001 --start 2025-01-01T00:00:00 --end 2025-12-31T23:59:59

    delete-product <sku>
        Delete a product and all its transactions

    help
        Show this help message)";
}

int runCommand(const std::vector<std::string>& args,
               Storage& storage,
               bool verbose,
               std::ostream& out,
               std::ostream& err)
{
    Command command;
    try {
        command = parseCommand(args);
    } catch (const std::invalid_argument& e) {
        err << e.what() << "\n";
        return 1;
    }

    if (command.type == CommandType::Help) {
        out << helpText() << "\n";
        return 0;
    }

    std::unique_ptr<InventoryService> service;
    try {
        service = std::make_unique<InventoryService>(storage, verbose);
    } catch (const InventoryError& e) {
        err << "Failed to initialize inventory service: " << e.what() << "\n";
        return 1;
    }

    try {
        out << executeCommand(command, *service) << "\n";
        return 0;
    } catch (const InventoryError& e) {
        err << formatError(e) << "\n";
        return 1;
    }
}

} // namespace stock_control
