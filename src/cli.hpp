#pragma once

#include "errors.hpp"
#include "inventory_service.hpp"
#include "models.hpp"
#include "storage.hpp"

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace stock_control {

enum class CommandType {
    AddProduct,
    UpdateProduct,
    AddStock,
    RemoveStock,
    ViewProduct,
    ListProducts,
    LowStock,
    History,
    DeleteProduct,
    Help,
};

/// One parsed command line.  Only the fields relevant to `type` are set.
struct Command {
    CommandType  type = CommandType::Help;
    std::string  sku;

    // add-product
    std::string  name;
    std::string  description;
    std::int64_t reorderPoint = 0;

    // add-product, add-stock, remove-stock
    std::int64_t quantity = 0;

    // update-product
    std::optional<std::string>  newName;
    std::optional<std::string>  newDescription;
    std::optional<std::int64_t> newReorderPoint;

    // add-stock, remove-stock
    std::optional<std::string> notes;

    // history
    std::optional<Timestamp> start;
    std::optional<Timestamp> end;
};

/// Parse the command word and its arguments (program name and global options
/// already removed).  An empty list means Help.
/// Throws std::invalid_argument with a usage message on malformed input.
Command parseCommand(const std::vector<std::string>& args);

/// Run @p command against @p service and return the text to show the user.
/// Service errors propagate as InventoryError.
std::string executeCommand(const Command& command, InventoryService& service);

/// One-line "Error: ..." rendering of a service error.
std::string formatError(const InventoryError& error);

std::string helpText();

/// Parse, build the service on @p storage, execute and print.
/// Returns the process exit code (0 on success, 1 on any error).
int runCommand(const std::vector<std::string>& args,
               Storage& storage,
               bool verbose,
               std::ostream& out,
               std::ostream& err);

} // namespace stock_control
