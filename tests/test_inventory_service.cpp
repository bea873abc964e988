/// @file test_inventory_service.cpp
/// Unit tests for inventory_service.hpp — validation, mutation, queries and the
/// contract with the storage layer (via an in-memory double).

#include "errors.hpp"
#include "inventory_service.hpp"
#include "memory_storage.hpp"
#include "util.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <limits>
#include <map>
#include <random>
#include <set>

using namespace stock_control;
using stock_control::test_support::MemoryStorage;

// ---------------------------------------------------------------------------
// Fixture: a service over MemoryStorage with a controllable clock.
// ---------------------------------------------------------------------------

class InventoryServiceTest : public ::testing::Test {
protected:
    MemoryStorage storage;
    Timestamp     clockNow = parseTimestamp("2025-01-01T00:00:00Z");

    InventoryService makeService() {
        return InventoryService(storage, /*verbose=*/false, [this] { return clockNow; });
    }

    void advance(std::chrono::seconds s) {
        clockNow += std::chrono::duration_cast<Clock::duration>(s);
    }

    static Timestamp at(const std::string& text) { return parseTimestamp(text); }
};

template <typename ErrorT, typename Fn>
static void expectError(Fn&& fn, ErrorKind expectedKind) {
    try {
        fn();
        ADD_FAILURE() << "expected " << toString(expectedKind);
    } catch (const ErrorT& e) {
        EXPECT_EQ(e.kind(), expectedKind);
    }
}

// ============================================================================
// Construction
// ============================================================================

TEST_F(InventoryServiceTest, StartsEmptyOnEmptyStorage) {
    auto svc = makeService();
    EXPECT_TRUE(svc.listProducts().empty());
    EXPECT_TRUE(svc.listLowStock().empty());
    EXPECT_TRUE(svc.getTransactions("A1").empty());
}

TEST_F(InventoryServiceTest, LoadsExistingState) {
    {
        auto svc = makeService();
        svc.createProduct("A1", "Widget", "", 10, 5);
        svc.addStock("A1", 4, std::string("restock"));
    }

    auto reloaded = makeService();
    EXPECT_EQ(reloaded.getProduct("A1").quantity, 14);
    ASSERT_EQ(reloaded.getTransactions("A1").size(), 1u);
    EXPECT_EQ(reloaded.getTransactions("A1")[0].notes, std::string("restock"));
}

TEST_F(InventoryServiceTest, ProductLoadFailurePropagates) {
    storage.failLoadProducts = true;
    expectError<StorageError>([&] { makeService(); }, ErrorKind::StorageFailure);
}

TEST_F(InventoryServiceTest, TransactionLoadFailurePropagates) {
    storage.failLoadTransactions = true;
    try {
        makeService();
        FAIL() << "expected StorageError";
    } catch (const StorageError& e) {
        EXPECT_EQ(e.cause(), StorageError::Cause::Parse);
    }
}

TEST_F(InventoryServiceTest, DuplicateStoredSkuIsParseFailure) {
    Product p;
    p.id = "1";
    p.sku = "A1";
    p.name = "Widget";
    storage.products = {p, p};

    try {
        makeService();
        FAIL() << "expected StorageError";
    } catch (const StorageError& e) {
        EXPECT_EQ(e.cause(), StorageError::Cause::Parse);
    }
}

// ============================================================================
// createProduct
// ============================================================================

TEST_F(InventoryServiceTest, CreateReturnsFullRecord) {
    auto svc = makeService();
    const Product p = svc.createProduct("SKU001", "Widget", "A useful widget", 100, 20);

    EXPECT_FALSE(p.id.empty());
    EXPECT_EQ(p.sku, "SKU001");
    EXPECT_EQ(p.name, "Widget");
    EXPECT_EQ(p.description, "A useful widget");
    EXPECT_EQ(p.quantity, 100);
    EXPECT_EQ(p.reorderPoint, 20);
    EXPECT_EQ(svc.getProduct("SKU001"), p);
}

TEST_F(InventoryServiceTest, CreateAssignsDistinctIds) {
    auto svc = makeService();
    std::set<std::string> ids;
    for (int i = 0; i < 20; ++i) {
        ids.insert(svc.createProduct("S" + std::to_string(i), "N", "", 0, 0).id);
    }
    EXPECT_EQ(ids.size(), 20u);
}

TEST_F(InventoryServiceTest, CreatePersistsBothCollections) {
    auto svc = makeService();
    svc.createProduct("A1", "Widget", "", 1, 0);

    EXPECT_EQ(storage.productSaves, 1);
    EXPECT_EQ(storage.transactionSaves, 1);
    ASSERT_EQ(storage.products.size(), 1u);
    EXPECT_EQ(storage.products[0].sku, "A1");
}

TEST_F(InventoryServiceTest, CreateDoesNotRecordTransaction) {
    auto svc = makeService();
    svc.createProduct("A1", "Widget", "", 50, 0);
    EXPECT_TRUE(svc.getTransactions("A1").empty());
}

TEST_F(InventoryServiceTest, CreateRejectsBlankSkuOrName) {
    auto svc = makeService();
    expectError<InvalidInputError>([&] { svc.createProduct("", "Widget", "", 1, 0); },
                                   ErrorKind::InvalidInput);
    expectError<InvalidInputError>([&] { svc.createProduct("   ", "Widget", "", 1, 0); },
                                   ErrorKind::InvalidInput);
    expectError<InvalidInputError>([&] { svc.createProduct("A1", "", "", 1, 0); },
                                   ErrorKind::InvalidInput);
    EXPECT_TRUE(svc.listProducts().empty());
    EXPECT_EQ(storage.productSaves, 0);
}

TEST_F(InventoryServiceTest, CreateRejectsNegativeNumbers) {
    auto svc = makeService();
    EXPECT_THROW(svc.createProduct("A1", "Widget", "", -1, 0), InvalidInputError);
    EXPECT_THROW(svc.createProduct("A1", "Widget", "", 1, -1), InvalidInputError);
    EXPECT_TRUE(svc.listProducts().empty());
}

TEST_F(InventoryServiceTest, CreateAllowsZeroQuantityAndEmptyDescription) {
    auto svc = makeService();
    const Product p = svc.createProduct("A1", "Widget", "", 0, 0);
    EXPECT_EQ(p.quantity, 0);
    EXPECT_TRUE(p.description.empty());
}

TEST_F(InventoryServiceTest, DuplicateSkuLeavesOriginalUntouched) {
    auto svc = makeService();
    const Product first = svc.createProduct("A1", "Widget", "original", 10, 5);

    try {
        svc.createProduct("A1", "Gadget", "imposter", 99, 1);
        FAIL() << "expected DuplicateSkuError";
    } catch (const DuplicateSkuError& e) {
        EXPECT_EQ(e.sku(), "A1");
        EXPECT_EQ(e.kind(), ErrorKind::DuplicateSku);
    }

    EXPECT_EQ(svc.getProduct("A1"), first);
    EXPECT_EQ(svc.listProducts().size(), 1u);
}

// ============================================================================
// updateProduct
// ============================================================================

TEST_F(InventoryServiceTest, UpdateChangesOnlySuppliedFields) {
    auto svc = makeService();
    const Product before = svc.createProduct("A1", "Widget", "desc", 10, 5);

    const Product after = svc.updateProduct("A1", std::string("Widget v2"), std::nullopt, 30);

    EXPECT_EQ(after.name, "Widget v2");
    EXPECT_EQ(after.description, "desc");
    EXPECT_EQ(after.reorderPoint, 30);
    EXPECT_EQ(after.quantity, before.quantity);
    EXPECT_EQ(after.id, before.id);
    EXPECT_EQ(after.sku, before.sku);
    EXPECT_EQ(svc.getProduct("A1"), after);
}

TEST_F(InventoryServiceTest, UpdateCanClearDescription) {
    auto svc = makeService();
    svc.createProduct("A1", "Widget", "desc", 10, 5);
    EXPECT_EQ(svc.updateProduct("A1", std::nullopt, std::string(""), std::nullopt).description,
              "");
}

TEST_F(InventoryServiceTest, UpdateKeepsTransactionHistory) {
    auto svc = makeService();
    svc.createProduct("A1", "Widget", "", 10, 5);
    svc.addStock("A1", 3);
    svc.removeStock("A1", 2);
    const auto history = svc.getTransactions("A1");

    svc.updateProduct("A1", std::string("Renamed"), std::string("new"), 1);

    EXPECT_EQ(svc.getTransactions("A1"), history);
}

TEST_F(InventoryServiceTest, UpdateUnknownSku) {
    auto svc = makeService();
    expectError<ProductNotFoundError>(
        [&] { svc.updateProduct("nope", std::string("x"), std::nullopt, std::nullopt); },
        ErrorKind::ProductNotFound);
}

TEST_F(InventoryServiceTest, UpdateValidationLeavesProductUnchanged) {
    auto svc = makeService();
    const Product before = svc.createProduct("A1", "Widget", "desc", 10, 5);
    const int savesBefore = storage.productSaves;

    EXPECT_THROW(svc.updateProduct("A1", std::string(" "), std::string("changed"), 1),
                 InvalidInputError);
    EXPECT_THROW(svc.updateProduct("A1", std::string("ok"), std::string("changed"), -1),
                 InvalidInputError);

    EXPECT_EQ(svc.getProduct("A1"), before);
    EXPECT_EQ(storage.productSaves, savesBefore);
}

// ============================================================================
// addStock / removeStock
// ============================================================================

TEST_F(InventoryServiceTest, AddStockIncreasesQuantityAndRecordsAddition) {
    auto svc = makeService();
    svc.createProduct("A1", "Widget", "", 10, 5);
    svc.addStock("A1", 15, std::string("Received shipment"));

    EXPECT_EQ(svc.getProduct("A1").quantity, 25);

    const auto txns = svc.getTransactions("A1");
    ASSERT_EQ(txns.size(), 1u);
    EXPECT_FALSE(txns[0].id.empty());
    EXPECT_EQ(txns[0].productSku, "A1");
    EXPECT_EQ(txns[0].type, TransactionType::Addition);
    EXPECT_EQ(txns[0].quantity, 15);
    EXPECT_EQ(txns[0].timestamp, clockNow);
    EXPECT_EQ(txns[0].notes, std::string("Received shipment"));
}

TEST_F(InventoryServiceTest, AddStockPersistsBothCollections) {
    auto svc = makeService();
    svc.createProduct("A1", "Widget", "", 10, 5);
    svc.addStock("A1", 1);

    ASSERT_EQ(storage.products.size(), 1u);
    EXPECT_EQ(storage.products[0].quantity, 11);
    ASSERT_EQ(storage.transactions.size(), 1u);
    EXPECT_FALSE(storage.transactions[0].notes.has_value());
}

TEST_F(InventoryServiceTest, AddStockUnknownSkuCreatesNoTransaction) {
    auto svc = makeService();
    expectError<ProductNotFoundError>([&] { svc.addStock("GHOST", 5); },
                                      ErrorKind::ProductNotFound);
    EXPECT_TRUE(svc.getTransactions("GHOST").empty());
    EXPECT_EQ(storage.transactionSaves, 0);
}

TEST_F(InventoryServiceTest, AddStockRejectsNonPositiveQuantity) {
    auto svc = makeService();
    svc.createProduct("A1", "Widget", "", 10, 5);
    EXPECT_THROW(svc.addStock("A1", 0), InvalidInputError);
    EXPECT_THROW(svc.addStock("A1", -4), InvalidInputError);
    EXPECT_EQ(svc.getProduct("A1").quantity, 10);
    EXPECT_TRUE(svc.getTransactions("A1").empty());
}

TEST_F(InventoryServiceTest, AddStockRejectsOverflow) {
    auto svc = makeService();
    svc.createProduct("A1", "Widget", "", std::numeric_limits<std::int64_t>::max() - 1, 0);
    EXPECT_THROW(svc.addStock("A1", 2), InvalidInputError);
    EXPECT_NO_THROW(svc.addStock("A1", 1));
}

TEST_F(InventoryServiceTest, RemoveStockToExactlyZero) {
    auto svc = makeService();
    svc.createProduct("A1", "Widget", "", 10, 0);
    svc.removeStock("A1", 10);
    EXPECT_EQ(svc.getProduct("A1").quantity, 0);
    ASSERT_EQ(svc.listLowStock().size(), 1u);
}

TEST_F(InventoryServiceTest, RemoveStockInsufficient) {
    auto svc = makeService();
    svc.createProduct("A1", "Widget", "", 3, 0);

    try {
        svc.removeStock("A1", 4);
        FAIL() << "expected InsufficientStockError";
    } catch (const InsufficientStockError& e) {
        EXPECT_EQ(e.sku(), "A1");
        EXPECT_EQ(e.requested(), 4);
        EXPECT_EQ(e.available(), 3);
    }
    EXPECT_EQ(svc.getProduct("A1").quantity, 3);
    EXPECT_TRUE(svc.getTransactions("A1").empty());
}

TEST_F(InventoryServiceTest, RemoveStockValidation) {
    auto svc = makeService();
    svc.createProduct("A1", "Widget", "", 3, 0);
    EXPECT_THROW(svc.removeStock("A1", 0), InvalidInputError);
    EXPECT_THROW(svc.removeStock("A1", -1), InvalidInputError);
    EXPECT_THROW(svc.removeStock("B2", 1), ProductNotFoundError);
    EXPECT_EQ(svc.getProduct("A1").quantity, 3);
}

// The worked example: sell 7 of 10 with reorder point 5, then over-sell.
TEST_F(InventoryServiceTest, RemovalCrossesReorderPoint) {
    auto svc = makeService();
    svc.createProduct("A1", "Widget", "", 10, 5);
    EXPECT_TRUE(svc.listLowStock().empty());

    svc.removeStock("A1", 7);
    EXPECT_EQ(svc.getProduct("A1").quantity, 3);

    const auto low = svc.listLowStock();
    ASSERT_EQ(low.size(), 1u);
    EXPECT_EQ(low[0].sku, "A1");

    const auto txns = svc.getTransactions("A1");
    ASSERT_EQ(txns.size(), 1u);
    EXPECT_EQ(txns[0].type, TransactionType::Removal);
    EXPECT_EQ(txns[0].quantity, 7);

    EXPECT_THROW(svc.removeStock("A1", 10), InsufficientStockError);
    EXPECT_EQ(svc.getProduct("A1").quantity, 3);
}

TEST_F(InventoryServiceTest, QuantityMatchesLedgerAfterRandomMovements) {
    auto svc = makeService();
    const std::vector<std::string> skus{"A1", "B2", "C3"};
    std::map<std::string, std::int64_t> initial;
    for (const auto& sku : skus) {
        initial[sku] = 20;
        svc.createProduct(sku, "Item " + sku, "", initial[sku], 5);
    }

    std::mt19937 rng(12345);
    std::uniform_int_distribution<int> pick(0, 2);
    std::uniform_int_distribution<int> amount(1, 15);
    std::bernoulli_distribution addOrRemove(0.5);

    for (int i = 0; i < 300; ++i) {
        const std::string& sku = skus[pick(rng)];
        const int qty = amount(rng);
        advance(std::chrono::seconds(1));
        if (addOrRemove(rng)) {
            svc.addStock(sku, qty);
        } else {
            try {
                svc.removeStock(sku, qty);
            } catch (const InsufficientStockError&) {
                // rejected removals leave no trace
            }
        }
    }

    for (const auto& sku : skus) {
        std::int64_t net = initial[sku];
        for (const auto& t : svc.getTransactions(sku)) {
            net += (t.type == TransactionType::Addition) ? t.quantity : -t.quantity;
        }
        const auto quantity = svc.getProduct(sku).quantity;
        EXPECT_EQ(quantity, net) << sku;
        EXPECT_GE(quantity, 0) << sku;
    }
}

// ============================================================================
// Persistence failure after mutation
// ============================================================================

TEST_F(InventoryServiceTest, FailedSaveKeepsInMemoryMutation) {
    auto svc = makeService();
    svc.createProduct("A1", "Widget", "", 10, 5);

    storage.failSaveTransactions = true;
    try {
        svc.addStock("A1", 5);
        FAIL() << "expected StorageError";
    } catch (const StorageError& e) {
        EXPECT_EQ(e.cause(), StorageError::Cause::Write);
        EXPECT_EQ(e.kind(), ErrorKind::StorageFailure);
    }

    // Memory is ahead of storage: products were written, the ledger was not.
    EXPECT_EQ(svc.getProduct("A1").quantity, 15);
    EXPECT_EQ(svc.getTransactions("A1").size(), 1u);
    EXPECT_EQ(storage.products[0].quantity, 15);
    EXPECT_TRUE(storage.transactions.empty());
}

TEST_F(InventoryServiceTest, FailedProductSaveSkipsTransactionSave) {
    auto svc = makeService();
    storage.failSaveProducts = true;

    EXPECT_THROW(svc.createProduct("A1", "Widget", "", 10, 5), StorageError);
    EXPECT_EQ(storage.transactionSaves, 0);
    EXPECT_EQ(svc.listProducts().size(), 1u);
}

TEST_F(InventoryServiceTest, NoRetryAfterFailedSave) {
    auto svc = makeService();
    svc.createProduct("A1", "Widget", "", 10, 5);
    const int saves = storage.productSaves;

    storage.failSaveProducts = true;
    EXPECT_THROW(svc.removeStock("A1", 1), StorageError);
    storage.failSaveProducts = false;

    EXPECT_EQ(storage.productSaves, saves);
}

// ============================================================================
// Queries
// ============================================================================

TEST_F(InventoryServiceTest, GetProductUnknown) {
    auto svc = makeService();
    try {
        svc.getProduct("missing");
        FAIL() << "expected ProductNotFoundError";
    } catch (const ProductNotFoundError& e) {
        EXPECT_EQ(e.sku(), "missing");
    }
}

TEST_F(InventoryServiceTest, ListProductsHasEachLiveProductOnce) {
    auto svc = makeService();
    svc.createProduct("C3", "c", "", 1, 0);
    svc.createProduct("A1", "a", "", 1, 0);
    svc.createProduct("B2", "b", "", 1, 0);
    svc.deleteProduct("B2");

    const auto products = svc.listProducts();
    ASSERT_EQ(products.size(), 2u);
    EXPECT_EQ(products[0].sku, "A1");
    EXPECT_EQ(products[1].sku, "C3");
}

TEST_F(InventoryServiceTest, LowStockIsExactlyAtOrBelowReorderPoint) {
    auto svc = makeService();
    svc.createProduct("BELOW", "n", "", 4, 5);
    svc.createProduct("EQUAL", "n", "", 5, 5);
    svc.createProduct("ABOVE", "n", "", 6, 5);
    svc.createProduct("ZERO", "n", "", 0, 0);

    std::set<std::string> low;
    for (const auto& p : svc.listLowStock()) {
        low.insert(p.sku);
    }
    EXPECT_EQ(low, (std::set<std::string>{"BELOW", "EQUAL", "ZERO"}));

    for (const auto& p : svc.listProducts()) {
        EXPECT_EQ(p.isLowStock(), low.count(p.sku) == 1) << p.sku;
    }
}

TEST_F(InventoryServiceTest, RaisingReorderPointMakesProductLow) {
    auto svc = makeService();
    svc.createProduct("A1", "Widget", "", 10, 5);
    EXPECT_TRUE(svc.listLowStock().empty());
    svc.updateProduct("A1", std::nullopt, std::nullopt, 10);
    EXPECT_EQ(svc.listLowStock().size(), 1u);
}

TEST_F(InventoryServiceTest, TransactionsAreChronologicalRegardlessOfInsertionOrder) {
    Transaction late;
    late.id = "t-late";
    late.productSku = "A1";
    late.type = TransactionType::Addition;
    late.quantity = 1;
    late.timestamp = at("2025-06-01T00:00:00Z");

    Transaction early = late;
    early.id = "t-early";
    early.timestamp = at("2025-02-01T00:00:00Z");

    Transaction middle = late;
    middle.id = "t-middle";
    middle.timestamp = at("2025-04-01T00:00:00Z");

    storage.transactions = {late, early, middle};
    auto svc = makeService();

    const auto txns = svc.getTransactions("A1");
    ASSERT_EQ(txns.size(), 3u);
    EXPECT_EQ(txns[0].id, "t-early");
    EXPECT_EQ(txns[1].id, "t-middle");
    EXPECT_EQ(txns[2].id, "t-late");
}

TEST_F(InventoryServiceTest, EqualTimestampsKeepLedgerOrder) {
    auto svc = makeService();
    svc.createProduct("A1", "Widget", "", 10, 0);
    svc.addStock("A1", 1, std::string("first"));
    svc.addStock("A1", 2, std::string("second"));
    svc.removeStock("A1", 3, std::string("third"));

    const auto txns = svc.getTransactions("A1");
    ASSERT_EQ(txns.size(), 3u);
    EXPECT_EQ(txns[0].notes, std::string("first"));
    EXPECT_EQ(txns[1].notes, std::string("second"));
    EXPECT_EQ(txns[2].notes, std::string("third"));
}

TEST_F(InventoryServiceTest, TransactionsAreFilteredBySku) {
    auto svc = makeService();
    svc.createProduct("A1", "a", "", 10, 0);
    svc.createProduct("B2", "b", "", 10, 0);
    svc.addStock("A1", 1);
    svc.addStock("B2", 2);
    svc.addStock("A1", 3);

    for (const auto& t : svc.getTransactions("A1")) {
        EXPECT_EQ(t.productSku, "A1");
    }
    EXPECT_EQ(svc.getTransactions("A1").size(), 2u);
    EXPECT_EQ(svc.getTransactions("B2").size(), 1u);
    EXPECT_TRUE(svc.getTransactions("Z9").empty());
}

TEST_F(InventoryServiceTest, RangeIsInclusiveAtBothEnds) {
    auto svc = makeService();
    svc.createProduct("A1", "Widget", "", 100, 0);

    clockNow = at("2025-01-01T00:00:00Z");
    svc.addStock("A1", 1);
    clockNow = at("2025-01-02T00:00:00Z");
    svc.addStock("A1", 2);
    clockNow = at("2025-01-03T00:00:00Z");
    svc.removeStock("A1", 3);
    clockNow = at("2025-01-04T00:00:00Z");
    svc.addStock("A1", 4);

    const auto txns = svc.getTransactionsInRange("A1", at("2025-01-02T00:00:00Z"),
                                                 at("2025-01-03T00:00:00Z"));
    ASSERT_EQ(txns.size(), 2u);
    EXPECT_EQ(txns[0].quantity, 2);
    EXPECT_EQ(txns[1].quantity, 3);
    EXPECT_LE(txns[0].timestamp, txns[1].timestamp);
}

TEST_F(InventoryServiceTest, RangeWithNoMatches) {
    auto svc = makeService();
    svc.createProduct("A1", "Widget", "", 100, 0);
    svc.addStock("A1", 1);

    EXPECT_TRUE(svc.getTransactionsInRange("A1", at("2030-01-01T00:00:00Z"),
                                           at("2030-12-31T00:00:00Z")).empty());
    EXPECT_TRUE(svc.getTransactionsInRange("Z9", Timestamp::min(), Timestamp::max()).empty());
}

TEST_F(InventoryServiceTest, InvertedRangeIsEmpty) {
    auto svc = makeService();
    svc.createProduct("A1", "Widget", "", 100, 0);
    svc.addStock("A1", 1);

    EXPECT_TRUE(svc.getTransactionsInRange("A1", clockNow + std::chrono::seconds(1),
                                           clockNow - std::chrono::seconds(1)).empty());
}

// ============================================================================
// deleteProduct
// ============================================================================

TEST_F(InventoryServiceTest, DeleteCascadesToTransactions) {
    auto svc = makeService();
    svc.createProduct("A1", "Widget", "", 10, 0);
    svc.createProduct("B2", "Gadget", "", 10, 0);
    svc.addStock("A1", 5);
    svc.removeStock("A1", 2);
    svc.addStock("B2", 1);

    svc.deleteProduct("A1");

    EXPECT_THROW(svc.getProduct("A1"), ProductNotFoundError);
    EXPECT_TRUE(svc.getTransactions("A1").empty());
    EXPECT_EQ(svc.getTransactions("B2").size(), 1u);
    ASSERT_EQ(svc.listProducts().size(), 1u);

    ASSERT_EQ(storage.transactions.size(), 1u);
    EXPECT_EQ(storage.transactions[0].productSku, "B2");
    ASSERT_EQ(storage.products.size(), 1u);
    EXPECT_EQ(storage.products[0].sku, "B2");
}

TEST_F(InventoryServiceTest, DeleteWithoutTransactions) {
    auto svc = makeService();
    svc.createProduct("A1", "Widget", "", 0, 0);
    svc.deleteProduct("A1");
    EXPECT_TRUE(svc.listProducts().empty());
    EXPECT_TRUE(svc.getTransactions("A1").empty());
}

TEST_F(InventoryServiceTest, DeleteAllowedWithStockOnHand) {
    auto svc = makeService();
    svc.createProduct("A1", "Widget", "", 500, 0);
    EXPECT_NO_THROW(svc.deleteProduct("A1"));
}

TEST_F(InventoryServiceTest, DeleteUnknown) {
    auto svc = makeService();
    EXPECT_THROW(svc.deleteProduct("A1"), ProductNotFoundError);
    EXPECT_EQ(storage.productSaves, 0);
}

TEST_F(InventoryServiceTest, SkuCanBeReusedAfterDelete) {
    auto svc = makeService();
    const Product first = svc.createProduct("A1", "Widget", "", 10, 0);
    svc.addStock("A1", 3);
    svc.deleteProduct("A1");

    const Product second = svc.createProduct("A1", "Widget II", "", 1, 0);
    EXPECT_NE(second.id, first.id);
    EXPECT_TRUE(svc.getTransactions("A1").empty());
}
