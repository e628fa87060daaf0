/// @file test_repository.cpp
/// Unit tests for repository.hpp — CRUD, stock invariants and queries.

#include "repository.hpp"

#include <gtest/gtest.h>
#include <chrono>
#include <limits>
#include <stdexcept>
#include <vector>

using namespace inventory_tracker;
using std::chrono::milliseconds;

// ---------------------------------------------------------------------------
// Helper: a clock the test can move by hand.
// ---------------------------------------------------------------------------

struct ManualClock {
    Timestamp now = Timestamp(milliseconds(1705314600000LL));

    InventoryRepository::Clock fn() {
        return [this] { return now; };
    }
};

static std::vector<int> idsOf(const std::vector<Product>& products) {
    std::vector<int> ids;
    for (const auto& p : products) ids.push_back(p.id);
    return ids;
}

static std::vector<int> stockOf(const std::vector<Product>& products) {
    std::vector<int> out;
    for (const auto& p : products) out.push_back(p.stockQuantity);
    return out;
}

class RepositoryTest : public ::testing::Test {
protected:
    ManualClock         clock;
    InventoryRepository repo{clock.fn()};
};

// ============================================================================
// create / remove / findById
// ============================================================================

TEST_F(RepositoryTest, CreateAssignsSequentialIdsAndTimestamp) {
    auto mouse = repo.create("Wireless Mouse", Money::parse("29.99"), 50, "Electronics");
    EXPECT_EQ(mouse.id, 1);
    EXPECT_EQ(mouse.name, "Wireless Mouse");
    EXPECT_EQ(mouse.price.cents(), 2999);
    EXPECT_EQ(mouse.stockQuantity, 50);
    EXPECT_EQ(mouse.category, "Electronics");
    EXPECT_EQ(mouse.lastUpdated, clock.now);

    auto chair = repo.create("Office Chair", Money::parse("199.99"), 15, "Furniture");
    EXPECT_EQ(chair.id, 2);
    EXPECT_EQ(repo.size(), 2u);
    EXPECT_EQ(repo.nextId(), 3);
}

TEST_F(RepositoryTest, CreateDeleteFindScenario) {
    repo.create("Wireless Mouse", Money::parse("29.99"), 50, "Electronics");
    repo.create("Office Chair", Money::parse("199.99"), 15, "Furniture");

    EXPECT_TRUE(repo.remove(1));
    EXPECT_FALSE(repo.findById(1).has_value());

    auto chair = repo.findById(2);
    ASSERT_TRUE(chair.has_value());
    EXPECT_EQ(chair->name, "Office Chair");
}

TEST_F(RepositoryTest, RemoveMissingReturnsFalse) {
    EXPECT_FALSE(repo.remove(1));
    repo.create("Desk", Money::parse("250"), 2, "Furniture");
    EXPECT_TRUE(repo.remove(1));
    EXPECT_FALSE(repo.remove(1));
}

TEST_F(RepositoryTest, IdsAreNeverReusedAfterDelete) {
    repo.create("A", Money::parse("1"), 1, "X");
    repo.create("B", Money::parse("1"), 1, "X");
    repo.remove(2);
    repo.remove(1);
    auto c = repo.create("C", Money::parse("1"), 1, "X");
    EXPECT_EQ(c.id, 3);
}

TEST_F(RepositoryTest, CreatedIdsStrictlyIncrease) {
    int last = 0;
    for (int i = 0; i < 20; ++i) {
        auto p = repo.create("Item", Money::parse("1.00"), i, "Misc");
        EXPECT_GT(p.id, last);
        last = p.id;
        if (i % 3 == 0) repo.remove(p.id);
    }
}

TEST_F(RepositoryTest, CreateRejectsInvalidArguments) {
    EXPECT_THROW(repo.create("Desk", Money::parse("-1"), 1, "Furniture"),
                 std::invalid_argument);
    EXPECT_THROW(repo.create("Desk", Money::parse("1"), -1, "Furniture"),
                 std::invalid_argument);
    EXPECT_THROW(repo.create("", Money::parse("1"), 1, "Furniture"),
                 std::invalid_argument);
    EXPECT_THROW(repo.create("Desk", Money::parse("1"), 1, "   "),
                 std::invalid_argument);

    // Rejections leave no trace, including on the id counter.
    EXPECT_EQ(repo.size(), 0u);
    EXPECT_EQ(repo.create("Desk", Money::parse("1"), 1, "Furniture").id, 1);
}

TEST_F(RepositoryTest, CreateAcceptsZeroPriceAndStock) {
    auto p = repo.create("Sample", Money::parse("0"), 0, "Promo");
    EXPECT_EQ(p.price.cents(), 0);
    EXPECT_EQ(p.stockQuantity, 0);
}

TEST_F(RepositoryTest, FindByIdReturnsCopy) {
    repo.create("Desk", Money::parse("250"), 2, "Furniture");
    auto p = repo.findById(1);
    ASSERT_TRUE(p.has_value());
    p->stockQuantity = 999;
    EXPECT_EQ(repo.findById(1)->stockQuantity, 2);
}

// ============================================================================
// adjustStock
// ============================================================================

TEST_F(RepositoryTest, AdjustStockRestockAndSale) {
    repo.create("Office Chair", Money::parse("199.99"), 15, "Furniture");
    EXPECT_TRUE(repo.adjustStock(1, 10));
    EXPECT_EQ(repo.findById(1)->stockQuantity, 25);
    EXPECT_TRUE(repo.adjustStock(1, -25));
    EXPECT_EQ(repo.findById(1)->stockQuantity, 0);
}

TEST_F(RepositoryTest, AdjustStockBelowZeroFailsAndLeavesStock) {
    repo.create("Wireless Mouse", Money::parse("29.99"), 50, "Electronics");
    repo.create("Office Chair", Money::parse("199.99"), 15, "Furniture");
    const auto before = *repo.findById(2);

    clock.now += milliseconds(5000);
    EXPECT_FALSE(repo.adjustStock(2, -20));

    const auto after = *repo.findById(2);
    EXPECT_EQ(after.stockQuantity, 15);
    EXPECT_EQ(after.lastUpdated, before.lastUpdated);
}

TEST_F(RepositoryTest, AdjustStockByMinusQPlusOneAlwaysFails) {
    for (int q : {0, 1, 7, 1000}) {
        auto p = repo.create("Item", Money::parse("1"), q, "Misc");
        EXPECT_FALSE(repo.adjustStock(p.id, -(q + 1)));
        EXPECT_EQ(repo.findById(p.id)->stockQuantity, q);
    }
}

TEST_F(RepositoryTest, AdjustStockUnknownIdFails) {
    EXPECT_FALSE(repo.adjustStock(42, 1));
}

TEST_F(RepositoryTest, AdjustStockOverflowFails) {
    repo.create("Bolt", Money::parse("0.01"), std::numeric_limits<int>::max() - 1, "Hardware");
    EXPECT_FALSE(repo.adjustStock(1, 2));
    EXPECT_EQ(repo.findById(1)->stockQuantity, std::numeric_limits<int>::max() - 1);
    EXPECT_TRUE(repo.adjustStock(1, 1));
}

TEST_F(RepositoryTest, AdjustStockUpdatesTimestamp) {
    auto p = repo.create("Desk", Money::parse("250"), 2, "Furniture");
    clock.now += milliseconds(60000);
    EXPECT_TRUE(repo.adjustStock(p.id, 3));
    EXPECT_EQ(repo.findById(p.id)->lastUpdated, clock.now);
}

TEST_F(RepositoryTest, TimestampNeverMovesBackwards) {
    auto p = repo.create("Desk", Money::parse("250"), 2, "Furniture");
    const auto created = p.lastUpdated;

    clock.now -= milliseconds(3600000);   // wall clock stepped back an hour
    EXPECT_TRUE(repo.adjustStock(p.id, 1));
    EXPECT_EQ(repo.findById(p.id)->lastUpdated, created);
}

TEST_F(RepositoryTest, SetExactViaDelta) {
    auto p = repo.create("Desk", Money::parse("250"), 12, "Furniture");
    const int target = 4;
    EXPECT_TRUE(repo.adjustStock(p.id, target - repo.findById(p.id)->stockQuantity));
    EXPECT_EQ(repo.findById(p.id)->stockQuantity, 4);
}

// ============================================================================
// updateDetails
// ============================================================================

TEST_F(RepositoryTest, UpdateDetailsChangesOnlyGivenFields) {
    auto p = repo.create("Desk", Money::parse("250"), 2, "Furniture");
    clock.now += milliseconds(1000);

    ProductUpdate update;
    update.price = Money::parse("275.50");
    EXPECT_TRUE(repo.updateDetails(p.id, update));

    auto after = *repo.findById(p.id);
    EXPECT_EQ(after.name, "Desk");
    EXPECT_EQ(after.price.cents(), 27550);
    EXPECT_EQ(after.category, "Furniture");
    EXPECT_EQ(after.stockQuantity, 2);
    EXPECT_EQ(after.lastUpdated, p.lastUpdated);   // not a stock mutation
}

TEST_F(RepositoryTest, UpdateDetailsAllFields) {
    repo.create("Desk", Money::parse("250"), 2, "Furniture");
    ProductUpdate update;
    update.name     = "Standing Desk";
    update.price    = Money::parse("499");
    update.category = "Office";
    EXPECT_TRUE(repo.updateDetails(1, update));

    auto after = *repo.findById(1);
    EXPECT_EQ(after.name, "Standing Desk");
    EXPECT_EQ(after.price.cents(), 49900);
    EXPECT_EQ(after.category, "Office");
}

TEST_F(RepositoryTest, UpdateDetailsIsAllOrNothing) {
    repo.create("Desk", Money::parse("250"), 2, "Furniture");
    ProductUpdate update;
    update.name  = "Standing Desk";
    update.price = Money::parse("-1");
    EXPECT_THROW(repo.updateDetails(1, update), std::invalid_argument);

    auto after = *repo.findById(1);
    EXPECT_EQ(after.name, "Desk");
    EXPECT_EQ(after.price.cents(), 25000);
}

TEST_F(RepositoryTest, UpdateDetailsRejectsBlankText) {
    repo.create("Desk", Money::parse("250"), 2, "Furniture");
    ProductUpdate blankName;
    blankName.name = " ";
    EXPECT_THROW(repo.updateDetails(1, blankName), std::invalid_argument);

    ProductUpdate blankCategory;
    blankCategory.category = "";
    EXPECT_THROW(repo.updateDetails(1, blankCategory), std::invalid_argument);
}

TEST_F(RepositoryTest, UpdateDetailsUnknownIdReturnsFalse) {
    ProductUpdate update;
    update.name = "Ghost";
    EXPECT_FALSE(repo.updateDetails(9, update));
}

// ============================================================================
// Queries
// ============================================================================

TEST_F(RepositoryTest, FindByNameIsCaseInsensitiveSubstring) {
    repo.create("Wireless Mouse", Money::parse("29.99"), 50, "Electronics");
    repo.create("Office Chair", Money::parse("199.99"), 15, "Furniture");
    repo.create("Mouse Pad", Money::parse("9.99"), 100, "Electronics");

    EXPECT_EQ(idsOf(repo.findByName("mouse")), (std::vector<int>{1, 3}));
    EXPECT_EQ(idsOf(repo.findByName("CHAIR")), (std::vector<int>{2}));
    EXPECT_EQ(idsOf(repo.findByName("e")), (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(idsOf(repo.findByName("o")), (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(idsOf(repo.findByName("pad")), (std::vector<int>{3}));
    EXPECT_TRUE(repo.findByName("keyboard").empty());
}

TEST_F(RepositoryTest, FindByNameEmptyQueryMatchesNothing) {
    repo.create("Desk", Money::parse("250"), 2, "Furniture");
    EXPECT_TRUE(repo.findByName("").empty());
}

TEST_F(RepositoryTest, ListAllIsOrderedById) {
    std::vector<Product> records;
    for (int id : {5, 2, 9}) {
        Product p;
        p.id = id; p.name = "P" + std::to_string(id);
        p.price = Money::parse("1"); p.stockQuantity = 1; p.category = "C";
        records.push_back(p);
    }
    repo.loadFrom(records);
    EXPECT_EQ(idsOf(repo.listAll()), (std::vector<int>{2, 5, 9}));
}

TEST_F(RepositoryTest, ListLowStockFiltersAndOrders) {
    for (int q : {10, 5, 0, 6, 3}) {
        repo.create("Item", Money::parse("1"), q, "Misc");
    }
    const auto low = repo.listLowStock(5);
    EXPECT_EQ(stockOf(low), (std::vector<int>{0, 3, 5}));
    EXPECT_EQ(idsOf(low), (std::vector<int>{3, 5, 2}));
}

TEST_F(RepositoryTest, ListLowStockTiesBrokenById) {
    repo.create("A", Money::parse("1"), 2, "Misc");
    repo.create("B", Money::parse("1"), 1, "Misc");
    repo.create("C", Money::parse("1"), 2, "Misc");
    repo.create("D", Money::parse("1"), 1, "Misc");
    EXPECT_EQ(idsOf(repo.listLowStock(2)), (std::vector<int>{2, 4, 1, 3}));
}

TEST_F(RepositoryTest, ListLowStockZeroThresholdMeansOutOfStock) {
    repo.create("A", Money::parse("1"), 0, "Misc");
    repo.create("B", Money::parse("1"), 1, "Misc");
    EXPECT_EQ(idsOf(repo.listLowStock(0)), (std::vector<int>{1}));
    EXPECT_TRUE(repo.listLowStock(-1).empty());
}

TEST_F(RepositoryTest, ListByCategoryIgnoresCase) {
    repo.create("Mouse", Money::parse("1"), 1, "Electronics");
    repo.create("Chair", Money::parse("1"), 1, "Furniture");
    repo.create("Cable", Money::parse("1"), 1, "electronics");
    EXPECT_EQ(idsOf(repo.listByCategory("ELECTRONICS")), (std::vector<int>{1, 3}));
    EXPECT_TRUE(repo.listByCategory("Garden").empty());
}

TEST_F(RepositoryTest, CategoriesAreDistinctAndSorted) {
    repo.create("Mouse", Money::parse("1"), 1, "Electronics");
    repo.create("Chair", Money::parse("1"), 1, "furniture");
    repo.create("Cable", Money::parse("1"), 1, "electronics");
    repo.create("Pen", Money::parse("1"), 1, "Office");
    EXPECT_EQ(repo.categories(),
              (std::vector<std::string>{"Electronics", "furniture", "Office"}));
}

TEST_F(RepositoryTest, TotalValueIsExact) {
    repo.create("Mouse Pad", Money::parse("9.99"), 100, "Electronics");
    repo.create("Wireless Mouse", Money::parse("29.99"), 50, "Electronics");
    repo.create("Office Chair", Money::parse("199.99"), 15, "Furniture");
    EXPECT_EQ(repo.totalValue().toString(), "14498.35");
    EXPECT_EQ(repo.totalValue().cents(), 1449835);
}

TEST_F(RepositoryTest, TotalValueOfEmptyRepositoryIsZero) {
    EXPECT_EQ(repo.totalValue().cents(), 0);
}

// ============================================================================
// loadFrom
// ============================================================================

static Product makeProduct(int id, int stock) {
    Product p;
    p.id            = id;
    p.name          = "Item " + std::to_string(id);
    p.price         = Money::parse("2.50");
    p.stockQuantity = stock;
    p.category      = "Misc";
    p.lastUpdated   = Timestamp(milliseconds(1000));
    return p;
}

TEST_F(RepositoryTest, LoadFromEmptyResetsNextId) {
    repo.create("Desk", Money::parse("250"), 2, "Furniture");
    repo.loadFrom({});
    EXPECT_EQ(repo.size(), 0u);
    EXPECT_EQ(repo.nextId(), 1);
    EXPECT_EQ(repo.create("Lamp", Money::parse("10"), 1, "Lighting").id, 1);
}

TEST_F(RepositoryTest, LoadFromDerivesNextIdFromMax) {
    repo.loadFrom({makeProduct(4, 1), makeProduct(11, 2), makeProduct(7, 3)});
    EXPECT_EQ(repo.nextId(), 12);
    EXPECT_EQ(repo.create("New", Money::parse("1"), 1, "Misc").id, 12);
}

TEST_F(RepositoryTest, LoadFromReplacesEverything) {
    repo.create("Desk", Money::parse("250"), 2, "Furniture");
    repo.loadFrom({makeProduct(3, 9)});
    EXPECT_FALSE(repo.findById(1).has_value());
    ASSERT_TRUE(repo.findById(3).has_value());
    EXPECT_EQ(*repo.findById(3), makeProduct(3, 9));
}

TEST_F(RepositoryTest, LoadFromRejectsInvalidRecordsAndKeepsState) {
    repo.create("Desk", Money::parse("250"), 2, "Furniture");

    EXPECT_THROW(repo.loadFrom({makeProduct(1, 1), makeProduct(1, 2)}),
                 std::invalid_argument);
    EXPECT_THROW(repo.loadFrom({makeProduct(2, -1)}), std::invalid_argument);
    EXPECT_THROW(repo.loadFrom({makeProduct(0, 1)}), std::invalid_argument);

    auto blank = makeProduct(2, 1);
    blank.name = "";
    EXPECT_THROW(repo.loadFrom({blank}), std::invalid_argument);

    EXPECT_EQ(repo.size(), 1u);
    EXPECT_EQ(repo.findById(1)->name, "Desk");
    EXPECT_EQ(repo.nextId(), 2);
}

// ============================================================================
// Isolation
// ============================================================================

TEST(RepositoryIsolation, InstancesDoNotShareState) {
    InventoryRepository a;
    InventoryRepository b;
    a.create("Desk", Money::parse("250"), 2, "Furniture");
    EXPECT_EQ(a.size(), 1u);
    EXPECT_EQ(b.size(), 0u);
    EXPECT_EQ(b.create("Lamp", Money::parse("10"), 1, "Lighting").id, 1);
}

TEST(RepositoryIsolation, EmptyClockRejected) {
    EXPECT_THROW({ InventoryRepository r{InventoryRepository::Clock{}}; },
                 std::invalid_argument);
}
