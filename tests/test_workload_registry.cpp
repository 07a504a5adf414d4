#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>

#include "workload/WorkloadRegistry.hpp"
#include "TestWorkloads.hpp"

using namespace burst;

TEST(WorkloadRegistryTest, BuiltinsCoverTheCatalog) {
    auto reg = WorkloadRegistry::with_builtins();
    for (int id = 1; id <= 8; ++id) EXPECT_TRUE(reg.contains(id)) << id;
    EXPECT_TRUE(reg.contains(WorkloadRegistry::kFailingSelfTestId));
    EXPECT_FALSE(reg.contains(9));
}

TEST(WorkloadRegistryTest, CatalogHidesReservedEntries) {
    auto reg = WorkloadRegistry::with_builtins();
    auto visible = reg.catalog();
    EXPECT_EQ(visible.size(), 8u);
    for (const auto& w : visible) EXPECT_NE(w.id, WorkloadRegistry::kFailingSelfTestId);
    EXPECT_EQ(reg.catalog(true).size(), 9u);
}

TEST(WorkloadRegistryTest, CreateReturnsFreshInstances) {
    auto reg = WorkloadRegistry::with_builtins();
    auto a = reg.create(1);
    auto b = reg.create(1);
    ASSERT_TRUE(a && b);
    EXPECT_NE(a.get(), b.get());
    EXPECT_STREQ(a->name(), "IntegerStress");
    EXPECT_THROW(reg.create(42), std::out_of_range);
}

TEST(WorkloadRegistryTest, NamesMatchCatalog) {
    auto reg = WorkloadRegistry::with_builtins();
    for (const auto& info : reg.catalog(true))
        EXPECT_EQ(info.name, reg.create(info.id)->name());
}

TEST(WorkloadRegistryTest, ParseSelectionSkipsJunkAndUnknown) {
    auto reg = WorkloadRegistry::with_builtins();
    EXPECT_EQ(reg.parse_selection("1,2 7"), (std::vector<int>{1, 2, 7}));
    EXPECT_EQ(reg.parse_selection("3, x, 99,4"), (std::vector<int>{3, 4}));
    EXPECT_EQ(reg.parse_selection("102030"), (std::vector<int>{102030}));
    EXPECT_TRUE(reg.parse_selection("").empty());
}

TEST(WorkloadRegistryTest, AddIsTheOnlyExtensionPoint) {
    WorkloadRegistry reg;
    reg.add(500, "Custom", "test entry",
            [] { return std::make_unique<burst::test::ScriptedWorkload>("Custom"); });
    EXPECT_STREQ(reg.create(500)->name(), "Custom");
    EXPECT_THROW(reg.add(500, "Dup", "", [] { return std::make_unique<burst::test::ScriptedWorkload>("Dup"); }),
                 std::invalid_argument);
    EXPECT_THROW(reg.add(501, "Empty", "", WorkloadRegistry::Factory{}), std::invalid_argument);
}
