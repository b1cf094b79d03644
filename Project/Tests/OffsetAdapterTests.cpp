#include "Registry/OffsetAdapter.hpp"
#include "TestHelpers.hpp"

#include <gtest/gtest.h>

#include <limits>

using namespace Palettes;

TEST(OffsetAdapter, OffsetIsIndexMinusOne) {
    EXPECT_EQ(OffsetAdapter::IndexToOffset(1), 0);
    EXPECT_EQ(OffsetAdapter::OffsetToIndex(0), 1);
    EXPECT_EQ(OffsetAdapter::OffsetToIndex(OffsetAdapter::IndexToOffset(12)), 12);
}

TEST(OffsetAdapter, RoundTripForEveryPalette) {
    PaletteRegistry registry;
    for (int i = 1; i <= 5; ++i) {
        registry.Register(PaletteTests::MakeDefinition("P" + std::to_string(i), std::nullopt, i));
    }

    for (int offset = 0; offset < registry.Count(); ++offset) {
        std::optional<std::string> id = OffsetAdapter::OffsetToId(registry, offset);
        ASSERT_TRUE(id.has_value());
        EXPECT_EQ(OffsetAdapter::IdToOffset(registry, *id), offset);
    }
    EXPECT_EQ(OffsetAdapter::OffsetToId(registry, 0), "P1");
    EXPECT_EQ(OffsetAdapter::IdToOffset(registry, "P5"), 4);
}

TEST(OffsetAdapter, OutOfRange) {
    PaletteRegistry registry;
    registry.Register(PaletteTests::MakeDefinition("Only", std::nullopt, 1));

    EXPECT_FALSE(OffsetAdapter::OffsetToId(registry, -1).has_value());
    EXPECT_FALSE(OffsetAdapter::OffsetToId(registry, 1).has_value());
    EXPECT_FALSE(OffsetAdapter::OffsetToId(registry, std::numeric_limits<int>::max()).has_value());
    EXPECT_FALSE(OffsetAdapter::OffsetToId(registry, std::numeric_limits<int>::min()).has_value());
    EXPECT_FALSE(OffsetAdapter::IdToOffset(registry, "Missing").has_value());
}
