#include "Authority/AuthorityManager.hpp"
#include "Authority/BuiltinPalettes.hpp"
#include "PaletteLibrary.hpp"
#include "TestHelpers.hpp"

#include <gtest/gtest.h>

using namespace Palettes;

namespace {

    // Reports count palettes but has no color map at gapIndex
    class GapColorAccessor : public IColorAccessor {
    public:
        GapColorAccessor(int count, int gapIndex) : m_count(count), m_gapIndex(gapIndex) {}

        int GetColorCount() const override { return m_count; }

        std::optional<ColorMap> GetColorMap(int index) const override {
            if (index < 1 || index > m_count || index == m_gapIndex) {
                return std::nullopt;
            }
            return PaletteTests::MakeColorMap(index);
        }

    private:
        int m_count;
        int m_gapIndex;
    };

    std::shared_ptr<IColorAccessor> MakeHost(int count) {
        return std::make_shared<StaticColorAccessor>(PaletteTests::MakeHostPalettes(count));
    }

} // anonymous

TEST(AuthorityManager, MigratesBuiltinPalettesInOrder) {
    HostEnvironment host(MakeHost(BuiltinPalettes::BUILTIN_PALETTE_COUNT));
    PaletteLibrary library(host);

    ASSERT_EQ(library.Count(), 9);
    EXPECT_EQ(library.IdAt(1), "RiftWalkers");
    EXPECT_EQ(library.IdAt(9), "SecretSquad");
    EXPECT_EQ(library.GetName("FrozenTitans"), "Pinnacle Ice Blue");

    for (int index = 1; index <= 9; ++index) {
        EXPECT_EQ(library.ColorMapAt(index), PaletteTests::MakeColorMap(index)) << "index " << index;
    }
    EXPECT_TRUE(library.IsAuthoritative());
}

TEST(AuthorityManager, InstalledAccessorAnswersFromRegistry) {
    HostEnvironment host(MakeHost(9));
    PaletteLibrary library(host);
    library.Register(PaletteTests::MakeDefinition("KnightRed", std::nullopt, 20));

    const std::shared_ptr<IColorAccessor>& accessor = host.GetAccessor();
    EXPECT_EQ(accessor->GetColorCount(), 10);
    EXPECT_EQ(accessor->GetColorMap(10), PaletteTests::MakeColorMap(20));
    EXPECT_FALSE(accessor->GetColorMap(11).has_value());
}

TEST(AuthorityManager, ForeignIdsNameExtraPalettes) {
    HostEnvironment host(MakeHost(12));
    host.SetForeignIdTable(ForeignIdTable{ { "Crimson", 9 }, { "Teal", 11 } });
    PaletteLibrary library(host);

    ASSERT_EQ(library.Count(), 12);
    EXPECT_EQ(library.IdAt(10), "Crimson");
    EXPECT_EQ(library.IdAt(11), "11");
    EXPECT_EQ(library.IdAt(12), "Teal");

    // names fall back to the id past the built-in table
    EXPECT_EQ(library.GetName("Crimson"), "Crimson");
    EXPECT_EQ(library.IdToOffset("Teal"), 11);
}

TEST(AuthorityManager, TakenCandidateIsSkipped) {
    HostEnvironment host(MakeHost(10));
    host.SetForeignIdTable(ForeignIdTable{ { "RiftWalkers", 9 } });
    PaletteLibrary library(host);

    ASSERT_EQ(library.Count(), 10);
    EXPECT_EQ(library.IdAt(1), "RiftWalkers");
    EXPECT_EQ(library.IdAt(10), "10");
}

TEST(AuthorityManager, GapStopsMigrationButTakesAuthority) {
    PaletteTests::DrainLog();
    HostEnvironment host(std::make_shared<GapColorAccessor>(5, 3));
    PaletteLibrary library(host);

    EXPECT_EQ(library.Count(), 2);
    EXPECT_TRUE(library.IsAuthoritative());

    std::vector<PaletteLogging::LogMessage> log = PaletteTests::DrainLog();
    EXPECT_TRUE(PaletteTests::LogContains(log, PaletteLogging::LogLevel::Warn, "No colors at index 3"));

    // registration continues after the gap
    EXPECT_TRUE(library.Register(PaletteTests::MakeDefinition("KnightRed", std::nullopt, 30)));
    EXPECT_EQ(library.IndexOf("KnightRed"), 3);
}

TEST(AuthorityManager, EnsureAuthorityIsIdempotent) {
    HostEnvironment host(MakeHost(9));
    PaletteLibrary library(host);

    std::shared_ptr<IColorAccessor> installed = host.GetAccessor();
    EXPECT_EQ(library.EnsureAuthority(), 0);
    EXPECT_EQ(library.EnsureAuthority(), 0);
    EXPECT_EQ(host.GetAccessor(), installed);
    EXPECT_EQ(library.Count(), 9);
}

TEST(AuthorityManager, RetakesAuthorityFromForeignLibrary) {
    HostEnvironment host(MakeHost(9));
    PaletteLibrary library(host);

    // a foreign library copied our palettes and added two of its own
    host.InstallAccessor(MakeHost(11));
    host.SetForeignIdTable(ForeignIdTable{ { "Crimson", 9 } });
    EXPECT_FALSE(library.IsAuthoritative());

    EXPECT_EQ(library.EnsureAuthority(), 2);
    EXPECT_TRUE(library.IsAuthoritative());
    EXPECT_EQ(library.IdAt(10), "Crimson");
    EXPECT_EQ(library.IdAt(11), "11");
    EXPECT_EQ(library.ColorMapAt(11), PaletteTests::MakeColorMap(11));
}

TEST(AuthorityManager, SmallerHostMigratesNothing) {
    PaletteRegistry registry;
    registry.Register(PaletteTests::MakeDefinition("A", std::nullopt, 1));
    registry.Register(PaletteTests::MakeDefinition("B", std::nullopt, 2));

    StaticColorAccessor host(PaletteTests::MakeHostPalettes(1));
    EXPECT_EQ(AuthorityManager::MigratePalettes(host, registry, std::nullopt), 0);
    EXPECT_EQ(registry.Count(), 2);
}

TEST(AuthorityManager, MigrationContinuesAfterLocalEntries) {
    PaletteRegistry registry;
    registry.Register(PaletteTests::MakeDefinition("Local", std::nullopt, 40));

    StaticColorAccessor host(PaletteTests::MakeHostPalettes(3));
    EXPECT_EQ(AuthorityManager::MigratePalettes(host, registry, std::nullopt), 2);

    EXPECT_EQ(registry.IdAt(1), "Local");
    EXPECT_EQ(registry.IdAt(2), "RustingHulks");
    EXPECT_EQ(registry.NameOf("ZenithGuard"), "Pinnacle Dark Blue");
}

TEST(AuthorityManager, EmptyHostGivesEmptyRegistry) {
    HostEnvironment host;
    PaletteLibrary library(host);

    EXPECT_EQ(library.Count(), 0);
    EXPECT_TRUE(library.IsAuthoritative());
}
