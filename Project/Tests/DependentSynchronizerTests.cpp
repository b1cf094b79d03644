#include "Dependents/DependentSynchronizer.hpp"
#include "PaletteLibrary.hpp"
#include "TestHelpers.hpp"

#include <gtest/gtest.h>

using namespace Palettes;

namespace {

    class DependentSyncTest : public ::testing::Test {
    protected:
        void SetUp() override {
            host = std::make_unique<HostEnvironment>(
                std::make_shared<StaticColorAccessor>(PaletteTests::MakeHostPalettes(9)));

            DescriptorSet& descriptors = host->GetDescriptors();
            descriptors.Add("MechUnit", { "units/mech_base.png", 9 });
            descriptors.Add("KnightMech", { "units/player/knight.png", 9 });
            descriptors.Add("KnightIcon", { "units/player/knight_icon.png", 5 });
            descriptors.Add("EnemyMech", { "units/aliens/scarab.png", 9 });
            descriptors.SetPaletteCount(9);
        }

        int HeightOf(const std::string& name) const {
            const DependentDescriptor* descriptor = host->GetDescriptors().Find(name);
            return descriptor ? descriptor->frameHeight : -1;
        }

        std::unique_ptr<HostEnvironment> host;
    };

} // anonymous

TEST_F(DependentSyncTest, OneNewPaletteGrowsPaletteSheets) {
    PaletteLibrary library(*host);
    library.Register(PaletteTests::MakeDefinition("KnightRed", std::nullopt, 50));

    EXPECT_EQ(HeightOf("MechUnit"), 10);
    EXPECT_EQ(HeightOf("KnightMech"), 10);
    EXPECT_EQ(HeightOf("KnightIcon"), 5);
    EXPECT_EQ(HeightOf("EnemyMech"), 9);
    EXPECT_EQ(host->GetDescriptors().GetPaletteCount(), 10);
}

TEST_F(DependentSyncTest, BatchSyncsOnce) {
    PaletteLibrary library(*host);
    PaletteTests::DrainLog();

    std::vector<PaletteDefinition> batch = {
        PaletteTests::MakeDefinition("A", std::nullopt, 50),
        PaletteTests::MakeDefinition("B", std::nullopt, 51),
        PaletteTests::MakeDefinition("C", std::nullopt, 52)
    };
    EXPECT_EQ(library.Register(batch), 3);

    EXPECT_EQ(HeightOf("KnightMech"), 12);
    EXPECT_EQ(HeightOf("MechUnit"), 12);
    EXPECT_EQ(host->GetDescriptors().GetPaletteCount(), 12);

    int syncMessages = 0;
    for (const PaletteLogging::LogMessage& message : PaletteTests::DrainLog()) {
        if (message.text.find("[DependentSynchronizer]") != std::string::npos) {
            ++syncMessages;
        }
    }
    EXPECT_EQ(syncMessages, 1);
}

TEST_F(DependentSyncTest, DuplicatesDoNotSync) {
    PaletteLibrary library(*host);
    EXPECT_FALSE(library.Register(PaletteTests::MakeDefinition("RiftWalkers", std::nullopt, 50)));

    EXPECT_EQ(HeightOf("KnightMech"), 9);
    EXPECT_EQ(host->GetDescriptors().GetPaletteCount(), 9);
}

TEST_F(DependentSyncTest, LoadTimeMigrationGrowsPaletteSheets) {
    // a foreign library added two palettes before this one loaded
    host->InstallAccessor(std::make_shared<StaticColorAccessor>(PaletteTests::MakeHostPalettes(11)));
    PaletteLibrary library(*host);

    EXPECT_EQ(library.Count(), 11);
    EXPECT_EQ(HeightOf("MechUnit"), 11);
    EXPECT_EQ(HeightOf("KnightMech"), 11);
    EXPECT_EQ(HeightOf("KnightIcon"), 5);
    EXPECT_EQ(HeightOf("EnemyMech"), 9);
    EXPECT_EQ(host->GetDescriptors().GetPaletteCount(), 11);

    library.Register(PaletteTests::MakeDefinition("KnightRed", std::nullopt, 50));
    EXPECT_EQ(HeightOf("KnightMech"), 12);
    EXPECT_EQ(HeightOf("MechUnit"), 12);
    EXPECT_EQ(host->GetDescriptors().GetPaletteCount(), 12);
}

TEST_F(DependentSyncTest, EveryMigrationBatchSyncs) {
    PaletteLibrary library(*host);

    host->InstallAccessor(std::make_shared<StaticColorAccessor>(PaletteTests::MakeHostPalettes(10)));
    EXPECT_EQ(library.EnsureAuthority(), 1);
    EXPECT_EQ(HeightOf("KnightMech"), 10);
    EXPECT_EQ(host->GetDescriptors().GetPaletteCount(), 10);

    // migration and registration in one batch share a single sync pass
    host->InstallAccessor(std::make_shared<StaticColorAccessor>(PaletteTests::MakeHostPalettes(11)));
    PaletteTests::DrainLog();
    EXPECT_TRUE(library.Register(PaletteTests::MakeDefinition("KnightRed", std::nullopt, 50)));

    EXPECT_EQ(library.Count(), 12);
    EXPECT_EQ(HeightOf("KnightMech"), 12);
    EXPECT_EQ(HeightOf("MechUnit"), 12);
    EXPECT_EQ(HeightOf("KnightIcon"), 5);
    EXPECT_EQ(HeightOf("EnemyMech"), 9);

    int syncMessages = 0;
    for (const PaletteLogging::LogMessage& message : PaletteTests::DrainLog()) {
        if (message.text.find("[DependentSynchronizer]") != std::string::npos) {
            ++syncMessages;
        }
    }
    EXPECT_EQ(syncMessages, 1);
}

TEST_F(DependentSyncTest, MirroringHostPalettesIsNotGrowth) {
    // constructing over the host's own nine palettes leaves sheets sliced for them alone
    PaletteLibrary library(*host);

    EXPECT_EQ(library.Count(), 9);
    EXPECT_EQ(HeightOf("KnightMech"), 9);
    EXPECT_EQ(HeightOf("KnightIcon"), 5);
    EXPECT_EQ(host->GetDescriptors().GetPaletteCount(), 9);
}

TEST_F(DependentSyncTest, DerivedDescriptorFollowsBase) {
    DependentDescriptor* derived = host->GetDescriptors().Derive("MechUnitRecolor", "MechUnit", "units/player/recolor.png");
    ASSERT_NE(derived, nullptr);
    EXPECT_EQ(derived->frameHeight, 9);

    PaletteLibrary library(*host);
    library.Register(PaletteTests::MakeDefinition("KnightRed", std::nullopt, 50));
    EXPECT_EQ(HeightOf("MechUnitRecolor"), 10);

    EXPECT_EQ(host->GetDescriptors().Derive("Orphan", "Missing", "units/player/x.png"), nullptr);
}

TEST(DependentSynchronizer, RangeIsHalfOpen) {
    PaletteSettingsData settings;
    DescriptorSet descriptors;
    descriptors.Add("Below", { "units/player/a.png", 8 });
    descriptors.Add("Low", { "units/player/b.png", 10 });
    descriptors.Add("High", { "units/player/c.png", 12 });
    descriptors.Add("Above", { "units/player/d.png", 13 });

    // 10 -> 12
    EXPECT_EQ(DependentSynchronizer::SyncAfterGrowth(2, 12, descriptors, settings), 1);
    EXPECT_EQ(descriptors.Find("Below")->frameHeight, 8);
    EXPECT_EQ(descriptors.Find("Low")->frameHeight, 12);
    EXPECT_EQ(descriptors.Find("High")->frameHeight, 12);
    EXPECT_EQ(descriptors.Find("Above")->frameHeight, 13);
}

TEST(DependentSynchronizer, NothingAddedIsANoOp) {
    PaletteSettingsData settings;
    DescriptorSet descriptors;
    descriptors.Add("MechUnit", { "", 9 });
    descriptors.SetPaletteCount(9);

    EXPECT_EQ(DependentSynchronizer::SyncAfterGrowth(0, 9, descriptors, settings), 0);
    EXPECT_EQ(descriptors.Find("MechUnit")->frameHeight, 9);
    EXPECT_EQ(descriptors.GetPaletteCount(), 9);
}

TEST(DependentSynchronizer, BatchSkipsPublishedPalettes) {
    PaletteSettingsData settings;
    DescriptorSet descriptors;
    descriptors.Add("KnightMech", { "units/player/knight.png", 9 });
    descriptors.Add("KnightIcon", { "units/player/icon.png", 5 });
    descriptors.SetPaletteCount(9);

    // nine mirrored palettes, all already published
    EXPECT_EQ(DependentSynchronizer::SyncAfterBatch(9, 9, descriptors, settings), 0);
    EXPECT_EQ(descriptors.Find("KnightIcon")->frameHeight, 5);

    // eleven committed, only the last two are new to the host
    EXPECT_EQ(DependentSynchronizer::SyncAfterBatch(11, 11, descriptors, settings), 1);
    EXPECT_EQ(descriptors.Find("KnightMech")->frameHeight, 11);
    EXPECT_EQ(descriptors.Find("KnightIcon")->frameHeight, 5);
    EXPECT_EQ(descriptors.GetPaletteCount(), 11);
}

TEST(DependentSynchronizer, BatchWithoutPublishedCount) {
    PaletteSettingsData settings;
    DescriptorSet descriptors;
    descriptors.Add("MechUnit", { "", 2 });

    EXPECT_EQ(DependentSynchronizer::SyncAfterBatch(3, 3, descriptors, settings), 1);
    EXPECT_EQ(descriptors.Find("MechUnit")->frameHeight, 3);
    EXPECT_EQ(descriptors.GetPaletteCount(), 3);
}

TEST(DependentSynchronizer, ConfiguredPrefixAndBases) {
    PaletteSettingsData settings;
    settings.palettePathPrefix = "mods/squad";
    settings.baseDescriptors = { "TankIcon" };

    EXPECT_TRUE(DependentSynchronizer::UsesPalettes("TankIcon", { "anything.png", 1 }, settings));
    EXPECT_TRUE(DependentSynchronizer::UsesPalettes("Other", { "mods/squad/tank.png", 1 }, settings));
    EXPECT_FALSE(DependentSynchronizer::UsesPalettes("MechUnit", { "units/player/mech.png", 1 }, settings));
}
