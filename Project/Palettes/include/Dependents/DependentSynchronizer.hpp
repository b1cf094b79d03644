#pragma once

#include "Dependents/DependentDescriptor.hpp"
#include "Settings/PaletteSettings.hpp"

// Keeps palette-bearing sprite sheets sliced into one frame per palette.
//
// Growing the palette count adds a frame to every palette-bearing sheet. A descriptor is
// only rewritten when its height lies in [oldCount, newCount): heights outside that range
// belong to sheets sliced for some other reason and are left alone.
namespace Palettes {
    namespace DependentSynchronizer {

        // True if the descriptor's sheet has one frame per palette
        bool UsesPalettes(const std::string& name, const DependentDescriptor& descriptor, const PaletteSettingsData& settings);

        // Runs once after a batch of addedCount palettes brought the total to newCount.
        // Publishes newCount to the set and returns how many descriptors were updated.
        int SyncAfterGrowth(int addedCount, int newCount, DescriptorSet& descriptors, const PaletteSettingsData& settings);

        // Runs once after a register or migration batch committed committedCount palettes.
        // Palettes at indices the set already published (the host's own palettes, mirrored by a first
        // migration) are not growth, so only the entries past GetPaletteCount() are synced.
        int SyncAfterBatch(int committedCount, int newCount, DescriptorSet& descriptors, const PaletteSettingsData& settings);

    } // namespace DependentSynchronizer
} // namespace Palettes
