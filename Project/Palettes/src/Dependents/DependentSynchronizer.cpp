#include "pch.h"
#include "Dependents/DependentSynchronizer.hpp"
#include "Logging.hpp"

namespace Palettes {
    namespace DependentSynchronizer {

        bool UsesPalettes(const std::string& name, const DependentDescriptor& descriptor, const PaletteSettingsData& settings) {
            const std::vector<std::string>& bases = settings.baseDescriptors;
            if (std::find(bases.begin(), bases.end(), name) != bases.end()) {
                return true;
            }

            const std::string& prefix = settings.palettePathPrefix;
            return !prefix.empty() && descriptor.spritePath.compare(0, prefix.size(), prefix) == 0;
        }

        int SyncAfterGrowth(int addedCount, int newCount, DescriptorSet& descriptors, const PaletteSettingsData& settings) {
            if (addedCount <= 0) {
                return 0;
            }

            // the count before this batch, every sheet sliced for it needs the new frames
            const int threshold = newCount - addedCount;

            int updated = 0;
            for (auto& [name, descriptor] : descriptors) {
                if (descriptor.frameHeight >= threshold && descriptor.frameHeight < newCount
                    && UsesPalettes(name, descriptor, settings)) {
                    descriptor.frameHeight = newCount;
                    ++updated;
                }
            }

            descriptors.SetPaletteCount(newCount);

            PALETTES_PRINT(PaletteLogging::LogLevel::Debug, "[DependentSynchronizer] Palette count ", threshold, " -> ", newCount,
                ", updated ", updated, " descriptors");
            return updated;
        }

        int SyncAfterBatch(int committedCount, int newCount, DescriptorSet& descriptors, const PaletteSettingsData& settings) {
            int grown = std::min(committedCount, newCount - descriptors.GetPaletteCount());
            return SyncAfterGrowth(grown, newCount, descriptors, settings);
        }

    } // namespace DependentSynchronizer
} // namespace Palettes
