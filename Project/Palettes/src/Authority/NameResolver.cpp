#include "pch.h"
#include "Authority/NameResolver.hpp"
#include "Authority/BuiltinPalettes.hpp"
#include "Registry/OffsetAdapter.hpp"

namespace Palettes {
    namespace NameResolvers {

        NameResolver BuiltinIds() {
            return [](int index) { return BuiltinPalettes::IdAt(index); };
        }

        NameResolver BuiltinNames() {
            return [](int index) { return BuiltinPalettes::NameAt(index); };
        }

        NameResolver ForeignIds(const std::optional<ForeignIdTable>& table) {
            if (!table) {
                return NameResolver{};
            }

            // the foreign table stores image offsets, convert to palette indices
            std::map<int, std::string> byIndex;
            for (const auto& [id, offset] : *table) {
                if (offset < 0 || offset == std::numeric_limits<int>::max() || id.empty()) {
                    continue;
                }
                int index = OffsetAdapter::OffsetToIndex(offset);
                auto it = byIndex.find(index);
                if (it == byIndex.end() || id < it->second) {
                    byIndex[index] = id;
                }
            }

            return [byIndex = std::move(byIndex)](int index) -> std::optional<std::string> {
                auto it = byIndex.find(index);
                if (it == byIndex.end()) {
                    return std::nullopt;
                }
                return it->second;
            };
        }

        NameResolver IndexString() {
            return [](int index) -> std::optional<std::string> { return std::to_string(index); };
        }

        NameResolver Fixed(std::string value) {
            return [value = std::move(value)](int) -> std::optional<std::string> { return value; };
        }

        std::optional<std::string> Resolve(const std::vector<NameResolver>& chain, int index,
            const std::function<bool(const std::string&)>& accept) {
            for (const NameResolver& resolver : chain) {
                if (!resolver) {
                    continue;
                }
                std::optional<std::string> candidate = resolver(index);
                if (candidate && (!accept || accept(*candidate))) {
                    return candidate;
                }
            }
            return std::nullopt;
        }

    } // namespace NameResolvers
} // namespace Palettes
