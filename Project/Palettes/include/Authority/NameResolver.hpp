#pragma once

#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace Palettes {

    // Maps a 1-based palette index to a candidate id or name, or nullopt if it has nothing for it.
    // An empty NameResolver is an absent strategy and is skipped.
    using NameResolver = std::function<std::optional<std::string>(int index)>;

    // A foreign palette library's table of id -> image offset (0-based)
    using ForeignIdTable = std::unordered_map<std::string, int>;

    namespace NameResolvers {

        NameResolver BuiltinIds();
        NameResolver BuiltinNames();

        // Returns an empty resolver when no table is given. When several ids share an
        // offset the lexicographically smallest one is used.
        NameResolver ForeignIds(const std::optional<ForeignIdTable>& table);

        // The stringified index, always resolves
        NameResolver IndexString();

        // Constant fallback, e.g. an already chosen id used as a name
        NameResolver Fixed(std::string value);

        // First candidate, in chain order, for which accept returns true (any candidate if accept is empty)
        std::optional<std::string> Resolve(const std::vector<NameResolver>& chain, int index,
            const std::function<bool(const std::string&)>& accept = nullptr);

    } // namespace NameResolvers
} // namespace Palettes
