#pragma once

#include <string>
#include <vector>

namespace Palettes {

    // Dotted numeric version such as "0.4" or "1.2.3". Missing trailing components compare as zero,
    // so "0.4" == "0.4.0". Non-numeric text in a component stops parsing of that component.
    class LibraryVersion {
    public:
        LibraryVersion() = default;
        explicit LibraryVersion(const std::string& text);

        const std::string& ToString() const { return m_text; }

        // -1, 0 or 1
        int Compare(const LibraryVersion& other) const;

        bool operator==(const LibraryVersion& other) const { return Compare(other) == 0; }
        bool operator<(const LibraryVersion& other) const { return Compare(other) < 0; }
        bool operator>(const LibraryVersion& other) const { return Compare(other) > 0; }
        bool operator>=(const LibraryVersion& other) const { return Compare(other) >= 0; }

    private:
        std::string m_text;
        std::vector<int> m_components;
    };

} // namespace Palettes
