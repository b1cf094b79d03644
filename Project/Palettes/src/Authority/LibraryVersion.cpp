#include "pch.h"
#include "Authority/LibraryVersion.hpp"

#include <cctype>

namespace Palettes {

    LibraryVersion::LibraryVersion(const std::string& text) : m_text(text) {
        std::istringstream stream(text);
        std::string part;
        while (std::getline(stream, part, '.')) {
            // components saturate at INT_MAX
            long long value = 0;
            for (char c : part) {
                if (!std::isdigit(static_cast<unsigned char>(c))) {
                    break;
                }
                value = std::min<long long>(value * 10 + (c - '0'), std::numeric_limits<int>::max());
            }
            m_components.push_back(static_cast<int>(value));
        }
    }

    int LibraryVersion::Compare(const LibraryVersion& other) const {
        size_t length = std::max(m_components.size(), other.m_components.size());
        for (size_t i = 0; i < length; ++i) {
            int mine = i < m_components.size() ? m_components[i] : 0;
            int theirs = i < other.m_components.size() ? other.m_components[i] : 0;
            if (mine != theirs) {
                return mine < theirs ? -1 : 1;
            }
        }
        return 0;
    }

} // namespace Palettes
