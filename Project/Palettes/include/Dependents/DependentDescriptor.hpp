#pragma once

#include <map>
#include <string>

namespace Palettes {

    // Host render object whose sprite sheet holds one vertical frame per palette.
    // frameHeight is the number of frames the sheet is sliced into.
    struct DependentDescriptor {
        std::string spritePath;
        int frameHeight = 1;
    };

    // DescriptorSet - the host's named render descriptors.
    //
    // Owned by the host rendering layer. The palette library only reads sprite paths and
    // rewrites frame heights; it never adds or removes descriptors.
    class DescriptorSet {
    public:
        using Container = std::map<std::string, DependentDescriptor>;

        // Adds or replaces a descriptor
        DependentDescriptor& Add(const std::string& name, const DependentDescriptor& descriptor);

        // Creates a descriptor that inherits the base's frame height, with its own sprite path.
        // Returns nullptr if the base does not exist.
        DependentDescriptor* Derive(const std::string& name, const std::string& baseName, const std::string& spritePath);

        DependentDescriptor* Find(const std::string& name);
        const DependentDescriptor* Find(const std::string& name) const;

        size_t Size() const { return m_descriptors.size(); }

        Container::iterator begin() { return m_descriptors.begin(); }
        Container::iterator end() { return m_descriptors.end(); }
        Container::const_iterator begin() const { return m_descriptors.begin(); }
        Container::const_iterator end() const { return m_descriptors.end(); }

        // Palette count last published to the host
        int GetPaletteCount() const { return m_paletteCount; }
        void SetPaletteCount(int count) { m_paletteCount = count; }

    private:
        Container m_descriptors;
        int m_paletteCount = 0;
    };

} // namespace Palettes
