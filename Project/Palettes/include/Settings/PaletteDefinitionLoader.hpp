#pragma once

#include "Registry/Color.hpp"

#include <string>
#include <vector>

// Palette definition files.
//
// Format:
//   {
//     "palettes": [
//       { "ID": "KnightRed", "Name": "Knight Red",
//         "PlateHighlight": [255, 226, 171], ..., "BodyHighlight": [186, 62, 41] }
//     ],
//     "hostPalettes": [
//       { "PlateHighlight": [...], ... }
//     ]
//   }
//
// Only JSON types are checked here; slot presence and channel ranges are left to the
// ColorValidator so a bad palette is reported by Register with the usual ValidationError.
namespace Palettes {

    struct PaletteDefinitionFile {
        std::vector<PaletteDefinition> palettes;

        // Color maps a host exposes before any library loads, in index order
        std::vector<ColorMap> hostPalettes;
    };

    bool ParsePaletteDefinitions(const std::string& json, PaletteDefinitionFile& out);
    bool LoadPaletteDefinitions(const std::string& filePath, PaletteDefinitionFile& out);

} // namespace Palettes
