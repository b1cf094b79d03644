#pragma once
// PaletteBindings.h
//
// Exposes a PaletteLibrary to Lua scripts.
//
// BindPaletteLibrary creates a global table (CUSTOM_PALETTES by default):
//   version                      active library version string
//   addPalette(data, ...)        registers one or more palettes, returns the number added.
//                                data = { ID = "...", Name = "...", PlateHighlight = {r,g,b}, ... }
//                                Malformed data raises a Lua error and adds nothing.
//   getMapID(index)              id at a 1-based index, or nil
//   getOffsetID(offset)          id at an image offset, or nil
//   getMapName(id)               display name (falls back to the id), or nil
//   getOffset(id)                image offset, or nil
//   getColorMap(index)           array of eight {r,g,b}, or nil
//   getCount()                   number of palettes
//   migrateHooks()               takes the palette queries back if a script replaced them
//
// and points the VM's GetColorCount / GetColorMap globals at getCount / getColorMap.
//
// If a script later replaces those globals (another palette library), the next addPalette or
// migrateHooks call treats the script functions as the current palette source, migrates from
// them through the HostEnvironment, and installs the library's functions again.
//
// The library must outlive the lua_State bindings. Main thread only.

#include "PaletteLibrary.hpp"

#include <string>

extern "C" {
    struct lua_State;
}

namespace Scripting {

    void BindPaletteLibrary(lua_State* L, Palettes::PaletteLibrary& library, const std::string& globalName = "CUSTOM_PALETTES");

} // namespace Scripting
