#include "PaletteLibrary.hpp"
#include "Registry/OffsetAdapter.hpp"
#include "Settings/PaletteDefinitionLoader.hpp"
#include "Settings/PaletteSettings.hpp"
#include "Logging.hpp"

#include <iostream>
#include <memory>

// palette_tool <settings.json> <palettes.json>
//
// Seeds a HostEnvironment with the file's host palettes, registers the file's palettes
// through a PaletteLibrary and prints the resulting index table.
int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: " << (argc > 0 ? argv[0] : "palette_tool") << " <settings.json> <palettes.json>\n";
        return 2;
    }

    // default logging until the settings say otherwise, so settings errors are reported
    PaletteLogging::Initialize();

    Palettes::PaletteSettingsData settings;
    // a missing settings file is reported and the defaults are kept
    bool settingsLoaded = Palettes::LoadPaletteSettings(argv[1], settings);

    PaletteLogging::Shutdown();
    PaletteLogging::Initialize(settings.ToLoggingConfig());
    PALETTES_PRINT(PaletteLogging::LogLevel::Info, "=== PALETTE TOOL ===");
    if (!settingsLoaded) {
        PALETTES_PRINT(PaletteLogging::LogLevel::Warn, "[PaletteTool] Using default settings");
    }

    Palettes::PaletteDefinitionFile definitions;
    if (!Palettes::LoadPaletteDefinitions(argv[2], definitions)) {
        PALETTES_PRINT(PaletteLogging::LogLevel::Error, "[PaletteTool] Could not load ", argv[2]);
        PaletteLogging::Shutdown();
        return 1;
    }

    // The host ships its palettes and sheets sliced for them before the library loads
    const int hostCount = static_cast<int>(definitions.hostPalettes.size());
    Palettes::HostEnvironment host(std::make_shared<Palettes::StaticColorAccessor>(definitions.hostPalettes));
    host.GetSettings() = settings;
    for (const std::string& name : settings.baseDescriptors) {
        host.GetDescriptors().Add(name, { settings.palettePathPrefix + "/" + name + ".png", hostCount });
    }
    host.GetDescriptors().SetPaletteCount(hostCount);

    int exitCode = 0;
    Palettes::PaletteLibrary library(host);
    try {
        int added = library.Register(definitions.palettes);
        PALETTES_PRINT(PaletteLogging::LogLevel::Info, "[PaletteTool] Registered ", added, " of ",
            definitions.palettes.size(), " palettes");
    }
    catch (const Palettes::ValidationError& e) {
        PALETTES_PRINT(PaletteLogging::LogLevel::Error, "[PaletteTool] ", e.what());
        exitCode = 1;
    }

    std::cout << "index\toffset\tid\tname\n";
    for (int index = 1; index <= library.Count(); ++index) {
        std::optional<std::string> id = library.IdAt(index);
        if (!id) continue;
        std::cout << index << '\t' << Palettes::OffsetAdapter::IndexToOffset(index) << '\t' << *id << '\t'
            << library.GetName(*id).value_or(*id) << '\n';
    }

    std::cout << "\ndescriptor\tframes\n";
    for (const auto& [name, descriptor] : host.GetDescriptors()) {
        std::cout << name << '\t' << descriptor.frameHeight << '\n';
    }

    PaletteLogging::Shutdown();
    return exitCode;
}
