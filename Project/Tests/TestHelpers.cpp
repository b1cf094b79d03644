#include "TestHelpers.hpp"

#include <gtest/gtest.h>

namespace PaletteTests {

    namespace {
        // Route every test's log output to the in-memory queue only
        class LoggingEnvironment : public ::testing::Environment {
        public:
            void SetUp() override {
                PaletteLogging::LoggingConfig config;
                config.level = PaletteLogging::LogLevel::Trace;
                config.logToConsole = false;
                PaletteLogging::Initialize(config);
            }

            void TearDown() override {
                PaletteLogging::Shutdown();
            }
        };

        ::testing::Environment* const loggingEnvironment = ::testing::AddGlobalTestEnvironment(new LoggingEnvironment);
    } // anonymous

    Palettes::ColorMap MakeColorMap(int seed) {
        Palettes::ColorMap colors{};
        for (size_t slot = 0; slot < Palettes::PALETTE_SLOT_COUNT; ++slot) {
            int base = seed * 8 + static_cast<int>(slot);
            colors[slot] = Palettes::Color(base % 256, (base * 3) % 256, (base * 7 + seed) % 256);
        }
        return colors;
    }

    std::unordered_map<std::string, Palettes::RawColor> MakeRawColors(int seed) {
        Palettes::ColorMap colors = MakeColorMap(seed);
        std::unordered_map<std::string, Palettes::RawColor> raw;
        for (size_t slot = 0; slot < Palettes::PALETTE_SLOT_COUNT; ++slot) {
            raw[Palettes::PALETTE_SLOT_NAMES[slot]] = { colors[slot].r, colors[slot].g, colors[slot].b };
        }
        return raw;
    }

    Palettes::PaletteDefinition MakeDefinition(const std::string& id, const std::optional<std::string>& name, int seed) {
        Palettes::PaletteDefinition definition;
        definition.id = id;
        definition.name = name;
        definition.colors = MakeRawColors(seed);
        return definition;
    }

    std::vector<Palettes::ColorMap> MakeHostPalettes(int count) {
        std::vector<Palettes::ColorMap> palettes;
        for (int i = 1; i <= count; ++i) {
            palettes.push_back(MakeColorMap(i));
        }
        return palettes;
    }

    std::vector<PaletteLogging::LogMessage> DrainLog() {
        std::vector<PaletteLogging::LogMessage> messages;
        PaletteLogging::LogMessage message("", PaletteLogging::LogLevel::Info);
        while (PaletteLogging::GetLogQueue().TryPop(message)) {
            messages.push_back(message);
        }
        return messages;
    }

    bool LogContains(const std::vector<PaletteLogging::LogMessage>& messages, PaletteLogging::LogLevel level,
        const std::string& fragment) {
        for (const PaletteLogging::LogMessage& message : messages) {
            if (message.level == level && message.text.find(fragment) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

} // namespace PaletteTests
