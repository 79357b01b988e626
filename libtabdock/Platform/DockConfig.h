#pragma once

#include <libtabdock/Dock/DockAreaOptions.h>
#include <libtabdock/Dock/DockStyle.h>

#include <filesystem>
#include <string_view>

namespace tabdock
{
    // user-configurable settings for a `DockArea`
    //
    // usually loaded from a TOML file with `[dock_area]`, `[style]` and `[style.tab]`
    // tables. Missing keys keep their defaults.
    struct DockConfig final {
        friend bool operator==(const DockConfig&, const DockConfig&) = default;

        DockAreaOptions options;
        DockStyle style;
    };

    // Parses a `DockConfig` from TOML content.
    //
    // Never throws: syntax errors are logged and yield a default `DockConfig`, values
    // with the wrong type are logged and keep their default.
    DockConfig parse_dock_config(std::string_view toml_content, std::string_view source_name = "<string>");

    // Loads a `DockConfig` from a TOML file, or returns a default one if the
    // file doesn't exist or cannot be parsed.
    DockConfig load_dock_config(const std::filesystem::path&);
}
