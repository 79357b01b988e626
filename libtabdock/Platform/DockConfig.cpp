#include "DockConfig.h"

#include <libtabdock/Dock/DockAreaOptions.h>
#include <libtabdock/Dock/DockStyle.h>
#include <libtabdock/Dock/TabStyle.h>
#include <libtabdock/Graphics/Color.h>
#include <libtabdock/Maths/Vec2.h>
#include <libtabdock/Platform/Log.h>

#include <toml++/toml.h>

#include <array>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

using namespace tabdock;

namespace
{
    // reads numeric arrays like `[r, g, b, a]` (or `[x, y]`)
    template<size_t N>
    std::optional<std::array<float, N>> try_read_floats(const toml::array& array)
    {
        if (array.size() != N) {
            return std::nullopt;
        }

        std::array<float, N> rv{};
        for (size_t i = 0; i < N; ++i) {
            if (not array[i].is_number()) {
                return std::nullopt;
            }
            rv[i] = static_cast<float>(array[i].value_or(0.0));
        }
        return rv;
    }

    // reads values from a parsed TOML document, keeping the caller's value (and
    // logging a warning) when a key has the wrong type
    class ConfigReader final {
    public:
        ConfigReader(const toml::table& root, std::string_view source_name) :
            root_{&root},
            source_name_{source_name}
        {}

        void read_bool(std::string_view table, std::string_view key, bool& out) const
        {
            const auto node = node_at(table, key);
            if (not node) {
                return;
            }
            if (const toml::value<bool>* value = node.as_boolean()) {
                out = value->get();
            }
            else {
                warn_wrong_type(table, key, "a boolean");
            }
        }

        void read_float(std::string_view table, std::string_view key, float& out) const
        {
            const auto node = node_at(table, key);
            if (not node) {
                return;
            }
            if (node.is_number()) {
                out = static_cast<float>(node.value_or(0.0));
            }
            else {
                warn_wrong_type(table, key, "a number");
            }
        }

        void read_color(std::string_view table, std::string_view key, Color& out) const
        {
            const auto node = node_at(table, key);
            if (not node) {
                return;
            }

            if (const toml::array* array = node.as_array()) {
                if (const auto rgb = try_read_floats<3>(*array)) {
                    out = Color{(*rgb)[0], (*rgb)[1], (*rgb)[2]};
                    return;
                }
                if (const auto rgba = try_read_floats<4>(*array)) {
                    out = Color{(*rgba)[0], (*rgba)[1], (*rgba)[2], (*rgba)[3]};
                    return;
                }
            }
            warn_wrong_type(table, key, "an array of 3 or 4 numbers");
        }

        void read_vec2(std::string_view table, std::string_view key, Vec2& out) const
        {
            const auto node = node_at(table, key);
            if (not node) {
                return;
            }

            if (const toml::array* array = node.as_array()) {
                if (const auto xy = try_read_floats<2>(*array)) {
                    out = Vec2{(*xy)[0], (*xy)[1]};
                    return;
                }
            }
            warn_wrong_type(table, key, "an array of 2 numbers");
        }

    private:
        // `table` may be a dotted path (e.g. `style.tab`)
        toml::node_view<const toml::node> node_at(std::string_view table, std::string_view key) const
        {
            return root_->at_path(table)[key];
        }

        void warn_wrong_type(std::string_view table, std::string_view key, const char* expected) const
        {
            log_warn("%s: [%s] %s should be %s: using its default value instead",
                std::string{source_name_}.c_str(),
                std::string{table}.c_str(),
                std::string{key}.c_str(),
                expected
            );
        }

        const toml::table* root_;
        std::string_view source_name_;
    };

    DockConfig read_dock_config(const toml::table& root, std::string_view source_name)
    {
        const ConfigReader reader{root, source_name};
        DockConfig rv;

        DockAreaOptions& options = rv.options;
        reader.read_bool("dock_area", "show_close_buttons", options.show_close_buttons);
        reader.read_bool("dock_area", "show_add_buttons", options.show_add_buttons);
        reader.read_bool("dock_area", "show_add_popup", options.show_add_popup);
        reader.read_bool("dock_area", "tab_context_menus", options.tab_context_menus);
        reader.read_bool("dock_area", "show_tab_name_on_hover", options.show_tab_name_on_hover);
        reader.read_bool("dock_area", "show_window_close_buttons", options.show_window_close_buttons);
        reader.read_bool("dock_area", "show_window_collapse_buttons", options.show_window_collapse_buttons);

        DockStyle& style = rv.style;
        reader.read_color("style", "tab_bar_bg_fill", style.tab_bar_bg_fill);
        reader.read_vec2("style", "window_default_size", style.window_default_size);

        TabStyle& tab = style.tab;
        reader.read_float("style.tab", "rounding", tab.rounding);
        reader.read_color("style.tab", "bg_fill", tab.bg_fill);
        reader.read_color("style.tab", "bg_fill_hovered", tab.bg_fill_hovered);
        reader.read_color("style.tab", "bg_fill_active", tab.bg_fill_active);
        reader.read_color("style.tab", "text_color", tab.text_color);
        reader.read_color("style.tab", "body_bg_fill", tab.body_bg_fill);

        return rv;
    }
}

DockConfig tabdock::parse_dock_config(std::string_view toml_content, std::string_view source_name)
{
    toml::table root;
    try {
        root = toml::parse(toml_content, source_name);
    }
    catch (const toml::parse_error& ex) {
        log_error("%s: error parsing dock configuration: %s", std::string{source_name}.c_str(), std::string{ex.description()}.c_str());
        log_error("the default dock configuration will be used instead");
        return DockConfig{};
    }
    return read_dock_config(root, source_name);
}

DockConfig tabdock::load_dock_config(const std::filesystem::path& path)
{
    std::error_code ec;
    if (not std::filesystem::exists(path, ec)) {
        log_info("%s: no dock configuration file found: using the default configuration", path.string().c_str());
        return DockConfig{};
    }

    const std::string source_name = path.string();
    toml::table root;
    try {
        root = toml::parse_file(source_name);
    }
    catch (const toml::parse_error& ex) {
        log_error("%s: error parsing dock configuration: %s", source_name.c_str(), std::string{ex.description()}.c_str());
        log_error("the default dock configuration will be used instead");
        return DockConfig{};
    }
    return read_dock_config(root, source_name);
}
