#include "DockConfig.h"

#include <libtabdock/Dock/DockAreaOptions.h>
#include <libtabdock/Dock/DockStyle.h>
#include <libtabdock/Dock/TabStyle.h>
#include <libtabdock/Graphics/Color.h>
#include <libtabdock/Maths/Vec2.h>
#include <libtabdock/Platform/LogLevel.h>

#include <gtest/gtest.h>
#include <testtabdock/TestingHelpers.h>

#include <filesystem>
#include <fstream>
#include <string_view>

using namespace tabdock;
using namespace tabdock::testing;

TEST(parse_dock_config, empty_document_yields_the_default_config)
{
    ASSERT_EQ(parse_dock_config(""), DockConfig{});
}

TEST(parse_dock_config, reads_dock_area_options)
{
    const DockConfig config = parse_dock_config(R"(
        [dock_area]
        show_close_buttons = false
        show_add_buttons = true
        show_add_popup = true
        tab_context_menus = false
        show_tab_name_on_hover = true
        show_window_close_buttons = false
        show_window_collapse_buttons = false
    )");

    const DockAreaOptions& options = config.options;
    ASSERT_FALSE(options.show_close_buttons);
    ASSERT_TRUE(options.show_add_buttons);
    ASSERT_TRUE(options.show_add_popup);
    ASSERT_FALSE(options.tab_context_menus);
    ASSERT_TRUE(options.show_tab_name_on_hover);
    ASSERT_FALSE(options.show_window_close_buttons);
    ASSERT_FALSE(options.show_window_collapse_buttons);
}

TEST(parse_dock_config, reads_style_values)
{
    const DockConfig config = parse_dock_config(R"(
        [style]
        tab_bar_bg_fill = [0.5, 0.5, 0.5, 1.0]
        window_default_size = [640, 480.0]

        [style.tab]
        rounding = 2
        bg_fill = [0.25, 0.5, 0.75]
        text_color = [0.0, 0.0, 0.0, 0.5]
    )");

    ASSERT_EQ(config.style.tab_bar_bg_fill, (Color{0.5f, 0.5f, 0.5f, 1.0f}));
    ASSERT_EQ(config.style.window_default_size, (Vec2{640.0f, 480.0f}));
    ASSERT_EQ(config.style.tab.rounding, 2.0f);
    ASSERT_EQ(config.style.tab.bg_fill, (Color{0.25f, 0.5f, 0.75f, 1.0f}));
    ASSERT_EQ(config.style.tab.text_color, (Color{0.0f, 0.0f, 0.0f, 0.5f}));
    ASSERT_EQ(config.style.tab.body_bg_fill, TabStyle{}.body_bg_fill);
}

TEST(parse_dock_config, missing_keys_keep_their_defaults)
{
    const DockConfig config = parse_dock_config(R"(
        [dock_area]
        show_add_buttons = true
    )");

    DockConfig expected;
    expected.options.show_add_buttons = true;
    ASSERT_EQ(config, expected);
}

TEST(parse_dock_config, syntax_error_yields_the_default_config_and_logs_an_error)
{
    ScopedLogCapture capture;

    const DockConfig config = parse_dock_config(R"(
        [dock_area
        show_add_buttons = true
    )");

    ASSERT_EQ(config, DockConfig{});
    ASSERT_GE(capture.sink().count(LogLevel::err), 1);
}

TEST(parse_dock_config, wrongly_typed_values_keep_their_default_and_log_a_warning)
{
    ScopedLogCapture capture;

    const DockConfig config = parse_dock_config(R"(
        [dock_area]
        show_close_buttons = "no"
        show_add_buttons = true

        [style.tab]
        rounding = "round"
        bg_fill = [1.0, "red", 0.0]
    )");

    DockConfig expected;
    expected.options.show_add_buttons = true;
    ASSERT_EQ(config, expected);
    ASSERT_EQ(capture.sink().count(LogLevel::warn), 3);
}

TEST(load_dock_config, missing_file_yields_the_default_config)
{
    ScopedLogCapture capture;

    const DockConfig config = load_dock_config(std::filesystem::temp_directory_path() / "tabdock_config_that_does_not_exist.toml");

    ASSERT_EQ(config, DockConfig{});
    ASSERT_EQ(capture.sink().count(LogLevel::info), 1);
    ASSERT_EQ(capture.sink().count(LogLevel::err), 0);
}

TEST(load_dock_config, reads_a_config_file)
{
    const std::filesystem::path path = std::filesystem::temp_directory_path() / "tabdock_load_dock_config_test.toml";
    {
        std::ofstream file{path};
        file << "[dock_area]\nshow_close_buttons = false\n\n[style.tab]\nrounding = 0.0\n";
    }

    const DockConfig config = load_dock_config(path);
    std::filesystem::remove(path);

    ASSERT_FALSE(config.options.show_close_buttons);
    ASSERT_EQ(config.style.tab.rounding, 0.0f);
}
