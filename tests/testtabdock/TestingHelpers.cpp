#include "TestingHelpers.h"

#include <libtabdock/Dock/DrawContext.h>
#include <libtabdock/Dock/OnCloseResponse.h>
#include <libtabdock/Dock/TabButtonResponse.h>
#include <libtabdock/Maths/Rect.h>
#include <libtabdock/Maths/Vec2.h>
#include <libtabdock/Platform/Log.h>
#include <libtabdock/UI/tabdockimgui.h>

#include <algorithm>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <vector>

using namespace tabdock;
using namespace tabdock::testing;

size_t tabdock::testing::RecordingTabViewer::count(std::string_view operation, std::string_view tab_title) const
{
    return static_cast<size_t>(std::ranges::count_if(calls_, [&](const ViewerCall& call)
    {
        return call.operation == operation and call.tab_title == tab_title;
    }));
}

size_t tabdock::testing::RecordingTabViewer::count(std::string_view operation) const
{
    return static_cast<size_t>(std::ranges::count_if(calls_, [&](const ViewerCall& call)
    {
        return call.operation == operation;
    }));
}

std::optional<size_t> tabdock::testing::RecordingTabViewer::index_of(std::string_view operation, std::string_view tab_title) const
{
    for (size_t i = 0; i < calls_.size(); ++i) {
        if (calls_[i].operation == operation and calls_[i].tab_title == tab_title) {
            return i;
        }
    }
    return std::nullopt;
}

std::optional<size_t> tabdock::testing::RecordingTabViewer::last_index_of(std::string_view operation, std::string_view tab_title) const
{
    for (size_t i = calls_.size(); i-- > 0;) {
        if (calls_[i].operation == operation and calls_[i].tab_title == tab_title) {
            return i;
        }
    }
    return std::nullopt;
}

std::optional<TabButtonResponse> tabdock::testing::RecordingTabViewer::last_tab_button_response(std::string_view tab_title) const
{
    if (const auto it = last_tab_button_responses_.find(tab_title); it != last_tab_button_responses_.end()) {
        return it->second;
    }
    return std::nullopt;
}

void tabdock::testing::RecordingTabViewer::record(std::string_view operation, std::string_view tab_title) const
{
    calls_.push_back(ViewerCall{std::string{operation}, std::string{tab_title}});
}

std::string tabdock::testing::RecordingTabViewer::impl_title(TestTab& tab)
{
    record("title", tab.title);
    return tab.title;
}

void tabdock::testing::RecordingTabViewer::impl_on_draw(DrawContext& ctx, TestTab& tab)
{
    record("on_draw", tab.title);
    last_draw_context_ = ctx;
    ui::draw_text(tab.title);
}

void tabdock::testing::RecordingTabViewer::impl_on_draw_context_menu(DrawContext& ctx, TestTab& tab, SurfaceIndex, NodeIndex)
{
    record("on_draw_context_menu", tab.title);
    last_context_menu_context_ = ctx;
}

TabId tabdock::testing::RecordingTabViewer::impl_id(TestTab& tab)
{
    record("id", tab.title);
    return tab.custom_id ? *tab.custom_id : TabId::from_title(tab.title);
}

void tabdock::testing::RecordingTabViewer::impl_on_tab_button(TestTab& tab, const TabButtonResponse& response)
{
    record("on_tab_button", tab.title);
    last_tab_button_responses_.insert_or_assign(tab.title, response);
}

OnCloseResponse tabdock::testing::RecordingTabViewer::impl_on_close(TestTab& tab)
{
    record("on_close", tab.title);
    return tab.close_response;
}

bool tabdock::testing::RecordingTabViewer::impl_is_closeable(const TestTab& tab) const
{
    record("is_closeable", tab.title);
    return tab.closeable;
}

bool tabdock::testing::RecordingTabViewer::impl_force_close(TestTab& tab)
{
    record("force_close", tab.title);
    return tab.wants_force_close;
}

void tabdock::testing::RecordingTabViewer::impl_on_add(SurfaceIndex, NodeIndex)
{
    record("on_add", {});
}

void tabdock::testing::RecordingTabViewer::impl_on_rect_changed(TestTab& tab)
{
    record("on_rect_changed", tab.title);
}

void tabdock::testing::RecordingTabViewer::impl_on_draw_add_popup(DrawContext&, SurfaceIndex, NodeIndex)
{
    record("on_draw_add_popup", {});
}

std::optional<TabStyle> tabdock::testing::RecordingTabViewer::impl_tab_style_override(const TestTab& tab, const TabStyle&) const
{
    record("tab_style_override", tab.title);
    return tab.style_override;
}

bool tabdock::testing::RecordingTabViewer::impl_allowed_in_windows(TestTab& tab) const
{
    record("allowed_in_windows", tab.title);
    return tab.allowed_in_windows;
}

bool tabdock::testing::RecordingTabViewer::impl_clear_background(const TestTab& tab) const
{
    record("clear_background", tab.title);
    return tab.clear_background;
}

ScrollBars tabdock::testing::RecordingTabViewer::impl_scroll_bars(const TestTab& tab) const
{
    record("scroll_bars", tab.title);
    return tab.scroll_bars;
}

size_t tabdock::testing::CapturingLogSink::count(LogLevel level) const
{
    return static_cast<size_t>(std::ranges::count_if(messages_, [level](const LogMessage& message)
    {
        return message.level() == level;
    }));
}

void tabdock::testing::CapturingLogSink::impl_log_message(const LogMessageView& message)
{
    messages_.emplace_back(message);
}

tabdock::testing::ScopedLogCapture::ScopedLogCapture() :
    sink_{std::make_shared<CapturingLogSink>()}
{
    global_default_logger()->sinks().push_back(sink_);
}

tabdock::testing::ScopedLogCapture::~ScopedLogCapture() noexcept
{
    std::erase(global_default_logger()->sinks(), sink_);
}

Vec2 tabdock::testing::close_button_center(const Rect& ui_rect)
{
    const Vec2 padding = ui::get_style_frame_padding();
    const float button_size = ui::get_font_base_size();
    return {
        ui_rect.max_corner().x - padding.x - 0.5f*button_size,
        ui_rect.min_corner().y + padding.y + 0.5f*button_size,
    };
}

void tabdock::testing::HeadlessFrameDriver::draw_frame(const std::function<void()>& draw)
{
    context_.on_start_new_frame(display_size_);
    ui::set_next_panel_ui_position({0.0f, 0.0f});
    ui::set_next_panel_size(display_size_);
    if (ui::begin_panel("##testtabdock", nullptr, {ui::PanelFlag::NoDecoration, ui::PanelFlag::NoSavedSettings, ui::PanelFlag::NoMove})) {
        draw();
    }
    ui::end_panel();
    context_.render();
}

void tabdock::testing::HeadlessFrameDriver::draw_frames(size_t n, const std::function<void()>& draw)
{
    for (size_t i = 0; i < n; ++i) {
        draw_frame(draw);
    }
}

void tabdock::testing::HeadlessFrameDriver::click(Vec2 ui_position, ui::MouseButton button, const std::function<void()>& draw)
{
    context_.on_mouse_move(ui_position);
    draw_frames(2, draw);  // hover, then let overlapping items (e.g. close buttons) take the hover
    context_.on_mouse_button(button, true);
    draw_frame(draw);
    context_.on_mouse_button(button, false);
    draw_frame(draw);
}
