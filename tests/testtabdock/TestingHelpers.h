#pragma once

#include <libtabdock/Dock/DrawContext.h>
#include <libtabdock/Dock/NodeIndex.h>
#include <libtabdock/Dock/OnCloseResponse.h>
#include <libtabdock/Dock/ScrollBars.h>
#include <libtabdock/Dock/SurfaceIndex.h>
#include <libtabdock/Dock/TabButtonResponse.h>
#include <libtabdock/Dock/TabId.h>
#include <libtabdock/Dock/TabStyle.h>
#include <libtabdock/Dock/TabViewer.h>
#include <libtabdock/Maths/Rect.h>
#include <libtabdock/Maths/Vec2.h>
#include <libtabdock/Platform/LogLevel.h>
#include <libtabdock/Platform/LogMessage.h>
#include <libtabdock/Platform/LogSink.h>
#include <libtabdock/UI/tabdockimgui.h>

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tabdock::testing
{
    // a tab whose behavior is entirely driven by its fields
    struct TestTab final {
        explicit TestTab(std::string title_) : title{std::move(title_)} {}

        friend bool operator==(const TestTab&, const TestTab&) = default;

        std::string title;
        std::optional<TabId> custom_id;
        bool closeable = true;
        OnCloseResponse close_response = OnCloseResponse::Close;
        bool wants_force_close = false;
        bool allowed_in_windows = true;
        bool clear_background = true;
        ScrollBars scroll_bars;
        std::optional<TabStyle> style_override;
    };

    // a single call made by the host into a `RecordingTabViewer`
    struct ViewerCall final {
        friend bool operator==(const ViewerCall&, const ViewerCall&) = default;

        std::string operation;
        std::string tab_title;  // empty for location-only operations (e.g. `on_add`)
    };

    // a `TabViewer` that answers from each `TestTab`'s fields and records every call
    class RecordingTabViewer final : public TabViewer<TestTab> {
    public:
        const std::vector<ViewerCall>& calls() const { return calls_; }
        void clear_calls() { calls_.clear(); }

        size_t count(std::string_view operation, std::string_view tab_title) const;
        size_t count(std::string_view operation) const;

        // Returns the index of the first matching call, if any.
        std::optional<size_t> index_of(std::string_view operation, std::string_view tab_title) const;

        // Returns the index of the last matching call, if any.
        std::optional<size_t> last_index_of(std::string_view operation, std::string_view tab_title) const;

        // the `DrawContext` most recently passed into `on_draw`
        const std::optional<DrawContext>& last_draw_context() const { return last_draw_context_; }

        // the `DrawContext` most recently passed into `on_draw_context_menu`
        const std::optional<DrawContext>& last_context_menu_context() const { return last_context_menu_context_; }

        // the response most recently passed into `on_tab_button` for the tab with the given title
        std::optional<TabButtonResponse> last_tab_button_response(std::string_view tab_title) const;

    private:
        void record(std::string_view operation, std::string_view tab_title) const;

        std::string impl_title(TestTab&) final;
        void impl_on_draw(DrawContext&, TestTab&) final;
        void impl_on_draw_context_menu(DrawContext&, TestTab&, SurfaceIndex, NodeIndex) final;
        TabId impl_id(TestTab&) final;
        void impl_on_tab_button(TestTab&, const TabButtonResponse&) final;
        OnCloseResponse impl_on_close(TestTab&) final;
        bool impl_is_closeable(const TestTab&) const final;
        bool impl_force_close(TestTab&) final;
        void impl_on_add(SurfaceIndex, NodeIndex) final;
        void impl_on_rect_changed(TestTab&) final;
        void impl_on_draw_add_popup(DrawContext&, SurfaceIndex, NodeIndex) final;
        std::optional<TabStyle> impl_tab_style_override(const TestTab&, const TabStyle&) const final;
        bool impl_allowed_in_windows(TestTab&) const final;
        bool impl_clear_background(const TestTab&) const final;
        ScrollBars impl_scroll_bars(const TestTab&) const final;

        mutable std::vector<ViewerCall> calls_;
        std::optional<DrawContext> last_draw_context_;
        std::optional<DrawContext> last_context_menu_context_;
        std::map<std::string, TabButtonResponse, std::less<>> last_tab_button_responses_;
    };

    // a log sink that keeps every message it receives
    class CapturingLogSink final : public LogSink {
    public:
        const std::vector<LogMessage>& messages() const { return messages_; }
        size_t count(LogLevel) const;
    private:
        void impl_log_message(const LogMessageView&) final;

        std::vector<LogMessage> messages_;
    };

    // attaches a `CapturingLogSink` to the global logger for its lifetime
    class ScopedLogCapture final {
    public:
        ScopedLogCapture();
        ScopedLogCapture(const ScopedLogCapture&) = delete;
        ScopedLogCapture(ScopedLogCapture&&) noexcept = delete;
        ScopedLogCapture& operator=(const ScopedLogCapture&) = delete;
        ScopedLogCapture& operator=(ScopedLogCapture&&) noexcept = delete;
        ~ScopedLogCapture() noexcept;

        const CapturingLogSink& sink() const { return *sink_; }
    private:
        std::shared_ptr<CapturingLogSink> sink_;
    };

    // Returns the center of the close button that the UI draws at the right
    // edge of a tab, or of a panel's title bar, that occupies `ui_rect`.
    Vec2 close_button_center(const Rect& ui_rect);

    // drives a headless `ui::Context` one frame at a time, calling the given
    // function from within a full-screen panel
    class HeadlessFrameDriver final {
    public:
        explicit HeadlessFrameDriver(Vec2 display_size = {1024.0f, 768.0f}) : display_size_{display_size} {}

        void draw_frame(const std::function<void()>&);
        void draw_frames(size_t n, const std::function<void()>&);

        // Moves the mouse to `ui_position` and then presses and releases `button` there,
        // drawing frames in between so that the UI sees a hover followed by a click.
        void click(Vec2 ui_position, ui::MouseButton button, const std::function<void()>&);
    private:
        ui::Context context_;
        Vec2 display_size_;
    };
}
