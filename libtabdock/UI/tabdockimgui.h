#pragma once

#include <libtabdock/Graphics/Color.h>
#include <libtabdock/Maths/Rect.h>
#include <libtabdock/Maths/Vec2.h>
#include <libtabdock/Utils/CStringView.h>
#include <libtabdock/Utils/Flags.h>

#include <cstdarg>
#include <cstddef>
#include <string_view>

// immediate-mode UI API
//
// a thin wrapper over Dear ImGui, so that the rest of the library (and
// downstream `TabViewer` implementations) talk in terms of `tabdock` types
namespace tabdock::ui
{
    enum class MouseButton {
        Left,
        Right,
        Middle,
        NUM_OPTIONS,
    };

    // Represents the top-level UI context that `ui::` functions talk to.
    //
    // The context doesn't own a platform window or a renderer: callers feed
    // it a display size each frame and do whatever they like with the draw
    // data afterwards, which also makes it usable headlessly (e.g. in tests).
    class Context final {
    public:
        Context();
        Context(const Context&) = delete;
        Context(Context&&) noexcept = delete;
        Context& operator=(const Context&) = delete;
        Context& operator=(Context&&) noexcept = delete;
        ~Context() noexcept;

        // Should be called at the start of each frame.
        void on_start_new_frame(Vec2 display_size, float delta_time = 1.0f/60.0f);

        // Should be called at the end of each frame.
        void render();

        // Queue mouse input (ui space, device-independent pixels) for the next frame.
        void on_mouse_move(Vec2 ui_position);
        void on_mouse_button(MouseButton, bool is_down);
    };

    enum class Conditional {
        Always,
        Once,
        Appearing,
        NUM_OPTIONS,
    };

    enum class PanelFlag : unsigned {
        None                = 0,
        NoMove              = 1<<0,
        NoTitleBar          = 1<<1,
        NoResize            = 1<<2,
        NoSavedSettings     = 1<<3,
        NoScrollbar         = 1<<4,
        NoScrollWithMouse   = 1<<5,
        NoBackground        = 1<<6,
        NoCollapse          = 1<<7,
        NoDecoration        = 1<<8,
        HorizontalScrollbar = 1<<9,
        NUM_FLAGS           =   10,
    };
    using PanelFlags = Flags<PanelFlag>;

    bool begin_panel(CStringView name, bool* p_open = nullptr, PanelFlags = {});
    void end_panel();

    void set_next_panel_ui_position(Vec2, Conditional = Conditional::Always);
    void set_next_panel_size(Vec2, Conditional = Conditional::Always);

    enum class ChildPanelFlag : unsigned {
        None        = 0,
        Border      = 1<<0,
        AutoResizeY = 1<<1,  // height follows the content, so no vertical scrolling happens
        NUM_FLAGS   =    2,
    };
    using ChildPanelFlags = Flags<ChildPanelFlag>;

    // Begins a child panel within a parent panel with the given ID, device-independent pixel size, and flags.
    bool begin_child_panel(CStringView str_id, const Vec2& size = {}, ChildPanelFlags child_flags = {}, PanelFlags panel_flags = {});
    void end_child_panel();

    enum class TabBarFlag : unsigned {
        None                = 0,
        NoTooltip           = 1<<0,
        FittingPolicyScroll = 1<<1,
        NUM_FLAGS           =    2,
    };
    using TabBarFlags = Flags<TabBarFlag>;

    bool begin_tab_bar(CStringView str_id, TabBarFlags = {});
    void end_tab_bar();

    enum class TabItemFlag : unsigned {
        None          = 0,
        NoReorder     = 1<<0,
        NoCloseButton = 1<<1,
        SetSelected   = 1<<2,  // trigger flag to programmatically make the tab selected when calling `begin_tab_item`
        NoTooltip     = 1<<3,
        NUM_FLAGS     =    4,
    };
    using TabItemFlags = Flags<TabItemFlag>;

    // `p_open` is set to `false` when the user presses the tab's close button; passing
    // `nullptr` means the tab has no close button.
    bool begin_tab_item(CStringView label, bool* p_open = nullptr, TabItemFlags = {});
    void end_tab_item();

    bool draw_tab_item_button(CStringView label);

    void push_id(int);
    void push_id(std::string_view);
    void push_id(const void*);
    // pushes an ID derived from the bytes of a precomputed hash
    void push_id_from_hash(size_t);
    void pop_id();

    enum class HoveredFlag : unsigned {
        None                         = 0,
        AllowWhenBlockedByPopup      = 1<<0,
        AllowWhenBlockedByActiveItem = 1<<1,
        ChildPanels                  = 1<<2,
        NUM_FLAGS                    =    3,
    };
    using HoveredFlags = Flags<HoveredFlag>;

    bool is_item_clicked(MouseButton = MouseButton::Left);
    bool is_item_hovered(HoveredFlags = {});
    bool is_panel_hovered(HoveredFlags = {});
    bool is_mouse_clicked(MouseButton);
    bool is_mouse_double_clicked(MouseButton);

    // Returns the bounds of the last-drawn item in ui space.
    Rect get_item_ui_rect();

    enum class PopupFlag : unsigned {
        None              = 0,
        MouseButtonLeft   = 1<<0,
        MouseButtonRight  = 1<<1,
        MouseButtonMiddle = 1<<2,
        NUM_FLAGS         =    3,
    };
    using PopupFlags = Flags<PopupFlag>;

    void open_popup(CStringView str_id);
    bool begin_popup(CStringView str_id);
    // Begins a popup that opens when the last-drawn item is clicked with the given mouse button.
    bool begin_popup_context_menu(CStringView str_id, PopupFlags = PopupFlag::MouseButtonRight);
    void end_popup();

    bool draw_menu_item(CStringView label, bool enabled = true);
    void draw_separator();
    void draw_text(CStringView);

    namespace detail
    {
        void set_tooltip_v(CStringView fmt, va_list);
    }
    inline void set_tooltip(CStringView fmt, ...)
    {
        va_list args;
        va_start(args, fmt);
        detail::set_tooltip_v(fmt, args);
        va_end(args);
    }

    // Places the cursor on the same line as the previous item, with the given
    // offset/spacing in device-independent pixels.
    void same_line(float offset_from_start_x = 0.0f, float spacing = -1.0f);

    // Returns the size of the content region that's available from the current
    // cursor position within the current panel in device-independent pixels.
    Vec2 get_content_region_available();

    // Returns the current position of the panel cursor in ui space in device-independent pixels.
    Vec2 get_cursor_ui_position();

    Vec2 get_style_item_spacing();
    Vec2 get_style_item_inner_spacing();
    Vec2 get_style_frame_padding();

    // Returns the height of the current font in device-independent pixels.
    float get_font_base_size();

    enum class ColorVar {
        Text,
        Tab,
        TabHovered,
        TabActive,
        ChildBg,
        NUM_OPTIONS,
    };

    void push_style_color(ColorVar, const Color&);
    void pop_style_color(int count = 1);

    enum class StyleVar {
        TabRounding,
        NUM_OPTIONS,
    };

    void push_style_var(StyleVar, float);
    void pop_style_var(int count = 1);

    // Fills `rect` (ui space) with `color` in the current panel's draw list.
    void draw_rect_filled(const Rect&, const Color&);
}
