#include "tabdockimgui.h"

#include <libtabdock/Graphics/Color.h>
#include <libtabdock/Maths/Rect.h>
#include <libtabdock/Maths/Vec2.h>
#include <libtabdock/Utils/CStringView.h>
#include <libtabdock/Utils/Flags.h>

#define IM_VEC4_CLASS_EXTRA                                                     \
        ImVec4(const tabdock::Color& v) { x = v.r; y = v.g; z = v.b; w = v.a; } \
        operator tabdock::Color() const { return tabdock::Color{x, y, z, w}; }

#define IM_VEC2_CLASS_EXTRA                                                     \
        ImVec2(const tabdock::Vec2& f) { x = f.x; y = f.y; }                    \
        operator tabdock::Vec2() const { return tabdock::Vec2(x, y); }
#include <imgui.h>

#include <array>
#include <bit>
#include <cstdarg>
#include <cstddef>
#include <initializer_list>
#include <stdexcept>
#include <string_view>
#include <type_traits>
#include <utility>

using namespace tabdock;

namespace
{
    // maps each bit of a `tabdock` flag enum onto the equivalent ImGui flag(s)
    template<typename SourceFlagType, typename DestinationImGuiFlagsType>
    class FlagMapper {
    public:
        static constexpr size_t num_flags = static_cast<size_t>(SourceFlagType::NUM_FLAGS);

        constexpr FlagMapper(std::initializer_list<std::pair<SourceFlagType, DestinationImGuiFlagsType>> mappings)
        {
            if (mappings.size() != num_flags) {
                throw std::runtime_error{"invalid number of flags passed to a FlagMapper"};
            }

            for (const auto& [source_flag, destination_flag] : mappings) {
                const auto source_index = std::countr_zero(static_cast<std::underlying_type_t<SourceFlagType>>(source_flag));
                lut_[source_index] = destination_flag;
            }
        }

        constexpr DestinationImGuiFlagsType operator()(Flags<SourceFlagType> flags) const
        {
            static_assert(std::is_unsigned_v<std::underlying_type_t<SourceFlagType>>);

            DestinationImGuiFlagsType rv{};
            for (auto v = flags.underlying_value(); v;) {
                const auto index = std::countr_zero(v);
                rv |= lut_[index];
                v ^= decltype(v){1} << index;
            }
            return rv;
        }
    private:
        std::array<DestinationImGuiFlagsType, num_flags> lut_{};
    };

    constexpr FlagMapper<ui::PanelFlag, ImGuiWindowFlags> c_panel_flag_mappings = {
        {ui::PanelFlag::NoMove,              ImGuiWindowFlags_NoMove},
        {ui::PanelFlag::NoTitleBar,          ImGuiWindowFlags_NoTitleBar},
        {ui::PanelFlag::NoResize,            ImGuiWindowFlags_NoResize},
        {ui::PanelFlag::NoSavedSettings,     ImGuiWindowFlags_NoSavedSettings},
        {ui::PanelFlag::NoScrollbar,         ImGuiWindowFlags_NoScrollbar},
        {ui::PanelFlag::NoScrollWithMouse,   ImGuiWindowFlags_NoScrollWithMouse},
        {ui::PanelFlag::NoBackground,        ImGuiWindowFlags_NoBackground},
        {ui::PanelFlag::NoCollapse,          ImGuiWindowFlags_NoCollapse},
        {ui::PanelFlag::NoDecoration,        ImGuiWindowFlags_NoDecoration},
        {ui::PanelFlag::HorizontalScrollbar, ImGuiWindowFlags_HorizontalScrollbar},
    };

    constexpr FlagMapper<ui::ChildPanelFlag, ImGuiChildFlags> c_child_panel_flag_mappings = {
        {ui::ChildPanelFlag::Border,      ImGuiChildFlags_Border},
        {ui::ChildPanelFlag::AutoResizeY, ImGuiChildFlags_AutoResizeY},
    };

    constexpr FlagMapper<ui::TabBarFlag, ImGuiTabBarFlags> c_tab_bar_flag_mappings = {
        {ui::TabBarFlag::NoTooltip,           ImGuiTabBarFlags_NoTooltip},
        {ui::TabBarFlag::FittingPolicyScroll, ImGuiTabBarFlags_FittingPolicyScroll},
    };

    constexpr FlagMapper<ui::TabItemFlag, ImGuiTabItemFlags> c_tab_item_flag_mappings = {
        {ui::TabItemFlag::NoReorder,     ImGuiTabItemFlags_NoReorder},
        {ui::TabItemFlag::NoCloseButton, ImGuiTabItemFlags_NoCloseButton},
        {ui::TabItemFlag::SetSelected,   ImGuiTabItemFlags_SetSelected},
        {ui::TabItemFlag::NoTooltip,     ImGuiTabItemFlags_NoTooltip},
    };

    constexpr FlagMapper<ui::HoveredFlag, ImGuiHoveredFlags> c_hovered_flag_mappings = {
        {ui::HoveredFlag::AllowWhenBlockedByPopup,      ImGuiHoveredFlags_AllowWhenBlockedByPopup},
        {ui::HoveredFlag::AllowWhenBlockedByActiveItem, ImGuiHoveredFlags_AllowWhenBlockedByActiveItem},
        {ui::HoveredFlag::ChildPanels,                  ImGuiHoveredFlags_ChildWindows},
    };

    constexpr FlagMapper<ui::PopupFlag, ImGuiPopupFlags> c_popup_flag_mappings = {
        {ui::PopupFlag::MouseButtonLeft,   ImGuiPopupFlags_MouseButtonLeft},
        {ui::PopupFlag::MouseButtonRight,  ImGuiPopupFlags_MouseButtonRight},
        {ui::PopupFlag::MouseButtonMiddle, ImGuiPopupFlags_MouseButtonMiddle},
    };

    ImGuiMouseButton to_imgui(ui::MouseButton button)
    {
        static_assert(static_cast<int>(ui::MouseButton::NUM_OPTIONS) == 3);

        switch (button) {
        case ui::MouseButton::Left:   return ImGuiMouseButton_Left;
        case ui::MouseButton::Right:  return ImGuiMouseButton_Right;
        case ui::MouseButton::Middle: return ImGuiMouseButton_Middle;
        default:                      return ImGuiMouseButton_Left;
        }
    }

    ImGuiCond to_imgui(ui::Conditional conditional)
    {
        static_assert(static_cast<int>(ui::Conditional::NUM_OPTIONS) == 3);

        switch (conditional) {
        case ui::Conditional::Always:    return ImGuiCond_Always;
        case ui::Conditional::Once:      return ImGuiCond_Once;
        case ui::Conditional::Appearing: return ImGuiCond_Appearing;
        default:                         return ImGuiCond_Always;
        }
    }

    ImGuiCol to_imgui(ui::ColorVar color_var)
    {
        static_assert(static_cast<int>(ui::ColorVar::NUM_OPTIONS) == 5);

        switch (color_var) {
        case ui::ColorVar::Text:       return ImGuiCol_Text;
        case ui::ColorVar::Tab:        return ImGuiCol_Tab;
        case ui::ColorVar::TabHovered: return ImGuiCol_TabHovered;
        case ui::ColorVar::TabActive:  return ImGuiCol_TabActive;
        case ui::ColorVar::ChildBg:    return ImGuiCol_ChildBg;
        default:                       return ImGuiCol_Text;
        }
    }

    ImGuiStyleVar to_imgui(ui::StyleVar style_var)
    {
        static_assert(static_cast<int>(ui::StyleVar::NUM_OPTIONS) == 1);

        switch (style_var) {
        case ui::StyleVar::TabRounding: return ImGuiStyleVar_TabRounding;
        default:                        return ImGuiStyleVar_TabRounding;
        }
    }

    ImU32 to_ImU32(const Color& color)
    {
        return ImGui::ColorConvertFloat4ToU32(ImVec4{color});
    }
}

tabdock::ui::Context::Context()
{
    IMGUI_CHECKVERSION();
    ImGui::CreateContext();

    ImGuiIO& io = ImGui::GetIO();
    io.IniFilename = nullptr;  // layout is owned by the caller's `DockState`, not an ini file
    io.LogFilename = nullptr;

    // build the font atlas up-front: `NewFrame` requires it, even when nothing is rendered
    unsigned char* pixel_data = nullptr;
    int width = 0;
    int height = 0;
    io.Fonts->GetTexDataAsRGBA32(&pixel_data, &width, &height);
}

tabdock::ui::Context::~Context() noexcept
{
    ImGui::DestroyContext();
}

void tabdock::ui::Context::on_start_new_frame(Vec2 display_size, float delta_time)
{
    ImGuiIO& io = ImGui::GetIO();
    io.DisplaySize = display_size;
    io.DeltaTime = delta_time > 0.0f ? delta_time : 1.0f/60.0f;
    ImGui::NewFrame();
}

void tabdock::ui::Context::render()
{
    ImGui::Render();
}

void tabdock::ui::Context::on_mouse_move(Vec2 ui_position)
{
    ImGui::GetIO().AddMousePosEvent(ui_position.x, ui_position.y);
}

void tabdock::ui::Context::on_mouse_button(MouseButton button, bool is_down)
{
    ImGui::GetIO().AddMouseButtonEvent(to_imgui(button), is_down);
}

bool tabdock::ui::begin_panel(CStringView name, bool* p_open, PanelFlags flags)
{
    return ImGui::Begin(name.c_str(), p_open, c_panel_flag_mappings(flags));
}

void tabdock::ui::end_panel()
{
    ImGui::End();
}

void tabdock::ui::set_next_panel_ui_position(Vec2 position, Conditional conditional)
{
    ImGui::SetNextWindowPos(position, to_imgui(conditional));
}

void tabdock::ui::set_next_panel_size(Vec2 size, Conditional conditional)
{
    ImGui::SetNextWindowSize(size, to_imgui(conditional));
}

bool tabdock::ui::begin_child_panel(CStringView str_id, const Vec2& size, ChildPanelFlags child_flags, PanelFlags panel_flags)
{
    return ImGui::BeginChild(str_id.c_str(), size, c_child_panel_flag_mappings(child_flags), c_panel_flag_mappings(panel_flags));
}

void tabdock::ui::end_child_panel()
{
    ImGui::EndChild();
}

bool tabdock::ui::begin_tab_bar(CStringView str_id, TabBarFlags flags)
{
    return ImGui::BeginTabBar(str_id.c_str(), c_tab_bar_flag_mappings(flags));
}

void tabdock::ui::end_tab_bar()
{
    ImGui::EndTabBar();
}

bool tabdock::ui::begin_tab_item(CStringView label, bool* p_open, TabItemFlags flags)
{
    return ImGui::BeginTabItem(label.c_str(), p_open, c_tab_item_flag_mappings(flags));
}

void tabdock::ui::end_tab_item()
{
    ImGui::EndTabItem();
}

bool tabdock::ui::draw_tab_item_button(CStringView label)
{
    return ImGui::TabItemButton(label.c_str());
}

void tabdock::ui::push_id(int id)
{
    ImGui::PushID(id);
}

void tabdock::ui::push_id(std::string_view str_id)
{
    ImGui::PushID(str_id.data(), str_id.data() + str_id.size());
}

void tabdock::ui::push_id(const void* ptr_id)
{
    ImGui::PushID(ptr_id);
}

void tabdock::ui::push_id_from_hash(size_t hash)
{
    const auto* begin = reinterpret_cast<const char*>(&hash);
    ImGui::PushID(begin, begin + sizeof(hash));
}

void tabdock::ui::pop_id()
{
    ImGui::PopID();
}

bool tabdock::ui::is_item_clicked(MouseButton mouse_button)
{
    return ImGui::IsItemClicked(to_imgui(mouse_button));
}

bool tabdock::ui::is_item_hovered(HoveredFlags flags)
{
    return ImGui::IsItemHovered(c_hovered_flag_mappings(flags));
}

bool tabdock::ui::is_panel_hovered(HoveredFlags flags)
{
    return ImGui::IsWindowHovered(c_hovered_flag_mappings(flags));
}

bool tabdock::ui::is_mouse_clicked(MouseButton mouse_button)
{
    return ImGui::IsMouseClicked(to_imgui(mouse_button));
}

bool tabdock::ui::is_mouse_double_clicked(MouseButton mouse_button)
{
    return ImGui::IsMouseDoubleClicked(to_imgui(mouse_button));
}

Rect tabdock::ui::get_item_ui_rect()
{
    return Rect::from_corners(ImGui::GetItemRectMin(), ImGui::GetItemRectMax());
}

void tabdock::ui::open_popup(CStringView str_id)
{
    ImGui::OpenPopup(str_id.c_str());
}

bool tabdock::ui::begin_popup(CStringView str_id)
{
    return ImGui::BeginPopup(str_id.c_str());
}

bool tabdock::ui::begin_popup_context_menu(CStringView str_id, PopupFlags popup_flags)
{
    return ImGui::BeginPopupContextItem(str_id.c_str(), c_popup_flag_mappings(popup_flags));
}

void tabdock::ui::end_popup()
{
    ImGui::EndPopup();
}

bool tabdock::ui::draw_menu_item(CStringView label, bool enabled)
{
    return ImGui::MenuItem(label.c_str(), nullptr, false, enabled);
}

void tabdock::ui::draw_separator()
{
    ImGui::Separator();
}

void tabdock::ui::draw_text(CStringView text)
{
    ImGui::TextUnformatted(text.c_str(), text.c_str() + text.size());
}

void tabdock::ui::detail::set_tooltip_v(CStringView fmt, va_list args)
{
    ImGui::SetTooltipV(fmt.c_str(), args);
}

void tabdock::ui::same_line(float offset_from_start_x, float spacing)
{
    ImGui::SameLine(offset_from_start_x, spacing);
}

Vec2 tabdock::ui::get_content_region_available()
{
    return ImGui::GetContentRegionAvail();
}

Vec2 tabdock::ui::get_cursor_ui_position()
{
    return ImGui::GetCursorScreenPos();
}

Vec2 tabdock::ui::get_style_item_spacing()
{
    return ImGui::GetStyle().ItemSpacing;
}

Vec2 tabdock::ui::get_style_item_inner_spacing()
{
    return ImGui::GetStyle().ItemInnerSpacing;
}

Vec2 tabdock::ui::get_style_frame_padding()
{
    return ImGui::GetStyle().FramePadding;
}

float tabdock::ui::get_font_base_size()
{
    return ImGui::GetFontSize();
}

void tabdock::ui::push_style_color(ColorVar color_var, const Color& color)
{
    ImGui::PushStyleColor(to_imgui(color_var), ImVec4{color});
}

void tabdock::ui::pop_style_color(int count)
{
    ImGui::PopStyleColor(count);
}

void tabdock::ui::push_style_var(StyleVar style_var, float value)
{
    ImGui::PushStyleVar(to_imgui(style_var), value);
}

void tabdock::ui::pop_style_var(int count)
{
    ImGui::PopStyleVar(count);
}

void tabdock::ui::draw_rect_filled(const Rect& rect, const Color& color)
{
    ImGui::GetWindowDrawList()->AddRectFilled(rect.min_corner(), rect.max_corner(), to_ImU32(color));
}
