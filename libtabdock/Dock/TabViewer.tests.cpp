#include "TabViewer.h"

#include <libtabdock/Dock/DrawContext.h>
#include <libtabdock/Dock/OnCloseResponse.h>
#include <libtabdock/Dock/ScrollBars.h>
#include <libtabdock/Dock/TabId.h>
#include <libtabdock/Dock/TabStyle.h>
#include <libtabdock/Graphics/Color.h>
#include <libtabdock/Maths/Rect.h>

#include <gtest/gtest.h>

#include <optional>
#include <string>

using namespace tabdock;

namespace
{
    struct Document final {
        std::string name;
        int num_draws = 0;
    };

    // only implements what a `TabViewer` requires
    class MinimalViewer final : public TabViewer<Document> {
    private:
        std::string impl_title(Document& doc) final { return doc.name; }
        void impl_on_draw(DrawContext&, Document& doc) final { ++doc.num_draws; }
    };

    class ReadOnlyViewer final : public TabViewer<Document> {
    private:
        std::string impl_title(Document& doc) final { return doc.name; }
        void impl_on_draw(DrawContext&, Document&) final {}
        TabId impl_id(Document&) final { return TabId{42}; }
        OnCloseResponse impl_on_close(Document&) final { return OnCloseResponse::Focus; }
        bool impl_is_closeable(const Document& doc) const final { return doc.name != "Readme"; }
        ScrollBars impl_scroll_bars(const Document& doc) const final
        {
            return doc.name == "Readme" ? ScrollBars{false, false} : ScrollBars{};
        }
        std::optional<TabStyle> impl_tab_style_override(const Document& doc, const TabStyle& global_style) const final
        {
            if (doc.name != "Readme") {
                return std::nullopt;
            }
            TabStyle rv = global_style;
            rv.text_color = Color::black();
            return rv;
        }
    };
}

TEST(TabViewer, on_draw_forwards_to_the_implementation)
{
    MinimalViewer viewer;
    Document doc{"Settings"};
    DrawContext ctx{Rect::from_corners({0.0f, 0.0f}, {100.0f, 100.0f})};

    viewer.on_draw(ctx, doc);
    viewer.on_draw(ctx, doc);

    ASSERT_EQ(doc.num_draws, 2);
}

TEST(TabViewer, defaults_are_as_documented)
{
    MinimalViewer viewer;
    Document doc{"Settings"};

    ASSERT_EQ(viewer.on_close(doc), OnCloseResponse::Close);
    ASSERT_TRUE(viewer.is_closeable(doc));
    ASSERT_FALSE(viewer.force_close(doc));
    ASSERT_TRUE(viewer.allowed_in_windows(doc));
    ASSERT_TRUE(viewer.clear_background(doc));
    ASSERT_EQ(viewer.scroll_bars(doc), (ScrollBars{true, true}));
    ASSERT_FALSE(viewer.tab_style_override(doc, TabStyle{}).has_value());
}

TEST(TabViewer, default_no_op_operations_do_not_touch_the_tab)
{
    MinimalViewer viewer;
    Document doc{"Settings"};
    DrawContext ctx{Rect{}};

    viewer.on_draw_context_menu(ctx, doc, main_surface_index(), NodeIndex{0});
    viewer.on_tab_button(doc, TabButtonResponse{});
    viewer.on_rect_changed(doc);
    viewer.on_add(main_surface_index(), NodeIndex{0});
    viewer.on_draw_add_popup(ctx, main_surface_index(), NodeIndex{0});

    ASSERT_EQ(doc.name, "Settings");
    ASSERT_EQ(doc.num_draws, 0);
}

TEST(TabViewer, default_id_is_derived_from_the_title)
{
    MinimalViewer viewer;
    Document doc{"Settings"};

    ASSERT_EQ(viewer.id(doc), TabId::from_title("Settings"));
}

TEST(TabViewer, default_id_is_a_pure_function_of_the_title)
{
    MinimalViewer viewer;
    Document a{"Settings", 0};
    Document b{"Settings", 7};
    Document c{"Console"};

    ASSERT_EQ(viewer.id(a), viewer.id(b));
    ASSERT_NE(viewer.id(a), viewer.id(c));
}

TEST(TabViewer, default_id_is_stable_across_calls)
{
    MinimalViewer viewer;
    Document doc{"Settings"};

    const TabId first = viewer.id(doc);
    for (int i = 0; i < 10; ++i) {
        ASSERT_EQ(viewer.id(doc), first);
    }
}

TEST(TabViewer, overridden_operations_are_used_instead_of_defaults)
{
    ReadOnlyViewer viewer;
    Document readme{"Readme"};
    Document notes{"Notes"};

    ASSERT_EQ(viewer.id(readme), TabId{42});
    ASSERT_EQ(viewer.on_close(readme), OnCloseResponse::Focus);
    ASSERT_FALSE(viewer.is_closeable(readme));
    ASSERT_TRUE(viewer.is_closeable(notes));
}

TEST(TabViewer, scroll_bar_override_only_affects_the_overridden_tab)
{
    ReadOnlyViewer viewer;
    Document readme{"Readme"};
    Document notes{"Notes"};

    ASSERT_EQ(viewer.scroll_bars(readme), (ScrollBars{false, false}));
    ASSERT_EQ(viewer.scroll_bars(notes), (ScrollBars{true, true}));
}

TEST(resolve_tab_style, returns_the_global_style_when_there_is_no_override)
{
    MinimalViewer viewer;
    Document doc{"Settings"};
    TabStyle global_style;
    global_style.rounding = 9.0f;
    global_style.bg_fill = Color{0.5f, 0.25f, 0.125f};

    ASSERT_EQ(resolve_tab_style(viewer, doc, global_style), global_style);
}

TEST(resolve_tab_style, returns_the_override_when_the_viewer_supplies_one)
{
    ReadOnlyViewer viewer;
    Document readme{"Readme"};
    Document notes{"Notes"};
    const TabStyle global_style;

    const TabStyle readme_style = resolve_tab_style(viewer, readme, global_style);
    ASSERT_EQ(readme_style.text_color, Color::black());
    ASSERT_EQ(readme_style.rounding, global_style.rounding);

    ASSERT_EQ(resolve_tab_style(viewer, notes, global_style), global_style);
}
