#pragma once

#include <libtabdock/Dock/Node.h>
#include <libtabdock/Dock/NodeIndex.h>
#include <libtabdock/Maths/Vec2.h>

#include <algorithm>
#include <cstddef>
#include <optional>
#include <span>
#include <stdexcept>
#include <utility>
#include <vector>

namespace tabdock
{
    enum class SurfaceKind {
        Main,
        Window,
        NUM_OPTIONS,
    };

    // placement of a window surface, as requested by the caller
    struct WindowPlacement final {
        std::optional<Vec2> position;
        std::optional<Vec2> size;
    };

    // a top-level docking region: either the main area or a floating window
    //
    // holds one or more leaf `Node`s, which the host lays out side by side
    template<typename TTab>
    class Surface final {
    public:
        static Surface main(std::vector<TTab> tabs = {})
        {
            return Surface{SurfaceKind::Main, Node<TTab>{std::move(tabs)}, {}};
        }

        static Surface window(std::vector<TTab> tabs, WindowPlacement placement = {})
        {
            return Surface{SurfaceKind::Window, Node<TTab>{std::move(tabs)}, placement};
        }

        SurfaceKind kind() const { return kind_; }
        bool is_main() const { return kind_ == SurfaceKind::Main; }
        const WindowPlacement& placement() const { return placement_; }

        size_t num_nodes() const { return nodes_.size(); }
        std::span<Node<TTab>> upd_nodes() { return nodes_; }
        std::span<const Node<TTab>> nodes() const { return nodes_; }

        Node<TTab>* try_upd_node(NodeIndex index)
        {
            return index.get() < nodes_.size() ? &nodes_[index.get()] : nullptr;
        }

        const Node<TTab>* find_node(NodeIndex index) const
        {
            return index.get() < nodes_.size() ? &nodes_[index.get()] : nullptr;
        }

        Node<TTab>& upd_node(NodeIndex index)
        {
            if (index.get() >= nodes_.size()) {
                throw std::out_of_range{"tried to access a node index that is out of range"};
            }
            return nodes_[index.get()];
        }

        const Node<TTab>& get_node(NodeIndex index) const
        {
            if (index.get() >= nodes_.size()) {
                throw std::out_of_range{"tried to access a node index that is out of range"};
            }
            return nodes_[index.get()];
        }

        NodeIndex add_node(Node<TTab> node)
        {
            nodes_.push_back(std::move(node));
            return NodeIndex{nodes_.size() - 1};
        }

        bool has_no_tabs() const
        {
            return std::ranges::all_of(nodes_, [](const Node<TTab>& node) { return node.empty(); });
        }

        size_t num_tabs() const
        {
            size_t rv = 0;
            for (const Node<TTab>& node : nodes_) {
                rv += node.num_tabs();
            }
            return rv;
        }

    private:
        Surface(SurfaceKind kind, Node<TTab> first_node, WindowPlacement placement) :
            kind_{kind},
            placement_{placement}
        {
            nodes_.push_back(std::move(first_node));
        }

        SurfaceKind kind_;
        WindowPlacement placement_;
        std::vector<Node<TTab>> nodes_;
    };
}
