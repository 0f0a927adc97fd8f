// frontend/include/specdoc/ast/Nodes.hpp
#pragma once
#include <specdoc/text/Span.hpp>

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>


namespace specdoc::ast {

    // --------------------
    // Node Ids
    // --------------------
    using NodeId = uint32_t;
    inline constexpr NodeId k_invalid_node = 0xFFFF'FFFFu;

    inline constexpr uint32_t k_no_offset = 0xFFFF'FFFFu;

    // --------------------
    // Node kinds
    // --------------------
    enum class NodeKind : uint8_t {
        kDocument,

        // block
        kHeader,      // level, text
        kParagraph,
        kCodeBlock,   // lang(aux), content(text)
        kList,        // ordered
        kListItem,    // text = 첫 줄 내용
        kTaskItem,    // id(aux), checked, description(text)
        kBlankLine,   // leaf

        // inline
        kText,        // leaf
        kWikiLink,    // leaf. target(text), alias(aux), anchor(extra)
        kEmphasis,    // level: 1=em, 2=strong
        kCodeSpan,    // leaf. content(text)

        // 마커/들여쓰기/개행/fence 줄 등 구문 기호. leaf
        kMarkup,
    };

    constexpr std::string_view node_kind_name(NodeKind k) {
        switch (k) {
            case NodeKind::kDocument: return "Document";
            case NodeKind::kHeader: return "Header";
            case NodeKind::kParagraph: return "Paragraph";
            case NodeKind::kCodeBlock: return "CodeBlock";
            case NodeKind::kList: return "List";
            case NodeKind::kListItem: return "ListItem";
            case NodeKind::kTaskItem: return "TaskItem";
            case NodeKind::kBlankLine: return "BlankLine";
            case NodeKind::kText: return "Text";
            case NodeKind::kWikiLink: return "WikiLink";
            case NodeKind::kEmphasis: return "Emphasis";
            case NodeKind::kCodeSpan: return "CodeSpan";
            case NodeKind::kMarkup: return "Markup";
        }
        return "Unknown";
    }

    /// @brief leaf(원문 바이트를 직접 소유) 인지
    constexpr bool is_leaf(NodeKind k) {
        return k == NodeKind::kBlankLine || k == NodeKind::kText || k == NodeKind::kWikiLink ||
               k == NodeKind::kCodeSpan || k == NodeKind::kMarkup;
    }

    constexpr bool is_block(NodeKind k) {
        return k == NodeKind::kHeader || k == NodeKind::kParagraph || k == NodeKind::kCodeBlock ||
               k == NodeKind::kList || k == NodeKind::kBlankLine;
    }

    // 하나의 fat node. kind 별로 쓰는 필드가 다르다.
    struct Node {
        NodeKind kind = NodeKind::kText;
        Span span{};

        // children slice (NodeArena::children_)
        uint32_t child_begin = 0;
        uint32_t child_count = 0;

        // Header: 1..6 / Emphasis: 1(em) or 2(strong)
        uint8_t level = 0;

        // List
        bool ordered = false;

        // TaskItem
        bool checked = false;
        bool source_checked = false;   // 원문 checkbox 상태
        bool has_id = false;
        uint32_t mark_off = k_no_offset; // checkbox mark 바이트의 절대 오프셋

        // ListItem/TaskItem/List: marker 의 display column (0-based)
        uint32_t marker_col = 0;

        // kind 별 하위 구간 (원문 기준)
        Span text{};
        Span aux{};
        Span extra{};

        bool is_modified() const { return kind == NodeKind::kTaskItem && checked != source_checked; }
    };

    /// @brief 인덱스 기반 노드 저장소. 부모->자식은 children_ slice 로 표현한다.
    class NodeArena {
    public:
        NodeId add(const Node& n) {
            nodes_.push_back(n);
            return static_cast<NodeId>(nodes_.size() - 1);
        }

        /// @brief ids 를 children_ 뒤에 연속으로 붙이고 parent 의 slice 를 갱신한다.
        void set_children(NodeId parent, const std::vector<NodeId>& ids) {
            Node& p = nodes_[parent];
            p.child_begin = static_cast<uint32_t>(children_.size());
            p.child_count = static_cast<uint32_t>(ids.size());
            children_.insert(children_.end(), ids.begin(), ids.end());
        }

        const Node& node(NodeId id) const { return nodes_[id]; }
        Node& node_mut(NodeId id) { return nodes_[id]; }

        std::span<const NodeId> children(NodeId id) const {
            const Node& n = nodes_[id];
            if (n.child_count == 0 || n.child_begin + n.child_count > children_.size()) return {};
            return std::span<const NodeId>(children_.data() + n.child_begin, n.child_count);
        }

        bool valid(NodeId id) const { return id < nodes_.size(); }

        size_t size() const { return nodes_.size(); }
        size_t child_slots() const { return children_.size(); }

        const std::vector<Node>& nodes() const { return nodes_; }

        /// @brief id 를 루트로 하는 서브트리의 모든 span 을 delta 만큼 민다.
        void shift_subtree(NodeId id, int64_t delta);

        /// @brief 서브트리 노드 수
        uint32_t subtree_size(NodeId id) const;

    private:
        std::vector<Node> nodes_;
        std::vector<NodeId> children_;
    };

} // namespace specdoc::ast
