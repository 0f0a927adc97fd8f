// frontend/include/specdoc/ast/Visitor.hpp
#pragma once
#include <specdoc/ast/Nodes.hpp>

#include <vector>


namespace specdoc::ast {

    enum class VisitAction : uint8_t {
        kContinue,
        kSkipChildren,  // 현재 노드의 서브트리만 건너뜀
        kStop,          // 순회 전체 중단
    };

    /// @brief pre-order 순회 콜백. kind 별 훅은 enter() 기본 구현이 분기한다.
    class Visitor {
    public:
        virtual ~Visitor() = default;

        virtual VisitAction enter(NodeId id, const Node& n) {
            switch (n.kind) {
                case NodeKind::kDocument: return visit_document(id, n);
                case NodeKind::kHeader: return visit_header(id, n);
                case NodeKind::kParagraph: return visit_paragraph(id, n);
                case NodeKind::kCodeBlock: return visit_code_block(id, n);
                case NodeKind::kList: return visit_list(id, n);
                case NodeKind::kListItem: return visit_list_item(id, n);
                case NodeKind::kTaskItem: return visit_task_item(id, n);
                case NodeKind::kBlankLine: return visit_blank_line(id, n);
                case NodeKind::kText: return visit_text(id, n);
                case NodeKind::kWikiLink: return visit_wikilink(id, n);
                case NodeKind::kEmphasis: return visit_emphasis(id, n);
                case NodeKind::kCodeSpan: return visit_code_span(id, n);
                case NodeKind::kMarkup: return visit_markup(id, n);
            }
            return VisitAction::kContinue;
        }

        virtual void leave(NodeId, const Node&) {}

        virtual VisitAction visit_document(NodeId, const Node&) { return VisitAction::kContinue; }
        virtual VisitAction visit_header(NodeId, const Node&) { return VisitAction::kContinue; }
        virtual VisitAction visit_paragraph(NodeId, const Node&) { return VisitAction::kContinue; }
        virtual VisitAction visit_code_block(NodeId, const Node&) { return VisitAction::kContinue; }
        virtual VisitAction visit_list(NodeId, const Node&) { return VisitAction::kContinue; }
        virtual VisitAction visit_list_item(NodeId, const Node&) { return VisitAction::kContinue; }
        virtual VisitAction visit_task_item(NodeId, const Node&) { return VisitAction::kContinue; }
        virtual VisitAction visit_blank_line(NodeId, const Node&) { return VisitAction::kContinue; }
        virtual VisitAction visit_text(NodeId, const Node&) { return VisitAction::kContinue; }
        virtual VisitAction visit_wikilink(NodeId, const Node&) { return VisitAction::kContinue; }
        virtual VisitAction visit_emphasis(NodeId, const Node&) { return VisitAction::kContinue; }
        virtual VisitAction visit_code_span(NodeId, const Node&) { return VisitAction::kContinue; }
        virtual VisitAction visit_markup(NodeId, const Node&) { return VisitAction::kContinue; }
    };

    /// @brief root 부터 pre-order 로 순회한다. 명시적 스택을 쓰므로 깊이 제한이 없다.
    inline void walk(const NodeArena& ast, NodeId root, Visitor& v) {
        if (root == k_invalid_node || !ast.valid(root)) return;

        struct Frame {
            NodeId id;
            size_t next;
        };
        std::vector<Frame> stack;

        const VisitAction first = v.enter(root, ast.node(root));
        if (first == VisitAction::kStop) return;
        if (first == VisitAction::kSkipChildren) {
            v.leave(root, ast.node(root));
            return;
        }
        stack.push_back({root, 0});

        while (!stack.empty()) {
            Frame& f = stack.back();
            const auto kids = ast.children(f.id);

            if (f.next == kids.size()) {
                v.leave(f.id, ast.node(f.id));
                stack.pop_back();
                continue;
            }

            const NodeId c = kids[f.next++];
            if (c == k_invalid_node || !ast.valid(c)) continue;

            const auto& n = ast.node(c);
            const VisitAction act = v.enter(c, n);
            if (act == VisitAction::kStop) return;
            if (act == VisitAction::kSkipChildren) {
                v.leave(c, n);
                continue;
            }
            stack.push_back({c, 0});
        }
    }

} // namespace specdoc::ast
