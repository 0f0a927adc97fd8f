// frontend/src/ast/nodes.cpp
#include <specdoc/ast/Nodes.hpp>


namespace specdoc::ast {

    namespace {

        void shift_span_(Span& sp, int64_t delta) {
            if (sp.empty() && sp.lo == 0 && sp.hi == 0) return;
            sp.lo = static_cast<uint32_t>(static_cast<int64_t>(sp.lo) + delta);
            sp.hi = static_cast<uint32_t>(static_cast<int64_t>(sp.hi) + delta);
        }

    } // namespace

    void NodeArena::shift_subtree(NodeId id, int64_t delta) {
        if (delta == 0) return;

        std::vector<NodeId> stack{id};
        while (!stack.empty()) {
            const NodeId cur = stack.back();
            stack.pop_back();

            Node& n = nodes_[cur];
            n.span.lo = static_cast<uint32_t>(static_cast<int64_t>(n.span.lo) + delta);
            n.span.hi = static_cast<uint32_t>(static_cast<int64_t>(n.span.hi) + delta);
            shift_span_(n.text, delta);
            shift_span_(n.aux, delta);
            shift_span_(n.extra, delta);
            if (n.mark_off != k_no_offset) {
                n.mark_off = static_cast<uint32_t>(static_cast<int64_t>(n.mark_off) + delta);
            }

            for (uint32_t i = 0; i < n.child_count; ++i) {
                stack.push_back(children_[n.child_begin + i]);
            }
        }
    }

    uint32_t NodeArena::subtree_size(NodeId id) const {
        uint32_t count = 0;
        std::vector<NodeId> stack{id};
        while (!stack.empty()) {
            const NodeId cur = stack.back();
            stack.pop_back();
            ++count;
            const Node& n = nodes_[cur];
            for (uint32_t i = 0; i < n.child_count; ++i) {
                stack.push_back(children_[n.child_begin + i]);
            }
        }
        return count;
    }

} // namespace specdoc::ast
