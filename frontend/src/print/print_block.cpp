// frontend/src/print/print_block.cpp
#include <specdoc/print/Printer.hpp>
#include <specdoc/doc/Document.hpp>

#include <algorithm>


namespace specdoc::print {

    using ast::NodeId;

    namespace {

        void emit_leaf_(std::string_view source,
                        Span sp,
                        const PatchList& patches,
                        std::string& out,
                        uint32_t lo,
                        uint32_t hi) {
            const uint32_t a = std::max(sp.lo, lo);
            const uint32_t b = std::min(sp.hi, hi);
            if (a >= b) return;

            const size_t base = out.size();
            out.append(source.substr(a, b - a));

            // 수정된 checkbox mark 만 덮어쓴다
            auto it = std::lower_bound(patches.begin(), patches.end(), a,
                                       [](const std::pair<uint32_t, char>& p, uint32_t off) { return p.first < off; });
            for (; it != patches.end() && it->first < b; ++it) {
                out[base + (it->first - a)] = it->second;
            }
        }

    } // namespace

    void print_block(const ast::NodeArena& ast,
                     std::string_view source,
                     NodeId id,
                     const PatchList& patches,
                     std::string& out,
                     uint32_t lo,
                     uint32_t hi) {
        if (id == ast::k_invalid_node || !ast.valid(id)) return;

        std::vector<NodeId> stack{id};
        while (!stack.empty()) {
            const NodeId cur = stack.back();
            stack.pop_back();

            const ast::Node& n = ast.node(cur);
            if (n.span.hi <= lo || n.span.lo >= hi) continue;

            if (ast::is_leaf(n.kind)) {
                emit_leaf_(source, n.span, patches, out, lo, hi);
                continue;
            }

            const auto kids = ast.children(cur);
            for (size_t i = kids.size(); i-- > 0;) stack.push_back(kids[i]);
        }
    }

} // namespace specdoc::print

namespace specdoc {

    std::string Document::print() const {
        std::string out;
        out.reserve(text_->size());
        print::print_block(*arena_, *text_, root_, patches_, out);
        return out;
    }

    std::string Document::print_node(ast::NodeId id) const {
        std::string out;
        print::print_block(*arena_, *text_, id, patches_, out);
        return out;
    }

    std::string Document::print_range(uint32_t lo, uint32_t hi) const {
        std::string out;
        if (lo >= hi) return out;
        print::print_block(*arena_, *text_, root_, patches_, out, lo, hi);
        return out;
    }

} // namespace specdoc
