// frontend/src/doc/document.cpp
#include <specdoc/doc/Document.hpp>
#include <specdoc/lex/Lexer.hpp>
#include <specdoc/parse/Parser.hpp>

#include <algorithm>
#include <atomic>


namespace specdoc {

    namespace {

        bool node_fields_equal_(const Document& a, const ast::Node& x, const Document& b, const ast::Node& y) {
            if (x.kind != y.kind) return false;
            if (!(x.span == y.span)) return false;
            if (x.level != y.level || x.ordered != y.ordered) return false;
            if (x.checked != y.checked || x.has_id != y.has_id) return false;
            if (x.marker_col != y.marker_col) return false;
            if (x.child_count != y.child_count) return false;
            if (a.slice(x.text) != b.slice(y.text)) return false;
            if (a.slice(x.aux) != b.slice(y.aux)) return false;
            if (a.slice(x.extra) != b.slice(y.extra)) return false;
            return a.slice(x.span) == b.slice(y.span);
        }

    } // namespace

    uint64_t Document::next_generation_() {
        // 0 은 "빈 Document" 세대로 남겨둔다
        static std::atomic<uint64_t> counter{0};
        return counter.fetch_add(1, std::memory_order_relaxed) + 1;
    }

    std::string_view Document::slice(Span sp) const {
        const uint32_t n = static_cast<uint32_t>(text_->size());
        const uint32_t lo = std::min(sp.lo, n);
        const uint32_t hi = std::min(std::max(sp.hi, lo), n);
        return std::string_view(*text_).substr(lo, hi - lo);
    }

    void Document::rebuild_patches_() {
        patches_.clear();
        for (const auto& n : arena_->nodes()) {
            if (!n.is_modified() || n.mark_off == ast::k_no_offset) continue;
            patches_.push_back({n.mark_off, n.checked ? 'x' : ' '});
        }
        std::sort(patches_.begin(), patches_.end());
    }

    std::optional<query::Matches> Document::query(std::string_view selector, diag::Bag& bag) const {
        return query::run_query(*this, selector, bag);
    }

    Document Document::with_task_checked(const std::vector<TaskCheckEdit>& edits) const {
        Document next = *this;
        if (edits.empty()) return next;

        auto arena = std::make_shared<ast::NodeArena>(*arena_);
        for (const auto& e : edits) {
            if (!arena->valid(e.id)) continue;
            ast::Node& n = arena->node_mut(e.id);
            if (n.kind != ast::NodeKind::kTaskItem) continue;
            n.checked = e.checked;
        }

        next.arena_ = std::move(arena);
        next.rebuild_patches_();
        return next;
    }

    std::optional<Document> parse(std::string text, diag::Bag& bag, uint32_t file_id) {
        auto owned = std::make_shared<const std::string>(std::move(text));

        Lexer lex(*owned, file_id, &bag);
        const uint32_t before = bag.fatal_count();
        const auto toks = lex.lex_all();
        if (bag.fatal_count() != before) return std::nullopt;

        auto arena = std::make_shared<ast::NodeArena>();
        Parser parser(toks, *owned, *arena);
        const ast::NodeId root = parser.parse_document();

        Document doc;
        doc.text_ = owned;
        doc.lines_ = std::make_shared<const LineIndex>(*owned);
        doc.arena_ = std::move(arena);
        doc.root_ = root;
        doc.generation_ = Document::next_generation_();
        doc.file_id_ = file_id;
        return doc;
    }

    bool structurally_equal(const Document& a, const Document& b) {
        if (a.root() == ast::k_invalid_node || b.root() == ast::k_invalid_node) {
            return a.root() == b.root();
        }

        std::vector<std::pair<ast::NodeId, ast::NodeId>> stack{{a.root(), b.root()}};
        while (!stack.empty()) {
            const auto [x, y] = stack.back();
            stack.pop_back();

            const ast::Node& nx = a.node(x);
            const ast::Node& ny = b.node(y);
            if (!node_fields_equal_(a, nx, b, ny)) return false;

            const auto kx = a.children(x);
            const auto ky = b.children(y);
            for (size_t i = 0; i < kx.size(); ++i) stack.push_back({kx[i], ky[i]});
        }
        return true;
    }

} // namespace specdoc
