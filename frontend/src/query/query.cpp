// frontend/src/query/query.cpp
#include <specdoc/query/Query.hpp>
#include <specdoc/doc/Document.hpp>
#include <specdoc/print/Printer.hpp>


namespace specdoc::query {

    using ast::NodeId;
    using ast::NodeKind;

    namespace {

        bool type_matches_(const Compound& c, const ast::Node& n) {
            // 구문 기호는 선택 대상이 아니다
            if (n.kind == NodeKind::kMarkup) return false;

            switch (c.type) {
                case TypeTest::kAny: return true;
                case TypeTest::kDocument: return n.kind == NodeKind::kDocument;
                case TypeTest::kHeader: return n.kind == NodeKind::kHeader && (c.level == 0 || n.level == c.level);
                case TypeTest::kParagraph: return n.kind == NodeKind::kParagraph;
                case TypeTest::kCode: return n.kind == NodeKind::kCodeBlock;
                case TypeTest::kList: return n.kind == NodeKind::kList;
                case TypeTest::kItem: return n.kind == NodeKind::kListItem || n.kind == NodeKind::kTaskItem;
                case TypeTest::kTask: return n.kind == NodeKind::kTaskItem;
                case TypeTest::kText: return n.kind == NodeKind::kText;
                case TypeTest::kWikiLink: return n.kind == NodeKind::kWikiLink;
                case TypeTest::kEmphasis: return n.kind == NodeKind::kEmphasis;
                case TypeTest::kCodeSpan: return n.kind == NodeKind::kCodeSpan;
                case TypeTest::kBlank: return n.kind == NodeKind::kBlankLine;
            }
            return false;
        }

        bool attr_matches_(const Document& doc, NodeId id, const AttrTest& t) {
            const auto v = attr_value(doc, id, t.attr);
            if (!v) return false;

            const std::string& s = *v;
            switch (t.op) {
                case AttrOp::kExists: return true;
                case AttrOp::kEquals: return s == t.value;
                case AttrOp::kPrefix: return s.compare(0, t.value.size(), t.value) == 0 && s.size() >= t.value.size();
                case AttrOp::kSuffix:
                    return s.size() >= t.value.size() &&
                           s.compare(s.size() - t.value.size(), t.value.size(), t.value) == 0;
                case AttrOp::kContains: return s.find(t.value) != std::string::npos;
            }
            return false;
        }

        bool compound_matches_(const Document& doc, const Compound& c, NodeId id) {
            if (!type_matches_(c, doc.node(id))) return false;
            for (const auto& t : c.attrs) {
                if (!attr_matches_(doc, id, t)) return false;
            }
            return true;
        }

        // alt[0..=i] 를 id 에서 오른쪽부터 맞춘다
        bool complex_matches_(const Document& doc,
                              const TreeIndex& index,
                              const std::vector<Compound>& alt,
                              size_t i,
                              NodeId id) {
            if (!compound_matches_(doc, alt[i], id)) return false;
            if (i == 0) return true;

            if (alt[i].comb == Combinator::kChild) {
                const NodeId p = index.parent[id];
                return p != ast::k_invalid_node && complex_matches_(doc, index, alt, i - 1, p);
            }

            for (NodeId p = index.parent[id]; p != ast::k_invalid_node; p = index.parent[p]) {
                if (complex_matches_(doc, index, alt, i - 1, p)) return true;
            }
            return false;
        }

        std::string bool_str_(bool b) { return b ? "true" : "false"; }

    } // namespace

    TreeIndex build_tree_index(const Document& doc) {
        TreeIndex idx;
        const NodeId root = doc.root();
        if (root == ast::k_invalid_node) return idx;

        idx.parent.assign(doc.arena().size(), ast::k_invalid_node);

        std::vector<NodeId> stack{root};
        while (!stack.empty()) {
            const NodeId cur = stack.back();
            stack.pop_back();
            idx.order.push_back(cur);

            const auto kids = doc.children(cur);
            for (size_t i = kids.size(); i-- > 0;) {
                idx.parent[kids[i]] = cur;
                stack.push_back(kids[i]);
            }
        }

        // 최상위 block 은 section header 아래로
        std::vector<NodeId> headers;
        for (const NodeId c : doc.children(root)) {
            const auto& n = doc.node(c);
            if (n.kind == NodeKind::kHeader) {
                while (!headers.empty() && doc.node(headers.back()).level >= n.level) headers.pop_back();
                idx.parent[c] = headers.empty() ? root : headers.back();
                headers.push_back(c);
                continue;
            }
            idx.parent[c] = headers.empty() ? root : headers.back();
        }
        return idx;
    }

    std::optional<std::string> attr_value(const Document& doc, NodeId id, Attr a) {
        const ast::Node& n = doc.node(id);

        switch (a) {
            case Attr::kText:
                switch (n.kind) {
                    case NodeKind::kHeader:
                    case NodeKind::kListItem:
                    case NodeKind::kTaskItem:
                    case NodeKind::kWikiLink:
                    case NodeKind::kCodeBlock:
                    case NodeKind::kCodeSpan:
                        return std::string(doc.slice(n.text));
                    case NodeKind::kText:
                        return std::string(doc.slice(n.span));
                    case NodeKind::kParagraph:
                    case NodeKind::kEmphasis:
                        return print::plain_text(doc, id);
                    default:
                        return std::nullopt;
                }

            case Attr::kLevel:
                if (n.kind == NodeKind::kHeader || n.kind == NodeKind::kEmphasis) return std::to_string(n.level);
                return std::nullopt;

            case Attr::kLang:
                if (n.kind == NodeKind::kCodeBlock && !n.aux.empty()) return std::string(doc.slice(n.aux));
                return std::nullopt;

            case Attr::kId:
                if (n.kind == NodeKind::kTaskItem && n.has_id) return std::string(doc.slice(n.aux));
                return std::nullopt;

            case Attr::kChecked:
                if (n.kind == NodeKind::kTaskItem) return bool_str_(n.checked);
                return std::nullopt;

            case Attr::kTarget:
                if (n.kind == NodeKind::kWikiLink) return std::string(doc.slice(n.text));
                return std::nullopt;

            case Attr::kAlias:
                if (n.kind == NodeKind::kWikiLink && !n.aux.empty()) return std::string(doc.slice(n.aux));
                return std::nullopt;

            case Attr::kAnchor:
                if (n.kind == NodeKind::kWikiLink && !n.extra.empty()) return std::string(doc.slice(n.extra));
                return std::nullopt;

            case Attr::kOrdered:
                if (n.kind == NodeKind::kList) return bool_str_(n.ordered);
                return std::nullopt;
        }
        return std::nullopt;
    }

    bool matches_node(const Document& doc, const TreeIndex& index, const Selector& sel, NodeId id) {
        for (const auto& alt : sel.alternatives) {
            if (alt.empty()) continue;
            if (complex_matches_(doc, index, alt, alt.size() - 1, id)) return true;
        }
        return false;
    }

    void Matches::iterator::seek_() {
        if (!owner_) return;
        const auto& order = owner_->index_->order;
        while (pos_ < order.size() && !matches_node(*owner_->doc_, *owner_->index_, owner_->sel_, order[pos_])) {
            ++pos_;
        }
        if (pos_ < order.size()) current_ = owner_->doc_->handle(order[pos_]);
    }

    Matches::Matches(const Document& doc, Selector sel)
        : doc_(std::make_shared<const Document>(doc)),
          index_(std::make_shared<const TreeIndex>(build_tree_index(doc))),
          sel_(std::move(sel)) {}

    std::vector<NodeHandle> Matches::collect() const {
        std::vector<NodeHandle> out;
        for (const auto& h : *this) out.push_back(h);
        return out;
    }

    size_t Matches::count() const {
        size_t n = 0;
        for (auto it = begin(); it != end(); ++it) ++n;
        return n;
    }

    std::optional<Matches> run_query(const Document& doc, std::string_view selector, diag::Bag& bag) {
        auto sel = compile_selector(selector, bag);
        if (!sel) return std::nullopt;
        return Matches(doc, std::move(*sel));
    }

} // namespace specdoc::query
