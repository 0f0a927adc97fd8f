// frontend/src/print/print_inline.cpp
#include <specdoc/print/Printer.hpp>
#include <specdoc/doc/Document.hpp>

#include <algorithm>


namespace specdoc::print {

    using ast::NodeId;
    using ast::NodeKind;

    namespace {

        bool is_punct_(char c) {
            return (c >= '!' && c <= '/') || (c >= ':' && c <= '@') ||
                   (c >= '[' && c <= '`') || (c >= '{' && c <= '~');
        }

        void append_unescaped_(std::string_view s, std::string& out) {
            for (size_t i = 0; i < s.size(); ++i) {
                if (s[i] == '\\' && i + 1 < s.size() && is_punct_(s[i + 1])) {
                    out.push_back(s[++i]);
                    continue;
                }
                out.push_back(s[i]);
            }
        }

        std::string trim_(std::string s) {
            const auto not_ws = [](char c) { return c != ' ' && c != '\t' && c != '\n' && c != '\r'; };
            const auto b = std::find_if(s.begin(), s.end(), not_ws);
            const auto e = std::find_if(s.rbegin(), s.rend(), not_ws).base();
            if (b >= e) return {};
            return std::string(b, e);
        }

        // [lo, hi) 안의 leaf 만 평문으로 모은다
        void plain_inner_(const Document& doc, NodeId root, uint32_t lo, uint32_t hi, std::string& out) {
            std::vector<NodeId> stack{root};
            while (!stack.empty()) {
                const NodeId id = stack.back();
                stack.pop_back();

                const ast::Node& n = doc.node(id);
                if (n.span.hi <= lo || n.span.lo >= hi) continue;

                switch (n.kind) {
                    case NodeKind::kText: {
                        const uint32_t a = std::max(n.span.lo, lo);
                        const uint32_t b = std::min(n.span.hi, hi);
                        append_unescaped_(doc.slice(Span{0, a, b}), out);
                        continue;
                    }
                    case NodeKind::kMarkup: {
                        const auto s = doc.slice(n.span);
                        if (!s.empty() && s.back() == '\n' && s.size() <= 2) out.push_back(' ');
                        continue;
                    }
                    case NodeKind::kWikiLink:
                        out.append(doc.slice(n.aux.empty() ? n.text : n.aux));
                        continue;
                    case NodeKind::kCodeSpan:
                        out.append(doc.slice(n.text));
                        continue;
                    case NodeKind::kBlankLine:
                        continue;
                    default:
                        break;
                }

                const auto kids = doc.children(id);
                for (size_t i = kids.size(); i-- > 0;) stack.push_back(kids[i]);
            }
        }

        std::string quoted_(std::string_view s) {
            std::string out = "\"";
            for (const char c : s) {
                if (c == '\n') out += "\\n";
                else if (c == '\r') out += "\\r";
                else if (c == '\t') out += "\\t";
                else if (c == '"') out += "\\\"";
                else out.push_back(c);
            }
            out.push_back('"');
            return out;
        }

    } // namespace

    std::string plain_text(const Document& doc, NodeId id) {
        if (id == ast::k_invalid_node || !doc.arena().valid(id)) return {};
        const ast::Node& n = doc.node(id);

        switch (n.kind) {
            case NodeKind::kHeader:
            case NodeKind::kListItem:
            case NodeKind::kTaskItem: {
                std::string out;
                plain_inner_(doc, id, n.text.lo, n.text.hi, out);
                return trim_(std::move(out));
            }
            case NodeKind::kCodeBlock:
                return std::string(doc.slice(n.text));

            case NodeKind::kDocument:
            case NodeKind::kList: {
                std::string out;
                for (const NodeId c : doc.children(id)) {
                    std::string part = plain_text(doc, c);
                    if (part.empty()) continue;
                    if (!out.empty()) out.push_back('\n');
                    out += part;
                }
                return out;
            }
            default: {
                std::string out;
                plain_inner_(doc, id, n.span.lo, n.span.hi, out);
                return trim_(std::move(out));
            }
        }
    }

    std::string node_summary(const Document& doc, NodeId id) {
        const ast::Node& n = doc.node(id);
        std::string out(ast::node_kind_name(n.kind));

        switch (n.kind) {
            case NodeKind::kHeader:
                out += "(h" + std::to_string(n.level) + ") " + quoted_(doc.slice(n.text));
                break;
            case NodeKind::kList:
                out += n.ordered ? "(ordered)" : "(bullet)";
                break;
            case NodeKind::kListItem:
                out += " " + quoted_(doc.slice(n.text));
                break;
            case NodeKind::kTaskItem:
                out += n.checked ? " [x]" : " [ ]";
                if (n.has_id) out += " id=" + std::string(doc.slice(n.aux));
                out += " " + quoted_(doc.slice(n.text));
                break;
            case NodeKind::kCodeBlock:
                out += " lang=" + quoted_(doc.slice(n.aux));
                break;
            case NodeKind::kWikiLink:
                out += " target=" + quoted_(doc.slice(n.text));
                if (!n.aux.empty()) out += " alias=" + quoted_(doc.slice(n.aux));
                if (!n.extra.empty()) out += " anchor=" + quoted_(doc.slice(n.extra));
                break;
            case NodeKind::kEmphasis:
                out += (n.level == 2) ? "(strong)" : "(em)";
                break;
            case NodeKind::kText:
            case NodeKind::kMarkup:
            case NodeKind::kCodeSpan:
                out += " " + quoted_(doc.slice(n.span));
                break;
            default:
                break;
        }
        return out;
    }

    std::string dump_tree(const Document& doc) {
        std::string out;
        if (doc.root() == ast::k_invalid_node) return out;

        std::vector<std::pair<NodeId, uint32_t>> stack{{doc.root(), 0}};
        while (!stack.empty()) {
            const auto [id, depth] = stack.back();
            stack.pop_back();

            const ast::Node& n = doc.node(id);
            out.append(depth * 2, ' ');
            out += node_summary(doc, id);
            out += " [" + std::to_string(n.span.lo) + ", " + std::to_string(n.span.hi) + ")\n";

            const auto kids = doc.children(id);
            for (size_t i = kids.size(); i-- > 0;) stack.push_back({kids[i], depth + 1});
        }
        return out;
    }

} // namespace specdoc::print
