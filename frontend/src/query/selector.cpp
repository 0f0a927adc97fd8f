// frontend/src/query/selector.cpp
#include <specdoc/query/Selector.hpp>

#include <string>


namespace specdoc::query {

    namespace {

        bool is_name_char_(char c) {
            return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-' || c == '_';
        }

        bool is_bare_value_char_(char c) {
            return is_name_char_(c) || c == '.' || c == ':' || c == '/';
        }

        bool is_ws_(char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; }

        struct TypeEntry {
            std::string_view name;
            TypeTest type;
            uint8_t level;
        };

        constexpr TypeEntry kTypes[] = {
            {"document", TypeTest::kDocument, 0},
            {"header", TypeTest::kHeader, 0},
            {"h1", TypeTest::kHeader, 1},
            {"h2", TypeTest::kHeader, 2},
            {"h3", TypeTest::kHeader, 3},
            {"h4", TypeTest::kHeader, 4},
            {"h5", TypeTest::kHeader, 5},
            {"h6", TypeTest::kHeader, 6},
            {"paragraph", TypeTest::kParagraph, 0},
            {"code", TypeTest::kCode, 0},
            {"list", TypeTest::kList, 0},
            {"item", TypeTest::kItem, 0},
            {"task", TypeTest::kTask, 0},
            {"text", TypeTest::kText, 0},
            {"wikilink", TypeTest::kWikiLink, 0},
            {"emphasis", TypeTest::kEmphasis, 0},
            {"codespan", TypeTest::kCodeSpan, 0},
            {"blank", TypeTest::kBlank, 0},
        };

        struct AttrEntry {
            std::string_view name;
            Attr attr;
        };

        constexpr AttrEntry kAttrs[] = {
            {"text", Attr::kText},
            {"level", Attr::kLevel},
            {"lang", Attr::kLang},
            {"id", Attr::kId},
            {"checked", Attr::kChecked},
            {"target", Attr::kTarget},
            {"alias", Attr::kAlias},
            {"anchor", Attr::kAnchor},
            {"ordered", Attr::kOrdered},
        };

        /// @brief 재귀 하강 선택자 파서. 첫 오류에서 멈춘다.
        class SelectorParser {
        public:
            SelectorParser(std::string_view src, diag::Bag& bag) : src_(src), bag_(bag) {}

            std::optional<Selector> run() {
                Selector sel;
                sel.source = std::string(src_);

                skip_ws_();
                if (eof_()) {
                    report_(diag::Code::kQueryEmpty, 0);
                    return std::nullopt;
                }

                while (true) {
                    std::vector<Compound> alt;
                    if (!parse_alternative_(alt)) return std::nullopt;
                    sel.alternatives.push_back(std::move(alt));

                    skip_ws_();
                    if (eof_()) break;
                    if (peek_() != ',') {
                        report_char_(pos_);
                        return std::nullopt;
                    }
                    ++pos_;
                    skip_ws_();
                    if (eof_()) {
                        report_(diag::Code::kQueryEmpty, pos_);
                        return std::nullopt;
                    }
                }
                return sel;
            }

        private:
            bool parse_alternative_(std::vector<Compound>& alt) {
                Combinator comb = Combinator::kNone;
                while (true) {
                    Compound c;
                    if (!parse_compound_(c)) return false;
                    c.comb = comb;
                    alt.push_back(std::move(c));

                    // combinator
                    const size_t save = pos_;
                    skip_ws_();
                    if (eof_() || peek_() == ',') {
                        pos_ = save;
                        return true;
                    }
                    if (peek_() == '>') {
                        ++pos_;
                        skip_ws_();
                        if (eof_() || peek_() == ',') {
                            report_(diag::Code::kQuerySyntax, pos_, "expected selector after '>'");
                            return false;
                        }
                        comb = Combinator::kChild;
                        continue;
                    }
                    if (pos_ == save) {
                        report_char_(pos_);
                        return false;
                    }
                    comb = Combinator::kDescendant;
                }
            }

            bool parse_compound_(Compound& c) {
                const size_t start = pos_;

                if (!eof_() && peek_() == '*') {
                    ++pos_;
                } else if (!eof_() && is_name_char_(peek_())) {
                    const size_t b = pos_;
                    while (!eof_() && is_name_char_(peek_())) ++pos_;
                    const std::string_view name = src_.substr(b, pos_ - b);

                    bool found = false;
                    for (const auto& e : kTypes) {
                        if (e.name != name) continue;
                        c.type = e.type;
                        c.level = e.level;
                        found = true;
                        break;
                    }
                    if (!found) {
                        report_(diag::Code::kQueryUnknownType, b, name, pos_);
                        return false;
                    }
                }

                while (!eof_() && peek_() == '[') {
                    AttrTest t;
                    if (!parse_attr_(t)) return false;
                    c.attrs.push_back(std::move(t));
                }

                if (pos_ == start) {
                    if (eof_()) report_(diag::Code::kQuerySyntax, pos_, "expected node type or attribute");
                    else report_char_(pos_);
                    return false;
                }
                return true;
            }

            bool parse_attr_(AttrTest& t) {
                ++pos_; // '['
                skip_ws_();

                const size_t b = pos_;
                while (!eof_() && is_name_char_(peek_())) ++pos_;
                const std::string_view name = src_.substr(b, pos_ - b);
                if (name.empty()) {
                    if (eof_()) report_(diag::Code::kQuerySyntax, pos_, "expected attribute name");
                    else report_char_(pos_);
                    return false;
                }

                bool found = false;
                for (const auto& e : kAttrs) {
                    if (e.name != name) continue;
                    t.attr = e.attr;
                    found = true;
                    break;
                }
                if (!found) {
                    report_(diag::Code::kQueryUnknownAttr, b, name, pos_);
                    return false;
                }

                skip_ws_();
                if (eof_()) {
                    report_(diag::Code::kQuerySyntax, pos_, "expected ']'");
                    return false;
                }

                if (peek_() == ']') {
                    ++pos_;
                    t.op = AttrOp::kExists;
                    return true;
                }

                if (peek_() == '=') {
                    t.op = AttrOp::kEquals;
                    ++pos_;
                } else if ((peek_() == '^' || peek_() == '$' || peek_() == '*') && pos_ + 1 < src_.size() && src_[pos_ + 1] == '=') {
                    t.op = (peek_() == '^') ? AttrOp::kPrefix : (peek_() == '$') ? AttrOp::kSuffix : AttrOp::kContains;
                    pos_ += 2;
                } else {
                    report_char_(pos_);
                    return false;
                }

                skip_ws_();
                if (!parse_value_(t.value)) return false;

                skip_ws_();
                if (eof_()) {
                    report_(diag::Code::kQuerySyntax, pos_, "expected ']'");
                    return false;
                }
                if (peek_() != ']') {
                    report_char_(pos_);
                    return false;
                }
                ++pos_;
                return true;
            }

            bool parse_value_(std::string& out) {
                if (eof_()) {
                    report_(diag::Code::kQuerySyntax, pos_, "expected attribute value");
                    return false;
                }

                const char q = peek_();
                if (q == '"' || q == '\'') {
                    const size_t open = pos_;
                    ++pos_;
                    while (!eof_() && peek_() != q) {
                        if (peek_() == '\\' && pos_ + 1 < src_.size()) ++pos_;
                        out.push_back(src_[pos_++]);
                    }
                    if (eof_()) {
                        report_(diag::Code::kQueryUnterminatedString, open);
                        return false;
                    }
                    ++pos_;
                    return true;
                }

                const size_t b = pos_;
                while (!eof_() && is_bare_value_char_(peek_())) ++pos_;
                if (pos_ == b) {
                    report_char_(pos_);
                    return false;
                }
                out.assign(src_.substr(b, pos_ - b));
                return true;
            }

            void report_(diag::Code code, size_t at, std::string_view arg = {}, size_t hi = 0) {
                const uint32_t lo = static_cast<uint32_t>(at);
                const uint32_t end = static_cast<uint32_t>(hi > at ? hi : at + 1);
                diag::Diagnostic d(diag::Severity::kError, code, Span{0, lo, end});
                if (!arg.empty()) d.add_arg(arg);
                bag_.add(std::move(d));
            }

            void report_char_(size_t at) {
                report_(diag::Code::kQueryUnexpectedChar, at, src_.substr(at, 1));
            }

            bool eof_() const { return pos_ >= src_.size(); }
            char peek_() const { return src_[pos_]; }
            void skip_ws_() {
                while (!eof_() && is_ws_(peek_())) ++pos_;
            }

            std::string_view src_;
            diag::Bag& bag_;
            size_t pos_ = 0;
        };

    } // namespace

    std::optional<Selector> compile_selector(std::string_view text, diag::Bag& bag) {
        SelectorParser p(text, bag);
        return p.run();
    }

    std::string_view type_test_name(TypeTest t) {
        if (t == TypeTest::kAny) return "*";
        for (const auto& e : kTypes) {
            if (e.type == t && e.level == 0) return e.name;
        }
        return "?";
    }

    std::string_view attr_name(Attr a) {
        for (const auto& e : kAttrs) {
            if (e.attr == a) return e.name;
        }
        return "?";
    }

} // namespace specdoc::query
