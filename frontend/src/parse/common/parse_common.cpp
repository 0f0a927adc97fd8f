// frontend/src/parse/common/parse_common.cpp
#include <specdoc/parse/Parser.hpp>
#include <specdoc/lex/Lexer.hpp>
#include <specdoc/syntax/TokenKind.hpp>


namespace specdoc {

    using K = syntax::TokenKind;

    void Parser::split_lines_() {
        lines_.clear();
        cursor_.rewind(0);

        bool in_fence = false;
        while (!cursor_.at(K::kEof)) {
            Line ln;
            ln.tb = static_cast<uint32_t>(cursor_.pos());
            ln.lo = cursor_.peek().span.lo;

            while (!cursor_.at(K::kEof)) {
                const Token& t = cursor_.bump();
                if (t.kind == K::kNewline || t.kind == K::kBlankLine) break;
            }
            ln.te = static_cast<uint32_t>(cursor_.pos());
            ln.hi = tokens_[ln.te - 1].span.hi;

            ln.first = ln.tb;
            if (tokens_[ln.tb].kind == K::kIndent && ln.tb + 1 < ln.te) {
                ln.indent_col = column_after_(0, tokens_[ln.tb]);
                ln.first = ln.tb + 1;
            }

            if (in_fence) {
                ln.kind = LineKind::kFenceBody;
                if (tokens_[ln.first].kind == K::kFenceClose) in_fence = false;
            } else {
                ln.kind = classify_line_(ln.first);
                if (ln.kind == LineKind::kFenceOpen) in_fence = true;
            }
            lines_.push_back(ln);
        }
    }

    Parser::LineKind Parser::classify_line_(uint32_t first) const {
        switch (tokens_[first].kind) {
            case K::kBlankLine: return LineKind::kBlank;
            case K::kHeadingMarker: return LineKind::kHeader;
            case K::kFenceOpen: return LineKind::kFenceOpen;
            case K::kListMarker: return LineKind::kListItem;
            case K::kCodeLine:
            case K::kFenceClose:
                return LineKind::kFenceBody;
            default:
                return LineKind::kText;
        }
    }

    // tab 은 다음 4의 배수 column 으로 간다
    uint32_t Parser::column_after_(uint32_t col, const Token& t) const {
        for (const char c : t.lexeme) {
            if (c == '\t') {
                col = (col / 4 + 1) * 4;
            } else if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
                ++col;
            }
        }
        return col;
    }

    uint32_t Parser::line_content_end_(const Line& ln) const {
        const Token& last = tokens_[ln.te - 1];
        if (last.kind == K::kNewline) return last.span.lo;
        return ln.hi;
    }

    ast::NodeId Parser::add_leaf_(ast::NodeKind k, uint32_t lo, uint32_t hi) {
        ast::Node n;
        n.kind = k;
        n.span = span_(lo, hi);
        return ast_.add(n);
    }

    ast::NodeId Parser::finish_(ast::Node n, const std::vector<ast::NodeId>& kids) {
        const ast::NodeId id = ast_.add(n);
        ast_.set_children(id, kids);
        return id;
    }

    Span Parser::trim_span_(uint32_t lo, uint32_t hi) const {
        while (lo < hi && is_blank_char(source_[lo])) ++lo;
        while (hi > lo && is_blank_char(source_[hi - 1])) --hi;
        return span_(lo, hi);
    }

    ast::NodeId Parser::parse_document() {
        const auto blocks = parse_blocks();

        ast::Node doc;
        doc.kind = ast::NodeKind::kDocument;
        doc.span = span_(0, static_cast<uint32_t>(source_.size()));
        return finish_(doc, blocks);
    }

} // namespace specdoc
