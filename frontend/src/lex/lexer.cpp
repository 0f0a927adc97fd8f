// frontend/src/lex/lexer.cpp
#include <specdoc/lex/Lexer.hpp>
#include <specdoc/text/Utf8.hpp>

#include <algorithm>


namespace specdoc {

    using K = syntax::TokenKind;

    namespace {

        bool is_digit_(char c) { return c >= '0' && c <= '9'; }

        bool is_ascii_punct_(char c) {
            return (c >= '!' && c <= '/') || (c >= ':' && c <= '@') ||
                   (c >= '[' && c <= '`') || (c >= '{' && c <= '~');
        }

        std::string byte_hex2(unsigned char b) {
            static constexpr char kHex[] = "0123456789ABCDEF";
            std::string s;
            s.push_back(kHex[(b >> 4) & 0xF]);
            s.push_back(kHex[b & 0xF]);
            return s;
        }

    } // namespace

    Lexer::Lexer(std::string_view source, uint32_t file_id, diag::Bag* diags)
        : source_(source), file_id_(file_id), diags_(diags) {}

    std::vector<Token> Lexer::lex_all() {
        const uint32_t size = static_cast<uint32_t>(source_.size());
        if (!validate_range(0, size)) {
            std::vector<Token> out;
            emit_(out, K::kEof, size, size);
            return out;
        }
        return lex_range(0, size);
    }

    bool Lexer::validate_range(uint32_t lo, uint32_t hi) {
        uint32_t bad_off = 0;
        if (text::validate_utf8_strict(source_.substr(lo, hi - lo), bad_off)) return true;
        report_invalid_utf8(lo + bad_off);
        return false;
    }

    void Lexer::report_invalid_utf8(uint32_t bad_off) {
        if (!diags_) return;

        const uint32_t hi = std::min<uint32_t>(bad_off + 1, static_cast<uint32_t>(source_.size()));
        diag::Diagnostic d(diag::Severity::kFatal, diag::Code::kInvalidUtf8, Span{file_id_, bad_off, hi});

        // args = offset + offending byte hex
        d.add_arg_int(bad_off);
        unsigned char b = 0;
        if (bad_off < source_.size()) b = static_cast<unsigned char>(source_[bad_off]);
        d.add_arg(byte_hex2(b));

        diags_->add(std::move(d));
    }

    std::vector<Token> Lexer::lex_range(uint32_t lo, uint32_t hi) {
        fence_char_ = 0;
        fence_len_ = 0;

        std::vector<Token> out;
        out.reserve((hi - lo) / 4 + 2);

        uint32_t p = lo;
        while (p < hi) {
            const LineBounds ln = line_bounds_(p, hi);
            lex_line_(ln, out);
            p = ln.nl_hi;
        }
        emit_(out, K::kEof, hi, hi);
        return out;
    }

    Lexer::LineBounds Lexer::line_bounds_(uint32_t lo, uint32_t hi) const {
        LineBounds ln;
        ln.lo = lo;

        uint32_t nl = lo;
        while (nl < hi && source_[nl] != '\n') ++nl;

        if (nl < hi) {
            ln.nl_hi = nl + 1;
            ln.end = (nl > lo && source_[nl - 1] == '\r') ? nl - 1 : nl;
        } else {
            // 마지막 줄 (개행 없음). 고립된 '\r' 은 내용으로 취급한다.
            ln.nl_hi = hi;
            ln.end = hi;
        }
        return ln;
    }

    uint32_t Lexer::skip_ws_(uint32_t p, uint32_t end) const {
        while (p < end && is_blank_char(source_[p])) ++p;
        return p;
    }

    void Lexer::emit_(std::vector<Token>& out, K k, uint32_t lo, uint32_t hi) const {
        Token t;
        t.kind = k;
        t.span = Span{file_id_, lo, hi};
        t.lexeme = source_.substr(lo, hi - lo);
        out.push_back(t);
    }

    void Lexer::emit_text_(std::vector<Token>& out, uint32_t lo, uint32_t hi) const {
        if (lo >= hi) return;
        // 인접한 text-run 은 하나로 합친다
        if (!out.empty() && out.back().kind == K::kText && out.back().span.hi == lo) {
            out.back().span.hi = hi;
            out.back().lexeme = source_.substr(out.back().span.lo, hi - out.back().span.lo);
            return;
        }
        emit_(out, K::kText, lo, hi);
    }

    void Lexer::emit_newline_(const LineBounds& ln, std::vector<Token>& out) const {
        if (ln.nl_hi > ln.end) emit_(out, K::kNewline, ln.end, ln.nl_hi);
    }

    void Lexer::lex_line_(const LineBounds& ln, std::vector<Token>& out) {
        if (fence_len_ != 0) {
            (void)lex_fence_body_line_(ln, out);
            return;
        }

        const uint32_t p = skip_ws_(ln.lo, ln.end);

        // blank line: 공백만 있는 줄 전체 (개행 포함)를 토큰 하나로
        if (p == ln.end) {
            emit_(out, K::kBlankLine, ln.lo, ln.nl_hi);
            return;
        }

        if (p > ln.lo) emit_(out, K::kIndent, ln.lo, p);

        if (!try_heading_(p, ln, out) &&
            !try_fence_open_(p, ln, out) &&
            !try_list_item_(p, ln, out)) {
            lex_inline_(p, ln.end, out);
        }
        emit_newline_(ln, out);
    }

    bool Lexer::lex_fence_body_line_(const LineBounds& ln, std::vector<Token>& out) {
        const uint32_t p = skip_ws_(ln.lo, ln.end);

        uint32_t q = p;
        while (q < ln.end && source_[q] == fence_char_) ++q;
        const uint32_t run = q - p;

        if (run >= fence_len_ && skip_ws_(q, ln.end) == ln.end) {
            if (p > ln.lo) emit_(out, K::kIndent, ln.lo, p);
            emit_(out, K::kFenceClose, p, q);
            if (q < ln.end) emit_(out, K::kSpace, q, ln.end);
            emit_newline_(ln, out);
            fence_char_ = 0;
            fence_len_ = 0;
            return true;
        }

        if (ln.end > ln.lo) emit_(out, K::kCodeLine, ln.lo, ln.end);
        emit_newline_(ln, out);
        return false;
    }

    bool Lexer::try_heading_(uint32_t p, const LineBounds& ln, std::vector<Token>& out) {
        if (source_[p] != '#') return false;

        uint32_t q = p;
        while (q < ln.end && source_[q] == '#') ++q;
        const uint32_t n = q - p;
        if (n > 6) return false;
        if (q < ln.end && !is_blank_char(source_[q])) return false;

        emit_(out, K::kHeadingMarker, p, q);
        const uint32_t r = skip_ws_(q, ln.end);
        if (r > q) emit_(out, K::kSpace, q, r);
        lex_inline_(r, ln.end, out);
        return true;
    }

    bool Lexer::try_fence_open_(uint32_t p, const LineBounds& ln, std::vector<Token>& out) {
        const char c = source_[p];
        if (c != '`' && c != '~') return false;

        uint32_t q = p;
        while (q < ln.end && source_[q] == c) ++q;
        const uint32_t n = q - p;
        if (n < 3) return false;

        // backtick fence 의 info string 에는 backtick 이 올 수 없다
        if (c == '`') {
            for (uint32_t i = q; i < ln.end; ++i) {
                if (source_[i] == '`') return false;
            }
        }

        emit_(out, K::kFenceOpen, p, q);
        const uint32_t r = skip_ws_(q, ln.end);
        if (r > q) emit_(out, K::kSpace, q, r);
        if (r < ln.end) emit_(out, K::kFenceInfo, r, ln.end);

        fence_char_ = c;
        fence_len_ = n;
        return true;
    }

    bool Lexer::try_list_item_(uint32_t p, const LineBounds& ln, std::vector<Token>& out) {
        const char c = source_[p];

        if (c == '-' || c == '*' || c == '+') {
            const uint32_t q = p + 1;
            const bool ws_after = (q == ln.end) || is_blank_char(source_[q]);

            // "-[ ]" 처럼 dash 바로 뒤에 checkbox 가 붙은 경우도 task 로 본다
            const bool glued_checkbox =
                c == '-' && q + 2 < ln.end && source_[q] == '[' &&
                (source_[q + 1] == ' ' || source_[q + 1] == 'x' || source_[q + 1] == 'X') &&
                source_[q + 2] == ']';

            if (!ws_after && !glued_checkbox) return false;

            emit_(out, K::kListMarker, p, q);
            if (c == '-') {
                lex_task_tail_(q, ln, out);
            } else {
                const uint32_t r = skip_ws_(q, ln.end);
                if (r > q) emit_(out, K::kSpace, q, r);
                lex_inline_(r, ln.end, out);
            }
            return true;
        }

        if (is_digit_(c)) {
            uint32_t q = p;
            while (q < ln.end && is_digit_(source_[q]) && q - p < 9) ++q;
            if (q >= ln.end || (source_[q] != '.' && source_[q] != ')')) return false;
            ++q;
            if (q < ln.end && !is_blank_char(source_[q])) return false;

            emit_(out, K::kListMarker, p, q);
            const uint32_t r = skip_ws_(q, ln.end);
            if (r > q) emit_(out, K::kSpace, q, r);
            lex_inline_(r, ln.end, out);
            return true;
        }

        return false;
    }

    // '-' 뒤: ws* '[' mark ']' ws* (id ws+)? description
    void Lexer::lex_task_tail_(uint32_t p, const LineBounds& ln, std::vector<Token>& out) {
        uint32_t r = skip_ws_(p, ln.end);
        if (r > p) emit_(out, K::kSpace, p, r);

        const bool has_box =
            r + 3 <= ln.end &&
            source_[r] == '[' &&
            (source_[r + 1] == ' ' || source_[r + 1] == 'x' || source_[r + 1] == 'X') &&
            source_[r + 2] == ']';
        if (!has_box) {
            lex_inline_(r, ln.end, out);
            return;
        }

        emit_(out, K::kCheckboxOpen, r, r + 1);
        emit_(out, K::kCheckboxMark, r + 1, r + 2);
        emit_(out, K::kCheckboxClose, r + 2, r + 3);

        uint32_t s = skip_ws_(r + 3, ln.end);
        if (s > r + 3) emit_(out, K::kSpace, r + 3, s);

        // dotted id: \d+(\.\d+)* '.'?
        uint32_t q = s;
        while (q < ln.end && is_digit_(source_[q])) ++q;
        if (q > s) {
            while (q + 1 < ln.end && source_[q] == '.' && is_digit_(source_[q + 1])) {
                ++q;
                while (q < ln.end && is_digit_(source_[q])) ++q;
            }
            if (q < ln.end && source_[q] == '.') ++q;

            // id 뒤에는 공백 + 설명이 와야 한다. 아니면 전체가 설명이다.
            const uint32_t d = skip_ws_(q, ln.end);
            if (d > q && d < ln.end) {
                emit_(out, K::kTaskId, s, q);
                emit_(out, K::kSpace, q, d);
                lex_inline_(d, ln.end, out);
                return;
            }
        }

        lex_inline_(s, ln.end, out);
    }

    void Lexer::lex_inline_(uint32_t p, uint32_t end, std::vector<Token>& out) {
        while (p < end) {
            const char c = source_[p];

            if (c == '[' && p + 1 < end && source_[p + 1] == '[') {
                emit_(out, K::kWikilinkOpen, p, p + 2);
                p += 2;
                continue;
            }
            if (c == ']' && p + 1 < end && source_[p + 1] == ']') {
                emit_(out, K::kWikilinkClose, p, p + 2);
                p += 2;
                continue;
            }
            if (c == '`' || c == '*' || c == '_') {
                uint32_t q = p;
                while (q < end && source_[q] == c) ++q;
                emit_(out, (c == '`') ? K::kCodeTick : K::kEmphasisDelim, p, q);
                p = q;
                continue;
            }
            if (c == '\\' && p + 1 < end && is_ascii_punct_(source_[p + 1])) {
                emit_(out, K::kEscape, p, p + 2);
                p += 2;
                continue;
            }

            // text-run: 다음 특수 문자 직전까지
            uint32_t q = p + 1;
            while (q < end) {
                const char d = source_[q];
                if (d == '[' || d == ']' || d == '`' || d == '*' || d == '_' || d == '\\') break;
                ++q;
            }
            emit_text_(out, p, q);
            p = q;
        }
    }

    std::optional<std::vector<Token>> tokenize(std::string_view source, diag::Bag& diags) {
        Lexer lex(source, 0, &diags);
        const uint32_t before = diags.fatal_count();
        auto toks = lex.lex_all();
        if (diags.fatal_count() != before) return std::nullopt;
        return toks;
    }

} // namespace specdoc
