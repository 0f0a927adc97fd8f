// frontend/src/parse/inline/parse_inline.cpp
#include <specdoc/parse/Parser.hpp>
#include <specdoc/lex/Lexer.hpp>
#include <specdoc/syntax/TokenKind.hpp>

#include <array>


namespace specdoc {

    using K = syntax::TokenKind;
    using ast::NodeId;
    using ast::NodeKind;

    namespace {

        enum class PieceKind : uint8_t {
            kText,
            kMarkup,   // newline / indent
            kNode,     // 이미 만들어진 leaf (code span, wikilink)
            kDelim,    // emphasis 후보
        };

        struct Piece {
            PieceKind kind = PieceKind::kText;
            uint32_t lo = 0;
            uint32_t hi = 0;
            NodeId node = ast::k_invalid_node;

            char ch = 0;
            bool can_open = false;
            bool can_close = false;
            int32_t match = -1;
        };

        // ('*', 1) ('*', 2) ('_', 1) ('_', 2)
        size_t delim_class_(const Piece& p) {
            return (p.ch == '_' ? 2u : 0u) + (p.hi - p.lo - 1);
        }

        struct Frame {
            std::vector<NodeId> kids{};
            size_t open = 0;
            bool text_open = false;
            uint32_t text_lo = 0;
            uint32_t text_hi = 0;
        };

        bool is_space_(char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; }

        bool is_word_(char c) {
            const auto u = static_cast<unsigned char>(c);
            return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || u >= 0x80;
        }

    } // namespace

    void Parser::parse_inline_(uint32_t tb, uint32_t te, std::vector<NodeId>& out) {
        if (tb >= te) return;

        const uint32_t range_lo = tokens_[tb].span.lo;
        const uint32_t range_hi = tokens_[te - 1].span.hi;

        // --------------------
        // 1) token -> piece. code span / wikilink 는 같은 줄 안에서만 닫힌다.
        // --------------------
        std::vector<Piece> pieces;
        pieces.reserve(te - tb);

        uint32_t i = tb;
        while (i < te) {
            const Token& t = tokens_[i];

            Piece p;
            p.lo = t.span.lo;
            p.hi = t.span.hi;

            if (t.kind == K::kNewline || t.kind == K::kIndent) {
                p.kind = PieceKind::kMarkup;
                pieces.push_back(p);
                ++i;
                continue;
            }

            if (t.kind == K::kCodeTick) {
                uint32_t j = i + 1;
                while (j < te && tokens_[j].kind != K::kNewline &&
                       !(tokens_[j].kind == K::kCodeTick && tokens_[j].lexeme.size() == t.lexeme.size())) {
                    ++j;
                }
                if (j < te && tokens_[j].kind == K::kCodeTick) {
                    ast::Node n;
                    n.kind = NodeKind::kCodeSpan;
                    n.span = span_(t.span.lo, tokens_[j].span.hi);
                    n.text = span_(t.span.hi, tokens_[j].span.lo);

                    p.kind = PieceKind::kNode;
                    p.hi = n.span.hi;
                    p.node = ast_.add(n);
                    pieces.push_back(p);
                    i = j + 1;
                    continue;
                }
            }

            if (t.kind == K::kWikilinkOpen) {
                uint32_t j = i + 1;
                while (j < te && tokens_[j].kind != K::kNewline &&
                       tokens_[j].kind != K::kWikilinkClose && tokens_[j].kind != K::kWikilinkOpen) {
                    ++j;
                }
                if (j < te && tokens_[j].kind == K::kWikilinkClose) {
                    // [[target#anchor|alias]]
                    const uint32_t a = t.span.hi;
                    const uint32_t b = tokens_[j].span.lo;

                    uint32_t pipe = a;
                    while (pipe < b && source_[pipe] != '|') ++pipe;
                    uint32_t hash = a;
                    while (hash < pipe && source_[hash] != '#') ++hash;

                    const Span target = trim_span_(a, hash);
                    if (!target.empty()) {
                        ast::Node n;
                        n.kind = NodeKind::kWikiLink;
                        n.span = span_(t.span.lo, tokens_[j].span.hi);
                        n.text = target;
                        if (pipe < b) n.aux = trim_span_(pipe + 1, b);
                        if (hash < pipe) n.extra = trim_span_(hash + 1, pipe);

                        p.kind = PieceKind::kNode;
                        p.hi = n.span.hi;
                        p.node = ast_.add(n);
                        pieces.push_back(p);
                        i = j + 1;
                        continue;
                    }
                }
            }

            if (t.kind == K::kEmphasisDelim && t.lexeme.size() <= 2) {
                const char prev = (p.lo > range_lo) ? source_[p.lo - 1] : ' ';
                const char next = (p.hi < range_hi) ? source_[p.hi] : ' ';
                const bool left_flank = !is_space_(next);
                const bool right_flank = !is_space_(prev);

                p.kind = PieceKind::kDelim;
                p.ch = t.lexeme[0];
                if (p.ch == '*') {
                    p.can_open = left_flank;
                    p.can_close = right_flank;
                } else {
                    // '_' 는 단어 내부에서 구분자가 아니다
                    p.can_open = left_flank && !is_word_(prev);
                    p.can_close = right_flank && !is_word_(next);
                }
                pieces.push_back(p);
                ++i;
                continue;
            }

            p.kind = PieceKind::kText;
            pieces.push_back(p);
            ++i;
        }

        // --------------------
        // 2) emphasis 짝짓기: 같은 문자 + 같은 길이만. 안쪽의 짝 없는 opener 는 버린다.
        //    opener 는 종류별 스택에 두고, closer 는 자기 종류 스택만 본다.
        // --------------------
        std::array<std::vector<size_t>, 4> openers;
        for (size_t k = 0; k < pieces.size(); ++k) {
            Piece& p = pieces[k];
            if (p.kind != PieceKind::kDelim) continue;

            const size_t cls = delim_class_(p);
            if (p.can_close) {
                const auto& st = openers[cls];
                size_t s = st.size();
                // 바로 앞 piece 와는 짝짓지 않는다
                if (s > 0 && st[s - 1] + 1 == k) --s;

                if (s > 0) {
                    const size_t o = st[s - 1];
                    pieces[o].match = static_cast<int32_t>(k);
                    p.match = static_cast<int32_t>(o);

                    // o 와 그 뒤에 열린 opener 는 모든 종류에서 닫힌다
                    for (auto& other : openers) {
                        while (!other.empty() && other.back() >= o) other.pop_back();
                    }
                    continue;
                }
            }
            if (p.can_open) openers[cls].push_back(k);
        }

        // --------------------
        // 3) 노드 생성. 인접한 text/짝 없는 구분자는 Text 하나로 합친다.
        //    열린 emphasis 는 frame 스택에 쌓는다 (중첩 깊이와 무관하게 재귀 없음).
        // --------------------
        const auto flush_text = [&](Frame& f) {
            if (!f.text_open) return;
            f.kids.push_back(add_leaf_(NodeKind::kText, f.text_lo, f.text_hi));
            f.text_open = false;
        };

        std::vector<Frame> frames(1);
        for (size_t k = 0; k < pieces.size(); ++k) {
            const Piece& p = pieces[k];

            if (p.kind == PieceKind::kDelim && p.match > static_cast<int32_t>(k)) {
                flush_text(frames.back());
                Frame f;
                f.open = k;
                f.kids.push_back(add_leaf_(NodeKind::kMarkup, p.lo, p.hi));
                frames.push_back(std::move(f));
                continue;
            }

            if (p.kind == PieceKind::kDelim && p.match >= 0) {
                // 짝은 항상 맨 위 frame 의 opener 다
                Frame f = std::move(frames.back());
                frames.pop_back();
                flush_text(f);
                f.kids.push_back(add_leaf_(NodeKind::kMarkup, p.lo, p.hi));

                const Piece& open = pieces[f.open];
                ast::Node e;
                e.kind = NodeKind::kEmphasis;
                e.level = static_cast<uint8_t>(open.hi - open.lo);
                e.span = span_(open.lo, p.hi);
                e.text = span_(open.hi, p.lo);
                frames.back().kids.push_back(finish_(e, f.kids));
                continue;
            }

            Frame& top = frames.back();
            if (p.kind == PieceKind::kText || p.kind == PieceKind::kDelim) {
                if (!top.text_open) {
                    top.text_open = true;
                    top.text_lo = p.lo;
                }
                top.text_hi = p.hi;
                continue;
            }

            flush_text(top);
            if (p.kind == PieceKind::kMarkup) {
                top.kids.push_back(add_leaf_(NodeKind::kMarkup, p.lo, p.hi));
            } else {
                top.kids.push_back(p.node);
            }
        }

        flush_text(frames.front());
        out.insert(out.end(), frames.front().kids.begin(), frames.front().kids.end());
    }

} // namespace specdoc
