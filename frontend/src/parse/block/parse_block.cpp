// frontend/src/parse/block/parse_block.cpp
#include <specdoc/parse/Parser.hpp>
#include <specdoc/lex/Lexer.hpp>
#include <specdoc/syntax/TokenKind.hpp>


namespace specdoc {

    using K = syntax::TokenKind;
    using ast::NodeId;
    using ast::NodeKind;

    std::vector<NodeId> Parser::parse_blocks() {
        split_lines_();
        out_.clear();
        lists_.clear();
        para_open_ = false;

        size_t li = 0;
        while (li < lines_.size()) {
            const Line& ln = lines_[li];

            switch (ln.kind) {
                case LineKind::kBlank:
                    // blank line 은 열린 list/paragraph 를 모두 닫는다
                    close_paragraph_();
                    close_lists_(0);
                    emit_block_(add_leaf_(NodeKind::kBlankLine, ln.lo, ln.hi));
                    ++li;
                    break;

                case LineKind::kHeader:
                    close_paragraph_();
                    close_lists_(0);
                    emit_block_(parse_header_(ln));
                    ++li;
                    break;

                case LineKind::kFenceOpen: {
                    close_paragraph_();
                    const uint32_t col = ln.indent_col;
                    const NodeId id = parse_code_block_(li);
                    attach_block_(id, col);
                    break;
                }

                case LineKind::kListItem:
                    close_paragraph_();
                    open_item_(ln);
                    ++li;
                    break;

                case LineKind::kText:
                case LineKind::kFenceBody:
                    if (!lists_.empty()) {
                        // lazy continuation: 가장 안쪽 item 에 붙는다
                        continue_item_(ln);
                    } else if (para_open_) {
                        para_te_ = ln.te;
                    } else {
                        para_open_ = true;
                        para_tb_ = ln.tb;
                        para_te_ = ln.te;
                    }
                    ++li;
                    break;
            }
        }

        close_paragraph_();
        close_lists_(0);

        std::vector<NodeId> blocks = std::move(out_);
        out_.clear();
        return blocks;
    }

    NodeId Parser::parse_header_(const Line& ln) {
        std::vector<NodeId> kids;

        if (ln.first > ln.tb) kids.push_back(add_markup_(tokens_[ln.tb]));

        uint32_t i = ln.first;
        const Token& marker = tokens_[i++];
        kids.push_back(add_markup_(marker));
        if (i < ln.te && tokens_[i].kind == K::kSpace) kids.push_back(add_markup_(tokens_[i++]));

        const bool has_nl = tokens_[ln.te - 1].kind == K::kNewline;
        const uint32_t inline_te = has_nl ? ln.te - 1 : ln.te;
        const uint32_t content_end = line_content_end_(ln);
        const uint32_t content_lo = (i < inline_te) ? tokens_[i].span.lo : content_end;

        parse_inline_(i, inline_te, kids);
        if (has_nl) kids.push_back(add_markup_(tokens_[ln.te - 1]));

        ast::Node n;
        n.kind = NodeKind::kHeader;
        n.span = span_(ln.lo, ln.hi);
        n.level = static_cast<uint8_t>(marker.lexeme.size());

        // 닫는 '#' 열은 앞에 공백이 있을 때만 제거
        Span t = trim_span_(content_lo, content_end);
        uint32_t q = t.hi;
        while (q > t.lo && source_[q - 1] == '#') --q;
        if (q < t.hi && (q == t.lo || is_blank_char(source_[q - 1]))) {
            t = trim_span_(t.lo, q);
        }
        n.text = t;

        return finish_(n, kids);
    }

    NodeId Parser::parse_code_block_(size_t& li) {
        const Line open = lines_[li++];

        ast::Node n;
        n.kind = NodeKind::kCodeBlock;

        for (uint32_t i = open.first; i < open.te; ++i) {
            if (tokens_[i].kind != K::kFenceInfo) continue;
            // lang = info string 첫 단어
            const Span info = tokens_[i].span;
            uint32_t e = info.lo;
            while (e < info.hi && !is_blank_char(source_[e])) ++e;
            n.aux = span_(info.lo, e);
            break;
        }

        std::vector<NodeId> kids;
        kids.push_back(add_leaf_(NodeKind::kMarkup, open.lo, open.hi));

        const uint32_t body_lo = open.hi;
        uint32_t body_hi = open.hi;
        bool closed = false;
        Line close_ln;

        while (li < lines_.size() && lines_[li].kind == LineKind::kFenceBody) {
            const Line& ln = lines_[li++];
            if (ln.first < ln.te && tokens_[ln.first].kind == K::kFenceClose) {
                closed = true;
                close_ln = ln;
                break;
            }
            body_hi = ln.hi;
        }

        if (body_hi > body_lo) kids.push_back(add_leaf_(NodeKind::kText, body_lo, body_hi));
        n.text = span_(body_lo, body_hi);

        if (closed) kids.push_back(add_leaf_(NodeKind::kMarkup, close_ln.lo, close_ln.hi));

        n.span = span_(open.lo, closed ? close_ln.hi : body_hi);
        return finish_(n, kids);
    }

    void Parser::open_item_(const Line& ln) {
        ItemFrame it;
        it.node.kind = NodeKind::kListItem;
        it.node.span = span_(ln.lo, ln.hi);
        it.node.marker_col = ln.indent_col;

        if (ln.first > ln.tb) it.kids.push_back(add_markup_(tokens_[ln.tb]));

        uint32_t i = ln.first;
        const Token& marker = tokens_[i++];
        it.kids.push_back(add_markup_(marker));

        const bool ordered = !marker.lexeme.empty() && marker.lexeme[0] >= '0' && marker.lexeme[0] <= '9';

        const uint32_t after_marker = column_after_(ln.indent_col, marker);
        if (i < ln.te && tokens_[i].kind == K::kSpace) {
            it.content_col = column_after_(after_marker, tokens_[i]);
            it.kids.push_back(add_markup_(tokens_[i++]));
        } else {
            it.content_col = after_marker + 1;
        }

        if (i + 2 < ln.te && tokens_[i].kind == K::kCheckboxOpen) {
            it.node.kind = NodeKind::kTaskItem;

            const Token& mark = tokens_[i + 1];
            it.node.checked = (mark.lexeme == "x" || mark.lexeme == "X");
            it.node.source_checked = it.node.checked;
            it.node.mark_off = mark.span.lo;

            for (int k = 0; k < 3; ++k) it.kids.push_back(add_markup_(tokens_[i++]));
            if (i < ln.te && tokens_[i].kind == K::kSpace) it.kids.push_back(add_markup_(tokens_[i++]));

            if (i < ln.te && tokens_[i].kind == K::kTaskId) {
                const Token& id = tokens_[i++];
                uint32_t id_hi = id.span.hi;
                if (id_hi > id.span.lo && source_[id_hi - 1] == '.') --id_hi;
                it.node.has_id = true;
                it.node.aux = span_(id.span.lo, id_hi);
                it.kids.push_back(add_markup_(id));
                if (i < ln.te && tokens_[i].kind == K::kSpace) it.kids.push_back(add_markup_(tokens_[i++]));
            }
        }

        const uint32_t content_end = line_content_end_(ln);
        const uint32_t content_lo =
            (i < ln.te && tokens_[i].kind != K::kNewline) ? tokens_[i].span.lo : content_end;
        it.node.text = trim_span_(content_lo, content_end);

        if (i < ln.te) {
            it.has_pending = true;
            it.pend_tb = i;
            it.pend_te = ln.te;
        }

        // 가장 깊은 level L: marker 가 L 의 item 내용 column 이상이면 그 안에 중첩
        int deepest = -1;
        for (int k = static_cast<int>(lists_.size()) - 1; k >= 0; --k) {
            if (ln.indent_col >= lists_[static_cast<size_t>(k)].item.content_col) {
                deepest = k;
                break;
            }
        }

        const size_t level = static_cast<size_t>(deepest + 1);
        close_lists_(level + 1);

        if (lists_.size() == level + 1) {
            ListFrame& lf = lists_.back();
            if (lf.node.ordered == ordered) {
                lf.items.push_back(close_item_(lf.item));
                lf.item = std::move(it);
                return;
            }
            close_level_();
        }

        if (deepest >= 0) flush_item_pending_(lists_[static_cast<size_t>(deepest)].item);

        ListFrame lf;
        lf.node.kind = NodeKind::kList;
        lf.node.ordered = ordered;
        lf.node.marker_col = ln.indent_col;
        lf.item = std::move(it);
        lists_.push_back(std::move(lf));
    }

    void Parser::continue_item_(const Line& ln) {
        ItemFrame& it = lists_.back().item;
        if (it.has_pending) {
            it.pend_te = ln.te;
            return;
        }
        it.has_pending = true;
        it.pend_tb = ln.tb;
        it.pend_te = ln.te;
    }

    void Parser::attach_block_(NodeId id, uint32_t indent_col) {
        for (int k = static_cast<int>(lists_.size()) - 1; k >= 0; --k) {
            const size_t level = static_cast<size_t>(k);
            if (indent_col < lists_[level].item.content_col) continue;

            close_lists_(level + 1);
            ItemFrame& it = lists_[level].item;
            flush_item_pending_(it);
            it.kids.push_back(id);
            return;
        }

        close_lists_(0);
        emit_block_(id);
    }

    void Parser::flush_item_pending_(ItemFrame& it) {
        if (!it.has_pending) return;
        parse_inline_(it.pend_tb, it.pend_te, it.kids);
        it.has_pending = false;
    }

    NodeId Parser::close_item_(ItemFrame& it) {
        flush_item_pending_(it);
        it.node.span.hi = ast_.node(it.kids.back()).span.hi;
        return finish_(it.node, it.kids);
    }

    void Parser::close_level_() {
        ListFrame lf = std::move(lists_.back());
        lists_.pop_back();

        lf.items.push_back(close_item_(lf.item));
        lf.node.span = span_(ast_.node(lf.items.front()).span.lo, ast_.node(lf.items.back()).span.hi);
        const NodeId lid = finish_(lf.node, lf.items);

        if (lists_.empty()) {
            emit_block_(lid);
            return;
        }

        ItemFrame& parent = lists_.back().item;
        flush_item_pending_(parent);
        parent.kids.push_back(lid);
    }

    void Parser::close_lists_(size_t keep) {
        while (lists_.size() > keep) close_level_();
    }

    void Parser::close_paragraph_() {
        if (!para_open_) return;
        para_open_ = false;

        std::vector<NodeId> kids;
        parse_inline_(para_tb_, para_te_, kids);

        ast::Node n;
        n.kind = NodeKind::kParagraph;
        n.span = span_(tokens_[para_tb_].span.lo, tokens_[para_te_ - 1].span.hi);
        emit_block_(finish_(n, kids));
    }

} // namespace specdoc
