// frontend/src/parse/common/incremental_parse.cpp
#include <specdoc/parse/IncrementalParse.hpp>
#include <specdoc/doc/Document.hpp>
#include <specdoc/lex/Lexer.hpp>
#include <specdoc/parse/Parser.hpp>

#include <algorithm>
#include <utility>


namespace specdoc {

    namespace {

        size_t find_first_affected_block_(const Document& prev, std::span<const ast::NodeId> top, uint32_t edit_lo) {
            for (size_t i = 0; i < top.size(); ++i) {
                if (edit_lo <= prev.node(top[i]).span.hi) return i;
            }
            return top.empty() ? 0 : top.size() - 1;
        }

        // edit 끝보다 뒤에서 시작하는 첫 BlankLine block. blank line 에서는 모든 container 가 닫힌다.
        size_t find_resync_block_(const Document& prev, std::span<const ast::NodeId> top, size_t from, uint32_t edit_hi) {
            for (size_t i = from; i < top.size(); ++i) {
                const auto& n = prev.node(top[i]);
                if (n.kind == ast::NodeKind::kBlankLine && n.span.lo > edit_hi) return i;
            }
            return top.size();
        }

        std::optional<Document> full_rebuild_(const std::string& text,
                                              uint32_t file_id,
                                              diag::Bag& bag,
                                              ReparseMode mode,
                                              IncrementalStats& st) {
            auto doc = parse(text, bag, file_id);
            if (!doc) return std::nullopt;

            st.mode = mode;
            st.reparse_lo = 0;
            st.reparse_hi = static_cast<uint32_t>(text.size());
            st.reused_blocks = 0;
            st.reparsed_blocks = doc->children(doc->root()).size();
            return doc;
        }

    } // namespace

    std::optional<Document> incremental_update(const Document& prev,
                                               EditRange edit,
                                               std::string_view new_text,
                                               diag::Bag& bag,
                                               IncrementalStats* stats) {
        IncrementalStats local{};
        IncrementalStats& st = stats ? *stats : local;
        st = IncrementalStats{};

        // 기준 텍스트는 print() 결과 (checkbox 수정 반영)
        const std::string base = prev.print();
        const uint32_t size = static_cast<uint32_t>(base.size());

        if (edit.lo > edit.hi || edit.hi > size) {
            diag::Diagnostic d(diag::Severity::kError, diag::Code::kEditOutOfRange,
                               Span{prev.file_id(), std::min(edit.lo, size), std::min(edit.hi, size)});
            d.add_arg_int(edit.lo);
            d.add_arg_int(edit.hi);
            d.add_arg_int(size);
            bag.add(std::move(d));
            return std::nullopt;
        }

        auto owned = std::make_shared<std::string>();
        owned->reserve(base.size() - (edit.hi - edit.lo) + new_text.size());
        owned->append(base, 0, edit.lo);
        owned->append(new_text);
        owned->append(base, edit.hi, std::string::npos);
        const std::string& next = *owned;

        const int64_t delta = static_cast<int64_t>(new_text.size()) - static_cast<int64_t>(edit.hi - edit.lo);

        const auto top = (prev.root() == ast::k_invalid_node)
            ? std::span<const ast::NodeId>{}
            : prev.children(prev.root());
        if (top.empty()) {
            return full_rebuild_(next, prev.file_id(), bag, ReparseMode::kFullRebuild, st);
        }

        // 재파싱 시작: 첫 영향 block 의 바로 앞 block (그 block 이 이어받을 수 있으므로)
        const size_t first = find_first_affected_block_(prev, top, edit.lo);
        const size_t start = (first > 0) ? first - 1 : 0;
        const uint32_t region_lo = prev.node(top[start]).span.lo;

        size_t resync = find_resync_block_(prev, top, first, edit.hi);
        uint32_t region_hi = (resync < top.size())
            ? static_cast<uint32_t>(static_cast<int64_t>(prev.node(top[resync]).span.lo) + delta)
            : static_cast<uint32_t>(next.size());

        Lexer lex(next, prev.file_id(), &bag);
        if (!lex.validate_range(region_lo, region_hi)) return std::nullopt;
        auto toks = lex.lex_range(region_lo, region_hi);

        // 닫히지 않은 fence 가 구간 밖으로 이어지면 끝까지 넓힌다
        if (lex.ended_in_fence() && resync < top.size()) {
            const uint32_t end = static_cast<uint32_t>(next.size());
            if (!lex.validate_range(region_hi, end)) return std::nullopt;
            resync = top.size();
            region_hi = end;
            toks = lex.lex_range(region_lo, region_hi);
        }

        auto arena = std::make_shared<ast::NodeArena>(prev.arena());
        Parser parser(toks, next, *arena);
        const auto fresh = parser.parse_blocks();

        std::vector<ast::NodeId> kids(top.begin(), top.begin() + static_cast<std::ptrdiff_t>(start));
        kids.insert(kids.end(), fresh.begin(), fresh.end());
        for (size_t i = resync; i < top.size(); ++i) {
            arena->shift_subtree(top[i], delta);
            kids.push_back(top[i]);
        }

        ast::Node doc_node;
        doc_node.kind = ast::NodeKind::kDocument;
        doc_node.span = Span{0, 0, static_cast<uint32_t>(next.size())};
        const ast::NodeId root = arena->add(doc_node);
        arena->set_children(root, kids);

        // 재사용 노드의 원문은 이제 print() 결과다
        for (ast::NodeId id = 0; id < arena->size(); ++id) {
            ast::Node& n = arena->node_mut(id);
            if (n.kind == ast::NodeKind::kTaskItem) n.source_checked = n.checked;
        }

        const uint32_t live = arena->subtree_size(root);
        if (arena->size() > k_arena_garbage_factor * static_cast<size_t>(live)) {
            // NodeId 가 새로 매겨지므로 parse() 가 준 새 세대를 그대로 쓴다
            return full_rebuild_(next, prev.file_id(), bag, ReparseMode::kFallbackFullRebuild, st);
        }

        st.mode = ReparseMode::kIncrementalMerge;
        st.reparse_lo = region_lo;
        st.reparse_hi = region_hi;
        st.reused_blocks = start + (top.size() - resync);
        st.reparsed_blocks = fresh.size();

        Document out;
        out.text_ = owned;
        out.lines_ = std::make_shared<const LineIndex>(*owned);
        out.arena_ = std::move(arena);
        out.root_ = root;
        out.generation_ = prev.generation_;
        out.file_id_ = prev.file_id_;
        return out;
    }

} // namespace specdoc
