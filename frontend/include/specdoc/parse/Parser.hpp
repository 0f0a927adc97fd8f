// frontend/include/specdoc/parse/Parser.hpp
#pragma once
#include <specdoc/parse/Cursor.hpp>
#include <specdoc/ast/Nodes.hpp>

#include <string_view>
#include <vector>


namespace specdoc {

    /// @brief 토큰 스트림 -> NodeArena.
    ///        1) block pass: 줄 단위 + 명시적 container stack (header/fence/list/paragraph)
    ///        2) inline pass: block 별 토큰 구간 (wikilink/code span/emphasis)
    ///        실패하지 않는다. 해석 불가한 바이트는 Text 로 남는다.
    class Parser {
    public:
        Parser(const std::vector<Token>& tokens, std::string_view source, ast::NodeArena& ast)
            : cursor_(tokens), tokens_(tokens), source_(source), ast_(ast) {}

        /// @brief 전체 입력을 Document 노드 하나로 파싱 (span = [0, source.size()))
        ast::NodeId parse_document();

        /// @brief 최상위 block 들만 순서대로 파싱한다 (incremental 구간 재파싱용)
        std::vector<ast::NodeId> parse_blocks();

    private:
        enum class LineKind : uint8_t {
            kBlank,
            kHeader,
            kFenceOpen,
            kListItem,
            kText,
            kFenceBody,   // fence 내부 줄 (CodeLine / FenceClose / 빈 개행)
        };

        struct Line {
            LineKind kind = LineKind::kText;
            uint32_t tb = 0;        // 첫 토큰 index
            uint32_t te = 0;        // 마지막 토큰 다음 index (개행 포함)
            uint32_t first = 0;     // indent 다음 첫 토큰 index
            uint32_t lo = 0;        // 줄 시작 오프셋
            uint32_t hi = 0;        // 개행 포함 끝 오프셋
            uint32_t indent_col = 0;
        };

        // 열린 list item 하나
        struct ItemFrame {
            ast::Node node{};
            std::vector<ast::NodeId> kids{};
            uint32_t content_col = 0;

            // 아직 inline 파싱하지 않은 토큰 구간
            bool has_pending = false;
            uint32_t pend_tb = 0;
            uint32_t pend_te = 0;
        };

        // 열린 list 하나와 그 안의 현재 item
        struct ListFrame {
            ast::Node node{};
            std::vector<ast::NodeId> items{};
            ItemFrame item{};
        };

        // --------------------
        // common (parse_common.cpp)
        // --------------------
        void split_lines_();
        LineKind classify_line_(uint32_t first) const;
        uint32_t column_after_(uint32_t col, const Token& t) const;
        uint32_t line_content_end_(const Line& ln) const;

        ast::NodeId add_leaf_(ast::NodeKind k, uint32_t lo, uint32_t hi);
        ast::NodeId add_markup_(const Token& t) { return add_leaf_(ast::NodeKind::kMarkup, t.span.lo, t.span.hi); }
        ast::NodeId finish_(ast::Node n, const std::vector<ast::NodeId>& kids);

        Span span_(uint32_t lo, uint32_t hi) const { return Span{0, lo, hi}; }
        Span trim_span_(uint32_t lo, uint32_t hi) const;

        // --------------------
        // block (parse_block.cpp)
        // --------------------
        ast::NodeId parse_header_(const Line& ln);
        ast::NodeId parse_code_block_(size_t& li);
        void open_item_(const Line& ln);
        void continue_item_(const Line& ln);
        void attach_block_(ast::NodeId id, uint32_t indent_col);

        void flush_item_pending_(ItemFrame& it);
        ast::NodeId close_item_(ItemFrame& it);
        void close_level_();
        void close_lists_(size_t keep);
        void close_paragraph_();

        void emit_block_(ast::NodeId id) { out_.push_back(id); }

        // --------------------
        // inline (parse_inline.cpp)
        // --------------------
        void parse_inline_(uint32_t tb, uint32_t te, std::vector<ast::NodeId>& out);

        Cursor cursor_;
        const std::vector<Token>& tokens_;
        std::string_view source_;
        ast::NodeArena& ast_;

        std::vector<Line> lines_{};
        std::vector<ListFrame> lists_{};
        std::vector<ast::NodeId> out_{};

        bool para_open_ = false;
        uint32_t para_tb_ = 0;
        uint32_t para_te_ = 0;
    };

} // namespace specdoc
