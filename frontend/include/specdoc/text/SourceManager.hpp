// frontend/include/specdoc/text/SourceManager.hpp
#pragma once
#include <specdoc/text/LineIndex.hpp>
#include <specdoc/text/Span.hpp>

#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <vector>


namespace specdoc {

    struct Snippet {
        std::string_view line_text{};
        uint32_t line_no = 1;           // 1-based
        uint32_t col = 1;               // 1-based, DISPLAY COLUMNS (location)
        uint32_t caret_cols_before = 0; // number of spaces before '^'
        uint32_t caret_cols_len = 1;    // number of '^'
    };

    struct SnippetBlock {
        uint32_t first_line_no = 1;             // 1-based
        std::vector<std::string_view> lines;    // [first_line_no ...]
        uint32_t caret_line_offset = 0;         // lines[]에서 캐럿이 찍힐 줄 (0-based)
        uint32_t caret_cols_before = 0;
        uint32_t caret_cols_len = 1;
        uint32_t col = 1;                       // caret 시작 col (1-based)
    };

    class SourceManager {
    public:
        SourceManager() = default;
        SourceManager(const SourceManager&) = delete;
        SourceManager& operator=(const SourceManager&) = delete;
        SourceManager(SourceManager&&) = default;
        SourceManager& operator=(SourceManager&&) = default;

        // Adds a "file" (or selector buffer). file_id 반환
        uint32_t add(std::string name, std::string content);

        std::string_view name(uint32_t file_id) const;
        std::string_view content(uint32_t file_id) const;
        const LineIndex& lines(uint32_t file_id) const;

        // byte_off -> (line, display-col)
        LineCol line_col(uint32_t file_id, uint32_t byte_off) const;

        // single-line snippet for span
        Snippet snippet_for_span(const Span& sp) const;

        /// @brief span 기준으로 여러 줄 컨텍스트 스니펫을 생성한다.
        /// @param context_lines 위/아래로 추가로 보여줄 줄 수 (예: 2)
        SnippetBlock snippet_block_for_span(const Span& sp, uint32_t context_lines) const;

    private:
        struct File {
            std::string name;
            std::string content;
            LineIndex index;
        };

        // deque: LineIndex 가 content 를 view 로 잡고 있으므로 재배치 금지
        std::deque<File> files_;
    };

} // namespace specdoc
