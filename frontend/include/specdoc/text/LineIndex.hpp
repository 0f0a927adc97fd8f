// frontend/include/specdoc/text/LineIndex.hpp
#pragma once
#include <cstdint>
#include <string_view>
#include <vector>


namespace specdoc {

    struct LineCol {
        uint32_t line = 1; // 1-based
        uint32_t col  = 1; // 1-based, DISPLAY COLUMNS
    };

    /// @brief byte offset <-> line/column 매핑.
    ///        line_starts 는 오름차순이며 항상 0을 포함한다.
    class LineIndex {
    public:
        LineIndex() : line_starts_{0} {}
        explicit LineIndex(std::string_view text);

        uint32_t line_count() const { return static_cast<uint32_t>(line_starts_.size()); }

        /// @brief 0-based line index of the line holding byte_off. O(log n)
        uint32_t line_of(uint32_t byte_off) const;

        /// @brief start offset of 0-based line
        uint32_t line_start(uint32_t line_index) const;

        /// @brief end offset (exclusive) of 0-based line, excluding "\n" / "\r\n".
        uint32_t line_end(uint32_t line_index) const;

        /// @brief byte_off -> (1-based line, 1-based display column).
        ///        byte_off 가 text 크기를 넘으면 끝으로 clamp 한다.
        LineCol offset_to_line_col(uint32_t byte_off) const;

        /// @brief 1-based (line, byte column) -> byte offset. 범위를 넘으면 clamp.
        uint32_t line_col_to_offset(uint32_t line, uint32_t byte_col) const;

        std::string_view line_text(uint32_t line_index) const;

        const std::vector<uint32_t>& line_starts() const { return line_starts_; }

    private:
        std::string_view text_{};
        std::vector<uint32_t> line_starts_;
    };

} // namespace specdoc
