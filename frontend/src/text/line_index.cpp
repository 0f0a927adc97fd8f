// frontend/src/text/line_index.cpp
#include <specdoc/text/LineIndex.hpp>
#include <specdoc/text/Utf8.hpp>

#include <algorithm>


namespace specdoc {

    LineIndex::LineIndex(std::string_view text) : text_(text) {
        line_starts_.reserve(text.size() / 32 + 1);
        line_starts_.push_back(0);
        for (uint32_t i = 0; i < text.size(); ++i) {
            if (text[i] == '\n') line_starts_.push_back(i + 1);
        }
    }

    uint32_t LineIndex::line_of(uint32_t byte_off) const {
        const uint32_t off = std::min<uint32_t>(byte_off, static_cast<uint32_t>(text_.size()));
        auto it = std::upper_bound(line_starts_.begin(), line_starts_.end(), off);
        return (it == line_starts_.begin()) ? 0 : static_cast<uint32_t>((it - line_starts_.begin()) - 1);
    }

    uint32_t LineIndex::line_start(uint32_t line_index) const {
        if (line_index >= line_starts_.size()) return static_cast<uint32_t>(text_.size());
        return line_starts_[line_index];
    }

    uint32_t LineIndex::line_end(uint32_t line_index) const {
        if (line_index >= line_starts_.size()) return static_cast<uint32_t>(text_.size());
        uint32_t end = (line_index + 1 < line_starts_.size())
            ? line_starts_[line_index + 1] - 1
            : static_cast<uint32_t>(text_.size());
        if (end > line_starts_[line_index] && end <= text_.size() && end > 0 && text_[end - 1] == '\r') {
            // "\r\n" 의 '\r' 은 줄 내용이 아니다
            if (end < text_.size() && text_[end] == '\n') --end;
        }
        return end;
    }

    LineCol LineIndex::offset_to_line_col(uint32_t byte_off) const {
        const uint32_t off = std::min<uint32_t>(byte_off, static_cast<uint32_t>(text_.size()));
        const uint32_t idx = line_of(off);
        const uint32_t start = line_starts_[idx];

        LineCol lc;
        lc.line = idx + 1;
        lc.col = text::display_width_between(text_, start, off) + 1;
        return lc;
    }

    uint32_t LineIndex::line_col_to_offset(uint32_t line, uint32_t byte_col) const {
        if (line == 0) return 0;
        const uint32_t idx = line - 1;
        if (idx >= line_starts_.size()) return static_cast<uint32_t>(text_.size());
        const uint32_t start = line_starts_[idx];
        const uint32_t end = line_end(idx);
        const uint32_t col = (byte_col == 0) ? 0 : byte_col - 1;
        return std::min<uint32_t>(start + col, end);
    }

    std::string_view LineIndex::line_text(uint32_t line_index) const {
        if (line_index >= line_starts_.size()) return {};
        const uint32_t lo = line_starts_[line_index];
        return text_.substr(lo, line_end(line_index) - lo);
    }

} // namespace specdoc
