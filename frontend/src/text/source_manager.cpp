// frontend/src/text/source_manager.cpp
#include <specdoc/text/SourceManager.hpp>
#include <specdoc/text/Utf8.hpp>

#include <algorithm>


namespace specdoc {

    uint32_t SourceManager::add(std::string name, std::string content) {
        File& f = files_.emplace_back();
        f.name = std::move(name);
        f.content = std::move(content);
        f.index = LineIndex(f.content);
        return static_cast<uint32_t>(files_.size() - 1);
    }

    std::string_view SourceManager::name(uint32_t file_id) const {
        return files_[file_id].name;
    }

    std::string_view SourceManager::content(uint32_t file_id) const {
        return files_[file_id].content;
    }

    const LineIndex& SourceManager::lines(uint32_t file_id) const {
        return files_[file_id].index;
    }

    LineCol SourceManager::line_col(uint32_t file_id, uint32_t byte_off) const {
        return files_[file_id].index.offset_to_line_col(byte_off);
    }

    Snippet SourceManager::snippet_for_span(const Span& sp) const {
        const auto& f = files_[sp.file_id];
        const uint32_t size = static_cast<uint32_t>(f.content.size());
        const uint32_t lo = std::min<uint32_t>(sp.lo, size);
        const uint32_t hi = std::min<uint32_t>(sp.hi, size);

        const uint32_t idx = f.index.line_of(lo);
        const uint32_t line_start = f.index.line_start(idx);
        const uint32_t line_end = f.index.line_end(idx);
        const std::string_view line_text = f.index.line_text(idx);

        // clamp highlight within this line
        const uint32_t lo_clamped = std::min<uint32_t>(lo, line_end);
        const uint32_t hi_clamped = std::max<uint32_t>(lo_clamped, std::min<uint32_t>(hi, line_end));

        Snippet sn;
        sn.line_text = line_text;
        sn.line_no = idx + 1;
        sn.col = f.index.offset_to_line_col(lo).col;
        sn.caret_cols_before = text::display_width_between(line_text, 0, lo_clamped - line_start);
        sn.caret_cols_len = text::display_width_between(line_text, lo_clamped - line_start, hi_clamped - line_start);
        if (sn.caret_cols_len == 0) sn.caret_cols_len = 1;
        return sn;
    }

    SnippetBlock SourceManager::snippet_block_for_span(const Span& sp, uint32_t context_lines) const {
        const auto& f = files_[sp.file_id];
        const Snippet one = snippet_for_span(sp);

        const uint32_t caret_idx = one.line_no - 1;
        const uint32_t first = (caret_idx > context_lines) ? caret_idx - context_lines : 0;
        const uint32_t last = std::min<uint32_t>(caret_idx + context_lines, f.index.line_count() - 1);

        SnippetBlock blk;
        blk.first_line_no = first + 1;
        for (uint32_t i = first; i <= last; ++i) {
            blk.lines.push_back(f.index.line_text(i));
        }
        blk.caret_line_offset = caret_idx - first;
        blk.caret_cols_before = one.caret_cols_before;
        blk.caret_cols_len = one.caret_cols_len;
        blk.col = one.col;
        return blk;
    }

} // namespace specdoc
