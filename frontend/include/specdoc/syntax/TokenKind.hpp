// frontend/include/specdoc/syntax/TokenKind.hpp
#pragma once
#include <string_view>
#include <cstdint>


namespace specdoc::syntax {

    enum class TokenKind : uint16_t {
        // special
        kEof = 0,

        // line structure
        kNewline,        // "\n" 또는 "\r\n"
        kBlankLine,      // 공백/탭만 있는 줄 (개행 포함)
        kIndent,         // 줄 앞 공백/탭
        kSpace,          // 마커 사이 공백/탭

        // block markers
        kHeadingMarker,  // # .. ######
        kListMarker,     // - * +  /  1. 1)
        kCheckboxOpen,   // [
        kCheckboxMark,   // ' ' | x | X
        kCheckboxClose,  // ]
        kTaskId,         // 1.2.3 (끝의 '.' 포함 가능)
        kFenceOpen,      // ``` / ~~~ (3+)
        kFenceInfo,      // info string
        kFenceClose,
        kCodeLine,       // fence 내부 한 줄 (개행 제외)

        // inline
        kText,
        kWikilinkOpen,   // [[
        kWikilinkClose,  // ]]
        kCodeTick,       // ` run
        kEmphasisDelim,  // * 또는 _ run
        kEscape,         // \ + punct
    };

    constexpr std::string_view token_kind_name(TokenKind k) {
        switch (k) {
            case TokenKind::kEof: return "eof";
            case TokenKind::kNewline: return "newline";
            case TokenKind::kBlankLine: return "blank_line";
            case TokenKind::kIndent: return "indent";
            case TokenKind::kSpace: return "space";
            case TokenKind::kHeadingMarker: return "heading_marker";
            case TokenKind::kListMarker: return "list_marker";
            case TokenKind::kCheckboxOpen: return "checkbox_open";
            case TokenKind::kCheckboxMark: return "checkbox_mark";
            case TokenKind::kCheckboxClose: return "checkbox_close";
            case TokenKind::kTaskId: return "task_id";
            case TokenKind::kFenceOpen: return "fence_open";
            case TokenKind::kFenceInfo: return "fence_info";
            case TokenKind::kFenceClose: return "fence_close";
            case TokenKind::kCodeLine: return "code_line";
            case TokenKind::kText: return "text";
            case TokenKind::kWikilinkOpen: return "wikilink_open";
            case TokenKind::kWikilinkClose: return "wikilink_close";
            case TokenKind::kCodeTick: return "code_tick";
            case TokenKind::kEmphasisDelim: return "emphasis_delim";
            case TokenKind::kEscape: return "escape";
        }
        return "unknown";
    }

    /// @brief 줄 구조(개행/들여쓰기) 토큰인지
    constexpr bool is_line_trivia(TokenKind k) {
        return k == TokenKind::kNewline || k == TokenKind::kIndent || k == TokenKind::kBlankLine;
    }

} // namespace specdoc::syntax
