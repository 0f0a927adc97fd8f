// frontend/include/specdoc/lex/Lexer.hpp
#pragma once
#include <specdoc/lex/Token.hpp>
#include <specdoc/diag/Diagnostic.hpp>

#include <optional>
#include <string_view>
#include <vector>


namespace specdoc {

    /// @brief 줄 단위 상태 기계 lexer.
    ///        토큰은 빈틈 없이 입력 전체를 덮는다 (kEof 제외).
    ///        구분자 사이 공백은 항상 0개 이상을 허용한다.
    class Lexer {
    public:
        Lexer(std::string_view source, std::uint32_t file_id)
            : Lexer(source, file_id, nullptr) {}

        Lexer(std::string_view source, std::uint32_t file_id, diag::Bag* diags);

        /// @brief UTF-8 검증 후 전체를 토큰화한다. 검증 실패 시 kEof 하나만 반환.
        std::vector<Token> lex_all();

        /// @brief [lo, hi) 를 토큰화한다. lo 는 줄 시작, hi 는 줄 시작이거나 끝이어야 한다.
        ///        fence 상태는 닫힌 상태에서 시작한다.
        std::vector<Token> lex_range(uint32_t lo, uint32_t hi);

        /// @brief 마지막 lex 가 fence 내부에서 끝났는지 (닫히지 않은 ```)
        bool ended_in_fence() const { return fence_len_ != 0; }

        /// @brief [lo, hi) 만 UTF-8 검증한다. 실패 시 kInvalidUtf8(fatal) 보고.
        bool validate_range(uint32_t lo, uint32_t hi);

    private:
        struct LineBounds {
            uint32_t lo = 0;      // 줄 시작
            uint32_t end = 0;     // 내용 끝 (개행 직전)
            uint32_t nl_hi = 0;   // 개행 포함 끝
        };

        LineBounds line_bounds_(uint32_t lo, uint32_t hi) const;

        void lex_line_(const LineBounds& ln, std::vector<Token>& out);
        bool lex_fence_body_line_(const LineBounds& ln, std::vector<Token>& out);
        bool try_heading_(uint32_t p, const LineBounds& ln, std::vector<Token>& out);
        bool try_fence_open_(uint32_t p, const LineBounds& ln, std::vector<Token>& out);
        bool try_list_item_(uint32_t p, const LineBounds& ln, std::vector<Token>& out);
        void lex_task_tail_(uint32_t p, const LineBounds& ln, std::vector<Token>& out);
        void lex_inline_(uint32_t p, uint32_t end, std::vector<Token>& out);

        uint32_t skip_ws_(uint32_t p, uint32_t end) const;
        void emit_(std::vector<Token>& out, syntax::TokenKind k, uint32_t lo, uint32_t hi) const;
        void emit_text_(std::vector<Token>& out, uint32_t lo, uint32_t hi) const;
        void emit_newline_(const LineBounds& ln, std::vector<Token>& out) const;

        void report_invalid_utf8(uint32_t bad_off);

        std::string_view source_;
        uint32_t file_id_ = 0;

        char fence_char_ = 0;
        uint32_t fence_len_ = 0;   // 0 이면 fence 밖

        diag::Bag* diags_ = nullptr;
    };

    /// @brief 전체 토큰화. 실패는 잘못된 UTF-8 뿐이다.
    std::optional<std::vector<Token>> tokenize(std::string_view source, diag::Bag& diags);

    /// @brief 공백/탭
    constexpr bool is_blank_char(char c) { return c == ' ' || c == '\t'; }

} // namespace specdoc
