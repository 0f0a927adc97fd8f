// frontend/include/specdoc/lex/Token.hpp
#pragma once
#include <specdoc/syntax/TokenKind.hpp>
#include <specdoc/text/Span.hpp>

#include <string_view>


namespace specdoc {

    struct Token {
        syntax::TokenKind kind = syntax::TokenKind::kEof;
        Span span{};
        std::string_view lexeme{};
    };

} // namespace specdoc
