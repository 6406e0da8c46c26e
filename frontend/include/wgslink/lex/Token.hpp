// frontend/include/wgslink/lex/Token.hpp
#pragma once
#include <string_view>
#include <wgslink/text/Span.hpp>
#include <wgslink/syntax/TokenKind.hpp>


namespace wgslink {

    struct Token {
        syntax::TokenKind kind = syntax::TokenKind::kError;
        Span span{};
        std::string_view lexeme{};
        bool line_start = false;   // 앞 토큰과 다른 줄에서 시작한다 (첫 토큰 포함)
    };

} // namespace wgslink
