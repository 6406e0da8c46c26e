// frontend/include/wgslink/syntax/Punct.hpp
#pragma once
#include <wgslink/syntax/TokenKind.hpp>

#include <array>
#include <string_view>


namespace wgslink::syntax {

    // Maximal munch: longer punctuations first.
    struct PunctEntry {
        std::string_view text;
        TokenKind kind;
    };


    inline constexpr std::array<PunctEntry, 49> k_punct_table = {{
        {"<<=", TokenKind::kShlAssign},
        {">>=", TokenKind::kShrAssign},

        {"->",  TokenKind::kArrow},

        {"<<",  TokenKind::kShiftLeft},
        {">>",  TokenKind::kShiftRight},

        {"&&",  TokenKind::kAmpAmp},
        {"||",  TokenKind::kPipePipe},

        {"==",  TokenKind::kEqEq},
        {"!=",  TokenKind::kBangEq},
        {"<=",  TokenKind::kLtEq},
        {">=",  TokenKind::kGtEq},

        {"++",  TokenKind::kPlusPlus},
        {"--",  TokenKind::kMinusMinus},
        {"+=",  TokenKind::kPlusAssign},
        {"-=",  TokenKind::kMinusAssign},
        {"*=",  TokenKind::kStarAssign},
        {"/=",  TokenKind::kSlashAssign},
        {"%=",  TokenKind::kPercentAssign},
        {"&=",  TokenKind::kAmpAssign},
        {"|=",  TokenKind::kPipeAssign},
        {"^=",  TokenKind::kCaretAssign},

        {"@",   TokenKind::kAt},
        {"#",   TokenKind::kHash},

        {"(",   TokenKind::kLParen},
        {")",   TokenKind::kRParen},
        {"{",   TokenKind::kLBrace},
        {"}",   TokenKind::kRBrace},
        {"[",   TokenKind::kLBracket},
        {"]",   TokenKind::kRBracket},

        {",",   TokenKind::kComma},
        {":",   TokenKind::kColon},
        {";",   TokenKind::kSemicolon},
        {".",   TokenKind::kDot},

        {"=",   TokenKind::kAssign},
        {"+",   TokenKind::kPlus},
        {"-",   TokenKind::kMinus},
        {"*",   TokenKind::kStar},
        {"/",   TokenKind::kSlash},
        {"%",   TokenKind::kPercent},

        {"!",   TokenKind::kBang},
        {"~",   TokenKind::kTilde},
        {"&",   TokenKind::kAmp},
        {"|",   TokenKind::kPipe},
        {"^",   TokenKind::kCaret},

        {"<",   TokenKind::kLt},
        {">",   TokenKind::kGt},

        // naga_oil 경로 구분자(`a::b`)는 ':' 두 개로 렉싱된다.
        {"?",   TokenKind::kUnknownPunct},
        {"$",   TokenKind::kUnknownPunct},
        {"\\",  TokenKind::kUnknownPunct},
    }};

} // namespace wgslink::syntax
