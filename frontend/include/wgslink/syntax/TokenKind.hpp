// frontend/include/wgslink/syntax/TokenKind.hpp
#pragma once
#include <string_view>
#include <cstdint>
#include <optional>


namespace wgslink::syntax {

    enum class TokenKind : uint16_t {
        // special
        kEof = 0,
        kError,

        // identifiers / literals
        kIdent,
        kIntLit,
        kFloatLit,

        kKwTrue,
        kKwFalse,

        // decl keywords
        kKwFn,
        kKwStruct,
        kKwVar,
        kKwLet,
        kKwConst,
        kKwOverride,
        kKwAlias,
        kKwConstAssert,

        // stmt keywords
        kKwReturn,
        kKwIf,
        kKwElse,
        kKwSwitch,
        kKwCase,
        kKwDefault,
        kKwLoop,
        kKwContinuing,
        kKwFor,
        kKwWhile,
        kKwBreak,
        kKwContinue,
        kKwDiscard,

        // punct
        kArrow,         // ->
        kAt,            // @
        kHash,          // #  (import marker / preprocessor directive)

        kLParen,
        kRParen,
        kLBrace,
        kRBrace,
        kLBracket,
        kRBracket,

        kComma,
        kColon,
        kSemicolon,
        kDot,

        kAssign,        // =
        kPlusAssign,
        kMinusAssign,
        kStarAssign,
        kSlashAssign,
        kPercentAssign,
        kAmpAssign,
        kPipeAssign,
        kCaretAssign,
        kShlAssign,     // <<=
        kShrAssign,     // >>=

        kPlusPlus,
        kMinusMinus,

        kPlus,
        kMinus,
        kStar,
        kSlash,
        kPercent,

        kBang,
        kTilde,
        kAmp,
        kPipe,
        kCaret,

        kAmpAmp,
        kPipePipe,

        kEqEq,
        kBangEq,
        kLt,
        kGt,
        kLtEq,
        kGtEq,
        kShiftLeft,
        kShiftRight,

        kUnknownPunct,
    };

    constexpr std::string_view token_kind_name(TokenKind k) {
        switch (k) {
            case TokenKind::kEof: return "eof";
            case TokenKind::kError: return "error";
            case TokenKind::kIdent: return "ident";
            case TokenKind::kIntLit: return "int_lit";
            case TokenKind::kFloatLit: return "float_lit";

            case TokenKind::kKwTrue: return "true";
            case TokenKind::kKwFalse: return "false";

            case TokenKind::kKwFn: return "fn";
            case TokenKind::kKwStruct: return "struct";
            case TokenKind::kKwVar: return "var";
            case TokenKind::kKwLet: return "let";
            case TokenKind::kKwConst: return "const";
            case TokenKind::kKwOverride: return "override";
            case TokenKind::kKwAlias: return "alias";
            case TokenKind::kKwConstAssert: return "const_assert";

            case TokenKind::kKwReturn: return "return";
            case TokenKind::kKwIf: return "if";
            case TokenKind::kKwElse: return "else";
            case TokenKind::kKwSwitch: return "switch";
            case TokenKind::kKwCase: return "case";
            case TokenKind::kKwDefault: return "default";
            case TokenKind::kKwLoop: return "loop";
            case TokenKind::kKwContinuing: return "continuing";
            case TokenKind::kKwFor: return "for";
            case TokenKind::kKwWhile: return "while";
            case TokenKind::kKwBreak: return "break";
            case TokenKind::kKwContinue: return "continue";
            case TokenKind::kKwDiscard: return "discard";

            case TokenKind::kArrow: return "->";
            case TokenKind::kAt: return "@";
            case TokenKind::kHash: return "#";

            case TokenKind::kLParen: return "(";
            case TokenKind::kRParen: return ")";
            case TokenKind::kLBrace: return "{";
            case TokenKind::kRBrace: return "}";
            case TokenKind::kLBracket: return "[";
            case TokenKind::kRBracket: return "]";

            case TokenKind::kComma: return ",";
            case TokenKind::kColon: return ":";
            case TokenKind::kSemicolon: return ";";
            case TokenKind::kDot: return ".";

            case TokenKind::kAssign: return "=";
            case TokenKind::kPlusAssign: return "+=";
            case TokenKind::kMinusAssign: return "-=";
            case TokenKind::kStarAssign: return "*=";
            case TokenKind::kSlashAssign: return "/=";
            case TokenKind::kPercentAssign: return "%=";
            case TokenKind::kAmpAssign: return "&=";
            case TokenKind::kPipeAssign: return "|=";
            case TokenKind::kCaretAssign: return "^=";
            case TokenKind::kShlAssign: return "<<=";
            case TokenKind::kShrAssign: return ">>=";

            case TokenKind::kPlusPlus: return "++";
            case TokenKind::kMinusMinus: return "--";

            case TokenKind::kPlus: return "+";
            case TokenKind::kMinus: return "-";
            case TokenKind::kStar: return "*";
            case TokenKind::kSlash: return "/";
            case TokenKind::kPercent: return "%";

            case TokenKind::kBang: return "!";
            case TokenKind::kTilde: return "~";
            case TokenKind::kAmp: return "&";
            case TokenKind::kPipe: return "|";
            case TokenKind::kCaret: return "^";

            case TokenKind::kAmpAmp: return "&&";
            case TokenKind::kPipePipe: return "||";

            case TokenKind::kEqEq: return "==";
            case TokenKind::kBangEq: return "!=";
            case TokenKind::kLt: return "<";
            case TokenKind::kGt: return ">";
            case TokenKind::kLtEq: return "<=";
            case TokenKind::kGtEq: return ">=";
            case TokenKind::kShiftLeft: return "<<";
            case TokenKind::kShiftRight: return ">>";

            case TokenKind::kUnknownPunct: return "unknown_punct";
        }
        return "unknown";
    }

    /// @brief token_kind_name의 역변환 (export index 로딩용).
    constexpr std::optional<TokenKind> token_kind_from_name(std::string_view name) {
        for (uint16_t i = 0; i <= static_cast<uint16_t>(TokenKind::kUnknownPunct); ++i) {
            const auto k = static_cast<TokenKind>(i);
            if (token_kind_name(k) == name) return k;
        }
        return std::nullopt;
    }

    /// @brief 키워드도 `#name` 마커의 name 자리에 올 수 있으므로(예: #if, #else) 식별자처럼 취급한다.
    constexpr bool is_ident_like(TokenKind k) {
        return k == TokenKind::kIdent
            || (k >= TokenKind::kKwTrue && k <= TokenKind::kKwDiscard);
    }

    constexpr bool is_literal(TokenKind k) {
        return k == TokenKind::kIntLit || k == TokenKind::kFloatLit;
    }

} // namespace wgslink::syntax
