// frontend/src/lex/lexer.cpp
#include <wgslink/lex/Lexer.hpp>
#include <wgslink/syntax/Punct.hpp>
#include <wgslink/syntax/TokenKind.hpp>

#include <cctype>
#include <algorithm>


namespace wgslink {

    static bool utf8_validate_strict(std::string_view s, uint32_t& bad_off) {
        auto is_cont = [&](unsigned char b) -> bool {
            return (b & 0xC0) == 0x80;
        };

        size_t i = 0;
        while (i < s.size()) {
            unsigned char b0 = static_cast<unsigned char>(s[i]);

            // ASCII
            if (b0 < 0x80) {
                i += 1;
                continue;
            }

            // continuation byte cannot start a sequence
            if (b0 >= 0x80 && b0 <= 0xBF) {
                bad_off = static_cast<uint32_t>(i);
                return false;
            }

            // 2-byte: C2..DF
            if (b0 >= 0xC2 && b0 <= 0xDF) {
                if (i + 1 >= s.size()) { bad_off = (uint32_t)i; return false; }
                unsigned char b1 = static_cast<unsigned char>(s[i + 1]);
                if (!is_cont(b1)) { bad_off = (uint32_t)i; return false; }
                i += 2;
                continue;
            }

            // 3-byte: E0..EF
            if (b0 >= 0xE0 && b0 <= 0xEF) {
                if (i + 2 >= s.size()) { bad_off = (uint32_t)i; return false; }
                unsigned char b1 = static_cast<unsigned char>(s[i + 1]);
                unsigned char b2 = static_cast<unsigned char>(s[i + 2]);
                if (!is_cont(b1) || !is_cont(b2)) { bad_off = (uint32_t)i; return false; }

                // reject overlong: E0 A0..BF
                if (b0 == 0xE0 && b1 < 0xA0) { bad_off = (uint32_t)i; return false; }

                // reject surrogate: ED 80..9F (U+D800..U+DFFF)
                if (b0 == 0xED && b1 >= 0xA0) { bad_off = (uint32_t)i; return false; }

                i += 3;
                continue;
            }

            // 4-byte: F0..F4
            if (b0 >= 0xF0 && b0 <= 0xF4) {
                if (i + 3 >= s.size()) { bad_off = (uint32_t)i; return false; }
                unsigned char b1 = static_cast<unsigned char>(s[i + 1]);
                unsigned char b2 = static_cast<unsigned char>(s[i + 2]);
                unsigned char b3 = static_cast<unsigned char>(s[i + 3]);
                if (!is_cont(b1) || !is_cont(b2) || !is_cont(b3)) { bad_off = (uint32_t)i; return false; }

                // reject overlong: F0 90..BF
                if (b0 == 0xF0 && b1 < 0x90) { bad_off = (uint32_t)i; return false; }

                // reject > U+10FFFF: F4 80..8F only
                if (b0 == 0xF4 && b1 > 0x8F) { bad_off = (uint32_t)i; return false; }

                i += 4;
                continue;
            }

            // invalid leading byte (C0,C1,F5..FF etc)
            bad_off = static_cast<uint32_t>(i);
            return false;
        }

        return true;
    }

    static bool is_ident_start(char c) {
        unsigned char u = static_cast<unsigned char>(c);
        if (u >= 0x80) return true; // UTF-8 lead/cont bytes: accept as identifier
        return std::isalpha(u) || c == '_';
    }

    static bool is_ident_cont(char c) {
        unsigned char u = static_cast<unsigned char>(c);
        if (u >= 0x80) return true;
        return std::isalnum(u) || c == '_';
    }

    static bool is_digit(char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    }

    static bool is_hex_digit(char c) {
        return std::isxdigit(static_cast<unsigned char>(c)) != 0;
    }

    Lexer::Lexer(std::string_view source, uint32_t file_id, diag::Bag* diags)
        : source_(source), file_id_(file_id), diags_(diags) {}

    bool Lexer::validate_utf8_all(uint32_t& bad_off) const {
        return utf8_validate_strict(source_, bad_off);
    }

    static std::string byte_hex2(unsigned char b) {
        static constexpr char kHex[] = "0123456789ABCDEF";
        std::string s;
        s.push_back(kHex[(b >> 4) & 0xF]);
        s.push_back(kHex[b & 0xF]);
        return s;
    }

    void Lexer::report_invalid_utf8(uint32_t bad_off) {
        if (!diags_) return;

        const uint32_t hi = std::min<uint32_t>(bad_off + 1, (uint32_t)source_.size());
        Span sp{file_id_, bad_off, hi};

        diag::Diagnostic d(diag::Severity::kFatal, diag::Code::kInvalidUtf8, sp);

        // args = offset + offending byte hex
        d.add_arg_int((int)bad_off);

        unsigned char b = 0;
        if (bad_off < source_.size()) {
            b = static_cast<unsigned char>(source_[bad_off]);
        }
        d.add_arg(byte_hex2(b));

        diags_->add(std::move(d));
    }

    void Lexer::report_unterminated_comment(size_t start) {
        if (!diags_) return;
        Span sp{file_id_, static_cast<uint32_t>(start), static_cast<uint32_t>(std::min(start + 2, source_.size()))};
        diags_->add(diag::Diagnostic(diag::Severity::kError, diag::Code::kUnterminatedComment, sp));
    }

    char Lexer::peek(size_t k) const {
        size_t i = pos_ + k;
        if (i >= source_.size()) return '\0';
        return source_[i];
    }

    bool Lexer::eof() const {
        return pos_ >= source_.size();
    }

    char Lexer::bump() {
        if (eof()) return '\0';
        return source_[pos_++];
    }

    void Lexer::skip_ws_and_comments() {
        while (1) {
            // white space
            while (!eof() && std::isspace(static_cast<unsigned char>(peek()))) bump();

            // line comment //
            if (peek() == '/' && peek(1) == '/') {
                bump(); bump();
                while (!eof() && peek() != '\n') bump();
                continue;
            }

            // block comment /* ... */ (WGSL: nesting allowed)
            if (peek() == '/' && peek(1) == '*') {
                const size_t start = pos_;
                bump(); bump();
                uint32_t depth = 1;
                while (!eof() && depth > 0) {
                    if (peek() == '/' && peek(1) == '*') { bump(); bump(); ++depth; continue; }
                    if (peek() == '*' && peek(1) == '/') { bump(); bump(); --depth; continue; }
                    bump();
                }
                if (depth > 0) report_unterminated_comment(start);
                continue;
            }

            break;
        }
    }

    Token Lexer::make_token(syntax::TokenKind kind, size_t start) const {
        Token t;
        t.kind = kind;
        t.span = Span{file_id_, static_cast<uint32_t>(start), static_cast<uint32_t>(pos_)};
        t.lexeme = source_.substr(start, pos_ - start);
        return t;
    }

    Token Lexer::lex_number() {
        const size_t start = pos_;
        bool is_float = false;

        auto scan_digits = [&] {
            bool any = false;
            while (!eof() && is_digit(peek())) { bump(); any = true; }
            return any;
        };

        // hex: 0x1F, 0xFFu
        if (peek() == '0' && (peek(1) == 'x' || peek(1) == 'X') && is_hex_digit(peek(2))) {
            bump(); bump();
            while (!eof() && is_hex_digit(peek())) bump();
            if (peek() == 'i' || peek() == 'u') bump();
            return make_token(syntax::TokenKind::kIntLit, start);
        }

        scan_digits();

        // fraction: 1.5, .5, 1.
        if (peek() == '.' && !is_ident_start(peek(1)) && peek(1) != '.') {
            is_float = true;
            bump(); // .
            scan_digits();
        } else if (peek() == '.' && (peek(1) == 'e' || peek(1) == 'E' || peek(1) == 'f' || peek(1) == 'h')) {
            // 1.e5, 1.f
            is_float = true;
            bump();
        }

        // exponent
        if ((peek() == 'e' || peek() == 'E')
            && (is_digit(peek(1)) || ((peek(1) == '+' || peek(1) == '-') && is_digit(peek(2))))) {
            is_float = true;
            bump();
            if (peek() == '+' || peek() == '-') bump();
            scan_digits();
        }

        // suffix: f/h -> float, i/u -> int
        if (peek() == 'f' || peek() == 'h') {
            is_float = true;
            bump();
        } else if (!is_float && (peek() == 'i' || peek() == 'u')) {
            bump();
        }

        // 붙어 있는 나머지 식별자 문자는 토큰에 포함시켜 checker가 잘못된 리터럴로 보고하게 한다.
        bool malformed = false;
        while (!eof() && is_ident_cont(peek())) { bump(); malformed = true; }

        if (malformed) return make_token(syntax::TokenKind::kError, start);
        return make_token(is_float ? syntax::TokenKind::kFloatLit : syntax::TokenKind::kIntLit, start);
    }

    Token Lexer::lex_ident_or_kw() {
        const size_t start = pos_;
        bump(); // first char
        while (!eof() && is_ident_cont(peek())) bump();

        Token t = make_token(syntax::TokenKind::kIdent, start);
        using K = syntax::TokenKind;

        if (t.lexeme == "true")         { t.kind = K::kKwTrue;         return t; }
        if (t.lexeme == "false")        { t.kind = K::kKwFalse;        return t; }

        if (t.lexeme == "fn")           { t.kind = K::kKwFn;           return t; }
        if (t.lexeme == "struct")       { t.kind = K::kKwStruct;       return t; }
        if (t.lexeme == "var")          { t.kind = K::kKwVar;          return t; }
        if (t.lexeme == "let")          { t.kind = K::kKwLet;          return t; }
        if (t.lexeme == "const")        { t.kind = K::kKwConst;        return t; }
        if (t.lexeme == "override")     { t.kind = K::kKwOverride;     return t; }
        if (t.lexeme == "alias")        { t.kind = K::kKwAlias;        return t; }
        if (t.lexeme == "const_assert") { t.kind = K::kKwConstAssert;  return t; }

        if (t.lexeme == "return")       { t.kind = K::kKwReturn;       return t; }
        if (t.lexeme == "if")           { t.kind = K::kKwIf;           return t; }
        if (t.lexeme == "else")         { t.kind = K::kKwElse;         return t; }
        if (t.lexeme == "switch")       { t.kind = K::kKwSwitch;       return t; }
        if (t.lexeme == "case")         { t.kind = K::kKwCase;         return t; }
        if (t.lexeme == "default")      { t.kind = K::kKwDefault;      return t; }
        if (t.lexeme == "loop")         { t.kind = K::kKwLoop;         return t; }
        if (t.lexeme == "continuing")   { t.kind = K::kKwContinuing;   return t; }
        if (t.lexeme == "for")          { t.kind = K::kKwFor;          return t; }
        if (t.lexeme == "while")        { t.kind = K::kKwWhile;        return t; }
        if (t.lexeme == "break")        { t.kind = K::kKwBreak;        return t; }
        if (t.lexeme == "continue")     { t.kind = K::kKwContinue;     return t; }
        if (t.lexeme == "discard")      { t.kind = K::kKwDiscard;      return t; }

        // enable/requires/diagnostic 등은 문맥 키워드: kIdent로 두고 파서가 lexeme으로 판정한다.
        return t;
    }

    Token Lexer::lex_punct_or_unknown() {
        const size_t start = pos_;

        // maximal munch using k_punct_table
        for (const auto& e : syntax::k_punct_table) {
            const auto s = e.text;
            bool ok = true;
            for (size_t i = 0; i < s.size(); ++i) {
                if (peek(i) != s[i]) { ok = false; break; }
            }
            if (!ok) continue;

            for (size_t i = 0; i < s.size(); ++i) bump();
            return make_token(e.kind, start);
        }

        // unknown single char punct
        bump();
        return make_token(syntax::TokenKind::kUnknownPunct, start);
    }

    void Lexer::emit_eof(std::vector<Token>& out) {
        Token t;
        t.kind = syntax::TokenKind::kEof;
        t.span = Span{file_id_, static_cast<uint32_t>(source_.size()), static_cast<uint32_t>(source_.size())};
        t.lexeme = std::string_view{};
        out.push_back(t);
    }

    std::vector<Token> Lexer::lex_all() {
        std::vector<Token> out;
        out.reserve(source_.size() / 4 + 1);

        // strict utf8 gate
        uint32_t bad_off = 0;
        if (!validate_utf8_all(bad_off)) {
            report_invalid_utf8(bad_off);
            emit_eof(out);
            return out;
        }

        while (!eof()) {
            skip_ws_and_comments();
            if (eof()) break;

            char c = peek();
            unsigned char u = static_cast<unsigned char>(c);

            if (std::isdigit(u) || (c == '.' && is_digit(peek(1)))) {
                out.push_back(lex_number());
                continue;
            }

            // ident / keyword (ASCII or UTF-8 bytes)
            if (is_ident_start(c)) {
                out.push_back(lex_ident_or_kw());
                continue;
            }

            out.push_back(lex_punct_or_unknown());
        }

        uint32_t prev_hi = 0;
        for (size_t i = 0; i < out.size(); ++i) {
            auto& t = out[i];
            t.line_start = (i == 0) || source_.substr(prev_hi, t.span.lo - prev_hi).find('\n') != std::string_view::npos;
            prev_hi = t.span.hi;
        }

        emit_eof(out);
        return out;
    }

} // namespace wgslink
