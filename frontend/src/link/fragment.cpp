// frontend/src/link/fragment.cpp
#include <wgslink/link/Fragment.hpp>
#include <wgslink/lex/Lexer.hpp>


namespace wgslink::link {

    Fragment make_fragment(
        const std::vector<Token>& tokens,
        size_t begin,
        size_t end,
        Span span,
        std::optional<std::string> name
    ) {
        Fragment f{};
        f.name = std::move(name);
        f.span = span;

        if (end > tokens.size()) end = tokens.size();
        if (begin < end) f.tokens.reserve(end - begin);

        for (size_t i = begin; i < end; ++i) {
            const auto& t = tokens[i];
            if (t.kind == syntax::TokenKind::kEof) break;
            f.tokens.push_back(FragToken{t.kind, std::string(t.lexeme), Origin::direct(t.span), t.line_start});
        }
        return f;
    }

    Fragment fragment_from_source(
        std::string_view source,
        uint32_t file_id,
        std::optional<std::string> name,
        diag::Bag* diags
    ) {
        Lexer lex(source, file_id, diags);
        const auto toks = lex.lex_all();
        const Span whole{file_id, 0, static_cast<uint32_t>(source.size())};
        return make_fragment(toks, 0, toks.size(), whole, std::move(name));
    }

} // namespace wgslink::link
