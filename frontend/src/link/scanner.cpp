// frontend/src/link/scanner.cpp
#include <wgslink/link/Scanner.hpp>

#include <algorithm>


namespace wgslink::link {

    using K = syntax::TokenKind;

    bool is_reserved_directive(std::string_view name) {
        return std::find(k_reserved_directives.begin(), k_reserved_directives.end(), name)
            != k_reserved_directives.end();
    }

    ScanResult scan_references(const std::vector<FragToken>& tokens, const ScanOptions& opt) {
        ScanResult out{};
        out.residual.reserve(tokens.size());

        for (size_t i = 0; i < tokens.size(); ++i) {
            const auto& t = tokens[i];

            const bool marker = t.kind == K::kHash
                             && i + 1 < tokens.size()
                             && syntax::is_ident_like(tokens[i + 1].kind);
            if (!marker) {
                out.residual.push_back(t);
                continue;
            }

            // `if`/`else`는 키워드로 렉싱되므로 kind가 아니라 텍스트로 판정한다.
            const auto& name_tok = tokens[i + 1];
            if (opt.directives && is_reserved_directive(name_tok.text)) {
                out.has_directive = true;
                out.residual.push_back(t);
                out.residual.push_back(name_tok);
                ++i;
                continue;
            }

            const bool has_args = i + 2 < tokens.size() && tokens[i + 2].kind == K::kLParen;

            ImportReference ref{};
            ref.name = name_tok.text;
            ref.call_site = name_tok.origin;
            ref.has_args = has_args;
            out.imports.push_back(std::move(ref));

            // call 형태면 이름을 남겨 `name(args)`가 그대로 출력되게 한다.
            if (has_args) out.residual.push_back(name_tok);
            ++i;
        }

        return out;
    }

} // namespace wgslink::link
