// frontend/src/link/mode.cpp
#include <wgslink/link/Mode.hpp>


namespace wgslink::link {

    Mode select_mode(const std::vector<FragToken>& tokens, const ScanOptions& opt) {
        if (!opt.directives) return Mode::kChecked;

        for (size_t i = 0; i + 1 < tokens.size(); ++i) {
            if (tokens[i].kind != syntax::TokenKind::kHash) continue;
            if (!syntax::is_ident_like(tokens[i + 1].kind)) continue;
            if (is_reserved_directive(tokens[i + 1].text)) return Mode::kUnchecked;
        }
        return Mode::kChecked;
    }

} // namespace wgslink::link
