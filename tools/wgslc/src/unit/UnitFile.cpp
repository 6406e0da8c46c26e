// tools/wgslc/src/unit/UnitFile.cpp
#include <wgslc/unit/UnitFile.hpp>

#include <wgslink/lex/Lexer.hpp>
#include <wgslink/os/File.hpp>
#include <wgslink/parse/Cursor.hpp>


namespace wgslc::unit {

    namespace {

        using K = wgslink::syntax::TokenKind;

        class UnitParser {
        public:
            UnitParser(const std::vector<wgslink::Token>& tokens, wgslink::diag::Bag& bag)
                : cursor_(tokens), tokens_(tokens), bag_(bag) {}

            bool parse(UnitFile& out) {
                bool seen_unit = false;

                while (!cursor_.at_eof()) {
                    if (at_word("unit")) {
                        if (seen_unit) return fail_expected("'fragment' declaration");
                        seen_unit = true;
                        cursor_.bump();

                        const wgslink::Token* name = nullptr;
                        if (!expect_ident("unit name", &name)) return false;
                        out.name = std::string(name->lexeme);
                        out.name_span = name->span;
                        if (!expect(K::kSemicolon, "';'")) return false;
                        continue;
                    }

                    if (at_word("requires")) {
                        cursor_.bump();
                        do {
                            const wgslink::Token* dep = nullptr;
                            if (!expect_ident("unit name", &dep)) return false;
                            out.requires_units.push_back(RequiresDecl{std::string(dep->lexeme), dep->span});
                        } while (cursor_.eat(K::kComma));
                        if (!expect(K::kSemicolon, "';'")) return false;
                        continue;
                    }

                    break;
                }

                while (!cursor_.at_eof()) {
                    FragmentDecl decl{};
                    if (!parse_fragment(decl)) return false;
                    out.fragments.push_back(std::move(decl));
                }
                return true;
            }

        private:
            bool parse_fragment(FragmentDecl& decl) {
                if (cursor_.at(K::kAt)) {
                    cursor_.bump();
                    if (!at_word("export")) return fail_expected("'export'");
                    cursor_.bump();
                    if (!expect(K::kLParen, "'('")) return false;

                    const wgslink::Token* ex = nullptr;
                    if (!expect_ident("export name", &ex)) return false;
                    decl.export_name = std::string(ex->lexeme);

                    if (!expect(K::kRParen, "')'")) return false;
                }

                if (!at_word("fragment")) return fail_expected("'fragment'");
                cursor_.bump();

                const wgslink::Token* name = nullptr;
                if (!expect_ident("fragment constant name", &name)) return false;
                decl.constant = std::string(name->lexeme);
                decl.constant_span = name->span;

                if (!expect(K::kLBrace, "'{'")) return false;
                const size_t open = cursor_.pos() - 1;

                // 중괄호 짝 맞추기. 본문은 WGSL이라 그 이상은 보지 않는다.
                uint32_t depth = 1;
                while (true) {
                    if (cursor_.at_eof()) return fail_eof("'}' to close fragment '" + decl.constant + "'");
                    const auto& t = cursor_.peek();
                    if (t.kind == K::kLBrace) ++depth;
                    if (t.kind == K::kRBrace && --depth == 0) break;
                    cursor_.bump();
                }
                const size_t close = cursor_.pos();
                cursor_.bump(); // '}'

                const wgslink::Span body{
                    tokens_[open].span.file_id,
                    tokens_[open].span.hi,
                    tokens_[close].span.lo,
                };
                decl.fragment = wgslink::link::make_fragment(tokens_, open + 1, close, body, decl.export_name);
                return true;
            }

            bool at_word(std::string_view w) const {
                return cursor_.peek().kind == K::kIdent && cursor_.peek().lexeme == w;
            }

            bool expect(K k, std::string_view what) {
                if (cursor_.eat(k)) return true;
                return fail_expected(what);
            }

            bool expect_ident(std::string_view what, const wgslink::Token** out) {
                if (cursor_.peek().kind != K::kIdent) return fail_expected(what);
                const auto& t = cursor_.bump();
                if (out) *out = &t;
                return true;
            }

            bool fail_expected(std::string_view what) {
                const auto& t = cursor_.peek();
                if (t.kind == K::kEof) return fail_eof(what);

                wgslink::diag::Diagnostic d(wgslink::diag::Severity::kError, wgslink::diag::Code::kHostExpectedToken, t.span);
                d.add_arg(what);
                d.add_arg(t.lexeme);
                bag_.add(std::move(d));
                return false;
            }

            bool fail_eof(std::string_view what) {
                wgslink::diag::Diagnostic d(
                    wgslink::diag::Severity::kError,
                    wgslink::diag::Code::kHostUnexpectedEof,
                    cursor_.peek().span
                );
                d.add_arg(what);
                bag_.add(std::move(d));
                return false;
            }

            wgslink::Cursor cursor_;
            const std::vector<wgslink::Token>& tokens_;
            wgslink::diag::Bag& bag_;
        };

    } // namespace

    bool parse_unit_file(
        const wgslink::SourceManager& sm,
        uint32_t file_id,
        UnitFile& out,
        wgslink::diag::Bag& bag
    ) {
        out = UnitFile{};
        out.file_id = file_id;
        out.name = wgslink::path_stem(std::string(sm.name(file_id)));
        out.name_span = wgslink::Span{file_id, 0, 0};

        const uint32_t before = bag.issue_count();
        wgslink::Lexer lex(sm.content(file_id), file_id, &bag);
        const auto tokens = lex.lex_all();
        if (bag.issue_count() != before) return false;

        UnitParser p(tokens, bag);
        return p.parse(out);
    }

} // namespace wgslc::unit
