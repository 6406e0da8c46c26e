// frontend/src/link/renderer.cpp
#include <wgslink/link/Renderer.hpp>

#include <algorithm>


namespace wgslink::link {

    void ByteRangeOriginTable::open_range(uint32_t start, Origin origin) {
        if (!entries_.empty()) entries_.back().hi = start;
        entries_.push_back(OriginRange{start, start, origin});
    }

    void ByteRangeOriginTable::finish(uint32_t total) {
        if (entries_.empty()) return;
        entries_.front().lo = 0;
        entries_.back().hi = total;
    }

    const OriginRange* ByteRangeOriginTable::lookup(uint32_t offset) const {
        if (entries_.empty()) return nullptr;

        // offset보다 큰 첫 시작점 바로 앞이 offset을 포함하는 구간이다.
        auto it = std::upper_bound(
            entries_.begin(), entries_.end(), offset,
            [](uint32_t off, const OriginRange& r) { return off < r.lo; }
        );
        if (it == entries_.begin()) return &entries_.front();
        return &*(it - 1);
    }

    namespace {

        using K = syntax::TokenKind;

        class TextBuilder {
        public:
            void push(const FragToken& t) {
                // 지시어는 원본의 줄 끝까지만 이어진다.
                if (in_directive_ && t.line_start) {
                    new_line();
                    in_directive_ = false;
                }

                consume_prev(t.kind);
                if (t.kind == K::kHash) {
                    new_line();
                    in_directive_ = true;
                }

                table_.open_range(static_cast<uint32_t>(text_.size()), t.origin);
                text_ += t.text;
                push_post(t.kind);
            }

            RenderedModule finish() {
                while (!text_.empty() && text_.back() == ' ') text_.pop_back();
                table_.finish(static_cast<uint32_t>(text_.size()));

                RenderedModule out{};
                out.text = std::move(text_);
                out.table = std::move(table_);
                return out;
            }

        private:
            void trim_space() {
                if (!text_.empty() && text_.back() == ' ') text_.pop_back();
            }

            void new_line() {
                trim_space();
                if (!text_.empty() && text_.back() != '\n') text_.push_back('\n');
            }

            void consume_prev(K k) {
                switch (k) {
                    case K::kColon:
                    case K::kComma:
                    case K::kDot:
                    case K::kSemicolon:
                    case K::kRParen:
                    case K::kRBracket:
                    case K::kRBrace:
                    case K::kLParen:
                    case K::kLBracket:
                        trim_space();
                        break;
                    default:
                        break;
                }
            }

            void push_post(K k) {
                switch (k) {
                    case K::kSemicolon:
                    case K::kLBrace:
                    case K::kRBrace:
                        text_.push_back('\n');
                        return;

                    // `:` / `.` / `@` / `#` 뒤에는 공백을 두지 않는다 (지시어 텍스트가 한 줄로 유지된다).
                    case K::kColon:
                    case K::kDot:
                    case K::kAt:
                    case K::kHash:
                    case K::kLParen:
                    case K::kLBracket:
                        return;

                    default:
                        text_.push_back(' ');
                        return;
                }
            }

            std::string text_;
            ByteRangeOriginTable table_;
            bool in_directive_ = false;
        };

    } // namespace

    RenderedModule render_tokens(const std::vector<FragToken>& tokens) {
        TextBuilder b{};
        for (const auto& t : tokens) b.push(t);
        return b.finish();
    }

    RenderedModule render(const StitchedModule& module) {
        TextBuilder b{};
        for (const auto& f : module.closure) {
            for (const auto& t : f.tokens) b.push(t);
        }
        for (const auto& t : module.root.tokens) b.push(t);
        return b.finish();
    }

} // namespace wgslink::link
