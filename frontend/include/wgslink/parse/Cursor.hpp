// frontend/include/wgslink/parse/Cursor.hpp
#pragma once
#include <wgslink/lex/Token.hpp>

#include <cstddef>
#include <vector>


namespace wgslink {

    /// @brief 토큰 벡터 위를 움직이는 읽기 전용 커서. 마지막 토큰은 항상 kEof여야 한다.
    class Cursor {
    public:
        explicit Cursor(const std::vector<Token>& tokens) : tokens_(tokens) {}

        const Token& peek(size_t k = 0) const {
            const size_t i = pos_ + k;
            if (i >= tokens_.size()) return tokens_.back();
            return tokens_[i];
        }

        bool at(syntax::TokenKind k) const {
            return peek().kind == k;
        }

        bool at_lexeme(std::string_view s) const {
            return peek().lexeme == s && peek().kind != syntax::TokenKind::kEof;
        }

        bool eat(syntax::TokenKind k) {
            if (!at(k)) return false;
            ++pos_;
            return true;
        }

        const Token& prev() const {
            if (pos_ == 0) return peek();
            const size_t i = pos_ - 1;
            if (i >= tokens_.size()) return tokens_.back();
            return tokens_[i];
        }

        const Token& bump() {
            if (pos_ + 1 >= tokens_.size()) return tokens_.back(); // eof는 소비하지 않는다
            return tokens_[pos_++];
        }

        bool at_eof() const { return at(syntax::TokenKind::kEof); }

        size_t pos() const { return pos_; }
        void rewind(size_t p) { pos_ = p; }

    private:
        const std::vector<Token>& tokens_;
        size_t pos_ = 0;
    };

} // namespace wgslink
