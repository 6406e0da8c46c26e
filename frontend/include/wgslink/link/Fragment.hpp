// frontend/include/wgslink/link/Fragment.hpp
#pragma once
#include <wgslink/diag/Diagnostic.hpp>
#include <wgslink/lex/Token.hpp>
#include <wgslink/text/Origin.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>


namespace wgslink::link {

    /// @brief origin 태그가 붙은 WGSL 토큰. 텍스트를 소유하므로 원본 버퍼보다 오래 살 수 있다.
    struct FragToken {
        syntax::TokenKind kind = syntax::TokenKind::kError;
        std::string text{};
        Origin origin{};
        bool line_start = false;  // 원본에서 줄의 첫 토큰 (지시어 줄을 닫을 때 쓴다)
    };

    /// @brief 하나의 WGSL 조각. name이 있으면 export 대상이 될 수 있다.
    struct Fragment {
        std::optional<std::string> name{};
        std::vector<FragToken> tokens{};
        Span span{}; // 조각 본문 전체 (더 나은 위치가 없을 때 진단 기준점)
    };

    /// @brief 조각 안에서 발견된 `#name` / `#name(args)` 참조.
    struct ImportReference {
        std::string name{};
        Origin call_site{};
        bool has_args = false;
    };

    /// @brief 렉서 토큰 [begin, end) 범위를 Fragment로 만든다. 모든 origin은 direct.
    Fragment make_fragment(
        const std::vector<Token>& tokens,
        size_t begin,
        size_t end,
        Span span,
        std::optional<std::string> name
    );

    /// @brief 버퍼 전체를 렉싱해 Fragment 하나로 만든다 (테스트/임베딩 용).
    Fragment fragment_from_source(
        std::string_view source,
        uint32_t file_id,
        std::optional<std::string> name,
        diag::Bag* diags
    );

} // namespace wgslink::link
