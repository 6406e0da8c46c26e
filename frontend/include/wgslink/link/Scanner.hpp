// frontend/include/wgslink/link/Scanner.hpp
#pragma once
#include <wgslink/link/Fragment.hpp>

#include <array>
#include <string_view>
#include <vector>


namespace wgslink::link {

    /// @brief 외부 전처리기(naga_oil 계열)가 처리하는 예약 지시어 이름.
    inline constexpr std::array<std::string_view, 7> k_reserved_directives = {
        "define_import_path",
        "import",
        "if",
        "ifdef",
        "ifndef",
        "else",
        "endif",
    };

    bool is_reserved_directive(std::string_view name);

    struct ScanOptions {
        // false면 예약 지시어 이름도 일반 import 이름으로 취급한다 (preprocess.directives).
        bool directives = true;
    };

    struct ScanResult {
        std::vector<ImportReference> imports{};  // 토큰 순서 그대로
        std::vector<FragToken> residual{};       // 마커를 정리한 나머지 토큰
        bool has_directive = false;
    };

    /// @brief `#name` / `#name(args)` 마커를 찾아 import 참조와 잔여 토큰열로 나눈다.
    /// @details
    ///  - `#name`        : 순수 import. `#`와 `name` 모두 제거.
    ///  - `#name(args)`  : import + 호출. `#`만 제거하고 `name(args)`는 그 자리에 남긴다.
    ///  - `#<지시어>`    : (directives on) 그대로 남기고 has_directive를 켠다.
    ///  - `#` 뒤가 식별자가 아니면 그대로 남긴다.
    ScanResult scan_references(const std::vector<FragToken>& tokens, const ScanOptions& opt);

} // namespace wgslink::link
