// frontend/include/wgslink/link/Validator.hpp
#pragma once
#include <wgslink/check/Checker.hpp>
#include <wgslink/diag/Diagnostic.hpp>
#include <wgslink/link/Renderer.hpp>


namespace wgslink::link {

    struct ValidateResult {
        bool ok = true;             // error severity 진단이 하나도 없으면 true
        uint32_t error_count = 0;
        uint32_t warning_count = 0;
    };

    /// @brief 렌더링된 텍스트에 checker를 한 번 돌리고, 각 진단을 정의 위치 origin으로 옮겨 bag에 쌓는다.
    /// @param fallback table이 비었을 때(빈 조각) 쓸 위치
    ValidateResult validate(
        const RenderedModule& rendered,
        const check::Checker& checker,
        Span fallback,
        diag::Bag& bag
    );

} // namespace wgslink::link
