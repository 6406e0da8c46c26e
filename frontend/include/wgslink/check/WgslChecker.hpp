// frontend/include/wgslink/check/WgslChecker.hpp
#pragma once
#include <wgslink/check/Checker.hpp>


namespace wgslink::check {

    /// @brief Tint WGSL reader를 감싼 검사기.
    /// @details
    ///  - 텍스트 전체를 `tint::wgsl::reader::Parse`에 넘긴다 (구문 분석 + resolver)
    ///  - 이름 해석, 타입, 재선언, uniformity 오류를 모두 Tint가 보고한다
    ///  - Tint의 error/warning을 line:col에서 바이트 오프셋으로 바꿔 돌려준다. note는 버린다.
    class WgslChecker final : public Checker {
    public:
        std::string_view name() const override { return "tint-wgsl"; }
        CheckResult check(std::string_view text) const override;
    };

} // namespace wgslink::check
