// frontend/include/wgslink/check/Checker.hpp
#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>


namespace wgslink::check {

    enum class Severity : uint8_t {
        kError,
        kWarning,
    };

    /// @brief checker가 돌려주는 진단. lo/hi는 검사한 텍스트 안의 바이트 오프셋이다.
    struct CheckDiagnostic {
        uint32_t lo = 0;
        uint32_t hi = 0;
        std::string message{};
        Severity severity = Severity::kError;
    };

    struct CheckResult {
        std::vector<CheckDiagnostic> diags{};

        bool has_error() const {
            for (const auto& d : diags) {
                if (d.severity == Severity::kError) return true;
            }
            return false;
        }
    };

    /// @brief 평탄화된 WGSL 텍스트를 검사하는 공통 인터페이스.
    /// @details 같은 입력이면 항상 같은 결과를 내는 순수 함수여야 한다 (재시도하지 않는다).
    class Checker {
    public:
        virtual ~Checker() = default;

        /// @brief 로그/진단에 쓰는 이름.
        virtual std::string_view name() const = 0;

        /// @brief 텍스트를 검사한다.
        virtual CheckResult check(std::string_view text) const = 0;
    };

} // namespace wgslink::check
