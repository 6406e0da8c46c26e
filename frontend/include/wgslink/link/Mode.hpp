// frontend/include/wgslink/link/Mode.hpp
#pragma once
#include <wgslink/link/Scanner.hpp>

#include <cstdint>
#include <string_view>
#include <vector>


namespace wgslink::link {

    enum class Mode : uint8_t {
        kChecked,
        kUnchecked,   // 전처리 지시어가 있어 checker를 건너뛴다
    };

    constexpr std::string_view mode_name(Mode m) {
        return (m == Mode::kUnchecked) ? "unchecked" : "checked";
    }

    /// @brief 조각 자신의 토큰에 예약 지시어 마커가 있으면 Unchecked.
    /// @details import된 조각의 지시어는 보지 않는다 (호출한 쪽에서 자기 토큰만 넘긴다).
    Mode select_mode(const std::vector<FragToken>& tokens, const ScanOptions& opt);

} // namespace wgslink::link
