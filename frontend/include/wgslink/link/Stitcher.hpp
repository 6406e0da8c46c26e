// frontend/include/wgslink/link/Stitcher.hpp
#pragma once
#include <wgslink/diag/Diagnostic.hpp>
#include <wgslink/link/ExportRegistry.hpp>
#include <wgslink/link/Scanner.hpp>

#include <cstdint>
#include <string>
#include <vector>


namespace wgslink::link {

    /// @brief 순환이 아닌 import 체인의 최대 중첩 깊이.
    inline constexpr uint32_t k_max_import_depth = 256;

    /// @brief 해석이 끝난 조각들(깊이 우선 첫 참조 순서) + 루트의 잔여 조각.
    /// @details closure의 토큰 origin은 이미 Inherited(정의 위치)로 바뀌어 있다.
    struct StitchedModule {
        std::vector<Fragment> closure{};
        Fragment root{};
    };

    struct StitchResult {
        bool ok = false;
        StitchedModule module{};
        std::vector<std::string> resolved{}; // closure와 같은 순서의 이름
    };

    /// @brief root의 import 참조를 전이적으로 해석해 하나의 토큰열로 평탄화한다.
    /// @param from root가 속한 unit (가시성 기준)
    StitchResult stitch(
        const Fragment& root,
        const ExportRegistry& registry,
        UnitId from,
        const ScanOptions& opt,
        diag::Bag& bag
    );

} // namespace wgslink::link
