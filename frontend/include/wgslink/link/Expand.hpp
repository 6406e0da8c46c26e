// frontend/include/wgslink/link/Expand.hpp
#pragma once
#include <wgslink/check/Checker.hpp>
#include <wgslink/link/Mode.hpp>
#include <wgslink/link/Renderer.hpp>
#include <wgslink/link/Stitcher.hpp>

#include <string>
#include <vector>


namespace wgslink::link {

    struct ExpandOptions {
        ScanOptions scan{};
        bool check = true;   // false면 모든 조각을 검사 없이 통과시킨다 (--no-check)
    };

    struct ExpandResult {
        bool ok = false;
        std::string text{};               // 최종 WGSL (ok일 때만 의미 있음)
        Mode mode = Mode::kChecked;
        bool checked = false;             // checker가 실제로 호출되었는가
        std::vector<std::string> imported{};
        ByteRangeOriginTable table{};
    };

    /// @brief 최상위 호출 하나: scan -> stitch -> render -> mode -> validate.
    /// @details checker가 nullptr이면 opt.check == false 와 같다.
    ExpandResult expand(
        const Fragment& root,
        const ExportRegistry& registry,
        UnitId from,
        const check::Checker* checker,
        const ExpandOptions& opt,
        diag::Bag& bag
    );

} // namespace wgslink::link
