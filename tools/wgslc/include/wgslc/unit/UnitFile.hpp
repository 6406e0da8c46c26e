// tools/wgslc/include/wgslc/unit/UnitFile.hpp
#pragma once

#include <wgslink/diag/Diagnostic.hpp>
#include <wgslink/link/Fragment.hpp>
#include <wgslink/text/SourceManager.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>


namespace wgslc::unit {

    /// @brief `[@export(name)] fragment CONST { ... }` 하나.
    struct FragmentDecl {
        std::string constant{};
        wgslink::Span constant_span{};
        std::optional<std::string> export_name{};
        wgslink::link::Fragment fragment{};  // fragment.name == export_name
    };

    struct RequiresDecl {
        std::string name{};
        wgslink::Span span{};
    };

    /// @brief 파싱된 unit 파일 (*.wgslu).
    struct UnitFile {
        uint32_t file_id = 0;
        std::string name{};         // `unit x;`가 없으면 파일 이름 stem
        wgslink::Span name_span{};
        std::vector<RequiresDecl> requires_units{};
        std::vector<FragmentDecl> fragments{};
    };

    /// @brief 이미 SourceManager에 올라간 unit 파일을 파싱한다.
    /// @details
    ///  - 헤더: `unit name;` (최대 1번), `requires a, b;` (여러 번)
    ///  - 본문: 중괄호 짝이 맞는 토큰열. 본문 토큰의 origin은 unit 파일 기준 direct span이다.
    ///  - 첫 오류에서 멈춘다 (kHostExpectedToken / kHostUnexpectedEof).
    bool parse_unit_file(
        const wgslink::SourceManager& sm,
        uint32_t file_id,
        UnitFile& out,
        wgslink::diag::Bag& bag
    );

} // namespace wgslc::unit
