// frontend/include/wgslink/link/ExportIndex.hpp
#pragma once
#include <wgslink/diag/Diagnostic.hpp>
#include <wgslink/link/ExportRegistry.hpp>
#include <wgslink/text/SourceManager.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>


namespace wgslink::link {

    inline constexpr uint32_t k_export_index_version = 1;

    struct ExportedToken {
        syntax::TokenKind kind = syntax::TokenKind::kError;
        std::string text{};
        uint32_t lo = 0;
        uint32_t hi = 0;
        bool line_start = false;
    };

    /// @brief 다른 unit에서 다시 등록할 수 있는 자기완결적 export 정의.
    /// @details 토큰 위치는 정의 파일(file) 기준 바이트 오프셋이다.
    struct ExportDefinition {
        std::string name{};
        std::string unit{};
        std::string file{};
        uint32_t lo = 0;
        uint32_t hi = 0;
        std::vector<ExportedToken> tokens{};
    };

    struct IndexUnit {
        std::string name{};
        std::vector<std::string> requires_units{};
    };

    struct ExportIndex {
        std::vector<IndexUnit> units{};
        std::vector<ExportDefinition> exports{};
    };

    /// @brief 레지스트리에 있는 이름의 정의를 다시 내보낼 수 있는 형태로 꺼낸다.
    std::optional<ExportDefinition> emit_export_definition(
        const ExportRegistry& registry,
        std::string_view name,
        const SourceManager& sm
    );

    /// @brief 버전이 붙은 JSON 문서로 쓴다.
    bool write_export_index(const std::string& path, const ExportIndex& index, std::string& out_err);

    /// @brief JSON 텍스트를 읽는다. 형식이 맞지 않으면 false + out_err.
    bool parse_export_index(std::string_view text, ExportIndex& out, std::string& out_err);

    /// @brief 읽어 들인 index의 unit/export를 레지스트리에 등록한다.
    /// @details 정의 파일은 SourceManager에 올려 진단 위치를 복원한다. 파일을 읽을 수 없으면
    ///          kExportIndexSourceMissing 경고를 내고 빈 내용으로 등록한다.
    /// @param at index 파일 자체를 가리키는 span (unit 관련 오류 위치)
    bool register_export_index(
        const ExportIndex& index,
        ExportRegistry& registry,
        SourceManager& sm,
        Span at,
        diag::Bag& bag
    );

} // namespace wgslink::link
