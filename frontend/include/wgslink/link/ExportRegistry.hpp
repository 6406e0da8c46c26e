// frontend/include/wgslink/link/ExportRegistry.hpp
#pragma once
#include <wgslink/diag/Diagnostic.hpp>
#include <wgslink/link/Fragment.hpp>

#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>


namespace wgslink::link {

    using UnitId = uint32_t;

    struct ExportEntry {
        std::string name{};
        Fragment fragment{};
        UnitId unit = 0;
    };

    /// @brief 빌드 전체에서 공유되는 export 이름 -> 정의 조각 테이블.
    /// @details
    ///  - append-only, 이름당 한 번만 등록된다 (두 번째 등록은 NameConflict).
    ///  - lookup은 같은 unit 또는 (전이적) 의존 unit에서 등록된 이름만 보인다.
    ///  - unit은 의존 대상이 먼저 등록되어 있어야 하므로 unit 그래프는 항상 비순환이다.
    ///  - 전역 싱글톤이 아니다. 빌드를 조율하는 쪽이 소유하고 참조로 넘긴다.
    class ExportRegistry {
    public:
        /// @brief unit을 추가한다. 이름 중복이거나 deps에 없는 id가 있으면 nullopt.
        std::optional<UnitId> add_unit(std::string name, const std::vector<UnitId>& deps);

        std::optional<UnitId> find_unit(std::string_view name) const;
        std::string_view unit_name(UnitId id) const;
        const std::vector<UnitId>& unit_deps(UnitId id) const;
        uint32_t unit_count() const { return static_cast<uint32_t>(units_.size()); }

        /// @brief from == target 이거나 target이 from의 전이적 의존이면 true.
        bool depends_on(UnitId from, UnitId target) const;

        /// @brief 이름 있는 조각을 export로 등록한다.
        /// @return 실패(NameConflict / ExportNameMissing / 알 수 없는 unit) 시 false. 진단은 bag에 쌓인다.
        bool register_export(Fragment fragment, UnitId unit, diag::Bag& bag);

        /// @brief from unit에서 보이는 export만 찾는다.
        const ExportEntry* lookup(std::string_view name, UnitId from) const;

        /// @brief 가시성과 무관하게 찾는다 (진단 설명, export-side 인터페이스 용).
        const ExportEntry* find(std::string_view name) const;

        /// @brief 등록 순서대로 모든 export.
        const std::deque<ExportEntry>& entries() const { return entries_; }

    private:
        struct Unit {
            std::string name{};
            std::vector<UnitId> deps{};
            std::vector<bool> reach{}; // reach[id] == depends_on(this, id)
        };

        std::vector<Unit> units_;
        std::unordered_map<std::string, UnitId> unit_by_name_;

        // deque: 등록이 계속돼도 기존 entry 포인터가 유지된다.
        std::deque<ExportEntry> entries_;
        std::unordered_map<std::string, size_t> by_name_;
    };

} // namespace wgslink::link
