// frontend/src/link/export_registry.cpp
#include <wgslink/link/ExportRegistry.hpp>


namespace wgslink::link {

    std::optional<UnitId> ExportRegistry::add_unit(std::string name, const std::vector<UnitId>& deps) {
        if (unit_by_name_.find(name) != unit_by_name_.end()) return std::nullopt;
        for (const auto d : deps) {
            if (d >= units_.size()) return std::nullopt;
        }

        const UnitId id = static_cast<UnitId>(units_.size());

        Unit u{};
        u.name = name;
        u.deps = deps;
        u.reach.assign(units_.size() + 1, false);
        u.reach[id] = true;
        for (const auto d : deps) {
            const auto& dr = units_[d].reach;
            for (size_t i = 0; i < dr.size(); ++i) {
                if (dr[i]) u.reach[i] = true;
            }
        }

        units_.push_back(std::move(u));
        unit_by_name_.emplace(std::move(name), id);
        return id;
    }

    std::optional<UnitId> ExportRegistry::find_unit(std::string_view name) const {
        auto it = unit_by_name_.find(std::string(name));
        if (it == unit_by_name_.end()) return std::nullopt;
        return it->second;
    }

    std::string_view ExportRegistry::unit_name(UnitId id) const {
        if (id >= units_.size()) return "<unknown>";
        return units_[id].name;
    }

    const std::vector<UnitId>& ExportRegistry::unit_deps(UnitId id) const {
        static const std::vector<UnitId> empty{};
        if (id >= units_.size()) return empty;
        return units_[id].deps;
    }

    bool ExportRegistry::depends_on(UnitId from, UnitId target) const {
        if (from >= units_.size()) return false;
        const auto& r = units_[from].reach;
        return target < r.size() && r[target];
    }

    bool ExportRegistry::register_export(Fragment fragment, UnitId unit, diag::Bag& bag) {
        if (!fragment.name.has_value() || fragment.name->empty()) {
            bag.add(diag::Diagnostic(diag::Severity::kError, diag::Code::kExportNameMissing, fragment.span));
            return false;
        }
        if (unit >= units_.size()) return false;

        const std::string name = *fragment.name;
        if (auto it = by_name_.find(name); it != by_name_.end()) {
            // 두 번째 정의 위치에 보고하고, 첫 번째 정의는 related로 붙인다.
            diag::Diagnostic d(diag::Severity::kError, diag::Code::kNameConflict, fragment.span);
            d.add_arg(name);
            d.add_related(entries_[it->second].fragment.span);
            bag.add(std::move(d));
            return false;
        }

        by_name_.emplace(name, entries_.size());
        entries_.push_back(ExportEntry{name, std::move(fragment), unit});
        return true;
    }

    const ExportEntry* ExportRegistry::lookup(std::string_view name, UnitId from) const {
        const auto* e = find(name);
        if (e == nullptr) return nullptr;
        if (!depends_on(from, e->unit)) return nullptr;
        return e;
    }

    const ExportEntry* ExportRegistry::find(std::string_view name) const {
        auto it = by_name_.find(std::string(name));
        if (it == by_name_.end()) return nullptr;
        return &entries_[it->second];
    }

} // namespace wgslink::link
