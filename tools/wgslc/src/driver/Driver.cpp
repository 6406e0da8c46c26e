// tools/wgslc/src/driver/Driver.cpp
#include <wgslc/driver/Driver.hpp>

#include <wgslc/config/Config.hpp>
#include <wgslc/unit/UnitFile.hpp>

#include <wgslink/check/WgslChecker.hpp>
#include <wgslink/diag/Diagnostic.hpp>
#include <wgslink/diag/Render.hpp>
#include <wgslink/link/Expand.hpp>
#include <wgslink/link/ExportIndex.hpp>
#include <wgslink/link/ExportRegistry.hpp>
#include <wgslink/os/File.hpp>
#include <wgslink/text/SourceManager.hpp>

#include <filesystem>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>


namespace wgslc::driver {

    namespace {

        namespace diag = wgslink::diag;
        namespace link = wgslink::link;

        /// @brief 설정 파일 + 명령줄을 합친 실행 설정. 명령줄이 우선한다.
        struct RunSettings {
            diag::Language lang = diag::Language::kEn;
            bool json = false;
            uint32_t context_lines = 2;
            uint32_t max_errors = 64;
            bool check = true;
            bool directives = true;
            std::string ns = "wgsl";
            bool verbose = false;
        };

        struct Generated {
            std::string constant{};
            std::string text{};
            link::Mode mode = link::Mode::kChecked;
        };

        void log_verbose(const RunSettings& s, const std::string& msg) {
            if (s.verbose) std::cerr << "[wgslc] " << msg << "\n";
        }

        std::string join(const std::vector<std::string>& xs, std::string_view sep) {
            std::string out{};
            for (size_t i = 0; i < xs.size(); ++i) {
                if (i != 0) out += sep;
                out += xs[i];
            }
            return out;
        }

        bool resolve_settings(const cli::Options& opt, RunSettings& out) {
            config::LoadedConfig cfg{};
            std::string err{};
            std::optional<std::filesystem::path> explicit_path{};
            if (!opt.config_path.empty()) explicit_path = std::filesystem::path(opt.config_path);

            if (!config::load(explicit_path, cfg, err)) {
                std::cerr << "error: " << err << "\n";
                return false;
            }
            for (const auto& w : cfg.warnings) {
                std::cerr << "warning: " << w << "\n";
            }

            config::Settings s{};
            std::vector<std::string> errors{};
            if (!config::materialize(cfg, s, errors)) {
                for (const auto& e : errors) std::cerr << "error: " << e << "\n";
                return false;
            }

            out.lang = (s.diag_lang == "ko") ? diag::Language::kKo : diag::Language::kEn;
            out.json = (s.diag_format == "json");
            out.context_lines = static_cast<uint32_t>(s.diag_context);
            out.max_errors = static_cast<uint32_t>(s.diag_max_errors);
            out.check = s.check_enabled;
            out.directives = s.preprocess_directives;
            out.ns = s.output_namespace;
            out.verbose = opt.verbose;

            if (opt.lang) out.lang = *opt.lang;
            if (opt.diag_format) out.json = (*opt.diag_format == cli::DiagFormat::kJson);
            if (opt.context_lines) out.context_lines = *opt.context_lines;
            if (opt.max_errors) out.max_errors = *opt.max_errors;
            if (opt.check) out.check = *opt.check;
            if (opt.directives) out.directives = *opt.directives;
            if (opt.ns) {
                if (!config::is_valid_namespace(*opt.ns)) {
                    std::cerr << "error: --namespace '" << *opt.ns << "' is not a valid C++ namespace\n";
                    return false;
                }
                out.ns = *opt.ns;
            }

            if (cfg.path) log_verbose(out, "config: " + cfg.path->string());
            return true;
        }

        /// @brief 진단을 출력하고 종료 코드를 반환한다. 오류는 max_errors개까지만 보여준다.
        int flush_diags(const diag::Bag& bag, const RunSettings& s, const wgslink::SourceManager& sm) {
            uint32_t shown = 0;
            for (const auto& d : bag.diags()) {
                const bool is_err = d.severity() != diag::Severity::kWarning;
                if (is_err && shown >= s.max_errors) {
                    diag::Diagnostic stop(diag::Severity::kFatal, diag::Code::kTooManyErrors, d.span());
                    if (s.json) std::cerr << diag::render_one_json(stop, s.lang, sm) << "\n";
                    else std::cerr << diag::render_one_context(stop, s.lang, sm, 0) << "\n";
                    break;
                }
                if (is_err) ++shown;

                if (s.json) std::cerr << diag::render_one_json(d, s.lang, sm) << "\n";
                else std::cerr << diag::render_one_context(d, s.lang, sm, s.context_lines) << "\n";
            }
            return bag.has_error() ? 1 : 0;
        }

        void load_export_index(
            const std::string& path,
            link::ExportRegistry& registry,
            wgslink::SourceManager& sm,
            diag::Bag& bag,
            const RunSettings& s
        ) {
            const std::string norm = wgslink::normalize_path(path);

            std::string text{};
            std::string io_err{};
            if (!wgslink::open_file(norm, text, io_err)) {
                const uint32_t fid = sm.add(norm, std::string{});
                diag::Diagnostic d(diag::Severity::kError, diag::Code::kExportIndexMissing, wgslink::Span{fid, 0, 0});
                d.add_arg(path);
                bag.add(std::move(d));
                return;
            }

            link::ExportIndex index{};
            std::string err{};
            const bool parsed = link::parse_export_index(text, index, err);
            const uint32_t fid = sm.add(norm, std::move(text));
            const wgslink::Span at{fid, 0, 0};
            if (!parsed) {
                diag::Diagnostic d(diag::Severity::kError, diag::Code::kExportIndexSchema, at);
                d.add_arg(err);
                bag.add(std::move(d));
                return;
            }

            (void)link::register_export_index(index, registry, sm, at, bag);
            log_verbose(s, "loaded export index " + norm + " (" + std::to_string(index.units.size())
                           + " unit(s), " + std::to_string(index.exports.size()) + " export(s))");
        }

        /// @brief 명령줄 순서로 동점을 깨는 위상 정렬. 순환이면 kUnitCycle을 보고하고 false.
        bool order_units(
            const std::vector<unit::UnitFile>& units,
            const link::ExportRegistry& registry,
            std::vector<size_t>& out_order,
            diag::Bag& bag
        ) {
            std::unordered_map<std::string, size_t> by_name{};
            for (size_t i = 0; i < units.size(); ++i) by_name.emplace(units[i].name, i);

            std::vector<std::vector<size_t>> local_deps(units.size());
            bool ok = true;
            for (size_t i = 0; i < units.size(); ++i) {
                for (const auto& r : units[i].requires_units) {
                    if (auto it = by_name.find(r.name); it != by_name.end()) {
                        local_deps[i].push_back(it->second);
                        continue;
                    }
                    if (registry.find_unit(r.name).has_value()) continue;

                    diag::Diagnostic d(diag::Severity::kError, diag::Code::kUnknownUnit, r.span);
                    d.add_arg(units[i].name);
                    d.add_arg(r.name);
                    bag.add(std::move(d));
                    ok = false;
                }
            }
            if (!ok) return false;

            std::vector<bool> done(units.size(), false);
            out_order.clear();
            while (out_order.size() < units.size()) {
                bool progressed = false;
                for (size_t i = 0; i < units.size(); ++i) {
                    if (done[i]) continue;
                    bool ready = true;
                    for (const size_t dep : local_deps[i]) {
                        if (!done[dep]) { ready = false; break; }
                    }
                    if (!ready) continue;
                    done[i] = true;
                    out_order.push_back(i);
                    progressed = true;
                    break;
                }
                if (progressed) continue;

                // 남은 unit은 모두 남은 unit에 의존한다. 가장 앞선 unit에서 출발해 순환을 찾는다.
                size_t cur = 0;
                while (done[cur]) ++cur;
                std::vector<size_t> path{};
                while (true) {
                    bool seen = false;
                    for (const size_t p : path) if (p == cur) { seen = true; break; }
                    if (seen) break;
                    path.push_back(cur);
                    for (const size_t dep : local_deps[cur]) {
                        if (!done[dep]) { cur = dep; break; }
                    }
                }

                size_t start = 0;
                while (path[start] != cur) ++start;
                std::vector<std::string> chain{};
                for (size_t k = start; k < path.size(); ++k) chain.push_back(units[path[k]].name);
                chain.push_back(units[cur].name);

                diag::Diagnostic d(diag::Severity::kError, diag::Code::kUnitCycle, units[cur].name_span);
                d.add_arg(join(chain, " -> "));
                bag.add(std::move(d));
                return false;
            }
            return true;
        }

        std::string render_header(const std::string& ns, const std::vector<Generated>& gen) {
            std::ostringstream out;
            out << "// generated by wgslc. do not edit.\n";
            out << "#pragma once\n";
            out << "#include <string_view>\n\n";
            out << "namespace " << ns << " {\n\n";
            for (const auto& g : gen) {
                out << "inline constexpr std::string_view " << g.constant << " = R\"wgsl(" << g.text << ")wgsl\";\n\n";
            }
            out << "} // namespace " << ns << "\n";
            return out.str();
        }

    } // namespace

    int run(const cli::Options& opt) {
        RunSettings s{};
        if (!resolve_settings(opt, s)) return 1;

        wgslink::SourceManager sm;
        diag::Bag bag;
        link::ExportRegistry registry;

        for (const auto& path : opt.load_indexes) {
            load_export_index(path, registry, sm, bag, s);
        }

        // ---- unit 파일 읽기 ----
        std::vector<unit::UnitFile> units{};
        units.reserve(opt.inputs.size());
        for (const auto& input : opt.inputs) {
            const std::string norm = wgslink::normalize_path(input);

            std::string content{};
            std::string io_err{};
            if (!wgslink::open_file(norm, content, io_err)) {
                std::cerr << "error: " << io_err << "\n";
                return 1;
            }

            const uint32_t fid = sm.add(norm, std::move(content));
            unit::UnitFile u{};
            if (unit::parse_unit_file(sm, fid, u, bag)) {
                units.push_back(std::move(u));
            }
        }

        // unit 이름 / 상수 이름은 이번 실행 전체에서 유일해야 한다.
        {
            std::unordered_map<std::string, wgslink::Span> seen_units{};
            std::unordered_map<std::string, wgslink::Span> seen_consts{};
            for (const auto& u : units) {
                if (auto it = seen_units.find(u.name); it != seen_units.end() || registry.find_unit(u.name)) {
                    diag::Diagnostic d(diag::Severity::kError, diag::Code::kDuplicateUnit, u.name_span);
                    d.add_arg(u.name);
                    if (it != seen_units.end()) d.add_related(it->second);
                    bag.add(std::move(d));
                } else {
                    seen_units.emplace(u.name, u.name_span);
                }

                for (const auto& f : u.fragments) {
                    if (auto it = seen_consts.find(f.constant); it != seen_consts.end()) {
                        diag::Diagnostic d(diag::Severity::kError, diag::Code::kDuplicateConstant, f.constant_span);
                        d.add_arg(f.constant);
                        d.add_related(it->second);
                        bag.add(std::move(d));
                        continue;
                    }
                    seen_consts.emplace(f.constant, f.constant_span);
                }
            }
        }

        std::vector<size_t> order{};
        if (bag.has_error() || !order_units(units, registry, order, bag)) {
            return flush_diags(bag, s, sm);
        }

        {
            std::vector<std::string> names{};
            for (const size_t i : order) names.push_back(units[i].name);
            log_verbose(s, "unit order: " + join(names, ", "));
        }

        // ---- unit별: export 등록 -> 조각 확장 ----
        wgslink::check::WgslChecker checker;
        link::ExpandOptions exopt{};
        exopt.scan.directives = s.directives;
        exopt.check = s.check;

        std::vector<Generated> generated{};
        std::unordered_set<std::string> own_units{};
        link::ExportIndex emitted{};

        for (const size_t idx : order) {
            const auto& u = units[idx];

            std::vector<link::UnitId> deps{};
            std::vector<std::string> dep_names{};
            for (const auto& r : u.requires_units) {
                // 순서상 의존 unit은 이미 등록되어 있다.
                if (const auto id = registry.find_unit(r.name)) deps.push_back(*id);
                dep_names.push_back(r.name);
            }

            const auto uid = registry.add_unit(u.name, deps);
            if (!uid) continue;
            own_units.insert(u.name);
            emitted.units.push_back(link::IndexUnit{u.name, dep_names});

            for (const auto& f : u.fragments) {
                if (!f.export_name) continue;
                (void)registry.register_export(f.fragment, *uid, bag);
            }

            for (const auto& f : u.fragments) {
                const auto r = link::expand(f.fragment, registry, *uid, s.check ? &checker : nullptr, exopt, bag);

                std::string line = u.name + "::" + f.constant + ": " + std::string(link::mode_name(r.mode));
                if (!r.imported.empty()) line += ", imports " + join(r.imported, ", ");
                if (!r.checked) line += ", not checked";
                if (!r.ok) line += ", failed";
                log_verbose(s, line);

                if (r.ok) generated.push_back(Generated{f.constant, r.text, r.mode});
            }
        }

        const int rc = flush_diags(bag, s, sm);
        if (rc != 0) return rc;

        if (opt.print) {
            for (const auto& g : generated) {
                std::cout << "// " << g.constant << " (" << link::mode_name(g.mode) << ")\n";
                std::cout << g.text << "\n";
            }
        }

        if (!opt.out_header.empty()) {
            std::string err{};
            if (!wgslink::write_file(opt.out_header, render_header(s.ns, generated), err)) {
                std::cerr << "error: " << err << "\n";
                return 1;
            }
            log_verbose(s, "wrote " + opt.out_header + " (" + std::to_string(generated.size()) + " fragment(s))");
        }

        if (!opt.emit_index.empty()) {
            for (const auto& e : registry.entries()) {
                if (!own_units.contains(std::string(registry.unit_name(e.unit)))) continue;
                if (auto def = link::emit_export_definition(registry, e.name, sm)) {
                    emitted.exports.push_back(std::move(*def));
                }
            }

            std::string err{};
            if (!link::write_export_index(opt.emit_index, emitted, err)) {
                std::cerr << "error: " << err << "\n";
                return 1;
            }
            log_verbose(s, "wrote export index " + opt.emit_index + " (" + std::to_string(emitted.exports.size()) + " export(s))");
        }

        return 0;
    }

} // namespace wgslc::driver
