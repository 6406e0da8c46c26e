// frontend/src/link/stitcher.cpp
#include <wgslink/link/Stitcher.hpp>

#include <algorithm>
#include <unordered_set>


namespace wgslink::link {

    namespace {

        class StitchContext {
        public:
            StitchContext(const ExportRegistry& registry, const ScanOptions& opt, diag::Bag& bag)
                : registry_(registry), opt_(opt), bag_(bag) {}

            /// @brief 한 조각의 참조를 모두 해석한다. 치명적 오류(깊이 초과)면 false.
            bool resolve_refs(const std::vector<ImportReference>& refs, UnitId from) {
                for (const auto& ref : refs) {
                    if (!resolve_one(ref, from)) return false;
                }
                return true;
            }

            void push_in_progress(std::string name) {
                in_progress_.push_back(std::move(name));
            }

            bool failed() const { return failed_; }

            std::vector<Fragment> take_closure() { return std::move(closure_); }
            std::vector<std::string> take_resolved() { return std::move(resolved_order_); }

        private:
            bool in_progress(const std::string& name) const {
                return std::find(in_progress_.begin(), in_progress_.end(), name) != in_progress_.end();
            }

            std::string cycle_chain(const std::string& name) const {
                auto it = std::find(in_progress_.begin(), in_progress_.end(), name);
                std::string chain{};
                for (; it != in_progress_.end(); ++it) {
                    chain += *it;
                    chain += " -> ";
                }
                chain += name;
                return chain;
            }

            void report_unresolved(const ImportReference& ref, UnitId from) {
                const Span at = ref.call_site.surfaced();
                if (const auto* hidden = registry_.find(ref.name)) {
                    diag::Diagnostic d(diag::Severity::kError, diag::Code::kExportNotVisible, at);
                    d.add_arg(ref.name);
                    d.add_arg(registry_.unit_name(hidden->unit));
                    d.add_arg(registry_.unit_name(from));
                    d.add_related(hidden->fragment.span);
                    bag_.add(std::move(d));
                    return;
                }
                diag::Diagnostic d(diag::Severity::kError, diag::Code::kUnresolvedExport, at);
                d.add_arg(ref.name);
                bag_.add(std::move(d));
            }

            bool resolve_one(const ImportReference& ref, UnitId from) {
                if (in_progress(ref.name)) {
                    diag::Diagnostic d(diag::Severity::kError, diag::Code::kImportCycle, ref.call_site.surfaced());
                    d.add_arg(cycle_chain(ref.name));
                    bag_.add(std::move(d));
                    failed_ = true;
                    return true;
                }

                // 이미 평탄화된 이름은 다시 넣지 않는다.
                if (resolved_.count(ref.name) != 0) return true;

                const auto* entry = registry_.lookup(ref.name, from);
                if (entry == nullptr) {
                    report_unresolved(ref, from);
                    failed_ = true;
                    return true;
                }

                if (in_progress_.size() >= k_max_import_depth) {
                    diag::Diagnostic d(diag::Severity::kFatal, diag::Code::kImportDepthExceeded, ref.call_site.surfaced());
                    d.add_arg_int(static_cast<int>(k_max_import_depth));
                    d.add_arg(ref.name);
                    bag_.add(std::move(d));
                    failed_ = true;
                    return false;
                }

                in_progress_.push_back(ref.name);

                // 정의 조각의 참조는 그 조각이 속한 unit 기준으로 해석한다.
                auto scanned = scan_references(entry->fragment.tokens, opt_);
                if (!resolve_refs(scanned.imports, entry->unit)) return false;

                Fragment flat{};
                flat.name = entry->name;
                flat.span = entry->fragment.span;
                flat.tokens = std::move(scanned.residual);
                const Span import_site = ref.call_site.surfaced();
                for (auto& t : flat.tokens) {
                    t.origin = t.origin.rewritten_for_import(import_site);
                }

                closure_.push_back(std::move(flat));
                resolved_.insert(ref.name);
                resolved_order_.push_back(ref.name);
                in_progress_.pop_back();
                return true;
            }

            const ExportRegistry& registry_;
            const ScanOptions& opt_;
            diag::Bag& bag_;

            std::vector<std::string> in_progress_;
            std::unordered_set<std::string> resolved_;
            std::vector<std::string> resolved_order_;
            std::vector<Fragment> closure_;
            bool failed_ = false;
        };

    } // namespace

    StitchResult stitch(
        const Fragment& root,
        const ExportRegistry& registry,
        UnitId from,
        const ScanOptions& opt,
        diag::Bag& bag
    ) {
        StitchResult out{};

        StitchContext ctx(registry, opt, bag);

        // 이름 있는 루트는 자기 자신을 import하면 순환이다.
        if (root.name.has_value()) ctx.push_in_progress(*root.name);

        auto scanned = scan_references(root.tokens, opt);
        const bool completed = ctx.resolve_refs(scanned.imports, from);

        out.module.closure = ctx.take_closure();
        out.resolved = ctx.take_resolved();

        out.module.root.name = root.name;
        out.module.root.span = root.span;
        out.module.root.tokens = std::move(scanned.residual);

        out.ok = completed && !ctx.failed();
        return out;
    }

} // namespace wgslink::link
