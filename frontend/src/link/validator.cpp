// frontend/src/link/validator.cpp
#include <wgslink/link/Validator.hpp>


namespace wgslink::link {

    ValidateResult validate(
        const RenderedModule& rendered,
        const check::Checker& checker,
        Span fallback,
        diag::Bag& bag
    ) {
        ValidateResult out{};

        const auto res = checker.check(rendered.text);
        for (const auto& cd : res.diags) {
            Span at = fallback;
            if (const auto* r = rendered.table.lookup(cd.lo)) {
                at = r->origin.surfaced();
            }

            const bool is_error = (cd.severity == check::Severity::kError);
            diag::Diagnostic d(
                is_error ? diag::Severity::kError : diag::Severity::kWarning,
                is_error ? diag::Code::kCheckerError : diag::Code::kCheckerWarning,
                at
            );
            d.add_arg(cd.message);
            bag.add(std::move(d));

            if (is_error) {
                ++out.error_count;
                out.ok = false;
            } else {
                ++out.warning_count;
            }
        }
        return out;
    }

} // namespace wgslink::link
