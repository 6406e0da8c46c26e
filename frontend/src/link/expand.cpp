// frontend/src/link/expand.cpp
#include <wgslink/link/Expand.hpp>
#include <wgslink/link/Validator.hpp>


namespace wgslink::link {

    ExpandResult expand(
        const Fragment& root,
        const ExportRegistry& registry,
        UnitId from,
        const check::Checker* checker,
        const ExpandOptions& opt,
        diag::Bag& bag
    ) {
        ExpandResult out{};

        // 지시어 모드에서도 import 해석은 그대로 한다.
        out.mode = select_mode(root.tokens, opt.scan);

        auto st = stitch(root, registry, from, opt.scan, bag);
        out.imported = std::move(st.resolved);
        if (!st.ok) return out;

        auto rendered = render(st.module);

        const bool run_checker = opt.check && checker != nullptr && out.mode == Mode::kChecked;
        if (run_checker) {
            out.checked = true;
            const auto vr = validate(rendered, *checker, root.span, bag);
            if (!vr.ok) return out;
        }

        out.ok = true;
        out.text = std::move(rendered.text);
        out.table = std::move(rendered.table);
        return out;
    }

} // namespace wgslink::link
