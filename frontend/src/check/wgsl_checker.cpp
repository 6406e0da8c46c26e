// frontend/src/check/wgsl_checker.cpp
#include <wgslink/check/WgslChecker.hpp>

#include <tint/tint.h>
#include "src/tint/lang/wgsl/reader/reader.h"

#include <algorithm>
#include <string>
#include <vector>


namespace wgslink::check {

    namespace {

        /// @brief 각 줄의 시작 바이트 오프셋. Tint는 '\n' 기준 1-based line을 쓴다.
        std::vector<uint32_t> line_starts_(std::string_view text) {
            std::vector<uint32_t> out{0};
            for (size_t i = 0; i < text.size(); ++i) {
                if (text[i] == '\n') out.push_back(static_cast<uint32_t>(i + 1));
            }
            return out;
        }

        uint32_t offset_of_(const std::vector<uint32_t>& starts, size_t text_size, const tint::Source::Location& loc) {
            if (loc.line == 0 || loc.line > starts.size()) return 0;
            // column은 1-based, UTF-8 코드 단위.
            const size_t col = (loc.column == 0) ? 0 : loc.column - 1;
            const size_t off = starts[loc.line - 1] + col;
            return static_cast<uint32_t>(std::min(off, text_size));
        }

    } // namespace

    CheckResult WgslChecker::check(std::string_view text) const {
        CheckResult out{};

        const std::string content(text);
        tint::Source::File file("", content);

        tint::wgsl::reader::Options options{};
        options.allowed_features = tint::wgsl::AllowedFeatures::Everything();
        const tint::Program program = tint::wgsl::reader::Parse(&file, options);

        const auto starts = line_starts_(text);
        for (const auto& d : program.Diagnostics()) {
            if (d.severity == tint::diag::Severity::Note) continue;

            CheckDiagnostic cd{};
            cd.lo = offset_of_(starts, text.size(), d.source.range.begin);
            cd.hi = std::max(cd.lo, offset_of_(starts, text.size(), d.source.range.end));
            cd.message = d.message.Plain();
            cd.severity = (d.severity == tint::diag::Severity::Warning) ? Severity::kWarning : Severity::kError;
            out.diags.push_back(std::move(cd));
        }

        // 위치 순. 같은 위치면 Tint가 보고한 순서를 지킨다.
        std::stable_sort(out.diags.begin(), out.diags.end(),
            [](const CheckDiagnostic& a, const CheckDiagnostic& b) { return a.lo < b.lo; });
        return out;
    }

} // namespace wgslink::check
