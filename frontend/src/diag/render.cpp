// frontend/src/diag/render.cpp
#include <wgslink/diag/Render.hpp>

#include <algorithm>
#include <sstream>


namespace wgslink::diag {

    static constexpr uint32_t digits10(uint32_t v) {
        uint32_t d = 1;
        while (v >= 10) { v /= 10; ++d; }
        return d;
    }

    static std::string replace_all(std::string s, std::string_view from, std::string_view to) {
        size_t pos = 0;
        while ((pos = s.find(from, pos)) != std::string::npos) {
            s.replace(pos, from.size(), to);
            pos += to.size();
        }

        return s;
    }

    static std::string format_template(std::string templ, const std::vector<std::string>& args) {
        for (size_t i = 0; i < args.size(); ++i) {
            std::string key = "{" + std::to_string(i) + "}";
            templ = replace_all(std::move(templ), key, args[i]);
        }
        return templ;
    }

    static std::string json_escape_(std::string_view s) {
        std::string out;
        out.reserve(s.size() + 8);
        for (char c : s) {
            switch (c) {
                case '"': out += "\\\""; break;
                case '\\': out += "\\\\"; break;
                case '\n': out += "\\n"; break;
                case '\r': out += "\\r"; break;
                case '\t': out += "\\t"; break;
                default: out.push_back(c); break;
            }
        }
        return out;
    }

    static const char* severity_name_(Severity sev) {
        return (sev == Severity::kWarning) ? "warning" :
               (sev == Severity::kFatal)   ? "fatal"   : "error";
    }

    std::string_view code_name(Code c) {
        switch (c) {
            case Code::kInvalidUtf8: return "InvalidUtf8";
            case Code::kUnterminatedComment: return "UnterminatedComment";
            case Code::kTooManyErrors: return "TooManyErrors";

            case Code::kNameConflict: return "NameConflict";
            case Code::kExportNameMissing: return "ExportNameMissing";

            case Code::kUnresolvedExport: return "UnresolvedExport";
            case Code::kExportNotVisible: return "ExportNotVisible";
            case Code::kImportCycle: return "ImportCycle";
            case Code::kImportDepthExceeded: return "ImportDepthExceeded";

            case Code::kCheckerError: return "CheckerError";
            case Code::kCheckerWarning: return "CheckerWarning";

            case Code::kExportIndexMissing: return "ExportIndexMissing";
            case Code::kExportIndexSchema: return "ExportIndexSchema";
            case Code::kExportIndexSourceMissing: return "ExportIndexSourceMissing";

            case Code::kHostExpectedToken: return "HostExpectedToken";
            case Code::kHostUnexpectedEof: return "HostUnexpectedEof";
            case Code::kUnknownUnit: return "UnknownUnit";
            case Code::kUnitCycle: return "UnitCycle";
            case Code::kDuplicateUnit: return "DuplicateUnit";
            case Code::kDuplicateConstant: return "DuplicateConstant";
        }
        return "Unknown";
    }

    static std::string template_en(Code c) {
        switch (c) {
            case Code::kInvalidUtf8: return "invalid UTF-8 at byte offset {0} (byte 0x{1})";
            case Code::kUnterminatedComment: return "unterminated block comment";
            case Code::kTooManyErrors: return "too many errors emitted; stopping now";

            case Code::kNameConflict: return "export name '{0}' is already defined";
            case Code::kExportNameMissing: return "fragment cannot be exported without a name";

            case Code::kUnresolvedExport: return "cannot find exported fragment '{0}'";
            case Code::kExportNotVisible: return "exported fragment '{0}' lives in unit '{1}', which is not a dependency of unit '{2}'";
            case Code::kImportCycle: return "import cycle detected: {0}";
            case Code::kImportDepthExceeded: return "import nesting exceeds the limit of {0} while resolving '{1}'";

            case Code::kCheckerError: /* args[0] = message */ return "wgsl error: {0}";
            case Code::kCheckerWarning: /* args[0] = message */ return "wgsl warning: {0}";

            case Code::kExportIndexMissing: return "export index file is missing: '{0}'";
            case Code::kExportIndexSchema: return "invalid export index schema: '{0}'";
            case Code::kExportIndexSourceMissing: return "source of exported fragments is unavailable: '{0}'";

            case Code::kHostExpectedToken: return "expected {0}, found '{1}'";
            case Code::kHostUnexpectedEof: return "unexpected end of file, expected {0}";
            case Code::kUnknownUnit: return "unit '{0}' requires unknown unit '{1}'";
            case Code::kUnitCycle: return "unit dependency cycle: {0}";
            case Code::kDuplicateUnit: return "unit '{0}' is defined more than once";
            case Code::kDuplicateConstant: return "fragment constant '{0}' is defined more than once";
        }
        return "unknown diagnostic";
    }

    static std::string template_ko(Code c) {
        switch (c) {
            case Code::kInvalidUtf8: return "올바르지 않은 UTF-8 입니다 (오프셋 {0}, 바이트 0x{1})";
            case Code::kUnterminatedComment: return "블록 주석이 닫히지 않았습니다";
            case Code::kTooManyErrors: return "오류가 너무 많아 중단합니다";

            case Code::kNameConflict: return "export 이름 '{0}'이(가) 이미 정의되어 있습니다";
            case Code::kExportNameMissing: return "이름 없는 fragment는 export할 수 없습니다";

            case Code::kUnresolvedExport: return "export된 fragment '{0}'을(를) 찾을 수 없습니다";
            case Code::kExportNotVisible: return "export된 fragment '{0}'은(는) unit '{1}'에 있고, unit '{2}'의 의존 대상이 아닙니다";
            case Code::kImportCycle: return "import 순환이 감지되었습니다: {0}";
            case Code::kImportDepthExceeded: return "'{1}' 해석 중 import 중첩 한도({0})를 넘었습니다";

            case Code::kCheckerError: return "wgsl 오류: {0}";
            case Code::kCheckerWarning: return "wgsl 경고: {0}";

            case Code::kExportIndexMissing: return "export index 파일을 찾을 수 없습니다: '{0}'";
            case Code::kExportIndexSchema: return "export index 형식이 올바르지 않습니다: '{0}'";
            case Code::kExportIndexSourceMissing: return "export 원본 파일을 읽을 수 없습니다: '{0}'";

            case Code::kHostExpectedToken: return "{0}이(가) 필요하지만 '{1}'을(를) 만났습니다";
            case Code::kHostUnexpectedEof: return "파일이 예상보다 일찍 끝났습니다. {0}이(가) 필요합니다";
            case Code::kUnknownUnit: return "unit '{0}'이(가) 알 수 없는 unit '{1}'을(를) 요구합니다";
            case Code::kUnitCycle: return "unit 의존 관계가 순환합니다: {0}";
            case Code::kDuplicateUnit: return "unit '{0}'이(가) 두 번 이상 정의되었습니다";
            case Code::kDuplicateConstant: return "fragment 상수 '{0}'이(가) 두 번 이상 정의되었습니다";
        }
        return "알 수 없는 진단";
    }

    std::string render_message(const Diagnostic& d, Language lang) {
        std::string templ = (lang == Language::kKo) ? template_ko(d.code()) : template_en(d.code());
        return format_template(std::move(templ), d.args());
    }

    std::string render_one_context(const Diagnostic& d, Language lang, const SourceManager& sm, uint32_t context_lines) {
        std::string msg = render_message(d, lang);

        const auto sp = d.span();
        const auto lc = sm.line_col(sp.file_id, sp.lo);
        const auto ex = sm.excerpt(sp, context_lines);
        const uint32_t w = digits10(ex.first_line + static_cast<uint32_t>(ex.lines.size()) - 1);

        std::ostringstream out;

        out << severity_name_(d.severity()) << "[" << code_name(d.code()) << "]: " << msg << "\n";
        out << " --> " << sm.name(sp.file_id) << ":" << lc.line << ":" << lc.col << "\n";
        out << "  |\n";

        for (uint32_t i = 0; i < ex.lines.size(); ++i) {
            // "  12 | code..."
            const std::string num = std::to_string(ex.first_line + i);
            out << "  " << std::string(w - static_cast<uint32_t>(num.size()), ' ') << num
                << " | " << ex.lines[i] << "\n";

            if (i == ex.caret_line) {
                out << "  " << std::string(w, ' ') << " | "
                    << std::string(ex.caret_before, ' ')
                    << std::string(ex.caret_len, '^') << "\n";
            }
        }

        // related: "first defined here" 류의 보조 위치
        for (const auto& rel : d.related()) {
            auto rlc = sm.line_col(rel.file_id, rel.lo);
            out << "  = note: " << ((lang == Language::kKo) ? "관련 위치" : "related location")
                << " " << sm.name(rel.file_id) << ":" << rlc.line << ":" << rlc.col << "\n";
        }

        return out.str();
    }

    std::string render_one_json(const Diagnostic& d, Language lang, const SourceManager& sm) {
        const auto sp = d.span();
        const auto lc = sm.line_col(sp.file_id, sp.lo);

        std::ostringstream out;
        out << "{\"severity\":\"" << severity_name_(d.severity())
            << "\",\"code\":\"" << code_name(d.code())
            << "\",\"message\":\"" << json_escape_(render_message(d, lang))
            << "\",\"file\":\"" << json_escape_(sm.name(sp.file_id))
            << "\",\"line\":" << lc.line
            << ",\"col\":" << lc.col
            << ",\"lo\":" << sp.lo
            << ",\"hi\":" << sp.hi
            << ",\"related\":[";
        for (size_t i = 0; i < d.related().size(); ++i) {
            const auto& rel = d.related()[i];
            const auto rlc = sm.line_col(rel.file_id, rel.lo);
            if (i != 0) out << ",";
            out << "{\"file\":\"" << json_escape_(sm.name(rel.file_id))
                << "\",\"line\":" << rlc.line
                << ",\"col\":" << rlc.col << "}";
        }
        out << "]}";
        return out.str();
    }

} // namespace wgslink::diag
