// frontend/src/link/export_index.cpp
#include <wgslink/link/ExportIndex.hpp>
#include <wgslink/os/File.hpp>

#include <cctype>
#include <iomanip>
#include <sstream>
#include <unordered_map>


namespace wgslink::link {

    namespace {

        std::string json_escape_text_(std::string_view s) {
            std::string out;
            out.reserve(s.size() + 8);
            for (const char ch : s) {
                switch (ch) {
                    case '\"': out += "\\\""; break;
                    case '\\': out += "\\\\"; break;
                    case '\n': out += "\\n"; break;
                    case '\r': out += "\\r"; break;
                    case '\t': out += "\\t"; break;
                    default:
                        if (static_cast<unsigned char>(ch) < 0x20) {
                            std::ostringstream oss;
                            oss << "\\u" << std::hex << std::uppercase
                                << std::setw(4) << std::setfill('0')
                                << static_cast<int>(static_cast<unsigned char>(ch));
                            out += oss.str();
                        } else {
                            out.push_back(ch);
                        }
                        break;
                }
            }
            return out;
        }

        bool json_unescape_text_(std::string_view in, std::string& out) {
            auto hex_value_ = [](char c) -> int {
                if (c >= '0' && c <= '9') return c - '0';
                if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
                if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
                return -1;
            };

            out.clear();
            out.reserve(in.size());
            for (size_t i = 0; i < in.size(); ++i) {
                const char c = in[i];
                if (c != '\\') {
                    out.push_back(c);
                    continue;
                }
                if (i + 1 >= in.size()) return false;
                const char n = in[++i];
                switch (n) {
                    case '\"': out.push_back('\"'); break;
                    case '\\': out.push_back('\\'); break;
                    case '/': out.push_back('/'); break;
                    case 'n': out.push_back('\n'); break;
                    case 'r': out.push_back('\r'); break;
                    case 't': out.push_back('\t'); break;
                    case 'u': {
                        // 쓰는 쪽은 제어 문자만 \u로 내보낸다.
                        if (i + 4 >= in.size()) return false;
                        int v = 0;
                        for (size_t k = 1; k <= 4; ++k) {
                            const int h = hex_value_(in[i + k]);
                            if (h < 0) return false;
                            v = (v << 4) | h;
                        }
                        if (v > 0x7F) return false;
                        out.push_back(static_cast<char>(v));
                        i += 4;
                        break;
                    }
                    default:
                        return false;
                }
            }
            return true;
        }

        /// @brief `"key"` 다음에 ':'가 오는 위치를 찾는다 (같은 글자의 문자열 값은 건너뛴다).
        bool find_json_key_pos_(std::string_view text, std::string_view key, size_t& out_pos) {
            const std::string needle = "\"" + std::string(key) + "\"";
            size_t at = 0;
            while ((at = text.find(needle, at)) != std::string_view::npos) {
                size_t p = at + needle.size();
                while (p < text.size() && std::isspace(static_cast<unsigned char>(text[p]))) ++p;
                if (p < text.size() && text[p] == ':') {
                    out_pos = p;
                    return true;
                }
                at += needle.size();
            }
            return false;
        }

        bool parse_json_string_at_(std::string_view text, size_t& pos, std::string& out) {
            while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) ++pos;
            if (pos >= text.size() || text[pos] != '"') return false;
            ++pos;
            std::string raw{};
            bool escaped = false;
            for (; pos < text.size(); ++pos) {
                const char c = text[pos];
                if (escaped) {
                    raw.push_back(c);
                    escaped = false;
                    continue;
                }
                if (c == '\\') {
                    raw.push_back(c);
                    escaped = true;
                    continue;
                }
                if (c == '"') break;
                raw.push_back(c);
            }
            if (pos >= text.size() || text[pos] != '"') return false;
            ++pos;
            return json_unescape_text_(raw, out);
        }

        bool parse_json_string_field_(std::string_view text, std::string_view key, std::string& out) {
            size_t pos = 0;
            if (!find_json_key_pos_(text, key, pos)) return false;
            ++pos; // ':'
            return parse_json_string_at_(text, pos, out);
        }

        bool parse_json_uint_field_(std::string_view text, std::string_view key, uint32_t& out) {
            size_t pos = 0;
            if (!find_json_key_pos_(text, key, pos)) return false;
            ++pos;
            while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) ++pos;
            size_t end = pos;
            while (end < text.size() && std::isdigit(static_cast<unsigned char>(text[end]))) ++end;
            if (end == pos) return false;
            try {
                out = static_cast<uint32_t>(std::stoul(std::string(text.substr(pos, end - pos))));
                return true;
            } catch (const std::exception&) {
                return false;
            }
        }

        bool parse_json_bool_field_(std::string_view text, std::string_view key, bool& out) {
            size_t pos = 0;
            if (!find_json_key_pos_(text, key, pos)) return false;
            ++pos;
            while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) ++pos;
            if (text.substr(pos, 4) == "true") {
                out = true;
                return true;
            }
            if (text.substr(pos, 5) == "false") {
                out = false;
                return true;
            }
            return false;
        }

        bool parse_json_string_array_field_(std::string_view text, std::string_view key, std::vector<std::string>& out) {
            out.clear();
            size_t pos = 0;
            if (!find_json_key_pos_(text, key, pos)) return false;
            pos = text.find('[', pos);
            if (pos == std::string_view::npos) return false;
            ++pos;

            while (true) {
                while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) ++pos;
                if (pos >= text.size()) return false;
                if (text[pos] == ']') return true;

                std::string s{};
                if (!parse_json_string_at_(text, pos, s)) return false;
                out.push_back(std::move(s));

                while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) ++pos;
                if (pos < text.size() && text[pos] == ',') ++pos;
            }
        }

        bool parse_json_array_object_slices_(std::string_view text, std::string_view key, std::vector<std::string_view>& out) {
            out.clear();
            size_t pos = 0;
            if (!find_json_key_pos_(text, key, pos)) return false;
            pos = text.find('[', pos);
            if (pos == std::string_view::npos) return false;
            ++pos;

            int depth = 0;
            bool in_string = false;
            bool escaped = false;
            size_t obj_begin = std::string_view::npos;

            for (size_t i = pos; i < text.size(); ++i) {
                const char c = text[i];
                if (in_string) {
                    if (escaped) {
                        escaped = false;
                    } else if (c == '\\') {
                        escaped = true;
                    } else if (c == '"') {
                        in_string = false;
                    }
                    continue;
                }

                if (c == '"') {
                    in_string = true;
                    continue;
                }

                if (c == '{') {
                    if (depth == 0) obj_begin = i;
                    ++depth;
                    continue;
                }
                if (c == '}') {
                    --depth;
                    if (depth == 0 && obj_begin != std::string_view::npos) {
                        out.push_back(text.substr(obj_begin, i - obj_begin + 1));
                        obj_begin = std::string_view::npos;
                    }
                    continue;
                }
                if (c == ']' && depth == 0) {
                    return true;
                }
            }
            return false;
        }

        bool parse_export_object_(std::string_view obj, ExportDefinition& e, std::string& out_err) {
            // name/unit/file/lo/hi는 tokens 배열보다 앞에 쓰므로 첫 번째 일치가 export 자신의 필드다.
            if (!parse_json_string_field_(obj, "name", e.name) || e.name.empty()) {
                out_err = "invalid export field 'name'";
                return false;
            }
            if (!parse_json_string_field_(obj, "unit", e.unit) || e.unit.empty()) {
                out_err = "invalid export field 'unit' of '" + e.name + "'";
                return false;
            }
            if (!parse_json_string_field_(obj, "file", e.file)) {
                out_err = "invalid export field 'file' of '" + e.name + "'";
                return false;
            }
            if (!parse_json_uint_field_(obj, "lo", e.lo) || !parse_json_uint_field_(obj, "hi", e.hi) || e.hi < e.lo) {
                out_err = "invalid export span of '" + e.name + "'";
                return false;
            }

            std::vector<std::string_view> tok_objs{};
            if (!parse_json_array_object_slices_(obj, "tokens", tok_objs)) {
                out_err = "invalid export field 'tokens' of '" + e.name + "'";
                return false;
            }

            e.tokens.clear();
            e.tokens.reserve(tok_objs.size());
            for (const auto t : tok_objs) {
                std::string kind_s{};
                ExportedToken tok{};
                if (!parse_json_string_field_(t, "kind", kind_s)
                    || !parse_json_string_field_(t, "text", tok.text)
                    || !parse_json_uint_field_(t, "lo", tok.lo)
                    || !parse_json_uint_field_(t, "hi", tok.hi)
                    || !parse_json_bool_field_(t, "line_start", tok.line_start)) {
                    out_err = "invalid token entry in '" + e.name + "'";
                    return false;
                }
                if (tok.hi < tok.lo) {
                    out_err = "invalid token span in '" + e.name + "'";
                    return false;
                }
                const auto kind = syntax::token_kind_from_name(kind_s);
                if (!kind.has_value() || tok.text.empty()) {
                    out_err = "unknown token kind '" + kind_s + "' in '" + e.name + "'";
                    return false;
                }
                tok.kind = *kind;
                e.tokens.push_back(std::move(tok));
            }
            return true;
        }

    } // namespace

    std::optional<ExportDefinition> emit_export_definition(
        const ExportRegistry& registry,
        std::string_view name,
        const SourceManager& sm
    ) {
        const auto* entry = registry.find(name);
        if (entry == nullptr) return std::nullopt;

        ExportDefinition def{};
        def.name = entry->name;
        def.unit = std::string(registry.unit_name(entry->unit));
        def.file = std::string(sm.name(entry->fragment.span.file_id));
        def.lo = entry->fragment.span.lo;
        def.hi = entry->fragment.span.hi;

        def.tokens.reserve(entry->fragment.tokens.size());
        for (const auto& t : entry->fragment.tokens) {
            const Span sp = t.origin.surfaced();
            def.tokens.push_back(ExportedToken{t.kind, t.text, sp.lo, sp.hi, t.line_start});
        }
        return def;
    }

    bool write_export_index(const std::string& path, const ExportIndex& index, std::string& out_err) {
        std::ostringstream ofs;

        ofs << "{\n";
        ofs << "  \"version\": " << k_export_index_version << ",\n";

        ofs << "  \"units\": [\n";
        for (size_t i = 0; i < index.units.size(); ++i) {
            const auto& u = index.units[i];
            ofs << "    {\"name\":\"" << json_escape_text_(u.name) << "\",\"requires\":[";
            for (size_t j = 0; j < u.requires_units.size(); ++j) {
                if (j != 0) ofs << ",";
                ofs << "\"" << json_escape_text_(u.requires_units[j]) << "\"";
            }
            ofs << "]}";
            if (i + 1 != index.units.size()) ofs << ",";
            ofs << "\n";
        }
        ofs << "  ],\n";

        ofs << "  \"exports\": [\n";
        for (size_t i = 0; i < index.exports.size(); ++i) {
            const auto& e = index.exports[i];
            ofs << "    {\"name\":\"" << json_escape_text_(e.name)
                << "\",\"unit\":\"" << json_escape_text_(e.unit)
                << "\",\"file\":\"" << json_escape_text_(e.file)
                << "\",\"lo\":" << e.lo
                << ",\"hi\":" << e.hi
                << ",\"tokens\":[";
            for (size_t j = 0; j < e.tokens.size(); ++j) {
                const auto& t = e.tokens[j];
                if (j != 0) ofs << ",";
                ofs << "{\"kind\":\"" << json_escape_text_(syntax::token_kind_name(t.kind))
                    << "\",\"text\":\"" << json_escape_text_(t.text)
                    << "\",\"lo\":" << t.lo
                    << ",\"hi\":" << t.hi
                    << ",\"line_start\":" << (t.line_start ? "true" : "false") << "}";
            }
            ofs << "]}";
            if (i + 1 != index.exports.size()) ofs << ",";
            ofs << "\n";
        }
        ofs << "  ]\n";
        ofs << "}\n";

        return write_file(path, ofs.str(), out_err);
    }

    bool parse_export_index(std::string_view text, ExportIndex& out, std::string& out_err) {
        out = ExportIndex{};
        out_err.clear();

        uint32_t version = 0;
        if (!parse_json_uint_field_(text, "version", version) || version != k_export_index_version) {
            out_err = "unsupported export-index version";
            return false;
        }

        // units/exports 배열은 항상 최상위에 한 번씩만 나온다.
        std::vector<std::string_view> unit_objs{};
        if (!parse_json_array_object_slices_(text, "units", unit_objs)) {
            out_err = "invalid export-index units array";
            return false;
        }
        for (const auto obj : unit_objs) {
            IndexUnit u{};
            if (!parse_json_string_field_(obj, "name", u.name) || u.name.empty()) {
                out_err = "invalid unit field 'name'";
                return false;
            }
            if (!parse_json_string_array_field_(obj, "requires", u.requires_units)) {
                out_err = "invalid unit field 'requires' of '" + u.name + "'";
                return false;
            }
            out.units.push_back(std::move(u));
        }

        std::vector<std::string_view> export_objs{};
        if (!parse_json_array_object_slices_(text, "exports", export_objs)) {
            out_err = "invalid export-index exports array";
            return false;
        }
        for (const auto obj : export_objs) {
            ExportDefinition e{};
            if (!parse_export_object_(obj, e, out_err)) return false;
            out.exports.push_back(std::move(e));
        }
        return true;
    }

    bool register_export_index(
        const ExportIndex& index,
        ExportRegistry& registry,
        SourceManager& sm,
        Span at,
        diag::Bag& bag
    ) {
        bool ok = true;

        for (const auto& u : index.units) {
            if (registry.find_unit(u.name).has_value()) {
                diag::Diagnostic d(diag::Severity::kError, diag::Code::kDuplicateUnit, at);
                d.add_arg(u.name);
                bag.add(std::move(d));
                ok = false;
                continue;
            }

            std::vector<UnitId> deps{};
            bool deps_ok = true;
            for (const auto& r : u.requires_units) {
                const auto id = registry.find_unit(r);
                if (!id.has_value()) {
                    diag::Diagnostic d(diag::Severity::kError, diag::Code::kUnknownUnit, at);
                    d.add_arg(u.name);
                    d.add_arg(r);
                    bag.add(std::move(d));
                    deps_ok = false;
                    continue;
                }
                deps.push_back(*id);
            }
            if (!deps_ok || !registry.add_unit(u.name, deps).has_value()) {
                ok = false;
            }
        }

        std::unordered_map<std::string, uint32_t> file_ids{};
        for (const auto& e : index.exports) {
            const auto unit = registry.find_unit(e.unit);
            if (!unit.has_value()) {
                diag::Diagnostic d(diag::Severity::kError, diag::Code::kExportIndexSchema, at);
                d.add_arg("export '" + e.name + "' names unknown unit '" + e.unit + "'");
                bag.add(std::move(d));
                ok = false;
                continue;
            }

            uint32_t fid = 0;
            if (auto it = file_ids.find(e.file); it != file_ids.end()) {
                fid = it->second;
            } else if (auto known = sm.find(e.file)) {
                fid = *known;
                file_ids.emplace(e.file, fid);
            } else {
                std::string content{};
                std::string io_err{};
                if (!open_file(e.file, content, io_err)) {
                    // 위치 정보만 잃는다. 텍스트는 index에 들어 있으므로 계속 진행한다.
                    diag::Diagnostic d(diag::Severity::kWarning, diag::Code::kExportIndexSourceMissing, at);
                    d.add_arg(e.file);
                    bag.add(std::move(d));
                    content.clear();
                }
                fid = sm.add(e.file, std::move(content));
                file_ids.emplace(e.file, fid);
            }

            Fragment f{};
            f.name = e.name;
            f.span = Span{fid, e.lo, e.hi};
            f.tokens.reserve(e.tokens.size());
            for (const auto& t : e.tokens) {
                f.tokens.push_back(FragToken{t.kind, t.text, Origin::direct(Span{fid, t.lo, t.hi}), t.line_start});
            }

            if (!registry.register_export(std::move(f), *unit, bag)) ok = false;
        }

        return ok;
    }

} // namespace wgslink::link
