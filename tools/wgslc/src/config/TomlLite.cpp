// tools/wgslc/src/config/TomlLite.cpp
#include <wgslc/config/TomlLite.hpp>

#include <wgslink/os/File.hpp>

#include <cctype>
#include <filesystem>

namespace wgslc::config::toml_lite {

namespace {

std::string trim(std::string_view s) {
    const auto is_space = [](unsigned char c) {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r';
    };
    size_t b = 0;
    size_t e = s.size();
    while (b < e && is_space(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && is_space(static_cast<unsigned char>(s[e - 1]))) --e;
    return std::string(s.substr(b, e - b));
}

std::string strip_comment(std::string_view line) {
    std::string out{};
    bool in_string = false;
    bool escaped = false;
    for (char c : line) {
        if (!in_string && c == '#') break;
        out.push_back(c);
        if (!in_string) {
            if (c == '"') in_string = true;
            continue;
        }
        if (escaped) {
            escaped = false;
            continue;
        }
        if (c == '\\') {
            escaped = true;
            continue;
        }
        if (c == '"') in_string = false;
    }
    return out;
}

bool parse_string_literal(std::string_view text, std::string& out, std::string& err) {
    if (text.size() < 2 || text.front() != '"' || text.back() != '"') {
        err = "invalid string literal";
        return false;
    }
    out.clear();
    bool escaped = false;
    for (size_t i = 1; i + 1 < text.size(); ++i) {
        const char c = text[i];
        if (escaped) {
            switch (c) {
                case 'n': out.push_back('\n'); break;
                case 't': out.push_back('\t'); break;
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                default:
                    err = std::string("unsupported escape '\\") + c + "'";
                    return false;
            }
            escaped = false;
            continue;
        }
        if (c == '\\') {
            escaped = true;
            continue;
        }
        if (c == '"') {
            err = "unexpected '\"' inside string literal";
            return false;
        }
        out.push_back(c);
    }
    if (escaped) {
        err = "unterminated escape in string literal";
        return false;
    }
    return true;
}

bool parse_int_literal(std::string_view text, int64_t& out) {
    if (text.empty() || text.size() > 18) return false;
    size_t i = 0;
    bool neg = false;
    if (text[0] == '+' || text[0] == '-') {
        neg = (text[0] == '-');
        i = 1;
    }
    if (i >= text.size()) return false;

    int64_t v = 0;
    for (; i < text.size(); ++i) {
        const char c = text[i];
        if (c == '_') continue;
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        v = v * 10 + (c - '0');
    }
    out = neg ? -v : v;
    return true;
}

bool parse_value(std::string_view text, Value& out, std::string& err) {
    const std::string v = trim(text);
    if (v.empty()) {
        err = "empty value";
        return false;
    }

    if (v == "true") {
        out = true;
        return true;
    }
    if (v == "false") {
        out = false;
        return true;
    }

    int64_t iv = 0;
    if (parse_int_literal(v, iv)) {
        out = iv;
        return true;
    }

    if (v.front() == '"') {
        std::string sv{};
        if (!parse_string_literal(v, sv, err)) return false;
        out = std::move(sv);
        return true;
    }

    err = "unsupported value '" + v + "'";
    return false;
}

bool valid_key(std::string_view key) {
    if (key.empty() || key.front() == '.' || key.back() == '.') return false;
    for (char c : key) {
        const bool ok = std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '.';
        if (!ok) return false;
    }
    return true;
}

} // namespace

bool parse_text(std::string_view text,
                std::string_view source_name,
                FlatMap& out,
                std::vector<std::string>& warnings,
                std::string& err) {
    out.clear();
    err.clear();

    const std::string src(source_name);
    std::string section{};
    size_t line_no = 0;
    size_t pos = 0;
    while (pos <= text.size()) {
        size_t nl = text.find('\n', pos);
        if (nl == std::string_view::npos) nl = text.size();
        const std::string_view line = text.substr(pos, nl - pos);
        pos = nl + 1;
        ++line_no;

        const std::string content = trim(strip_comment(line));
        if (content.empty()) continue;

        const std::string where = src + ":" + std::to_string(line_no) + ": ";

        if (content.front() == '[') {
            if (content.back() != ']') {
                err = where + "invalid section header";
                return false;
            }
            const std::string sec = trim(std::string_view(content).substr(1, content.size() - 2));
            if (sec.empty() || !valid_key(sec)) {
                err = where + "invalid section name";
                return false;
            }
            section = sec;
            continue;
        }

        const auto eq = content.find('=');
        if (eq == std::string::npos) {
            err = where + "expected '='";
            return false;
        }
        const std::string key = trim(std::string_view(content).substr(0, eq));
        const std::string rhs = trim(std::string_view(content).substr(eq + 1));
        if (!valid_key(key)) {
            err = where + "invalid key";
            return false;
        }

        Value parsed{};
        std::string parse_err{};
        if (!parse_value(rhs, parsed, parse_err)) {
            err = where + parse_err;
            return false;
        }

        const std::string fq = section.empty() ? key : section + "." + key;
        if (out.contains(fq)) {
            warnings.push_back(where + "duplicate key '" + fq + "', overriding");
        }
        out[fq] = std::move(parsed);
    }

    return true;
}

bool parse_file(const std::filesystem::path& path,
                FlatMap& out,
                std::vector<std::string>& warnings,
                std::string& err) {
    out.clear();
    err.clear();

    std::error_code ec{};
    if (!std::filesystem::is_regular_file(path, ec)) {
        err = "not a regular file: " + path.string();
        return false;
    }

    std::string text{};
    std::string io_err{};
    if (!wgslink::open_file(path.string(), text, io_err)) {
        err = io_err;
        return false;
    }
    return parse_text(text, path.string(), out, warnings, err);
}

} // namespace wgslc::config::toml_lite
