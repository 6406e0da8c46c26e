// tools/wgslc/src/config/Config.cpp
#include <wgslc/config/Config.hpp>

#include <wgslc/config/TomlLite.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <unordered_set>

namespace wgslc::config {

namespace {

const std::unordered_set<std::string>& known_keys_() {
    static const std::unordered_set<std::string> keys = {
        "diag.lang",
        "diag.format",
        "diag.context",
        "diag.max_errors",
        "check.enabled",
        "preprocess.directives",
        "output.namespace",
    };
    return keys;
}

template <typename T>
const T* as_ptr(const Value* v) {
    if (v == nullptr) return nullptr;
    return std::get_if<T>(v);
}

void filter_unknown_keys(FlatMap& values, std::vector<std::string>& warnings, std::string_view source_name) {
    std::vector<std::string> to_erase{};
    for (const auto& [k, _] : values) {
        if (!is_known_key(k)) {
            warnings.push_back(std::string(source_name) + ": unknown key '" + k + "' ignored");
            to_erase.push_back(k);
        }
    }
    for (const auto& k : to_erase) {
        values.erase(k);
    }
}

std::string lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // namespace

bool is_valid_namespace(std::string_view ns) {
    // a::b::c 형태의 식별자 경로
    if (ns.empty()) return false;
    size_t i = 0;
    while (i < ns.size()) {
        const size_t end = ns.find("::", i);
        const std::string_view part = ns.substr(i, end == std::string_view::npos ? std::string_view::npos : end - i);
        if (part.empty() || std::isdigit(static_cast<unsigned char>(part.front()))) return false;
        for (char c : part) {
            if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') return false;
        }
        if (end == std::string_view::npos) break;
        i = end + 2;
        if (i >= ns.size()) return false;
    }
    return true;
}

bool is_known_key(std::string_view key) {
    return known_keys_().contains(std::string(key));
}

std::optional<std::filesystem::path> find_config_file(std::filesystem::path start) {
    std::error_code ec{};
    if (start.empty()) start = std::filesystem::current_path(ec);
    if (ec) return std::nullopt;

    start = std::filesystem::absolute(start, ec);
    if (ec) return std::nullopt;
    if (!std::filesystem::is_directory(start, ec)) {
        start = start.parent_path();
    }

    for (std::filesystem::path cur = start; !cur.empty(); cur = cur.parent_path()) {
        const auto candidate = cur / k_config_file_name;
        if (std::filesystem::is_regular_file(candidate, ec)) {
            return candidate;
        }
        const auto parent = cur.parent_path();
        if (parent == cur) break;
    }
    return std::nullopt;
}

bool load(const std::optional<std::filesystem::path>& explicit_path, LoadedConfig& out, std::string& err) {
    out = LoadedConfig{};
    err.clear();

    if (explicit_path.has_value()) {
        std::error_code ec{};
        if (!std::filesystem::exists(*explicit_path, ec)) {
            err = "config file not found: " + explicit_path->string();
            return false;
        }
        out.path = *explicit_path;
    } else {
        out.path = find_config_file({});
    }

    if (!out.path.has_value()) return true;

    if (!toml_lite::parse_file(*out.path, out.values, out.warnings, err)) {
        return false;
    }
    filter_unknown_keys(out.values, out.warnings, out.path->string());
    return true;
}

bool materialize(const LoadedConfig& cfg, Settings& out, std::vector<std::string>& errors) {
    Settings s{};
    const FlatMap& v = cfg.values;
    const size_t errors_before = errors.size();

    auto get_string = [&](std::string_view key, std::string& dst) {
        const auto it = v.find(std::string(key));
        if (it == v.end()) return;
        if (const auto* p = as_ptr<std::string>(&it->second); p != nullptr) {
            dst = *p;
            return;
        }
        errors.push_back("config key '" + std::string(key) + "' has wrong type (expected string)");
    };
    auto get_int = [&](std::string_view key, int64_t& dst) {
        const auto it = v.find(std::string(key));
        if (it == v.end()) return;
        if (const auto* p = as_ptr<int64_t>(&it->second); p != nullptr) {
            dst = *p;
            return;
        }
        errors.push_back("config key '" + std::string(key) + "' has wrong type (expected int)");
    };
    auto get_bool = [&](std::string_view key, bool& dst) {
        const auto it = v.find(std::string(key));
        if (it == v.end()) return;
        if (const auto* p = as_ptr<bool>(&it->second); p != nullptr) {
            dst = *p;
            return;
        }
        errors.push_back("config key '" + std::string(key) + "' has wrong type (expected bool)");
    };

    get_string("diag.lang", s.diag_lang);
    get_string("diag.format", s.diag_format);
    get_int("diag.context", s.diag_context);
    get_int("diag.max_errors", s.diag_max_errors);
    get_bool("check.enabled", s.check_enabled);
    get_bool("preprocess.directives", s.preprocess_directives);
    get_string("output.namespace", s.output_namespace);

    s.diag_lang = lower(std::move(s.diag_lang));
    if (s.diag_lang != "en" && s.diag_lang != "ko") {
        errors.push_back("config key 'diag.lang' must be \"en\" or \"ko\"");
    }
    s.diag_format = lower(std::move(s.diag_format));
    if (s.diag_format != "text" && s.diag_format != "json") {
        errors.push_back("config key 'diag.format' must be \"text\" or \"json\"");
    }
    if (s.diag_context < 0 || s.diag_context > 100) {
        errors.push_back("config key 'diag.context' must be in [0, 100]");
    }
    if (s.diag_max_errors < 1) {
        errors.push_back("config key 'diag.max_errors' must be at least 1");
    }
    if (!is_valid_namespace(s.output_namespace)) {
        errors.push_back("config key 'output.namespace' is not a valid C++ namespace");
    }

    if (errors.size() != errors_before) return false;
    out = std::move(s);
    return true;
}

} // namespace wgslc::config
