// tools/wgslc/include/wgslc/config/Config.hpp
#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace wgslc::config {

using Value = std::variant<std::string, int64_t, bool>;
using FlatMap = std::map<std::string, Value>;

inline constexpr std::string_view k_config_file_name = "wgslc.toml";

struct LoadedConfig {
    std::optional<std::filesystem::path> path{};  // 읽은 파일 (없으면 기본값만)
    FlatMap values{};
    std::vector<std::string> warnings{};
};

struct Settings {
    std::string diag_lang = "en";
    std::string diag_format = "text";
    int64_t diag_context = 2;
    int64_t diag_max_errors = 64;

    bool check_enabled = true;
    bool preprocess_directives = true;

    std::string output_namespace = "wgsl";
};

bool is_known_key(std::string_view key);

/// @brief `a::b::c` 형태의 C++ namespace 경로인가.
bool is_valid_namespace(std::string_view ns);

/// @brief start에서 위로 올라가며 wgslc.toml을 찾는다.
std::optional<std::filesystem::path> find_config_file(std::filesystem::path start);

/// @brief explicit_path가 있으면 그 파일을, 없으면 현재 디렉터리부터 탐색한 파일을 읽는다.
/// @details 모르는 키는 경고와 함께 버린다. 명시한 파일이 없거나 문법 오류면 false.
bool load(const std::optional<std::filesystem::path>& explicit_path, LoadedConfig& out, std::string& err);

/// @brief 읽은 값을 Settings로 옮긴다. 타입/값이 잘못된 키는 errors에 쌓고 false.
bool materialize(const LoadedConfig& cfg, Settings& out, std::vector<std::string>& errors);

} // namespace wgslc::config
