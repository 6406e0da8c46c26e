// tools/wgslc/include/wgslc/config/TomlLite.hpp
#pragma once

#include <wgslc/config/Config.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace wgslc::config::toml_lite {

/// @brief `[section]` 과 `key = value` 만 받는 평탄한 TOML 부분집합을 읽는다.
bool parse_text(std::string_view text,
                std::string_view source_name,
                FlatMap& out,
                std::vector<std::string>& warnings,
                std::string& err);

bool parse_file(const std::filesystem::path& path,
                FlatMap& out,
                std::vector<std::string>& warnings,
                std::string& err);

} // namespace wgslc::config::toml_lite
