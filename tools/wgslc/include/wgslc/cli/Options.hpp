// tools/wgslc/include/wgslc/cli/Options.hpp
#pragma once

#include <wgslink/diag/DiagCode.hpp>

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>


namespace wgslc::cli {

    enum class Mode : uint8_t {
        kUsage,
        kVersion,
        kBuild,
    };

    enum class DiagFormat : uint8_t {
        kText,
        kJson,
    };

    struct Options {
        Mode mode = Mode::kUsage;

        std::vector<std::string> inputs{};        // *.wgslu (명령줄 순서 유지)
        std::string out_header{};                 // -o
        std::string emit_index{};                 // --emit-export-index
        std::vector<std::string> load_indexes{};  // --load-export-index (반복 가능)
        std::string config_path{};                // --config

        bool print = false;
        bool verbose = false;

        // 설정 파일 값을 덮어쓴다. 명령줄에 없으면 nullopt.
        std::optional<wgslink::diag::Language> lang{};
        std::optional<DiagFormat> diag_format{};
        std::optional<uint32_t> context_lines{};
        std::optional<uint32_t> max_errors{};
        std::optional<bool> check{};
        std::optional<bool> directives{};
        std::optional<std::string> ns{};

        bool ok = true;
        std::string error{};
    };

    /// @brief `wgslc` CLI 사용법을 출력한다.
    void print_usage(std::ostream& os);

    /// @brief CLI 인자를 파싱해 실행 옵션 구조체로 변환한다.
    Options parse_options(int argc, char** argv);

} // namespace wgslc::cli
