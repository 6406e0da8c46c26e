// tests/harness/run_wgslc_cli_tests.cpp
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace {

const std::filesystem::path k_cases = WGSLC_CASE_DIR;
const std::filesystem::path k_tmp = WGSLC_TEST_TMP_DIR;

std::pair<int, std::string> run_capture(const std::string& command) {
    std::error_code ec{};
    std::filesystem::create_directories(k_tmp, ec);
    const std::string tmp = (k_tmp / "wgslc_cli_capture.txt").string();
    const std::string full = command + " > \"" + tmp + "\" 2>&1";
    const int rc = std::system(full.c_str());

    std::ifstream ifs(tmp, std::ios::binary);
    std::string out;
    if (ifs) {
        out.assign((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    }
    std::remove(tmp.c_str());
    return {rc, out};
}

bool contains(const std::string& s, const std::string& needle) {
    return s.find(needle) != std::string::npos;
}

size_t count_of(const std::string& s, const std::string& needle) {
    size_t n = 0;
    for (size_t p = s.find(needle); p != std::string::npos; p = s.find(needle, p + 1)) ++n;
    return n;
}

std::string read_text(const std::filesystem::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    std::string out;
    if (ifs) {
        out.assign((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    }
    return out;
}

/// @brief wgslc 명령줄을 만든다. 인자는 그대로 따옴표로 감싼다.
std::string wgslc(const std::vector<std::string>& args) {
    std::string cmd = "\"" + std::string(WGSLC_BUILD_BIN) + "\"";
    for (const auto& a : args) cmd += " \"" + a + "\"";
    return cmd;
}

std::string unit_case(const char* name) {
    return (k_cases / name).string();
}

/// @brief 생성된 헤더에서 상수 하나의 raw string 본문만 꺼낸다.
std::string constant_body(const std::string& header, const std::string& constant) {
    const std::string open = constant + " = R\"wgsl(";
    const size_t b = header.find(open);
    if (b == std::string::npos) return {};
    const size_t e = header.find(")wgsl\"", b + open.size());
    if (e == std::string::npos) return {};
    return header.substr(b + open.size(), e - b - open.size());
}

bool test_help_and_version() {
    auto [rc_help, out_help] = run_capture(wgslc({"--help"}));
    if (rc_help != 0 || !contains(out_help, "--emit-export-index")) {
        std::cerr << "help output mismatch\n" << out_help;
        return false;
    }

    auto [rc_ver, out_ver] = run_capture(wgslc({"--version"}));
    if (rc_ver != 0 || !contains(out_ver, "wgslink v")) {
        std::cerr << "version output mismatch\n" << out_ver;
        return false;
    }

    auto [rc_bad, out_bad] = run_capture(wgslc({"--frobnicate", unit_case("math.wgslu")}));
    if (rc_bad == 0 || !contains(out_bad, "unknown option '--frobnicate'")) {
        std::cerr << "unknown option must fail\n" << out_bad;
        return false;
    }
    return true;
}

bool test_header_generation() {
    const auto header = k_tmp / "gen" / "shaders.hpp";
    std::error_code ec{};
    std::filesystem::remove_all(header.parent_path(), ec);

    // 명령줄 순서와 무관하게 의존 unit이 먼저 처리된다.
    auto [rc, out] = run_capture(wgslc({
        unit_case("main.wgslu"), unit_case("blend.wgslu"), unit_case("math.wgslu"),
        "-o", header.string(), "--namespace", "gfx::wgsl", "--verbose",
    }));
    if (rc != 0) {
        std::cerr << "header build failed\n" << out;
        return false;
    }
    if (!contains(out, "[wgslc] unit order: math, blend, main")) {
        std::cerr << "unit order log mismatch\n" << out;
        return false;
    }
    if (!contains(out, "main::MAIN_CS: checked, imports")) {
        std::cerr << "per-fragment log missing\n" << out;
        return false;
    }

    const std::string text = read_text(header);
    if (!contains(text, "// generated by wgslc. do not edit.") || !contains(text, "#pragma once")
        || !contains(text, "namespace gfx::wgsl {")) {
        std::cerr << "header preamble mismatch\n" << text;
        return false;
    }

    const std::string body = constant_body(text, "MAIN_CS");
    if (body.empty()) {
        std::cerr << "MAIN_CS constant missing\n" << text;
        return false;
    }
    const size_t p_lerp = body.find("fn lerp3(");
    const size_t p_blend = body.find("fn blend_colors(");
    const size_t p_main = body.find("fn main(");
    if (p_lerp == std::string::npos || p_blend == std::string::npos || p_main == std::string::npos
        || !(p_lerp < p_blend && p_blend < p_main)) {
        std::cerr << "definitions must precede their users\n" << body;
        return false;
    }
    if (count_of(body, "fn lerp3(") != 1 || count_of(body, "fn saturate1(") != 1 || contains(body, "#")) {
        std::cerr << "each import must appear exactly once without markers\n" << body;
        return false;
    }

    // 같은 입력이면 같은 출력
    const std::string first = text;
    auto [rc2, out2] = run_capture(wgslc({
        unit_case("main.wgslu"), unit_case("blend.wgslu"), unit_case("math.wgslu"),
        "-o", header.string(), "--namespace", "gfx::wgsl",
    }));
    if (rc2 != 0 || read_text(header) != first) {
        std::cerr << "second build must produce an identical header\n" << out2;
        return false;
    }
    return true;
}

bool test_print_directive_fragment() {
    auto [rc, out] = run_capture(wgslc({unit_case("math.wgslu"), unit_case("tonemap.wgslu"), "--print"}));
    if (rc != 0) {
        std::cerr << "tonemap build failed\n" << out;
        return false;
    }
    if (!contains(out, "// TONEMAP (unchecked)") || !contains(out, "// LERP3 (checked)")) {
        std::cerr << "print labels mismatch\n" << out;
        return false;
    }
    if (!contains(out, "#ifdef HDR") || !contains(out, "#else") || !contains(out, "#endif")) {
        std::cerr << "directives must survive expansion\n" << out;
        return false;
    }

    const size_t tonemap = out.find("// TONEMAP");
    const std::string tail = out.substr(tonemap);
    if (count_of(tail, "fn saturate1(") != 1) {
        std::cerr << "import used in both branches must be emitted once\n" << tail;
        return false;
    }
    return true;
}

bool test_checker_error_blocks_output() {
    const auto header = k_tmp / "broken" / "broken.hpp";
    std::error_code ec{};
    std::filesystem::remove_all(header.parent_path(), ec);

    auto [rc, out] = run_capture(wgslc({unit_case("broken.wgslu"), "-o", header.string()}));
    if (rc == 0) {
        std::cerr << "broken fragment expected failure but passed\n" << out;
        return false;
    }
    if (!contains(out, "error[CheckerError]: wgsl error: ") || !contains(out, "'missing_value'")) {
        std::cerr << "checker message mismatch\n" << out;
        return false;
    }
    if (!contains(out, "broken.wgslu:5:16")) {
        std::cerr << "error must point into the unit file\n" << out;
        return false;
    }
    if (std::filesystem::exists(header, ec)) {
        std::cerr << "no header may be written on error\n";
        return false;
    }

    auto [rc_nc, out_nc] = run_capture(wgslc({unit_case("broken.wgslu"), "--no-check", "--print"}));
    if (rc_nc != 0 || !contains(out_nc, "return missing_value;")) {
        std::cerr << "--no-check must pass the fragment through\n" << out_nc;
        return false;
    }
    return true;
}

bool test_json_and_korean_diagnostics() {
    auto [rc, out] = run_capture(wgslc({unit_case("broken.wgslu"), "--diag-format", "json"}));
    if (rc == 0 || !contains(out, "\"code\":\"CheckerError\"") || !contains(out, "\"line\":5")) {
        std::cerr << "json diagnostic mismatch\n" << out;
        return false;
    }

    auto [rc_ko, out_ko] = run_capture(wgslc({unit_case("orphan.wgslu"), "--lang", "ko"}));
    if (rc_ko == 0 || !contains(out_ko, "알 수 없는 unit 'nowhere'")) {
        std::cerr << "korean diagnostic mismatch\n" << out_ko;
        return false;
    }

    // 설정 파일: json + ko, 명령줄 --lang이 이긴다
    auto [rc_cfg, out_cfg] = run_capture(wgslc({
        unit_case("orphan.wgslu"), "--config", unit_case("json_diag.toml"), "--lang", "en",
    }));
    if (rc_cfg == 0 || !contains(out_cfg, "\"code\":\"UnknownUnit\"")
        || !contains(out_cfg, "unit 'orphan' requires unknown unit 'nothere'")) {
        std::cerr << "config driven diagnostics mismatch\n" << out_cfg;
        return false;
    }
    return true;
}

bool test_config_namespace_and_errors() {
    const auto header = k_tmp / "cfg" / "math.hpp";
    auto [rc, out] = run_capture(wgslc({
        unit_case("math.wgslu"), "--config", unit_case("json_diag.toml"), "-o", header.string(),
    }));
    if (rc != 0 || !contains(read_text(header), "namespace cfg::shaders {")) {
        std::cerr << "namespace from config not applied\n" << out;
        return false;
    }

    auto [rc_bad, out_bad] = run_capture(wgslc({unit_case("math.wgslu"), "--config", unit_case("bad_lang.toml")}));
    if (rc_bad == 0 || !contains(out_bad, "config key 'diag.lang' must be")) {
        std::cerr << "bad config must be rejected\n" << out_bad;
        return false;
    }

    auto [rc_ns, out_ns] = run_capture(wgslc({unit_case("math.wgslu"), "--namespace", "a::::b"}));
    if (rc_ns == 0 || !contains(out_ns, "is not a valid C++ namespace")) {
        std::cerr << "bad namespace must be rejected\n" << out_ns;
        return false;
    }

    auto [rc_missing, out_missing] = run_capture(wgslc({unit_case("math.wgslu"), "--config", unit_case("nope.toml")}));
    if (rc_missing == 0 || !contains(out_missing, "config file not found")) {
        std::cerr << "missing config must be rejected\n" << out_missing;
        return false;
    }
    return true;
}

bool test_unit_graph_errors() {
    auto [rc_cycle, out_cycle] = run_capture(wgslc({unit_case("cycle_a.wgslu"), unit_case("cycle_b.wgslu")}));
    if (rc_cycle == 0 || !contains(out_cycle, "unit dependency cycle: ca -> cb -> ca")) {
        std::cerr << "unit cycle mismatch\n" << out_cycle;
        return false;
    }

    auto [rc_max, out_max] = run_capture(wgslc({unit_case("orphan.wgslu"), "--max-errors", "1"}));
    if (rc_max == 0 || count_of(out_max, "error[UnknownUnit]") != 1 || !contains(out_max, "TooManyErrors")) {
        std::cerr << "--max-errors must cut the report\n" << out_max;
        return false;
    }

    auto [rc_dup, out_dup] = run_capture(wgslc({unit_case("dup_const.wgslu")}));
    if (rc_dup == 0 || !contains(out_dup, "fragment constant 'X' is defined more than once")
        || !contains(out_dup, "= note: related location")) {
        std::cerr << "duplicate constant mismatch\n" << out_dup;
        return false;
    }

    auto [rc_unit, out_unit] = run_capture(wgslc({unit_case("math.wgslu"), unit_case("math.wgslu")}));
    if (rc_unit == 0 || !contains(out_unit, "unit 'math' is defined more than once")) {
        std::cerr << "duplicate unit mismatch\n" << out_unit;
        return false;
    }

    auto [rc_host, out_host] = run_capture(wgslc({unit_case("host_syntax.wgslu")}));
    if (rc_host == 0 || !contains(out_host, "expected fragment constant name, found '{'")) {
        std::cerr << "unit file syntax error mismatch\n" << out_host;
        return false;
    }

    auto [rc_io, out_io] = run_capture(wgslc({unit_case("does_not_exist.wgslu")}));
    if (rc_io == 0 || !contains(out_io, "error:")) {
        std::cerr << "missing input must fail\n" << out_io;
        return false;
    }
    return true;
}

bool test_import_resolution_errors() {
    auto [rc_unres, out_unres] = run_capture(wgslc({unit_case("unresolved.wgslu")}));
    if (rc_unres == 0 || !contains(out_unres, "cannot find exported fragment 'nothing'")) {
        std::cerr << "unresolved import mismatch\n" << out_unres;
        return false;
    }

    auto [rc_vis, out_vis] = run_capture(wgslc({unit_case("math.wgslu"), unit_case("not_visible.wgslu")}));
    if (rc_vis == 0 || !contains(out_vis, "lives in unit 'math', which is not a dependency of unit 'nv'")) {
        std::cerr << "visibility error mismatch\n" << out_vis;
        return false;
    }
    return true;
}

bool test_export_index_across_runs() {
    const auto dir = k_tmp / "chain";
    std::error_code ec{};
    std::filesystem::remove_all(dir, ec);
    const std::string math_idx = (dir / "math.exports.json").string();
    const std::string blend_idx = (dir / "blend.exports.json").string();
    const std::string header = (dir / "app.hpp").string();

    auto [rc1, out1] = run_capture(wgslc({unit_case("math.wgslu"), "--emit-export-index", math_idx}));
    if (rc1 != 0 || !contains(read_text(math_idx), "\"lerp3\"")) {
        std::cerr << "math index not written\n" << out1;
        return false;
    }

    auto [rc2, out2] = run_capture(wgslc({
        unit_case("blend.wgslu"), "--load-export-index", math_idx, "--emit-export-index", blend_idx,
    }));
    const std::string blend_text = read_text(blend_idx);
    if (rc2 != 0 || !contains(blend_text, "\"blend_colors\"") || contains(blend_text, "\"name\":\"lerp3\"")) {
        std::cerr << "blend index must hold only its own exports\n" << out2 << blend_text;
        return false;
    }

    auto [rc3, out3] = run_capture(wgslc({
        unit_case("main.wgslu"), "--load-export-index", math_idx, "--load-export-index", blend_idx, "-o", header,
    }));
    const std::string body = constant_body(read_text(header), "MAIN_CS");
    if (rc3 != 0 || count_of(body, "fn lerp3(") != 1 || !contains(body, "fn blend_colors(")) {
        std::cerr << "downstream build must stitch upstream exports\n" << out3 << body;
        return false;
    }

    // 상위 index를 빠뜨리면 의존 unit을 찾지 못한다.
    auto [rc4, out4] = run_capture(wgslc({unit_case("main.wgslu"), "--load-export-index", blend_idx}));
    if (rc4 == 0 || !contains(out4, "unit 'blend' requires unknown unit 'math'")) {
        std::cerr << "missing upstream index must be reported\n" << out4;
        return false;
    }

    auto [rc5, out5] = run_capture(wgslc({unit_case("main.wgslu"), "--load-export-index", (dir / "none.json").string()}));
    if (rc5 == 0 || !contains(out5, "ExportIndexMissing")) {
        std::cerr << "missing index file must be reported\n" << out5;
        return false;
    }
    return true;
}

} // namespace

int main() {
    const bool ok1 = test_help_and_version();
    const bool ok2 = test_header_generation();
    const bool ok3 = test_print_directive_fragment();
    const bool ok4 = test_checker_error_blocks_output();
    const bool ok5 = test_json_and_korean_diagnostics();
    const bool ok6 = test_config_namespace_and_errors();
    const bool ok7 = test_unit_graph_errors();
    const bool ok8 = test_import_resolution_errors();
    const bool ok9 = test_export_index_across_runs();

    if (!ok1 || !ok2 || !ok3 || !ok4 || !ok5 || !ok6 || !ok7 || !ok8 || !ok9) {
        return 1;
    }

    std::cout << "wgslc cli tests passed\n";
    return 0;
}
