// tests/harness/run_wgslc_option_tests.cpp
#include <wgslc/cli/Options.hpp>
#include <wgslc/config/Config.hpp>
#include <wgslc/config/TomlLite.hpp>
#include <wgslc/unit/UnitFile.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#ifndef WGSLC_TEST_TMP_DIR
#define WGSLC_TEST_TMP_DIR "/tmp/wgslc-option-tests"
#endif

namespace {

    namespace cli = wgslc::cli;
    namespace config = wgslc::config;
    namespace diag = wgslink::diag;

    static bool require_(bool cond, const char* msg) {
        if (cond) return true;
        std::cerr << "  - " << msg << "\n";
        return false;
    }

    static cli::Options parse_(const std::vector<std::string_view>& args) {
        std::vector<std::string> storage{};
        storage.reserve(args.size() + 1);
        storage.emplace_back("wgslc");
        for (const auto a : args) {
            storage.emplace_back(a);
        }

        std::vector<char*> argv{};
        argv.reserve(storage.size());
        for (auto& s : storage) {
            argv.push_back(s.data());
        }

        return cli::parse_options(static_cast<int>(argv.size()), argv.data());
    }

    static bool write_text_(const std::filesystem::path& path, std::string_view text) {
        std::error_code ec{};
        std::filesystem::create_directories(path.parent_path(), ec);
        std::ofstream ofs(path, std::ios::binary);
        if (!ofs) return false;
        ofs << text;
        return ofs.good();
    }

    // ---------------------------------------------------------------
    // cli
    // ---------------------------------------------------------------

    static bool test_build_options_parse_() {
        const auto opt = parse_({
            "a.wgslu",
            "-o", "out/shaders.hpp",
            "--load-export-index", "base.json",
            "b.wgslu",
            "--load-export-index", "util.json",
            "--emit-export-index", "mine.json",
            "--namespace", "gfx::wgsl",
            "--lang", "ko",
            "--diag-format", "json",
            "--context", "0",
            "--max-errors", "5",
            "--no-check",
            "--no-directives",
            "--print",
            "--verbose",
        });

        bool ok = true;
        ok &= require_(opt.ok, "option parse must succeed");
        ok &= require_(opt.mode == cli::Mode::kBuild, "mode must be build");
        ok &= require_(opt.inputs.size() == 2 && opt.inputs[0] == "a.wgslu" && opt.inputs[1] == "b.wgslu",
                       "inputs must keep command-line order");
        ok &= require_(opt.out_header == "out/shaders.hpp", "-o path");
        ok &= require_(opt.emit_index == "mine.json", "--emit-export-index path");
        ok &= require_(opt.load_indexes.size() == 2 && opt.load_indexes[1] == "util.json", "--load-export-index repeats");
        ok &= require_(opt.ns == std::optional<std::string>("gfx::wgsl"), "--namespace");
        ok &= require_(opt.lang == diag::Language::kKo, "--lang ko");
        ok &= require_(opt.diag_format == cli::DiagFormat::kJson, "--diag-format json");
        ok &= require_(opt.context_lines == 0u, "--context 0 is allowed");
        ok &= require_(opt.max_errors == 5u, "--max-errors");
        ok &= require_(opt.check == false && opt.directives == false, "--no-check / --no-directives");
        ok &= require_(opt.print && opt.verbose, "--print / --verbose");
        return ok;
    }

    static bool test_unset_overrides_stay_empty_() {
        const auto opt = parse_({"a.wgslu"});

        bool ok = true;
        ok &= require_(opt.ok && opt.mode == cli::Mode::kBuild, "single input builds");
        ok &= require_(!opt.lang && !opt.diag_format && !opt.context_lines && !opt.max_errors, "no diag overrides");
        ok &= require_(!opt.check && !opt.directives && !opt.ns, "no behavior overrides");
        ok &= require_(opt.out_header.empty() && opt.emit_index.empty(), "no outputs");
        return ok;
    }

    static bool test_index_only_run_is_allowed_() {
        const auto opt = parse_({"--load-export-index", "base.json", "--print"});
        return require_(opt.ok && opt.mode == cli::Mode::kBuild, "an index alone is a valid input");
    }

    static bool test_help_and_version_win_() {
        bool ok = true;
        ok &= require_(parse_({}).mode == cli::Mode::kUsage, "no args prints usage");
        ok &= require_(parse_({"a.wgslu", "--bogus", "--version"}).mode == cli::Mode::kVersion, "--version wins");
        ok &= require_(parse_({"--lang", "xx", "-h"}).mode == cli::Mode::kUsage, "-h wins");
        return ok;
    }

    static bool test_option_errors_() {
        struct Bad {
            std::vector<std::string_view> args;
            std::string_view expect;
        };
        const Bad cases[] = {
            {{"--print"}, "no input unit files"},
            {{"a.wgslu", "-o"}, "-o requires a path"},
            {{"a.wgslu", "--lang", "fr"}, "unknown --lang value 'fr'"},
            {{"a.wgslu", "--diag-format", "xml"}, "unknown --diag-format value 'xml'"},
            {{"a.wgslu", "--context", "-1"}, "invalid --context value '-1'"},
            {{"a.wgslu", "--max-errors", "0"}, "invalid --max-errors value '0'"},
            {{"a.wgslu", "--namespace", ""}, "--namespace must not be empty"},
            {{"a.wgslu", "--frobnicate"}, "unknown option '--frobnicate'"},
        };

        bool ok = true;
        for (const auto& c : cases) {
            const auto opt = parse_(c.args);
            if (opt.ok || opt.error.find(c.expect) == std::string::npos) {
                std::cerr << "    expected '" << c.expect << "', got '" << opt.error << "'\n";
                ok = false;
            }
        }
        return ok;
    }

    // ---------------------------------------------------------------
    // config
    // ---------------------------------------------------------------

    static bool test_toml_sections_and_values_() {
        constexpr std::string_view text =
            "# wgslc settings\n"
            "[diag]\n"
            "lang = \"ko\"   # inline comment\n"
            "context = 4\n"
            "\n"
            "[check]\n"
            "enabled = false\n"
            "[output]\n"
            "namespace = \"gfx::shaders\"\n";

        config::FlatMap values{};
        std::vector<std::string> warnings{};
        std::string err{};

        bool ok = true;
        ok &= require_(config::toml_lite::parse_text(text, "wgslc.toml", values, warnings, err), "toml must parse");
        ok &= require_(warnings.empty(), "no warnings expected");

        config::LoadedConfig cfg{};
        cfg.values = values;
        config::Settings s{};
        std::vector<std::string> errors{};
        ok &= require_(config::materialize(cfg, s, errors), "settings must materialize");
        ok &= require_(s.diag_lang == "ko" && s.diag_context == 4, "diag section");
        ok &= require_(!s.check_enabled, "check.enabled");
        ok &= require_(s.preprocess_directives, "unset key keeps default");
        ok &= require_(s.output_namespace == "gfx::shaders", "output.namespace");
        ok &= require_(s.diag_max_errors == 64 && s.diag_format == "text", "defaults");
        return ok;
    }

    static bool test_toml_syntax_errors_() {
        const std::string_view bad[] = {
            "[diag\nlang = \"en\"\n",
            "lang \"en\"\n",
            "lang = \"unterminated\n",
            "lang = en\n",
        };

        bool ok = true;
        for (const auto text : bad) {
            config::FlatMap values{};
            std::vector<std::string> warnings{};
            std::string err{};
            if (config::toml_lite::parse_text(text, "bad.toml", values, warnings, err)) {
                std::cerr << "    accepted: " << text;
                ok = false;
            }
            ok &= require_(err.rfind("bad.toml:", 0) == 0, "errors carry the source name and line");
        }
        return ok;
    }

    static bool test_config_type_and_value_errors_() {
        config::LoadedConfig cfg{};
        cfg.values["diag.lang"] = std::string("fr");
        cfg.values["diag.context"] = std::string("two");
        cfg.values["check.enabled"] = int64_t{1};
        cfg.values["output.namespace"] = std::string("9bad::ns");

        config::Settings s{};
        s.output_namespace = "untouched";
        std::vector<std::string> errors{};

        bool ok = true;
        ok &= require_(!config::materialize(cfg, s, errors), "bad config must be rejected");
        ok &= require_(errors.size() == 4, "one error per bad key");
        ok &= require_(s.output_namespace == "untouched", "failed materialize must not touch the output");
        return ok;
    }

    static bool test_namespace_validation_() {
        bool ok = true;
        ok &= require_(config::is_valid_namespace("wgsl"), "simple");
        ok &= require_(config::is_valid_namespace("gfx::wgsl_v2"), "nested");
        ok &= require_(!config::is_valid_namespace(""), "empty");
        ok &= require_(!config::is_valid_namespace("gfx::"), "trailing separator");
        ok &= require_(!config::is_valid_namespace("::gfx"), "leading separator");
        ok &= require_(!config::is_valid_namespace("gfx:wgsl"), "single colon");
        ok &= require_(!config::is_valid_namespace("2d"), "leading digit");
        return ok;
    }

    static bool test_config_discovery_and_unknown_keys_() {
        const std::filesystem::path root = std::filesystem::path(WGSLC_TEST_TMP_DIR) / "discovery";
        std::error_code ec{};
        std::filesystem::remove_all(root, ec);

        bool ok = true;
        ok &= require_(write_text_(root / "wgslc.toml", "[diag]\nformat = \"json\"\ncolour = true\n"), "write config");
        std::filesystem::create_directories(root / "a" / "b", ec);

        const auto found = config::find_config_file(root / "a" / "b");
        ok &= require_(found.has_value(), "config must be found in a parent directory");
        if (!found.has_value()) return false;
        ok &= require_(std::filesystem::equivalent(*found, root / "wgslc.toml", ec), "nearest config wins");

        config::LoadedConfig cfg{};
        std::string err{};
        ok &= require_(config::load(*found, cfg, err), "explicit load must succeed");
        ok &= require_(cfg.values.size() == 1 && cfg.values.contains("diag.format"), "unknown key is dropped");
        ok &= require_(cfg.warnings.size() == 1 && cfg.warnings[0].find("diag.colour") != std::string::npos,
                       "unknown key is reported");

        config::LoadedConfig missing{};
        ok &= require_(!config::load(root / "nope.toml", missing, err), "explicit missing file must fail");
        ok &= require_(err.find("config file not found") != std::string::npos, "missing file message");
        return ok;
    }

    // ---------------------------------------------------------------
    // unit files
    // ---------------------------------------------------------------

    static bool parse_unit_(std::string_view name, std::string_view text, wgslc::unit::UnitFile& out, diag::Bag& bag) {
        wgslink::SourceManager sm;
        const auto fid = sm.add(std::string(name), std::string(text));
        return wgslc::unit::parse_unit_file(sm, fid, out, bag);
    }

    static bool test_unit_file_headers_and_fragments_() {
        constexpr std::string_view text =
            "unit shaders;\n"
            "requires math, util;\n"
            "\n"
            "@export(lerp3)\n"
            "fragment LERP {\n"
            "    fn lerp3(a: vec3<f32>) -> vec3<f32> { return a; }\n"
            "}\n"
            "\n"
            "fragment MAIN { #lerp3 }\n";

        wgslc::unit::UnitFile u{};
        diag::Bag bag;

        bool ok = true;
        ok &= require_(parse_unit_("src/shaders.wgslu", text, u, bag), "unit must parse");
        ok &= require_(bag.diags().empty(), "no diagnostics");
        ok &= require_(u.name == "shaders" && u.name_span.lo == text.find("shaders"), "unit name and span");
        ok &= require_(u.requires_units.size() == 2 && u.requires_units[1].name == "util", "requires list");
        ok &= require_(u.fragments.size() == 2, "two fragments");
        if (u.fragments.size() != 2) return false;

        const auto& lerp = u.fragments[0];
        ok &= require_(lerp.constant == "LERP" && lerp.export_name == std::optional<std::string>("lerp3"), "export fragment");
        ok &= require_(lerp.fragment.name == lerp.export_name, "fragment carries the export name");
        ok &= require_(lerp.fragment.span.lo == text.find("{\n    fn") + 1, "body span starts after '{'");
        ok &= require_(!lerp.fragment.tokens.empty() && lerp.fragment.tokens.front().text == "fn", "body starts at fn");
        ok &= require_(!lerp.fragment.tokens.empty() && lerp.fragment.tokens.back().text == "}", "nested braces stay in the body");
        ok &= require_(!lerp.fragment.tokens.empty()
                       && lerp.fragment.tokens.front().origin.surfaced().lo == text.find("fn lerp3"),
                       "body tokens keep unit file offsets");

        const auto& main = u.fragments[1];
        ok &= require_(!main.export_name.has_value() && !main.fragment.name.has_value(), "plain fragment");
        ok &= require_(main.fragment.tokens.size() == 2, "'#' and 'lerp3'");
        return ok;
    }

    static bool test_unit_name_defaults_to_file_stem_() {
        wgslc::unit::UnitFile u{};
        diag::Bag bag;

        bool ok = true;
        ok &= require_(parse_unit_("dir/post_fx.wgslu", "fragment A { }\n", u, bag), "unit must parse");
        ok &= require_(u.name == "post_fx", "name from file stem");
        ok &= require_(u.fragments.size() == 1 && u.fragments[0].fragment.tokens.empty(), "empty body is allowed");
        return ok;
    }

    static bool test_unit_file_errors_() {
        struct Bad {
            std::string_view text;
            diag::Code code;
            std::string_view arg0;
            std::string_view at;
        };
        const Bad cases[] = {
            {"fragment 3 { }", diag::Code::kHostExpectedToken, "fragment constant name", "3"},
            {"unit a;\nunit b;\n", diag::Code::kHostExpectedToken, "'fragment' declaration", "unit b"},
            {"@exprot(x) fragment A { }", diag::Code::kHostExpectedToken, "'export'", "exprot"},
            {"requires a b;", diag::Code::kHostExpectedToken, "';'", "b;"},
            {"fragment A { fn f() {", diag::Code::kHostUnexpectedEof, "'}' to close fragment 'A'", ""},
            {"fn f() {}", diag::Code::kHostExpectedToken, "'fragment'", "fn"},
        };

        bool ok = true;
        for (const auto& c : cases) {
            wgslc::unit::UnitFile u{};
            diag::Bag bag;
            const bool parsed = parse_unit_("bad.wgslu", c.text, u, bag);

            const auto* d = bag.first_of(c.code);
            bool good = !parsed && d != nullptr && bag.diags().size() == 1
                && !d->args().empty() && d->args()[0] == c.arg0;
            if (good && !c.at.empty()) good = (d->span().lo == c.text.find(c.at));
            if (!good) {
                std::cerr << "    case failed: " << c.text << "\n";
                ok = false;
            }
        }
        return ok;
    }

    static bool test_unit_file_lexer_error_stops_parse_() {
        wgslc::unit::UnitFile u{};
        diag::Bag bag;

        bool ok = true;
        ok &= require_(!parse_unit_("c.wgslu", "fragment A { } /* never closed", u, bag), "lexer error must fail");
        ok &= require_(bag.has_code(diag::Code::kUnterminatedComment), "lexer diagnostic is kept");
        ok &= require_(u.fragments.empty(), "nothing is parsed after a lexer error");
        return ok;
    }

} // namespace

int main() {
    struct Case {
        const char* name;
        bool (*fn)();
    };

    const Case cases[] = {
        {"build_options_parse", test_build_options_parse_},
        {"unset_overrides_stay_empty", test_unset_overrides_stay_empty_},
        {"index_only_run_is_allowed", test_index_only_run_is_allowed_},
        {"help_and_version_win", test_help_and_version_win_},
        {"option_errors", test_option_errors_},
        {"toml_sections_and_values", test_toml_sections_and_values_},
        {"toml_syntax_errors", test_toml_syntax_errors_},
        {"config_type_and_value_errors", test_config_type_and_value_errors_},
        {"namespace_validation", test_namespace_validation_},
        {"config_discovery_and_unknown_keys", test_config_discovery_and_unknown_keys_},
        {"unit_file_headers_and_fragments", test_unit_file_headers_and_fragments_},
        {"unit_name_defaults_to_file_stem", test_unit_name_defaults_to_file_stem_},
        {"unit_file_errors", test_unit_file_errors_},
        {"unit_file_lexer_error_stops_parse", test_unit_file_lexer_error_stops_parse_},
    };

    int failed = 0;
    for (const auto& c : cases) {
        std::cout << "[TEST] " << c.name << "\n";
        if (!c.fn()) {
            ++failed;
            std::cout << "  -> FAIL\n";
        } else {
            std::cout << "  -> PASS\n";
        }
    }

    if (failed != 0) {
        std::cout << "\nFAILED " << failed << " test(s)\n";
        return 1;
    }
    std::cout << "\nALL TESTS PASSED\n";
    return 0;
}
