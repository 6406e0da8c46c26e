// tools/wgslc/src/cli/Options.cpp
#include <wgslc/cli/Options.hpp>

#include <string>
#include <string_view>
#include <vector>


namespace wgslc::cli {

    namespace {

        /// @brief `--lang` 값을 파싱한다.
        std::optional<wgslink::diag::Language> parse_lang(std::string_view v) {
            if (v == "en") return wgslink::diag::Language::kEn;
            if (v == "ko") return wgslink::diag::Language::kKo;
            return std::nullopt;
        }

        std::optional<DiagFormat> parse_diag_format(std::string_view v) {
            if (v == "text") return DiagFormat::kText;
            if (v == "json") return DiagFormat::kJson;
            return std::nullopt;
        }

        /// @brief `--context N` / `--max-errors N` 의 음이 아닌 정수 값을 파싱한다.
        std::optional<uint32_t> parse_uint(std::string_view v) {
            if (v.empty() || v.size() > 9) return std::nullopt;
            uint32_t n = 0;
            for (const char c : v) {
                if (c < '0' || c > '9') return std::nullopt;
                n = n * 10 + static_cast<uint32_t>(c - '0');
            }
            return n;
        }

        /// @brief 값을 받는 플래그의 다음 인자를 꺼낸다. 없으면 opt.error를 채운다.
        bool take_value(
            const std::vector<std::string_view>& args,
            size_t& i,
            std::string_view what,
            std::string_view& out,
            Options& opt
        ) {
            if (i + 1 >= args.size()) {
                opt.ok = false;
                opt.error = std::string(args[i]) + " requires " + std::string(what);
                return false;
            }
            out = args[++i];
            return true;
        }

        bool fail(Options& opt, std::string msg) {
            opt.ok = false;
            opt.error = std::move(msg);
            return false;
        }

    } // namespace

    void print_usage(std::ostream& os) {
        os
            << "wgslc <unit.wgslu>... [options]\n"
            << "\n"
            << "Outputs:\n"
            << "  -o <file.hpp>                   (write generated C++ header)\n"
            << "  --emit-export-index <file.json> (write exports of the given units)\n"
            << "  --load-export-index <file.json> (register upstream exports, repeatable)\n"
            << "  --print                         (print expanded WGSL to stdout)\n"
            << "\n"
            << "Options:\n"
            << "  --no-check                      (skip WGSL validation)\n"
            << "  --no-directives                 (treat every #name as an import)\n"
            << "  --namespace <ns>                (C++ namespace, default: wgsl)\n"
            << "  --lang en|ko\n"
            << "  --diag-format text|json\n"
            << "  --context N\n"
            << "  --max-errors N\n"
            << "  --config <wgslc.toml>\n"
            << "  --verbose\n"
            << "  --version\n"
            << "  --help\n";
    }

    Options parse_options(int argc, char** argv) {
        Options opt{};

        if (argc <= 1) {
            opt.mode = Mode::kUsage;
            return opt;
        }

        std::vector<std::string_view> args;
        args.reserve(static_cast<size_t>(argc - 1));
        for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);

        for (auto a : args) {
            if (a == "--version") {
                opt.mode = Mode::kVersion;
                return opt;
            }
            if (a == "--help" || a == "-h") {
                opt.mode = Mode::kUsage;
                return opt;
            }
        }

        for (size_t i = 0; i < args.size(); ++i) {
            const auto a = args[i];
            std::string_view v{};

            if (a == "-o") {
                if (!take_value(args, i, "a path", v, opt)) return opt;
                opt.out_header = std::string(v);
            } else if (a == "--emit-export-index") {
                if (!take_value(args, i, "a path", v, opt)) return opt;
                opt.emit_index = std::string(v);
            } else if (a == "--load-export-index") {
                if (!take_value(args, i, "a path", v, opt)) return opt;
                opt.load_indexes.emplace_back(v);
            } else if (a == "--config") {
                if (!take_value(args, i, "a path", v, opt)) return opt;
                opt.config_path = std::string(v);
            } else if (a == "--namespace") {
                if (!take_value(args, i, "a namespace", v, opt)) return opt;
                if (v.empty()) {
                    fail(opt, "--namespace must not be empty");
                    return opt;
                }
                opt.ns = std::string(v);
            } else if (a == "--lang") {
                if (!take_value(args, i, "en|ko", v, opt)) return opt;
                opt.lang = parse_lang(v);
                if (!opt.lang) {
                    fail(opt, "unknown --lang value '" + std::string(v) + "'");
                    return opt;
                }
            } else if (a == "--diag-format") {
                if (!take_value(args, i, "text|json", v, opt)) return opt;
                opt.diag_format = parse_diag_format(v);
                if (!opt.diag_format) {
                    fail(opt, "unknown --diag-format value '" + std::string(v) + "'");
                    return opt;
                }
            } else if (a == "--context") {
                if (!take_value(args, i, "a number", v, opt)) return opt;
                opt.context_lines = parse_uint(v);
                if (!opt.context_lines) {
                    fail(opt, "invalid --context value '" + std::string(v) + "'");
                    return opt;
                }
            } else if (a == "--max-errors") {
                if (!take_value(args, i, "a number", v, opt)) return opt;
                opt.max_errors = parse_uint(v);
                if (!opt.max_errors || *opt.max_errors == 0) {
                    fail(opt, "invalid --max-errors value '" + std::string(v) + "'");
                    return opt;
                }
            } else if (a == "--print") {
                opt.print = true;
            } else if (a == "--verbose") {
                opt.verbose = true;
            } else if (a == "--no-check") {
                opt.check = false;
            } else if (a == "--no-directives") {
                opt.directives = false;
            } else if (!a.empty() && a.front() == '-') {
                fail(opt, "unknown option '" + std::string(a) + "'");
                return opt;
            } else {
                opt.inputs.emplace_back(a);
            }
        }

        if (opt.inputs.empty() && opt.load_indexes.empty()) {
            fail(opt, "no input unit files");
            return opt;
        }

        opt.mode = Mode::kBuild;
        return opt;
    }

} // namespace wgslc::cli
