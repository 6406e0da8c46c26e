// tools/wgslc/src/main.cpp
#include <wgslc/cli/Options.hpp>
#include <wgslc/driver/Driver.hpp>
#include <wgslink/Version.hpp>

#include <iostream>


int main(int argc, char** argv) {
    if (argc <= 1) {
        std::cout << wgslink::k_version_string << "\n";
        wgslc::cli::print_usage(std::cout);
        return 0;
    }

    const auto opt = wgslc::cli::parse_options(argc, argv);

    if (!opt.ok) {
        std::cerr << "error: " << opt.error << "\n";
        wgslc::cli::print_usage(std::cerr);
        return 1;
    }

    if (opt.mode == wgslc::cli::Mode::kVersion) {
        std::cout << wgslink::k_version_string << "\n";
        return 0;
    }

    if (opt.mode == wgslc::cli::Mode::kUsage) {
        wgslc::cli::print_usage(std::cout);
        return 0;
    }

    return wgslc::driver::run(opt);
}
