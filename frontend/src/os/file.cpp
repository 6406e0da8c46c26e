// frontend/src/os/file.cpp
#include <wgslink/os/File.hpp>

#include <cstdio>
#include <filesystem>
#include <fstream>

// POSIX (Linux, macOS)
#include <cerrno>   // errno
#include <cstring>  // std::strerror
#include <cstdlib>  // realpath
#include <limits.h> // PATH_MAX (may be missing on some platforms)

#ifndef PATH_MAX
    #define PATH_MAX 4096
#endif


namespace wgslink {

    static void normalize_newlines_inplace(std::string& s) {
        // CRLF -> LF, 단독 CR 제거
        std::string out;
        out.reserve(s.size());

        for (size_t i = 0; i < s.size(); ++i) {
            char c = s[i];
            if (c == '\r') continue;
            out.push_back(c);
        }

        s.swap(out);
    }

    bool open_file(const std::string& path, std::string& out_content, std::string& out_error) {
        out_error.clear();
        out_content.clear();

        std::FILE* fp = std::fopen(path.c_str(), "rb");
        if (!fp) {
            out_error = std::string("CANNOT open file: ") + std::strerror(errno);
            return false;
        }

        std::fseek(fp, 0, SEEK_END);
        long sz = std::ftell(fp);
        std::fseek(fp, 0, SEEK_SET);

        if (sz < 0) {
            std::fclose(fp);
            out_error = "파일 크기를 읽을 수 없습니다.";
            return false;
        }

        out_content.resize(static_cast<size_t>(sz));
        size_t n = std::fread(out_content.data(), 1, out_content.size(), fp);
        std::fclose(fp);

        if (n != out_content.size()) {
            out_content.clear();
            out_error = "파일 읽기 중 일부만 읽혔습니다.";
            return false;
        }

        normalize_newlines_inplace(out_content);
        return true;
    }

    bool write_file(const std::string& path, const std::string& content, std::string& out_error) {
        namespace fs = std::filesystem;
        out_error.clear();

        std::error_code ec{};
        const fs::path p(path);
        const auto dir = p.parent_path();
        if (!dir.empty()) {
            fs::create_directories(dir, ec);
            if (ec) {
                out_error = "failed to create directory: " + dir.string();
                return false;
            }
        }

        std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            out_error = "failed to open output: " + path;
            return false;
        }
        ofs << content;
        if (!ofs.good()) {
            out_error = "failed to write output: " + path;
            return false;
        }
        return true;
    }

    std::string normalize_path(const std::string& path) {
        // realpath는 "실제 존재하는 경로"가 아니면 실패할 수 있음.
        char buf[PATH_MAX];
        if (::realpath(path.c_str(), buf) != nullptr) {
            return std::string(buf);
        }
        return std::filesystem::path(path).lexically_normal().string();
    }

    std::string path_stem(const std::string& path) {
        return std::filesystem::path(path).stem().string();
    }

} // namespace wgslink
