// frontend/include/wgslink/text/SourceManager.hpp
#pragma once
#include <wgslink/text/Span.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>


namespace wgslink {

    /// @brief 1-based 위치. col은 줄 시작부터의 바이트 수 + 1 (Tint, export index와 같은 단위).
    struct LineCol {
        uint32_t line = 1;
        uint32_t col = 1;
    };

    /// @brief 진단 출력용 발췌. 캐럿 위치/길이는 코드 포인트 단위로 센다.
    struct Excerpt {
        uint32_t first_line = 1;
        std::vector<std::string_view> lines{};
        uint32_t caret_line = 0;    // lines[] 안의 인덱스
        uint32_t caret_before = 0;
        uint32_t caret_len = 1;
    };

    /// @brief unit 파일과 export index가 가리키는 정의 파일을 보관한다.
    /// @details file id는 등록 순서다. Fragment/Origin의 Span은 이 id와 바이트 오프셋으로 위치를 가리킨다.
    class SourceManager {
    public:
        uint32_t add(std::string name, std::string content);

        /// @brief 이 이름으로 처음 등록된 파일의 id.
        std::optional<uint32_t> find(std::string_view name) const;

        std::string_view name(uint32_t file_id) const;
        std::string_view content(uint32_t file_id) const;
        uint32_t file_count() const { return static_cast<uint32_t>(files_.size()); }

        LineCol line_col(uint32_t file_id, uint32_t byte_off) const;

        /// @brief span 시작 줄과 위/아래 context 줄. 여러 줄 span이면 캐럿은 첫 줄 끝에서 멈춘다.
        Excerpt excerpt(const Span& sp, uint32_t context) const;

    private:
        struct File {
            std::string name;
            std::string content;
            std::vector<uint32_t> line_starts;
        };

        const File* file_(uint32_t file_id) const;
        std::string_view line_(const File& f, uint32_t index) const;

        std::vector<File> files_;
        std::unordered_map<std::string, uint32_t> by_name_;
    };

} // namespace wgslink
