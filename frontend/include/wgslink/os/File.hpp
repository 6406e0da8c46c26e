// frontend/include/wgslink/os/File.hpp
#pragma once
#include <string>


namespace wgslink {

    /// @brief 파일을 열어서 내용을 문자열로 변환 (텍스트 모드)
    /// @details 내부에서 CRLF 정규화(\r\n -> \n, \r -> 제거) 수행
    bool open_file(const std::string& path, std::string& out_content, std::string& out_error);

    /// @brief 텍스트를 파일에 쓴다. 상위 디렉터리가 없으면 만든다.
    bool write_file(const std::string& path, const std::string& content, std::string& out_error);

    /// @brief 입력 경로를 "표시용/캐시용"으로 정규화
    std::string normalize_path(const std::string& path);

    /// @brief 경로의 파일 이름에서 확장자를 뗀 부분 (unit 기본 이름).
    std::string path_stem(const std::string& path);

} // namespace wgslink
