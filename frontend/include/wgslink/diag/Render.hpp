// frontend/include/wgslink/diag/Render.hpp
#pragma once
#include <wgslink/diag/Diagnostic.hpp>
#include <wgslink/text/SourceManager.hpp>

#include <string>
#include <string_view>


namespace wgslink::diag {

    std::string_view code_name(Code c);

    /// @brief 템플릿에 인자를 채운 메시지 본문만 만든다.
    std::string render_message(const Diagnostic& d, Language lang);

    /// @brief 진단을 렌더링하되, 에러 라인 주변 컨텍스트를 함께 출력
    std::string render_one_context(const Diagnostic& d, Language lang, const SourceManager& sm, uint32_t context_lines);

    /// @brief 한 줄짜리 JSON 객체로 렌더링한다 (--diag-format json).
    std::string render_one_json(const Diagnostic& d, Language lang, const SourceManager& sm);

} // namespace wgslink::diag
