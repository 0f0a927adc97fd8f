// frontend/include/specdoc/diag/Render.hpp
#pragma once
#include <specdoc/diag/Diagnostic.hpp>
#include <specdoc/text/SourceManager.hpp>

#include <string>


namespace specdoc::diag {

    std::string code_name(Code c);

    /// @brief 템플릿 + 인자로 메시지 본문만 만든다 (위치 정보 없음).
    std::string render_message(const Diagnostic& d, Language lang);

    std::string render_one(const Diagnostic& d, Language lang, const SourceManager& sm);

    /// @brief 진단을 렌더링하되, 에러 라인 주변 컨텍스트를 함께 출력
    std::string render_one_context(const Diagnostic& d, Language lang, const SourceManager& sm, uint32_t context_lines);

    /// @brief 한 줄 JSON 객체로 렌더링한다 (`diag.format = json`).
    std::string render_one_json(const Diagnostic& d, Language lang, const SourceManager& sm);

} // namespace specdoc::diag
