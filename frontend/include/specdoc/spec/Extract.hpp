// frontend/include/specdoc/spec/Extract.hpp
#pragma once
#include <specdoc/spec/Requirement.hpp>
#include <specdoc/doc/Document.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>


namespace specdoc::spec {

    /// @brief 문서의 모든 requirement (section 과 무관하게, 문서 순서).
    ///        실패하지 않는다. 없으면 빈 목록.
    std::vector<Requirement> extract_requirements(const Document& doc);

    /// @brief 최상위 header 를 따라가는 상태 기계.
    ///        h2 "ADDED/MODIFIED/REMOVED/RENAMED Requirements" 가 section 을 바꾸고,
    ///        h3 "Requirement:" 가 requirement 를 열고, h4 "Scenario:" 가 scenario 를 더한다.
    ///        빈 section 이나 잘못된 구조도 오류가 아니다.
    DeltaPlan extract_delta(const Document& doc);

    /// @brief h2 text 로 delta section 판별 ("... ADDED Requirements ..." 포함 여부)
    DeltaSection classify_delta_header(std::string_view header_text);

    DeltaCounts count_delta_changes(const DeltaPlan& plan);

    /// @brief "+1 ~1 -1 →1"
    std::string delta_summary(const DeltaCounts& counts);

    struct SectionRange {
        ast::NodeId header = ast::k_invalid_node;
        uint32_t lo = 0;        // header 줄 시작
        uint32_t body_lo = 0;   // header 줄 다음
        uint32_t hi = 0;        // 다음 h1/h2 시작 또는 문서 끝
    };

    /// @brief text 가 title 과 같은 (trim 후) 최상위 h2
    std::optional<SectionRange> find_section(const Document& doc, std::string_view title);

} // namespace specdoc::spec
