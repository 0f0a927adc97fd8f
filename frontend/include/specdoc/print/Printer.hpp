// frontend/include/specdoc/print/Printer.hpp
#pragma once
#include <specdoc/ast/Nodes.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>


namespace specdoc {
    class Document;
}

namespace specdoc::print {

    using PatchList = std::vector<std::pair<uint32_t, char>>;

    inline constexpr uint32_t k_range_end = 0xFFFF'FFFFu;

    /// @brief block printer: id 서브트리의 leaf 를 순서대로 [lo, hi) 로 잘라 이어 붙인다.
    ///        patches 가 가리키는 바이트만 바꿔 쓴다 (checkbox 1바이트 수술).
    void print_block(const ast::NodeArena& ast,
                     std::string_view source,
                     ast::NodeId id,
                     const PatchList& patches,
                     std::string& out,
                     uint32_t lo = 0,
                     uint32_t hi = k_range_end);

    /// @brief inline printer: 표시용 평문.
    ///        emphasis 구분자 제거, wikilink -> alias 또는 target, code span -> 내용,
    ///        escape -> 문자, 개행 -> 공백. 앞뒤 공백은 잘라낸다.
    std::string plain_text(const Document& doc, ast::NodeId id);

    /// @brief 진단/덤프용 한 줄 요약 (`Header(h2) "ADDED Requirements"`)
    std::string node_summary(const Document& doc, ast::NodeId id);

    /// @brief `--ast` 덤프. 들여쓰기 트리 + span.
    std::string dump_tree(const Document& doc);

} // namespace specdoc::print
