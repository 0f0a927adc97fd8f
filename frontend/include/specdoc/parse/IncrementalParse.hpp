// frontend/include/specdoc/parse/IncrementalParse.hpp
#pragma once
#include <cstddef>
#include <cstdint>


namespace specdoc {

    enum class ReparseMode : uint8_t {
        kNone = 0,
        kFullRebuild,          // 이전 문서가 비어 있음
        kIncrementalMerge,     // 구간 재파싱 + 서브트리 재사용
        kFallbackFullRebuild,  // arena 쓰레기가 너무 많아 전체 재파싱
    };

    /// @brief 마지막 incremental_update 가 실제로 한 일
    struct IncrementalStats {
        ReparseMode mode = ReparseMode::kNone;
        uint32_t reparse_lo = 0;      // 새 문서 기준 재파싱 구간
        uint32_t reparse_hi = 0;
        size_t reused_blocks = 0;     // 그대로 재사용한 최상위 block 수
        size_t reparsed_blocks = 0;   // 새로 만든 최상위 block 수
    };

    /// @brief live 노드 대비 arena 크기가 이 배수를 넘으면 전체 재파싱한다.
    inline constexpr size_t k_arena_garbage_factor = 3;

} // namespace specdoc
