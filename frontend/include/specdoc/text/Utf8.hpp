// frontend/include/specdoc/text/Utf8.hpp
#pragma once

#include <cstdint>
#include <string_view>


namespace specdoc::text {

    // Strict UTF-8 validator.
    // overlong / surrogate / > U+10FFFF 를 모두 거부한다.
    // 실패 시 false, bad_off 에 문제 바이트 시작 오프셋을 기록한다.
    bool validate_utf8_strict(std::string_view s, uint32_t& bad_off);

    /// @brief s[i..] 에서 코드포인트 하나를 디코드하고 i를 전진시킨다. 깨진 바이트는 U+FFFD.
    bool decode_one(std::string_view s, uint32_t& i, uint32_t& cp);

    /// @brief 코드포인트 표시 폭 (0/1/2). 한글/CJK/전각은 2.
    uint32_t display_width(uint32_t cp);

    /// @brief [byte_lo, byte_hi) 구간의 표시 폭 합.
    uint32_t display_width_between(std::string_view s, uint32_t byte_lo, uint32_t byte_hi);

} // namespace specdoc::text
