// frontend/include/specdoc/text/Span.hpp
#pragma once
#include <cstdint>


namespace specdoc {

    struct Span {
        uint32_t file_id = 0;
        uint32_t lo = 0;   // byte offset inclusive
        uint32_t hi = 0;   // byte offset exclusive

        uint32_t size() const { return hi - lo; }
        bool empty() const { return hi <= lo; }
        bool contains(uint32_t off) const { return off >= lo && off < hi; }
    };

    inline bool operator==(const Span& a, const Span& b) {
        return a.file_id == b.file_id && a.lo == b.lo && a.hi == b.hi;
    }

} // namespace specdoc
