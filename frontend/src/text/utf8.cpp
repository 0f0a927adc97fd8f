// frontend/src/text/utf8.cpp
#include <specdoc/text/Utf8.hpp>


namespace specdoc::text {

    bool validate_utf8_strict(std::string_view s, uint32_t& bad_off) {
        auto is_cont = [](unsigned char b) -> bool {
            return (b & 0xC0) == 0x80;
        };

        size_t i = 0;
        while (i < s.size()) {
            const unsigned char b0 = static_cast<unsigned char>(s[i]);

            if (b0 < 0x80) {
                i += 1;
                continue;
            }

            // 2-byte: C2..DF (C0/C1 은 overlong)
            if (b0 >= 0xC2 && b0 <= 0xDF) {
                if (i + 1 >= s.size() || !is_cont(static_cast<unsigned char>(s[i + 1]))) {
                    bad_off = static_cast<uint32_t>(i);
                    return false;
                }
                i += 2;
                continue;
            }

            // 3-byte: E0..EF
            if (b0 >= 0xE0 && b0 <= 0xEF) {
                if (i + 2 >= s.size()) { bad_off = static_cast<uint32_t>(i); return false; }
                const unsigned char b1 = static_cast<unsigned char>(s[i + 1]);
                const unsigned char b2 = static_cast<unsigned char>(s[i + 2]);
                if (!is_cont(b1) || !is_cont(b2)) { bad_off = static_cast<uint32_t>(i); return false; }
                if (b0 == 0xE0 && b1 < 0xA0) { bad_off = static_cast<uint32_t>(i); return false; }  // overlong
                if (b0 == 0xED && b1 >= 0xA0) { bad_off = static_cast<uint32_t>(i); return false; } // surrogate
                i += 3;
                continue;
            }

            // 4-byte: F0..F4
            if (b0 >= 0xF0 && b0 <= 0xF4) {
                if (i + 3 >= s.size()) { bad_off = static_cast<uint32_t>(i); return false; }
                const unsigned char b1 = static_cast<unsigned char>(s[i + 1]);
                const unsigned char b2 = static_cast<unsigned char>(s[i + 2]);
                const unsigned char b3 = static_cast<unsigned char>(s[i + 3]);
                if (!is_cont(b1) || !is_cont(b2) || !is_cont(b3)) { bad_off = static_cast<uint32_t>(i); return false; }
                if (b0 == 0xF0 && b1 < 0x90) { bad_off = static_cast<uint32_t>(i); return false; }  // overlong
                if (b0 == 0xF4 && b1 > 0x8F) { bad_off = static_cast<uint32_t>(i); return false; }  // > U+10FFFF
                i += 4;
                continue;
            }

            // stray continuation byte, C0/C1, F5..FF
            bad_off = static_cast<uint32_t>(i);
            return false;
        }
        return true;
    }

    bool decode_one(std::string_view s, uint32_t& i, uint32_t& cp) {
        if (i >= s.size()) return false;
        const unsigned char c0 = static_cast<unsigned char>(s[i]);

        if (c0 < 0x80) {
            cp = c0;
            i += 1;
            return true;
        }

        auto cont = [&](uint32_t idx) -> bool {
            if (idx >= s.size()) return false;
            return (static_cast<unsigned char>(s[idx]) & 0xC0) == 0x80;
        };

        if ((c0 & 0xE0) == 0xC0) {
            if (!cont(i + 1)) { cp = 0xFFFD; i += 1; return false; }
            cp = ((c0 & 0x1Fu) << 6) | (static_cast<unsigned char>(s[i + 1]) & 0x3Fu);
            i += 2;
            return true;
        }

        if ((c0 & 0xF0) == 0xE0) {
            if (!cont(i + 1) || !cont(i + 2)) { cp = 0xFFFD; i += 1; return false; }
            cp = ((c0 & 0x0Fu) << 12)
               | ((static_cast<unsigned char>(s[i + 1]) & 0x3Fu) << 6)
               | (static_cast<unsigned char>(s[i + 2]) & 0x3Fu);
            i += 3;
            return true;
        }

        if ((c0 & 0xF8) == 0xF0) {
            if (!cont(i + 1) || !cont(i + 2) || !cont(i + 3)) { cp = 0xFFFD; i += 1; return false; }
            cp = ((c0 & 0x07u) << 18)
               | ((static_cast<unsigned char>(s[i + 1]) & 0x3Fu) << 12)
               | ((static_cast<unsigned char>(s[i + 2]) & 0x3Fu) << 6)
               | (static_cast<unsigned char>(s[i + 3]) & 0x3Fu);
            i += 4;
            return true;
        }

        cp = 0xFFFD;
        i += 1;
        return false;
    }

    // ---- approximate unicode display width (0/1/2) ----
    uint32_t display_width(uint32_t cp) {
        if (cp == 0) return 0;
        if (cp < 32 || (cp >= 0x7F && cp < 0xA0)) return 0;

        // combining marks (rough)
        if ((cp >= 0x0300 && cp <= 0x036F) || (cp >= 0x1AB0 && cp <= 0x1AFF) ||
            (cp >= 0x1DC0 && cp <= 0x1DFF) || (cp >= 0x20D0 && cp <= 0x20FF) ||
            (cp >= 0xFE20 && cp <= 0xFE2F)) {
            return 0;
        }

        // Wide (CJK / 한글 / Fullwidth)
        if ((cp >= 0x1100 && cp <= 0x115F) ||
            (cp >= 0x2329 && cp <= 0x232A) ||
            (cp >= 0x2E80 && cp <= 0xA4CF) ||
            (cp >= 0xAC00 && cp <= 0xD7A3) ||
            (cp >= 0xF900 && cp <= 0xFAFF) ||
            (cp >= 0xFE10 && cp <= 0xFE19) ||
            (cp >= 0xFE30 && cp <= 0xFE6F) ||
            (cp >= 0xFF00 && cp <= 0xFF60) ||
            (cp >= 0xFFE0 && cp <= 0xFFE6) ||
            (cp >= 0x1F300 && cp <= 0x1FAFF)) {
            return 2;
        }

        return 1;
    }

    uint32_t display_width_between(std::string_view s, uint32_t byte_lo, uint32_t byte_hi) {
        uint32_t i = byte_lo;
        uint32_t w = 0;
        while (i < byte_hi && i < s.size()) {
            uint32_t cp = 0;
            const uint32_t before = i;
            decode_one(s, i, cp);
            if (i == before) i += 1;
            // tab 은 1칸으로 센다 (caret 정렬은 원문 tab 을 그대로 출력)
            w += (cp == '\t') ? 1 : display_width(cp);
        }
        return w;
    }

} // namespace specdoc::text
