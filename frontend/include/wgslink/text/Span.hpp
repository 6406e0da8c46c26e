// frontend/include/wgslink/text/Span.hpp
#pragma once
#include <cstdint>


namespace wgslink {

    struct Span {
        uint32_t file_id = 0;
        uint32_t lo = 0;   // byte offset inclusive
        uint32_t hi = 0;   // byte offset exclusive
    };

    inline bool operator==(const Span& a, const Span& b) {
        return a.file_id == b.file_id && a.lo == b.lo && a.hi == b.hi;
    }

    inline bool operator!=(const Span& a, const Span& b) {
        return !(a == b);
    }

    inline bool operator<(const Span& a, const Span& b) {
        if (a.file_id != b.file_id) return a.file_id < b.file_id;
        if (a.lo != b.lo) return a.lo < b.lo;
        return a.hi < b.hi;
    }

} // namespace wgslink
