#pragma once
// Args: checked numeric parsing for command-line flags

#include <cerrno>
#include <cstdlib>

namespace rotator {

// Base-10 unsigned in [0, max]. Rejects signs, junk and overflow.
inline bool parse_unsigned(const char* s, unsigned long long max, unsigned long long& out) {
    if (!s || s[0] == '\0' || s[0] == '-' || s[0] == '+') return false;
    char* end = nullptr;
    errno = 0;
    unsigned long long v = std::strtoull(s, &end, 10);
    if (errno != 0 || end == s || *end != '\0' || v > max) return false;
    out = v;
    return true;
}

} // namespace rotator
