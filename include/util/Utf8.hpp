#pragma once
#include <string>

// Removes the last UTF-8 code point, not just the last byte.
inline void popUtf8(std::string& s) {
    if (s.empty()) return;
    size_t i = s.size() - 1;
    while (i > 0 && (static_cast<unsigned char>(s[i]) & 0xC0) == 0x80) i--;
    s.erase(i);
}
