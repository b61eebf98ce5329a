#include "color/hex_color.hpp"

#include <stdexcept>

namespace gifdraw {

namespace {
const char kHexDigits[] = "0123456789ABCDEF";

inline void put_byte(std::string& s, size_t pos, uint8_t v) {
    s[pos] = kHexDigits[(v >> 4) & 0x0F];
    s[pos + 1] = kHexDigits[v & 0x0F];
}
} // namespace

std::string to_hex(uint8_t r, uint8_t g, uint8_t b) {
    std::string s(7, '#');
    put_byte(s, 1, r);
    put_byte(s, 3, g);
    put_byte(s, 5, b);
    return s;
}

std::string to_hex(const Rgba& px) {
    return to_hex(px.r, px.g, px.b);
}

#ifndef NDEBUG
namespace {
struct HexSelfTest {
    HexSelfTest() {
        if (to_hex(255, 0, 0) != "#FF0000") throw std::runtime_error("hex self-test: red");
        if (to_hex(0x0a, 0xbc, 0x01) != "#0ABC01") throw std::runtime_error("hex self-test: padding/case");
        if (to_hex(Rgba{1, 2, 3, 0}) != to_hex(Rgba{1, 2, 3, 255})) {
            throw std::runtime_error("hex self-test: alpha must not affect color");
        }
    }
};
static HexSelfTest _hex_self_test{};
} // namespace
#endif

} // namespace gifdraw
