#include "hex.hpp"
#include <utility>

namespace fastuuid::uuid {

namespace {

constexpr char hex_digits[] = "0123456789abcdef";
constexpr std::size_t hex128_length = 36;
constexpr std::size_t separators[] = {8, 13, 18, 23};


char *encode(char *dst, const std::uint8_t *src, std::size_t len)
{
    for (std::size_t i = 0; i < len; ++i) {
        *dst++ = hex_digits[src[i] >> 4];
        *dst++ = hex_digits[src[i] & 0x0f];
    }
    return dst;
}


bool is_separator(std::size_t pos)
{
    for (auto sep: separators)
        if (pos == sep)
            return true;
    return false;
}

} // namespace


std::string hex128(const uuid &id)
{
    return hex128(truncate128(id));
}


std::string hex128(const uuid128 &id)
{
    uuid128 b = id;
    std::swap(b[6], b[9]);
    b[6] = static_cast<std::uint8_t>((b[6] & 0x0f) | 0x40);
    b[8] = static_cast<std::uint8_t>((b[8] & 0x0f) | 0x80);

    std::string out(hex128_length, '-');
    char *p = out.data();
    p = encode(p, &b[0], 4);
    p = encode(p + 1, &b[4], 2);
    p = encode(p + 1, &b[6], 2);
    p = encode(p + 1, &b[8], 2);
    encode(p + 1, &b[10], 6);
    return out;
}


std::string hex192(const uuid &id)
{
    std::string out(id.size() * 2, '0');
    encode(out.data(), id.data(), id.size());
    return out;
}


bool valid_hex128(std::string_view s) noexcept
{
    if (s.size() != hex128_length)
        return false;

    for (std::size_t i = 0; i < s.size(); ++i) {
        const char c = s[i];
        if (is_separator(i)) {
            if (c != '-')
                return false;
        } else if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) {
            return false;
        }
    }
    return true;
}

} // namespace fastuuid::uuid
