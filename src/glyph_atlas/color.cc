//
// Created by igor on 02/01/2026.
//

#include <glyph_atlas/color.hh>
#include <failsafe/exception.hh>

namespace glyph_atlas {

namespace {

constexpr char HEX_DIGITS[] = "0123456789abcdef";

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::uint8_t parse_byte(std::string_view text, std::string_view digits) {
    int hi = hex_value(digits[0]);
    int lo = hex_value(digits[1]);
    THROW_IF(hi < 0 || lo < 0, std::invalid_argument, "Invalid hex color:", std::string(text));
    return static_cast<std::uint8_t>((hi << 4) | lo);
}

void append_byte(std::string& out, std::uint8_t value) {
    out.push_back(HEX_DIGITS[value >> 4]);
    out.push_back(HEX_DIGITS[value & 0x0F]);
}

} // anonymous namespace

std::string rgba_color::to_hex() const {
    std::string out = "#";
    append_byte(out, r);
    append_byte(out, g);
    append_byte(out, b);
    if (a != 255) {
        append_byte(out, a);
    }
    return out;
}

rgba_color parse_hex_color(std::string_view text) {
    THROW_IF(text.empty() || text.front() != '#', std::invalid_argument,
             "Hex color must start with '#':", std::string(text));

    std::string_view digits = text.substr(1);
    rgba_color color;

    switch (digits.size()) {
        case 3: {
            // #rgb expands each digit: #abc == #aabbcc
            const char expanded[] = {
                digits[0], digits[0], digits[1], digits[1], digits[2], digits[2]
            };
            std::string_view e(expanded, sizeof(expanded));
            color.r = parse_byte(text, e.substr(0, 2));
            color.g = parse_byte(text, e.substr(2, 2));
            color.b = parse_byte(text, e.substr(4, 2));
            break;
        }
        case 8:
            color.a = parse_byte(text, digits.substr(6, 2));
            [[fallthrough]];
        case 6:
            color.r = parse_byte(text, digits.substr(0, 2));
            color.g = parse_byte(text, digits.substr(2, 2));
            color.b = parse_byte(text, digits.substr(4, 2));
            break;
        default:
            THROW_INVALID_ARG("Invalid hex color length:", std::string(text));
    }

    return color;
}

} // namespace glyph_atlas
