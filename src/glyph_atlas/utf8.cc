//
// Created by igor on 02/01/2026.
//

#include <glyph_atlas/utf8.hh>

namespace glyph_atlas {
    namespace {
        struct lead_info {
            std::size_t length;      // total sequence length
            unsigned char payload;   // mask of code point bits in the lead byte
            char32_t min_codepoint;  // smallest value not overlong for this length
        };

        // Returns length 0 for bytes that cannot start a sequence
        constexpr lead_info classify_lead(unsigned char b) noexcept {
            if (b < 0x80) return {1, 0x7F, 0};
            if ((b & 0xE0) == 0xC0) return {2, 0x1F, 0x80};
            if ((b & 0xF0) == 0xE0) return {3, 0x0F, 0x800};
            if ((b & 0xF8) == 0xF0) return {4, 0x07, 0x10000};
            return {0, 0, 0};
        }

        constexpr bool is_continuation(unsigned char b) noexcept {
            return (b & 0xC0) == 0x80;
        }
    }

    utf8_decoded decode_utf8_one(std::string_view str) noexcept {
        if (str.empty()) {
            return {utf8_replacement_char, 0};
        }

        const auto* data = reinterpret_cast<const unsigned char*>(str.data());
        const lead_info lead = classify_lead(data[0]);

        // Stray continuation byte or 0xF8..0xFF
        if (lead.length == 0) {
            return {utf8_replacement_char, 1};
        }

        // Truncated or broken sequence: skip the lead byte only
        if (str.size() < lead.length) {
            return {utf8_replacement_char, 1};
        }
        char32_t cp = data[0] & lead.payload;
        for (std::size_t k = 1; k < lead.length; ++k) {
            if (!is_continuation(data[k])) {
                return {utf8_replacement_char, 1};
            }
            cp = (cp << 6) | (data[k] & 0x3F);
        }

        // Well-formed shape but not a valid scalar value
        if (cp < lead.min_codepoint || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            return {utf8_replacement_char, lead.length};
        }
        return {cp, lead.length};
    }

    std::vector<char32_t> decode_utf8(std::string_view str) {
        std::vector<char32_t> out;
        out.reserve(str.size());
        while (!str.empty()) {
            const utf8_decoded d = decode_utf8_one(str);
            out.push_back(d.codepoint);
            str.remove_prefix(d.length);
        }
        return out;
    }
} // namespace glyph_atlas
