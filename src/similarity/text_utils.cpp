#include "similarity/text_utils.hpp"

namespace kgf {
namespace text {

std::u32string decode_utf8(const std::string& input) {
    std::u32string result;
    result.reserve(input.size());

    size_t i = 0;
    while (i < input.size()) {
        unsigned char lead = static_cast<unsigned char>(input[i]);
        char32_t code_point = 0;
        size_t extra = 0;

        if (lead < 0x80) {
            code_point = lead;
        } else if ((lead & 0xE0) == 0xC0) {
            code_point = lead & 0x1F;
            extra = 1;
        } else if ((lead & 0xF0) == 0xE0) {
            code_point = lead & 0x0F;
            extra = 2;
        } else if ((lead & 0xF8) == 0xF0) {
            code_point = lead & 0x07;
            extra = 3;
        } else {
            result.push_back(U'\uFFFD');
            ++i;
            continue;
        }

        // Truncated sequence at end of input
        if (i + extra >= input.size()) {
            result.push_back(U'\uFFFD');
            ++i;
            continue;
        }

        bool valid = true;
        for (size_t k = 1; k <= extra; ++k) {
            unsigned char cont = static_cast<unsigned char>(input[i + k]);
            if ((cont & 0xC0) != 0x80) {
                valid = false;
                break;
            }
            code_point = (code_point << 6) | (cont & 0x3F);
        }

        if (!valid) {
            result.push_back(U'\uFFFD');
            ++i;
            continue;
        }

        result.push_back(code_point);
        i += extra + 1;
    }

    return result;
}

size_t utf8_length(const std::string& input) {
    return decode_utf8(input).size();
}

std::u32string to_lower(const std::u32string& input) {
    std::u32string result = input;
    for (auto& c : result) {
        if (c >= U'A' && c <= U'Z') {
            c = c - U'A' + U'a';
        }
    }
    return result;
}

bool is_upper(const std::string& input) {
    bool has_letter = false;
    for (unsigned char c : input) {
        if (c >= 'a' && c <= 'z') return false;
        if (c >= 'A' && c <= 'Z') has_letter = true;
    }
    return has_letter;
}

} // namespace text
} // namespace kgf
