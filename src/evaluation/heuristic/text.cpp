#include "evaluation/heuristic/text.h"

#include <algorithm>

#include <absl/strings/ascii.h>
#include <absl/strings/str_split.h>
#include <unicode/uchar.h>

namespace evalkit::eval::heuristic {

namespace {

constexpr char32_t kReplacement = 0xFFFD;

bool IsContinuation(unsigned char byte) {
    return (byte & 0xC0) == 0x80;
}

// General categories L* and N*.
bool IsAlphanumeric(char32_t cp) {
    if (cp < 0x80) {
        return absl::ascii_isalnum(static_cast<unsigned char>(cp));
    }
    return (U_GET_GC_MASK(static_cast<UChar32>(cp)) & (U_GC_L_MASK | U_GC_N_MASK)) != 0;
}

}  // namespace

std::u32string DecodeUtf8(absl::string_view text) {
    std::u32string out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<unsigned char>(text[i]);
        size_t length = 0;
        char32_t cp = 0;

        if (lead < 0x80) {
            length = 1;
            cp = lead;
        } else if ((lead & 0xE0) == 0xC0) {
            length = 2;
            cp = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            length = 3;
            cp = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            length = 4;
            cp = lead & 0x07;
        } else {
            out.push_back(kReplacement);
            ++i;
            continue;
        }

        if (i + length > text.size()) {
            out.push_back(kReplacement);
            ++i;
            continue;
        }

        bool valid = true;
        for (size_t k = 1; k < length; ++k) {
            const auto byte = static_cast<unsigned char>(text[i + k]);
            if (!IsContinuation(byte)) {
                valid = false;
                break;
            }
            cp = (cp << 6) | (byte & 0x3F);
        }

        if (!valid) {
            out.push_back(kReplacement);
            ++i;
            continue;
        }

        out.push_back(cp);
        i += length;
    }

    return out;
}

std::string EncodeUtf8(char32_t cp) {
    std::string out;
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    return out;
}

std::string ToLower(absl::string_view text) {
    const bool ascii = std::all_of(text.begin(), text.end(), [](char c) {
        return static_cast<unsigned char>(c) < 0x80;
    });
    if (ascii) {
        return absl::AsciiStrToLower(text);
    }

    std::string out;
    out.reserve(text.size());
    for (char32_t cp : DecodeUtf8(text)) {
        out += EncodeUtf8(static_cast<char32_t>(u_tolower(static_cast<UChar32>(cp))));
    }
    return out;
}

std::vector<std::string> Fields(absl::string_view text) {
    return absl::StrSplit(text, absl::ByAnyChar(" \t\n\v\f\r"), absl::SkipEmpty());
}

std::string TrimNonAlphanumeric(absl::string_view word) {
    const std::u32string cps = DecodeUtf8(word);
    size_t begin = 0;
    size_t end = cps.size();
    while (begin < end && !IsAlphanumeric(cps[begin])) {
        ++begin;
    }
    while (end > begin && !IsAlphanumeric(cps[end - 1])) {
        --end;
    }

    std::string out;
    out.reserve(word.size());
    for (size_t i = begin; i < end; ++i) {
        out += EncodeUtf8(cps[i]);
    }
    return out;
}

std::string TrimSpace(absl::string_view text) {
    return std::string(absl::StripAsciiWhitespace(text));
}

}  // namespace evalkit::eval::heuristic
