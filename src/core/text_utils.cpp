#include <regdoc/core/text_utils.h>

namespace regdoc::text {

namespace {

constexpr char32_t kReplacement = 0xFFFD;

int digitValue(char32_t cp) {
    switch (cp) {
        case U'零':
        case U'〇':
            return 0;
        case U'一':
            return 1;
        case U'二':
        case U'两':
            return 2;
        case U'三':
            return 3;
        case U'四':
            return 4;
        case U'五':
            return 5;
        case U'六':
            return 6;
        case U'七':
            return 7;
        case U'八':
            return 8;
        case U'九':
            return 9;
        default:
            return -1;
    }
}

int unitValue(char32_t cp) {
    switch (cp) {
        case U'十':
            return 10;
        case U'百':
            return 100;
        case U'千':
            return 1000;
        default:
            return 0;
    }
}

} // namespace

std::u32string decodeUtf8(std::string_view input) {
    std::u32string out;
    out.reserve(input.size());

    const auto* data = reinterpret_cast<const unsigned char*>(input.data());
    const size_t n = input.size();
    size_t i = 0;
    while (i < n) {
        unsigned char c = data[i];
        if (c < 0x80) {
            out.push_back(c);
            ++i;
            continue;
        }

        size_t len = 0;
        char32_t cp = 0;
        if (c >= 0xC2 && c <= 0xDF) {
            len = 2;
            cp = c & 0x1F;
        } else if (c >= 0xE0 && c <= 0xEF) {
            len = 3;
            cp = c & 0x0F;
        } else if (c >= 0xF0 && c <= 0xF4) {
            len = 4;
            cp = c & 0x07;
        }

        if (len == 0 || i + len > n) {
            out.push_back(kReplacement);
            ++i;
            continue;
        }

        bool valid = true;
        for (size_t k = 1; k < len; ++k) {
            unsigned char cc = data[i + k];
            if ((cc & 0xC0) != 0x80) {
                valid = false;
                break;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }
        if (!valid) {
            out.push_back(kReplacement);
            ++i;
            continue;
        }
        out.push_back(cp);
        i += len;
    }
    return out;
}

std::string encodeUtf8(char32_t cp) {
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

std::string encodeUtf8(std::u32string_view input) {
    std::string out;
    out.reserve(input.size() * 3);
    for (char32_t cp : input) {
        out += encodeUtf8(cp);
    }
    return out;
}

size_t codepointCount(std::string_view input) {
    size_t count = 0;
    for (unsigned char c : input) {
        if ((c & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

std::string truncateCodepoints(std::string_view input, size_t maxChars) {
    size_t seen = 0;
    for (size_t i = 0; i < input.size(); ++i) {
        auto c = static_cast<unsigned char>(input[i]);
        if ((c & 0xC0) != 0x80) {
            if (seen == maxChars) {
                return std::string(input.substr(0, i));
            }
            ++seen;
        }
    }
    return std::string(input);
}

bool isWhitespace(char32_t cp) {
    return cp == U' ' || cp == U'\t' || cp == U'\n' || cp == U'\r' || cp == U'\f' ||
           cp == U'\v' || cp == 0x3000 || cp == 0x00A0;
}

bool isCjk(char32_t cp) {
    return (cp >= 0x4E00 && cp <= 0x9FFF) || (cp >= 0x3400 && cp <= 0x4DBF);
}

std::u32string trim(std::u32string_view input) {
    size_t start = 0;
    while (start < input.size() && isWhitespace(input[start])) {
        ++start;
    }
    size_t end = input.size();
    while (end > start && isWhitespace(input[end - 1])) {
        --end;
    }
    return std::u32string(input.substr(start, end - start));
}

std::string trim(std::string_view input) {
    return encodeUtf8(trim(decodeUtf8(input)));
}

std::string toHalfWidth(std::string_view input) {
    auto cps = decodeUtf8(input);
    for (auto& cp : cps) {
        if (cp >= 0xFF01 && cp <= 0xFF5E) {
            cp = cp - 0xFF01 + 0x21;
        } else if (cp == 0x3000) {
            cp = U' ';
        }
    }
    return encodeUtf8(cps);
}

std::optional<int> parseChineseNumber(std::u32string_view input) {
    if (input.empty()) {
        return std::nullopt;
    }

    bool allDigits = true;
    for (char32_t cp : input) {
        if (cp < U'0' || cp > U'9') {
            allDigits = false;
            break;
        }
    }
    if (allDigits) {
        if (input.size() > 6) {
            return std::nullopt;
        }
        int value = 0;
        for (char32_t cp : input) {
            value = value * 10 + static_cast<int>(cp - U'0');
        }
        return value;
    }

    int result = 0;
    int digit = -1;
    for (char32_t cp : input) {
        int d = digitValue(cp);
        if (d >= 0) {
            digit = d;
            continue;
        }
        int unit = unitValue(cp);
        if (unit == 0) {
            return std::nullopt;
        }
        if (digit < 0) {
            // Leading 十 as in 十二
            digit = 1;
        }
        result += digit * unit;
        digit = -1;
    }
    if (digit > 0) {
        result += digit;
    }
    return result;
}

std::optional<int> parseChineseNumber(std::string_view input) {
    return parseChineseNumber(std::u32string_view(decodeUtf8(input)));
}

bool isNumeralChar(char32_t cp) {
    return (cp >= U'0' && cp <= U'9') || digitValue(cp) >= 0 || unitValue(cp) != 0;
}

std::string collapseWhitespace(std::string_view input) {
    auto cps = decodeUtf8(input);
    std::u32string out;
    out.reserve(cps.size());
    bool pendingSpace = false;
    for (char32_t cp : cps) {
        if (isWhitespace(cp)) {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace) {
            out.push_back(U' ');
            pendingSpace = false;
        }
        out.push_back(cp);
    }
    return encodeUtf8(out);
}

} // namespace regdoc::text
