#include "utils/string_utils.hpp"

namespace meddictate {
namespace utils {

namespace {

// Lead byte of Ä Ö Ü ä ö ü ß
constexpr unsigned char kLatin1Lead = 0xC3;

bool isGermanLetter(const std::string& text, size_t pos, size_t& width) {
    unsigned char c = static_cast<unsigned char>(text[pos]);
    if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z')) {
        width = 1;
        return true;
    }
    if (c == kLatin1Lead && pos + 1 < text.size()) {
        unsigned char n = static_cast<unsigned char>(text[pos + 1]);
        switch (n) {
            case 0x84: case 0x96: case 0x9C:   // Ä Ö Ü
            case 0xA4: case 0xB6: case 0xBC:   // ä ö ü
            case 0x9F:                         // ß
                width = 2;
                return true;
            default:
                break;
        }
    }
    return false;
}

} // namespace

std::string toLower(const std::string& text) {
    std::string out = text;
    for (size_t i = 0; i < out.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(out[i]);
        if (c >= 'A' && c <= 'Z') {
            out[i] = static_cast<char>(c - 'A' + 'a');
        } else if (c == kLatin1Lead && i + 1 < out.size()) {
            unsigned char n = static_cast<unsigned char>(out[i + 1]);
            if (n == 0x84 || n == 0x96 || n == 0x9C) {
                out[i + 1] = static_cast<char>(n + 0x20);
            }
            ++i;
        }
    }
    return out;
}

bool isWordByte(unsigned char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') || c == '_' || c >= 0x80;
}

size_t utf8Length(const std::string& text) {
    size_t count = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

std::vector<std::string> utf8Split(const std::string& text) {
    std::vector<std::string> out;
    for (size_t i = 0; i < text.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if ((c & 0xC0) == 0x80 && !out.empty()) {
            out.back().push_back(text[i]);
        } else {
            out.emplace_back(1, text[i]);
        }
    }
    return out;
}

bool containsIgnoreCase(const std::string& haystack, const std::string& needle) {
    return toLower(haystack).find(toLower(needle)) != std::string::npos;
}

size_t replaceWholeWord(std::string& text, const std::string& needle,
                        const std::string& replacement) {
    if (needle.empty()) {
        return 0;
    }
    
    const std::string lowerNeedle = toLower(needle);
    const std::string lowerText = toLower(text);
    const bool needleStartsWord = isWordByte(static_cast<unsigned char>(needle.front()));
    const bool needleEndsWord = isWordByte(static_cast<unsigned char>(needle.back()));
    
    std::string result;
    result.reserve(text.size());
    size_t count = 0;
    size_t copied = 0;
    size_t pos = lowerText.find(lowerNeedle);
    
    while (pos != std::string::npos) {
        size_t end = pos + lowerNeedle.size();
        bool leftOk = !needleStartsWord || pos == 0 ||
                      !isWordByte(static_cast<unsigned char>(lowerText[pos - 1]));
        bool rightOk = !needleEndsWord || end == lowerText.size() ||
                       !isWordByte(static_cast<unsigned char>(lowerText[end]));
        
        if (leftOk && rightOk) {
            result.append(text, copied, pos - copied);
            result.append(replacement);
            copied = end;
            ++count;
            pos = lowerText.find(lowerNeedle, end);
        } else {
            pos = lowerText.find(lowerNeedle, pos + 1);
        }
    }
    
    if (count > 0) {
        result.append(text, copied, std::string::npos);
        text.swap(result);
    }
    return count;
}

std::vector<std::string> extractWords(const std::string& text, size_t minLength) {
    std::vector<std::string> words;
    size_t i = 0;
    
    while (i < text.size()) {
        if (!isWordByte(static_cast<unsigned char>(text[i]))) {
            ++i;
            continue;
        }
        
        // One run of word bytes; keep it only if every code point is a letter
        size_t start = i;
        bool lettersOnly = true;
        size_t codePoints = 0;
        while (i < text.size() && isWordByte(static_cast<unsigned char>(text[i]))) {
            size_t width = 1;
            if (!isGermanLetter(text, i, width)) {
                lettersOnly = false;
                width = 1;
            }
            i += width;
            ++codePoints;
        }
        
        if (lettersOnly && codePoints >= minLength) {
            words.push_back(toLower(text.substr(start, i - start)));
        }
    }
    return words;
}

std::string trim(const std::string& text) {
    const char* whitespace = " \t\r\n";
    size_t start = text.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(whitespace);
    return text.substr(start, end - start + 1);
}

std::string join(const std::vector<std::string>& parts, const std::string& separator) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            out += separator;
        }
        out += parts[i];
    }
    return out;
}

} // namespace utils
} // namespace meddictate
