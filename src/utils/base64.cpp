#include "utils/base64.hpp"
#include <array>

namespace meddictate {
namespace utils {

namespace {

const char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::array<int8_t, 256> buildReverseTable() {
    std::array<int8_t, 256> table;
    table.fill(-1);
    for (int i = 0; i < 64; ++i) {
        table[static_cast<unsigned char>(kAlphabet[i])] = static_cast<int8_t>(i);
    }
    return table;
}

} // namespace

std::optional<std::vector<uint8_t>> base64Decode(const std::string& encoded) {
    static const std::array<int8_t, 256> reverse = buildReverseTable();
    
    std::string clean;
    clean.reserve(encoded.size());
    for (char c : encoded) {
        if (c == ' ' || c == '\n' || c == '\r' || c == '\t') {
            continue;
        }
        clean.push_back(c);
    }
    
    if (clean.size() % 4 != 0) {
        return std::nullopt;
    }
    
    std::vector<uint8_t> out;
    out.reserve(clean.size() / 4 * 3);
    
    for (size_t i = 0; i < clean.size(); i += 4) {
        bool last = (i + 4 == clean.size());
        int values[4];
        int padding = 0;
        
        for (int k = 0; k < 4; ++k) {
            char c = clean[i + k];
            if (c == '=') {
                // Padding only in the final quartet, only in the last two slots
                if (!last || k < 2) {
                    return std::nullopt;
                }
                ++padding;
                values[k] = 0;
                continue;
            }
            if (padding > 0) {
                return std::nullopt;
            }
            int v = reverse[static_cast<unsigned char>(c)];
            if (v < 0) {
                return std::nullopt;
            }
            values[k] = v;
        }
        
        uint32_t triple = (static_cast<uint32_t>(values[0]) << 18) |
                          (static_cast<uint32_t>(values[1]) << 12) |
                          (static_cast<uint32_t>(values[2]) << 6) |
                          static_cast<uint32_t>(values[3]);
        
        out.push_back(static_cast<uint8_t>((triple >> 16) & 0xFF));
        if (padding < 2) {
            out.push_back(static_cast<uint8_t>((triple >> 8) & 0xFF));
        }
        if (padding < 1) {
            out.push_back(static_cast<uint8_t>(triple & 0xFF));
        }
    }
    
    return out;
}

std::string base64Encode(const std::vector<uint8_t>& data) {
    std::string out;
    out.reserve((data.size() + 2) / 3 * 4);
    
    size_t i = 0;
    while (i + 2 < data.size()) {
        uint32_t triple = (data[i] << 16) | (data[i + 1] << 8) | data[i + 2];
        out.push_back(kAlphabet[(triple >> 18) & 0x3F]);
        out.push_back(kAlphabet[(triple >> 12) & 0x3F]);
        out.push_back(kAlphabet[(triple >> 6) & 0x3F]);
        out.push_back(kAlphabet[triple & 0x3F]);
        i += 3;
    }
    
    size_t remaining = data.size() - i;
    if (remaining == 1) {
        uint32_t triple = data[i] << 16;
        out.push_back(kAlphabet[(triple >> 18) & 0x3F]);
        out.push_back(kAlphabet[(triple >> 12) & 0x3F]);
        out += "==";
    } else if (remaining == 2) {
        uint32_t triple = (data[i] << 16) | (data[i + 1] << 8);
        out.push_back(kAlphabet[(triple >> 18) & 0x3F]);
        out.push_back(kAlphabet[(triple >> 12) & 0x3F]);
        out.push_back(kAlphabet[(triple >> 6) & 0x3F]);
        out.push_back('=');
    }
    
    return out;
}

} // namespace utils
} // namespace meddictate
