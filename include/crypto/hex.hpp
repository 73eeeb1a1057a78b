#ifndef VAULT_HEX_HPP
#define VAULT_HEX_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vault::crypto {

class Hex {
public:
    // Lower-case hex encoding of a byte buffer
    static std::string encode(const uint8_t* data, size_t length) {
        static constexpr char digits[] = "0123456789abcdef";
        std::string out;
        out.reserve(length * 2);
        for (size_t i = 0; i < length; ++i) {
            out.push_back(digits[data[i] >> 4]);
            out.push_back(digits[data[i] & 0x0F]);
        }
        return out;
    }

    static std::string encode(const std::vector<uint8_t>& data) {
        return encode(data.data(), data.size());
    }

    // True if every character is a hex digit (either case)
    static bool isHex(std::string_view text) {
        for (char c : text) {
            if (nibble(c) < 0) {
                return false;
            }
        }
        return true;
    }

    // Decodes hex text, returns nullopt on odd length or a non-hex character
    static std::optional<std::vector<uint8_t>> decode(std::string_view text) {
        if (text.size() % 2 != 0) {
            return std::nullopt;
        }
        std::vector<uint8_t> out;
        out.reserve(text.size() / 2);
        for (size_t i = 0; i < text.size(); i += 2) {
            int high = nibble(text[i]);
            int low = nibble(text[i + 1]);
            if (high < 0 || low < 0) {
                return std::nullopt;
            }
            out.push_back(static_cast<uint8_t>((high << 4) | low));
        }
        return out;
    }

private:
    static int nibble(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }
};

} // namespace vault::crypto

#endif // VAULT_HEX_HPP
