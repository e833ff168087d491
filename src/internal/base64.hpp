#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace pycomp::internal {

    inline constexpr std::string_view base64_alphabet{
            "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/"};

    // Standard alphabet, '=' padded (`base64.b64encode`).
    inline std::string base64_encode(std::string_view bytes) {
        std::string out{};
        out.reserve(((bytes.size() + 2U) / 3U) * 4U);

        size_t i = 0U;
        for (; i + 2U < bytes.size(); i += 3U) {
            uint32_t chunk = (static_cast<uint8_t>(bytes[i]) << 16U) | (static_cast<uint8_t>(bytes[i + 1U]) << 8U) |
                             static_cast<uint8_t>(bytes[i + 2U]);
            out.push_back(base64_alphabet[(chunk >> 18U) & 0x3FU]);
            out.push_back(base64_alphabet[(chunk >> 12U) & 0x3FU]);
            out.push_back(base64_alphabet[(chunk >> 6U) & 0x3FU]);
            out.push_back(base64_alphabet[chunk & 0x3FU]);
        }

        auto remaining = bytes.size() - i;
        if (remaining == 1U) {
            uint32_t chunk = static_cast<uint8_t>(bytes[i]) << 16U;
            out.push_back(base64_alphabet[(chunk >> 18U) & 0x3FU]);
            out.push_back(base64_alphabet[(chunk >> 12U) & 0x3FU]);
            out += "==";
        }
        else if (remaining == 2U) {
            uint32_t chunk = (static_cast<uint8_t>(bytes[i]) << 16U) | (static_cast<uint8_t>(bytes[i + 1U]) << 8U);
            out.push_back(base64_alphabet[(chunk >> 18U) & 0x3FU]);
            out.push_back(base64_alphabet[(chunk >> 12U) & 0x3FU]);
            out.push_back(base64_alphabet[(chunk >> 6U) & 0x3FU]);
            out.push_back('=');
        }
        return out;
    }

}  // namespace pycomp::internal
