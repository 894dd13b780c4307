#pragma once
#include <openssl/sha.h>

#include <array>
#include <cstddef>
#include <string>
#include <string_view>

namespace datamesh {

// Lower-case hex SHA-224 of the input (56 characters).
[[nodiscard]] inline std::string sha224_hex(std::string_view data)
{
    std::array<unsigned char, SHA224_DIGEST_LENGTH> hash{};
    SHA224(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash.data());

    static constexpr char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(hash.size() * 2);
    for (unsigned char b : hash) {
        out += digits[b >> 4];
        out += digits[b & 0x0F];
    }
    return out;
}

} // namespace datamesh
