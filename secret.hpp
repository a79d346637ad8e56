/*
    This file is part of gm wallet (devrpc).

    gm wallet is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 2 of the License, or
    (at your option) any later version.

    gm wallet is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with gm wallet.  If not, see <http://www.gnu.org/licenses/>.

    This program is released under the GPL with the additional exemption
    that compiling, linking, and/or using OpenSSL is allowed.
    You are free to remove this exemption from derived works.
*/

#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>
#include <openssl/crypto.h>
#include <openssl/rand.h>

namespace gm {

inline void secure_zero(std::string& s) {
    if (!s.empty()) OPENSSL_cleanse(&s[0], s.size());
}

inline std::string hex_encode(const unsigned char* data, size_t len) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; i++) {
        out += digits[data[i] >> 4];
        out += digits[data[i] & 0x0f];
    }
    return out;
}

// Capability token for the proxy URL path.
inline std::string random_secret_hex(size_t nbytes = 32) {
    std::vector<unsigned char> buf(nbytes);
    if (RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1)
        throw std::runtime_error("RAND_bytes failed");
    std::string s = hex_encode(buf.data(), buf.size());
    OPENSSL_cleanse(buf.data(), buf.size());
    return s;
}

} // namespace gm
