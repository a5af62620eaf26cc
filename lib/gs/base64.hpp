/* This file is part of Graph Sentinel project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef GRAPH_SENTINEL_BASE64_HPP
#define GRAPH_SENTINEL_BASE64_HPP

#include <string>
#include <string_view>

namespace graph_sentinel::base64 {
    inline std::string encode(const std::string_view &in)
    {
        static constexpr std::string_view alphabet { "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/" };
        std::string out {};
        out.reserve((in.size() + 2) / 3 * 4);
        int val = 0, valb = -6;
        for (const unsigned char c: in) {
            val = ((val << 8) + c) & 0xFFFF;
            valb += 8;
            while (valb >= 0) {
                out.push_back(alphabet[(val >> valb) & 0x3F]);
                valb -= 6;
            }
        }
        if (valb > -6)
            out.push_back(alphabet[((val << 8) >> (valb + 8)) & 0x3F]);
        while (out.size() % 4)
            out.push_back('=');
        return out;
    }
}

#endif // !GRAPH_SENTINEL_BASE64_HPP
