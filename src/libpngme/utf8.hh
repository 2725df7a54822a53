//
// Created by igor on 16/08/2025.
//

#pragma once

#include <cstddef>

namespace pngme {
    /**
     * @brief Check that a byte range is well-formed UTF-8
     *
     * Rejects overlong encodings, UTF-16 surrogates and code points above U+10FFFF.
     * On failure @p error_offset receives the offset of the first bad sequence.
     */
    bool is_valid_utf8(const std::byte* data, std::size_t size, std::size_t& error_offset) noexcept;
}
