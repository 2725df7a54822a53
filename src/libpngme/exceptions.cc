//
// Created by igor on 14/08/2025.
//

#include <pngme/exceptions.hh>

namespace pngme {
    std::string_view to_string(error_kind kind) noexcept {
        switch (kind) {
            case error_kind::io:                 return "io";
            case error_kind::parse:              return "parse";
            case error_kind::invalid_length:     return "invalid_length";
            case error_kind::invalid_chunk_type: return "invalid_chunk_type";
            case error_kind::truncated_input:    return "truncated_input";
            case error_kind::length_mismatch:    return "length_mismatch";
            case error_kind::chunk_too_large:    return "chunk_too_large";
            case error_kind::checksum_mismatch:  return "checksum_mismatch";
            case error_kind::text_decode:        return "text_decode";
        }
        // make compiler happy
        return "unknown";
    }
}
