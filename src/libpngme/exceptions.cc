//
// Error kind names, used as warning categories.
//

#include <pngme/exceptions.hh>

namespace pngme {

    std::string_view to_string(error_kind kind) noexcept {
        switch (kind) {
            case error_kind::invalid_character:
                return "invalid_character";
            case error_kind::wrong_length:
                return "wrong_length";
            case error_kind::too_short:
                return "too_short";
            case error_kind::length_mismatch:
                return "length_mismatch";
            case error_kind::length_exceeds_buffer:
                return "length_exceeds_buffer";
            case error_kind::trailing_data:
                return "trailing_data";
            case error_kind::crc_mismatch:
                return "crc_mismatch";
            case error_kind::invalid_encoding:
                return "invalid_encoding";
            case error_kind::invalid_signature:
                return "invalid_signature";
            case error_kind::chunk_not_found:
                return "chunk_not_found";
        }
        // make compiler happy
        return "unknown";
    }

} // namespace pngme
