//
// Chunk type parsing from user supplied text.
//

#include <pngme/chunk_type.hh>

namespace pngme {

    chunk_type chunk_type::from_string(std::string_view s) {
        // Byte length, so a multi-byte UTF-8 character never passes as one letter
        THROW_PARSE_IF(s.size() != size, wrong_length,
                       "Chunk type '", s, "' is ", s.size(), " bytes long, expected ", size);
        return from_bytes(s.data());
    }

} // namespace pngme
