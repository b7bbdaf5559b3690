#include <audiotag/containers/id3.hh>
#include <audiotag/sdk/byte_reader.hh>
#include <audiotag/sdk/bits.hh>
#include <audiotag/error.hh>
#include <cstring>

namespace audiotag {
namespace id3 {

static constexpr uint8_t FLAG_FOOTER = 0x10;

tag_format v2_format(uint8_t major_version) {
    switch (major_version) {
        case 2: return tag_format::id3v2_2;
        case 3: return tag_format::id3v2_3;
        case 4: return tag_format::id3v2_4;
        default:
            break;
    }
    throw unsupported_version_error("ID3 version: " + std::to_string(major_version) +
                                    ", expected: 2, 3 or 4");
}

v2_header read_v2_header(io_stream* stream) {
    uint8_t raw[v2_header_size];
    read_exact(stream, raw, sizeof(raw));

    if (std::memcmp(raw, "ID3", 3) != 0) {
        throw format_mismatch_error("Expected 'ID3' tag header");
    }

    v2_header header;
    header.major_version = raw[3];
    header.revision = raw[4];
    header.flags = raw[5];
    header.size = static_cast<uint32_t>(get_7bit_chunked_value(raw + 6, 4));
    header.footer_present = (header.flags & FLAG_FOOTER) != 0;

    // Validates the version as a side effect
    v2_format(header.major_version);
    return header;
}

bool has_v1_trailer(io_stream* stream) {
    if (stream->get_size() < v1_tag_size) {
        return false;
    }
    if (stream->seek(-v1_tag_size, seek_origin::end) < 0) {
        throw io_error("Cannot seek to ID3v1 trailer");
    }
    return read_string(stream, 3) == "TAG";
}

} // namespace id3
} // namespace audiotag
