#pragma once

#include <audiotag/export_audiotag.h>
#include <audiotag/metadata_types.hh>
#include <audiotag/sdk/io_stream.hh>

namespace audiotag {
namespace id3 {

// Size of the ID3v2 header and of the optional ID3v2.4 footer
constexpr int64_t v2_header_size = 10;
constexpr int64_t v2_footer_size = 10;

// ID3v1 is a fixed trailer at the very end of the file
constexpr int64_t v1_tag_size = 128;

// Fixed part of an ID3v2 tag
struct v2_header {
    uint8_t major_version = 0;
    uint8_t revision = 0;
    uint8_t flags = 0;
    uint32_t size = 0;          // Synchsafe body size, excluding header and footer
    bool footer_present = false;

    // Bytes the tag occupies in the file
    int64_t total_size() const {
        return v2_header_size + size + (footer_present ? v2_footer_size : 0);
    }
};

// Map an ID3v2 major version to its dialect; throws unsupported_version_error
// for anything other than 2, 3 or 4
AUDIOTAG_EXPORT tag_format v2_format(uint8_t major_version);

// Read the 10-byte header at the cursor. Leaves the cursor after the header.
AUDIOTAG_EXPORT v2_header read_v2_header(io_stream* stream);

// True when the last 128 bytes start with "TAG". Cursor position is
// unspecified afterwards.
AUDIOTAG_EXPORT bool has_v1_trailer(io_stream* stream);

} // namespace id3
} // namespace audiotag
