/**
 * @file mp4.hh
 * @brief MP4 pass-through to the tag decoder
 * @ingroup containers
 */

#pragma once

#include <audiotag/export_audiotag.h>
#include <audiotag/metadata.hh>
#include <audiotag/sdk/io_stream.hh>
#include <audiotag/sdk/tag_decoder.hh>
#include <memory>

namespace audiotag {
namespace mp4 {

// The atom tree is left to tag_decoder::decode_mp4; no timing is extracted.
class AUDIOTAG_EXPORT mp4_metadata : public tagged_metadata {
public:
    mp4_metadata(file_type type, tag_fields tags);

    [[nodiscard]] file_type get_file_type() const override { return m_type; }
    [[nodiscard]] duration_t duration() const override { return duration_t::zero(); }

private:
    file_type m_type;
};

/**
 * @brief Hand the whole stream to the MP4 tag decoder
 * @param type File subtype from the "ftyp" brand
 */
AUDIOTAG_EXPORT std::unique_ptr<mp4_metadata> read(io_stream* stream, file_type type, tag_decoder& tags);

} // namespace mp4
} // namespace audiotag
