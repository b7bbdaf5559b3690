/**
 * @file dsf.hh
 * @brief DSD stream file header reader
 * @ingroup containers
 */

#pragma once

#include <audiotag/export_audiotag.h>
#include <audiotag/metadata.hh>
#include <audiotag/sdk/io_stream.hh>
#include <audiotag/sdk/tag_decoder.hh>
#include <memory>

namespace audiotag {
namespace dsf {

// Fields of the "DSD " and "fmt " chunks
struct header {
    uint64_t tag_offset = 0;      // Absolute offset of the ID3v2 tag, 0 if none
    channels_t channels = 0;
    sample_rate_t sample_rate = 0;
    uint32_t bits_per_sample = 0;
    uint64_t sample_count = 0;    // Per channel
};

class AUDIOTAG_EXPORT dsf_metadata : public tagged_metadata {
public:
    dsf_metadata(const header& hdr, tag_fields tags);

    [[nodiscard]] file_type get_file_type() const override { return file_type::dsf; }

    // Whole seconds, truncated
    [[nodiscard]] duration_t duration() const override;

    [[nodiscard]] const header& get_header() const { return m_header; }

protected:
    [[nodiscard]] raw_map technical_fields() const override;

private:
    header m_header;
};

/**
 * @brief Read the fixed DSF header and the ID3v2 tag it points to
 *
 * @throws format_mismatch_error if "DSD " is missing
 * @throws io_error if the header or the tag is truncated
 */
AUDIOTAG_EXPORT std::unique_ptr<dsf_metadata> read(io_stream* stream, tag_decoder& tags);

} // namespace dsf
} // namespace audiotag
