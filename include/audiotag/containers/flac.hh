/**
 * @file flac.hh
 * @brief FLAC metadata block chain walker
 * @ingroup containers
 */

#pragma once

#include <audiotag/export_audiotag.h>
#include <audiotag/metadata.hh>
#include <audiotag/sdk/io_stream.hh>
#include <audiotag/sdk/tag_decoder.hh>
#include <memory>
#include <vector>

namespace audiotag {
namespace flac {

enum class block_type : uint8_t {
    stream_info = 0,
    padding = 1,
    application = 2,
    seek_table = 3,
    vorbis_comment = 4,
    cue_sheet = 5,
    picture = 6
};

AUDIOTAG_EXPORT const char* to_string(block_type type);

// One visited metadata block
struct block_info {
    uint8_t type;      // Raw 7-bit type; values above 6 are reserved
    uint64_t offset;   // Offset of the payload in the stream
    uint32_t length;   // 24-bit payload length
    bool last;
};

// Fields of the STREAMINFO block used for duration
struct stream_info {
    sample_rate_t sample_rate = 0;
    channels_t channels = 0;
    uint16_t bits_per_sample = 0;
    uint64_t total_samples = 0;
};

/**
 * @class flac_metadata
 * @brief Vorbis comment fields plus STREAMINFO timing of a FLAC file
 */
class AUDIOTAG_EXPORT flac_metadata : public tagged_metadata {
public:
    flac_metadata(const stream_info& info, std::vector<block_info> blocks, tag_fields tags);

    [[nodiscard]] file_type get_file_type() const override { return file_type::flac; }
    [[nodiscard]] duration_t duration() const override;

    [[nodiscard]] const stream_info& info() const { return m_info; }
    [[nodiscard]] const std::vector<block_info>& blocks() const { return m_blocks; }

protected:
    [[nodiscard]] raw_map technical_fields() const override;

private:
    stream_info m_info;
    std::vector<block_info> m_blocks;
};

/**
 * @brief Walk the metadata blocks of a FLAC stream
 *
 * Starts at offset 0. VORBIS_COMMENT and PICTURE payloads are handed to
 * @p tags as sub-streams of exactly the declared length; every other block
 * is skipped. The walk stops after the block flagged last, leaving the
 * cursor at the first audio frame.
 *
 * @throws format_mismatch_error if "fLaC" is missing or STREAMINFO is short
 * @throws io_error if a block extends past the end of the stream
 */
AUDIOTAG_EXPORT std::unique_ptr<flac_metadata> read(io_stream* stream, tag_decoder& tags);

} // namespace flac
} // namespace audiotag
