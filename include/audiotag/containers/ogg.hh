/**
 * @file ogg.hh
 * @brief OGG page demuxer and Vorbis/Opus header reader
 * @ingroup containers
 */

#pragma once

#include <audiotag/export_audiotag.h>
#include <audiotag/metadata.hh>
#include <audiotag/sdk/io_stream.hh>
#include <audiotag/sdk/tag_decoder.hh>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <vector>

namespace audiotag {
namespace ogg {

constexpr std::size_t page_header_size = 27;
constexpr uint8_t flag_continued = 0x01;

// Granule position of a page on which no packet ends
constexpr uint64_t no_granule = ~0ULL;

/**
 * @brief OGG flavoured CRC-32
 *
 * Polynomial 0x04C11DB7, unreflected, no final xor. Pass the previous
 * result as @p crc to checksum a page in pieces.
 */
AUDIOTAG_EXPORT uint32_t crc32(const uint8_t* data, std::size_t size, uint32_t crc = 0);

struct page_header {
    uint8_t version = 0;
    uint8_t flags = 0;
    uint64_t granule_position = 0;
    uint32_t serial = 0;
    uint32_t sequence = 0;
    uint32_t crc = 0;
    uint8_t segments = 0;

    bool continued() const { return (flags & flag_continued) != 0; }
};

// Packets completed on one page
struct page {
    page_header header;
    std::vector<std::vector<uint8_t>> packets;
};

/**
 * @class demuxer
 * @brief Reassembles packets from consecutive pages of one physical stream
 *
 * Holds a pending buffer per logical stream (serial number) so packets may
 * span pages and several logical streams may be interleaved. One demuxer
 * belongs to one physical stream; do not share it between files.
 */
class AUDIOTAG_EXPORT demuxer {
public:
    /**
     * @brief Read and verify the page at the cursor
     *
     * @return std::nullopt at a clean end of stream, otherwise the page with
     *         every packet it completed (possibly none)
     * @throws format_mismatch_error if "OggS" is missing
     * @throws checksum_error if the CRC does not match
     * @throws orphaned_continuation_error if a continued page has no
     *         pending packet for its serial
     * @throws io_error if the page is truncated
     */
    std::optional<page> read_page(io_stream* stream);

    // True once a page of @p serial has been seen
    [[nodiscard]] bool knows(uint32_t serial) const;

    // Bytes waiting for the rest of their packet
    [[nodiscard]] std::size_t pending_size(uint32_t serial) const;

private:
    std::map<uint32_t, std::vector<uint8_t>> m_pending;
};

/**
 * @class ogg_metadata
 * @brief Vorbis comment fields plus granule based duration
 */
class AUDIOTAG_EXPORT ogg_metadata : public tagged_metadata {
public:
    ogg_metadata(sample_rate_t sample_rate, uint64_t granule_position, std::string codec,
                 std::set<uint32_t> serials, tag_fields tags);

    [[nodiscard]] file_type get_file_type() const override { return file_type::ogg; }
    [[nodiscard]] duration_t duration() const override;

    [[nodiscard]] sample_rate_t get_sample_rate() const { return m_sample_rate; }
    [[nodiscard]] uint64_t get_granule_position() const { return m_granule_position; }
    [[nodiscard]] const std::string& get_codec() const { return m_codec; }

protected:
    [[nodiscard]] raw_map technical_fields() const override;

private:
    sample_rate_t m_sample_rate;
    uint64_t m_granule_position;
    std::string m_codec;
    std::set<uint32_t> m_serials;
};

/**
 * @brief Demux every page and collect the Vorbis/Opus header packets
 *
 * Comment packets ("\x03vorbis", "OpusTags") go to
 * tag_decoder::decode_vorbis_comment without their prefix. Duration is the
 * granule position of the last page divided by the sample rate, which is
 * taken from the Vorbis identification packet or fixed at 48 kHz for Opus.
 *
 * @throws no_tags_found_error if no comment packet was found
 */
AUDIOTAG_EXPORT std::unique_ptr<ogg_metadata> read(io_stream* stream, tag_decoder& tags);

} // namespace ogg
} // namespace audiotag
