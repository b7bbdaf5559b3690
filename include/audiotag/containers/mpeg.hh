/**
 * @file mpeg.hh
 * @brief MPEG audio frame header decoding and CBR duration estimate
 * @ingroup containers
 */

#pragma once

#include <audiotag/export_audiotag.h>
#include <audiotag/metadata.hh>
#include <audiotag/sdk/io_stream.hh>
#include <audiotag/sdk/tag_decoder.hh>
#include <memory>

namespace audiotag {
namespace mpeg {

constexpr std::size_t frame_header_size = 4;

// Values of the 2-bit version field
enum class version : uint8_t {
    mpeg25 = 0,
    reserved = 1,
    mpeg2 = 2,
    mpeg1 = 3
};

// Values of the 2-bit layer field
enum class layer : uint8_t {
    reserved = 0,
    layer3 = 1,
    layer2 = 2,
    layer1 = 3
};

// Decoded first frame header
struct frame_header {
    version ver = version::reserved;
    layer lay = layer::reserved;
    bool protection = false;
    unsigned bitrate_kbps = 0;
    sample_rate_t sample_rate = 0;
    unsigned samples_per_frame = 0;
    bool padding = false;
    unsigned slot_size = 0;

    // Seconds of audio per frame
    double frame_duration() const;

    // Bytes per frame including the 4-byte header
    int64_t frame_size() const;
};

/**
 * @brief Table driven decode of a 32-bit frame header
 *
 * Field positions (bit offsets, MSB first): version 11, layer 13,
 * protection 15, bitrate index 16, sample rate index 20, padding 21.
 * The padding position overlaps the sample rate index and is kept as is
 * so durations match existing files.
 *
 * @throws unsupported_format_error for reserved version, layer, bitrate or
 *         sample rate values
 */
AUDIOTAG_EXPORT frame_header decode_header(const uint8_t* header);

/**
 * @brief Estimate stream duration assuming constant bitrate
 *
 * Frame size is floor(frame_duration * kbps * 1000 / 8), plus one slot
 * when padding is set, plus 2 when the protection bit is set, plus the
 * header. The result is rounded to whole seconds.
 *
 * @param header First four bytes of the first frame
 * @param stripped_size Audio bytes, i.e. stream size minus tag bytes
 * @throws unsupported_format_error for reserved header values
 */
AUDIOTAG_EXPORT duration_t compute_duration(const uint8_t* header, int64_t stripped_size);

/**
 * @class mp3_metadata
 * @brief ID3 fields plus the estimated duration of an MP3 file
 */
class AUDIOTAG_EXPORT mp3_metadata : public tagged_metadata {
public:
    mp3_metadata(const frame_header& header, int64_t audio_size, duration_t duration, tag_fields tags);

    [[nodiscard]] file_type get_file_type() const override { return file_type::mp3; }
    [[nodiscard]] duration_t duration() const override { return m_duration; }

    [[nodiscard]] const frame_header& first_frame() const { return m_header; }
    [[nodiscard]] int64_t get_audio_size() const { return m_audio_size; }

protected:
    [[nodiscard]] raw_map technical_fields() const override;

private:
    frame_header m_header;
    int64_t m_audio_size;
    duration_t m_duration;
};

/**
 * @brief Read an MP3 that starts with an ID3v2 tag
 *
 * The tag (header, body and optional footer) is handed to
 * tag_decoder::decode_id3v2; the first frame header follows it.
 *
 * @param total_size Size of the whole stream in bytes
 */
AUDIOTAG_EXPORT std::unique_ptr<mp3_metadata> read_v2(io_stream* stream, int64_t total_size, tag_decoder& tags);

/**
 * @brief Read an MP3 that ends with a 128-byte ID3v1 trailer
 *
 * The first frame header is at offset 0.
 *
 * @param total_size Size of the whole stream in bytes
 */
AUDIOTAG_EXPORT std::unique_ptr<mp3_metadata> read_v1(io_stream* stream, int64_t total_size, tag_decoder& tags);

} // namespace mpeg
} // namespace audiotag
