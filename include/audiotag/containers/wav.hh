/**
 * @file wav.hh
 * @brief RIFF/WAVE chunk walker
 * @ingroup containers
 */

#pragma once

#include <audiotag/export_audiotag.h>
#include <audiotag/metadata.hh>
#include <audiotag/sdk/io_stream.hh>
#include <audiotag/sdk/tag_decoder.hh>
#include <iff/fourcc.hh>
#include <memory>
#include <vector>

namespace audiotag {
namespace wav {

// Chunk information
struct chunk_info {
    iff::fourcc id;
    uint64_t offset;  // Offset of the payload in the stream
    uint32_t size;    // Declared payload size, excluding the pad byte
};

// "fmt " chunk data
struct fmt_data {
    uint16_t audio_format = 0;
    channels_t channels = 0;
    sample_rate_t sample_rate = 0;
    uint16_t bits_per_sample = 0;
};

/**
 * @class wav_metadata
 * @brief Technical fields of a PCM WAV file
 *
 * Duration is derived from the size of the "data" chunk. When the audio
 * payload is followed by an ID3v2 tag, its fields are exposed through the
 * tag accessors and get_format() reports its dialect.
 */
class AUDIOTAG_EXPORT wav_metadata : public tagged_metadata {
public:
    wav_metadata(const fmt_data& fmt, uint32_t data_size, duration_t duration,
                 std::vector<chunk_info> chunks, tag_fields tags);

    [[nodiscard]] file_type get_file_type() const override { return file_type::wav; }
    [[nodiscard]] duration_t duration() const override { return m_duration; }

    [[nodiscard]] const fmt_data& get_fmt() const { return m_fmt; }
    [[nodiscard]] uint32_t get_data_size() const { return m_data_size; }

    // Chunks in file order
    [[nodiscard]] const std::vector<chunk_info>& chunks() const { return m_chunks; }

protected:
    [[nodiscard]] raw_map technical_fields() const override;

private:
    fmt_data m_fmt;
    uint32_t m_data_size;
    duration_t m_duration;
    std::vector<chunk_info> m_chunks;
};

/**
 * @brief Walk every chunk of a RIFF/WAVE stream
 *
 * Starts at offset 0 of @p stream and stops at end of stream.
 *
 * @throws format_mismatch_error if "RIFF"/"WAVE" is missing
 * @throws unsupported_format_error if the payload is not PCM
 * @throws io_error on short reads
 */
AUDIOTAG_EXPORT std::unique_ptr<wav_metadata> read(io_stream* stream);

/**
 * @brief Walk the chunks, then decode a tag following the audio
 *
 * @param tags Decoder for the trailing tag
 * @param trailing Tag dialect the identifier found after the audio. An
 *        ID3v2 dialect is decoded from the first byte after the data chunk,
 *        ID3v1 from the last 128 bytes; anything else means "no tag".
 *        RIFF/WAVE streams appended after the audio are looked through
 *        to reach the ID3v2 tag, as identify() does.
 */
AUDIOTAG_EXPORT std::unique_ptr<wav_metadata> read(io_stream* stream, tag_decoder& tags, tag_format trailing);

/**
 * @brief Locate the first byte after the audio payload
 *
 * Performs the same chunk scan as read() but stops right after the "data"
 * chunk and its pad byte. A data chunk that claims more bytes than the
 * stream holds ends at end of stream.
 *
 * @return Absolute offset; the cursor is left there
 * @throws format_mismatch_error if "RIFF"/"WAVE" is missing
 * @throws io_error if the stream ends before a "data" chunk
 */
AUDIOTAG_EXPORT int64_t find_audio_end(io_stream* stream);

/**
 * @brief Locate a tag following the audio payload
 *
 * Like find_audio_end(), but also steps over the 8-byte "id3 " header some
 * encoders (Serato among them) put in front of the trailing tag.
 *
 * @return Absolute offset; the cursor is left there
 */
AUDIOTAG_EXPORT int64_t find_tag_start(io_stream* stream);

} // namespace wav
} // namespace audiotag
