#include <audiotag/containers/wav.hh>
#include <audiotag/containers/id3.hh>
#include <audiotag/sdk/byte_reader.hh>
#include <audiotag/error.hh>
#include <failsafe/failsafe.hh>
#include <chrono>

namespace audiotag {
namespace wav {

// RIFF chunk identifiers
static const iff::fourcc RIFF_ID("RIFF");
static const iff::fourcc WAVE_ID("WAVE");
static const iff::fourcc FMT_ID("fmt ");
static const iff::fourcc DATA_ID("data");

static constexpr uint16_t WAVE_FORMAT_PCM = 1;
static constexpr uint32_t FMT_PCM_SIZE = 16;
static constexpr int64_t VENDOR_ID3_HEADER_SIZE = 8;

namespace {

    // Returns false at a clean end of stream, throws on a partial id
    bool read_chunk_id(io_stream* stream, iff::fourcc& id) {
        char raw[4];
        size_t got = stream->read(raw, sizeof(raw));
        if (got == 0) {
            return false;
        }
        if (got != sizeof(raw)) {
            throw io_error("Truncated RIFF chunk header");
        }
        id = iff::fourcc::from_bytes(raw);
        return true;
    }

    void parse_riff_header(io_stream* stream) {
        seek_to(stream, 0);

        auto magic = read_string(stream, 4);
        if (iff::fourcc(magic.c_str()) != RIFF_ID) {
            throw format_mismatch_error("Chunk header '" + magic + "' does not match expected 'RIFF'");
        }

        // RIFF size is not trusted; the walk ends at end of stream
        skip_bytes(stream, 4);

        auto form = read_string(stream, 4);
        if (iff::fourcc(form.c_str()) != WAVE_ID) {
            throw format_mismatch_error("Filetype '" + form + "' does not match expected 'WAVE'");
        }
    }

    fmt_data parse_fmt_chunk(io_stream* stream, uint32_t size) {
        if (size < FMT_PCM_SIZE) {
            throw format_mismatch_error("fmt chunk too small: " + std::to_string(size));
        }

        fmt_data fmt;
        fmt.audio_format = static_cast<uint16_t>(read_uint_le(stream, 2));
        fmt.channels = static_cast<channels_t>(read_uint_le(stream, 2));
        fmt.sample_rate = static_cast<sample_rate_t>(read_uint_le(stream, 4));
        // byte rate and block align are derived values
        skip_bytes(stream, 6);
        fmt.bits_per_sample = static_cast<uint16_t>(read_uint_le(stream, 2));

        // WAVEFORMATEX / EXTENSIBLE tail
        if (size > FMT_PCM_SIZE) {
            skip_bytes(stream, size - FMT_PCM_SIZE);
        }

        if (fmt.audio_format != WAVE_FORMAT_PCM) {
            throw unsupported_format_error("Unsupported audio format: " + std::to_string(fmt.audio_format) +
                                           " (only PCM format 1 is supported)");
        }
        return fmt;
    }

    duration_t compute_duration(const fmt_data& fmt, uint32_t data_size) {
        uint64_t bytes_per_sample = (fmt.bits_per_sample + 7u) / 8u;
        uint64_t bytes_per_second = static_cast<uint64_t>(fmt.sample_rate) * fmt.channels * bytes_per_sample;
        if (bytes_per_second == 0) {
            return duration_t::zero();
        }
        // data_size < 2^32, so data_size * 1e9 stays inside 64 bits
        auto ns = static_cast<uint64_t>(data_size) * 1000000000ULL / bytes_per_second;
        return duration_t(static_cast<duration_t::rep>(ns));
    }

    // Skip a chunk payload. Returns false if the chunk runs past the end of
    // the stream, leaving the cursor at end of stream.
    bool skip_payload(io_stream* stream, const chunk_info& chunk) {
        auto remaining = remaining_bytes(stream);
        if (remaining >= 0 && static_cast<uint64_t>(remaining) < chunk.size) {
            LOG_WARN("wav", "Chunk", chunk.id.to_string(), "claims", chunk.size,
                     "bytes but only", remaining, "remain");
            seek_to(stream, stream->get_size());
            return false;
        }
        skip_bytes(stream, chunk.size);
        return true;
    }

    // RIFF chunks are word aligned
    void skip_pad(io_stream* stream, uint32_t size) {
        if ((size & 1) && remaining_bytes(stream) != 0) {
            skip_bytes(stream, 1);
        }
    }

    bool at_riff_wave(io_stream* stream) {
        auto head = peek_bytes(stream, 12);
        if (head.size() != 12) {
            return false;
        }
        auto chars = reinterpret_cast<const char*>(head.data());
        return iff::fourcc::from_bytes(chars) == RIFF_ID && iff::fourcc::from_bytes(chars + 8) == WAVE_ID;
    }

    // Offset of the tag after the audio, looking through RIFF/WAVE streams
    // appended after the audio payload. @p raw is false when the tag sits
    // behind an "id3 " chunk header.
    int64_t locate_trailing_tag(io_stream* stream, bool& raw) {
        int64_t start = 0;
        while (true) {
            auto window = io_sub_stream(stream, start, stream->get_size() - start);
            auto audio_end = find_audio_end(window.get());
            auto tag_start = find_tag_start(window.get());

            seek_to(stream, start + tag_start);
            if (tag_start == audio_end && at_riff_wave(stream)) {
                LOG_DEBUG("wav", "Nested RIFF/WAVE at", start + tag_start);
                start += tag_start;
                continue;
            }
            raw = tag_start == audio_end;
            return start + tag_start;
        }
    }

} // anonymous namespace

wav_metadata::wav_metadata(const fmt_data& fmt, uint32_t data_size, duration_t duration,
                           std::vector<chunk_info> chunks, tag_fields tags)
    : tagged_metadata(std::move(tags))
    , m_fmt(fmt)
    , m_data_size(data_size)
    , m_duration(duration)
    , m_chunks(std::move(chunks)) {
}

raw_map wav_metadata::technical_fields() const {
    return {
        {"sample_rate", static_cast<uint64_t>(m_fmt.sample_rate)},
        {"bits_per_sample", static_cast<uint64_t>(m_fmt.bits_per_sample)},
        {"channels", static_cast<uint64_t>(m_fmt.channels)},
        {"data_size", static_cast<uint64_t>(m_data_size)}
    };
}

std::unique_ptr<wav_metadata> read(io_stream* stream, tag_decoder& tags, tag_format trailing) {
    // A tag appended without a chunk header is not part of the chunk walk
    int64_t walk_end = -1;
    int64_t tag_offset = -1;
    if (is_id3v2(trailing)) {
        bool raw = false;
        tag_offset = locate_trailing_tag(stream, raw);
        if (raw) {
            walk_end = tag_offset;
        }
    } else if (trailing == tag_format::id3v1 && id3::has_v1_trailer(stream)) {
        tag_offset = stream->get_size() - id3::v1_tag_size;
        walk_end = tag_offset;
    }

    parse_riff_header(stream);

    fmt_data fmt;
    bool has_fmt = false;
    bool has_data = false;
    uint32_t data_size = 0;
    std::vector<chunk_info> chunks;

    iff::fourcc id;
    while ((walk_end < 0 || stream->tell() < walk_end) && read_chunk_id(stream, id)) {
        chunk_info chunk;
        chunk.id = id;
        chunk.size = static_cast<uint32_t>(read_uint_le(stream, 4));
        chunk.offset = static_cast<uint64_t>(stream->tell());
        chunks.push_back(chunk);

        LOG_DEBUG("wav", "Chunk", chunk.id.to_string(), "at", chunk.offset, "size", chunk.size);

        if (chunk.id == FMT_ID) {
            fmt = parse_fmt_chunk(stream, chunk.size);
            has_fmt = true;
        } else {
            if (chunk.id == DATA_ID) {
                data_size = chunk.size;
                has_data = true;
            }
            if (!skip_payload(stream, chunk)) {
                break;
            }
        }

        skip_pad(stream, chunk.size);
    }

    duration_t duration = duration_t::zero();
    if (has_fmt && has_data) {
        duration = compute_duration(fmt, data_size);
    }

    tag_fields fields;
    if (is_id3v2(trailing)) {
        seek_to(stream, tag_offset);
        auto header = id3::read_v2_header(stream);
        auto remaining = stream->get_size() - tag_offset;
        if (header.total_size() > remaining) {
            throw io_error("ID3v2 tag after audio claims " + std::to_string(header.total_size()) +
                           " bytes, " + std::to_string(remaining) + " available");
        }
        fields.format = trailing;
        auto tag_stream = io_sub_stream(stream, tag_offset, header.total_size());
        tags.decode_id3v2(tag_stream.get(), fields);
    } else if (tag_offset >= 0) {
        fields.format = trailing;
        auto tag_stream = io_sub_stream(stream, tag_offset, id3::v1_tag_size);
        tags.decode_id3v1(tag_stream.get(), fields);
    }

    return std::make_unique<wav_metadata>(fmt, data_size, duration, std::move(chunks), std::move(fields));
}

std::unique_ptr<wav_metadata> read(io_stream* stream) {
    null_tag_decoder none;
    return read(stream, none, tag_format::unknown);
}

int64_t find_audio_end(io_stream* stream) {
    parse_riff_header(stream);

    iff::fourcc id;
    while (true) {
        if (!read_chunk_id(stream, id)) {
            throw io_error("RIFF stream ended before the 'data' chunk");
        }
        chunk_info chunk;
        chunk.id = id;
        chunk.size = static_cast<uint32_t>(read_uint_le(stream, 4));
        chunk.offset = static_cast<uint64_t>(stream->tell());

        if (chunk.id == DATA_ID) {
            if (skip_payload(stream, chunk)) {
                skip_pad(stream, chunk.size);
            }
            return stream->tell();
        }

        if (!skip_payload(stream, chunk)) {
            throw io_error("RIFF stream ended before the 'data' chunk");
        }
        skip_pad(stream, chunk.size);
    }
}

int64_t find_tag_start(io_stream* stream) {
    int64_t offset = find_audio_end(stream);
    auto marker = peek_bytes(stream, 3);
    if (marker.size() == 3 && marker[0] == 'i' && marker[1] == 'd' && marker[2] == '3') {
        skip_bytes(stream, VENDOR_ID3_HEADER_SIZE);
        offset += VENDOR_ID3_HEADER_SIZE;
    }
    return offset;
}

} // namespace wav
} // namespace audiotag
