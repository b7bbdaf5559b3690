#include <audiotag/containers/mpeg.hh>
#include <audiotag/containers/id3.hh>
#include <audiotag/sdk/byte_reader.hh>
#include <audiotag/sdk/bits.hh>
#include <audiotag/error.hh>
#include <failsafe/failsafe.hh>
#include <chrono>
#include <cmath>

namespace audiotag {
namespace mpeg {

namespace {

    constexpr std::size_t VERSIONS = 4;
    constexpr std::size_t LAYERS = 4;
    constexpr std::size_t BITRATE_INDICES = 15;
    constexpr std::size_t SAMPLE_RATE_INDICES = 3;

    // kbps, [version][layer][index]
    constexpr unsigned BITRATES[VERSIONS][LAYERS][BITRATE_INDICES] = {
        { // MPEG 2.5
            {0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0},
            {0, 8, 16, 24, 32, 40, 48, 56, 64, 80, 96, 112, 128, 144, 160},
            {0, 8, 16, 24, 32, 40, 48, 56, 64, 80, 96, 112, 128, 144, 160},
            {0, 32, 48, 56, 64, 80, 96, 112, 128, 144, 160, 176, 192, 224, 256},
        },
        { // reserved
            {0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0},
            {0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0},
            {0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0},
            {0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0},
        },
        { // MPEG 2
            {0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0},
            {0, 8, 16, 24, 32, 40, 48, 56, 64, 80, 96, 112, 128, 144, 160},
            {0, 8, 16, 24, 32, 40, 48, 56, 64, 80, 96, 112, 128, 144, 160},
            {0, 32, 48, 56, 64, 80, 96, 112, 128, 144, 160, 176, 192, 224, 256},
        },
        { // MPEG 1
            {0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0},
            {0, 32, 40, 48, 56, 64, 80, 96, 112, 128, 160, 192, 224, 256, 320},
            {0, 32, 48, 56, 64, 80, 96, 112, 128, 160, 192, 224, 256, 320, 384},
            {0, 32, 64, 96, 128, 160, 192, 224, 256, 288, 320, 352, 384, 416, 448},
        },
    };

    constexpr sample_rate_t SAMPLE_RATES[VERSIONS][SAMPLE_RATE_INDICES] = {
        {11025, 12000, 8000},
        {0, 0, 0},
        {22050, 24000, 16000},
        {44100, 48000, 32000},
    };

    constexpr unsigned SAMPLES_PER_FRAME[VERSIONS][LAYERS] = {
        {0, 576, 1152, 384},
        {0, 0, 0, 0},
        {0, 576, 1152, 384},
        {0, 1152, 1152, 384},
    };

    constexpr unsigned SLOT_SIZES[LAYERS] = {0, 1, 1, 4};

    bool has_sync(const uint8_t* header) {
        return header[0] == 0xFF && (header[1] & 0xE0) == 0xE0;
    }

    std::unique_ptr<mp3_metadata> read_first_frame(io_stream* stream, int64_t offset, int64_t stripped_size,
                                                   tag_fields fields) {
        seek_to(stream, offset);
        uint8_t raw[frame_header_size];
        read_exact(stream, raw, sizeof(raw));

        if (!has_sync(raw)) {
            LOG_WARN("mpeg", "No frame sync at offset", offset, ", decoding header anyway");
        }

        auto header = decode_header(raw);
        auto duration = compute_duration(raw, stripped_size);
        LOG_DEBUG("mpeg", "First frame:", header.bitrate_kbps, "kbps,", header.sample_rate, "Hz, duration",
                  std::chrono::duration_cast<std::chrono::seconds>(duration).count(), "s");
        return std::make_unique<mp3_metadata>(header, stripped_size, duration, std::move(fields));
    }

} // anonymous namespace

double frame_header::frame_duration() const {
    return static_cast<double>(samples_per_frame) / static_cast<double>(sample_rate);
}

int64_t frame_header::frame_size() const {
    double size = std::floor(((frame_duration() * bitrate_kbps) * 1000) / 8);
    if (padding) {
        size += slot_size;
    }
    // Polarity kept from existing data: a set bit adds the CRC word
    if (protection) {
        size += 2;
    }
    size += frame_header_size;
    return static_cast<int64_t>(size);
}

frame_header decode_header(const uint8_t* header) {
    auto ver = cut_bits(header, frame_header_size, 11, 2);
    auto lay = cut_bits(header, frame_header_size, 13, 2);
    auto protection = cut_bits(header, frame_header_size, 15, 1);
    auto bitrate_index = cut_bits(header, frame_header_size, 16, 4);
    auto sample_rate_index = cut_bits(header, frame_header_size, 20, 2);
    auto padding = cut_bits(header, frame_header_size, 21, 1);

    if (static_cast<version>(ver) == version::reserved) {
        throw unsupported_format_error("Reserved MPEG version");
    }
    if (static_cast<layer>(lay) == layer::reserved) {
        throw unsupported_format_error("Reserved MPEG layer");
    }
    if (bitrate_index >= BITRATE_INDICES) {
        throw unsupported_format_error("Invalid MPEG bitrate index: " + std::to_string(bitrate_index));
    }
    if (sample_rate_index >= SAMPLE_RATE_INDICES) {
        throw unsupported_format_error("Reserved MPEG sample rate index");
    }

    frame_header result;
    result.ver = static_cast<version>(ver);
    result.lay = static_cast<layer>(lay);
    result.protection = protection == 1;
    result.bitrate_kbps = BITRATES[ver][lay][bitrate_index];
    result.sample_rate = SAMPLE_RATES[ver][sample_rate_index];
    result.samples_per_frame = SAMPLES_PER_FRAME[ver][lay];
    result.padding = padding == 1;
    result.slot_size = SLOT_SIZES[lay];

    // Free format streams have no fixed frame size to divide by
    if (result.bitrate_kbps == 0) {
        throw unsupported_format_error("Free format MPEG stream");
    }
    return result;
}

duration_t compute_duration(const uint8_t* header, int64_t stripped_size) {
    auto frame = decode_header(header);
    double seconds = std::round((static_cast<double>(stripped_size) / static_cast<double>(frame.frame_size())) *
                                frame.frame_duration());
    return std::chrono::seconds(static_cast<int64_t>(seconds));
}

mp3_metadata::mp3_metadata(const frame_header& header, int64_t audio_size, duration_t duration, tag_fields tags)
    : tagged_metadata(std::move(tags))
    , m_header(header)
    , m_audio_size(audio_size)
    , m_duration(duration) {
}

raw_map mp3_metadata::technical_fields() const {
    return {
        {"sample_rate", static_cast<uint64_t>(m_header.sample_rate)},
        {"bitrate", static_cast<uint64_t>(m_header.bitrate_kbps)},
        {"samples_per_frame", static_cast<uint64_t>(m_header.samples_per_frame)},
        {"frame_size", static_cast<uint64_t>(m_header.frame_size())},
        {"audio_size", static_cast<uint64_t>(m_audio_size)}
    };
}

std::unique_ptr<mp3_metadata> read_v2(io_stream* stream, int64_t total_size, tag_decoder& tags) {
    seek_to(stream, 0);
    auto header = id3::read_v2_header(stream);
    auto tag_size = header.total_size();
    if (tag_size > total_size) {
        throw io_error("ID3v2 tag claims " + std::to_string(tag_size) + " bytes of a " +
                       std::to_string(total_size) + " byte stream");
    }

    tag_fields fields;
    fields.format = id3::v2_format(header.major_version);
    auto tag_stream = io_sub_stream(stream, 0, tag_size);
    tags.decode_id3v2(tag_stream.get(), fields);

    return read_first_frame(stream, tag_size, total_size - tag_size, std::move(fields));
}

std::unique_ptr<mp3_metadata> read_v1(io_stream* stream, int64_t total_size, tag_decoder& tags) {
    if (!id3::has_v1_trailer(stream)) {
        throw no_tags_found_error("No ID3v1 trailer");
    }

    tag_fields fields;
    fields.format = tag_format::id3v1;
    auto tag_stream = io_sub_stream(stream, total_size - id3::v1_tag_size, id3::v1_tag_size);
    tags.decode_id3v1(tag_stream.get(), fields);

    return read_first_frame(stream, 0, total_size - id3::v1_tag_size, std::move(fields));
}

} // namespace mpeg
} // namespace audiotag
