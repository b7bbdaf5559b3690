#include <audiotag/containers/flac.hh>
#include <audiotag/sdk/byte_reader.hh>
#include <audiotag/sdk/bits.hh>
#include <audiotag/error.hh>
#include <failsafe/failsafe.hh>
#include <limits>

namespace audiotag {
namespace flac {

static constexpr uint8_t LAST_BLOCK_FLAG = 0x80;
static constexpr uint8_t BLOCK_TYPE_MASK = 0x7F;

// Bit positions inside the STREAMINFO payload
static constexpr unsigned SAMPLE_RATE_OFFSET = 80;
static constexpr unsigned SAMPLE_RATE_BITS = 20;
static constexpr unsigned CHANNELS_OFFSET = 100;
static constexpr unsigned CHANNELS_BITS = 3;
static constexpr unsigned BPS_OFFSET = 103;
static constexpr unsigned BPS_BITS = 5;
static constexpr unsigned TOTAL_SAMPLES_OFFSET = 108;
static constexpr unsigned TOTAL_SAMPLES_BITS = 36;
static constexpr uint32_t STREAM_INFO_MIN_SIZE = (TOTAL_SAMPLES_OFFSET + TOTAL_SAMPLES_BITS) / 8;

const char* to_string(block_type type) {
    switch (type) {
        case block_type::stream_info: return "STREAMINFO";
        case block_type::padding: return "PADDING";
        case block_type::application: return "APPLICATION";
        case block_type::seek_table: return "SEEKTABLE";
        case block_type::vorbis_comment: return "VORBIS_COMMENT";
        case block_type::cue_sheet: return "CUESHEET";
        case block_type::picture: return "PICTURE";
    }
    return "RESERVED";
}

// Largest whole second count representable by duration_t
static constexpr uint64_t MAX_WHOLE_SECONDS =
    static_cast<uint64_t>(std::numeric_limits<duration_t::rep>::max()) / 1000000000ULL - 1;

namespace {

    stream_info parse_stream_info(io_stream* stream, uint32_t length) {
        if (length < STREAM_INFO_MIN_SIZE) {
            throw format_mismatch_error("STREAMINFO block too small: " + std::to_string(length));
        }
        auto payload = read_bytes(stream, length);

        stream_info info;
        info.sample_rate = static_cast<sample_rate_t>(cut_bits(payload, SAMPLE_RATE_OFFSET, SAMPLE_RATE_BITS));
        info.channels = static_cast<channels_t>(cut_bits(payload, CHANNELS_OFFSET, CHANNELS_BITS) + 1);
        info.bits_per_sample = static_cast<uint16_t>(cut_bits(payload, BPS_OFFSET, BPS_BITS) + 1);
        info.total_samples = cut_bits(payload, TOTAL_SAMPLES_OFFSET, TOTAL_SAMPLES_BITS);

        if (info.sample_rate == 0) {
            LOG_WARN("flac", "STREAMINFO has a zero sample rate, duration unknown");
        }
        return info;
    }

    // Hand a block payload to a tag decoder, then step past it regardless of
    // how much the decoder consumed
    template<typename Decode>
    void decode_block(io_stream* stream, const block_info& block, Decode&& decode) {
        auto remaining = remaining_bytes(stream);
        if (remaining >= 0 && static_cast<uint64_t>(remaining) < block.length) {
            throw io_error("FLAC block claims " + std::to_string(block.length) +
                           " bytes, " + std::to_string(remaining) + " available");
        }
        auto window = io_sub_stream(stream, static_cast<int64_t>(block.offset), block.length);
        decode(window.get());
        seek_to(stream, static_cast<int64_t>(block.offset + block.length));
    }

} // anonymous namespace

flac_metadata::flac_metadata(const stream_info& info, std::vector<block_info> blocks, tag_fields tags)
    : tagged_metadata(std::move(tags))
    , m_info(info)
    , m_blocks(std::move(blocks)) {
}

duration_t flac_metadata::duration() const {
    if (m_info.sample_rate == 0) {
        return duration_t::zero();
    }
    // Split to keep total_samples * 1e9 from overflowing
    uint64_t seconds = m_info.total_samples / m_info.sample_rate;
    uint64_t rest = m_info.total_samples % m_info.sample_rate;
    if (seconds > MAX_WHOLE_SECONDS) {
        LOG_WARN("flac", "Duration of", seconds, "s does not fit, saturating");
        return duration_t::max();
    }
    auto ns = seconds * 1000000000ULL + rest * 1000000000ULL / m_info.sample_rate;
    return duration_t(static_cast<duration_t::rep>(ns));
}

raw_map flac_metadata::technical_fields() const {
    std::string names;
    for (const auto& block : m_blocks) {
        if (!names.empty()) {
            names += ',';
        }
        names += to_string(static_cast<block_type>(block.type));
    }
    return {
        {"sample_rate", static_cast<uint64_t>(m_info.sample_rate)},
        {"channels", static_cast<uint64_t>(m_info.channels)},
        {"bits_per_sample", static_cast<uint64_t>(m_info.bits_per_sample)},
        {"total_samples", m_info.total_samples},
        {"blocks", names}
    };
}

std::unique_ptr<flac_metadata> read(io_stream* stream, tag_decoder& tags) {
    seek_to(stream, 0);

    auto magic = read_string(stream, 4);
    if (magic != "fLaC") {
        throw format_mismatch_error("Expected 'fLaC', got '" + magic + "'");
    }

    stream_info info;
    std::vector<block_info> blocks;
    tag_fields fields;
    fields.format = tag_format::vorbis;

    bool last = false;
    while (!last) {
        auto flags = static_cast<uint8_t>(read_uint_be(stream, 1));
        uint8_t raw_length[3];
        read_exact(stream, raw_length, sizeof(raw_length));

        block_info block;
        block.type = flags & BLOCK_TYPE_MASK;
        block.last = (flags & LAST_BLOCK_FLAG) != 0;
        block.length = static_cast<uint32_t>(get_chunked_value(raw_length, sizeof(raw_length)));
        block.offset = static_cast<uint64_t>(stream->tell());
        blocks.push_back(block);
        last = block.last;

        LOG_DEBUG("flac", "Block", to_string(static_cast<block_type>(block.type)),
                  "at", block.offset, "length", block.length, block.last ? "(last)" : "");

        switch (static_cast<block_type>(block.type)) {
            case block_type::stream_info:
                info = parse_stream_info(stream, block.length);
                break;
            case block_type::vorbis_comment:
                decode_block(stream, block, [&](io_stream* s) { tags.decode_vorbis_comment(s, fields); });
                break;
            case block_type::picture:
                decode_block(stream, block, [&](io_stream* s) { tags.decode_flac_picture(s, fields); });
                break;
            default:
                skip_bytes(stream, block.length);
                break;
        }
    }

    return std::make_unique<flac_metadata>(info, std::move(blocks), std::move(fields));
}

} // namespace flac
} // namespace audiotag
