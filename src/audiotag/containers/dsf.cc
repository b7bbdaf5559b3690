#include <audiotag/containers/dsf.hh>
#include <audiotag/containers/id3.hh>
#include <audiotag/sdk/byte_reader.hh>
#include <audiotag/sdk/endian.hh>
#include <audiotag/error.hh>
#include <failsafe/failsafe.hh>
#include <chrono>

namespace audiotag {
namespace dsf {

// Chunk size and total file size of the "DSD " chunk
static constexpr uint64_t DSD_CHUNK_SIZES = 16;
// "fmt " chunk up to and including the channel count
static constexpr std::size_t FMT_PREFIX_SIZE = 28;
static constexpr std::size_t CHANNEL_NUM_OFFSET = 24;

dsf_metadata::dsf_metadata(const header& hdr, tag_fields tags)
    : tagged_metadata(std::move(tags))
    , m_header(hdr) {
}

duration_t dsf_metadata::duration() const {
    if (m_header.sample_rate == 0) {
        return duration_t::zero();
    }
    return std::chrono::seconds(static_cast<int64_t>(m_header.sample_count / m_header.sample_rate));
}

raw_map dsf_metadata::technical_fields() const {
    return {
        {"sample_rate", static_cast<uint64_t>(m_header.sample_rate)},
        {"channels", static_cast<uint64_t>(m_header.channels)},
        {"bits_per_sample", static_cast<uint64_t>(m_header.bits_per_sample)},
        {"sample_count", m_header.sample_count}
    };
}

std::unique_ptr<dsf_metadata> read(io_stream* stream, tag_decoder& tags) {
    seek_to(stream, 0);

    auto magic = read_string(stream, 4);
    if (magic != "DSD ") {
        throw format_mismatch_error("Expected 'DSD ', got '" + magic + "'");
    }
    skip_bytes(stream, DSD_CHUNK_SIZES);

    header hdr;
    hdr.tag_offset = read_uint_le(stream, 8);

    auto fmt = read_bytes(stream, FMT_PREFIX_SIZE);
    hdr.channels = static_cast<channels_t>(load32le(fmt.data() + CHANNEL_NUM_OFFSET));
    hdr.sample_rate = static_cast<sample_rate_t>(read_uint_le(stream, 4));
    hdr.bits_per_sample = static_cast<uint32_t>(read_uint_le(stream, 4));
    hdr.sample_count = read_uint_le(stream, 8);

    if (hdr.sample_rate == 0) {
        LOG_WARN("dsf", "Zero sample rate, duration unknown");
    }

    tag_fields fields;
    if (hdr.tag_offset == 0) {
        LOG_DEBUG("dsf", "No metadata chunk");
    } else {
        auto tag_offset = static_cast<int64_t>(hdr.tag_offset);
        seek_to(stream, tag_offset);
        auto tag_header = id3::read_v2_header(stream);
        auto available = stream->get_size() - tag_offset;
        if (tag_header.total_size() > available) {
            throw io_error("ID3v2 tag claims " + std::to_string(tag_header.total_size()) +
                           " bytes, " + std::to_string(available) + " available");
        }
        fields.format = id3::v2_format(tag_header.major_version);
        auto tag_stream = io_sub_stream(stream, tag_offset, tag_header.total_size());
        tags.decode_id3v2(tag_stream.get(), fields);
    }

    return std::make_unique<dsf_metadata>(hdr, std::move(fields));
}

} // namespace dsf
} // namespace audiotag
