#include <audiotag/containers/ogg.hh>
#include <audiotag/sdk/byte_reader.hh>
#include <audiotag/sdk/endian.hh>
#include <audiotag/error.hh>
#include <failsafe/failsafe.hh>
#include <cstring>
#include <limits>

namespace audiotag {
namespace ogg {

static constexpr uint32_t CRC_POLY = 0x04C11DB7;
static constexpr uint32_t OPUS_SAMPLE_RATE = 48000;
static constexpr uint8_t MAX_SEGMENT_SIZE = 255;

// Offsets inside the fixed page header
static constexpr std::size_t CRC_OFFSET = 22;

static const std::string VORBIS_IDENT_PREFIX("\x01vorbis", 7);
static const std::string VORBIS_COMMENT_PREFIX("\x03vorbis", 7);
static const std::string OPUS_TAGS_PREFIX("OpusTags");

// Largest whole second count representable by duration_t
static constexpr uint64_t MAX_WHOLE_SECONDS =
    static_cast<uint64_t>(std::numeric_limits<duration_t::rep>::max()) / 1000000000ULL - 1;

namespace {

    struct crc_table {
        uint32_t entries[256];

        constexpr crc_table() : entries() {
            for (uint32_t i = 0; i < 256; i++) {
                uint32_t crc = i << 24;
                for (int j = 0; j < 8; j++) {
                    crc = (crc & 0x80000000u) ? (crc << 1) ^ CRC_POLY : (crc << 1);
                }
                entries[i] = crc;
            }
        }
    };

    constexpr crc_table CRC_TABLE;

    bool has_prefix(const std::vector<uint8_t>& packet, const std::string& prefix) {
        return packet.size() >= prefix.size() &&
               std::memcmp(packet.data(), prefix.data(), prefix.size()) == 0;
    }

    sample_rate_t parse_vorbis_identification(const std::vector<uint8_t>& packet) {
        // vorbis_version (4) and audio_channels (1) precede the rate
        auto body = io_from_memory(packet.data() + VORBIS_IDENT_PREFIX.size(),
                                   packet.size() - VORBIS_IDENT_PREFIX.size());
        skip_bytes(body.get(), 5);
        return static_cast<sample_rate_t>(read_uint_le(body.get(), 4));
    }

} // anonymous namespace

uint32_t crc32(const uint8_t* data, std::size_t size, uint32_t crc) {
    for (std::size_t i = 0; i < size; i++) {
        crc = (crc << 8) ^ CRC_TABLE.entries[((crc >> 24) ^ data[i]) & 0xFF];
    }
    return crc;
}

std::optional<page> demuxer::read_page(io_stream* stream) {
    uint8_t raw[page_header_size];
    size_t got = stream->read(raw, sizeof(raw));
    if (got == 0) {
        return std::nullopt;
    }
    if (got != sizeof(raw)) {
        throw io_error("Truncated OGG page header: " + std::to_string(got) + " bytes");
    }

    if (std::memcmp(raw, "OggS", 4) != 0) {
        throw format_mismatch_error("Expected 'OggS'");
    }

    page result;
    auto& header = result.header;
    header.version = raw[4];
    header.flags = raw[5];
    header.granule_position = load64le(raw + 6);
    header.serial = load32le(raw + 14);
    header.sequence = load32le(raw + 18);
    header.crc = load32le(raw + CRC_OFFSET);
    header.segments = raw[26];

    std::vector<uint8_t> segment_table(header.segments);
    read_exact(stream, segment_table.data(), segment_table.size());

    std::size_t data_size = 0;
    for (auto s : segment_table) {
        data_size += s;
    }
    auto data = read_bytes(stream, data_size);

    std::memset(raw + CRC_OFFSET, 0, 4);
    uint32_t crc = crc32(raw, sizeof(raw));
    crc = crc32(segment_table.data(), segment_table.size(), crc);
    crc = crc32(data.data(), data.size(), crc);
    if (crc != header.crc) {
        LOG_WARN("ogg", "CRC mismatch on page", header.sequence, "of stream", header.serial);
        throw checksum_error("OGG page CRC expected " + std::to_string(header.crc) +
                             ", computed " + std::to_string(crc));
    }

    std::vector<uint8_t> packet;
    if (header.continued()) {
        auto it = m_pending.find(header.serial);
        if (it == m_pending.end()) {
            throw orphaned_continuation_error("Continued page for unknown stream " +
                                              std::to_string(header.serial));
        }
        packet = std::move(it->second);
    }

    std::size_t pos = 0;
    for (auto s : segment_table) {
        packet.insert(packet.end(), data.begin() + static_cast<std::ptrdiff_t>(pos),
                      data.begin() + static_cast<std::ptrdiff_t>(pos + s));
        pos += s;
        if (s < MAX_SEGMENT_SIZE) {
            result.packets.push_back(std::move(packet));
            packet.clear();
        }
    }
    m_pending[header.serial] = std::move(packet);

    return result;
}

bool demuxer::knows(uint32_t serial) const {
    return m_pending.find(serial) != m_pending.end();
}

std::size_t demuxer::pending_size(uint32_t serial) const {
    auto it = m_pending.find(serial);
    return it == m_pending.end() ? 0 : it->second.size();
}

ogg_metadata::ogg_metadata(sample_rate_t sample_rate, uint64_t granule_position, std::string codec,
                           std::set<uint32_t> serials, tag_fields tags)
    : tagged_metadata(std::move(tags))
    , m_sample_rate(sample_rate)
    , m_granule_position(granule_position)
    , m_codec(std::move(codec))
    , m_serials(std::move(serials)) {
}

duration_t ogg_metadata::duration() const {
    if (m_sample_rate == 0) {
        return duration_t::zero();
    }
    uint64_t seconds = m_granule_position / m_sample_rate;
    uint64_t rest = m_granule_position % m_sample_rate;
    if (seconds > MAX_WHOLE_SECONDS) {
        LOG_WARN("ogg", "Duration of", seconds, "s does not fit, saturating");
        return duration_t::max();
    }
    auto ns = seconds * 1000000000ULL + rest * 1000000000ULL / m_sample_rate;
    return duration_t(static_cast<duration_t::rep>(ns));
}

raw_map ogg_metadata::technical_fields() const {
    std::string serials;
    for (auto serial : m_serials) {
        if (!serials.empty()) {
            serials += ',';
        }
        serials += std::to_string(serial);
    }
    return {
        {"sample_rate", static_cast<uint64_t>(m_sample_rate)},
        {"codec", m_codec},
        {"serials", serials}
    };
}

std::unique_ptr<ogg_metadata> read(io_stream* stream, tag_decoder& tags) {
    seek_to(stream, 0);

    demuxer session;
    tag_fields fields;
    fields.format = tag_format::vorbis;

    bool comment_found = false;
    sample_rate_t sample_rate = 0;
    uint64_t position = 0;
    std::string codec;
    std::set<uint32_t> serials;

    while (auto current = session.read_page(stream)) {
        serials.insert(current->header.serial);
        if (current->header.granule_position != no_granule) {
            position = current->header.granule_position;
        }

        for (const auto& packet : current->packets) {
            if (has_prefix(packet, VORBIS_COMMENT_PREFIX)) {
                comment_found = true;
                codec = "vorbis";
                auto body = io_from_memory(packet.data() + VORBIS_COMMENT_PREFIX.size(),
                                           packet.size() - VORBIS_COMMENT_PREFIX.size());
                tags.decode_vorbis_comment(body.get(), fields);
            } else if (has_prefix(packet, OPUS_TAGS_PREFIX)) {
                comment_found = true;
                codec = "opus";
                auto body = io_from_memory(packet.data() + OPUS_TAGS_PREFIX.size(),
                                           packet.size() - OPUS_TAGS_PREFIX.size());
                tags.decode_vorbis_comment(body.get(), fields);
                sample_rate = OPUS_SAMPLE_RATE;
            } else if (has_prefix(packet, VORBIS_IDENT_PREFIX)) {
                codec = "vorbis";
                sample_rate = parse_vorbis_identification(packet);
                LOG_DEBUG("ogg", "Vorbis stream", current->header.serial, "at", sample_rate, "Hz");
            }
        }
    }

    if (!comment_found) {
        throw no_tags_found_error("No Vorbis comment or OpusTags packet in OGG stream");
    }
    if (sample_rate == 0) {
        LOG_WARN("ogg", "No sample rate found, duration unknown");
    }

    return std::make_unique<ogg_metadata>(sample_rate, position, std::move(codec),
                                          std::move(serials), std::move(fields));
}

} // namespace ogg
} // namespace audiotag
