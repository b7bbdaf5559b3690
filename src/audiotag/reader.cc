#include <audiotag/reader.hh>
#include <audiotag/identify.hh>
#include <audiotag/containers/dsf.hh>
#include <audiotag/containers/flac.hh>
#include <audiotag/containers/mp4.hh>
#include <audiotag/containers/mpeg.hh>
#include <audiotag/containers/ogg.hh>
#include <audiotag/containers/wav.hh>
#include <audiotag/sdk/byte_reader.hh>
#include <audiotag/error.hh>
#include <failsafe/failsafe.hh>

namespace audiotag {

    std::unique_ptr<metadata> read_from(io_stream* stream, tag_decoder& tags, const read_options& options) {
        if (!stream) {
            throw invalid_argument_error("Null stream");
        }

        seek_to(stream, 0);
        auto id = identify(stream, options);
        LOG_INFO("reader", "Reading", to_string(id.type), "container,", to_string(id.format), "tags");

        if (id.format == tag_format::mp4) {
            return mp4::read(stream, id.type, tags);
        }

        switch (id.type) {
            case file_type::flac:
                return flac::read(stream, tags);
            case file_type::ogg:
                return ogg::read(stream, tags);
            case file_type::wav:
                return wav::read(stream, tags, id.format);
            case file_type::dsf:
                return dsf::read(stream, tags);
            case file_type::mp3:
                if (id.format == tag_format::id3v1) {
                    return mpeg::read_v1(stream, stream->get_size(), tags);
                }
                return mpeg::read_v2(stream, stream->get_size(), tags);
            default:
                break;
        }
        throw no_tags_found_error("No reader for this stream");
    }

} // namespace audiotag
