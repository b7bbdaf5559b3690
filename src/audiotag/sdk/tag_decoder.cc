#include <audiotag/sdk/tag_decoder.hh>

namespace audiotag {

    tag_decoder::~tag_decoder() = default;

    void null_tag_decoder::decode_id3v2(io_stream*, tag_fields&) {
    }

    void null_tag_decoder::decode_id3v1(io_stream*, tag_fields&) {
    }

    void null_tag_decoder::decode_vorbis_comment(io_stream*, tag_fields&) {
    }

    void null_tag_decoder::decode_flac_picture(io_stream*, tag_fields&) {
    }

    void null_tag_decoder::decode_mp4(io_stream*, tag_fields&) {
    }

} // namespace audiotag
