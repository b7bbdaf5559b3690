#include <audiotag/containers/mp4.hh>

namespace audiotag {
namespace mp4 {

mp4_metadata::mp4_metadata(file_type type, tag_fields tags)
    : tagged_metadata(std::move(tags))
    , m_type(type) {
}

std::unique_ptr<mp4_metadata> read(io_stream* stream, file_type type, tag_decoder& tags) {
    tag_fields fields;
    fields.format = tag_format::mp4;

    auto whole = io_sub_stream(stream, 0, stream->get_size());
    tags.decode_mp4(whole.get(), fields);

    return std::make_unique<mp4_metadata>(type, std::move(fields));
}

} // namespace mp4
} // namespace audiotag
