#include <audiotag/identify.hh>
#include <audiotag/containers/id3.hh>
#include <audiotag/containers/wav.hh>
#include <audiotag/sdk/byte_reader.hh>
#include <audiotag/error.hh>
#include <failsafe/failsafe.hh>
#include <cstring>
#include <optional>
#include <vector>

namespace audiotag {

    namespace {

        constexpr std::size_t PEEK_SIZE = 12;

        bool matches(const std::vector<uint8_t>& head, std::size_t offset, const char* magic) {
            auto len = std::strlen(magic);
            return head.size() >= offset + len && std::memcmp(head.data() + offset, magic, len) == 0;
        }

        file_type mp4_subtype(const std::vector<uint8_t>& head) {
            if (matches(head, 8, "M4A")) {
                return file_type::m4a;
            }
            if (matches(head, 8, "M4B")) {
                return file_type::m4b;
            }
            if (matches(head, 8, "M4P")) {
                return file_type::m4p;
            }
            return file_type::unknown;
        }

        // Signatures found at the start of the stream, RIFF/WAVE excluded
        std::optional<identification> match_prefix(const std::vector<uint8_t>& head) {
            if (matches(head, 0, "fLaC")) {
                return identification{tag_format::vorbis, file_type::flac};
            }
            if (matches(head, 0, "OggS")) {
                return identification{tag_format::vorbis, file_type::ogg};
            }
            if (matches(head, 4, "ftyp")) {
                return identification{tag_format::mp4, mp4_subtype(head)};
            }
            if (matches(head, 0, "ID3") && head.size() > 3) {
                return identification{id3::v2_format(head[3]), file_type::mp3};
            }
            return std::nullopt;
        }

        bool is_riff_wave(const std::vector<uint8_t>& head) {
            return matches(head, 0, "RIFF") && matches(head, 8, "WAVE");
        }

        identification match_trailer(io_stream* stream) {
            if (id3::has_v1_trailer(stream)) {
                return identification{tag_format::id3v1, file_type::mp3};
            }
            throw no_tags_found_error("No recognisable signature or ID3v1 trailer");
        }

        // Move the cursor past the audio payload of the RIFF/WAVE stream
        // starting at the cursor
        void skip_wav_audio(io_stream* stream) {
            auto start = stream->tell();
            auto riff = io_sub_stream(stream, start, stream->get_size() - start);
            try {
                auto tag_start = wav::find_tag_start(riff.get());
                seek_to(stream, start + tag_start);
            } catch (audiotag_error& e) {
                e.set_container_hint(file_type::wav);
                throw;
            }
        }

    } // anonymous namespace

    identification identify(io_stream* stream, const read_options& options) {
        unsigned depth = 0;

        while (true) {
            auto head = peek_bytes(stream, PEEK_SIZE);
            identification result;

            if (depth > 0 && head.empty()) {
                LOG_DEBUG("identify", "Nothing follows the WAV audio payload");
                return identification{tag_format::unknown, file_type::wav};
            }

            try {
                if (auto found = match_prefix(head)) {
                    result = *found;
                } else if (matches(head, 0, "DSD ")) {
                    result = identification{tag_format::unknown, file_type::dsf};
                } else if (is_riff_wave(head)) {
                    if (depth >= options.max_wav_wrap_depth) {
                        auto error = unsupported_format_error("RIFF/WAVE nested more than " +
                                                              std::to_string(options.max_wav_wrap_depth) +
                                                              " levels deep");
                        error.set_container_hint(file_type::wav);
                        throw error;
                    }
                    skip_wav_audio(stream);
                    depth++;
                    continue;
                } else {
                    result = match_trailer(stream);
                }
            } catch (audiotag_error& e) {
                if (depth == 0) {
                    throw;
                }
                if (e.kind() == error_kind::no_tags_found) {
                    LOG_DEBUG("identify", "No tag after the WAV audio payload");
                    return identification{tag_format::unknown, file_type::wav};
                }
                e.set_container_hint(file_type::wav);
                throw;
            }

            if (depth > 0) {
                result.type = file_type::wav;
            }
            LOG_DEBUG("identify", "Identified", to_string(result.type), "with", to_string(result.format), "tags");
            return result;
        }
    }

} // namespace audiotag
