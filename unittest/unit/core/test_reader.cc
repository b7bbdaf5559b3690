#include <doctest/doctest.h>
#include <audiotag/reader.hh>
#include <audiotag/containers/flac.hh>
#include <audiotag/containers/ogg.hh>
#include <audiotag/containers/wav.hh>
#include <audiotag/error.hh>
#include "../../test_helpers.hh"
#include <chrono>

using namespace audiotag;
using namespace audiotag::test;
using namespace std::chrono_literals;

namespace {
    bytes create_test_flac(uint32_t rate, uint64_t total_samples) {
        bytes out;
        append(out, "fLaC");
        append(out, flac_block(0, stream_info_payload(rate, 2, 16, total_samples), false));
        bytes comment;
        append(comment, "vendor");
        append(out, flac_block(4, comment, true));
        out.push_back(0xFF);
        out.push_back(0xF8);
        return out;
    }

    bytes create_test_ogg(uint32_t rate, uint64_t granule) {
        bytes out;
        auto ident = vorbis_ident_packet(rate);
        auto comment = vorbis_comment_packet("comment body");
        append(out, ogg_page(0x02, 0, 1, 0, lacing_for(ident.size()), ident));
        append(out, ogg_page(0, 0, 1, 1, lacing_for(comment.size()), comment));
        append(out, ogg_page(0x04, granule, 1, 2, lacing_for(8), bytes(8, 0)));
        return out;
    }

    std::unique_ptr<metadata> read_bytes_with(const bytes& data, tag_decoder& decoder) {
        auto stream = io_from_memory(data.data(), data.size());
        return read_from(stream.get(), decoder);
    }
}

TEST_SUITE("Core::Reader") {
    TEST_CASE("FLAC") {
        recording_tag_decoder decoder;
        auto meta = read_bytes_with(create_test_flac(44100, 44100 * 7), decoder);

        CHECK(meta->get_file_type() == file_type::flac);
        CHECK(meta->get_format() == tag_format::vorbis);
        CHECK(meta->duration() == 7s);
        CHECK(meta->get_artist() == "vorbis artist");
        CHECK(dynamic_cast<flac::flac_metadata*>(meta.get()) != nullptr);
    }

    TEST_CASE("OGG") {
        recording_tag_decoder decoder;
        auto meta = read_bytes_with(create_test_ogg(44100, 44100 * 4), decoder);

        CHECK(meta->get_file_type() == file_type::ogg);
        CHECK(meta->duration() == 4s);
        CHECK(dynamic_cast<ogg::ogg_metadata*>(meta.get()) != nullptr);
        REQUIRE(decoder.calls.size() == 1);
        CHECK(decoder.calls[0].method == "vorbis_comment");
    }

    TEST_CASE("WAV") {
        recording_tag_decoder decoder;

        SUBCASE("Plain") {
            auto meta = read_bytes_with(create_test_wav(44100, 2, 16, 44100 * 5), decoder);
            CHECK(meta->get_file_type() == file_type::wav);
            CHECK(meta->get_format() == tag_format::unknown);
            CHECK(meta->duration() == 5s);
            CHECK(decoder.calls.empty());
            CHECK(dynamic_cast<wav::wav_metadata*>(meta.get()) != nullptr);
        }

        SUBCASE("With a trailing ID3v2 tag") {
            auto data = create_test_wav(8000, 1, 8, 8000 * 2);
            auto tag = create_id3v2(3, 30);
            append(data, tag);
            auto meta = read_bytes_with(data, decoder);
            CHECK(meta->get_file_type() == file_type::wav);
            CHECK(meta->get_format() == tag_format::id3v2_3);
            CHECK(meta->duration() == 2s);
            CHECK(meta->get_title() == "id3v2 title");
            REQUIRE(decoder.calls.size() == 1);
            CHECK(decoder.calls[0].region == tag);
        }

        SUBCASE("ID3v2 tag behind a nested RIFF/WAVE stream") {
            auto data = create_test_wav(8000, 1, 8, 8000 * 3);
            append(data, create_test_wav(8000, 1, 8, 100));
            auto tag = create_id3v2(3, 16);
            append(data, tag);
            auto meta = read_bytes_with(data, decoder);
            CHECK(meta->get_file_type() == file_type::wav);
            CHECK(meta->get_format() == tag_format::id3v2_3);
            CHECK(meta->duration() == 3s);
            REQUIRE(decoder.calls.size() == 1);
            CHECK(decoder.calls[0].region == tag);
        }

        SUBCASE("With an ID3v1 trailer") {
            auto data = create_test_wav(8000, 1, 8, 8000);
            append(data, create_id3v1("Title"));
            auto meta = read_bytes_with(data, decoder);
            CHECK(meta->get_format() == tag_format::id3v1);
            CHECK(meta->duration() == 1s);
            CHECK(meta->get_title() == "id3v1 title");
        }
    }

    TEST_CASE("DSF") {
        recording_tag_decoder decoder;
        auto meta = read_bytes_with(create_test_dsf(2822400, 2822400 * 3, 2, create_id3v2(4, 20)), decoder);

        CHECK(meta->get_file_type() == file_type::dsf);
        CHECK(meta->get_format() == tag_format::id3v2_4);
        CHECK(meta->duration() == 3s);
    }

    TEST_CASE("MP3") {
        recording_tag_decoder decoder;
        auto frame = mpeg_header(3, 1, 0, 9, 0);

        SUBCASE("Leading ID3v2") {
            auto data = create_id3v2(3, 90);
            append(data, frame);
            data.resize(100 + 42100, 0);
            auto meta = read_bytes_with(data, decoder);
            CHECK(meta->get_file_type() == file_type::mp3);
            CHECK(meta->get_format() == tag_format::id3v2_3);
            CHECK(meta->duration() == 3s);
        }

        SUBCASE("ID3v1 trailer") {
            auto data = frame;
            data.resize(42100, 0);
            append(data, create_id3v1("Title"));
            auto meta = read_bytes_with(data, decoder);
            CHECK(meta->get_file_type() == file_type::mp3);
            CHECK(meta->get_format() == tag_format::id3v1);
            CHECK(meta->duration() == 3s);
        }
    }

    TEST_CASE("MP4 is handed to the tag decoder whole") {
        recording_tag_decoder decoder;
        bytes data = {0, 0, 0, 0x18};
        append(data, "ftypM4B ");
        data.resize(256, 0x33);

        auto meta = read_bytes_with(data, decoder);
        CHECK(meta->get_file_type() == file_type::m4b);
        CHECK(meta->get_format() == tag_format::mp4);
        CHECK(meta->duration() == duration_t::zero());
        CHECK(meta->get_album() == "mp4 album");
        REQUIRE(decoder.calls.size() == 1);
        CHECK(decoder.calls[0].method == "mp4");
        CHECK(decoder.calls[0].region == data);
    }

    TEST_CASE("Reading starts at offset 0 whatever the cursor") {
        null_tag_decoder none;
        auto data = create_test_flac(48000, 48000);
        auto stream = io_from_memory(data.data(), data.size());
        seek_to(stream.get(), 20);
        CHECK(read_from(stream.get(), none)->get_file_type() == file_type::flac);
    }

    TEST_CASE("Failures") {
        null_tag_decoder none;

        SUBCASE("Null stream") {
            CHECK_THROWS_AS(read_from(nullptr, none), invalid_argument_error);
        }

        SUBCASE("Nothing recognisable") {
            CHECK_THROWS_AS(read_bytes_with(bytes(300, 0), none), no_tags_found_error);
        }

        SUBCASE("Container error propagates") {
            auto data = create_test_flac(44100, 44100);
            data.resize(20);
            CHECK_THROWS_AS(read_bytes_with(data, none), io_error);
        }
    }
}
