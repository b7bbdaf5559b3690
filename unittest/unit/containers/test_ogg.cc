#include <doctest/doctest.h>
#include <audiotag/containers/ogg.hh>
#include <audiotag/error.hh>
#include "../../test_helpers.hh"
#include <chrono>

using namespace audiotag;
using namespace audiotag::test;
using namespace std::chrono_literals;

namespace {
    constexpr uint8_t FLAG_BOS = 0x02;
    constexpr uint8_t FLAG_EOS = 0x04;

    bytes comment_of_size(size_t size) {
        auto packet = vorbis_comment_packet(std::string(size - 7, 'k'));
        for (size_t i = 7; i < packet.size(); i++) {
            packet[i] = static_cast<uint8_t>(i);
        }
        return packet;
    }

    // Identification page, a comment packet split over two pages, one audio page
    bytes create_test_ogg(uint32_t rate, const bytes& comment, uint64_t last_granule) {
        bytes out;
        auto ident = vorbis_ident_packet(rate);
        append(out, ogg_page(FLAG_BOS, 0, 0x1234, 0, lacing_for(ident.size()), ident));

        REQUIRE(comment.size() > 255);
        bytes first(comment.begin(), comment.begin() + 255);
        bytes rest(comment.begin() + 255, comment.end());
        append(out, ogg_page(0, ogg::no_granule, 0x1234, 1, bytes{255}, first));
        append(out, ogg_page(ogg::flag_continued, 0, 0x1234, 2, lacing_for(rest.size()), rest));

        bytes audio(100, 0x55);
        append(out, ogg_page(FLAG_EOS, last_granule, 0x1234, 3, lacing_for(audio.size()), audio));
        return out;
    }
}

TEST_SUITE("Containers::OGG") {
    TEST_CASE("CRC matches the bitwise definition") {
        bytes data;
        append(data, "The quick brown fox jumps over the lazy dog");
        CHECK(ogg::crc32(data.data(), data.size()) == reference_ogg_crc(data));
        CHECK(ogg::crc32(data.data(), 0) == 0);

        // Piecewise update
        uint32_t crc = ogg::crc32(data.data(), 10);
        crc = ogg::crc32(data.data() + 10, data.size() - 10, crc);
        CHECK(crc == reference_ogg_crc(data));
    }

    TEST_CASE("Packet spanning two pages") {
        auto comment = comment_of_size(300);
        auto data = create_test_ogg(48000, comment, 96000);
        auto stream = io_from_memory(data.data(), data.size());

        ogg::demuxer session;

        auto first = session.read_page(stream.get());
        REQUIRE(first.has_value());
        REQUIRE(first->packets.size() == 1);
        CHECK(first->header.serial == 0x1234);
        CHECK(first->header.granule_position == 0);

        auto second = session.read_page(stream.get());
        REQUIRE(second.has_value());
        CHECK(second->packets.empty());
        CHECK(second->header.granule_position == ogg::no_granule);
        CHECK(session.pending_size(0x1234) == 255);

        auto third = session.read_page(stream.get());
        REQUIRE(third.has_value());
        CHECK(third->header.continued());
        REQUIRE(third->packets.size() == 1);
        CHECK(third->packets[0] == comment);
        CHECK(session.pending_size(0x1234) == 0);

        auto fourth = session.read_page(stream.get());
        REQUIRE(fourth.has_value());
        CHECK(fourth->header.granule_position == 96000);

        CHECK_FALSE(session.read_page(stream.get()).has_value());
    }

    TEST_CASE("Vorbis stream metadata") {
        auto comment = comment_of_size(300);
        auto data = create_test_ogg(48000, comment, 96000);
        auto stream = io_from_memory(data.data(), data.size());

        recording_tag_decoder decoder;
        auto meta = ogg::read(stream.get(), decoder);

        CHECK(meta->get_file_type() == file_type::ogg);
        CHECK(meta->get_format() == tag_format::vorbis);
        CHECK(meta->get_sample_rate() == 48000);
        CHECK(meta->get_codec() == "vorbis");
        CHECK(meta->duration() == 2s);

        REQUIRE(decoder.calls.size() == 1);
        CHECK(decoder.calls[0].method == "vorbis_comment");
        CHECK(decoder.calls[0].region == bytes(comment.begin() + 7, comment.end()));
        CHECK(meta->get_artist() == "vorbis artist");

        auto raw = meta->raw();
        CHECK(std::get<std::string>(raw.at("serials")) == std::to_string(0x1234));
        CHECK(std::get<uint64_t>(raw.at("sample_rate")) == 48000);
    }

    TEST_CASE("Opus forces 48 kHz") {
        bytes head;
        append(head, "OpusHead");
        head.push_back(1);
        head.push_back(2);
        write_u16le(head, 312);
        write_u32le(head, 44100);  // input rate, informational only
        write_u16le(head, 0);
        head.push_back(0);

        bytes tags;
        append(tags, "OpusTags");
        write_u32le(tags, 4);
        append(tags, "opus");
        write_u32le(tags, 0);

        bytes data;
        append(data, ogg_page(FLAG_BOS, 0, 7, 0, lacing_for(head.size()), head));
        append(data, ogg_page(0, 0, 7, 1, lacing_for(tags.size()), tags));
        append(data, ogg_page(FLAG_EOS, 48000 * 3, 7, 2, lacing_for(10), bytes(10, 0)));
        auto stream = io_from_memory(data.data(), data.size());

        recording_tag_decoder decoder;
        auto meta = ogg::read(stream.get(), decoder);

        CHECK(meta->get_sample_rate() == 48000);
        CHECK(meta->get_codec() == "opus");
        CHECK(meta->duration() == 3s);
        REQUIRE(decoder.calls.size() == 1);
        CHECK(decoder.calls[0].region == bytes(tags.begin() + 8, tags.end()));
    }

    TEST_CASE("Interleaved logical streams keep separate buffers") {
        bytes a(300, 'a');
        bytes b(260, 'b');

        bytes data;
        append(data, ogg_page(FLAG_BOS, 0, 1, 0, bytes{255}, bytes(a.begin(), a.begin() + 255)));
        append(data, ogg_page(FLAG_BOS, 0, 2, 0, bytes{255}, bytes(b.begin(), b.begin() + 255)));
        append(data, ogg_page(ogg::flag_continued, 0, 1, 1, bytes{45}, bytes(a.begin() + 255, a.end())));
        append(data, ogg_page(ogg::flag_continued, 0, 2, 1, bytes{5}, bytes(b.begin() + 255, b.end())));
        auto stream = io_from_memory(data.data(), data.size());

        ogg::demuxer session;
        CHECK(session.read_page(stream.get())->packets.empty());
        CHECK(session.read_page(stream.get())->packets.empty());
        CHECK(session.knows(1));
        CHECK(session.knows(2));
        CHECK_FALSE(session.knows(3));

        auto third = session.read_page(stream.get());
        REQUIRE(third->packets.size() == 1);
        CHECK(third->packets[0] == a);

        auto fourth = session.read_page(stream.get());
        REQUIRE(fourth->packets.size() == 1);
        CHECK(fourth->packets[0] == b);
    }

    TEST_CASE("Several packets on one page") {
        bytes seg_table = {3, 255, 10, 0};
        bytes payload;
        append(payload, bytes(3, 1));
        append(payload, bytes(265, 2));
        auto data = ogg_page(0, 5, 9, 0, seg_table, payload);
        auto stream = io_from_memory(data.data(), data.size());

        ogg::demuxer session;
        auto p = session.read_page(stream.get());
        REQUIRE(p->packets.size() == 3);
        CHECK(p->packets[0].size() == 3);
        CHECK(p->packets[1].size() == 265);
        CHECK(p->packets[2].empty());
    }

    TEST_CASE("Corruption is detected") {
        auto comment = comment_of_size(300);
        auto data = create_test_ogg(44100, comment, 44100);

        SUBCASE("Every page of a conforming stream verifies") {
            auto stream = io_from_memory(data.data(), data.size());
            ogg::demuxer session;
            int pages = 0;
            while (session.read_page(stream.get())) {
                pages++;
            }
            CHECK(pages == 4);
        }

        SUBCASE("Any flipped payload byte fails the checksum") {
            auto ident = vorbis_ident_packet(44100);
            auto page = ogg_page(FLAG_BOS, 0, 1, 0, lacing_for(ident.size()), ident);
            size_t payload_start = ogg::page_header_size + 1;

            for (size_t i = payload_start; i < page.size(); i++) {
                auto corrupt = page;
                corrupt[i] ^= 0x01;
                auto stream = io_from_memory(corrupt.data(), corrupt.size());
                ogg::demuxer session;
                CAPTURE(i);
                CHECK_THROWS_AS(session.read_page(stream.get()), checksum_error);
            }
        }

        SUBCASE("Flipped header fields fail too") {
            auto corrupt = data;
            corrupt[6] ^= 0x80;  // granule position
            auto stream = io_from_memory(corrupt.data(), corrupt.size());
            ogg::demuxer session;
            CHECK_THROWS_AS(session.read_page(stream.get()), checksum_error);
        }
    }

    TEST_CASE("Malformed streams") {
        null_tag_decoder none;

        SUBCASE("Continuation without a pending packet") {
            auto data = ogg_page(ogg::flag_continued, 0, 42, 0, bytes{4}, bytes(4, 0));
            auto stream = io_from_memory(data.data(), data.size());
            ogg::demuxer session;
            CHECK_THROWS_AS(session.read_page(stream.get()), orphaned_continuation_error);
        }

        SUBCASE("Wrong capture pattern") {
            auto data = ogg_page(0, 0, 1, 0, bytes{4}, bytes(4, 0));
            data[3] = 'X';
            auto stream = io_from_memory(data.data(), data.size());
            ogg::demuxer session;
            CHECK_THROWS_AS(session.read_page(stream.get()), format_mismatch_error);
        }

        SUBCASE("Truncated page") {
            auto data = ogg_page(0, 0, 1, 0, bytes{40}, bytes(40, 0));
            data.resize(data.size() - 5);
            auto stream = io_from_memory(data.data(), data.size());
            ogg::demuxer session;
            CHECK_THROWS_AS(session.read_page(stream.get()), io_error);

            auto header_only = bytes(data.begin(), data.begin() + 20);
            auto short_stream = io_from_memory(header_only.data(), header_only.size());
            CHECK_THROWS_AS(session.read_page(short_stream.get()), io_error);
        }

        SUBCASE("No comment packet") {
            auto ident = vorbis_ident_packet(44100);
            auto data = ogg_page(FLAG_BOS, 0, 1, 0, lacing_for(ident.size()), ident);
            auto stream = io_from_memory(data.data(), data.size());
            CHECK_THROWS_AS(ogg::read(stream.get(), none), no_tags_found_error);
        }
    }

    TEST_CASE("Huge granule positions saturate") {
        ogg::ogg_metadata meta(48000, 1ULL << 62, "vorbis", {}, tag_fields{});
        CHECK(meta.duration() == duration_t::max());

        ogg::ogg_metadata fits(48000, 48000ULL * 9000000000ULL, "vorbis", {}, tag_fields{});
        CHECK(fits.duration() == std::chrono::seconds(9000000000LL));
    }
}
