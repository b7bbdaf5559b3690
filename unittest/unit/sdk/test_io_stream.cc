#include <doctest/doctest.h>
#include <audiotag/sdk/io_stream.hh>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace audiotag;

TEST_SUITE("SDK::IOStream") {
    TEST_CASE("Memory stream seeking") {
        const uint8_t data[] = {0, 1, 2, 3, 4, 5, 6, 7, 8, 9};
        auto stream = io_from_memory(data, sizeof(data));
        REQUIRE(stream != nullptr);
        CHECK(stream->get_size() == 10);

        SUBCASE("seek set") {
            CHECK(stream->seek(5, seek_origin::set) == 5);
            CHECK(stream->tell() == 5);

            uint8_t value = 0;
            CHECK(stream->read(&value, 1) == 1);
            CHECK(value == 5);
        }

        SUBCASE("seek cur") {
            stream->seek(3, seek_origin::set);
            CHECK(stream->seek(2, seek_origin::cur) == 5);
            CHECK(stream->seek(-2, seek_origin::cur) == 3);
        }

        SUBCASE("seek end") {
            CHECK(stream->seek(-1, seek_origin::end) == 9);
            uint8_t value = 0;
            stream->read(&value, 1);
            CHECK(value == 9);
        }

        SUBCASE("Out of range seeks fail and keep the cursor") {
            stream->seek(4, seek_origin::set);
            CHECK(stream->seek(-1, seek_origin::set) == -1);
            CHECK(stream->seek(11, seek_origin::set) == -1);
            CHECK(stream->tell() == 4);
        }

        SUBCASE("Short read at the end") {
            stream->seek(8, seek_origin::set);
            uint8_t buf[4] = {};
            CHECK(stream->read(buf, sizeof(buf)) == 2);
            CHECK(stream->read(buf, sizeof(buf)) == 0);
        }

        SUBCASE("Closed stream") {
            stream->close();
            CHECK_FALSE(stream->is_open());
            uint8_t value = 0;
            CHECK(stream->read(&value, 1) == 0);
            CHECK(stream->tell() == -1);
        }
    }

    TEST_CASE("Endian helpers") {
        const uint8_t data[] = {0x12, 0x34, 0x56, 0x78, 0x9A, 0xBC, 0xDE, 0xF0};
        auto stream = io_from_memory(data, sizeof(data));

        SUBCASE("Little endian") {
            uint16_t v16 = 0;
            CHECK(read_u16le(stream.get(), &v16));
            CHECK(v16 == 0x3412);

            stream->seek(0, seek_origin::set);
            uint32_t v32 = 0;
            CHECK(read_u32le(stream.get(), &v32));
            CHECK(v32 == 0x78563412);

            stream->seek(0, seek_origin::set);
            uint64_t v64 = 0;
            CHECK(read_u64le(stream.get(), &v64));
            CHECK(v64 == 0xF0DEBC9A78563412ULL);
        }

        SUBCASE("Big endian") {
            uint16_t v16 = 0;
            CHECK(read_u16be(stream.get(), &v16));
            CHECK(v16 == 0x1234);

            stream->seek(0, seek_origin::set);
            uint32_t v32 = 0;
            CHECK(read_u32be(stream.get(), &v32));
            CHECK(v32 == 0x12345678);

            stream->seek(0, seek_origin::set);
            uint64_t v64 = 0;
            CHECK(read_u64be(stream.get(), &v64));
            CHECK(v64 == 0x123456789ABCDEF0ULL);
        }

        SUBCASE("Short reads report failure") {
            stream->seek(6, seek_origin::set);
            uint32_t v32 = 0;
            CHECK_FALSE(read_u32le(stream.get(), &v32));

            stream->seek(8, seek_origin::set);
            uint8_t v8 = 0;
            CHECK_FALSE(read_u8(stream.get(), &v8));
        }
    }

    TEST_CASE("Sub stream window") {
        const uint8_t data[] = {0, 1, 2, 3, 4, 5, 6, 7, 8, 9};
        auto parent = io_from_memory(data, sizeof(data));
        auto window = io_sub_stream(parent.get(), 3, 4);

        CHECK(window->get_size() == 4);
        CHECK(window->tell() == 0);

        SUBCASE("Reads stop at the window end") {
            uint8_t buf[8] = {};
            CHECK(window->read(buf, sizeof(buf)) == 4);
            CHECK(buf[0] == 3);
            CHECK(buf[3] == 6);
            CHECK(window->read(buf, sizeof(buf)) == 0);
        }

        SUBCASE("Seeks are relative to the window") {
            CHECK(window->seek(-1, seek_origin::end) == 3);
            uint8_t value = 0;
            CHECK(window->read(&value, 1) == 1);
            CHECK(value == 6);
            CHECK(window->seek(5, seek_origin::set) == -1);
        }

        SUBCASE("Parent cursor moves are tolerated") {
            parent->seek(0, seek_origin::set);
            uint8_t value = 0;
            CHECK(window->read(&value, 1) == 1);
            CHECK(value == 3);
            parent->seek(9, seek_origin::set);
            CHECK(window->read(&value, 1) == 1);
            CHECK(value == 4);
        }
    }

    TEST_CASE("File stream") {
        auto path = std::filesystem::temp_directory_path() / "audiotag_io_stream_test.bin";
        {
            std::ofstream out(path, std::ios::binary);
            out << "RIFF1234WAVE";
        }

        auto stream = io_from_file(path.string().c_str());
        REQUIRE(stream != nullptr);
        CHECK(stream->get_size() == 12);

        char buf[16] = {};
        CHECK(stream->read(buf, 4) == 4);
        CHECK(std::string(buf, 4) == "RIFF");
        CHECK(stream->tell() == 4);

        // Short read followed by a seek
        CHECK(stream->read(buf, sizeof(buf)) == 8);
        CHECK(stream->seek(8, seek_origin::set) == 8);
        CHECK(stream->read(buf, 4) == 4);
        CHECK(std::string(buf, 4) == "WAVE");
        CHECK(stream->seek(13, seek_origin::set) == -1);

        stream.reset();
        std::filesystem::remove(path);

        CHECK(io_from_file(path.string().c_str()) == nullptr);
    }
}
