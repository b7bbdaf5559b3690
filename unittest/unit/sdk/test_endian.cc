#include <doctest/doctest.h>
#include <audiotag/sdk/endian.hh>
#include <cstring>

using namespace audiotag;

TEST_SUITE("SDK::Endian") {
    TEST_CASE("Byte swapping") {
        CHECK(swap16(0x1234) == 0x3412);
        CHECK(swap16(0x00FF) == 0xFF00);
        CHECK(swap32(0x12345678) == 0x78563412);
        CHECK(swap32(0xFF000000) == 0x000000FF);
        CHECK(swap64(0x0102030405060708ULL) == 0x0807060504030201ULL);

        uint32_t original = 0xDEADBEEF;
        CHECK(swap32(swap32(original)) == original);
    }

    TEST_CASE("Platform endianness detection") {
        uint32_t test = 0x01020304;
        uint8_t bytes[4];
        std::memcpy(bytes, &test, sizeof(bytes));

        if (is_little_endian) {
            CHECK(bytes[0] == 0x04);
            CHECK(bytes[3] == 0x01);
        } else {
            CHECK(bytes[0] == 0x01);
            CHECK(bytes[3] == 0x04);
        }
        CHECK(is_little_endian != is_big_endian);
    }

    TEST_CASE("Unaligned loads") {
        // OGG page header: granule at 6, serial at 14
        const uint8_t page[] = {'O', 'g', 'g', 'S', 0, 0,
                                0x08, 0x07, 0x06, 0x05, 0x04, 0x03, 0x02, 0x01,
                                0x78, 0x56, 0x34, 0x12};

        CHECK(load64le(page + 6) == 0x0102030405060708ULL);
        CHECK(load32le(page + 14) == 0x12345678);
    }
}
