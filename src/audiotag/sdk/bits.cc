#include <audiotag/sdk/bits.hh>
#include <audiotag/error.hh>
#include <algorithm>
#include <string>

namespace audiotag {

    uint64_t cut_bits(const uint8_t* data, std::size_t size, uint64_t bit_offset, unsigned bit_width) {
        if (bit_width > 64) {
            throw invalid_argument_error("Bit width " + std::to_string(bit_width) +
                                         " exceeds maximum value of 64");
        }
        auto size_bits = static_cast<uint64_t>(size) * 8;
        if (bit_offset > size_bits || bit_width > size_bits - bit_offset) {
            throw invalid_argument_error("Out of bounds bit read: offset " + std::to_string(bit_offset) +
                                         " width " + std::to_string(bit_width) +
                                         " buffer " + std::to_string(size) + " bytes");
        }

        uint64_t result = 0;
        unsigned bits_read = 0;
        uint64_t pos = bit_offset;
        while (bits_read < bit_width) {
            uint8_t byte = data[pos / 8];
            unsigned available = 8 - static_cast<unsigned>(pos % 8);
            unsigned take = std::min(available, bit_width - bits_read);
            unsigned chunk = (static_cast<unsigned>(byte) >> (available - take)) & ((1u << take) - 1u);
            result = (result << take) | chunk;
            bits_read += take;
            pos += take;
        }
        return result;
    }

    uint64_t get_7bit_chunked_value(const uint8_t* data, std::size_t size) {
        uint64_t n = 0;
        for (std::size_t i = 0; i < size; ++i) {
            n = (n << 7) | (data[i] & 0x7Fu);
        }
        return n;
    }

    uint64_t get_chunked_value(const uint8_t* data, std::size_t size) {
        uint64_t n = 0;
        for (std::size_t i = 0; i < size; ++i) {
            n = (n << 8) | data[i];
        }
        return n;
    }

} // namespace audiotag
