/**
 * @file bits.hh
 * @brief Bit-span extraction and chunked integer decoding
 * @ingroup sdk_io
 */

#pragma once

#include <audiotag/export_audiotag.h>
#include <audiotag/sdk/types.hh>
#include <vector>

namespace audiotag {

    /**
     * @brief Extract an unsigned value spanning an arbitrary bit range
     *
     * Bits are numbered MSB-first across the buffer, so bit 0 is the top
     * bit of data[0]. This is the order FLAC stream-info and MPEG frame
     * headers are packed in.
     *
     * @param data Buffer to read from
     * @param size Buffer size in bytes
     * @param bit_offset First bit of the field
     * @param bit_width Field width, at most 64
     * @return The field value, right-aligned
     *
     * @throws invalid_argument_error if @p bit_width exceeds 64 or the
     *         range extends past the buffer
     *
     * @code
     * // FLAC stream-info: 20-bit sample rate at bit 80
     * auto rate = cut_bits(info.data(), info.size(), 80, 20);
     * @endcode
     */
    AUDIOTAG_EXPORT uint64_t cut_bits(const uint8_t* data, std::size_t size,
                                      uint64_t bit_offset, unsigned bit_width);

    inline uint64_t cut_bits(const std::vector<uint8_t>& data, uint64_t bit_offset, unsigned bit_width) {
        return cut_bits(data.data(), data.size(), bit_offset, bit_width);
    }

    /**
     * @brief Decode a big-endian base-128 ("synchsafe") integer
     *
     * Only the low 7 bits of each byte contribute. ID3v2 stores its tag
     * size this way.
     */
    AUDIOTAG_EXPORT uint64_t get_7bit_chunked_value(const uint8_t* data, std::size_t size);

    /**
     * @brief Decode a big-endian base-256 integer of any length up to 8 bytes
     */
    AUDIOTAG_EXPORT uint64_t get_chunked_value(const uint8_t* data, std::size_t size);

} // namespace audiotag
