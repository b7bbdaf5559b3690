/**
 * @file byte_reader.hh
 * @brief Exact-length reads that throw on short input
 * @ingroup sdk_io
 *
 * The container parsers need "exactly N bytes or fail" semantics with a
 * typed error. These helpers layer that over io_stream and convert every
 * short read or failed seek into io_error.
 */

#pragma once

#include <audiotag/sdk/io_stream.hh>
#include <audiotag/export_audiotag.h>
#include <audiotag/audiotag_config.h>
#include <string>
#include <vector>

namespace audiotag {

    /**
     * @brief Read exactly @p n bytes
     *
     * When the stream size is known and fewer than @p n bytes remain the
     * call fails before allocating anything. Requests above
     * @p max_upfront are accumulated in pieces of at most that size.
     *
     * @throws io_error on a short read
     */
    AUDIOTAG_EXPORT std::vector<uint8_t> read_bytes(io_stream* stream, std::size_t n,
                                                    std::size_t max_upfront = AUDIOTAG_MAX_UPFRONT_READ);

    /**
     * @brief Read exactly @p n bytes into caller storage
     * @throws io_error on a short read
     */
    AUDIOTAG_EXPORT void read_exact(io_stream* stream, void* dst, std::size_t n);

    /**
     * @brief Read @p n bytes as a string, for magic comparison
     * @throws io_error on a short read
     */
    AUDIOTAG_EXPORT std::string read_string(io_stream* stream, std::size_t n);

    /**
     * @brief Read a little-endian unsigned integer of 1, 2, 4 or 8 bytes
     * @throws invalid_argument_error for any other width
     * @throws io_error on a short read
     */
    AUDIOTAG_EXPORT uint64_t read_uint_le(io_stream* stream, unsigned width);

    /**
     * @brief Read a big-endian unsigned integer of 1, 2, 4 or 8 bytes
     * @throws invalid_argument_error for any other width
     * @throws io_error on a short read
     */
    AUDIOTAG_EXPORT uint64_t read_uint_be(io_stream* stream, unsigned width);

    /**
     * @brief Read up to @p n bytes and put the cursor back where it was
     * @return Bytes actually available (may be fewer than @p n)
     * @throws io_error if the cursor cannot be restored
     */
    AUDIOTAG_EXPORT std::vector<uint8_t> peek_bytes(io_stream* stream, std::size_t n);

    /**
     * @brief Move the cursor forward by @p n bytes
     * @throws io_error if that would leave the stream
     */
    AUDIOTAG_EXPORT void skip_bytes(io_stream* stream, uint64_t n);

    /**
     * @brief Move the cursor to an absolute position
     * @throws io_error if the position is outside the stream
     */
    AUDIOTAG_EXPORT void seek_to(io_stream* stream, int64_t position);

    /**
     * @brief Bytes between the cursor and the end of the stream
     * @return -1 when the stream size is unknown
     */
    AUDIOTAG_EXPORT int64_t remaining_bytes(io_stream* stream);

} // namespace audiotag
