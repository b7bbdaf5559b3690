#include <audiotag/sdk/byte_reader.hh>
#include <audiotag/error.hh>
#include <algorithm>

namespace audiotag {

    static size_t read_fully(io_stream* stream, uint8_t* dst, size_t n) {
        size_t total = 0;
        while (total < n) {
            size_t got = stream->read(dst + total, n - total);
            if (got == 0) {
                break;
            }
            total += got;
        }
        return total;
    }

    static void check_stream(io_stream* stream) {
        if (!stream) {
            throw invalid_argument_error("No IO stream provided");
        }
    }

    int64_t remaining_bytes(io_stream* stream) {
        check_stream(stream);
        auto size = stream->get_size();
        auto pos = stream->tell();
        if (size < 0 || pos < 0) {
            return -1;
        }
        return size > pos ? size - pos : 0;
    }

    std::vector<uint8_t> read_bytes(io_stream* stream, size_t n, size_t max_upfront) {
        check_stream(stream);

        auto remaining = remaining_bytes(stream);
        if (remaining >= 0 && static_cast<uint64_t>(remaining) < n) {
            throw io_error("Unexpected end of stream: need " + std::to_string(n) +
                           " bytes, " + std::to_string(remaining) + " available");
        }

        if (n <= max_upfront || max_upfront == 0) {
            std::vector<uint8_t> data(n);
            size_t got = read_fully(stream, data.data(), n);
            if (got != n) {
                throw io_error("Unexpected end of stream: got " + std::to_string(got) +
                               " of " + std::to_string(n) + " bytes");
            }
            return data;
        }

        // Grow in capped pieces so a bogus length cannot force one huge allocation
        std::vector<uint8_t> data;
        size_t total = 0;
        while (total < n) {
            size_t piece = std::min(max_upfront, n - total);
            data.resize(total + piece);
            size_t got = read_fully(stream, data.data() + total, piece);
            total += got;
            if (got != piece) {
                throw io_error("Unexpected end of stream: got " + std::to_string(total) +
                               " of " + std::to_string(n) + " bytes");
            }
        }
        return data;
    }

    void read_exact(io_stream* stream, void* dst, size_t n) {
        check_stream(stream);
        size_t got = read_fully(stream, static_cast<uint8_t*>(dst), n);
        if (got != n) {
            throw io_error("Unexpected end of stream: got " + std::to_string(got) +
                           " of " + std::to_string(n) + " bytes");
        }
    }

    std::string read_string(io_stream* stream, size_t n) {
        auto bytes = read_bytes(stream, n);
        return std::string(bytes.begin(), bytes.end());
    }

    static void check_width(unsigned width) {
        if (width != 1 && width != 2 && width != 4 && width != 8) {
            throw invalid_argument_error("Integer width must be 1, 2, 4 or 8 bytes, got " +
                                         std::to_string(width));
        }
    }

    static void check_read(bool ok, unsigned width) {
        if (!ok) {
            throw io_error("Unexpected end of stream reading a " + std::to_string(width) + "-byte integer");
        }
    }

    uint64_t read_uint_le(io_stream* stream, unsigned width) {
        check_stream(stream);
        check_width(width);
        switch (width) {
            case 1: {
                uint8_t v = 0;
                check_read(read_u8(stream, &v), width);
                return v;
            }
            case 2: {
                uint16_t v = 0;
                check_read(read_u16le(stream, &v), width);
                return v;
            }
            case 4: {
                uint32_t v = 0;
                check_read(read_u32le(stream, &v), width);
                return v;
            }
            default: {
                uint64_t v = 0;
                check_read(read_u64le(stream, &v), width);
                return v;
            }
        }
    }

    uint64_t read_uint_be(io_stream* stream, unsigned width) {
        check_stream(stream);
        check_width(width);
        switch (width) {
            case 1: {
                uint8_t v = 0;
                check_read(read_u8(stream, &v), width);
                return v;
            }
            case 2: {
                uint16_t v = 0;
                check_read(read_u16be(stream, &v), width);
                return v;
            }
            case 4: {
                uint32_t v = 0;
                check_read(read_u32be(stream, &v), width);
                return v;
            }
            default: {
                uint64_t v = 0;
                check_read(read_u64be(stream, &v), width);
                return v;
            }
        }
    }

    std::vector<uint8_t> peek_bytes(io_stream* stream, size_t n) {
        check_stream(stream);
        auto start = stream->tell();
        if (start < 0) {
            throw io_error("Cannot determine stream position");
        }
        std::vector<uint8_t> data(n);
        data.resize(read_fully(stream, data.data(), n));
        if (stream->seek(start, seek_origin::set) != start) {
            throw io_error("Could not seek back to original position");
        }
        return data;
    }

    void skip_bytes(io_stream* stream, uint64_t n) {
        auto remaining = remaining_bytes(stream);
        if (remaining >= 0 && static_cast<uint64_t>(remaining) < n) {
            throw io_error("Cannot skip " + std::to_string(n) + " bytes, " +
                           std::to_string(remaining) + " remain");
        }
        if (stream->seek(static_cast<int64_t>(n), seek_origin::cur) < 0) {
            throw io_error("Seek failed while skipping " + std::to_string(n) + " bytes");
        }
    }

    void seek_to(io_stream* stream, int64_t position) {
        check_stream(stream);
        if (stream->seek(position, seek_origin::set) != position) {
            throw io_error("Cannot seek to offset " + std::to_string(position));
        }
    }

} // namespace audiotag
