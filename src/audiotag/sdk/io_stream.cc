#include <audiotag/sdk/io_stream.hh>
#include <audiotag/sdk/endian.hh>
#include <algorithm>
#include <fstream>
#include <cstring>

namespace audiotag {

// Memory stream implementation
class memory_stream : public io_stream {
public:
    memory_stream(const void* data, size_t size_bytes)
        : m_data(static_cast<const uint8_t*>(data))
        , m_size(size_bytes)
        , m_position(0)
        , m_is_open(true) {}

    size_t read(void* ptr, size_t size_bytes) override {
        if (!m_is_open || m_position >= m_size) {
            return 0;
        }

        size_t to_read = std::min(size_bytes, m_size - m_position);
        std::memcpy(ptr, m_data + m_position, to_read);
        m_position += to_read;
        return to_read;
    }

    int64_t seek(int64_t offset, seek_origin whence) override {
        if (!m_is_open) {
            return -1;
        }

        int64_t new_pos = 0;
        switch (whence) {
            case seek_origin::set:
                new_pos = offset;
                break;
            case seek_origin::cur:
                new_pos = static_cast<int64_t>(m_position) + offset;
                break;
            case seek_origin::end:
                new_pos = static_cast<int64_t>(m_size) + offset;
                break;
        }

        if (new_pos < 0 || new_pos > static_cast<int64_t>(m_size)) {
            return -1;
        }

        m_position = static_cast<size_t>(new_pos);
        return new_pos;
    }

    int64_t tell() override {
        return m_is_open ? static_cast<int64_t>(m_position) : -1;
    }

    int64_t get_size() override {
        return m_is_open ? static_cast<int64_t>(m_size) : -1;
    }

    void close() override {
        m_is_open = false;
    }

    bool is_open() const override {
        return m_is_open;
    }

private:
    const uint8_t* m_data;
    size_t m_size;
    size_t m_position;
    bool m_is_open;
};

// File stream implementation
class file_stream : public io_stream {
public:
    explicit file_stream(const char* filename) {
        m_file.open(filename, std::ios::binary | std::ios::in);
        if (m_file.is_open()) {
            m_file.seekg(0, std::ios::end);
            m_size = static_cast<int64_t>(m_file.tellg());
            m_file.seekg(0, std::ios::beg);
        }
    }

    size_t read(void* ptr, size_t size_bytes) override {
        if (!is_open()) {
            return 0;
        }
        m_file.read(static_cast<char*>(ptr), static_cast<std::streamsize>(size_bytes));
        auto got = static_cast<size_t>(m_file.gcount());
        if (m_file.eof()) {
            // A short read sets eof/fail; clear so later seeks still work
            m_file.clear();
        }
        return got;
    }

    int64_t seek(int64_t offset, seek_origin whence) override {
        if (!is_open()) {
            return -1;
        }

        int64_t base = 0;
        switch (whence) {
            case seek_origin::set: base = 0; break;
            case seek_origin::cur: base = tell(); break;
            case seek_origin::end: base = m_size; break;
        }
        int64_t new_pos = base + offset;
        if (base < 0 || new_pos < 0 || new_pos > m_size) {
            return -1;
        }

        m_file.clear();
        m_file.seekg(new_pos, std::ios::beg);
        return m_file.fail() ? -1 : new_pos;
    }

    int64_t tell() override {
        if (!is_open()) {
            return -1;
        }
        return static_cast<int64_t>(m_file.tellg());
    }

    int64_t get_size() override {
        return is_open() ? m_size : -1;
    }

    void close() override {
        m_file.close();
    }

    bool is_open() const override {
        return m_file.is_open();
    }

private:
    mutable std::ifstream m_file;
    int64_t m_size = -1;
};

// Window onto [offset, offset + length) of a parent stream
class sub_stream : public io_stream {
public:
    sub_stream(io_stream* parent, int64_t offset, int64_t length)
        : m_parent(parent)
        , m_offset(offset)
        , m_length(length)
        , m_position(0)
        , m_is_open(parent != nullptr) {}

    size_t read(void* ptr, size_t size_bytes) override {
        if (!m_is_open || m_position >= m_length) {
            return 0;
        }
        if (m_parent->seek(m_offset + m_position, seek_origin::set) < 0) {
            return 0;
        }
        auto available = static_cast<uint64_t>(m_length - m_position);
        auto to_read = static_cast<size_t>(std::min<uint64_t>(size_bytes, available));
        size_t got = m_parent->read(ptr, to_read);
        m_position += static_cast<int64_t>(got);
        return got;
    }

    int64_t seek(int64_t offset, seek_origin whence) override {
        if (!m_is_open) {
            return -1;
        }

        int64_t new_pos = 0;
        switch (whence) {
            case seek_origin::set: new_pos = offset; break;
            case seek_origin::cur: new_pos = m_position + offset; break;
            case seek_origin::end: new_pos = m_length + offset; break;
        }
        if (new_pos < 0 || new_pos > m_length) {
            return -1;
        }
        m_position = new_pos;
        return new_pos;
    }

    int64_t tell() override {
        return m_is_open ? m_position : -1;
    }

    int64_t get_size() override {
        return m_is_open ? m_length : -1;
    }

    void close() override {
        m_is_open = false;
    }

    bool is_open() const override {
        return m_is_open && m_parent->is_open();
    }

private:
    io_stream* m_parent;
    int64_t m_offset;
    int64_t m_length;
    int64_t m_position;
    bool m_is_open;
};

// Convenience read functions implementation
bool read_u8(io_stream* stream, uint8_t* value) {
    return stream->read(value, 1) == 1;
}

bool read_u16le(io_stream* stream, uint16_t* value) {
    uint16_t temp;
    if (stream->read(&temp, 2) != 2) return false;
    *value = swap16le(temp);
    return true;
}

bool read_u16be(io_stream* stream, uint16_t* value) {
    uint16_t temp;
    if (stream->read(&temp, 2) != 2) return false;
    *value = swap16be(temp);
    return true;
}

bool read_u32le(io_stream* stream, uint32_t* value) {
    uint32_t temp;
    if (stream->read(&temp, 4) != 4) return false;
    *value = swap32le(temp);
    return true;
}

bool read_u32be(io_stream* stream, uint32_t* value) {
    uint32_t temp;
    if (stream->read(&temp, 4) != 4) return false;
    *value = swap32be(temp);
    return true;
}

bool read_u64le(io_stream* stream, uint64_t* value) {
    uint64_t temp;
    if (stream->read(&temp, 8) != 8) return false;
    *value = swap64le(temp);
    return true;
}

bool read_u64be(io_stream* stream, uint64_t* value) {
    uint64_t temp;
    if (stream->read(&temp, 8) != 8) return false;
    *value = swap64be(temp);
    return true;
}

// Factory functions
std::unique_ptr<io_stream> io_from_file(const char* filename) {
    auto stream = std::make_unique<file_stream>(filename);
    if (!stream->is_open()) {
        return nullptr;
    }
    return stream;
}

std::unique_ptr<io_stream> io_from_memory(const void* mem, size_t size_bytes) {
    return std::make_unique<memory_stream>(mem, size_bytes);
}

std::unique_ptr<io_stream> io_sub_stream(io_stream* parent, int64_t offset, int64_t length) {
    return std::make_unique<sub_stream>(parent, offset, length);
}

} // namespace audiotag
