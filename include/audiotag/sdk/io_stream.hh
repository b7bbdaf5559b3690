/**
 * @file io_stream.hh
 * @brief Seekable binary input stream abstraction
 * @ingroup sdk_io
 */

#ifndef AUDIOTAG_SDK_IO_STREAM_H
#define AUDIOTAG_SDK_IO_STREAM_H

#include <audiotag/sdk/types.hh>
#include <audiotag/export_audiotag.h>
#include <memory>

namespace audiotag {

/**
 * @enum seek_origin
 * @brief Seek origin for stream positioning
 * @ingroup sdk_io
 */
enum class seek_origin : int {
    set = 0,  ///< Seek from beginning of stream (SEEK_SET)
    cur = 1,  ///< Seek from current position (SEEK_CUR)
    end = 2   ///< Seek from end of stream (SEEK_END)
};

/**
 * @class io_stream
 * @brief Abstract interface for seekable binary input
 * @ingroup sdk_io
 *
 * Every container parser reads exclusively through this interface; none of
 * them assume the file is memory resident. The library never writes, so
 * the interface is read-only.
 *
 * ## Implementation Examples
 *
 * @code
 * class file_stream : public io_stream {
 *     FILE* m_file;
 * public:
 *     size_t read(void* ptr, size_t size) override {
 *         return fread(ptr, 1, size, m_file);
 *     }
 *     // ... other methods
 * };
 * @endcode
 *
 * ## Using I/O Streams
 *
 * @code
 * auto stream = io_from_file("audio.wav");
 *
 * uint32_t chunk_size;
 * if (!read_u32le(stream.get(), &chunk_size)) {
 *     // Handle error
 * }
 * @endcode
 *
 * @see io_from_file(), io_from_memory(), io_sub_stream()
 */
class io_stream {
public:
    /**
     * @brief Virtual destructor
     */
    virtual ~io_stream() = default;

    /**
     * @brief Read binary data from stream
     *
     * @param ptr Buffer to read into
     * @param size_bytes Number of bytes to read
     * @return Actual number of bytes read (may be less than requested)
     *
     * @note Returns 0 on EOF or error
     */
    virtual size_t read(void* ptr, size_t size_bytes) = 0;

    /**
     * @brief Seek to a position in the stream
     *
     * @param offset Byte offset from origin
     * @param whence Origin for seek operation
     * @return New position from start, or -1 on error
     *
     * Seeking outside [0, get_size()] is an error.
     */
    virtual int64_t seek(int64_t offset, seek_origin whence) = 0;

    /**
     * @brief Get current position in stream
     * @return Current byte position from start, or -1 on error
     */
    virtual int64_t tell() = 0;

    /**
     * @brief Get total size of stream
     * @return Total size in bytes, or -1 if unknown
     */
    virtual int64_t get_size() = 0;

    /**
     * @brief Close the stream
     * @note After closing every read and seek fails
     */
    virtual void close() = 0;

    /**
     * @brief Check if stream is open and usable
     * @return true if stream is open
     */
    [[nodiscard]] virtual bool is_open() const = 0;
};

/**
 * @defgroup io_endian Endian-aware I/O helpers
 * @ingroup sdk_io
 * @brief Convenience functions for reading binary data with endian conversion
 *
 * These return false on a short read instead of throwing; see
 * byte_reader.hh for the throwing counterparts used by the parsers.
 *
 * @{
 */

AUDIOTAG_EXPORT bool read_u8(io_stream* stream, uint8_t* value);
AUDIOTAG_EXPORT bool read_u16le(io_stream* stream, uint16_t* value);
AUDIOTAG_EXPORT bool read_u16be(io_stream* stream, uint16_t* value);

/**
 * @brief Read unsigned 32-bit little-endian value
 * @param stream Stream to read from
 * @param[out] value Value read (converted to native endian)
 * @return true on success, false on error
 *
 * @code
 * // Read RIFF chunk size
 * uint32_t chunk_size;
 * if (!read_u32le(stream.get(), &chunk_size)) {
 *     // Handle error
 * }
 * @endcode
 */
AUDIOTAG_EXPORT bool read_u32le(io_stream* stream, uint32_t* value);
AUDIOTAG_EXPORT bool read_u32be(io_stream* stream, uint32_t* value);
AUDIOTAG_EXPORT bool read_u64le(io_stream* stream, uint64_t* value);
AUDIOTAG_EXPORT bool read_u64be(io_stream* stream, uint64_t* value);

/** @} */ // end of io_endian group

/**
 * @defgroup io_factory I/O Stream Factory Functions
 * @ingroup sdk_io
 * @{
 */

/**
 * @brief Open a file for reading
 * @param filename Path to file
 * @return New io_stream, or nullptr if the file cannot be opened
 */
AUDIOTAG_EXPORT std::unique_ptr<io_stream> io_from_file(const char* filename);

/**
 * @brief Create a read-only memory-based I/O stream
 *
 * @param mem Pointer to memory buffer
 * @param size_bytes Size of buffer in bytes
 * @return New io_stream
 *
 * @note The memory must remain valid for the lifetime of the stream
 */
AUDIOTAG_EXPORT std::unique_ptr<io_stream> io_from_memory(const void* mem, size_t size_bytes);

/**
 * @brief Create a window onto a region of another stream
 *
 * Offsets of the returned stream are relative to @p offset. Reads never
 * go past @p offset + @p length even if the parent holds more data. The
 * parent cursor is moved by every read; callers re-seek the parent
 * afterwards.
 *
 * @param parent Stream to read from (not owned)
 * @param offset Absolute start of the window in @p parent
 * @param length Size of the window in bytes
 */
AUDIOTAG_EXPORT std::unique_ptr<io_stream> io_sub_stream(io_stream* parent, int64_t offset, int64_t length);

/** @} */ // end of io_factory group

} // namespace audiotag

#endif // AUDIOTAG_SDK_IO_STREAM_H
