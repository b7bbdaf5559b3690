/**
 * @file metadata_types.hh
 * @brief Tag dialect and container enumerations
 * @ingroup metadata
 */

#pragma once

#include <audiotag/export_audiotag.h>

namespace audiotag {

    /**
     * @enum tag_format
     * @brief Dialect of the tag data embedded in a file
     */
    enum class tag_format {
        unknown,
        id3v1,
        id3v2_2,
        id3v2_3,
        id3v2_4,
        mp4,
        vorbis    ///< Vorbis-style comments (FLAC, OGG Vorbis, Opus)
    };

    /**
     * @enum file_type
     * @brief Container the audio is stored in
     *
     * MP4 files are reported by their brand (M4A, M4B, M4P); an MP4 file
     * with any other brand is reported as unknown.
     */
    enum class file_type {
        unknown,
        mp3,
        m4a,
        m4b,
        m4p,
        flac,
        ogg,
        wav,
        dsf
    };

    AUDIOTAG_EXPORT const char* to_string(tag_format format);
    AUDIOTAG_EXPORT const char* to_string(file_type type);

    /**
     * @brief True for the three ID3v2 dialects
     */
    inline bool is_id3v2(tag_format format) {
        return format == tag_format::id3v2_2 ||
               format == tag_format::id3v2_3 ||
               format == tag_format::id3v2_4;
    }

} // namespace audiotag
