/**
 * @file identify.hh
 * @brief Format sniffing
 */

#pragma once

#include <audiotag/export_audiotag.h>
#include <audiotag/metadata_types.hh>
#include <audiotag/options.hh>
#include <audiotag/sdk/io_stream.hh>

namespace audiotag {

    /**
     * @struct identification
     * @brief Tag dialect and container of a stream
     */
    struct identification {
        tag_format format = tag_format::unknown;
        file_type type = file_type::unknown;
    };

    /**
     * @brief Classify the stream starting at the cursor
     *
     * Looks at the first 12 bytes for the FLAC, OGG, MP4, ID3v2, DSF and
     * RIFF/WAVE signatures, in that order, and otherwise for an ID3v1 trailer
     * at the end of the stream.
     *
     * A RIFF/WAVE stream is looked through: the bytes following its audio
     * payload are identified in turn and their tag format is reported with
     * file type WAV. Nothing after the audio yields (unknown, wav).
     *
     * The cursor position afterwards is unspecified.
     *
     * @throws unsupported_version_error for ID3v2 versions other than 2, 3, 4
     * @throws no_tags_found_error if nothing matched
     * @throws audiotag_error from the RIFF scan, with container_hint() WAV
     */
    AUDIOTAG_EXPORT identification identify(io_stream* stream, const read_options& options = {});

} // namespace audiotag
