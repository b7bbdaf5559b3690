/**
 * @file reader.hh
 * @brief One-call metadata extraction
 */

#pragma once

#include <audiotag/export_audiotag.h>
#include <audiotag/metadata.hh>
#include <audiotag/options.hh>
#include <audiotag/sdk/io_stream.hh>
#include <audiotag/sdk/tag_decoder.hh>
#include <memory>

namespace audiotag {

    /**
     * @brief Identify the stream and run the matching container reader
     *
     * The whole stream, from offset 0, is examined. MP3 durations use the
     * stream size as the total byte count.
     *
     * @code
     * auto stream = audiotag::io_from_file("song.flac");
     * audiotag::null_tag_decoder tags;
     * auto meta = audiotag::read_from(stream.get(), tags);
     * auto secs = std::chrono::duration_cast<std::chrono::seconds>(meta->duration());
     * @endcode
     *
     * @throws audiotag_error from identification or from the container reader
     */
    AUDIOTAG_EXPORT std::unique_ptr<metadata> read_from(io_stream* stream, tag_decoder& tags,
                                                        const read_options& options = {});

} // namespace audiotag
