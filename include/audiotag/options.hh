/**
 * @file options.hh
 * @brief Run-time limits for identification and dispatch
 */

#pragma once

namespace audiotag {

    /**
     * @struct read_options
     * @brief Limits applied while reading a single stream
     */
    struct read_options {
        /**
         * How many RIFF/WAVE envelopes the identifier looks through when
         * searching for a tag that follows the audio payload.
         */
        unsigned max_wav_wrap_depth = 2;
    };

} // namespace audiotag
