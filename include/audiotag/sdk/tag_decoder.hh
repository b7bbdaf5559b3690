/**
 * @file tag_decoder.hh
 * @brief Interface to the decoders of tag payloads
 * @ingroup sdk_decoders
 */

#pragma once

#include <audiotag/export_audiotag.h>
#include <audiotag/metadata.hh>
#include <audiotag/sdk/io_stream.hh>

namespace audiotag {

    /**
     * @class tag_decoder
     * @brief Decodes the tag regions located by the container readers
     * @ingroup sdk_decoders
     *
     * Container readers find where tags live; turning the bytes of a tag
     * into fields is left to an implementation of this interface. Every
     * method receives a stream holding exactly the tag region (offset 0 is
     * the first byte of the tag) and merges what it finds into @p fields.
     * Implementations report malformed tags by throwing an audiotag_error.
     *
     * ## Implementing a Tag Decoder
     *
     * @code
     * class my_tags : public tag_decoder {
     * public:
     *     void decode_vorbis_comment(io_stream* s, tag_fields& f) override {
     *         // vendor string, then "KEY=value" pairs
     *     }
     *     // ... other methods
     * };
     * @endcode
     *
     * @see null_tag_decoder, read_from()
     */
    class AUDIOTAG_EXPORT tag_decoder {
        public:
            virtual ~tag_decoder();

            /**
             * @brief Decode a complete ID3v2 tag
             * @param stream Tag bytes, starting with the "ID3" header
             */
            virtual void decode_id3v2(io_stream* stream, tag_fields& fields) = 0;

            /**
             * @brief Decode the 128-byte ID3v1 trailer
             * @param stream Tag bytes, starting with "TAG"
             */
            virtual void decode_id3v1(io_stream* stream, tag_fields& fields) = 0;

            /**
             * @brief Decode a Vorbis comment body
             * @param stream Comment bytes after any packet prefix
             *               ("\x03vorbis", "OpusTags") or FLAC block header
             */
            virtual void decode_vorbis_comment(io_stream* stream, tag_fields& fields) = 0;

            /**
             * @brief Decode a FLAC PICTURE block body
             */
            virtual void decode_flac_picture(io_stream* stream, tag_fields& fields) = 0;

            /**
             * @brief Decode the metadata atoms of an MP4 file
             * @param stream The whole file
             */
            virtual void decode_mp4(io_stream* stream, tag_fields& fields) = 0;
    };

    /**
     * @class null_tag_decoder
     * @brief Ignores every tag region
     *
     * Useful when only the technical fields and duration are wanted.
     */
    class AUDIOTAG_EXPORT null_tag_decoder : public tag_decoder {
        public:
            void decode_id3v2(io_stream* stream, tag_fields& fields) override;
            void decode_id3v1(io_stream* stream, tag_fields& fields) override;
            void decode_vorbis_comment(io_stream* stream, tag_fields& fields) override;
            void decode_flac_picture(io_stream* stream, tag_fields& fields) override;
            void decode_mp4(io_stream* stream, tag_fields& fields) override;
    };

} // namespace audiotag
