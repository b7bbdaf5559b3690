/**
 * @file metadata.hh
 * @brief Queryable metadata produced by the container readers
 * @ingroup metadata
 */

// This is copyrighted software. More information is at the end of this file.
#pragma once

#include <audiotag/export_audiotag.h>
#include <audiotag/metadata_types.hh>
#include <audiotag/sdk/types.hh>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace audiotag {

    /**
     * @struct picture
     * @brief Embedded cover art as handed back by a tag decoder
     */
    struct picture {
        std::string ext;          ///< File extension, e.g. "jpg"
        std::string mime_type;    ///< e.g. "image/jpeg"
        std::string type;         ///< Picture role, e.g. "Cover (front)"
        std::string description;
        std::vector<uint8_t> data;
    };

    /**
     * @typedef raw_value
     * @brief Value of a raw (machine-facing) metadata entry
     *
     * Technical fields read from container headers are numbers; entries
     * supplied by tag decoders are strings.
     */
    using raw_value = std::variant<uint64_t, std::string>;
    using raw_map = std::map<std::string, raw_value>;

    /**
     * @struct tag_fields
     * @brief Conventional tag fields filled by a tag_decoder
     *
     * Every member defaults to its zero value, which is also what the
     * metadata accessors return when a field is absent.
     */
    struct tag_fields {
        tag_format format = tag_format::unknown;
        std::string title;
        std::string album;
        std::string artist;
        std::string album_artist;
        std::string composer;
        std::string genre;
        std::string comment;
        std::string lyrics;
        int year = 0;
        int track = 0;
        int track_total = 0;
        int disc = 0;
        int disc_total = 0;
        std::shared_ptr<const picture> cover;
        raw_map raw;
    };

    /**
     * @class metadata
     * @brief Read-only view of everything extracted from one audio stream
     * @ingroup metadata
     *
     * Each container reader returns its own implementation of this
     * interface. A container that cannot express a field returns the zero
     * value of the field's type rather than failing.
     *
     * @code
     * auto stream = io_from_file("song.flac");
     * null_tag_decoder tags;
     * auto meta = read_from(stream.get(), tags);
     * std::cout << to_string(meta->get_file_type()) << " "
     *           << std::chrono::duration_cast<std::chrono::seconds>(meta->duration()).count()
     *           << "s\n";
     * @endcode
     */
    class AUDIOTAG_EXPORT metadata {
        public:
            virtual ~metadata();

            [[nodiscard]] virtual tag_format get_format() const = 0;
            [[nodiscard]] virtual file_type get_file_type() const = 0;

            [[nodiscard]] virtual std::string get_title() const = 0;
            [[nodiscard]] virtual std::string get_album() const = 0;
            [[nodiscard]] virtual std::string get_artist() const = 0;
            [[nodiscard]] virtual std::string get_album_artist() const = 0;
            [[nodiscard]] virtual std::string get_composer() const = 0;
            [[nodiscard]] virtual std::string get_genre() const = 0;
            [[nodiscard]] virtual std::string get_comment() const = 0;
            [[nodiscard]] virtual std::string get_lyrics() const = 0;
            [[nodiscard]] virtual int get_year() const = 0;

            /**
             * @brief Track number
             * @return (number, total), both 0 when absent
             */
            [[nodiscard]] virtual std::pair<int, int> get_track() const = 0;

            /**
             * @brief Disc number
             * @return (number, total), both 0 when absent
             */
            [[nodiscard]] virtual std::pair<int, int> get_disc() const = 0;

            /**
             * @brief Embedded picture
             * @return nullptr when the file has none
             */
            [[nodiscard]] virtual const picture* get_picture() const = 0;

            /**
             * @brief Playback duration
             * @return Zero when the container gives no way to compute it
             */
            [[nodiscard]] virtual duration_t duration() const = 0;

            /**
             * @brief Container-specific technical fields and raw tag entries
             *
             * Keys are stable snake_case names such as "sample_rate",
             * "channels", "bits_per_sample" and "data_size".
             */
            [[nodiscard]] virtual raw_map raw() const = 0;
    };

    /**
     * @class tagged_metadata
     * @brief Implements the tag accessors of metadata from a tag_fields value
     *
     * Container variants derive from this and supply file type, duration
     * and technical raw fields.
     */
    class AUDIOTAG_EXPORT tagged_metadata : public metadata {
        public:
            explicit tagged_metadata(tag_fields tags);

            [[nodiscard]] tag_format get_format() const override;
            [[nodiscard]] std::string get_title() const override;
            [[nodiscard]] std::string get_album() const override;
            [[nodiscard]] std::string get_artist() const override;
            [[nodiscard]] std::string get_album_artist() const override;
            [[nodiscard]] std::string get_composer() const override;
            [[nodiscard]] std::string get_genre() const override;
            [[nodiscard]] std::string get_comment() const override;
            [[nodiscard]] std::string get_lyrics() const override;
            [[nodiscard]] int get_year() const override;
            [[nodiscard]] std::pair<int, int> get_track() const override;
            [[nodiscard]] std::pair<int, int> get_disc() const override;
            [[nodiscard]] const picture* get_picture() const override;
            [[nodiscard]] raw_map raw() const override;

            [[nodiscard]] const tag_fields& tags() const { return m_tags; }

        protected:
            // Technical entries of the container; merged over the tag entries by raw()
            [[nodiscard]] virtual raw_map technical_fields() const;

        private:
            tag_fields m_tags;
    };

} // namespace audiotag

/*
 * Copyright (C) 2025
 *
 * This file is part of audiotag.
 *
 * audiotag is free software: you can redistribute it and/or modify it under
 * the terms of the GNU Lesser General Public License as published by the Free
 * Software Foundation, either version 3 of the License, or (at your option) any
 * later version.
 *
 * audiotag is distributed in the hope that it will be useful, but WITHOUT ANY
 * WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR
 * A PARTICULAR PURPOSE.  See the GNU Lesser General Public License for more
 * details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with audiotag.  If not, see <http://www.gnu.org/licenses/>.
 */
