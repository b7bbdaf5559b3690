// This is copyrighted software. More information is at the end of this file.
#include <audiotag/metadata.hh>

namespace audiotag {

    const char* to_string(tag_format format) {
        switch (format) {
            case tag_format::id3v1: return "ID3v1";
            case tag_format::id3v2_2: return "ID3v2.2";
            case tag_format::id3v2_3: return "ID3v2.3";
            case tag_format::id3v2_4: return "ID3v2.4";
            case tag_format::mp4: return "MP4";
            case tag_format::vorbis: return "VORBIS";
            case tag_format::unknown: break;
        }
        return "";
    }

    const char* to_string(file_type type) {
        switch (type) {
            case file_type::mp3: return "MP3";
            case file_type::m4a: return "M4A";
            case file_type::m4b: return "M4B";
            case file_type::m4p: return "M4P";
            case file_type::flac: return "FLAC";
            case file_type::ogg: return "OGG";
            case file_type::wav: return "WAV";
            case file_type::dsf: return "DSF";
            case file_type::unknown: break;
        }
        return "";
    }

    metadata::~metadata() = default;

    tagged_metadata::tagged_metadata(tag_fields tags)
        : m_tags(std::move(tags)) {
    }

    tag_format tagged_metadata::get_format() const {
        return m_tags.format;
    }

    std::string tagged_metadata::get_title() const {
        return m_tags.title;
    }

    std::string tagged_metadata::get_album() const {
        return m_tags.album;
    }

    std::string tagged_metadata::get_artist() const {
        return m_tags.artist;
    }

    std::string tagged_metadata::get_album_artist() const {
        return m_tags.album_artist;
    }

    std::string tagged_metadata::get_composer() const {
        return m_tags.composer;
    }

    std::string tagged_metadata::get_genre() const {
        return m_tags.genre;
    }

    std::string tagged_metadata::get_comment() const {
        return m_tags.comment;
    }

    std::string tagged_metadata::get_lyrics() const {
        return m_tags.lyrics;
    }

    int tagged_metadata::get_year() const {
        return m_tags.year;
    }

    std::pair<int, int> tagged_metadata::get_track() const {
        return {m_tags.track, m_tags.track_total};
    }

    std::pair<int, int> tagged_metadata::get_disc() const {
        return {m_tags.disc, m_tags.disc_total};
    }

    const picture* tagged_metadata::get_picture() const {
        return m_tags.cover.get();
    }

    raw_map tagged_metadata::raw() const {
        raw_map result = m_tags.raw;
        for (auto& [key, value] : technical_fields()) {
            result[key] = std::move(value);
        }
        return result;
    }

    raw_map tagged_metadata::technical_fields() const {
        return {};
    }

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
