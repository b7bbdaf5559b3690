// This is copyrighted software. More information is at the end of this file.
#pragma once

#include <audiotag/export_audiotag.h>
#include <audiotag/metadata_types.hh>
#include <stdexcept>
#include <string>

namespace audiotag {

/**
 * @brief Classification of every failure a parser can report
 */
enum class error_kind {
    io,                     ///< Short read, failed seek, end of stream
    format_mismatch,        ///< Expected magic or marker absent
    unsupported_version,    ///< Recognised but unhandled version (e.g. ID3v2.1)
    unsupported_format,     ///< Recognised but unhandled variant (e.g. non-PCM WAV)
    checksum_mismatch,      ///< OGG page CRC failure
    orphaned_continuation,  ///< Continued OGG page with no pending packet
    no_tags_found,          ///< Nothing recognisable in the stream
    invalid_argument        ///< Bit range or length out of bounds
};

AUDIOTAG_EXPORT const char* to_string(error_kind kind);

/**
 * @brief Base exception class for all audiotag errors
 *
 * All audiotag-specific exceptions derive from this class, making it easy
 * to catch all parser errors with a single catch block. The error also
 * carries a best-guess container type: the identifier fills it in when it
 * already knows the outer container (WAV) but a nested step failed.
 */
class AUDIOTAG_EXPORT audiotag_error : public std::runtime_error {
public:
    audiotag_error(error_kind kind, const std::string& what);

    [[nodiscard]] error_kind kind() const noexcept { return m_kind; }

    /**
     * @brief Container type known at the point of failure
     * @return file_type::unknown unless a caller attached a hint
     */
    [[nodiscard]] file_type container_hint() const noexcept { return m_container_hint; }

    void set_container_hint(file_type type) noexcept { m_container_hint = type; }

private:
    error_kind m_kind;
    file_type m_container_hint = file_type::unknown;
};

/**
 * @brief I/O stream related errors
 *
 * Thrown when:
 * - fewer bytes than requested are available
 * - a seek lands outside the stream
 * - a declared length exceeds what the stream holds
 */
class AUDIOTAG_EXPORT io_error : public audiotag_error {
public:
    explicit io_error(const std::string& what)
        : audiotag_error(error_kind::io, what) {}
};

/**
 * @brief Expected magic number or marker was not found
 */
class AUDIOTAG_EXPORT format_mismatch_error : public audiotag_error {
public:
    explicit format_mismatch_error(const std::string& what)
        : audiotag_error(error_kind::format_mismatch, what) {}
};

class AUDIOTAG_EXPORT unsupported_version_error : public audiotag_error {
public:
    explicit unsupported_version_error(const std::string& what)
        : audiotag_error(error_kind::unsupported_version, what) {}
};

/**
 * @brief Container variant is recognised but not handled
 *
 * Thrown for non-PCM WAV payloads and reserved MPEG header values.
 */
class AUDIOTAG_EXPORT unsupported_format_error : public audiotag_error {
public:
    explicit unsupported_format_error(const std::string& what)
        : audiotag_error(error_kind::unsupported_format, what) {}
};

class AUDIOTAG_EXPORT checksum_error : public audiotag_error {
public:
    explicit checksum_error(const std::string& what)
        : audiotag_error(error_kind::checksum_mismatch, what) {}
};

class AUDIOTAG_EXPORT orphaned_continuation_error : public audiotag_error {
public:
    explicit orphaned_continuation_error(const std::string& what)
        : audiotag_error(error_kind::orphaned_continuation, what) {}
};

class AUDIOTAG_EXPORT no_tags_found_error : public audiotag_error {
public:
    explicit no_tags_found_error(const std::string& what)
        : audiotag_error(error_kind::no_tags_found, what) {}
};

class AUDIOTAG_EXPORT invalid_argument_error : public audiotag_error {
public:
    explicit invalid_argument_error(const std::string& what)
        : audiotag_error(error_kind::invalid_argument, what) {}
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
