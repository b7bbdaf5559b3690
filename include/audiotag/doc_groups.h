/**
 * @file doc_groups.h
 * @brief Doxygen group definitions for audiotag
 *
 * This file defines the module/group structure for the documentation.
 * It doesn't contain any actual code.
 */

#ifndef AUDIOTAG_DOC_GROUPS_H
#define AUDIOTAG_DOC_GROUPS_H

/**
 * @defgroup audiotag audiotag
 * @brief Container level metadata extraction for audio files
 */

/**
 * @defgroup containers Container Readers
 * @ingroup audiotag
 * @brief One reader per supported container
 *
 * Each reader validates its container's signature, extracts the technical
 * fields needed for duration and hands tag regions to a tag_decoder:
 * - RIFF/WAVE chunk walker
 * - FLAC metadata block walker
 * - OGG page demuxer (Vorbis, Opus)
 * - MPEG frame header decoder
 * - DSF header reader
 */

/**
 * @defgroup metadata Metadata Results
 * @ingroup audiotag
 * @brief Queryable result of reading one file
 */

/**
 * @defgroup sdk_types Basic Types
 * @ingroup audiotag
 * @brief Sample rate, channel and duration types
 */

/**
 * @defgroup sdk_io Stream I/O
 * @ingroup audiotag
 * @brief Seekable byte streams and exact-length reads
 */

/**
 * @defgroup sdk_decoders Tag Decoders
 * @ingroup audiotag
 * @brief Interface for turning tag regions into fields
 */

#endif // AUDIOTAG_DOC_GROUPS_H
