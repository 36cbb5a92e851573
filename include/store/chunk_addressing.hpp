#ifndef DOCPIPE_STORE_CHUNK_ADDRESSING_HPP
#define DOCPIPE_STORE_CHUNK_ADDRESSING_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace docpipe {
namespace store {

/**
 * Chunk addressing law shared by the write path (splitting) and the read path (serving).
 *
 * Lengths and offsets are counted in characters. A character is a UTF-8 code point:
 * every byte that is not a continuation byte starts one. Chunk i owns the half-open
 * character range [i * chunk_size, min((i + 1) * chunk_size, length)).
 */

// Half-open character range owned by one chunk
struct ChunkRange {
    std::size_t begin;
    std::size_t end;

    std::size_t size() const { return end - begin; }
};

// ceil(length / chunk_size); zero for empty content. Throws InvalidArgumentError if chunk_size is 0.
std::size_t chunk_count(std::size_t length, std::size_t chunk_size);

// Range of chunk `index`. Throws OutOfRangeError if index >= chunk_count.
ChunkRange chunk_range(std::size_t index, std::size_t length, std::size_t chunk_size);

// floor(offset / chunk_size)
std::size_t offset_to_index(std::size_t offset, std::size_t chunk_size);

// Maps a start-offset request to the canonical index of the chunk owning that offset.
// Throws OutOfRangeError if offset >= length.
std::size_t normalize_request(std::size_t offset, std::size_t length, std::size_t chunk_size);

// Number of characters in a UTF-8 string
std::size_t character_count(const std::string& text);

// Byte offsets of every chunk boundary: chunk_count + 1 entries, first 0 and last text.size().
// Empty text yields the single entry {0}.
std::vector<std::size_t> character_boundaries(const std::string& text, std::size_t chunk_size);

} // namespace store
} // namespace docpipe

#endif // DOCPIPE_STORE_CHUNK_ADDRESSING_HPP
