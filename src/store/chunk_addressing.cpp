#include "store/chunk_addressing.hpp"
#include "store/store_error.hpp"
#include <string>

namespace docpipe {
namespace store {

namespace {

// A byte starts a character unless it is a UTF-8 continuation byte.
// Position 0 always starts one so stray continuation bytes are never orphaned.
inline bool starts_character(const std::string& text, std::size_t pos) {
  return pos == 0 || (static_cast<unsigned char>(text[pos]) & 0xC0) != 0x80;
}

void require_chunk_size(std::size_t chunk_size) {
  if (chunk_size == 0) {
    throw InvalidArgumentError("chunk size must be greater than zero");
  }
}

} // namespace

//==============================================
// INDEX ARITHMETIC
//==============================================

std::size_t chunk_count(std::size_t length, std::size_t chunk_size) {
  require_chunk_size(chunk_size);
  return length / chunk_size + (length % chunk_size != 0 ? 1 : 0);
}

ChunkRange chunk_range(std::size_t index, std::size_t length, std::size_t chunk_size) {
  const std::size_t count = chunk_count(length, chunk_size);
  if (index >= count) {
    throw OutOfRangeError("chunk " + std::to_string(index) + " of " + std::to_string(count));
  }

  ChunkRange range;
  range.begin = index * chunk_size;
  range.end = (length - range.begin < chunk_size) ? length : range.begin + chunk_size;
  return range;
}

std::size_t offset_to_index(std::size_t offset, std::size_t chunk_size) {
  require_chunk_size(chunk_size);
  return offset / chunk_size;
}

std::size_t normalize_request(std::size_t offset, std::size_t length, std::size_t chunk_size) {
  require_chunk_size(chunk_size);
  if (offset >= length) {
    throw OutOfRangeError("offset " + std::to_string(offset) + " of length " + std::to_string(length));
  }
  return offset_to_index(offset, chunk_size);
}


//==============================================
// CHARACTER SCANNING
//==============================================

std::size_t character_count(const std::string& text) {
  std::size_t count = 0;
  for (std::size_t pos = 0; pos < text.size(); ++pos) {
    if (starts_character(text, pos)) {
      ++count;
    }
  }
  return count;
}

std::vector<std::size_t> character_boundaries(const std::string& text, std::size_t chunk_size) {
  require_chunk_size(chunk_size);

  std::vector<std::size_t> boundaries;
  boundaries.push_back(0);

  std::size_t characters = 0;
  for (std::size_t pos = 0; pos < text.size(); ++pos) {
    if (!starts_character(text, pos)) {
      continue;
    }
    // Character number `characters` opens a new chunk when it sits on a multiple of chunk_size
    if (characters != 0 && characters % chunk_size == 0) {
      boundaries.push_back(pos);
    }
    ++characters;
  }

  if (!text.empty()) {
    boundaries.push_back(text.size());
  }
  return boundaries;
}

} // namespace store
} // namespace docpipe
