#include "store/content_entry.hpp"
#include "store/chunk_addressing.hpp"
#include "store/store_error.hpp"
#include <boost/log/trivial.hpp>
#include <utility>

namespace docpipe {
namespace store {

const char* kind_to_string(ContentKind kind) {
  switch (kind) {
    case ContentKind::RAW:     return "raw";
    case ContentKind::DERIVED: return "derived";
    default:                   return "unknown";
  }
}

std::ostream& operator<<(std::ostream& os, ContentKind kind) {
  os << kind_to_string(kind);
  return os;
}


//==============================================
// CONSTRUCTION
//==============================================

ContentEntry::ContentEntry(EntryInfo info, std::shared_ptr<const std::string> text,
                           std::vector<std::size_t> boundaries)
  : info_(std::move(info))
  , text_(std::move(text))
  , boundaries_(std::move(boundaries)) {}

ContentEntryPtr ContentEntry::create(EntryInfo info, std::shared_ptr<const std::string> text) {
  if (!text) {
    throw InvalidArgumentError("content must not be null");
  }

  // Throws InvalidArgumentError on a zero chunk size
  std::vector<std::size_t> boundaries = character_boundaries(*text, info.chunk_size);

  info.byte_length = text->size();
  info.length = character_count(*text);
  info.chunk_count = boundaries.size() - 1;

  return std::make_shared<const ContentEntry>(std::move(info), std::move(text), std::move(boundaries));
}

ContentEntryPtr ContentEntry::rechunk(std::size_t chunk_size) const {
  EntryInfo info = info_;
  info.chunk_size = chunk_size;
  return create(std::move(info), text_);
}

ContentEntryPtr ContentEntry::with_generation(std::uint64_t generation) const {
  EntryInfo info = info_;
  info.generation = generation;
  return std::make_shared<const ContentEntry>(std::move(info), text_, boundaries_);
}


//==============================================
// READS
//==============================================

std::string ContentEntry::chunk(std::size_t index) const {
  // Validates the index against the same law used when splitting
  const ChunkRange range = chunk_range(index, info_.length, info_.chunk_size);

  const std::size_t first = boundaries_[index];
  const std::size_t last = boundaries_[index + 1];
  BOOST_LOG_TRIVIAL(trace) << "Content entry: " << info_.id << " chunk " << index
                           << " characters [" << range.begin << ", " << range.end
                           << ") bytes [" << first << ", " << last << ")";
  return text_->substr(first, last - first);
}

} // namespace store
} // namespace docpipe
