#ifndef DOCPIPE_STORE_CONTENT_ENTRY_HPP
#define DOCPIPE_STORE_CONTENT_ENTRY_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace docpipe {
namespace store {

// Raw entries are user-supplied, derived entries come out of a transform
enum class ContentKind {
  RAW,
  DERIVED
};

const char* kind_to_string(ContentKind kind);
std::ostream& operator<<(std::ostream& os, ContentKind kind);

// Metadata callers use to decide between chunked and direct handling
struct EntryInfo {
  std::string id;
  ContentKind kind{ContentKind::RAW};
  std::size_t length{0};        // characters
  std::size_t byte_length{0};
  std::size_t chunk_size{0};
  std::size_t chunk_count{0};
  std::string digest;           // SHA-256 of the content bytes, lowercase hex
  std::uint64_t generation{0};  // assigned by the store on every put; never reused
  std::string source_id;        // derived entries only
  std::string transform;        // derived entries only
};

class ContentEntry;
using ContentEntryPtr = std::shared_ptr<const ContentEntry>;

// Immutable once built. The text is stored once and sliced on read; only the
// byte offsets of chunk boundaries are precomputed.
class ContentEntry {
public:
  // ---- CONSTRUCTION ----
  // Builds an entry over shared text. Throws InvalidArgumentError if chunk_size is 0.
  static ContentEntryPtr create(EntryInfo info, std::shared_ptr<const std::string> text);

  // Same text, different chunk size. Used to serve a whole entry as a single chunk.
  ContentEntryPtr rechunk(std::size_t chunk_size) const;

  // Same text and boundaries, stamped with the store's generation
  ContentEntryPtr with_generation(std::uint64_t generation) const;


  // ---- READS ----
  // Text of chunk `index`. Throws OutOfRangeError if index >= chunk_count.
  std::string chunk(std::size_t index) const;
  const std::string& text() const { return *text_; }
  const EntryInfo& info() const { return info_; }

  ContentEntry(EntryInfo info, std::shared_ptr<const std::string> text,
               std::vector<std::size_t> boundaries);

private:
  // ---- PARAMETERS ----
  EntryInfo info_;
  std::shared_ptr<const std::string> text_;
  std::vector<std::size_t> boundaries_;
};

} // namespace store
} // namespace docpipe

#endif // DOCPIPE_STORE_CONTENT_ENTRY_HPP
