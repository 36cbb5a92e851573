#pragma once

#include <cstdint>
#include <istream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "store/content_entry.hpp"
#include "store/store_error.hpp"

namespace docpipe {
namespace store {

class ContentStore {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  ContentStore();


  // ---- CORE STORAGE OPERATIONS ----
  // Stores content under `id` (or a fresh id), replacing any prior entry with that id
  EntryInfo put(ContentKind kind, const std::string& content, std::size_t chunk_size,
                const std::optional<std::string>& id = std::nullopt);
  // Same as put, reading the content from a stream
  EntryInfo put_stream(ContentKind kind, std::istream& data, std::size_t chunk_size,
                       const std::optional<std::string>& id = std::nullopt);
  // Stores an already built entry. Used by the transform pipeline for derived entries.
  EntryInfo put_entry(ContentEntryPtr entry);
  // Releases the entry; clearing an absent id is a no-op
  void clear(const std::string& id);
  // Releases every entry
  void clear_all();


  // ---- READ OPERATIONS ----
  // Text of one chunk. Throws NotFoundError or OutOfRangeError.
  std::string get_chunk(const std::string& id, std::size_t index) const;
  // Metadata of one entry. Throws NotFoundError.
  EntryInfo get_info(const std::string& id) const;
  // Whole entry; the handle stays valid after the id is replaced or cleared
  ContentEntryPtr get_content(const std::string& id) const;


  // ---- QUERY OPERATIONS ----
  bool has(const std::string& id) const;
  std::vector<EntryInfo> list() const;
  std::size_t size() const;


  // ---- ID GENERATION ----
  // Returns "raw-<n>" or "derived-<n>"; never returns the same id twice
  std::string next_id(ContentKind kind);

  // SHA-256 of the content bytes as lowercase hex (OpenSSL EVP)
  static std::string digest(const std::string& content);

private:
  // ---- PARAMETERS ----
  mutable std::mutex mutex_;
  std::map<std::string, ContentEntryPtr> entries_;
  std::uint64_t id_counter_{0};
  std::uint64_t generation_counter_{0};


  // ---- LOOKUP SUPPORT ----
  // Caller must hold mutex_
  ContentEntryPtr find_locked(const std::string& id) const;
  // Resolves the optional id to a concrete one before locking
  std::string resolve_id(ContentKind kind, const std::optional<std::string>& id);
};

} // namespace store
} // namespace docpipe
