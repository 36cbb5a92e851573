#include "store/content_store.hpp"
#include "store/chunk_addressing.hpp"
#include <boost/log/trivial.hpp>
#include <openssl/evp.h>
#include <iomanip>
#include <sstream>
#include <utility>

namespace docpipe {
namespace store {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ContentStore::ContentStore() {
  BOOST_LOG_TRIVIAL(info) << "Content store: Initialized empty store";
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

EntryInfo ContentStore::put(ContentKind kind, const std::string& content, std::size_t chunk_size,
                            const std::optional<std::string>& id) {
  if (chunk_size == 0) {
    BOOST_LOG_TRIVIAL(error) << "Content store: Rejected put with zero chunk size";
    throw InvalidArgumentError("chunk size must be greater than zero");
  }

  EntryInfo info;
  info.id = resolve_id(kind, id);
  info.kind = kind;
  info.chunk_size = chunk_size;
  info.digest = digest(content);

  // Split and hash outside the lock; the map only ever sees finished entries
  auto entry = ContentEntry::create(std::move(info), std::make_shared<const std::string>(content));
  return put_entry(std::move(entry));
}

EntryInfo ContentStore::put_stream(ContentKind kind, std::istream& data, std::size_t chunk_size,
                                   const std::optional<std::string>& id) {
  if (!data.good()) {
    BOOST_LOG_TRIVIAL(error) << "Content store: Invalid input stream provided";
    throw InvalidArgumentError("invalid input stream");
  }

  std::string content;
  char buffer[4096];

  // Read input stream in blocks
  while (data.read(buffer, sizeof(buffer))) {
    content.append(buffer, data.gcount());
  }

  // Handle final partial block if present
  if (data.gcount() > 0) {
    content.append(buffer, data.gcount());
  }

  if (data.bad()) {
    BOOST_LOG_TRIVIAL(error) << "Content store: Stream failed after " << content.size() << " bytes";
    throw InvalidArgumentError("failed to read input stream");
  }

  BOOST_LOG_TRIVIAL(debug) << "Content store: Read " << content.size() << " bytes from stream";
  return put(kind, content, chunk_size, id);
}

EntryInfo ContentStore::put_entry(ContentEntryPtr entry) {
  if (!entry) {
    throw InvalidArgumentError("entry must not be null");
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    // Every write gets a fresh generation, so a replaced entry never matches its predecessor
    entry = entry->with_generation(++generation_counter_);
    const EntryInfo& info = entry->info();
    auto existing = entries_.find(info.id);
    if (existing != entries_.end()) {
      BOOST_LOG_TRIVIAL(debug) << "Content store: Replacing entry " << info.id;
      existing->second = entry;
    } else {
      entries_.emplace(info.id, entry);
    }
  }

  const EntryInfo& info = entry->info();
  BOOST_LOG_TRIVIAL(info) << "Content store: Stored " << info.kind << " entry " << info.id
                          << " (" << info.length << " characters, " << info.chunk_count
                          << " chunks of " << info.chunk_size << ", generation " << info.generation << ")";
  return info;
}

void ContentStore::clear(const std::string& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (entries_.erase(id) > 0) {
    BOOST_LOG_TRIVIAL(info) << "Content store: Cleared entry " << id;
  } else {
    BOOST_LOG_TRIVIAL(debug) << "Content store: Clear of absent entry " << id << " ignored";
  }
}

void ContentStore::clear_all() {
  std::lock_guard<std::mutex> lock(mutex_);
  BOOST_LOG_TRIVIAL(info) << "Content store: Clearing " << entries_.size() << " entries";
  entries_.clear();
}


//==============================================
// READ OPERATIONS
//==============================================

std::string ContentStore::get_chunk(const std::string& id, std::size_t index) const {
  ContentEntryPtr entry;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    entry = find_locked(id);
  }

  BOOST_LOG_TRIVIAL(debug) << "Content store: Reading chunk " << index << " of " << id;
  return entry->chunk(index);
}

EntryInfo ContentStore::get_info(const std::string& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return find_locked(id)->info();
}

ContentEntryPtr ContentStore::get_content(const std::string& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return find_locked(id);
}


//==============================================
// QUERY OPERATIONS
//==============================================

bool ContentStore::has(const std::string& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.count(id) > 0;
}

std::vector<EntryInfo> ContentStore::list() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<EntryInfo> infos;
  infos.reserve(entries_.size());
  for (const auto& [id, entry] : entries_) {
    infos.push_back(entry->info());
  }
  return infos;
}

std::size_t ContentStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}


//==============================================
// ID GENERATION AND HASHING
//==============================================

std::string ContentStore::next_id(ContentKind kind) {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::string(kind_to_string(kind)) + "-" + std::to_string(++id_counter_);
}

std::string ContentStore::digest(const std::string& content) {
  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;

  EVP_MD_CTX* ctx = EVP_MD_CTX_new();
  if (!ctx) {
    throw std::runtime_error("Content store: Failed to create hash context");
  }

  if (!EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) ||
      !EVP_DigestUpdate(ctx, content.data(), content.size()) ||
      !EVP_DigestFinal_ex(ctx, hash, &hash_len)) {
    EVP_MD_CTX_free(ctx);
    throw std::runtime_error("Content store: Failed to compute content digest");
  }
  EVP_MD_CTX_free(ctx);

  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
  }
  return ss.str();
}


//==============================================
// LOOKUP SUPPORT
//==============================================

ContentEntryPtr ContentStore::find_locked(const std::string& id) const {
  auto it = entries_.find(id);
  if (it == entries_.end()) {
    BOOST_LOG_TRIVIAL(error) << "Content store: Entry not found: " << id;
    throw NotFoundError(id);
  }
  return it->second;
}

std::string ContentStore::resolve_id(ContentKind kind, const std::optional<std::string>& id) {
  if (!id) {
    return next_id(kind);
  }
  if (id->empty()) {
    throw InvalidArgumentError("entry id must not be empty");
  }
  return *id;
}

} // namespace store
} // namespace docpipe
