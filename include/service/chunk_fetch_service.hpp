#ifndef DOCPIPE_SERVICE_CHUNK_FETCH_SERVICE_HPP
#define DOCPIPE_SERVICE_CHUNK_FETCH_SERVICE_HPP

#include <optional>
#include <string>
#include "service/chunk_messages.hpp"
#include "store/content_store.hpp"
#include "transform/transform_pipeline.hpp"

namespace docpipe {
namespace service {

// Largest entry fetch_all serves by default, in characters
constexpr std::size_t DEFAULT_FETCH_ALL_LIMIT = 100 * 1024 * 1024;

// Boundary between the content store and its UI-facing consumers. Every read goes
// through fetch_chunk; the other reads are wrappers over the same addressing law.
class ChunkFetchService {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  ChunkFetchService(store::ContentStore& store, transform::TransformPipeline& pipeline);


  // ---- CONTENT MANAGEMENT ----
  store::EntryInfo put_content(store::ContentKind kind, const std::string& text, std::size_t chunk_size,
                               const std::optional<std::string>& id = std::nullopt);
  store::EntryInfo put_stream(store::ContentKind kind, std::istream& data, std::size_t chunk_size,
                              const std::optional<std::string>& id = std::nullopt);
  store::EntryInfo format_content(const std::string& source_id, const std::string& transform_name,
                                  std::size_t chunk_size,
                                  const std::optional<std::string>& target_id = std::nullopt);
  // Idempotent
  void clear(const std::string& id);


  // ---- READS ----
  store::EntryInfo get_info(const std::string& id) const;
  // Canonical read. Throws NotFoundError or OutOfRangeError.
  ChunkResponse fetch_chunk(const std::string& id, std::size_t index) const;
  ChunkResponse get_chunk(const std::string& id, std::size_t index) const { return fetch_chunk(id, index); }
  // Start-offset request, normalised to the chunk owning `offset`
  ChunkResponse fetch_at(const std::string& id, std::size_t offset) const;
  // Whole entry as chunk 0 of a one-chunk view. Throws InvalidArgumentError above `limit`.
  ChunkResponse fetch_all(const std::string& id, std::size_t limit = DEFAULT_FETCH_ALL_LIMIT) const;

private:
  // ---- PARAMETERS ----
  store::ContentStore& store_;
  transform::TransformPipeline& pipeline_;


  // Slices one chunk of an entry snapshot into a response
  static ChunkResponse make_response(const store::ContentEntry& entry, std::size_t index);
};

} // namespace service
} // namespace docpipe

#endif // DOCPIPE_SERVICE_CHUNK_FETCH_SERVICE_HPP
