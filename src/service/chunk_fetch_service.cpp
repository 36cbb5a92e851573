#include "service/chunk_fetch_service.hpp"
#include "store/chunk_addressing.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>

namespace docpipe {
namespace service {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ChunkFetchService::ChunkFetchService(store::ContentStore& store, transform::TransformPipeline& pipeline)
  : store_(store)
  , pipeline_(pipeline) {
  BOOST_LOG_TRIVIAL(info) << "Fetch service: Initialized";
}


//==============================================
// CONTENT MANAGEMENT
//==============================================

store::EntryInfo ChunkFetchService::put_content(store::ContentKind kind, const std::string& text,
                                                std::size_t chunk_size, const std::optional<std::string>& id) {
  return store_.put(kind, text, chunk_size, id);
}

store::EntryInfo ChunkFetchService::put_stream(store::ContentKind kind, std::istream& data,
                                               std::size_t chunk_size, const std::optional<std::string>& id) {
  return store_.put_stream(kind, data, chunk_size, id);
}

store::EntryInfo ChunkFetchService::format_content(const std::string& source_id, const std::string& transform_name,
                                                   std::size_t chunk_size,
                                                   const std::optional<std::string>& target_id) {
  return pipeline_.format(source_id, transform_name, chunk_size, target_id);
}

void ChunkFetchService::clear(const std::string& id) {
  store_.clear(id);
}


//==============================================
// READS
//==============================================

store::EntryInfo ChunkFetchService::get_info(const std::string& id) const {
  return store_.get_info(id);
}

ChunkResponse ChunkFetchService::fetch_chunk(const std::string& id, std::size_t index) const {
  // One snapshot serves both the text and the metadata of the response
  store::ContentEntryPtr entry = store_.get_content(id);
  ChunkResponse response = make_response(*entry, index);

  BOOST_LOG_TRIVIAL(debug) << "Fetch service: Served chunk " << index << "/" << response.chunk_count
                           << " of " << id << (response.has_more ? "" : " (last)");
  return response;
}

ChunkResponse ChunkFetchService::fetch_at(const std::string& id, std::size_t offset) const {
  store::ContentEntryPtr entry = store_.get_content(id);
  const store::EntryInfo& info = entry->info();

  const std::size_t index = store::normalize_request(offset, info.length, info.chunk_size);
  BOOST_LOG_TRIVIAL(debug) << "Fetch service: Offset " << offset << " of " << id
                           << " normalized to chunk " << index;
  return make_response(*entry, index);
}

ChunkResponse ChunkFetchService::fetch_all(const std::string& id, std::size_t limit) const {
  store::ContentEntryPtr entry = store_.get_content(id);
  const store::EntryInfo& info = entry->info();

  if (info.length > limit) {
    BOOST_LOG_TRIVIAL(error) << "Fetch service: Entry " << id << " has " << info.length
                             << " characters, above the single-call limit of " << limit;
    throw store::InvalidArgumentError("entry " + id + " is too large to fetch in one call");
  }

  if (info.length == 0) {
    ChunkResponse empty;
    empty.id = info.id;
    return empty;
  }

  // Same text, one chunk wide; served through the ordinary chunk path
  store::ContentEntryPtr whole = entry->rechunk(std::max<std::size_t>(info.length, 1));
  BOOST_LOG_TRIVIAL(debug) << "Fetch service: Serving all " << info.length << " characters of " << id;
  return make_response(*whole, 0);
}

ChunkResponse ChunkFetchService::make_response(const store::ContentEntry& entry, std::size_t index) {
  const store::EntryInfo& info = entry.info();

  ChunkResponse response;
  response.id = info.id;
  response.generation = info.generation;
  response.index = index;
  response.content = entry.chunk(index);
  response.total_length = info.length;
  response.chunk_count = info.chunk_count;
  response.has_more = (index + 1) < info.chunk_count;
  response.next_index = response.has_more ? index + 1 : index;
  return response;
}

} // namespace service
} // namespace docpipe
