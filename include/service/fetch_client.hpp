#ifndef DOCPIPE_SERVICE_FETCH_CLIENT_HPP
#define DOCPIPE_SERVICE_FETCH_CLIENT_HPP

#include <functional>
#include <string>
#include "service/chunk_fetch_service.hpp"
#include "service/chunk_messages.hpp"

namespace docpipe {
namespace service {

using FetchHandler = std::function<void(FetchResult)>;

// Request side of the fetch contract as seen by client code. The handler is called
// exactly once per request unless the client is shut down first.
class FetchClient {
public:
  virtual ~FetchClient() = default;

  virtual void fetch_chunk(const std::string& id, std::size_t index, FetchHandler handler) = 0;
};

// Serves requests synchronously: the handler runs before fetch_chunk returns
class LocalFetchClient : public FetchClient {
public:
  explicit LocalFetchClient(const ChunkFetchService& service);

  void fetch_chunk(const std::string& id, std::size_t index, FetchHandler handler) override;

private:
  const ChunkFetchService& service_;
};

// Runs `fetch` for `request` and turns any exception into a classified failure. Store
// errors keep their kind; anything else is reported as INTERNAL_ERROR.
FetchResult guarded_fetch(const ChunkRequest& request, const std::function<ChunkResponse()>& fetch);

// Runs one request against the service and classifies any failure
FetchResult execute_fetch(const ChunkFetchService& service, const ChunkRequest& request);

} // namespace service
} // namespace docpipe

#endif // DOCPIPE_SERVICE_FETCH_CLIENT_HPP
