#include "service/fetch_client.hpp"
#include <boost/log/trivial.hpp>
#include <exception>
#include <utility>

namespace docpipe {
namespace service {

FetchResult guarded_fetch(const ChunkRequest& request, const std::function<ChunkResponse()>& fetch) {
  try {
    return FetchResult::success(fetch());
  } catch (const store::StoreError& e) {
    BOOST_LOG_TRIVIAL(error) << "Fetch client: Request for chunk " << request.index << " of "
                             << request.id << " failed: " << e.what();
    return FetchResult::failure(e.kind(), e.what());
  } catch (const std::exception& e) {
    // May run on the async worker; nothing may escape into its io_context
    BOOST_LOG_TRIVIAL(error) << "Fetch client: Request for chunk " << request.index << " of "
                             << request.id << " raised an unexpected error: " << e.what();
    return FetchResult::failure(ErrorKind::INTERNAL_ERROR, e.what());
  }
}

FetchResult execute_fetch(const ChunkFetchService& service, const ChunkRequest& request) {
  return guarded_fetch(request, [&service, &request]() { return service.fetch_chunk(request.id, request.index); });
}

LocalFetchClient::LocalFetchClient(const ChunkFetchService& service)
  : service_(service) {}

void LocalFetchClient::fetch_chunk(const std::string& id, std::size_t index, FetchHandler handler) {
  ChunkRequest request{id, index};
  handler(execute_fetch(service_, request));
}

} // namespace service
} // namespace docpipe
