#pragma once

#include <atomic>
#include <memory>
#include <thread>
#include <boost/asio.hpp>
#include "service/fetch_client.hpp"

namespace docpipe {
namespace service {

// Runs fetches on a dedicated io_context thread and invokes handlers there.
// Requests are served in submission order.
class AsyncFetchClient : public FetchClient {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit AsyncFetchClient(const ChunkFetchService& service);
  ~AsyncFetchClient() override;


  // ---- REQUESTS ----
  // Queues the request; ignored after shutdown
  void fetch_chunk(const std::string& id, std::size_t index, FetchHandler handler) override;


  // ---- TEARDOWN ----
  // Stops the worker; queued requests are dropped without calling their handlers
  void shutdown();
  bool is_running() const { return running_; }

private:
  // ---- PARAMETERS ----
  const ChunkFetchService& service_;
  boost::asio::io_context io_context_;
  std::unique_ptr<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_;
  std::unique_ptr<std::thread> io_thread_;
  std::atomic<bool> running_{false};
};

} // namespace service
} // namespace docpipe
