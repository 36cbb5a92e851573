#include "service/async_fetch_client.hpp"
#include <boost/log/trivial.hpp>
#include <utility>

namespace docpipe {
namespace service {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

AsyncFetchClient::AsyncFetchClient(const ChunkFetchService& service)
  : service_(service)
  , work_(std::make_unique<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>(
      boost::asio::make_work_guard(io_context_))) {
  running_ = true;

  // Start io_context in a separate thread
  io_thread_ = std::make_unique<std::thread>([this]() {
    try {
      io_context_.run();
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Async fetch client: IO context error: " << e.what();
      running_ = false;
    }
  });

  BOOST_LOG_TRIVIAL(info) << "Async fetch client: Worker started";
}

AsyncFetchClient::~AsyncFetchClient() {
  shutdown();
}


//==============================================
// REQUESTS
//==============================================

void AsyncFetchClient::fetch_chunk(const std::string& id, std::size_t index, FetchHandler handler) {
  if (!running_) {
    BOOST_LOG_TRIVIAL(warning) << "Async fetch client: Dropping request for chunk " << index
                               << " of " << id << " after shutdown";
    return;
  }

  BOOST_LOG_TRIVIAL(debug) << "Async fetch client: Queued request for chunk " << index << " of " << id;
  ChunkRequest request{id, index};
  boost::asio::post(io_context_, [this, request = std::move(request), handler = std::move(handler)]() {
    if (!running_) {
      return;
    }
    handler(execute_fetch(service_, request));
  });
}


//==============================================
// TEARDOWN
//==============================================

// Must not be called from inside a fetch handler
void AsyncFetchClient::shutdown() {
  if (!io_thread_) {
    return;
  }

  running_ = false;
  work_.reset();
  io_context_.stop();

  if (io_thread_->joinable()) {
    io_thread_->join();
  }
  io_thread_.reset();
  BOOST_LOG_TRIVIAL(info) << "Async fetch client: Worker stopped";
}

} // namespace service
} // namespace docpipe
