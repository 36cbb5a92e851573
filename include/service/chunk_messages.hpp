#ifndef DOCPIPE_SERVICE_CHUNK_MESSAGES_HPP
#define DOCPIPE_SERVICE_CHUNK_MESSAGES_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include "store/store_error.hpp"

namespace docpipe {
namespace service {

// Canonical request: one entry, one chunk index
struct ChunkRequest {
    std::string id;
    std::size_t index{0};
};

// Unit of transfer. next_index is only meaningful when has_more is set.
// generation identifies which write of `id` the chunk was cut from.
struct ChunkResponse {
    std::string id;
    std::uint64_t generation{0};
    std::size_t index{0};
    std::string content;
    bool has_more{false};
    std::size_t total_length{0};
    std::size_t chunk_count{0};
    std::size_t next_index{0};
};

// Outcome delivered to asynchronous callers: a response or a classified failure
struct FetchResult {
    std::optional<ChunkResponse> response;
    ErrorKind error{ErrorKind::NOT_FOUND};
    std::string message;

    bool ok() const { return response.has_value(); }

    static FetchResult success(ChunkResponse response) {
        FetchResult result;
        result.response = std::move(response);
        return result;
    }

    static FetchResult failure(ErrorKind error, std::string message) {
        FetchResult result;
        result.error = error;
        result.message = std::move(message);
        return result;
    }
};

} // namespace service
} // namespace docpipe

#endif // DOCPIPE_SERVICE_CHUNK_MESSAGES_HPP
