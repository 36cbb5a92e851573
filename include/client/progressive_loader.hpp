#ifndef DOCPIPE_CLIENT_PROGRESSIVE_LOADER_HPP
#define DOCPIPE_CLIENT_PROGRESSIVE_LOADER_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include "client/loader_state.hpp"
#include "service/fetch_client.hpp"
#include "store/content_entry.hpp"

namespace docpipe {
namespace client {

constexpr double DEFAULT_LOAD_MORE_THRESHOLD = 0.8;

struct LoaderOptions {
  // Fraction of the scroll range past which the next chunk is requested
  double load_more_threshold{DEFAULT_LOAD_MORE_THRESHOLD};
};

// What happened to a response handed to the loader
enum class ApplyResult {
  APPLIED,    // frontier chunk appended (and any queued successors)
  QUEUED,     // arrived ahead of the frontier, held until the gap is filled
  DUPLICATE,  // index already retrieved
  STALE,      // belongs to a previous selection or a replaced write of the entry
  FAILED      // the fetch itself failed
};

const char* apply_result_to_string(ApplyResult result);

struct LoaderSnapshot {
  std::string id;
  LoaderState::State state{LoaderState::State::EMPTY};
  std::size_t retrieved_count{0};
  std::size_t chunk_count{0};
  std::size_t loaded_length{0};
  std::size_t total_length{0};
  bool in_flight{false};
  // The entry was replaced or cleared in the store; reselect to see the new content
  bool superseded{false};
  std::string error;

  bool is_complete() const { return state == LoaderState::State::COMPLETE; }
};

/**
 * Client-side accumulator for one displayed entry at a time.
 *
 * Chunks are applied strictly in index order and at most one fetch is outstanding per
 * entry. Selecting another entry (or resetting) invalidates every outstanding request:
 * responses for an older selection are discarded. Responses cut from a different write of
 * the same id are discarded too, and the loader stops requesting until it is reselected.
 * Handlers may run on any thread.
 */
class ProgressiveLoader {
public:
  using Listener = std::function<void(const LoaderSnapshot&)>;

  // Keeps a listener registered for as long as it lives
  class Subscription {
  public:
    Subscription() = default;
    ~Subscription();
    Subscription(Subscription&& other) noexcept;
    Subscription& operator=(Subscription&& other) noexcept;
    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    void reset();

  private:
    friend class ProgressiveLoader;
    explicit Subscription(std::function<void()> remove);

    std::function<void()> remove_;
  };

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit ProgressiveLoader(service::FetchClient& client, LoaderOptions options = LoaderOptions());
  ~ProgressiveLoader();
  ProgressiveLoader(const ProgressiveLoader&) = delete;
  ProgressiveLoader& operator=(const ProgressiveLoader&) = delete;


  // ---- SELECTION ----
  // Drops the current entry and starts loading `info` from chunk 0
  void select(const store::EntryInfo& info);
  // Drops the current entry without selecting another
  void reset();


  // ---- LOAD TRIGGERS ----
  // Scroll metrics from the renderer; requests more when past the threshold
  bool on_scroll(double scroll_top, double client_height, double scroll_height);
  bool on_near_frontier();
  // Requests the frontier chunk unless one is in flight, it is retrieved, or loading is over
  bool load_more();
  // Re-requests the frontier chunk after a failure
  bool retry();


  // ---- RESPONSES ----
  // Applies the outcome of a request issued for `requested_index` in selection `session`
  ApplyResult handle_result(std::uint64_t session, std::size_t requested_index, service::FetchResult result);


  // ---- QUERIES ----
  std::string content() const;
  // Brings `mirror` up to date with the buffer, copying only what it lacks when the
  // selection is unchanged. Returns true if the mirror changed.
  bool sync_mirror(std::uint64_t& mirror_session, std::string& mirror) const;
  LoaderSnapshot snapshot() const;
  std::string active_id() const;
  std::uint64_t session() const;
  LoaderState::State state() const;
  std::size_t retrieved_count() const;
  std::size_t chunk_count() const;
  bool is_complete() const;
  bool is_loading() const;
  // Fraction of the entry's characters applied so far
  double progress() const;
  bool is_superseded() const;
  std::string last_error() const;


  // ---- EVENTS ----
  Subscription subscribe(Listener listener);

private:
  struct Core;

  // ---- PARAMETERS ----
  service::FetchClient& client_;
  LoaderOptions options_;
  std::shared_ptr<Core> core_;


  // Sends the request for `index`; must be called without holding the core lock
  void issue(const std::string& id, std::uint64_t session, std::size_t index);

  // Listeners are copied under the lock and invoked outside it
  static void notify_all(const std::shared_ptr<Core>& core, const LoaderSnapshot& snapshot);
  static ApplyResult apply_and_notify(const std::shared_ptr<Core>& core, std::uint64_t session,
                                      std::size_t requested_index, service::FetchResult result);
};

} // namespace client
} // namespace docpipe

#endif // DOCPIPE_CLIENT_PROGRESSIVE_LOADER_HPP
