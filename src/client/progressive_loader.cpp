#include "client/progressive_loader.hpp"
#include "store/chunk_addressing.hpp"
#include <boost/log/trivial.hpp>
#include <map>
#include <mutex>
#include <set>
#include <utility>
#include <vector>

namespace docpipe {
namespace client {

const char* apply_result_to_string(ApplyResult result) {
  switch (result) {
    case ApplyResult::APPLIED:   return "APPLIED";
    case ApplyResult::QUEUED:    return "QUEUED";
    case ApplyResult::DUPLICATE: return "DUPLICATE";
    case ApplyResult::STALE:     return "STALE";
    case ApplyResult::FAILED:    return "FAILED";
    default:                     return "UNKNOWN";
  }
}

// Shared with in-flight handlers so a response can outlive the loader safely
struct ProgressiveLoader::Core {
  mutable std::mutex mutex;

  // Selection
  std::uint64_t session{0};
  std::string id;
  std::uint64_t generation{0};
  std::size_t chunk_count{0};
  std::size_t total_length{0};
  // Set once the selected write of `id` has been replaced or cleared in the store
  bool superseded{false};

  // Frontier: chunks [0, next_index) are applied to buffer
  std::string buffer;
  std::size_t next_index{0};
  std::size_t loaded_length{0};
  std::set<std::size_t> retrieved;
  std::map<std::size_t, service::ChunkResponse> pending;
  std::optional<std::size_t> in_flight;

  LoaderState state;
  std::string error;

  // Listeners
  std::uint64_t next_listener_id{0};
  std::map<std::uint64_t, Listener> listeners;

  void clear_selection() {
    id.clear();
    generation = 0;
    superseded = false;
    chunk_count = 0;
    total_length = 0;
    buffer.clear();
    buffer.shrink_to_fit();
    next_index = 0;
    loaded_length = 0;
    retrieved.clear();
    pending.clear();
    in_flight.reset();
    error.clear();
    state.transition_to(LoaderState::State::EMPTY);
  }

  void move_to(LoaderState::State target) {
    if (state.get_state() == target) {
      return;
    }
    const LoaderState::State from = state.get_state();
    if (!state.transition_to(target)) {
      BOOST_LOG_TRIVIAL(error) << "Progressive loader: Invalid transition " << from << " -> " << target
                               << " for " << id;
      return;
    }
    BOOST_LOG_TRIVIAL(debug) << "Progressive loader: " << id << " " << from << " -> " << target;
  }

  LoaderSnapshot snapshot() const {
    LoaderSnapshot snap;
    snap.id = id;
    snap.state = state.get_state();
    snap.retrieved_count = retrieved.size();
    snap.chunk_count = chunk_count;
    snap.loaded_length = loaded_length;
    snap.total_length = total_length;
    snap.in_flight = in_flight.has_value();
    snap.superseded = superseded;
    snap.error = error;
    return snap;
  }

  void append(const service::ChunkResponse& response) {
    buffer += response.content;
    loaded_length += store::character_count(response.content);
    retrieved.insert(response.index);
    next_index = response.index + 1;
  }

  // A discarded answer may still have been the outstanding request
  ApplyResult settle(ApplyResult outcome) {
    if (!in_flight && state.get_state() == LoaderState::State::LOADING) {
      move_to(LoaderState::State::LOADED);
    }
    return outcome;
  }

  // The selected write is gone from the store. What was applied stays; nothing more is requested.
  ApplyResult supersede(std::size_t requested_index, const std::string& reason) {
    superseded = true;
    pending.clear();
    BOOST_LOG_TRIVIAL(warning) << "Progressive loader: Discarding stale response for chunk " << requested_index
                               << " of " << id << ": " << reason;
    return settle(ApplyResult::STALE);
  }

  // Caller holds mutex
  ApplyResult apply(std::uint64_t request_session, std::size_t requested_index, service::FetchResult result) {
    if (request_session != session) {
      BOOST_LOG_TRIVIAL(warning) << "Progressive loader: Discarding stale response for chunk "
                                 << requested_index << " (selection " << request_session
                                 << ", active " << session << ")";
      return ApplyResult::STALE;
    }

    if (state.get_state() == LoaderState::State::COMPLETE) {
      BOOST_LOG_TRIVIAL(warning) << "Progressive loader: Ignoring response for chunk " << requested_index
                                 << " of " << id << " after loading completed";
      return ApplyResult::DUPLICATE;
    }

    if (in_flight && *in_flight == requested_index) {
      in_flight.reset();
    }

    if (superseded) {
      BOOST_LOG_TRIVIAL(warning) << "Progressive loader: Discarding response for chunk " << requested_index
                                 << " of replaced entry " << id;
      return settle(ApplyResult::STALE);
    }

    if (!result.ok()) {
      // The selected write held this index, so only a clear or a replace can make it unreadable
      if ((result.error == ErrorKind::NOT_FOUND || result.error == ErrorKind::OUT_OF_RANGE) &&
          requested_index < chunk_count) {
        return supersede(requested_index, result.message);
      }

      error = result.message;
      BOOST_LOG_TRIVIAL(error) << "Progressive loader: Fetch of chunk " << requested_index << " of " << id
                               << " failed: " << error;
      move_to(LoaderState::State::FAILED);
      return ApplyResult::FAILED;
    }

    service::ChunkResponse response = std::move(*result.response);
    if (response.id != id) {
      BOOST_LOG_TRIVIAL(warning) << "Progressive loader: Discarding response for " << response.id
                                 << " while showing " << id;
      return settle(ApplyResult::STALE);
    }

    if (response.generation != generation) {
      // Generations only grow: a newer one means the selected write was replaced
      if (response.generation > generation) {
        return supersede(response.index, "entry was replaced in the store");
      }
      BOOST_LOG_TRIVIAL(warning) << "Progressive loader: Discarding chunk " << response.index
                                 << " of an earlier write of " << id;
      return settle(ApplyResult::STALE);
    }

    if (response.index >= chunk_count) {
      BOOST_LOG_TRIVIAL(warning) << "Progressive loader: Discarding chunk " << response.index << " of " << id
                                 << ", which has only " << chunk_count << " chunks";
      return settle(ApplyResult::STALE);
    }

    if (response.index < next_index || retrieved.count(response.index) > 0) {
      BOOST_LOG_TRIVIAL(warning) << "Progressive loader: Ignoring duplicate chunk " << response.index << " of " << id;
      return settle(ApplyResult::DUPLICATE);
    }

    ApplyResult outcome = ApplyResult::APPLIED;
    if (response.index > next_index) {
      BOOST_LOG_TRIVIAL(warning) << "Progressive loader: Holding chunk " << response.index << " of " << id
                                 << " until chunk " << next_index << " arrives";
      pending.emplace(response.index, std::move(response));
      outcome = ApplyResult::QUEUED;
    } else {
      bool has_more = response.has_more;
      append(response);

      // Drain successors that arrived early
      auto it = pending.begin();
      while (it != pending.end() && it->first == next_index) {
        has_more = it->second.has_more;
        append(it->second);
        it = pending.erase(it);
      }

      BOOST_LOG_TRIVIAL(debug) << "Progressive loader: Applied " << retrieved.size() << "/" << chunk_count
                               << " chunks of " << id;
      if (!has_more) {
        pending.clear();
        move_to(LoaderState::State::COMPLETE);
        BOOST_LOG_TRIVIAL(info) << "Progressive loader: " << id << " fully loaded ("
                                << loaded_length << " characters)";
        return outcome;
      }
    }

    move_to(in_flight ? LoaderState::State::LOADING : LoaderState::State::LOADED);
    return outcome;
  }
};

void ProgressiveLoader::notify_all(const std::shared_ptr<Core>& core, const LoaderSnapshot& snapshot) {
  std::vector<Listener> listeners;
  {
    std::lock_guard<std::mutex> lock(core->mutex);
    listeners.reserve(core->listeners.size());
    for (const auto& entry : core->listeners) {
      listeners.push_back(entry.second);
    }
  }
  for (const auto& listener : listeners) {
    listener(snapshot);
  }
}

ApplyResult ProgressiveLoader::apply_and_notify(const std::shared_ptr<Core>& core, std::uint64_t session,
                                                std::size_t requested_index, service::FetchResult result) {
  ApplyResult outcome;
  LoaderSnapshot before;
  LoaderSnapshot snap;
  {
    std::lock_guard<std::mutex> lock(core->mutex);
    before = core->snapshot();
    outcome = core->apply(session, requested_index, std::move(result));
    snap = core->snapshot();
  }
  // Discarded responses only matter to listeners when they ended a request or the selection
  const bool changed = before.in_flight != snap.in_flight || before.superseded != snap.superseded;
  if ((outcome != ApplyResult::STALE && outcome != ApplyResult::DUPLICATE) || changed) {
    notify_all(core, snap);
  }
  return outcome;
}


//==============================================
// SUBSCRIPTION
//==============================================

ProgressiveLoader::Subscription::Subscription(std::function<void()> remove)
  : remove_(std::move(remove)) {}

ProgressiveLoader::Subscription::~Subscription() {
  reset();
}

ProgressiveLoader::Subscription::Subscription(Subscription&& other) noexcept
  : remove_(std::move(other.remove_)) {
  other.remove_ = nullptr;
}

ProgressiveLoader::Subscription& ProgressiveLoader::Subscription::operator=(Subscription&& other) noexcept {
  if (this != &other) {
    reset();
    remove_ = std::move(other.remove_);
    other.remove_ = nullptr;
  }
  return *this;
}

void ProgressiveLoader::Subscription::reset() {
  if (remove_) {
    remove_();
    remove_ = nullptr;
  }
}


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ProgressiveLoader::ProgressiveLoader(service::FetchClient& client, LoaderOptions options)
  : client_(client)
  , options_(options)
  , core_(std::make_shared<Core>()) {
  BOOST_LOG_TRIVIAL(debug) << "Progressive loader: Created with load-more threshold "
                           << options_.load_more_threshold;
}

ProgressiveLoader::~ProgressiveLoader() {
  std::lock_guard<std::mutex> lock(core_->mutex);
  // Outstanding handlers see a new session and discard their responses
  core_->session++;
  core_->listeners.clear();
}


//==============================================
// SELECTION
//==============================================

void ProgressiveLoader::select(const store::EntryInfo& info) {
  std::uint64_t session = 0;
  bool fetch_first = false;
  LoaderSnapshot snap;
  {
    std::lock_guard<std::mutex> lock(core_->mutex);
    session = ++core_->session;
    core_->clear_selection();
    core_->id = info.id;
    core_->generation = info.generation;
    core_->chunk_count = info.chunk_count;
    core_->total_length = info.length;

    if (info.chunk_count == 0) {
      core_->move_to(LoaderState::State::COMPLETE);
    } else {
      core_->in_flight = 0;
      core_->move_to(LoaderState::State::LOADING);
      fetch_first = true;
    }
    snap = core_->snapshot();
  }

  BOOST_LOG_TRIVIAL(info) << "Progressive loader: Selected " << info.id << " (" << info.chunk_count << " chunks)";
  notify_all(core_, snap);

  if (fetch_first) {
    issue(info.id, session, 0);
  }
}

void ProgressiveLoader::reset() {
  LoaderSnapshot snap;
  {
    std::lock_guard<std::mutex> lock(core_->mutex);
    core_->session++;
    BOOST_LOG_TRIVIAL(info) << "Progressive loader: Reset" << (core_->id.empty() ? "" : " from " + core_->id);
    core_->clear_selection();
    snap = core_->snapshot();
  }
  notify_all(core_, snap);
}


//==============================================
// LOAD TRIGGERS
//==============================================

bool ProgressiveLoader::on_scroll(double scroll_top, double client_height, double scroll_height) {
  // Content shorter than the viewport always counts as being at the frontier
  const double ratio = scroll_height <= 0.0 ? 1.0 : (scroll_top + client_height) / scroll_height;
  if (ratio < options_.load_more_threshold) {
    return false;
  }
  return on_near_frontier();
}

bool ProgressiveLoader::on_near_frontier() {
  return load_more();
}

bool ProgressiveLoader::load_more() {
  std::string id;
  std::uint64_t session = 0;
  std::size_t index = 0;
  LoaderSnapshot snap;
  {
    std::lock_guard<std::mutex> lock(core_->mutex);
    const LoaderState::State state = core_->state.get_state();

    if (core_->id.empty() || core_->superseded || state == LoaderState::State::COMPLETE ||
        state == LoaderState::State::FAILED) {
      return false;
    }
    if (core_->in_flight) {
      BOOST_LOG_TRIVIAL(debug) << "Progressive loader: Chunk " << *core_->in_flight << " of " << core_->id
                               << " still in flight";
      return false;
    }

    index = core_->next_index;
    if (index >= core_->chunk_count || core_->retrieved.count(index) > 0) {
      return false;
    }

    core_->in_flight = index;
    core_->move_to(LoaderState::State::LOADING);
    id = core_->id;
    session = core_->session;
    snap = core_->snapshot();
  }

  notify_all(core_, snap);
  issue(id, session, index);
  return true;
}

bool ProgressiveLoader::retry() {
  std::string id;
  std::uint64_t session = 0;
  std::size_t index = 0;
  LoaderSnapshot snap;
  {
    std::lock_guard<std::mutex> lock(core_->mutex);
    if (core_->state.get_state() != LoaderState::State::FAILED) {
      return false;
    }

    index = core_->next_index;
    core_->error.clear();
    core_->in_flight = index;
    core_->move_to(LoaderState::State::LOADING);
    id = core_->id;
    session = core_->session;
    snap = core_->snapshot();
  }

  BOOST_LOG_TRIVIAL(info) << "Progressive loader: Retrying chunk " << index << " of " << id;
  notify_all(core_, snap);
  issue(id, session, index);
  return true;
}

void ProgressiveLoader::issue(const std::string& id, std::uint64_t session, std::size_t index) {
  BOOST_LOG_TRIVIAL(debug) << "Progressive loader: Requesting chunk " << index << " of " << id;

  std::weak_ptr<Core> weak_core = core_;
  client_.fetch_chunk(id, index, [weak_core, session, index](service::FetchResult result) {
    std::shared_ptr<Core> core = weak_core.lock();
    if (!core) {
      BOOST_LOG_TRIVIAL(debug) << "Progressive loader: Response for chunk " << index << " arrived after teardown";
      return;
    }
    apply_and_notify(core, session, index, std::move(result));
  });
}


//==============================================
// RESPONSES
//==============================================

ApplyResult ProgressiveLoader::handle_result(std::uint64_t session, std::size_t requested_index,
                                             service::FetchResult result) {
  return apply_and_notify(core_, session, requested_index, std::move(result));
}


//==============================================
// QUERIES
//==============================================

std::string ProgressiveLoader::content() const {
  std::lock_guard<std::mutex> lock(core_->mutex);
  return core_->buffer;
}

bool ProgressiveLoader::sync_mirror(std::uint64_t& mirror_session, std::string& mirror) const {
  std::lock_guard<std::mutex> lock(core_->mutex);
  if (mirror_session != core_->session || mirror.size() > core_->buffer.size()) {
    mirror_session = core_->session;
    mirror = core_->buffer;
    return true;
  }
  if (mirror.size() == core_->buffer.size()) {
    return false;
  }
  mirror.append(core_->buffer, mirror.size(), std::string::npos);
  return true;
}

LoaderSnapshot ProgressiveLoader::snapshot() const {
  std::lock_guard<std::mutex> lock(core_->mutex);
  return core_->snapshot();
}

std::string ProgressiveLoader::active_id() const {
  std::lock_guard<std::mutex> lock(core_->mutex);
  return core_->id;
}

std::uint64_t ProgressiveLoader::session() const {
  std::lock_guard<std::mutex> lock(core_->mutex);
  return core_->session;
}

LoaderState::State ProgressiveLoader::state() const {
  std::lock_guard<std::mutex> lock(core_->mutex);
  return core_->state.get_state();
}

std::size_t ProgressiveLoader::retrieved_count() const {
  std::lock_guard<std::mutex> lock(core_->mutex);
  return core_->retrieved.size();
}

std::size_t ProgressiveLoader::chunk_count() const {
  std::lock_guard<std::mutex> lock(core_->mutex);
  return core_->chunk_count;
}

bool ProgressiveLoader::is_complete() const {
  return state() == LoaderState::State::COMPLETE;
}

bool ProgressiveLoader::is_loading() const {
  std::lock_guard<std::mutex> lock(core_->mutex);
  return core_->in_flight.has_value();
}

double ProgressiveLoader::progress() const {
  std::lock_guard<std::mutex> lock(core_->mutex);
  if (core_->total_length == 0) {
    return core_->state.get_state() == LoaderState::State::COMPLETE ? 1.0 : 0.0;
  }
  return static_cast<double>(core_->loaded_length) / static_cast<double>(core_->total_length);
}

bool ProgressiveLoader::is_superseded() const {
  std::lock_guard<std::mutex> lock(core_->mutex);
  return core_->superseded;
}

std::string ProgressiveLoader::last_error() const {
  std::lock_guard<std::mutex> lock(core_->mutex);
  return core_->error;
}


//==============================================
// EVENTS
//==============================================

ProgressiveLoader::Subscription ProgressiveLoader::subscribe(Listener listener) {
  std::uint64_t listener_id = 0;
  {
    std::lock_guard<std::mutex> lock(core_->mutex);
    listener_id = ++core_->next_listener_id;
    core_->listeners.emplace(listener_id, std::move(listener));
  }

  std::weak_ptr<Core> weak_core = core_;
  return Subscription([weak_core, listener_id]() {
    if (auto core = weak_core.lock()) {
      std::lock_guard<std::mutex> lock(core->mutex);
      core->listeners.erase(listener_id);
    }
  });
}

} // namespace client
} // namespace docpipe
