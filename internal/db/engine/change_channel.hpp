#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/document/value.hpp"

namespace practicedb::db {

enum class ChangeKind { Created, Updated, Deleted, Imported, RolledBack, Cleared };

const char* ToString(ChangeKind kind);

/*
  One notification per mutating call.

  document_ids is the diff (which ids the call touched); snapshot is the
  whole collection as it stands after the call.
*/
struct ChangeEvent {
  std::string                     collection;
  ChangeKind                      kind = ChangeKind::Updated;
  std::vector<std::string>        document_ids;
  std::vector<document::Document> snapshot;
};

using ChangeHandler = std::function<void(const ChangeEvent&)>;

class ChangeChannel;

/*
  Move-only subscription handle. Destroying it (or calling
  Unsubscribe) detaches the handler; safe after the channel is gone.
*/
class Subscription {
 public:
  Subscription() = default;
  ~Subscription();

  Subscription(const Subscription&)            = delete;
  Subscription& operator=(const Subscription&) = delete;

  Subscription(Subscription&& other) noexcept;
  Subscription& operator=(Subscription&& other) noexcept;

  void Unsubscribe();
  bool Active() const;

 private:
  friend class ChangeChannel;

  struct Slot;
  struct State;

  Subscription(std::weak_ptr<State> state, std::string topic, uint64_t id, std::shared_ptr<Slot> slot);

  std::weak_ptr<State>  state_;
  std::string           topic_;
  uint64_t              id_ = 0;
  std::shared_ptr<Slot> slot_;
};

/*
  Topic-per-collection publish/subscribe.

  Handlers run synchronously on the publishing thread. A handler that
  throws is logged and the remaining handlers still run. An event
  published from inside a handler on the same thread is queued and
  delivered once the current dispatch finishes, so handlers never
  nest.
*/
class ChangeChannel {
 public:
  ChangeChannel();

  ChangeChannel(const ChangeChannel&)            = delete;
  ChangeChannel& operator=(const ChangeChannel&) = delete;

  [[nodiscard]] Subscription Subscribe(const std::string& topic, ChangeHandler handler);

  void Publish(ChangeEvent event);

  std::size_t SubscriberCount(const std::string& topic) const;

 private:
  void Dispatch(const ChangeEvent& event);

  std::shared_ptr<Subscription::State> state_;
};

// ------------------------------------------------------------------
// Shared subscription state
// ------------------------------------------------------------------

struct Subscription::Slot {
  explicit Slot(ChangeHandler h) : handler(std::move(h)) {
  }

  ChangeHandler     handler;
  std::atomic<bool> active{true};
};

struct Subscription::State {
  mutable std::mutex                                                 mutex;
  uint64_t                                                           next_id = 1;
  std::map<std::string, std::map<uint64_t, std::shared_ptr<Slot>>> topics;
};

} // namespace practicedb::db
