#include "change_channel.hpp"

#include <deque>
#include <exception>

#include "internal/observability/logging.hpp"

namespace practicedb::db {

namespace {

struct PendingEvent {
  ChangeChannel* channel;
  ChangeEvent    event;
};

// Per-thread dispatch state; makes same-thread re-entrant publishes FIFO.
thread_local bool                     t_dispatching = false;
thread_local std::deque<PendingEvent> t_pending;

struct DispatchGuard {
  DispatchGuard() {
    t_dispatching = true;
  }
  ~DispatchGuard() {
    t_dispatching = false;
  }
};

} // namespace

const char* ToString(ChangeKind kind) {
  switch (kind) {
    case ChangeKind::Created:
      return "created";
    case ChangeKind::Updated:
      return "updated";
    case ChangeKind::Deleted:
      return "deleted";
    case ChangeKind::Imported:
      return "imported";
    case ChangeKind::RolledBack:
      return "rolled_back";
    case ChangeKind::Cleared:
      return "cleared";
  }
  return "updated";
}

// ------------------------------------------------------------
// Subscription
// ------------------------------------------------------------

Subscription::Subscription(std::weak_ptr<State> state, std::string topic, uint64_t id, std::shared_ptr<Slot> slot)
    : state_(std::move(state)), topic_(std::move(topic)), id_(id), slot_(std::move(slot)) {
}

Subscription::~Subscription() {
  Unsubscribe();
}

Subscription::Subscription(Subscription&& other) noexcept
    : state_(std::move(other.state_)), topic_(std::move(other.topic_)), id_(other.id_), slot_(std::move(other.slot_)) {
  other.id_ = 0;
}

Subscription& Subscription::operator=(Subscription&& other) noexcept {
  if (this != &other) {
    Unsubscribe();
    state_    = std::move(other.state_);
    topic_    = std::move(other.topic_);
    id_       = other.id_;
    slot_     = std::move(other.slot_);
    other.id_ = 0;
  }
  return *this;
}

void Subscription::Unsubscribe() {
  if (!slot_) return;

  slot_->active = false;
  if (auto state = state_.lock()) {
    std::scoped_lock lock(state->mutex);
    auto             it = state->topics.find(topic_);
    if (it != state->topics.end()) {
      it->second.erase(id_);
      if (it->second.empty()) state->topics.erase(it);
    }
  }

  slot_.reset();
  state_.reset();
  id_ = 0;
}

bool Subscription::Active() const {
  return slot_ && slot_->active && !state_.expired();
}

// ------------------------------------------------------------
// ChangeChannel
// ------------------------------------------------------------

ChangeChannel::ChangeChannel() : state_(std::make_shared<Subscription::State>()) {
}

Subscription ChangeChannel::Subscribe(const std::string& topic, ChangeHandler handler) {
  auto slot = std::make_shared<Subscription::Slot>(std::move(handler));

  std::scoped_lock lock(state_->mutex);
  const auto       id   = state_->next_id++;
  state_->topics[topic][id] = slot;
  return Subscription(state_, topic, id, std::move(slot));
}

std::size_t ChangeChannel::SubscriberCount(const std::string& topic) const {
  std::scoped_lock lock(state_->mutex);
  auto             it = state_->topics.find(topic);
  return it == state_->topics.end() ? 0 : it->second.size();
}

void ChangeChannel::Publish(ChangeEvent event) {
  t_pending.push_back(PendingEvent{this, std::move(event)});
  if (t_dispatching) return;

  DispatchGuard guard;
  while (!t_pending.empty()) {
    auto next = std::move(t_pending.front());
    t_pending.pop_front();
    next.channel->Dispatch(next.event);
  }
}

void ChangeChannel::Dispatch(const ChangeEvent& event) {
  std::vector<std::shared_ptr<Subscription::Slot>> slots;
  {
    std::scoped_lock lock(state_->mutex);
    auto             it = state_->topics.find(event.collection);
    if (it == state_->topics.end()) return;
    slots.reserve(it->second.size());
    for (const auto& [id, slot] : it->second) slots.push_back(slot);
  }

  for (const auto& slot : slots) {
    if (!slot->active) continue;
    try {
      slot->handler(event);
    } catch (const std::exception& e) {
      PRACTICEDB_LOG_ERROR("change handler failed",
                           {observability::CollectionField(event.collection), observability::StringField("kind", ToString(event.kind)),
                            observability::ErrorField(e)});
    }
  }
}

} // namespace practicedb::db
