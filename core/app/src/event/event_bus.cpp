#include "recon/eventbus/event_bus.hpp"

#include <algorithm>

namespace recon {

EventBus::SubscriptionId EventBus::subscribe(GenericCallback callback) {
  return add(kAnyEvent, std::move(callback));
}

EventBus::SubscriptionId EventBus::add(std::size_t event_index,
                                       GenericCallback callback) {
  std::lock_guard lock(mutex_);
  const SubscriptionId id = next_id_++;
  subscribers_.push_back(Subscriber{id, event_index, std::move(callback)});
  return id;
}

void EventBus::unsubscribe(SubscriptionId id) {
  std::lock_guard lock(mutex_);
  subscribers_.erase(
      std::remove_if(subscribers_.begin(), subscribers_.end(),
                     [id](const Subscriber& s) { return s.id == id; }),
      subscribers_.end());
}

void EventBus::publish(const Event& event) {
  const std::size_t index = event.index();
  std::vector<GenericCallback> matching;
  {
    std::lock_guard lock(mutex_);
    for (const auto& s : subscribers_) {
      if (s.event_index == kAnyEvent || s.event_index == index) {
        matching.push_back(s.callback);
      }
    }
  }

  for (const auto& callback : matching) {
    callback(event);
  }
}

std::size_t EventBus::subscriberCount() const {
  std::lock_guard lock(mutex_);
  return subscribers_.size();
}

}  // namespace recon
