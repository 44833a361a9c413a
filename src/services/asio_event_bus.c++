#include "asio_event_bus.h++"

using std::make_shared, std::pair, std::shared_lock, std::shared_mutex,
    std::unique_lock;

namespace Skein {

  auto AsioEventBus::dispatch(Event event, uint64_t subject_id, EventPayload payload) -> void {
    shared_lock<shared_mutex> lock(listener_lock);
    const auto shared_payload = make_shared<const EventPayload>(std::move(payload));
    spdlog::trace("Dispatching {} for {:x} ({:d} ids)", to_string(event), subject_id, shared_payload->size());
    auto range = event_listeners.equal_range({ event, 0 });
    for (auto i = range.first; i != range.second; i++) {
      asio::post(*io, EventListenerInstance{i->second, subject_id, shared_payload});
    }
    if (subject_id) {
      auto range = event_listeners.equal_range({ event, subject_id });
      for (auto i = range.first; i != range.second; i++) {
        asio::post(*io, EventListenerInstance{i->second, subject_id, shared_payload});
      }
    }
  }

  auto AsioEventBus::on_event(Event event, uint64_t subject_id, Callback&& callback) -> Subscription {
    unique_lock<shared_mutex> lock(listener_lock);
    auto id = next_event_id++;
    const auto key = pair(event, subject_id);
    event_listeners.emplace(key, make_shared<EventListener>(id, event, subject_id, std::move(callback)));
    return Subscription(shared_from_this(), id, key);
  }

  auto AsioEventBus::unsubscribe(uint64_t event_id, pair<Event, uint64_t> key) -> void {
    unique_lock<shared_mutex> lock(listener_lock);
    auto range = event_listeners.equal_range(key);
    const auto it = std::find_if(range.first, range.second, [event_id](auto& p) {
      return p.second->id == event_id;
    });
    if (it != range.second) event_listeners.erase(it);
  }
}
