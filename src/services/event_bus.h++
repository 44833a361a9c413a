#pragma once
#include "util/common.h++"
#include <memory>
#include <vector>

namespace Skein {

  enum class Event : uint8_t {
    ThreadUpdate,
    MessageUpdate,
    MessageRescored,
    MessagesMarkedRead,
    MessagesMarkedUnread,
    ConfigUpdate,
    MAX
  };

  constexpr auto to_string(Event e) -> std::string_view {
    using enum Event;
    switch (e) {
      case ThreadUpdate: return "ThreadUpdate";
      case MessageUpdate: return "MessageUpdate";
      case MessageRescored: return "MessageRescored";
      case MessagesMarkedRead: return "MessagesMarkedRead";
      case MessagesMarkedUnread: return "MessagesMarkedUnread";
      case ConfigUpdate: return "ConfigUpdate";
      case MAX: break;
    }
    return "unknown";
  }

  using EventPayload = std::vector<uint64_t>;

  class EventBus : public std::enable_shared_from_this<EventBus> {
    protected:
      virtual auto unsubscribe(uint64_t event_id, std::pair<Event, uint64_t> key) -> void = 0;
    public:
      using Callback = std::function<void (Event, uint64_t, const EventPayload&)>;

      class Subscription {
      private:
        std::weak_ptr<EventBus> bus;
        uint64_t id;
        std::pair<Event, uint64_t> key;
      public:
        Subscription(std::shared_ptr<EventBus> bus, uint64_t id, std::pair<Event, uint64_t> key)
          : bus(bus), id(id), key(key) {}
        Subscription(const Subscription&) = delete;
        auto operator=(const Subscription&) = delete;
        Subscription(Subscription&& from) : bus(from.bus), id(from.id), key(from.key) {
          from.bus.reset();
        }
        inline auto operator=(Subscription&& from) noexcept -> Subscription& {
          if (auto bus_ptr = bus.lock()) bus_ptr->unsubscribe(id, key);
          bus = from.bus;
          id = from.id;
          key = from.key;
          from.bus.reset();
          return *this;
        }
        ~Subscription() {
          if (auto bus_ptr = bus.lock()) bus_ptr->unsubscribe(id, key);
        }
      };

      virtual ~EventBus() = default;

      // Fire-and-forget. Listeners on subject 0 hear every subject.
      virtual auto dispatch(Event event, uint64_t subject_id = 0, EventPayload payload = {}) -> void = 0;
      inline auto on_event(Event event, Callback&& callback) -> Subscription {
        return on_event(event, 0, std::move(callback));
      }
      virtual auto on_event(Event event, uint64_t subject_id, Callback&& callback) -> Subscription = 0;
  };

  class DummyEventBus : public EventBus {
    protected:
      inline auto unsubscribe(uint64_t, std::pair<Event, uint64_t>) -> void override {};
    public:
      inline auto dispatch(Event, uint64_t = 0, EventPayload = {}) -> void override {}
      using EventBus::on_event;
      inline auto on_event(Event e, uint64_t s, Callback&&) -> Subscription override {
        return Subscription(this->shared_from_this(), 0, {e,s});
      }
  };
}
