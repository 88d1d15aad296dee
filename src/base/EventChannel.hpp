#ifndef __TH_EVENT_CHANNEL__
#define __TH_EVENT_CHANNEL__

#include "Headers.hpp"

namespace th {
/**
 * @brief Typed publish/subscribe channel.
 *
 * Listeners are invoked on the emitting thread, after the subscriber list has
 * been copied, so a listener may subscribe, unsubscribe or emit again without
 * deadlocking. Emitters must not hold their own locks while calling emit().
 */
template <typename Event>
class EventChannel {
 public:
  typedef std::function<void(const Event &)> Listener;

  EventChannel() : nextId(1) {}

  /** @return A handle for unsubscribe(). */
  int subscribe(Listener listener) {
    lock_guard<mutex> guard(listenerMutex);
    int id = nextId++;
    listeners[id] = std::make_shared<Listener>(std::move(listener));
    return id;
  }

  void unsubscribe(int id) {
    lock_guard<mutex> guard(listenerMutex);
    listeners.erase(id);
  }

  void emit(const Event &event) const {
    vector<shared_ptr<Listener>> snapshot;
    {
      lock_guard<mutex> guard(listenerMutex);
      snapshot.reserve(listeners.size());
      for (const auto &it : listeners) {
        snapshot.push_back(it.second);
      }
    }
    for (const auto &listener : snapshot) {
      try {
        (*listener)(event);
      } catch (const std::exception &e) {
        // A broken observer must not take the emitter down with it
        LOG(ERROR) << "Event listener threw: " << e.what();
      }
    }
  }

  size_t listenerCount() const {
    lock_guard<mutex> guard(listenerMutex);
    return listeners.size();
  }

 protected:
  mutable mutex listenerMutex;
  int nextId;
  map<int, shared_ptr<Listener>> listeners;
};
}  // namespace th

#endif  // __TH_EVENT_CHANNEL__
