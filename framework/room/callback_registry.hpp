// framework/room/callback_registry.hpp
#ifndef WSROOMS_FRAMEWORK_ROOM_CALLBACK_REGISTRY_HPP
#define WSROOMS_FRAMEWORK_ROOM_CALLBACK_REGISTRY_HPP

#include <functional>
#include <map>
#include <mutex>
#include "connection.hpp"
#include "message.hpp"

namespace wsrooms::framework
{
  class Room;

  using LifecycleHandler = std::function<void(Room&, const ConnectionPtr&)>;
  using ReceiveHandler = std::function<void(Room&, const ConnectionPtr&, const Message&)>;

  // At most one handler per (event, phase) and per message kind.
  class CallbackRegistry
  {
  public:
    CallbackRegistry() = default;

    // Registering again for the same key replaces the previous handler.
    void set_connect_handler(Phase phase, LifecycleHandler handler);
    void set_disconnect_handler(Phase phase, LifecycleHandler handler);
    void set_receive_handler(MessageKind kind, ReceiveHandler handler);

    // Lookups return a copy; an empty function means nothing is registered.
    LifecycleHandler connect_handler(Phase phase) const;
    LifecycleHandler disconnect_handler(Phase phase) const;
    ReceiveHandler receive_handler(MessageKind kind) const;

    bool has_receive_handler(MessageKind kind) const;

  private:
    mutable std::mutex mutex_;
    std::map<Phase, LifecycleHandler> on_connect_;
    std::map<Phase, LifecycleHandler> on_disconnect_;
    std::map<MessageKind, ReceiveHandler> on_receive_;
  };
}
#endif // WSROOMS_FRAMEWORK_ROOM_CALLBACK_REGISTRY_HPP
