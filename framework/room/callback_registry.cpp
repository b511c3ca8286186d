// framework/room/callback_registry.cpp
#include "callback_registry.hpp"
#include <fmt/core.h>
#include <utility>

namespace wsrooms::framework
{
  namespace
  {
    template <class Key, class Handler>
    Handler find_handler(const std::map<Key, Handler>& handlers, Key key)
    {
      const auto it = handlers.find(key);
      if (it == handlers.end())
      {
        return {};
      }
      return it->second;
    }

    template <class Key, class Handler>
    void store_handler(std::map<Key, Handler>& handlers, Key key, Handler handler)
    {
      if (handler)
      {
        handlers[key] = std::move(handler);
      }
      else
      {
        handlers.erase(key);
      }
    }
  }

  void CallbackRegistry::set_connect_handler(Phase phase, LifecycleHandler handler)
  {
    std::lock_guard<std::mutex> lock(mutex_);
    store_handler(on_connect_, phase, std::move(handler));
    fmt::print("Registered {}-connect handler\n", to_string(phase));
  }

  void CallbackRegistry::set_disconnect_handler(Phase phase, LifecycleHandler handler)
  {
    std::lock_guard<std::mutex> lock(mutex_);
    store_handler(on_disconnect_, phase, std::move(handler));
    fmt::print("Registered {}-disconnect handler\n", to_string(phase));
  }

  void CallbackRegistry::set_receive_handler(MessageKind kind, ReceiveHandler handler)
  {
    std::lock_guard<std::mutex> lock(mutex_);
    store_handler(on_receive_, kind, std::move(handler));
    fmt::print("Registered {} receive handler\n", to_string(kind));
  }

  LifecycleHandler CallbackRegistry::connect_handler(Phase phase) const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return find_handler(on_connect_, phase);
  }

  LifecycleHandler CallbackRegistry::disconnect_handler(Phase phase) const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return find_handler(on_disconnect_, phase);
  }

  ReceiveHandler CallbackRegistry::receive_handler(MessageKind kind) const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return find_handler(on_receive_, kind);
  }

  bool CallbackRegistry::has_receive_handler(MessageKind kind) const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return on_receive_.count(kind) > 0;
  }
}
