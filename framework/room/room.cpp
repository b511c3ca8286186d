// framework/room/room.cpp
#include "room.hpp"
#include "inbound_dispatcher.hpp"
#include <fmt/core.h>

#include <thread>
#include <utility>

namespace wsrooms::framework
{
  Room::Room(RoomOptions options)
    : options_(options),
      publisher_(registry_, options.backlog)
  {
  }

  Room::~Room()
  {
    close();
  }

  Room& Room::on_connect(Phase phase, LifecycleHandler handler)
  {
    callbacks_.set_connect_handler(phase, std::move(handler));
    return *this;
  }

  Room& Room::on_disconnect(Phase phase, LifecycleHandler handler)
  {
    callbacks_.set_disconnect_handler(phase, std::move(handler));
    return *this;
  }

  Room& Room::on_receive(MessageKind kind, ReceiveHandler handler)
  {
    callbacks_.set_receive_handler(kind, std::move(handler));
    return *this;
  }

  void Room::connect(const ConnectionPtr& conn)
  {
    run_hook(callbacks_.connect_handler(Phase::Before), "connect", Phase::Before, conn);

    try
    {
      conn->accept();
    }
    catch (const std::exception& e)
    {
      fmt::print(stderr, "Accept failed for connection {}: {}\n", conn->id(), e.what());
      throw;
    }

    std::size_t member_count = 0;
    {
      std::lock_guard<std::mutex> lock(membership_mutex_);
      registry_.add(conn);
      active_.insert(conn);
      member_count = registry_.size();
      if (publisher_.start())
      {
        fmt::print("Room publisher started\n");
      }
    }
    fmt::print("{} ({}) joined the room, {} member(s)\n", conn->id(), conn->remote_address(), member_count);

    run_hook(callbacks_.connect_handler(Phase::After), "connect", Phase::After, conn);

    bool already_closed = false;
    try
    {
      InboundDispatcher dispatcher(*this, callbacks_, conn, options_.slow_handler_threshold);
      already_closed = dispatcher.run();
    }
    catch (const std::exception& e)
    {
      fmt::print(stderr, "Dispatch loop for connection {} ended: {}\n", conn->id(), e.what());
    }

    remove(conn, already_closed);
  }

  void Room::remove(const ConnectionPtr& conn, bool already_closed)
  {
    {
      std::unique_lock<std::mutex> lock(membership_mutex_);
      if (active_.erase(conn) == 0)
      {
        // Another thread owns this teardown; return once it has finished.
        teardown_cv_.wait(lock, [this, &conn]
        {
          const auto it = tearing_down_.find(conn);
          return it == tearing_down_.end() || it->second == std::this_thread::get_id();
        });
        return;
      }
      tearing_down_.emplace(conn, std::this_thread::get_id());
    }

    run_hook(callbacks_.disconnect_handler(Phase::Before), "disconnect", Phase::Before, conn);

    if (!already_closed)
    {
      try
      {
        conn->close();
      }
      catch (const std::exception& e)
      {
        fmt::print(stderr, "Closing connection {} failed: {}\n", conn->id(), e.what());
      }
    }

    std::size_t member_count = 0;
    {
      std::lock_guard<std::mutex> lock(membership_mutex_);
      registry_.remove(conn);
      member_count = registry_.size();
      if (member_count == 0 && publisher_.stop())
      {
        fmt::print("Room is empty, publisher stopped\n");
      }
    }
    fmt::print("{} ({}) left the room, {} member(s)\n", conn->id(), conn->remote_address(), member_count);

    run_hook(callbacks_.disconnect_handler(Phase::After), "disconnect", Phase::After, conn);

    {
      std::lock_guard<std::mutex> lock(membership_mutex_);
      tearing_down_.erase(conn);
    }
    teardown_cv_.notify_all();
  }

  void Room::close()
  {
    // Members dropped by the publisher are out of the registry but still active.
    auto targets = registry_.snapshot();
    {
      std::lock_guard<std::mutex> lock(membership_mutex_);
      targets.insert(targets.end(), active_.begin(), active_.end());
    }
    for (const auto& member : targets)
    {
      remove(member);
    }

    std::unique_lock<std::mutex> lock(membership_mutex_);
    teardown_cv_.wait(lock, [this]
    {
      for (const auto& item : tearing_down_)
      {
        if (item.second != std::this_thread::get_id())
        {
          return false;
        }
      }
      return true;
    });
    if (registry_.empty())
    {
      publisher_.stop();
    }
  }

  void Room::push(Message message)
  {
    publisher_.push(std::move(message));
  }

  void Room::push_text(std::string text)
  {
    push(Message::from_text(std::move(text)));
  }

  void Room::push_bytes(std::string bytes)
  {
    push(Message::from_bytes(std::move(bytes)));
  }

  void Room::push_json(boost::json::value value)
  {
    push(Message::from_json(std::move(value)));
  }

  std::size_t Room::size() const
  {
    return registry_.size();
  }

  std::vector<ConnectionPtr> Room::members() const
  {
    return registry_.snapshot();
  }

  bool Room::contains(const ConnectionPtr& conn) const
  {
    return registry_.contains(conn);
  }

  bool Room::publisher_running() const
  {
    return publisher_.running();
  }

  std::size_t Room::pending_broadcasts() const
  {
    return publisher_.pending();
  }

  void Room::run_hook(const LifecycleHandler& hook, const char* event, Phase phase, const ConnectionPtr& conn)
  {
    if (!hook)
    {
      return;
    }
    try
    {
      hook(*this, conn);
    }
    catch (const std::exception& e)
    {
      fmt::print(stderr, "{}-{} hook failed for connection {}: {}\n", to_string(phase), event, conn->id(), e.what());
    }
  }
}
