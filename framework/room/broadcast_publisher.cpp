// framework/room/broadcast_publisher.cpp
#include "broadcast_publisher.hpp"
#include <fmt/core.h>

#include <optional>
#include <utility>

namespace wsrooms::framework
{
  BroadcastPublisher::BroadcastPublisher(ConnectionRegistry& registry, BacklogPolicy policy)
    : registry_(registry), policy_(policy)
  {
  }

  BroadcastPublisher::~BroadcastPublisher()
  {
    stop();
  }

  void BroadcastPublisher::push(Message message)
  {
    {
      std::lock_guard<std::mutex> lock(queue_mutex_);
      if (policy_ == BacklogPolicy::Discard && !running_)
      {
        fmt::print(stderr, "Room is empty, discarding {} broadcast\n", to_string(message.kind()));
        return;
      }
      outbox_.push_back(std::move(message));
    }
    queue_cv_.notify_one();
  }

  bool BroadcastPublisher::start()
  {
    std::lock_guard<std::mutex> guard(worker_mutex_);
    if (worker_.joinable())
    {
      {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        ++members_epoch_;
      }
      queue_cv_.notify_all();
      return false;
    }
    {
      std::lock_guard<std::mutex> lock(queue_mutex_);
      stopping_ = false;
      running_ = true;
      ++members_epoch_;
    }
    worker_ = std::thread(&BroadcastPublisher::run, this);
    return true;
  }

  bool BroadcastPublisher::stop()
  {
    std::lock_guard<std::mutex> guard(worker_mutex_);
    if (!worker_.joinable())
    {
      return false;
    }
    {
      std::lock_guard<std::mutex> lock(queue_mutex_);
      stopping_ = true;
      running_ = false;
      if (policy_ == BacklogPolicy::Discard && !outbox_.empty())
      {
        fmt::print(stderr, "Room is empty, discarding {} queued broadcast(s)\n", outbox_.size());
        outbox_.clear();
      }
    }
    queue_cv_.notify_all();
    worker_.join();
    return true;
  }

  std::size_t BroadcastPublisher::pending() const
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return outbox_.size();
  }

  void BroadcastPublisher::run()
  {
    // Epoch at which the head message found nobody to deliver to.
    std::optional<std::uint64_t> idle_epoch;
    for (;;)
    {
      std::optional<Message> next;
      std::uint64_t epoch = 0;
      {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        queue_cv_.wait(lock, [this, &idle_epoch]
        {
          return stopping_ || (!outbox_.empty() && (!idle_epoch || *idle_epoch != members_epoch_));
        });
        if (stopping_)
        {
          return;
        }
        epoch = members_epoch_;
        next.emplace(std::move(outbox_.front()));
        outbox_.pop_front();
      }

      // Members joining after this point only see later messages.
      const auto members = registry_.snapshot();
      if (members.empty())
      {
        if (policy_ == BacklogPolicy::Discard)
        {
          fmt::print(stderr, "Room is empty, discarding {} broadcast\n", to_string(next->kind()));
          continue;
        }
        std::lock_guard<std::mutex> lock(queue_mutex_);
        outbox_.push_front(std::move(*next));
        idle_epoch = epoch;
        continue;
      }
      idle_epoch.reset();
      deliver(*next, members);
    }
  }

  void BroadcastPublisher::deliver(const Message& message, const std::vector<ConnectionPtr>& members)
  {
    for (const auto& member : members)
    {
      try
      {
        member->send(message);
      }
      catch (const std::exception& e)
      {
        fmt::print(stderr, "Broadcast of {} message to {} failed: {}\n", to_string(message.kind()), member->id(),
                   e.what());
        drop(member);
      }
    }
  }

  void BroadcastPublisher::drop(const ConnectionPtr& member)
  {
    // Disconnect hooks run later, from the member's own teardown.
    registry_.remove(member);
    try
    {
      member->close();
    }
    catch (const std::exception& e)
    {
      fmt::print(stderr, "Closing dropped member {} failed: {}\n", member->id(), e.what());
    }
  }
}
