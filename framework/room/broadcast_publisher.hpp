// framework/room/broadcast_publisher.hpp
#ifndef WSROOMS_FRAMEWORK_ROOM_BROADCAST_PUBLISHER_HPP
#define WSROOMS_FRAMEWORK_ROOM_BROADCAST_PUBLISHER_HPP

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <thread>
#include <vector>
#include "connection_registry.hpp"
#include "message.hpp"

namespace wsrooms::framework
{
  // What happens to queued broadcasts while the room has no members.
  enum class BacklogPolicy
  {
    Retain, // kept and delivered to whoever joins next
    Discard // cleared on stop, pushes while stopped are dropped
  };

  /**
   * @brief Drains the room's outbox on a single worker thread and fans every
   * message out to a snapshot of the registry.
   *
   * Messages are delivered one at a time in push order. A failed send drops
   * that member (removed from the registry, connection closed) and delivery
   * continues with the rest of the snapshot.
   *
   * Under BacklogPolicy::Retain a message is never consumed by an empty
   * snapshot: it stays at the head of the outbox until a member is added.
   *
   * start()/stop() are idempotent. stop() is cooperative: a broadcast pass
   * already in progress completes before the worker exits. stop() must not be
   * called from a Connection::close() or send_*() implementation, since those
   * run on the worker.
   */
  class BroadcastPublisher
  {
  public:
    BroadcastPublisher(ConnectionRegistry& registry, BacklogPolicy policy);
    ~BroadcastPublisher();

    BroadcastPublisher(const BroadcastPublisher&) = delete;
    BroadcastPublisher& operator=(const BroadcastPublisher&) = delete;

    // Never blocks on delivery.
    void push(Message message);

    // Returns true if the worker was started by this call. Call it after every
    // registry insertion: a running worker holding back retained messages wakes up.
    bool start();
    // Returns true if the worker was stopped by this call.
    bool stop();

    bool running() const { return running_; }
    std::size_t pending() const;

  private:
    void run();
    void deliver(const Message& message, const std::vector<ConnectionPtr>& members);
    void drop(const ConnectionPtr& member);

    ConnectionRegistry& registry_;
    const BacklogPolicy policy_;

    std::mutex worker_mutex_;
    std::thread worker_;
    std::atomic<bool> running_{false};

    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<Message> outbox_;
    bool stopping_ = false;
    // Bumped by start(); tells a waiting worker the registry may have gained a member.
    std::uint64_t members_epoch_ = 0;
  };
}
#endif // WSROOMS_FRAMEWORK_ROOM_BROADCAST_PUBLISHER_HPP
