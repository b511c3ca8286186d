// framework/room/room.hpp
#ifndef WSROOMS_FRAMEWORK_ROOM_ROOM_HPP
#define WSROOMS_FRAMEWORK_ROOM_ROOM_HPP

#include <boost/json.hpp>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>
#include "broadcast_publisher.hpp"
#include "callback_registry.hpp"
#include "connection.hpp"
#include "connection_registry.hpp"
#include "message.hpp"

namespace wsrooms::framework
{
  struct RoomOptions
  {
    BacklogPolicy backlog = BacklogPolicy::Retain;
    // Handlers running longer than this are logged. Zero disables the warning.
    std::chrono::milliseconds slow_handler_threshold{1000};
  };

  /**
   * @brief A group of live connections with typed inbound dispatch, queued
   * broadcast to every member and hooks around connect / disconnect.
   *
   * Handlers are normally registered before the first connection arrives.
   * Registering later is safe, but which frames see the new handler is up to
   * the caller.
   *
   * The owner must keep the room alive until every connect() call returned.
   */
  class Room
  {
  public:
    explicit Room(RoomOptions options = {});
    ~Room();

    Room(const Room&) = delete;
    Room& operator=(const Room&) = delete;

    Room& on_connect(Phase phase, LifecycleHandler handler);
    Room& on_disconnect(Phase phase, LifecycleHandler handler);
    Room& on_receive(MessageKind kind, ReceiveHandler handler);

    /**
     * @brief Accepts conn, makes it a member and serves it until it disconnects.
     *
     * Blocks for the whole lifetime of the connection; run one call per
     * connection on its own thread.
     *
     * @throws ProtocolError if the accept fails. The connection is not registered.
     */
    void connect(const ConnectionPtr& conn);

    /**
     * @brief Tears a member down: before-disconnect hook, close (unless
     * already_closed), registry removal, publisher stop if the room became
     * empty, after-disconnect hook.
     *
     * Runs once per connection. A call made while another thread is tearing
     * conn down waits for that teardown to finish; other later calls are no-ops.
     */
    void remove(const ConnectionPtr& conn, bool already_closed = false);

    // Removes every current member and waits for teardowns already in progress.
    // Returns with the room empty and the publisher stopped, unless a member
    // joined concurrently.
    void close();

    // Queue a broadcast to every member. Never waits for delivery.
    void push(Message message);
    void push_text(std::string text);
    void push_bytes(std::string bytes);
    void push_json(boost::json::value value);

    std::size_t size() const;
    std::vector<ConnectionPtr> members() const;
    bool contains(const ConnectionPtr& conn) const;
    bool publisher_running() const;
    std::size_t pending_broadcasts() const;

    const RoomOptions& options() const { return options_; }

  private:
    void run_hook(const LifecycleHandler& hook, const char* event, Phase phase, const ConnectionPtr& conn);

    const RoomOptions options_;
    CallbackRegistry callbacks_;
    ConnectionRegistry registry_;
    BroadcastPublisher publisher_;

    // Guards registry mutation together with the publisher start / stop.
    std::mutex membership_mutex_;
    // Accepted connections whose teardown has not started yet.
    std::set<ConnectionPtr> active_;
    // Teardowns in progress and the thread running each of them.
    std::map<ConnectionPtr, std::thread::id> tearing_down_;
    std::condition_variable teardown_cv_;
  };
}
#endif // WSROOMS_FRAMEWORK_ROOM_ROOM_HPP
