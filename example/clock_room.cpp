//
// Two rooms on one server:
//   /current_time  pushes {"current_time": <epoch seconds>} to every member once a second
//   /chat          rebroadcasts every text frame to every member, sender included
//
// usage: clock_room [address] [port] [threads]
//

#include "server.hpp"
#include "room/room.hpp"

#include <boost/asio/steady_timer.hpp>
#include <boost/json.hpp>
#include <fmt/core.h>
#include <chrono>
#include <memory>
#include <string>
#include <utility>

using namespace wsrooms::framework;

class ClockTicker : public std::enable_shared_from_this<ClockTicker>
{
public:
  ClockTicker(net::io_context& ioc, std::shared_ptr<Room> room)
    : timer_(ioc), room_(std::move(room))
  {
  }

  void start()
  {
    schedule_next();
  }

private:
  void schedule_next()
  {
    timer_.expires_after(std::chrono::seconds(1));
    timer_.async_wait([self = shared_from_this()](const boost::system::error_code& ec)
    {
      if (ec == net::error::operation_aborted) return;
      if (ec)
      {
        fmt::print(stderr, "[ClockTicker] Timer error: {}\n", ec.message());
        return;
      }

      const auto now = std::chrono::duration<double>(std::chrono::system_clock::now().time_since_epoch()).count();
      self->room_->push_json(boost::json::object{{"current_time", now}});
      self->schedule_next();
    });
  }

  net::steady_timer timer_;
  std::shared_ptr<Room> room_;
};

int main(int argc, char* argv[])
{
  try
  {
    const std::string address = argc > 1 ? argv[1] : "0.0.0.0";
    const auto port = static_cast<unsigned short>(argc > 2 ? std::stoi(argv[2]) : 8000);

    ServerOptions options;
    if (argc > 3)
    {
      options.threads = static_cast<unsigned int>(std::stoi(argv[3]));
    }

    auto server = std::make_shared<Server>(tcp::endpoint{net::ip::make_address(address), port}, options);

    auto log_join = [](Room& room, const ConnectionPtr& conn)
    {
      fmt::print("{} joined the channel ({} online)\n", conn->remote_address(), room.size());
    };
    auto log_leave = [](Room& room, const ConnectionPtr& conn)
    {
      fmt::print("{} left the channel ({} online)\n", conn->remote_address(), room.size());
    };

    // Ticks pushed while nobody listens are stale by the time someone joins.
    RoomOptions clock_options;
    clock_options.backlog = BacklogPolicy::Discard;
    auto time_room = std::make_shared<Room>(clock_options);
    time_room->on_connect(Phase::After, log_join)
             .on_disconnect(Phase::After, log_leave)
             .on_receive(MessageKind::Text, [](Room&, const ConnectionPtr& conn, const Message& message)
             {
               fmt::print("{} just sent '{}'\n", conn->remote_address(), message.as_string());
             });

    auto chat_room = std::make_shared<Room>();
    chat_room->on_connect(Phase::After, log_join)
             .on_disconnect(Phase::After, log_leave)
             .on_receive(MessageKind::Text, [](Room& room, const ConnectionPtr&, const Message& message)
             {
               room.push_text(message.as_string());
             });

    server->get_room_router().add_room("/current_time", time_room);
    server->get_room_router().add_room("/chat", chat_room);

    std::make_shared<ClockTicker>(server->get_io_context(), time_room)->start();

    server->run();
  }
  catch (const std::exception& e)
  {
    fmt::print(stderr, "Fatal: {}\n", e.what());
    return 1;
  }
  return 0;
}
