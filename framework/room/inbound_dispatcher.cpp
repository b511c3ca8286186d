// framework/room/inbound_dispatcher.cpp
#include "inbound_dispatcher.hpp"
#include "exception/room_errors.hpp"
#include <fmt/core.h>

#include <optional>
#include <utility>

namespace wsrooms::framework
{
  InboundDispatcher::InboundDispatcher(Room& room, const CallbackRegistry& callbacks, ConnectionPtr conn,
                                       std::chrono::milliseconds slow_handler_threshold)
    : room_(room), callbacks_(callbacks), conn_(std::move(conn)), slow_handler_threshold_(slow_handler_threshold)
  {
  }

  bool InboundDispatcher::run()
  {
    for (;;)
    {
      const auto state = conn_->state();
      if (state == ConnectionState::Disconnected)
      {
        return true;
      }
      if (state != ConnectionState::Connected)
      {
        throw ProtocolError(fmt::format("receive before accept on connection {} ({})", conn_->id(),
                                        to_string(state)));
      }

      std::optional<Message> frame;
      try
      {
        frame.emplace(conn_->receive());
      }
      catch (const ConnectionClosed& e)
      {
        fmt::print("Connection {} closed: {}\n", conn_->id(), e.what());
        return true;
      }

      if (!dispatch(std::move(*frame)))
      {
        return false;
      }
    }
  }

  Message InboundDispatcher::decode_json(const Message& frame)
  {
    boost::json::error_code ec;
    auto value = boost::json::parse(frame.as_string(), ec);
    if (ec)
    {
      throw DecodeError(fmt::format("invalid JSON in {} frame: {}", to_string(frame.kind()), ec.message()));
    }
    return Message::from_json(std::move(value));
  }

  bool InboundDispatcher::dispatch(Message frame)
  {
    std::optional<Message> message;
    ReceiveHandler handler = callbacks_.receive_handler(frame.kind());
    if (handler)
    {
      message.emplace(std::move(frame));
    }
    else
    {
      handler = callbacks_.receive_handler(MessageKind::Json);
      if (!handler)
      {
        return true;
      }
      try
      {
        message.emplace(decode_json(frame));
      }
      catch (const DecodeError& e)
      {
        fmt::print(stderr, "Dropping frame from {}: {}\n", conn_->id(), e.what());
        return true;
      }
    }

    const auto started = std::chrono::steady_clock::now();
    try
    {
      handler(room_, conn_, *message);
    }
    catch (const std::exception& e)
    {
      fmt::print(stderr, "{} handler failed for connection {}: {}\n", to_string(message->kind()), conn_->id(),
                 e.what());
      return false;
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
    if (slow_handler_threshold_.count() > 0 && elapsed > slow_handler_threshold_)
    {
      fmt::print(stderr, "Warning: {} handler for connection {} took {} ms\n", to_string(message->kind()),
                 conn_->id(), elapsed.count());
    }
    return true;
  }
}
