// framework/room/message.cpp
#include "message.hpp"

#include <utility>

namespace wsrooms::framework
{
  const char* to_string(MessageKind kind)
  {
    switch (kind)
    {
    case MessageKind::Text:
      return "text";
    case MessageKind::Bytes:
      return "bytes";
    case MessageKind::Json:
      return "json";
    }
    return "unknown";
  }

  const char* to_string(Phase phase)
  {
    return phase == Phase::Before ? "before" : "after";
  }

  Message::Message(MessageKind kind, Payload payload)
    : kind_(kind), payload_(std::move(payload))
  {
  }

  Message Message::from_text(std::string text)
  {
    return Message(MessageKind::Text, Payload(std::in_place_index<0>, std::move(text)));
  }

  Message Message::from_bytes(std::string bytes)
  {
    return Message(MessageKind::Bytes, Payload(std::in_place_index<0>, std::move(bytes)));
  }

  Message Message::from_json(boost::json::value value)
  {
    return Message(MessageKind::Json, Payload(std::in_place_index<1>, std::move(value)));
  }

  const std::string& Message::as_string() const
  {
    return std::get<std::string>(payload_);
  }

  const boost::json::value& Message::as_json() const
  {
    return std::get<boost::json::value>(payload_);
  }

  std::string Message::to_wire() const
  {
    if (kind_ == MessageKind::Json)
    {
      return boost::json::serialize(as_json());
    }
    return as_string();
  }
}
