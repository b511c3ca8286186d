// framework/room/connection.cpp
#include "connection.hpp"

namespace wsrooms::framework
{
  const char* to_string(ConnectionState state)
  {
    switch (state)
    {
    case ConnectionState::Connecting:
      return "connecting";
    case ConnectionState::Connected:
      return "connected";
    case ConnectionState::Disconnected:
      return "disconnected";
    }
    return "unknown";
  }

  void Connection::send(const Message& message)
  {
    switch (message.kind())
    {
    case MessageKind::Text:
      send_text(message.as_string());
      break;
    case MessageKind::Bytes:
      send_bytes(message.as_string());
      break;
    case MessageKind::Json:
      send_text(message.to_wire());
      break;
    }
  }
}
