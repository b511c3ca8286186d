// framework/room/message.hpp
#ifndef WSROOMS_FRAMEWORK_ROOM_MESSAGE_HPP
#define WSROOMS_FRAMEWORK_ROOM_MESSAGE_HPP

#include <boost/json.hpp>
#include <string>
#include <variant>

namespace wsrooms::framework
{
  enum class MessageKind
  {
    Text,
    Bytes,
    Json
  };

  // Hook position around connect / disconnect
  enum class Phase
  {
    Before,
    After
  };

  const char* to_string(MessageKind kind);
  const char* to_string(Phase phase);

  /**
   * @brief One inbound frame or one pending broadcast.
   *
   * Text and Bytes carry their payload as a std::string (bytes are opaque octets),
   * Json carries the parsed value.
   */
  class Message
  {
  public:
    static Message from_text(std::string text);
    static Message from_bytes(std::string bytes);
    static Message from_json(boost::json::value value);

    MessageKind kind() const { return kind_; }

    // Text / Bytes payload. Throws std::bad_variant_access for Json.
    const std::string& as_string() const;
    // Json payload. Throws std::bad_variant_access for Text / Bytes.
    const boost::json::value& as_json() const;

    // What goes on the wire: the raw payload, or the serialized JSON document.
    std::string to_wire() const;

  private:
    using Payload = std::variant<std::string, boost::json::value>;

    Message(MessageKind kind, Payload payload);

    MessageKind kind_;
    Payload payload_;
  };
}
#endif // WSROOMS_FRAMEWORK_ROOM_MESSAGE_HPP
