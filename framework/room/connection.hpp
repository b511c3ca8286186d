// framework/room/connection.hpp
#ifndef WSROOMS_FRAMEWORK_ROOM_CONNECTION_HPP
#define WSROOMS_FRAMEWORK_ROOM_CONNECTION_HPP

#include <memory>
#include <string>
#include "message.hpp"

namespace wsrooms::framework
{
  enum class ConnectionState
  {
    Connecting,
    Connected,
    Disconnected
  };

  const char* to_string(ConnectionState state);

  /**
   * @brief A bidirectional message stream handed to a Room by its host.
   *
   * The host creates it past transport readiness; the Room performs accept().
   * All blocking calls are made from the connection's own thread except the
   * send_* and close() calls, which may also come from the room's publisher.
   * Implementations must serialize those.
   */
  class Connection
  {
  public:
    virtual ~Connection() = default;

    /**
     * @brief Completes the WebSocket-level accept.
     * @throws ProtocolError if the handshake fails.
     */
    virtual void accept() = 0;

    /**
     * @brief Blocks until the next frame arrives.
     * @return a Text or Bytes message.
     * @throws ConnectionClosed when the peer disconnects or the stream fails.
     */
    virtual Message receive() = 0;

    /**
     * @throws ConnectionClosed if the connection is gone or the write fails.
     */
    virtual void send_text(const std::string& text) = 0;
    virtual void send_bytes(const std::string& bytes) = 0;

    // Idempotent. Does not throw for an already closed connection.
    virtual void close() = 0;

    virtual ConnectionState state() const = 0;

    // Transport-level identity, used for logging.
    virtual const std::string& id() const = 0;
    virtual std::string remote_address() const = 0;

    // Sends with the method matching message.kind(); Json goes out as a text frame.
    void send(const Message& message);
  };

  using ConnectionPtr = std::shared_ptr<Connection>;
}
#endif // WSROOMS_FRAMEWORK_ROOM_CONNECTION_HPP
