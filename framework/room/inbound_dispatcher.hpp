// framework/room/inbound_dispatcher.hpp
#ifndef WSROOMS_FRAMEWORK_ROOM_INBOUND_DISPATCHER_HPP
#define WSROOMS_FRAMEWORK_ROOM_INBOUND_DISPATCHER_HPP

#include <chrono>
#include "callback_registry.hpp"
#include "connection.hpp"

namespace wsrooms::framework
{
  class Room;

  /**
   * @brief Read loop of one member.
   *
   * Frames are handled strictly in arrival order: the next receive() only
   * happens after the previous handler returned.
   *
   * Handler resolution for a Text or Bytes frame: the handler of the same kind,
   * otherwise the Json handler with the payload parsed as JSON, otherwise the
   * frame is dropped. A payload that fails to parse is logged and dropped; the
   * connection stays open.
   */
  class InboundDispatcher
  {
  public:
    InboundDispatcher(Room& room, const CallbackRegistry& callbacks, ConnectionPtr conn,
                      std::chrono::milliseconds slow_handler_threshold);

    /**
     * @brief Runs until the connection ends.
     * @return true if the stream is already closed (peer close / transport failure),
     *         false if the loop stopped because a handler threw and the caller must close it.
     * @throws ProtocolError if the connection was never accepted.
     */
    bool run();

    static Message decode_json(const Message& frame);

  private:
    // false when the handler failed and the loop must end
    bool dispatch(Message frame);

    Room& room_;
    const CallbackRegistry& callbacks_;
    ConnectionPtr conn_;
    std::chrono::milliseconds slow_handler_threshold_;
  };
}
#endif // WSROOMS_FRAMEWORK_ROOM_INBOUND_DISPATCHER_HPP
