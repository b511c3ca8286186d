#ifndef WSROOMS_HTTP_SESSION_HPP
#define WSROOMS_HTTP_SESSION_HPP

#include <boost/beast.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <functional>
#include <memory>
#include "router/room_router.hpp"
#include "websocket/beast_connection.hpp"


namespace wsrooms::framework
{
  namespace beast = boost::beast;
  namespace http = beast::http;
  namespace net = boost::asio;
  using tcp = boost::asio::ip::tcp;

  // Reads the upgrade request of one TCP connection and hands it to the matching room.
  class HttpSession : public std::enable_shared_from_this<HttpSession>
  {
  public:
    // Called with the room and the not yet accepted connection; must not block.
    using ConnectionLauncher = std::function<void(std::shared_ptr<Room>, std::shared_ptr<BeastConnection>)>;

    HttpSession(net::io_context& ioc, tcp::socket&& socket, RoomRouter& router, const ConnectionOptions& options,
                ConnectionLauncher launcher);

    void run();

  private:
    net::io_context& ioc_;
    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> req_;
    http::response<http::string_body> res_;
    RoomRouter& room_router_;
    const ConnectionOptions options_;
    ConnectionLauncher launcher_;

    void do_read();
    void on_read(beast::error_code ec, std::size_t bytes_transferred);

    void handle_websocket_upgrade();
    void send_error(http::status status, const std::string& body);
    void on_write(beast::error_code ec, std::size_t bytes_transferred);

    void do_close();
  };
}
#endif // WSROOMS_HTTP_SESSION_HPP
