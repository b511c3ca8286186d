#include "http_session.hpp"

#include <fmt/core.h>
#include <utility>


using namespace wsrooms::framework;

HttpSession::HttpSession(net::io_context& ioc, tcp::socket&& socket, RoomRouter& router,
                         const ConnectionOptions& options, ConnectionLauncher launcher)
  : ioc_(ioc),
    stream_(std::move(socket)),
    room_router_(router),
    options_(options),
    launcher_(std::move(launcher))
{
}

void HttpSession::run()
{
  net::dispatch(stream_.get_executor(),
                beast::bind_front_handler(&HttpSession::do_read, shared_from_this()));
}

void HttpSession::do_read()
{
  req_ = {};
  stream_.expires_after(options_.handshake_timeout);
  http::async_read(stream_, buffer_, req_,
                   beast::bind_front_handler(&HttpSession::on_read, shared_from_this()));
}

void HttpSession::on_read(beast::error_code ec, std::size_t bytes_transferred)
{
  boost::ignore_unused(bytes_transferred);

  if (ec == http::error::end_of_stream)
  {
    return do_close();
  }
  if (ec)
  {
    fmt::print(stderr, "HttpSession on_read error: {}\n", ec.message());
    return;
  }

  if (!ws::is_upgrade(req_))
  {
    return send_error(http::status::upgrade_required, "WebSocket upgrade required\n");
  }

  handle_websocket_upgrade();
}

void HttpSession::handle_websocket_upgrade()
{
  const auto target_view = req_.target();
  const std::string target(target_view.data(), target_view.size());
  fmt::print("Detected WebSocket upgrade request for target: {}\n", target);

  auto room = room_router_.find(target);
  if (!room)
  {
    return send_error(http::status::not_found, "No room at this path\n");
  }

  stream_.expires_never();
  auto conn = std::make_shared<BeastConnection>(ioc_, stream_.release_socket(), std::move(req_), options_);
  launcher_(std::move(room), std::move(conn));
}

void HttpSession::send_error(http::status status, const std::string& body)
{
  res_ = {};
  res_.result(status);
  res_.version(req_.version());
  res_.set(http::field::server, std::string(BOOST_BEAST_VERSION_STRING) + " wsrooms");
  res_.set(http::field::content_type, "text/plain");
  res_.keep_alive(false);
  res_.body() = body;
  res_.prepare_payload();

  http::async_write(stream_, res_,
                    beast::bind_front_handler(&HttpSession::on_write, shared_from_this()));
}

void HttpSession::on_write(beast::error_code ec, std::size_t bytes_transferred)
{
  boost::ignore_unused(bytes_transferred);

  if (ec)
  {
    fmt::print(stderr, "HttpSession on_write error: {}\n", ec.message());
    return;
  }

  do_close();
}

void HttpSession::do_close()
{
  beast::error_code ec;
  stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
  if (ec)
  {
    fmt::print(stderr, "HttpSession shutdown error: {}\n", ec.message());
  }
}
