// framework/server.hpp
#ifndef WSROOMS_FRAMEWORK_SERVER_HPP
#define WSROOMS_FRAMEWORK_SERVER_HPP

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/signal_set.hpp>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>

#include "io_context_pool.hpp"
#include "router/room_router.hpp"
#include "websocket/beast_connection.hpp"

namespace wsrooms::framework
{
  namespace net = boost::asio;
  using tcp = boost::asio::ip::tcp;

  struct ServerOptions
  {
    // io_context worker threads. Connections get threads of their own.
    unsigned int threads = 2;
    ConnectionOptions connection;
    // How long stop() waits for connections to finish their teardown.
    std::chrono::milliseconds drain_timeout{std::chrono::seconds(5)};
  };

  /**
   * @brief Accepts TCP connections, reads the upgrade request and routes it to
   * the Room registered for its path. Each Room::connect() runs on its own thread.
   *
   * Must be owned by a std::shared_ptr.
   */
  class Server : public std::enable_shared_from_this<Server>
  {
  public:
    explicit Server(const tcp::endpoint& endpoint, ServerOptions options = {});
    ~Server();

    RoomRouter& get_room_router();
    const RoomRouter& get_room_router() const;

    net::io_context& get_io_context();

    tcp::endpoint local_endpoint() const;
    std::size_t active_connections() const;

    // Starts accepting; returns immediately.
    void start();

    // start(), then blocks until SIGINT / SIGTERM or stop().
    void run();

    // Closes the acceptor and every room, waits for connections to drain,
    // then stops the worker threads. Not callable from a worker thread.
    void stop();

  private:
    const ServerOptions options_;
    IoContextPool pool_;
    net::signal_set signals_;
    tcp::acceptor acceptor_;

    RoomRouter room_router_;

    mutable std::mutex state_mutex_;
    std::condition_variable state_cv_;
    std::size_t active_connections_ = 0;
    bool stop_requested_ = false;
    // Cleared when stop() begins; later upgrades are refused.
    bool accepting_ = true;
    std::once_flag stop_flag_;

    void do_accept();
    void on_accept(boost::beast::error_code ec, tcp::socket socket);
    void launch(std::shared_ptr<Room> room, std::shared_ptr<BeastConnection> conn);
    void request_stop();
    void handle_signal(const boost::beast::error_code& error, int signal_number);
  };
}
#endif
