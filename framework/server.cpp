// framework/server.cpp
#include "server.hpp"
#include "session/http_session.hpp"
#include <fmt/core.h>
#include <csignal>
#include <stdexcept>
#include <thread>
#include <utility>

namespace wsrooms::framework
{
  namespace
  {
    constexpr std::chrono::milliseconds kDrainPollInterval{50};
  }

  Server::Server(const tcp::endpoint& endpoint, ServerOptions options)
    : options_(std::move(options)),
      pool_(options_.threads),
      signals_(pool_.get_io_context(), SIGINT, SIGTERM),
      acceptor_(net::make_strand(pool_.get_io_context()))
  {
    boost::beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec)
    {
      fmt::print(stderr, "Server open error: {}\n", ec.message());
      throw std::runtime_error(fmt::format("Failed to open acceptor: {}", ec.message()));
    }

    acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    if (ec)
    {
      fmt::print(stderr, "Server set_option reuse_address error: {}\n", ec.message());
      throw std::runtime_error(fmt::format("Failed to set reuse_address: {}", ec.message()));
    }

    acceptor_.bind(endpoint, ec);
    if (ec)
    {
      fmt::print(stderr, "Server bind error: {}\n", ec.message());
      throw std::runtime_error(fmt::format("Failed to bind acceptor: {}", ec.message()));
    }

    acceptor_.listen(net::socket_base::max_listen_connections, ec);
    if (ec)
    {
      fmt::print(stderr, "Server listen error: {}\n", ec.message());
      throw std::runtime_error(fmt::format("Failed to listen: {}", ec.message()));
    }
  }

  Server::~Server()
  {
    stop();
  }

  RoomRouter& Server::get_room_router()
  {
    return room_router_;
  }

  const RoomRouter& Server::get_room_router() const
  {
    return room_router_;
  }

  net::io_context& Server::get_io_context()
  {
    return pool_.get_io_context();
  }

  tcp::endpoint Server::local_endpoint() const
  {
    return acceptor_.local_endpoint();
  }

  std::size_t Server::active_connections() const
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return active_connections_;
  }

  void Server::start()
  {
    fmt::print("Server listening on {}:{}\n", acceptor_.local_endpoint().address().to_string(),
               acceptor_.local_endpoint().port());

    net::dispatch(acceptor_.get_executor(),
                  beast::bind_front_handler(&Server::do_accept, shared_from_this()));
  }

  void Server::run()
  {
    start();

    signals_.async_wait(beast::bind_front_handler(&Server::handle_signal, shared_from_this()));

    {
      std::unique_lock<std::mutex> lock(state_mutex_);
      state_cv_.wait(lock, [this] { return stop_requested_; });
    }

    stop();
  }

  void Server::stop()
  {
    std::call_once(stop_flag_, [this]()
    {
      {
        std::lock_guard<std::mutex> lock(state_mutex_);
        accepting_ = false;
      }

      boost::beast::error_code ec;
      acceptor_.close(ec);
      if (ec)
      {
        fmt::print(stderr, "Server acceptor close error: {}\n", ec.message());
      }
      signals_.cancel(ec);

      room_router_.close_all();

      // Connections launched while the rooms were being closed still join a room;
      // keep closing until everything drained.
      const auto deadline = std::chrono::steady_clock::now() + options_.drain_timeout;
      std::unique_lock<std::mutex> lock(state_mutex_);
      while (!state_cv_.wait_for(lock, kDrainPollInterval, [this] { return active_connections_ == 0; }))
      {
        if (std::chrono::steady_clock::now() >= deadline)
        {
          fmt::print(stderr, "Server stop: {} connection(s) still running\n", active_connections_);
          break;
        }
        lock.unlock();
        room_router_.close_all();
        lock.lock();
      }
      lock.unlock();

      pool_.stop();
      fmt::print("Server stopped.\n");
    });

    request_stop();
  }

  void Server::do_accept()
  {
    acceptor_.async_accept(
      net::make_strand(pool_.get_io_context()),
      beast::bind_front_handler(&Server::on_accept, shared_from_this()));
  }

  void Server::on_accept(boost::beast::error_code ec, tcp::socket socket)
  {
    if (ec)
    {
      if (ec != boost::system::errc::operation_canceled)
      {
        fmt::print(stderr, "Server on_accept error: {}\n", ec.message());
      }
    }
    else
    {
      auto launcher = [weak = weak_from_this()](std::shared_ptr<Room> room, std::shared_ptr<BeastConnection> conn)
      {
        if (auto self = weak.lock())
        {
          self->launch(std::move(room), std::move(conn));
        }
      };
      std::make_shared<HttpSession>(pool_.get_io_context(), std::move(socket), room_router_, options_.connection,
                                    std::move(launcher))->run();
    }

    if (acceptor_.is_open())
    {
      do_accept();
    }
  }

  void Server::launch(std::shared_ptr<Room> room, std::shared_ptr<BeastConnection> conn)
  {
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      if (!accepting_)
      {
        fmt::print(stderr, "Server stopping, refusing connection {} from {}\n", conn->id(), conn->remote_address());
        conn->close();
        return;
      }
      ++active_connections_;
    }

    // Room::connect blocks for the whole life of the connection.
    std::thread([self = shared_from_this(), room = std::move(room), conn = std::move(conn)]()
    {
      try
      {
        room->connect(conn);
      }
      catch (const std::exception& e)
      {
        fmt::print(stderr, "Connection {} from {} rejected: {}\n", conn->id(), conn->remote_address(), e.what());
      }

      {
        std::lock_guard<std::mutex> lock(self->state_mutex_);
        --self->active_connections_;
      }
      self->state_cv_.notify_all();
    }).detach();
  }

  void Server::request_stop()
  {
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      stop_requested_ = true;
    }
    state_cv_.notify_all();
  }

  void Server::handle_signal(const boost::beast::error_code& error, int signal_number)
  {
    if (!error)
    {
      fmt::print("Received signal {}, shutting down gracefully...\n", signal_number);
      request_stop();
    }
  }
} // namespace wsrooms::framework
