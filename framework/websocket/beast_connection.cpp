// framework/websocket/beast_connection.cpp
#include "beast_connection.hpp"
#include "exception/room_errors.hpp"
#include <fmt/core.h>
#include <boost/uuid/uuid_io.hpp>           // to_string
#include <future>
#include <utility>

namespace wsrooms::framework
{
  std::mutex BeastConnection::m_gen_mutex{};
  boost::uuids::random_generator BeastConnection::gen{};

  namespace
  {
    // How often a blocked caller checks whether the io_context was stopped.
    constexpr std::chrono::milliseconds kStopPollInterval{50};
  }

  BeastConnection::BeastConnection(net::io_context& ioc, tcp::socket&& socket,
                                   http::request<http::string_body> upgrade_request, const ConnectionOptions& options)
    : ioc_(ioc),
      ws_(std::move(socket)),
      upgrade_request_(std::move(upgrade_request)),
      options_(options)
  {
    const auto target = upgrade_request_.target();
    target_.assign(target.data(), target.size());

    {
      std::unique_lock<std::mutex> lock(m_gen_mutex);
      id_ = boost::uuids::to_string(gen());
    }

    beast::error_code ec;
    const auto endpoint = beast::get_lowest_layer(ws_).socket().remote_endpoint(ec);
    remote_address_ = ec ? std::string("unknown") : fmt::format("{}:{}", endpoint.address().to_string(), endpoint.port());

    // The websocket timeouts replace the tcp_stream ones.
    beast::get_lowest_layer(ws_).expires_never();
    auto timeouts = ws::stream_base::timeout::suggested(beast::role_type::server);
    timeouts.handshake_timeout = options_.handshake_timeout;
    timeouts.idle_timeout = options_.idle_timeout;
    timeouts.keep_alive_pings = options_.keep_alive_pings;
    ws_.set_option(timeouts);
    ws_.read_message_max(options_.max_message_size);
    ws_.set_option(ws::stream_base::decorator([](ws::response_type& res)
    {
      res.set(http::field::server, std::string(BOOST_BEAST_VERSION_STRING) + " wsrooms");
    }));
  }

  template <class Initiation>
  beast::error_code BeastConnection::run_on_strand(Initiation&& initiation, std::chrono::milliseconds timeout)
  {
    auto done = std::make_shared<std::promise<beast::error_code>>();
    auto result = done->get_future();

    net::post(ws_.get_executor(),
              [self = shared_from_this(), done, initiation = std::forward<Initiation>(initiation)]() mutable
              {
                initiation([done](beast::error_code ec, auto&&...)
                {
                  done->set_value(ec);
                });
              });

    // Handlers posted to a stopped io_context never run.
    const auto wait_ready = [this, &result]()
    {
      while (result.wait_for(kStopPollInterval) != std::future_status::ready)
      {
        if (ioc_.stopped())
        {
          return false;
        }
      }
      return true;
    };

    try
    {
      const auto deadline = std::chrono::steady_clock::now() + timeout;
      while (result.wait_for(kStopPollInterval) != std::future_status::ready)
      {
        if (ioc_.stopped())
        {
          return net::error::operation_aborted;
        }
        if (timeout.count() > 0 && std::chrono::steady_clock::now() >= deadline)
        {
          net::post(ws_.get_executor(), [self = shared_from_this()]()
          {
            beast::get_lowest_layer(self->ws_).cancel();
          });
          // The cancelled operation may still reference the caller's buffers.
          if (!wait_ready())
          {
            return net::error::operation_aborted;
          }
          return net::error::timed_out;
        }
      }
      return result.get();
    }
    catch (const std::future_error&)
    {
      // The handler was destroyed without running: the io_context is gone.
      return net::error::operation_aborted;
    }
  }

  void BeastConnection::accept()
  {
    if (state_ != ConnectionState::Connecting)
    {
      throw ProtocolError(fmt::format("connection {} is already {}", id_, to_string(state_.load())));
    }

    const auto ec = run_on_strand([this](auto handler)
    {
      ws_.async_accept(upgrade_request_, std::move(handler));
    }, std::chrono::milliseconds::zero());

    if (ec)
    {
      state_ = ConnectionState::Disconnected;
      fmt::print(stderr, "WebSocket handshake error for path '{}': {}\n", target_, ec.message());
      throw ProtocolError(fmt::format("websocket handshake failed: {}", ec.message()));
    }
    state_ = ConnectionState::Connected;
    fmt::print("WebSocket handshake successful for path: {}\n", target_);
  }

  Message BeastConnection::receive()
  {
    bool is_text = false;
    const auto ec = run_on_strand([this, &is_text](auto handler)
    {
      ws_.async_read(buffer_, [this, &is_text, handler = std::move(handler)](beast::error_code ec,
                                                                            std::size_t bytes) mutable
      {
        is_text = ws_.got_text();
        handler(ec, bytes);
      });
    }, std::chrono::milliseconds::zero());

    if (ec)
    {
      state_ = ConnectionState::Disconnected;
      if (ec == ws::error::closed)
      {
        throw ConnectionClosed("closed by client");
      }
      if (ec != net::error::eof && ec != net::error::connection_reset && ec != net::error::operation_aborted)
      {
        fmt::print(stderr, "WebSocket read error for path '{}': {}\n", target_, ec.message());
      }
      throw ConnectionClosed(ec.message());
    }

    std::string payload = beast::buffers_to_string(buffer_.data());
    buffer_.consume(buffer_.size());
    if (is_text)
    {
      return Message::from_text(std::move(payload));
    }
    return Message::from_bytes(std::move(payload));
  }

  void BeastConnection::send_text(const std::string& text)
  {
    write(text, true);
  }

  void BeastConnection::send_bytes(const std::string& bytes)
  {
    write(bytes, false);
  }

  void BeastConnection::write(const std::string& payload, bool is_text)
  {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (state_ != ConnectionState::Connected)
    {
      throw ConnectionClosed(fmt::format("connection {} is {}", id_, to_string(state_.load())));
    }

    const auto ec = run_on_strand([this, &payload, is_text](auto handler)
    {
      ws_.text(is_text);
      ws_.async_write(net::buffer(payload), std::move(handler));
    }, options_.write_timeout);

    if (ec)
    {
      fmt::print(stderr, "WebSocket write error for path '{}': {}\n", target_, ec.message());
      throw ConnectionClosed(fmt::format("write failed: {}", ec.message()));
    }
  }

  void BeastConnection::close()
  {
    std::lock_guard<std::mutex> lock(write_mutex_);
    auto expected = ConnectionState::Connected;
    if (!state_.compare_exchange_strong(expected, ConnectionState::Disconnected))
    {
      if (expected == ConnectionState::Connecting)
      {
        // Never accepted: drop the TCP connection.
        state_ = ConnectionState::Disconnected;
        net::post(ws_.get_executor(), [self = shared_from_this()]()
        {
          beast::error_code ec;
          beast::get_lowest_layer(self->ws_).socket().close(ec);
        });
      }
      return;
    }

    const auto ec = run_on_strand([this](auto handler)
    {
      ws_.async_close(ws::close_code::normal, std::move(handler));
    }, options_.close_timeout);

    if (ec && ec != ws::error::closed && ec != net::error::operation_aborted)
    {
      fmt::print(stderr, "WebSocket close error for path '{}': {}\n", target_, ec.message());
    }
  }
}
