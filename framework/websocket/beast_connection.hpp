// framework/websocket/beast_connection.hpp
#ifndef WSROOMS_FRAMEWORK_WEBSOCKET_BEAST_CONNECTION_HPP
#define WSROOMS_FRAMEWORK_WEBSOCKET_BEAST_CONNECTION_HPP

#include <boost/beast.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include "room/connection.hpp"

namespace wsrooms::framework
{
  namespace beast = boost::beast;
  namespace http = beast::http;
  namespace ws = beast::websocket;
  namespace net = boost::asio;
  using tcp = boost::asio::ip::tcp;

  struct ConnectionOptions
  {
    std::chrono::milliseconds handshake_timeout{std::chrono::seconds(30)};
    // No frame from the peer for this long closes the stream. Pings keep quiet peers alive.
    std::chrono::milliseconds idle_timeout{std::chrono::seconds(300)};
    bool keep_alive_pings = true;
    std::chrono::milliseconds write_timeout{std::chrono::seconds(10)};
    std::chrono::milliseconds close_timeout{std::chrono::seconds(5)};
    std::size_t max_message_size = 32 * 1024 * 1024;
  };

  /**
   * @brief Connection over a Beast WebSocket stream.
   *
   * Every Beast operation is started on the socket's strand; the calling thread
   * blocks on its completion. That needs the io_context to be run by other
   * threads than the ones calling into this object. Once the io_context is
   * stopped, every blocking call returns with operation_aborted.
   */
  class BeastConnection : public Connection, public std::enable_shared_from_this<BeastConnection>
  {
  public:
    // upgrade_request has already been read from socket by the host. ioc runs the socket.
    BeastConnection(net::io_context& ioc, tcp::socket&& socket, http::request<http::string_body> upgrade_request,
                    const ConnectionOptions& options);

    void accept() override;
    Message receive() override;
    void send_text(const std::string& text) override;
    void send_bytes(const std::string& bytes) override;
    void close() override;

    ConnectionState state() const override { return state_; }
    const std::string& id() const override { return id_; }
    std::string remote_address() const override { return remote_address_; }

    const std::string& target() const { return target_; }

  private:
    template <class Initiation>
    beast::error_code run_on_strand(Initiation&& initiation, std::chrono::milliseconds timeout);

    void write(const std::string& payload, bool is_text);

    net::io_context& ioc_;
    ws::stream<beast::tcp_stream> ws_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> upgrade_request_;
    const ConnectionOptions options_;
    std::string id_;
    std::string remote_address_;
    std::string target_;
    std::atomic<ConnectionState> state_{ConnectionState::Connecting};
    // one write or close in flight at a time
    std::mutex write_mutex_;

    static std::mutex m_gen_mutex;
    static boost::uuids::random_generator gen;
  };
}
#endif // WSROOMS_FRAMEWORK_WEBSOCKET_BEAST_CONNECTION_HPP
