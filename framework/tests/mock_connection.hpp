#ifndef WSROOMS_FRAMEWORK_TESTS_MOCK_CONNECTION_HPP
#define WSROOMS_FRAMEWORK_TESTS_MOCK_CONNECTION_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "framework/room/connection.hpp"
#include "framework/exception/room_errors.hpp"

// Scripted in-memory peer. The test plays the remote side through the peer_* methods
// and inspects what the room sent through sent().
class MockConnection : public wsrooms::framework::Connection
{
public:
  using Message = wsrooms::framework::Message;
  using ConnectionState = wsrooms::framework::ConnectionState;

  explicit MockConnection(std::string id = "mock")
    : id_(std::move(id))
  {
  }

  void accept() override
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fail_accept_)
    {
      state_ = ConnectionState::Disconnected;
      throw wsrooms::framework::ProtocolError("handshake refused");
    }
    state_ = ConnectionState::Connected;
  }

  Message receive() override
  {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this]() { return closed_by_server_ || peer_closed_ || !inbound_.empty(); });
    if (closed_by_server_)
    {
      state_ = ConnectionState::Disconnected;
      throw wsrooms::framework::ConnectionClosed("closed by server");
    }
    if (!inbound_.empty())
    {
      Message next = std::move(inbound_.front());
      inbound_.pop_front();
      return next;
    }
    state_ = ConnectionState::Disconnected;
    throw wsrooms::framework::ConnectionClosed("closed by peer");
  }

  void send_text(const std::string& text) override
  {
    record(Message::from_text(text));
  }

  void send_bytes(const std::string& bytes) override
  {
    record(Message::from_bytes(bytes));
  }

  void close() override
  {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      ++close_calls_;
      closed_by_server_ = true;
      state_ = ConnectionState::Disconnected;
    }
    cv_.notify_all();
  }

  ConnectionState state() const override { return state_; }
  const std::string& id() const override { return id_; }
  std::string remote_address() const override { return "127.0.0.1:" + id_; }

  // --- remote side ---

  void peer_send_text(const std::string& text)
  {
    push_inbound(Message::from_text(text));
  }

  void peer_send_bytes(const std::string& bytes)
  {
    push_inbound(Message::from_bytes(bytes));
  }

  void peer_disconnect()
  {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      peer_closed_ = true;
    }
    cv_.notify_all();
  }

  // --- scripting ---

  void fail_accept(bool fail) { fail_accept_ = fail; }
  void fail_sends(bool fail) { fail_sends_ = fail; }
  void send_delay(std::chrono::milliseconds delay) { send_delay_ = delay; }

  // --- inspection ---

  std::vector<Message> sent() const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return sent_;
  }

  std::vector<std::string> sent_payloads() const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> payloads;
    for (const auto& message : sent_)
    {
      payloads.push_back(message.to_wire());
    }
    return payloads;
  }

  bool wait_for_sent(std::size_t count, std::chrono::milliseconds timeout = std::chrono::seconds(5))
  {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this, count]() { return sent_.size() >= count; });
  }

  bool closed_by_server() const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_by_server_;
  }

  int close_calls() const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return close_calls_;
  }

  int send_attempts() const { return send_attempts_; }

private:
  void push_inbound(Message message)
  {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      inbound_.push_back(std::move(message));
    }
    cv_.notify_all();
  }

  void record(Message message)
  {
    ++send_attempts_;
    if (send_delay_.load().count() > 0)
    {
      std::this_thread::sleep_for(send_delay_.load());
    }
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (fail_sends_)
      {
        throw std::runtime_error("broken pipe");
      }
      if (state_ != ConnectionState::Connected)
      {
        throw wsrooms::framework::ConnectionClosed("send on closed connection");
      }
      sent_.push_back(std::move(message));
    }
    cv_.notify_all();
  }

  const std::string id_;
  std::atomic<ConnectionState> state_{ConnectionState::Connecting};
  std::atomic<bool> fail_accept_{false};
  std::atomic<bool> fail_sends_{false};
  std::atomic<std::chrono::milliseconds> send_delay_{std::chrono::milliseconds::zero()};
  std::atomic<int> send_attempts_{0};

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<Message> inbound_;
  std::vector<Message> sent_;
  bool peer_closed_ = false;
  bool closed_by_server_ = false;
  int close_calls_ = 0;
};

// Polls pred until it holds or timeout expires.
inline bool wait_until(const std::function<bool()>& pred,
                       std::chrono::milliseconds timeout = std::chrono::seconds(5))
{
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!pred())
  {
    if (std::chrono::steady_clock::now() >= deadline)
    {
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  return true;
}

#endif // WSROOMS_FRAMEWORK_TESTS_MOCK_CONNECTION_HPP
