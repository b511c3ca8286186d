#include "framework/server.hpp"
#include "framework/router/room_router.hpp"
#include "framework/room/room.hpp"
#include "mock_connection.hpp"
#include <gtest/gtest.h>
#include <boost/beast.hpp>
#include <boost/json.hpp>
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>

namespace beast = boost::beast;
namespace http = beast::http;
namespace ws = beast::websocket;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;
using namespace wsrooms::framework;
using namespace std::chrono_literals;

// --- RoomRouter ---

TEST(RoomRouterTest, FindIgnoresQueryString)
{
  RoomRouter router;
  auto chat = std::make_shared<Room>();
  router.add_room("/chat", chat);

  EXPECT_EQ(router.find("/chat"), chat);
  EXPECT_EQ(router.find("/chat?nick=bob"), chat);
  EXPECT_EQ(router.find("/chat/"), nullptr);
  EXPECT_EQ(router.find("/other"), nullptr);
}

TEST(RoomRouterTest, AddingAgainReplaces)
{
  RoomRouter router;
  auto first = std::make_shared<Room>();
  auto second = std::make_shared<Room>();
  router.add_room("/r", first);
  router.add_room("/r", second);
  router.add_room("/s", first);

  EXPECT_EQ(router.find("/r"), second);
  EXPECT_EQ(router.paths(), (std::vector<std::string>{"/r", "/s"}));
}

// --- Server over real sockets ---

struct ReceivedFrame
{
  std::string payload;
  bool text = false;
};

class ServerTest : public ::testing::Test
{
protected:
  using Client = ws::stream<tcp::socket>;

  void SetUp() override
  {
    ServerOptions options;
    options.threads = 2;
    options.drain_timeout = 2s;
    options.connection.close_timeout = 500ms;
    server = std::make_shared<Server>(tcp::endpoint(net::ip::make_address("127.0.0.1"), 0), options);

    chat = std::make_shared<Room>();
    chat->on_receive(MessageKind::Text, [](Room& room, const ConnectionPtr&, const Message& message)
    {
      room.push_text(message.as_string());
    });
    server->get_room_router().add_room("/chat", chat);
    server->start();
  }

  void TearDown() override
  {
    server->stop();
    EXPECT_EQ(server->active_connections(), 0u);
  }

  std::unique_ptr<Client> open(const std::string& path)
  {
    auto client = std::make_unique<Client>(client_ioc);
    client->next_layer().connect(server->local_endpoint());
    client->handshake("127.0.0.1", path);
    return client;
  }

  // Reads one frame, failing the test instead of hanging forever.
  static ReceivedFrame read_frame(Client& client, std::chrono::milliseconds timeout = 5s)
  {
    auto pending = std::async(std::launch::async, [&client]()
    {
      beast::flat_buffer buffer;
      client.read(buffer);
      return ReceivedFrame{beast::buffers_to_string(buffer.data()), client.got_text()};
    });
    if (pending.wait_for(timeout) != std::future_status::ready)
    {
      beast::error_code ec;
      client.next_layer().shutdown(tcp::socket::shutdown_both, ec);
      ADD_FAILURE() << "no frame within " << timeout.count() << " ms";
      try
      {
        pending.get();
      }
      catch (const std::exception&)
      {
      }
      return {};
    }
    return pending.get();
  }

  static void close_client(Client& client)
  {
    beast::error_code ec;
    client.close(ws::close_code::normal, ec);
  }

  net::io_context client_ioc;
  std::shared_ptr<Server> server;
  std::shared_ptr<Room> chat;
};

TEST_F(ServerTest, BothClientsReceiveTheRebroadcast)
{
  auto a = open("/chat");
  auto b = open("/chat");
  ASSERT_TRUE(wait_until([&]() { return chat->size() == 2; }));

  a->text(true);
  a->write(net::buffer(std::string("hi!")));

  auto at_a = read_frame(*a);
  auto at_b = read_frame(*b);
  EXPECT_EQ(at_a.payload, "hi!");
  EXPECT_TRUE(at_a.text);
  EXPECT_EQ(at_b.payload, "hi!");

  close_client(*a);
  close_client(*b);
}

TEST_F(ServerTest, JsonPushArrivesAsTextFrame)
{
  auto a = open("/chat");
  ASSERT_TRUE(wait_until([&]() { return chat->size() == 1; }));

  const boost::json::value doc = boost::json::object{{"message", "abcd"}};
  chat->push_json(doc);

  auto frame = read_frame(*a);
  EXPECT_TRUE(frame.text);
  EXPECT_EQ(boost::json::parse(frame.payload), doc);

  close_client(*a);
}

TEST_F(ServerTest, BytesPushArrivesAsBinaryFrame)
{
  auto a = open("/chat");
  ASSERT_TRUE(wait_until([&]() { return chat->size() == 1; }));

  const std::string raw("\x00\x01\x02\x03", 4);
  chat->push_bytes(raw);

  auto frame = read_frame(*a);
  EXPECT_FALSE(frame.text);
  EXPECT_EQ(frame.payload, raw);

  close_client(*a);
}

TEST_F(ServerTest, UnknownPathIsRejected)
{
  EXPECT_THROW(open("/nowhere"), boost::system::system_error);
  EXPECT_EQ(chat->size(), 0u);
}

TEST_F(ServerTest, PlainHttpRequestGetsUpgradeRequired)
{
  tcp::socket socket(client_ioc);
  socket.connect(server->local_endpoint());

  http::request<http::empty_body> req(http::verb::get, "/chat", 11);
  req.set(http::field::host, "127.0.0.1");
  http::write(socket, req);

  beast::flat_buffer buffer;
  http::response<http::string_body> res;
  http::read(socket, buffer, res);
  EXPECT_EQ(res.result(), http::status::upgrade_required);
}

TEST_F(ServerTest, ClientCloseRemovesMember)
{
  auto a = open("/chat");
  ASSERT_TRUE(wait_until([&]() { return chat->size() == 1; }));
  EXPECT_TRUE(chat->publisher_running());

  a->close(ws::close_code::normal);

  ASSERT_TRUE(wait_until([&]() { return chat->size() == 0 && server->active_connections() == 0; }));
  EXPECT_FALSE(chat->publisher_running());
}

TEST_F(ServerTest, StopClosesOpenClients)
{
  auto a = open("/chat");
  ASSERT_TRUE(wait_until([&]() { return chat->size() == 1; }));

  auto reader = std::async(std::launch::async, [&a]()
  {
    beast::flat_buffer buffer;
    beast::error_code ec;
    a->read(buffer, ec);
    return ec;
  });

  server->stop();

  ASSERT_EQ(reader.wait_for(5s), std::future_status::ready);
  EXPECT_EQ(reader.get(), ws::error::closed);
  EXPECT_EQ(chat->size(), 0u);
  EXPECT_EQ(server->active_connections(), 0u);
}

TEST(ServerShutdownTest, SlowHandlerOutlivingTheDrainStillFinishes)
{
  ServerOptions options;
  options.drain_timeout = 100ms;
  options.connection.close_timeout = 200ms;
  auto server = std::make_shared<Server>(tcp::endpoint(net::ip::make_address("127.0.0.1"), 0), options);

  std::atomic<bool> handling{false};
  auto slow = std::make_shared<Room>();
  slow->on_receive(MessageKind::Text, [&handling](Room&, const ConnectionPtr&, const Message&)
  {
    handling = true;
    std::this_thread::sleep_for(500ms);
  });
  server->get_room_router().add_room("/slow", slow);
  server->start();

  net::io_context client_ioc;
  ws::stream<tcp::socket> client(client_ioc);
  client.next_layer().connect(server->local_endpoint());
  client.handshake("127.0.0.1", "/slow");
  ASSERT_TRUE(wait_until([&]() { return slow->size() == 1; }));

  client.text(true);
  client.write(net::buffer(std::string("work")));
  ASSERT_TRUE(wait_until([&]() { return handling.load(); }));

  server->stop();

  EXPECT_TRUE(wait_until([&]() { return server->active_connections() == 0; }, 3s));
  EXPECT_EQ(slow->size(), 0u);
}
