#include "framework/room/connection_registry.hpp"
#include "mock_connection.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace wsrooms::framework;

class ConnectionRegistryTest : public ::testing::Test
{
protected:
  ConnectionRegistry registry;

  static ConnectionPtr make(const std::string& id)
  {
    return std::make_shared<MockConnection>(id);
  }
};

TEST_F(ConnectionRegistryTest, AddAndRemove)
{
  auto a = make("a");
  auto b = make("b");
  EXPECT_TRUE(registry.empty());

  registry.add(a);
  registry.add(b);
  EXPECT_EQ(registry.size(), 2u);
  EXPECT_TRUE(registry.contains(a));
  EXPECT_TRUE(registry.contains(b));

  EXPECT_TRUE(registry.remove(a));
  EXPECT_FALSE(registry.contains(a));
  EXPECT_EQ(registry.size(), 1u);
}

TEST_F(ConnectionRegistryTest, RemovingANonMemberIsReported)
{
  auto a = make("a");
  registry.add(make("b"));

  EXPECT_FALSE(registry.remove(a));
  EXPECT_EQ(registry.size(), 1u);
}

TEST_F(ConnectionRegistryTest, SnapshotIsUnaffectedByLaterChanges)
{
  auto a = make("a");
  auto b = make("b");
  registry.add(a);
  registry.add(b);

  auto snapshot = registry.snapshot();
  registry.remove(a);
  registry.add(make("c"));

  ASSERT_EQ(snapshot.size(), 2u);
  EXPECT_EQ(snapshot[0], a);
  EXPECT_EQ(snapshot[1], b);
  EXPECT_EQ(registry.size(), 2u);
}

TEST_F(ConnectionRegistryTest, ConcurrentMutationAndIteration)
{
  constexpr int kWriters = 4;
  constexpr int kPerWriter = 200;
  std::atomic<bool> done{false};

  std::thread reader([this, &done]()
  {
    while (!done)
    {
      for (const auto& member : registry.snapshot())
      {
        ASSERT_NE(member, nullptr);
      }
    }
  });

  std::vector<std::thread> writers;
  for (int w = 0; w < kWriters; ++w)
  {
    writers.emplace_back([this, w]()
    {
      std::vector<ConnectionPtr> mine;
      for (int i = 0; i < kPerWriter; ++i)
      {
        mine.push_back(make(std::to_string(w) + "-" + std::to_string(i)));
        registry.add(mine.back());
      }
      // keep every other one
      for (std::size_t i = 0; i < mine.size(); i += 2)
      {
        EXPECT_TRUE(registry.remove(mine[i]));
      }
    });
  }
  for (auto& t : writers)
  {
    t.join();
  }
  done = true;
  reader.join();

  EXPECT_EQ(registry.size(), static_cast<std::size_t>(kWriters * kPerWriter / 2));
}
