// framework/router/room_router.cpp
#include "room_router.hpp"
#include <fmt/core.h>
#include <utility>

namespace wsrooms::framework
{
  RoomRouter::RoomRouter() = default;

  void RoomRouter::add_room(const std::string& path, std::shared_ptr<Room> room)
  {
    std::lock_guard<std::mutex> lock(mutex_);
    rooms_[path] = std::move(room);
    fmt::print("Registered room for path: {}\n", path);
  }

  std::shared_ptr<Room> RoomRouter::find(const std::string& target) const
  {
    const auto path = target.substr(0, target.find('?'));

    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = rooms_.find(path);
    if (it == rooms_.end())
    {
      fmt::print(stderr, "No room found for WS path: {}\n", path);
      return nullptr;
    }
    return it->second;
  }

  std::vector<std::string> RoomRouter::paths() const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(rooms_.size());
    for (const auto& item : rooms_)
    {
      result.push_back(item.first);
    }
    return result;
  }

  void RoomRouter::close_all()
  {
    std::vector<std::shared_ptr<Room>> rooms;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      for (const auto& item : rooms_)
      {
        rooms.push_back(item.second);
      }
    }
    for (const auto& room : rooms)
    {
      room->close();
    }
  }
}
