// framework/router/room_router.hpp
#ifndef WSROOMS_FRAMEWORK_ROUTER_ROOM_ROUTER_HPP
#define WSROOMS_FRAMEWORK_ROUTER_ROOM_ROUTER_HPP

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "room/room.hpp"

namespace wsrooms::framework
{
  // Upgrade target path -> Room
  class RoomRouter
  {
  public:
    RoomRouter();

    // Replaces a room already registered under path.
    void add_room(const std::string& path, std::shared_ptr<Room> room);

    // target may carry a query string, it is ignored. nullptr if nothing matches.
    std::shared_ptr<Room> find(const std::string& target) const;

    std::vector<std::string> paths() const;

    // Closes every member of every room.
    void close_all();

  private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Room>> rooms_;
  };
}
#endif // WSROOMS_FRAMEWORK_ROUTER_ROOM_ROUTER_HPP
