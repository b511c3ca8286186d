// framework/room/connection_registry.hpp
#ifndef WSROOMS_FRAMEWORK_ROOM_CONNECTION_REGISTRY_HPP
#define WSROOMS_FRAMEWORK_ROOM_CONNECTION_REGISTRY_HPP

#include <cstddef>
#include <mutex>
#include <vector>
#include "connection.hpp"

namespace wsrooms::framework
{
  // Membership set of a room. Readers iterate copies taken by snapshot().
  class ConnectionRegistry
  {
  public:
    void add(ConnectionPtr conn);

    // Removes the first matching entry. Returns false if it was not a member.
    bool remove(const ConnectionPtr& conn);

    std::vector<ConnectionPtr> snapshot() const;

    bool contains(const ConnectionPtr& conn) const;
    bool empty() const;
    std::size_t size() const;

  private:
    mutable std::mutex mutex_;
    std::vector<ConnectionPtr> members_;
  };
}
#endif // WSROOMS_FRAMEWORK_ROOM_CONNECTION_REGISTRY_HPP
