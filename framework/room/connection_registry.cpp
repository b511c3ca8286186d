// framework/room/connection_registry.cpp
#include "connection_registry.hpp"

#include <algorithm>

namespace wsrooms::framework
{
  void ConnectionRegistry::add(ConnectionPtr conn)
  {
    std::lock_guard<std::mutex> lock(mutex_);
    members_.push_back(std::move(conn));
  }

  bool ConnectionRegistry::remove(const ConnectionPtr& conn)
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = std::find(members_.begin(), members_.end(), conn);
    if (it == members_.end())
    {
      return false;
    }
    members_.erase(it);
    return true;
  }

  std::vector<ConnectionPtr> ConnectionRegistry::snapshot() const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return members_;
  }

  bool ConnectionRegistry::contains(const ConnectionPtr& conn) const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::find(members_.begin(), members_.end(), conn) != members_.end();
  }

  bool ConnectionRegistry::empty() const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return members_.empty();
  }

  std::size_t ConnectionRegistry::size() const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return members_.size();
  }
}
