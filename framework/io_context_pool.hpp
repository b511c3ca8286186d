#ifndef WSROOMS_FRAMEWORK_IO_CONTEXT_POOL_HPP
#define WSROOMS_FRAMEWORK_IO_CONTEXT_POOL_HPP

#include <boost/asio/io_context.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <thread>
#include <vector>
#include <mutex>

namespace wsrooms::framework
{
  // A shared io_context run by a fixed set of worker threads. Owned by the Server.
  class IoContextPool
  {
  public:
    explicit IoContextPool(unsigned int num_threads = std::thread::hardware_concurrency())
      : work_guard_(boost::asio::make_work_guard(ioc_))
    {
      // hardware_concurrency() may report 0
      if (num_threads == 0) num_threads = 1;

      threads_.reserve(num_threads);
      for (unsigned int i = 0; i < num_threads; ++i)
      {
        threads_.emplace_back([this]()
        {
          ioc_.run();
        });
      }
    }

    ~IoContextPool()
    {
      stop();
    }

    IoContextPool(const IoContextPool&) = delete;
    IoContextPool& operator=(const IoContextPool&) = delete;

    boost::asio::io_context& get_io_context()
    {
      return ioc_;
    }

    // Must not be called from one of the pool's own threads.
    void stop()
    {
      std::call_once(stop_flag_, [this]()
      {
        work_guard_.reset();
        ioc_.stop();

        for (auto& t : threads_)
        {
          if (t.joinable())
          {
            t.join();
          }
        }
        threads_.clear();
      });
    }

  private:
    boost::asio::io_context ioc_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
    std::vector<std::thread> threads_;
    std::once_flag stop_flag_;
  };
}

#endif // WSROOMS_FRAMEWORK_IO_CONTEXT_POOL_HPP
