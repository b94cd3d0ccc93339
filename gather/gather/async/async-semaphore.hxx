#pragma once

#include <cstddef>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/experimental/channel.hpp>

namespace gather
{
  namespace asio = boost::asio;

  class async_semaphore;

  // Semaphore permit.
  //
  // Releases its slot when destroyed, on every exit path, including
  // exceptions and cancellation.
  //
  class semaphore_permit
  {
  public:
    semaphore_permit () = default;

    explicit
    semaphore_permit (async_semaphore& s) : s_ (&s) {}

    semaphore_permit (semaphore_permit&& p) noexcept
      : s_ (std::exchange (p.s_, nullptr)) {}

    semaphore_permit&
    operator= (semaphore_permit&& p) noexcept
    {
      if (this != &p)
      {
        release ();
        s_ = std::exchange (p.s_, nullptr);
      }
      return *this;
    }

    semaphore_permit (const semaphore_permit&) = delete;
    semaphore_permit& operator= (const semaphore_permit&) = delete;

    ~semaphore_permit ()
    {
      release ();
    }

    // Give the slot back early.
    //
    void
    release () noexcept;

    bool
    owns () const noexcept
    {
      return s_ != nullptr;
    }

  private:
    async_semaphore* s_ = nullptr;
  };

  // Counting semaphore for coroutines.
  //
  // Implemented on top of a buffered channel: a permit is a message sitting
  // in the buffer, so acquire() suspends once the buffer is full and resumes
  // in FIFO order as permits are released. Waiting is cancellable.
  //
  class async_semaphore
  {
  public:
    using executor_type = asio::any_io_executor;

    async_semaphore (executor_type ex, std::size_t n)
      : channel_ (ex, n), limit_ (n) {}

    async_semaphore (const async_semaphore&) = delete;
    async_semaphore& operator= (const async_semaphore&) = delete;

    asio::awaitable<semaphore_permit>
    acquire ()
    {
      co_await channel_.async_send (boost::system::error_code (),
                                    asio::use_awaitable);
      ++in_use_;
      co_return semaphore_permit (*this);
    }

    std::size_t
    limit () const noexcept
    {
      return limit_;
    }

    std::size_t
    in_use () const noexcept
    {
      return in_use_;
    }

  private:
    friend class semaphore_permit;

    void
    release () noexcept
    {
      if (channel_.try_receive ([] (boost::system::error_code) {}))
        --in_use_;
    }

  private:
    asio::experimental::channel<void (boost::system::error_code)> channel_;
    std::size_t limit_;
    std::size_t in_use_ = 0;
  };

  inline void semaphore_permit::
  release () noexcept
  {
    if (s_ != nullptr)
      std::exchange (s_, nullptr)->release ();
  }
}
