#pragma once

#include <map>
#include <memory>
#include <string>
#include <cstddef>

#include <gather/async/async-semaphore.hxx>

namespace gather
{
  // Per-host concurrency limiter.
  //
  // Maps a host (scheme://host:port) to its own semaphore, created on first
  // use with the configured number of permits. Entries live as long as the
  // limiter.
  //
  class host_limiter
  {
  public:
    host_limiter (asio::any_io_executor ex, std::size_t per_host)
      : ex_ (std::move (ex)), per_host_ (per_host) {}

    host_limiter (const host_limiter&) = delete;
    host_limiter& operator= (const host_limiter&) = delete;

    // Acquire a permit for the host of this URL.
    //
    asio::awaitable<semaphore_permit>
    acquire (const std::string& url);

    async_semaphore&
    semaphore (const std::string& host);

    std::size_t
    hosts () const noexcept
    {
      return map_.size ();
    }

  private:
    asio::any_io_executor ex_;
    std::size_t per_host_;
    std::map<std::string, std::unique_ptr<async_semaphore>> map_;
  };
}
