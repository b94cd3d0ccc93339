#include <gather/async/async-limiter.hxx>

#include <gather/http/http-url.hxx>

using namespace std;

namespace gather
{
  async_semaphore& host_limiter::
  semaphore (const string& host)
  {
    unique_ptr<async_semaphore>& p (map_[host]);

    if (p == nullptr)
      p = make_unique<async_semaphore> (ex_, per_host_);

    return *p;
  }

  asio::awaitable<semaphore_permit> host_limiter::
  acquire (const string& url)
  {
    // Take the reference before suspending: the map may grow while we wait
    // but the semaphore itself never moves.
    //
    async_semaphore& s (semaphore (parse_url (url).authority ()));
    co_return co_await s.acquire ();
  }
}
