#include <gather/async/async-semaphore.hxx>
#include <gather/async/async-limiter.hxx>
#include <gather/async/async-group.hxx>

#include <chrono>
#include <vector>
#include <cassert>
#include <stdexcept>
#include <exception>

using namespace std;
using namespace gather;

static void
run (asio::io_context& ioc, asio::awaitable<void> a)
{
  bool done (false);

  asio::co_spawn (ioc,
                  move (a),
                  [&done] (exception_ptr e)
  {
    if (e)
      rethrow_exception (e);

    done = true;
  });

  ioc.run ();
  assert (done);
}

// Hold a permit across a timer wait and record the peak number of holders.
//
static asio::awaitable<void>
hold (async_semaphore& s, size_t& active, size_t& peak)
{
  semaphore_permit p (co_await s.acquire ());

  if (++active > peak)
    peak = active;

  asio::steady_timer t (co_await asio::this_coro::executor,
                        chrono::milliseconds (5));
  co_await t.async_wait (asio::use_awaitable);

  --active;
}

static void
test_bound ()
{
  asio::io_context ioc;
  async_semaphore s (ioc.get_executor (), 2);

  size_t active (0), peak (0);

  for (size_t i (0); i != 6; ++i)
    asio::co_spawn (ioc, hold (s, active, peak), asio::detached);

  ioc.run ();

  assert (peak == 2);
  assert (active == 0);
  assert (s.in_use () == 0);
  assert (s.limit () == 2);
}

static void
test_permit ()
{
  asio::io_context ioc;
  async_semaphore s (ioc.get_executor (), 1);

  run (ioc, [&s] () -> asio::awaitable<void>
  {
    semaphore_permit p (co_await s.acquire ());
    assert (p.owns ());
    assert (s.in_use () == 1);

    // Moving transfers ownership, releasing twice is harmless.
    //
    semaphore_permit q (move (p));
    assert (!p.owns ());
    assert (q.owns ());

    q.release ();
    q.release ();
    assert (s.in_use () == 0);

    // The slot is available again.
    //
    semaphore_permit r (co_await s.acquire ());
    assert (s.in_use () == 1);
  } ());

  assert (s.in_use () == 0);
}

static void
test_limiter ()
{
  asio::io_context ioc;
  host_limiter l (ioc.get_executor (), 1);

  run (ioc, [&l] () -> asio::awaitable<void>
  {
    // Different hosts do not contend, the same host with the default port
    // spelled out does.
    //
    semaphore_permit a (co_await l.acquire ("https://a.org/x"));
    semaphore_permit b (co_await l.acquire ("https://b.org/x"));

    assert (l.hosts () == 2);
    assert (l.semaphore ("https://a.org:443").in_use () == 1);
    assert (l.semaphore ("https://b.org:443").in_use () == 1);

    a.release ();
    semaphore_permit c (co_await l.acquire ("https://a.org:443/y"));
    assert (l.hosts () == 2);
  } ());
}

static asio::awaitable<int>
value (int v, chrono::milliseconds d)
{
  asio::steady_timer t (co_await asio::this_coro::executor, d);
  co_await t.async_wait (asio::use_awaitable);

  if (v < 0)
    throw runtime_error ("negative");

  co_return v;
}

static void
test_group ()
{
  asio::io_context ioc;

  run (ioc, [] () -> asio::awaitable<void>
  {
    vector<asio::awaitable<int>> ts;
    ts.push_back (value (1, chrono::milliseconds (20)));
    ts.push_back (value (-1, chrono::milliseconds (1)));
    ts.push_back (value (3, chrono::milliseconds (5)));

    group_result<int> r (co_await when_all (move (ts)));

    assert (r.order.size () == 3);
    assert (r.failed () == 1);
    assert (!r.errors[0] && r.values[0] == 1);
    assert (r.errors[1]);
    assert (!r.errors[2] && r.values[2] == 3);

    // Completion order follows the timers.
    //
    assert (r.order[0] == 1 && r.order[1] == 2 && r.order[2] == 0);

    try
    {
      r.rethrow ();
      assert (false);
    }
    catch (const runtime_error&)
    {
    }

    group_result<int> e (co_await when_all (vector<asio::awaitable<int>> ()));
    assert (e.order.empty () && e.failed () == 0);
  } ());
}

int
main ()
{
  test_bound ();
  test_permit ();
  test_limiter ();
  test_group ();
}
