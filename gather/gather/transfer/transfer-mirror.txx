#include <variant>
#include <exception>

#include <boost/system/system_error.hpp>
#include <boost/asio/experimental/awaitable_operators.hpp>

#include <gather/gather-diagnostics.hxx>
#include <gather/http/http-types.hxx>
#include <gather/async/async-group.hxx>
#include <gather/transfer/transfer-error.hxx>

namespace gather
{
  template <typename C>
  boost::asio::awaitable<std::vector<std::string>>
  probe_sources (C& c,
                 const std::vector<std::string>& urls,
                 std::uint64_t size,
                 std::chrono::milliseconds timeout)
  {
    namespace asio = boost::asio;
    using namespace asio::experimental::awaitable_operators;

    std::vector<std::string> r;

    // Each probe appends its URL on success so the result ends up in
    // completion order.
    //
    auto probe = [&c, &r, size, timeout] (std::string u)
      -> asio::awaitable<bool>
    {
      asio::steady_timer t (co_await asio::this_coro::executor, timeout);

      std::variant<typename C::response_type, std::monostate> v (
        co_await (c.head (u) || t.async_wait (asio::use_awaitable)));

      if (v.index () != 0)
      {
        info () << "probe of " << u << " timed out";
        co_return false;
      }

      const auto& res (std::get<0> (v));

      if (!res.is_success () || !res.accepts_ranges () ||
          res.content_length () != size)
      {
        info () << "dropping source " << u << ": status "
                << res.status_code () << ", "
                << (res.accepts_ranges () ? "" : "no ") << "byte ranges";
        co_return false;
      }

      r.push_back (std::move (u));
      co_return true;
    };

    std::vector<asio::awaitable<bool>> ps;
    for (const std::string& u: urls)
      ps.push_back (probe (u));

    group_result<bool> g (co_await when_all (std::move (ps)));

    // An unreachable source is dropped like a refusing one, but cancellation
    // is not a probe failure.
    //
    for (std::size_t i (0); i != g.errors.size (); ++i)
    {
      if (!g.errors[i])
        continue;

      try
      {
        std::rethrow_exception (g.errors[i]);
      }
      catch (const boost::system::system_error& e)
      {
        if (e.code () == asio::error::operation_aborted)
          throw;

        info () << "dropping source " << urls[i] << ": " << e.what ();
      }
      catch (const std::exception& e)
      {
        info () << "dropping source " << urls[i] << ": " << e.what ();
      }
    }

    co_return r;
  }

  template <typename C>
  boost::asio::awaitable<void>
  fetch_chunks (C& c,
                const std::vector<std::string>& sources,
                chunk_queue& q,
                chunk_assembler& a)
  {
    namespace asio = boost::asio;

    if (sources.empty ())
      throw no_viable_source_error ("no source accepts byte ranges of the "
                                    "expected length");

    auto worker = [&c, &q, &a] (const std::string& u)
      -> asio::awaitable<bool>
    {
      while (std::optional<chunk> k = q.pop ())
      {
        std::optional<typename C::response_type> res;
        std::string why;

        try
        {
          res = co_await c.get_range (u, k->first, k->last);
        }
        catch (const boost::system::system_error& e)
        {
          if (e.code () == asio::error::operation_aborted)
            throw;

          why = e.what ();
        }
        catch (const http_error& e)
        {
          why = e.what ();
        }

        if (res)
        {
          if (res->status != http_status::partial_content)
            why = "status " + std::to_string (res->status_code ());
          else if (!res->body || res->body->size () != k->size ())
            why = "short range";
        }

        if (!why.empty ())
        {
          info () << "giving up on " << u << " at bytes " << k->first << '-'
                  << k->last << ": " << why;

          q.requeue (*k);
          co_return false;
        }

        a.put (k->index, std::move (*res->body));
      }

      co_return true;
    };

    std::vector<asio::awaitable<bool>> ws;
    for (const std::string& u: sources)
      ws.push_back (worker (u));

    group_result<bool> g (co_await when_all (std::move (ws)));
    g.rethrow ();

    if (!a.complete ())
      throw exhausted_source_error (
        std::to_string (a.missing ()) + " chunk(s) could not be fetched from " +
        std::to_string (sources.size ()) + " source(s)");
  }
}
