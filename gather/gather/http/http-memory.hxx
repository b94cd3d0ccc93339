#pragma once

#include <map>
#include <algorithm>
#include <string>
#include <vector>
#include <chrono>
#include <limits>
#include <cstdint>
#include <utility>
#include <optional>
#include <stdexcept>
#include <functional>

#include <boost/asio.hpp>

#include <gather/http/http-url.hxx>
#include <gather/http/http-types.hxx>
#include <gather/http/http-request.hxx>
#include <gather/http/http-response.hxx>

namespace gather
{
  // Resource served by the in-memory client.
  //
  struct memory_resource
  {
    std::string body;

    // Honour Range requests and advertise Accept-Ranges: bytes.
    //
    bool ranges = true;

    // If present, answer every request for this resource with the status.
    //
    std::optional<http_status> status;

    // Number of ranged GETs served before answering 503.
    //
    std::size_t range_budget = std::numeric_limits<std::size_t>::max ();
  };

  // In-memory HTTP client.
  //
  // Offers the same interface as basic_http_client but answers from a table
  // of resources (exact URL match) and handlers (URL prefix match). Used to
  // exercise the search and transfer engines without a network. Requests
  // are recorded in arrival order.
  //
  template <typename S = std::string>
  class basic_memory_client
  {
  public:
    using string_type     = S;
    using request_type    = basic_http_request<string_type>;
    using response_type   = basic_http_response<string_type>;
    using header_callback = std::function<void (const response_type&)>;
    using data_callback   = std::function<void (const char*, std::size_t)>;
    using handler_type    = std::function<response_type (const request_type&)>;

    basic_memory_client () = default;

    basic_memory_client (const basic_memory_client&) = delete;
    basic_memory_client& operator= (const basic_memory_client&) = delete;

    memory_resource&
    serve (const string_type& url, string_type body, bool ranges = true)
    {
      memory_resource& r (resources_[url]);
      r.body = std::move (body);
      r.ranges = ranges;
      return r;
    }

    void
    route (string_type prefix, handler_type h)
    {
      routes_.emplace_back (std::move (prefix), std::move (h));
    }

    // Suspend on a timer before answering each request.
    //
    void
    delay (std::chrono::milliseconds d)
    {
      delay_ = d;
    }

    const std::vector<request_type>&
    requests () const noexcept
    {
      return log_;
    }

    std::size_t
    count (http_method m, const string_type& url) const
    {
      std::size_t n (0);
      for (const auto& r: log_)
        if (r.method == m && r.url == url)
          ++n;
      return n;
    }

    boost::asio::awaitable<response_type>
    request (const request_type& req)
    {
      co_await pause ();
      co_return dispatch (req);
    }

    boost::asio::awaitable<response_type>
    get (const string_type& url)
    {
      co_return co_await request (request_type (http_method::get, url));
    }

    boost::asio::awaitable<response_type>
    head (const string_type& url)
    {
      co_return co_await request (request_type (http_method::head, url));
    }

    boost::asio::awaitable<response_type>
    post (const string_type& url,
          const string_type& body,
          const string_type& content_type = string_type ("application/json"))
    {
      request_type req (http_method::post, url);
      req.set_content_type (content_type);
      req.set_body (body);
      co_return co_await request (req);
    }

    boost::asio::awaitable<response_type>
    get_range (const string_type& url, std::uint64_t first, std::uint64_t last)
    {
      request_type req (http_method::get, url);
      req.set_range (first, last);
      co_return co_await request (req);
    }

    // Deliver the body in small pieces to exercise incremental writes.
    //
    boost::asio::awaitable<std::uint64_t>
    download (const string_type& url,
              header_callback on_header,
              data_callback on_data,
              std::optional<std::uint64_t> resume = std::nullopt)
    {
      request_type req (http_method::get, url);

      if (resume)
        req.set_range (*resume);

      co_await pause ();
      response_type r (dispatch (req));

      if (r.status != http_status::ok &&
          r.status != http_status::partial_content)
        throw http_error (r.status,
                          "GET " + url + ": unexpected status " +
                          std::to_string (r.status_code ()));

      std::optional<string_type> body (std::move (r.body));
      r.body = std::nullopt;

      if (on_header)
        on_header (r);

      std::uint64_t n (body ? body->size () : 0);

      if (body && on_data)
      {
        for (std::size_t i (0); i < body->size (); i += 7)
          on_data (body->data () + i, std::min<std::size_t> (7, body->size () - i));
      }

      co_return n;
    }

  private:
    boost::asio::awaitable<void>
    pause ()
    {
      if (delay_.count () != 0)
      {
        boost::asio::steady_timer t (co_await boost::asio::this_coro::executor,
                                     delay_);
        co_await t.async_wait (boost::asio::use_awaitable);
      }
    }

    response_type
    dispatch (const request_type& req)
    {
      log_.push_back (req);

      auto i (resources_.find (req.url));
      if (i != resources_.end ())
        return answer (i->second, req);

      for (const auto& r: routes_)
        if (req.url.compare (0, r.first.size (), r.first) == 0)
          return r.second (req);

      return response_type (http_status::not_found);
    }

    static response_type
    answer (memory_resource& res, const request_type& req)
    {
      if (res.status)
        return response_type (*res.status);

      const string_type& b (res.body);

      response_type r (http_status::ok);

      if (res.ranges)
        r.set_header ("Accept-Ranges", "bytes");

      std::optional<string_type> range (req.get_header ("Range"));

      if (req.method == http_method::head)
      {
        r.set_header ("Content-Length", std::to_string (b.size ()));
        return r;
      }

      if (!range || !res.ranges)
      {
        r.set_header ("Content-Length", std::to_string (b.size ()));
        r.body = b;
        return r;
      }

      if (res.range_budget == 0)
        return response_type (http_status::service_unavailable);

      --res.range_budget;

      // bytes=first-[last]
      //
      std::size_t eq (range->find ('=')), dash (range->find ('-'));
      std::uint64_t first (std::stoull (range->substr (eq + 1, dash - eq - 1)));
      std::uint64_t last (dash + 1 < range->size ()
                          ? std::stoull (range->substr (dash + 1))
                          : b.size () - 1);

      if (first >= b.size ())
        return response_type (http_status::range_not_satisfiable);

      last = std::min<std::uint64_t> (last, b.size () - 1);

      r.status = http_status::partial_content;
      r.body = b.substr (first, last - first + 1);
      r.set_header ("Content-Length", std::to_string (r.body->size ()));
      r.set_header ("Content-Range",
                    "bytes " + std::to_string (first) + '-' +
                    std::to_string (last) + '/' + std::to_string (b.size ()));
      return r;
    }

  private:
    std::map<string_type, memory_resource> resources_;
    std::vector<std::pair<string_type, handler_type>> routes_;
    std::vector<request_type> log_;
    std::chrono::milliseconds delay_ {0};
  };

  using memory_client = basic_memory_client<>;
}
