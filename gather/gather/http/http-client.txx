#include <limits>
#include <stdexcept>

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <openssl/ssl.h>
#include <openssl/err.h>

#include <gather/gather-diagnostics.hxx>

namespace gather
{
  namespace http = beast::http;
  using tcp = asio::ip::tcp;

  inline http::verb
  to_beast_verb (http_method m)
  {
    switch (m)
    {
    case http_method::get:  return http::verb::get;
    case http_method::head: return http::verb::head;
    case http_method::post: return http::verb::post;
    }
    return http::verb::get;
  }

  // Convert a Beast response header (or a complete response, in which case
  // the body is ignored) into our response type.
  //
  template <typename R, typename F>
  inline R
  to_response (const http::response_header<F>& h)
  {
    using string_type = typename R::string_type;

    R r (static_cast<http_status> (h.result_int ()),
         http_version (static_cast<std::uint8_t> (h.version () / 10),
                       static_cast<std::uint8_t> (h.version () % 10)));

    r.reason = string_type (h.reason ());

    for (const auto& f: h)
      r.headers.add (string_type (f.name_string ()),
                     string_type (f.value ()));

    return r;
  }

  template <typename T, typename S>
  inline http::request<http::string_body>
  to_beast_request (const basic_http_request<S>& req, const T& tr)
  {
    http::request<http::string_body> br;
    br.method (to_beast_verb (req.method));
    br.target (req.target ());
    br.version (req.version.beast ());

    for (const auto& h: req.headers)
      br.set (h.name, h.value);

    br.keep_alive (tr.keep_alive);

    if (req.body)
    {
      br.body () = *req.body;
      br.prepare_payload ();
    }

    return br;
  }

  template <typename T>
  asio::awaitable<std::unique_ptr<http_connection>> basic_http_client<T>::
  connect (const url_parts& u)
  {
    auto& ctx (session_->io_context ());
    const auto& tr (session_->traits ());

    tcp::resolver rslv (ctx);
    auto addrs (co_await rslv.async_resolve (u.host,
                                             u.port,
                                             asio::use_awaitable));

    std::unique_ptr<http_connection> c (std::make_unique<http_connection> ());
    c->key = u.authority ();

    if (u.secure ())
    {
      c->tls = std::make_unique<http_connection::tls_stream> (
        ctx, session_->ssl_context ());

      // Set SNI. Beast has no wrapper for this so we go through the native
      // handle.
      //
      if (!SSL_set_tlsext_host_name (c->tls->native_handle (),
                                     u.host.c_str ()))
      {
        beast::error_code ec (static_cast<int> (::ERR_get_error ()),
                              asio::error::get_ssl_category ());

        throw beast::system_error (ec, "unable to set SNI hostname");
      }

      if (tr.verify_ssl)
        c->tls->set_verify_callback (ssl::host_name_verification (u.host));

      auto& layer (beast::get_lowest_layer (*c->tls));

      expire (layer, tr.connect_timeout);
      co_await layer.async_connect (addrs, asio::use_awaitable);

      co_await c->tls->async_handshake (ssl::stream_base::client,
                                        asio::use_awaitable);
    }
    else
    {
      c->tcp = std::make_unique<http_connection::tcp_stream> (ctx);

      expire (*c->tcp, tr.connect_timeout);
      co_await c->tcp->async_connect (addrs, asio::use_awaitable);
    }

    trace () << "connected to " << c->key;
    co_return c;
  }

  template <typename T>
  asio::awaitable<std::unique_ptr<http_connection>> basic_http_client<T>::
  acquire (const url_parts& u, bool& reused)
  {
    std::unique_ptr<http_connection> c (session_->take (u.authority ()));

    reused = (c != nullptr);

    if (!reused)
      c = co_await connect (u);

    co_return c;
  }

  template <typename T>
  template <typename Stream>
  asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  exchange (Stream& s,
            http_connection& c,
            const request_type& req,
            bool& keep)
  {
    const auto& tr (session_->traits ());

    http::request<http::string_body> br (to_beast_request (req, tr));

    expire (c.lowest_layer (), tr.request_timeout);
    co_await http::async_write (s, br, asio::use_awaitable);

    // The default body limit (8MB) is too small for transfer chunks.
    //
    http::response_parser<http::string_body> p;
    p.body_limit (std::numeric_limits<std::uint64_t>::max ());

    // A response to HEAD carries Content-Length but no body.
    //
    if (req.method == http_method::head)
      p.skip (true);

    co_await http::async_read (s, c.buffer, p, asio::use_awaitable);

    auto& m (p.get ());

    response_type r (to_response<response_type> (m));

    if (req.method != http_method::head)
      r.body = std::move (m.body ());

    keep = tr.keep_alive && m.keep_alive ();
    co_return r;
  }

  template <typename T>
  asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  request_impl (request_type req, std::uint8_t redirect_count)
  {
    const auto& tr (session_->traits ());

    if (redirect_count > tr.max_redirects)
      throw std::runtime_error ("maximum redirects exceeded for " + req.url);

    req.normalize ();

    url_parts parts (parse_url (req.url));

    trace () << req;

    response_type r;

    for (;;)
    {
      bool reused (false);
      std::unique_ptr<http_connection> c (co_await acquire (parts, reused));

      bool keep (false);

      try
      {
        r = co_await c->visit ([this, &c, &req, &keep] (auto& s)
        {
          return this->exchange (s, *c, req, keep);
        });
      }
      catch (const beast::system_error& e)
      {
        // The server may have closed a pooled connection while it was idle.
        // Retry on another one (eventually a fresh connection). A failure on
        // a fresh connection is final.
        //
        if (!reused || e.code () == asio::error::operation_aborted)
          throw;

        trace () << "retrying " << req.url << " after stale connection: "
                 << e.code ().message ();
        continue;
      }

      if (keep)
        session_->put (std::move (c));

      break;
    }

    if (tr.follow_redirects && r.is_redirection ())
    {
      if (auto loc = r.location ())
      {
        request_type next (req.method, *loc, req.version);

        for (const auto& h: req.headers)
          if (!header_name_equal (h.name, "Host"))
            next.headers.add (h.name, h.value);

        // 303 See Other turns anything into a GET without a body.
        //
        if (r.status == http_status::see_other)
          next.method = http_method::get;
        else
          next.body = req.body;

        co_return co_await request_impl (std::move (next),
                                         redirect_count + 1);
      }
    }

    co_return r;
  }

  template <typename T>
  template <typename Stream>
  asio::awaitable<std::uint64_t> basic_http_client<T>::
  stream (Stream& s,
          http_connection& c,
          const request_type& req,
          const header_callback& on_header,
          const data_callback& on_data,
          std::optional<string_type>& redirect,
          bool& keep)
  {
    const auto& tr (session_->traits ());

    http::request<http::string_body> br (to_beast_request (req, tr));

    expire (c.lowest_layer (), tr.request_timeout);
    co_await http::async_write (s, br, asio::use_awaitable);

    http::response_parser<http::buffer_body> p;
    p.body_limit (std::numeric_limits<std::uint64_t>::max ());

    co_await http::async_read_header (s, c.buffer, p, asio::use_awaitable);

    unsigned status (p.get ().result_int ());

    if (tr.follow_redirects && status >= 300 && status < 400)
    {
      auto loc (p.get ()[http::field::location]);

      if (!loc.empty ())
      {
        redirect = string_type (loc);
        keep = false;
        co_return 0;
      }
    }

    if (status != 200 && status != 206)
      throw http_error (static_cast<http_status> (status),
                        "GET " + req.url + ": unexpected status " +
                        std::to_string (status));

    if (on_header)
      on_header (to_response<response_type> (p.get ()));

    // Read the body through a fixed buffer. Beast reports need_buffer each
    // time the buffer fills up which is not an error for us.
    //
    char buf[65536];
    std::uint64_t n (0);

    while (!p.is_done ())
    {
      p.get ().body ().data = buf;
      p.get ().body ().size = sizeof (buf);

      beast::error_code ec;

      expire (c.lowest_layer (), tr.request_timeout);
      co_await http::async_read_some (
        s, c.buffer, p, asio::redirect_error (asio::use_awaitable, ec));

      if (ec && ec != http::error::need_buffer)
        throw beast::system_error (ec);

      std::size_t got (sizeof (buf) - p.get ().body ().size);

      if (got != 0)
      {
        if (on_data)
          on_data (buf, got);

        n += got;
      }
    }

    keep = tr.keep_alive && p.get ().keep_alive ();
    co_return n;
  }

  template <typename T>
  asio::awaitable<std::uint64_t> basic_http_client<T>::
  download_impl (const string_type& url,
                 const header_callback& on_header,
                 const data_callback& on_data,
                 std::optional<std::uint64_t> resume,
                 std::uint8_t redirect_count)
  {
    const auto& tr (session_->traits ());

    if (redirect_count > tr.max_redirects)
      throw std::runtime_error ("maximum redirects exceeded for " + url);

    request_type req (http_method::get, url);

    if (resume)
      req.set_range (*resume);

    req.normalize ();

    url_parts parts (parse_url (url));

    trace () << req;

    // Streamed bodies always start on a fresh connection: a stale pooled one
    // could fail after part of the body has already been delivered.
    //
    std::unique_ptr<http_connection> c (co_await connect (parts));

    std::optional<string_type> redirect;
    bool keep (false);

    std::uint64_t n (
      co_await c->visit ([&, this] (auto& s)
      {
        return this->stream (s, *c, req, on_header, on_data, redirect, keep);
      }));

    if (keep)
      session_->put (std::move (c));

    if (redirect)
      co_return co_await download_impl (*redirect,
                                        on_header,
                                        on_data,
                                        resume,
                                        redirect_count + 1);

    co_return n;
  }
}
