#pragma once

#include <string>
#include <memory>
#include <vector>
#include <cstdint>
#include <optional>
#include <functional>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>

#include <gather/http/http-url.hxx>
#include <gather/http/http-types.hxx>
#include <gather/http/http-request.hxx>
#include <gather/http/http-response.hxx>

namespace gather
{
  namespace asio  = boost::asio;
  namespace beast = boost::beast;
  namespace ssl   = boost::asio::ssl;

  // HTTP client configuration traits.
  //
  template <typename S = std::string>
  struct http_client_traits
  {
    using string_type   = S;
    using request_type  = basic_http_request<string_type>;
    using response_type = basic_http_response<string_type>;

    // Connection (resolve, connect, handshake) timeout in milliseconds
    // (0 = no timeout).
    //
    std::uint32_t connect_timeout = 20000;

    // Timeout for each request/response exchange in milliseconds (0 = no
    // timeout). For streamed downloads it applies to every read.
    //
    std::uint32_t request_timeout = 20000;

    std::uint8_t max_redirects = 10;
    bool follow_redirects = true;

    bool verify_ssl = true;

    // CA bundle (empty = system default paths).
    //
    string_type ssl_cert_file;

    // Keep connections alive and reuse them for subsequent requests to the
    // same scheme://host:port.
    //
    bool keep_alive = true;

    // Maximum number of idle connections kept for reuse.
    //
    std::size_t max_idle = 16;
  };

  // Connection to a single scheme://host:port, either plain or TLS.
  //
  struct http_connection
  {
    using tcp_stream = beast::tcp_stream;
    using tls_stream = beast::ssl_stream<beast::tcp_stream>;

    std::string key;
    std::unique_ptr<tcp_stream> tcp;
    std::unique_ptr<tls_stream> tls;
    beast::flat_buffer buffer;

    // Apply f to whichever stream is in use.
    //
    template <typename F>
    auto
    visit (F&& f)
    {
      return tls ? f (*tls) : f (*tcp);
    }

    beast::tcp_stream&
    lowest_layer ()
    {
      return tls ? beast::get_lowest_layer (*tls) : *tcp;
    }
  };

  // HTTP client session context.
  //
  // Holds the TLS context and the pool of idle keep-alive connections.
  //
  template <typename T = http_client_traits<>>
  class basic_http_session
  {
  public:
    using traits_type = T;
    using string_type = typename traits_type::string_type;

    basic_http_session (asio::io_context& ioc, const traits_type& traits)
      : ioc_ (ioc), traits_ (traits), ssl_ctx_ (ssl::context::tls_client)
    {
      configure_ssl ();
    }

    basic_http_session (const basic_http_session&) = delete;
    basic_http_session& operator= (const basic_http_session&) = delete;

    asio::io_context&
    io_context () noexcept
    {
      return ioc_;
    }

    const traits_type&
    traits () const noexcept
    {
      return traits_;
    }

    ssl::context&
    ssl_context () noexcept
    {
      return ssl_ctx_;
    }

    // Take an idle connection for this key out of the pool or return
    // nullptr.
    //
    std::unique_ptr<http_connection>
    take (const std::string& key);

    // Return a connection to the pool. Dropped if the pool is full.
    //
    void
    put (std::unique_ptr<http_connection>);

    std::size_t
    idle () const noexcept
    {
      return idle_.size ();
    }

  private:
    void
    configure_ssl ();

  private:
    asio::io_context& ioc_;
    traits_type traits_;
    ssl::context ssl_ctx_;
    std::vector<std::unique_ptr<http_connection>> idle_;
  };

  // HTTP client.
  //
  // Asynchronous HTTP/1.1 operations over Boost.Beast using coroutines.
  // Every exchange is bounded by the traits timeouts; expiry surfaces as
  // beast::error::timeout.
  //
  template <typename T = http_client_traits<>>
  class basic_http_client
  {
  public:
    using traits_type   = T;
    using string_type   = typename traits_type::string_type;
    using request_type  = typename traits_type::request_type;
    using response_type = typename traits_type::response_type;
    using session_type  = basic_http_session<traits_type>;

    // Streaming callbacks. The header callback receives the response
    // without a body before any data is delivered.
    //
    using header_callback = std::function<void (const response_type&)>;
    using data_callback = std::function<void (const char*, std::size_t)>;

    explicit
    basic_http_client (asio::io_context& ioc)
      : session_ (std::make_unique<session_type> (ioc, traits_type ())) {}

    basic_http_client (asio::io_context& ioc, const traits_type& traits)
      : session_ (std::make_unique<session_type> (ioc, traits)) {}

    basic_http_client (const basic_http_client&) = delete;
    basic_http_client& operator= (const basic_http_client&) = delete;

    // Perform a request and buffer the whole response.
    //
    asio::awaitable<response_type>
    request (const request_type& req);

    asio::awaitable<response_type>
    get (const string_type& url);

    asio::awaitable<response_type>
    head (const string_type& url);

    asio::awaitable<response_type>
    post (const string_type& url,
          const string_type& body,
          const string_type& content_type = string_type ("application/json"));

    // GET the inclusive byte range [first, last]. The caller is expected to
    // check for 206 Partial Content.
    //
    asio::awaitable<response_type>
    get_range (const string_type& url, std::uint64_t first, std::uint64_t last);

    // GET the resource streaming the body through the data callback. If
    // resume is specified, ask for the bytes from that offset onwards. Fail
    // on anything other than 200 and 206 after following redirects.
    //
    // Return the number of body bytes delivered.
    //
    asio::awaitable<std::uint64_t>
    download (const string_type& url,
              header_callback on_header,
              data_callback on_data,
              std::optional<std::uint64_t> resume = std::nullopt);

    session_type&
    session () noexcept
    {
      return *session_;
    }

  private:
    asio::awaitable<response_type>
    request_impl (request_type req, std::uint8_t redirect_count);

    asio::awaitable<std::uint64_t>
    download_impl (const string_type& url,
                   const header_callback& on_header,
                   const data_callback& on_data,
                   std::optional<std::uint64_t> resume,
                   std::uint8_t redirect_count);

    // Establish a new connection (resolve, connect, TLS handshake).
    //
    asio::awaitable<std::unique_ptr<http_connection>>
    connect (const url_parts&);

    // Reuse an idle connection if there is one, otherwise connect.
    //
    asio::awaitable<std::unique_ptr<http_connection>>
    acquire (const url_parts&, bool& reused);

    // Write the request and read the complete response on the stream.
    //
    template <typename Stream>
    asio::awaitable<response_type>
    exchange (Stream&, http_connection&, const request_type&, bool& keep);

    // Write the request and stream the response body through the callbacks.
    // If the server redirects, set redirect and deliver nothing.
    //
    template <typename Stream>
    asio::awaitable<std::uint64_t>
    stream (Stream&,
            http_connection&,
            const request_type&,
            const header_callback&,
            const data_callback&,
            std::optional<string_type>& redirect,
            bool& keep);

    void
    expire (beast::tcp_stream&, std::uint32_t ms);

  private:
    std::unique_ptr<session_type> session_;
  };

  using http_session = basic_http_session<>;
  using http_client  = basic_http_client<>;
}

#include <gather/http/http-client.ixx>
#include <gather/http/http-client.txx>
