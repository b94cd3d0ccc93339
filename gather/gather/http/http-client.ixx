#include <algorithm>

namespace gather
{
  template <typename T>
  inline void basic_http_session<T>::
  configure_ssl ()
  {
    if (!traits_.ssl_cert_file.empty ())
      ssl_ctx_.load_verify_file (traits_.ssl_cert_file);
    else
      ssl_ctx_.set_default_verify_paths ();

    ssl_ctx_.set_verify_mode (traits_.verify_ssl
                              ? ssl::verify_peer
                              : ssl::verify_none);

    ssl_ctx_.set_options (ssl::context::default_workarounds |
                          ssl::context::no_sslv2 |
                          ssl::context::no_sslv3 |
                          ssl::context::single_dh_use);
  }

  template <typename T>
  inline std::unique_ptr<http_connection> basic_http_session<T>::
  take (const std::string& key)
  {
    // Prefer the most recently returned connection: it is the least likely
    // to have been closed by the server in the meantime.
    //
    auto i (std::find_if (idle_.rbegin (), idle_.rend (),
                          [&key] (const std::unique_ptr<http_connection>& c)
                          {
                            return c->key == key;
                          }));

    if (i == idle_.rend ())
      return nullptr;

    std::unique_ptr<http_connection> r (std::move (*i));
    idle_.erase (std::next (i).base ());
    return r;
  }

  template <typename T>
  inline void basic_http_session<T>::
  put (std::unique_ptr<http_connection> c)
  {
    if (!traits_.keep_alive || traits_.max_idle == 0)
      return;

    if (idle_.size () == traits_.max_idle)
      idle_.erase (idle_.begin ());

    idle_.push_back (std::move (c));
  }

  template <typename T>
  inline asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  request (const request_type& req)
  {
    co_return co_await request_impl (req, 0);
  }

  template <typename T>
  inline asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  get (const string_type& url)
  {
    request_type req (http_method::get, url);
    req.normalize ();
    co_return co_await request_impl (std::move (req), 0);
  }

  template <typename T>
  inline asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  head (const string_type& url)
  {
    request_type req (http_method::head, url);
    req.normalize ();
    co_return co_await request_impl (std::move (req), 0);
  }

  template <typename T>
  inline asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  post (const string_type& url,
        const string_type& body,
        const string_type& content_type)
  {
    request_type req (http_method::post, url);
    req.set_content_type (content_type);
    req.set_body (body);
    req.normalize ();
    co_return co_await request_impl (std::move (req), 0);
  }

  template <typename T>
  inline asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  get_range (const string_type& url, std::uint64_t first, std::uint64_t last)
  {
    request_type req (http_method::get, url);
    req.set_range (first, last);
    req.normalize ();
    co_return co_await request_impl (std::move (req), 0);
  }

  template <typename T>
  inline asio::awaitable<std::uint64_t> basic_http_client<T>::
  download (const string_type& url,
            header_callback on_header,
            data_callback on_data,
            std::optional<std::uint64_t> resume)
  {
    co_return co_await download_impl (url, on_header, on_data, resume, 0);
  }

  template <typename T>
  inline void basic_http_client<T>::
  expire (beast::tcp_stream& s, std::uint32_t ms)
  {
    if (ms != 0)
      s.expires_after (std::chrono::milliseconds (ms));
    else
      s.expires_never ();
  }
}
