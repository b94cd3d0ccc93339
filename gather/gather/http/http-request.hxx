#pragma once

#include <string>
#include <cstdint>
#include <utility>
#include <ostream>
#include <optional>

#include <gather/http/http-types.hxx>

namespace gather
{
  // HTTP request.
  //
  template <typename S, typename B = S>
  class basic_http_request
  {
  public:
    using string_type  = S;
    using body_type    = B;
    using headers_type = basic_http_headers<string_type>;

    http_method              method;
    string_type              url;
    http_version             version;
    headers_type             headers;
    std::optional<body_type> body;

    basic_http_request () : method (http_method::get) {}

    basic_http_request (http_method m,
                        string_type u,
                        http_version v = http_version (1, 1))
        : method (m), url (std::move (u)), version (v) {}

    // Request target (path and query of the URL).
    //
    string_type
    target () const;

    void
    set_header (string_type name, string_type value)
    {
      headers.set (std::move (name), std::move (value));
    }

    std::optional<string_type>
    get_header (const string_type& name) const
    {
      return headers.get (name);
    }

    bool
    has_header (const string_type& name) const
    {
      return headers.contains (name);
    }

    void
    set_content_type (string_type ct)
    {
      set_header (string_type ("Content-Type"), std::move (ct));
    }

    void
    set_body (body_type b)
    {
      body = std::move (b);
    }

    // Ask for the inclusive byte range [first, last].
    //
    void
    set_range (std::uint64_t first, std::uint64_t last)
    {
      set_header (string_type ("Range"),
                  "bytes=" + std::to_string (first) + '-' +
                  std::to_string (last));
    }

    // Ask for everything from first onwards.
    //
    void
    set_range (std::uint64_t first)
    {
      set_header (string_type ("Range"),
                  "bytes=" + std::to_string (first) + '-');
    }

    // Add the default headers (Host, User-Agent, Content-Length) unless
    // already present.
    //
    void
    normalize ();

    bool
    valid () const noexcept
    {
      return !url.empty ();
    }
  };

  template <typename S, typename B>
  inline auto
  operator<< (std::basic_ostream<typename S::value_type>& o,
              const basic_http_request<S, B>& r) -> decltype (o)
  {
    return o << to_string (r.method) << ' ' << r.url << ' ' << r.version;
  }

  using http_request = basic_http_request<std::string, std::string>;
}

#include <gather/http/http-request.ixx>
