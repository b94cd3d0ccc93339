#pragma once

#include <string>
#include <cstdint>
#include <utility>
#include <ostream>
#include <optional>

#include <gather/http/http-types.hxx>

namespace gather
{
  // HTTP response.
  //
  template <typename S, typename B = S>
  class basic_http_response
  {
  public:
    using string_type  = S;
    using body_type    = B;
    using headers_type = basic_http_headers<string_type>;

    http_status              status;
    http_version             version;
    string_type              reason;
    headers_type             headers;
    std::optional<body_type> body;

    basic_http_response () : status (http_status::ok) {}

    explicit
    basic_http_response (http_status s,
                         http_version v = http_version (1, 1))
      : status (s), version (v) {}

    std::uint16_t
    status_code () const noexcept
    {
      return static_cast<std::uint16_t> (status);
    }

    bool
    is_success () const noexcept
    {
      return status_code () >= 200 && status_code () < 300;
    }

    bool
    is_redirection () const noexcept
    {
      return status_code () >= 300 && status_code () < 400;
    }

    bool
    is_error () const noexcept
    {
      return status_code () >= 400;
    }

    // True if the server fulfilled a range request.
    //
    bool
    is_partial () const noexcept
    {
      return status == http_status::partial_content;
    }

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

    std::optional<string_type>
    location () const
    {
      return get_header (string_type ("Location"));
    }

    // Content-Length as a number or nullopt if absent or malformed.
    //
    std::optional<std::uint64_t>
    content_length () const;

    // True if the server advertises Accept-Ranges: bytes.
    //
    bool
    accepts_ranges () const;

    // Body size, 0 if there is no body.
    //
    std::size_t
    body_size () const noexcept
    {
      return body ? body->size () : 0;
    }
  };

  template <typename S, typename B>
  inline auto
  operator<< (std::basic_ostream<typename S::value_type>& o,
              const basic_http_response<S, B>& r) -> decltype (o)
  {
    o << r.version << ' ' << r.status_code ();

    if (!r.reason.empty ())
      o << ' ' << r.reason;

    return o;
  }

  using http_response = basic_http_response<std::string, std::string>;
}

#include <gather/http/http-response.ixx>
