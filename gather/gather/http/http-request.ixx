#include <type_traits>

#include <gather/version.hxx>
#include <gather/http/http-url.hxx>

namespace gather
{
  template <typename S, typename B>
  inline typename basic_http_request<S, B>::string_type
  basic_http_request<S, B>::
  target () const
  {
    return parse_url (url).target;
  }

  template <typename S, typename B>
  inline void basic_http_request<S, B>::
  normalize ()
  {
    if (body && !has_header (string_type ("Content-Length")))
    {
      if constexpr (std::is_same_v<body_type, string_type>)
        set_header (string_type ("Content-Length"),
                    std::to_string (body->size ()));
    }

    if (!has_header (string_type ("Host")))
    {
      url_parts p (parse_url (url));

      // Only spell the port out when it is not the scheme default.
      //
      bool dflt ((p.secure () && p.port == "443") ||
                 (!p.secure () && p.port == "80"));

      set_header (string_type ("Host"),
                  dflt ? p.host : p.host + ':' + p.port);
    }

    if (!has_header (string_type ("User-Agent")))
      set_header (string_type ("User-Agent"),
                  string_type (GATHER_USER_AGENT));
  }
}
