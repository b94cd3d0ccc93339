#pragma once

#include <string>
#include <vector>
#include <utility>

namespace gather
{
  // URL parts.
  //
  struct url_parts
  {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target; // Path, query, and fragment. Never empty.

    // Connection identity in the scheme://host:port form. Used to key
    // connection reuse and per-host limits.
    //
    std::string
    authority () const;

    bool
    secure () const noexcept
    {
      return scheme == "https";
    }
  };

  // Parse a URL of the scheme://host[:port][/target] form. The scheme
  // defaults to http when absent.
  //
  // Throw std::invalid_argument if the host is empty. IPv6 literals and user
  // info are not supported.
  //
  url_parts
  parse_url (const std::string&);

  // Percent-encode a query component (RFC 3986 unreserved characters are
  // kept as is).
  //
  std::string
  url_encode (const std::string&);

  // Decode a percent-encoded component. A '+' is decoded as space.
  //
  std::string
  url_decode (const std::string&);

  // Ordered query parameters.
  //
  class http_query
  {
  public:
    using value_type = std::pair<std::string, std::string>;

    http_query () = default;

    http_query&
    add (std::string name, std::string value)
    {
      params_.emplace_back (std::move (name), std::move (value));
      return *this;
    }

    const std::vector<value_type>&
    params () const noexcept
    {
      return params_;
    }

    bool
    empty () const noexcept
    {
      return params_.empty ();
    }

    // Return the first value of the named parameter or nullptr.
    //
    const std::string*
    find (const std::string& name) const;

    // Encode as name=value&... (without the leading '?').
    //
    std::string
    string () const;

    // Append to a base URL, using '?' or '&' as appropriate.
    //
    std::string
    apply (const std::string& url) const;

  private:
    std::vector<value_type> params_;
  };
}
