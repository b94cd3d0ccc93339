#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <utility>
#include <ostream>
#include <optional>
#include <stdexcept>

namespace gather
{
  // HTTP method (verb).
  //
  // Only the verbs a catalog search or a file transfer needs.
  //
  enum class http_method
  {
    get,
    head,
    post
  };

  std::string
  to_string (http_method);

  http_method
  to_http_method (const std::string&);

  inline std::ostream&
  operator<< (std::ostream& o, http_method m)
  {
    return o << to_string (m);
  }

  // HTTP status code.
  //
  // The enumerators name the codes we react to. Any other code received from
  // a server is still representable by casting.
  //
  enum class http_status : std::uint16_t
  {
    ok                    = 200,
    no_content            = 204,
    partial_content       = 206,

    moved_permanently     = 301,
    found                 = 302,
    see_other             = 303,
    not_modified          = 304,
    temporary_redirect    = 307,
    permanent_redirect    = 308,

    bad_request           = 400,
    unauthorized          = 401,
    forbidden             = 403,
    not_found             = 404,
    request_timeout       = 408,
    range_not_satisfiable = 416,
    too_many_requests     = 429,

    internal_server_error = 500,
    bad_gateway           = 502,
    service_unavailable   = 503,
    gateway_timeout       = 504
  };

  std::string
  to_string (http_status);

  inline std::ostream&
  operator<< (std::ostream& o, http_status s)
  {
    return o << static_cast<std::uint16_t> (s);
  }

  // Unexpected HTTP status.
  //
  class http_error: public std::runtime_error
  {
  public:
    http_error (http_status s, const std::string& what)
      : std::runtime_error (what), status_ (s) {}

    http_status
    status () const noexcept
    {
      return status_;
    }

  private:
    http_status status_;
  };

  // Case-insensitive comparison of header names.
  //
  bool
  header_name_equal (const std::string&, const std::string&) noexcept;

  // HTTP header field.
  //
  template <typename S>
  struct basic_http_field
  {
    using string_type = S;

    string_type name;
    string_type value;

    basic_http_field () = default;

    basic_http_field (string_type n, string_type v)
        : name (std::move (n)), value (std::move (v)) {}
  };

  template <typename S>
  inline bool
  operator== (const basic_http_field<S>& x, const basic_http_field<S>& y)
  {
    return x.name == y.name && x.value == y.value;
  }

  // HTTP headers collection.
  //
  // Preserves insertion order and allows duplicates (add()). Lookups are
  // case-insensitive as required by RFC 9110.
  //
  template <typename S>
  struct basic_http_headers
  {
    using string_type = S;
    using field_type  = basic_http_field<string_type>;
    using fields_type = std::vector<field_type>;

    fields_type fields;

    // Set a header field, replacing any existing field with the same name.
    //
    void
    set (string_type name, string_type value);

    void
    add (string_type name, string_type value);

    // Return the first value with this name or nullopt if not present.
    //
    std::optional<string_type>
    get (const string_type& name) const;

    bool
    contains (const string_type& name) const
    {
      return get (name).has_value ();
    }

    void
    remove (const string_type& name);

    bool
    empty () const noexcept
    {
      return fields.empty ();
    }

    std::size_t
    size () const noexcept
    {
      return fields.size ();
    }

    using const_iterator = typename fields_type::const_iterator;

    const_iterator begin () const noexcept { return fields.begin (); }
    const_iterator end ()   const noexcept { return fields.end (); }
  };

  // HTTP version.
  //
  struct http_version
  {
    std::uint8_t major;
    std::uint8_t minor;

    http_version (std::uint8_t maj = 1, std::uint8_t min = 1)
        : major (maj), minor (min) {}

    bool
    operator== (const http_version& v) const noexcept
    {
      return major == v.major && minor == v.minor;
    }

    // Version in the form Beast uses (11 for HTTP/1.1).
    //
    unsigned
    beast () const noexcept
    {
      return major * 10u + minor;
    }

    std::string
    string () const;
  };

  inline std::ostream&
  operator<< (std::ostream& o, const http_version& v)
  {
    return o << v.string ();
  }

  using http_field   = basic_http_field<std::string>;
  using http_headers = basic_http_headers<std::string>;
}

#include <gather/http/http-types.ixx>
