#include <gather/http/http-types.hxx>

#include <cctype>
#include <stdexcept>
#include <algorithm>

using namespace std;

namespace gather
{
  string
  to_string (http_method m)
  {
    switch (m)
    {
    case http_method::get:  return "GET";
    case http_method::head: return "HEAD";
    case http_method::post: return "POST";
    }
    return "GET";
  }

  http_method
  to_http_method (const string& s)
  {
    if (header_name_equal (s, "GET"))  return http_method::get;
    if (header_name_equal (s, "HEAD")) return http_method::head;
    if (header_name_equal (s, "POST")) return http_method::post;

    throw invalid_argument ("invalid HTTP method: " + s);
  }

  string
  to_string (http_status s)
  {
    switch (s)
    {
    case http_status::ok:                    return "OK";
    case http_status::no_content:            return "No Content";
    case http_status::partial_content:       return "Partial Content";
    case http_status::moved_permanently:     return "Moved Permanently";
    case http_status::found:                 return "Found";
    case http_status::see_other:             return "See Other";
    case http_status::not_modified:          return "Not Modified";
    case http_status::temporary_redirect:    return "Temporary Redirect";
    case http_status::permanent_redirect:    return "Permanent Redirect";
    case http_status::bad_request:           return "Bad Request";
    case http_status::unauthorized:          return "Unauthorized";
    case http_status::forbidden:             return "Forbidden";
    case http_status::not_found:             return "Not Found";
    case http_status::request_timeout:       return "Request Timeout";
    case http_status::range_not_satisfiable: return "Range Not Satisfiable";
    case http_status::too_many_requests:     return "Too Many Requests";
    case http_status::internal_server_error: return "Internal Server Error";
    case http_status::bad_gateway:           return "Bad Gateway";
    case http_status::service_unavailable:   return "Service Unavailable";
    case http_status::gateway_timeout:       return "Gateway Timeout";
    }

    return "Status " + std::to_string (static_cast<uint16_t> (s));
  }

  bool
  header_name_equal (const string& x, const string& y) noexcept
  {
    return x.size () == y.size () &&
           equal (x.begin (), x.end (), y.begin (),
                  [] (unsigned char a, unsigned char b)
                  {
                    return tolower (a) == tolower (b);
                  });
  }

  string http_version::
  string () const
  {
    return "HTTP/" + std::to_string (major) + '.' + std::to_string (minor);
  }
}
