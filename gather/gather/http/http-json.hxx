#pragma once

#include <string>
#include <stdexcept>

#include <boost/json.hpp>

#include <gather/http/http-types.hxx>
#include <gather/http/http-request.hxx>
#include <gather/http/http-response.hxx>

namespace gather
{
  // Parse the response body as JSON. Throw std::runtime_error if there is
  // no body or it does not parse.
  //
  template <typename S>
  inline boost::json::value
  parse_json (const basic_http_response<S>& r)
  {
    if (!r.body)
      throw std::runtime_error ("HTTP response has no body to parse as JSON");

    boost::system::error_code ec;
    boost::json::value v (boost::json::parse (*r.body, ec));

    if (ec)
      throw std::runtime_error ("unable to parse JSON response: " +
                                ec.message ());

    return v;
  }

  // Parse the response as a JSON object, first making sure the server
  // reported success.
  //
  template <typename S>
  inline boost::json::object
  parse_json_object (const basic_http_response<S>& r, const std::string& what)
  {
    if (!r.is_success ())
      throw http_error (r.status,
                        what + ": HTTP status " +
                        std::to_string (r.status_code ()));

    boost::json::value v (parse_json (r));

    if (!v.is_object ())
      throw std::runtime_error (what + ": expected JSON object");

    return std::move (v.as_object ());
  }

  template <typename S>
  inline basic_http_request<S>
  make_json_request (http_method m, const S& url, const boost::json::value& j)
  {
    basic_http_request<S> r (m, url);
    r.set_content_type (S ("application/json"));
    r.set_header (S ("Accept"), S ("application/json"));
    r.set_body (boost::json::serialize (j));
    r.normalize ();
    return r;
  }
}
