#pragma once

#include <string>
#include <cstdint>
#include <cstddef>
#include <ostream>
#include <optional>

#include <boost/json.hpp>

#include <gather/http/http-url.hxx>
#include <gather/http/http-request.hxx>
#include <gather/search/search-types.hxx>

namespace gather
{
  // Single catalog request.
  //
  // Built by the planner and never modified afterwards. A Solr request
  // carries its parameters; a STAC request carries its JSON search body and
  // the window of items (offset, limit) to keep while following the result
  // cursor.
  //
  class search_request
  {
  public:
    // Solr.
    //
    search_request (std::string endpoint,
                    result_type type,
                    std::size_t query,
                    std::uint64_t offset,
                    std::uint64_t limit,
                    http_query params)
      : backend_ (api_backend::solr),
        endpoint_ (std::move (endpoint)),
        type_ (type),
        query_ (query),
        offset_ (offset),
        limit_ (limit),
        params_ (std::move (params)) {}

    // STAC.
    //
    search_request (std::string endpoint,
                    result_type type,
                    std::size_t query,
                    std::uint64_t offset,
                    std::uint64_t limit,
                    boost::json::object body)
      : backend_ (api_backend::stac),
        endpoint_ (std::move (endpoint)),
        type_ (type),
        query_ (query),
        offset_ (offset),
        limit_ (limit),
        body_ (std::move (body)) {}

    api_backend
    backend () const noexcept
    {
      return backend_;
    }

    const std::string&
    endpoint () const noexcept
    {
      return endpoint_;
    }

    result_type
    type () const noexcept
    {
      return type_;
    }

    // Index of the flat query this request was planned for.
    //
    std::size_t
    query () const noexcept
    {
      return query_;
    }

    std::uint64_t
    offset () const noexcept
    {
      return offset_;
    }

    std::uint64_t
    limit () const noexcept
    {
      return limit_;
    }

    const http_query&
    params () const noexcept
    {
      return params_;
    }

    const std::optional<boost::json::object>&
    body () const noexcept
    {
      return body_;
    }

    // Filter expression: the Solr query parameter or the serialized CQL2
    // filter.
    //
    std::string
    filter () const;

    // Full request URL.
    //
    std::string
    url () const;

    http_request
    http () const;

  private:
    api_backend backend_;
    std::string endpoint_;
    result_type type_;
    std::size_t query_;
    std::uint64_t offset_;
    std::uint64_t limit_;
    http_query params_;
    std::optional<boost::json::object> body_;
  };

  inline std::ostream&
  operator<< (std::ostream& o, const search_request& r)
  {
    return o << r.url ();
  }
}
