#pragma once

#include <memory>
#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>
#include <optional>

#include <boost/asio.hpp>
#include <boost/json.hpp>

#include <gather/http/http-client.hxx>
#include <gather/async/async-limiter.hxx>
#include <gather/search/search-types.hxx>
#include <gather/search/search-records.hxx>
#include <gather/search/search-request.hxx>
#include <gather/search/search-planner.hxx>

namespace gather
{
  struct search_options
  {
    // Known hit counts per query. Counted first if absent.
    //
    std::optional<std::vector<std::uint64_t>> hits;

    std::uint64_t offset = 0;

    // Maximum number of records over all queries.
    //
    std::optional<std::uint64_t> max_hits;

    // Address every index node holding matches directly.
    //
    bool distributed = false;

    bool keep_duplicates = false;

    std::vector<std::string> fields = {"*"};
  };

  // What the last search dropped or skipped.
  //
  struct search_stats
  {
    std::size_t duplicates = 0;
    std::size_t invalid = 0;
    std::size_t failed = 0;
  };

  // Catalog search engine.
  //
  // Plans the catalog requests for a set of queries and runs all of them
  // concurrently, at most max_concurrent at a time per remote host. Failed
  // requests are collected and, once every request has completed, reported
  // with search_error (or logged and skipped with noraise).
  //
  // The client type C must provide the basic_http_client request interface.
  //
  template <typename C>
  class basic_search_fetcher
  {
  public:
    using client_type = C;

    basic_search_fetcher (client_type& c, search_settings s)
      : client_ (c), planner_ (std::move (s)) {}

    basic_search_fetcher (const basic_search_fetcher&) = delete;
    basic_search_fetcher& operator= (const basic_search_fetcher&) = delete;

    // Number of matches per query.
    //
    boost::asio::awaitable<std::vector<std::uint64_t>>
    hits (const std::vector<flat_query>&, result_type);

    // Facet value counts per query.
    //
    boost::asio::awaitable<std::vector<facet_counts>>
    hints (const std::vector<flat_query>&,
           result_type,
           const std::vector<std::string>& facets);

    // Matching records, deduplicated by identity unless requested
    // otherwise. Records with invalid metadata are skipped.
    //
    boost::asio::awaitable<std::vector<file_record>>
    files (const std::vector<flat_query>&, const search_options& = {});

    boost::asio::awaitable<std::vector<dataset_record>>
    datasets (const std::vector<flat_query>&, const search_options& = {});

    const search_planner&
    planner () const noexcept
    {
      return planner_;
    }

    const search_settings&
    settings () const noexcept
    {
      return planner_.settings ();
    }

    const search_stats&
    last_stats () const noexcept
    {
      return stats_;
    }

  private:
    using pages = std::vector<boost::json::object>;

    boost::asio::awaitable<std::vector<std::uint64_t>>
    count (const std::vector<flat_query>&, result_type);

    boost::asio::awaitable<std::vector<facet_counts>>
    count_facets (const std::vector<flat_query>&,
                  result_type,
                  const std::vector<std::string>& facets);

    // Plan and fetch the record pages, returning the documents (Solr) or
    // items (STAC) in request order.
    //
    boost::asio::awaitable<std::vector<boost::json::object>>
    documents (const std::vector<flat_query>&,
               result_type,
               const search_options&);

    // Run the requests concurrently. The result holds the pages of each
    // request in request order; a failed request yields no pages.
    //
    boost::asio::awaitable<std::vector<pages>>
    fetch_all (const std::vector<search_request>&);

    boost::asio::awaitable<pages>
    fetch_gated (const search_request&);

    // Single request. For STAC, follow the result cursor until the window
    // of the request is covered.
    //
    boost::asio::awaitable<pages>
    fetch (const search_request&);

    template <typename R>
    std::vector<R>
    deduplicate (std::vector<R>, const search_options&, const char* what);

  private:
    client_type& client_;
    search_planner planner_;
    std::unique_ptr<host_limiter> limiter_;
    search_stats stats_;
  };

  using search_fetcher = basic_search_fetcher<http_client>;
}

#include <gather/search/search-fetcher.txx>
