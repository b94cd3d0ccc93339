#pragma once

#include <string>
#include <vector>
#include <cstdint>

#include <boost/asio.hpp>

#include <gather/http/http-client.hxx>
#include <gather/search/search-types.hxx>
#include <gather/search/search-records.hxx>
#include <gather/search/search-fetcher.hxx>

namespace gather
{
  namespace asio = boost::asio;

  // Catalog search over HTTP.
  //
  class search_coordinator
  {
  public:
    search_coordinator (asio::io_context&, const search_settings&);

    search_coordinator (const search_coordinator&) = delete;
    search_coordinator& operator= (const search_coordinator&) = delete;

    asio::awaitable<std::vector<std::uint64_t>>
    hits (const query&, result_type);

    asio::awaitable<std::vector<facet_counts>>
    hints (const query&, result_type, const std::vector<std::string>& facets);

    asio::awaitable<std::vector<file_record>>
    files (const query&, const search_options& = {});

    asio::awaitable<std::vector<dataset_record>>
    datasets (const query&, const search_options& = {});

    // Other catalog records of the same file, found with a distributed
    // search on its identifier. A failed lookup is reported and yields no
    // replicas.
    //
    asio::awaitable<std::vector<file_record>>
    replicas (const file_record&);

    search_fetcher&
    fetcher () noexcept
    {
      return fetcher_;
    }

  private:
    http_client client_;
    search_fetcher fetcher_;
  };
}
