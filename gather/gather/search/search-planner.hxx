#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <optional>

#include <gather/search/search-types.hxx>
#include <gather/search/search-request.hxx>

namespace gather
{
  // Search request planner.
  //
  // Turns flat queries into the catalog requests that count, describe or
  // page through their results. Catalog query errors (unstable facet
  // requests, missing STAC project) are thrown here, before anything is
  // sent.
  //
  class search_planner
  {
  public:
    explicit
    search_planner (search_settings s): settings_ (std::move (s)) {}

    const search_settings&
    settings () const noexcept
    {
      return settings_;
    }

    // One request per query, asking for the number of matches only.
    //
    std::vector<search_request>
    hits (const std::vector<flat_query>&, result_type) const;

    // One request per query, asking for the value counts of the facets.
    // Solr only.
    //
    std::vector<search_request>
    hints (const std::vector<flat_query>&,
           result_type,
           const std::vector<std::string>& facets) const;

    // Requests for the records of the queries given their hit counts.
    //
    // Offset and cap are distributed over the queries in proportion to
    // their hits. Solr results are paged by page_limit; a STAC request
    // covers the whole window of its query and is paged by following the
    // result cursor.
    //
    std::vector<search_request>
    search (const std::vector<flat_query>&,
            result_type,
            const std::vector<std::uint64_t>& hits,
            std::uint64_t offset,
            std::optional<std::uint64_t> cap,
            const std::vector<std::string>& fields) const;

    // As above but addressing every index node directly (distrib=false),
    // with the per-node counts taken from index_node hints. Queries whose
    // hints lack the index_node facet go to the configured node. Solr only.
    //
    std::vector<search_request>
    search_distributed (const std::vector<flat_query>&,
                        result_type,
                        const std::vector<facet_counts>& hints,
                        std::uint64_t offset,
                        std::optional<std::uint64_t> cap,
                        const std::vector<std::string>& fields) const;

    // Number of record requests search() would build per query.
    //
    std::vector<std::size_t>
    number_of_requests (const std::vector<std::uint64_t>& hits,
                        std::uint64_t offset,
                        std::optional<std::uint64_t> cap) const;

  private:
    std::string
    endpoint () const;

  private:
    search_settings settings_;
  };
}
