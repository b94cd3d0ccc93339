#pragma once

#include <string>
#include <vector>
#include <cstdint>

#include <boost/json.hpp>

#include <gather/http/http-url.hxx>
#include <gather/search/search-types.hxx>

namespace gather
{
  // Solr-style catalog protocol (esg-search).

  // True if requesting counts for this facet makes paginated or
  // distributed results unstable (identifiers unique per entry).
  //
  bool
  solr_unstable_facet (const std::string&);

  // Build the query expression: name:value terms, multiple values as
  // name:(v1 v2), negated facets (!name) as -name:..., the free-text facet
  // (query) verbatim, all joined with AND. An empty selection matches
  // everything.
  //
  std::string
  solr_filter (const flat_query&);

  // Build the request parameters. Fields default to instance_id; facets are
  // only requested for counts.
  //
  // Throw unstable_query_error for facet requests that cannot be paginated
  // reliably.
  //
  http_query
  solr_params (const flat_query&,
               result_type,
               std::uint64_t offset,
               std::uint64_t limit,
               const std::vector<std::string>& fields,
               const std::vector<std::string>& facets = {});

  // Response accessors. Throw catalog_error if the response does not have
  // the expected shape.
  //
  std::uint64_t
  solr_hits (const boost::json::object&);

  const boost::json::array&
  solr_docs (const boost::json::object&);

  // facet_counts.facet_fields is a map of facet name to a flat list of
  // alternating values and counts.
  //
  facet_counts
  solr_facets (const boost::json::object&);
}
