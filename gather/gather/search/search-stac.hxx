#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <optional>

#include <boost/json.hpp>

#include <gather/http/http-request.hxx>
#include <gather/search/search-types.hxx>
#include <gather/search/search-records.hxx>

namespace gather
{
  // STAC item search with CQL2-JSON filters.

  // Collections to search: the query's project values. Throw catalog_error
  // if the query does not select a project.
  //
  std::vector<std::string>
  stac_collections (const flat_query&);

  // Translate the selection into a CQL2-JSON filter. Facet names are
  // qualified with each (lower-cased) project as properties.<project>:<name>.
  // Values containing '*' become like comparisons. Return an empty object if
  // nothing but the project is selected.
  //
  boost::json::object
  stac_filter (const flat_query&);

  boost::json::object
  stac_body (const flat_query&, std::uint64_t limit);

  // Number of matched items (numMatched or context.matched). Throw
  // catalog_error if the server does not report it.
  //
  std::uint64_t
  stac_hits (const boost::json::object& page);

  const boost::json::array&
  stac_features (const boost::json::object& page);

  // Request for the page following this one, if there is any. A POST link
  // carries a body which, with merge set, is merged into the previous one.
  //
  std::optional<http_request>
  stac_next (const boost::json::object& page,
             const boost::json::object& body,
             boost::json::object& next_body);

  // Records of an item. Files: one per netCDF asset served over HTTP (for
  // assets with alternates, the first alternate). Throw invalid_metadata on
  // malformed items.
  //
  std::vector<file_record>
  stac_files (const boost::json::object& item);

  dataset_record
  stac_dataset (const boost::json::object& item);
}
