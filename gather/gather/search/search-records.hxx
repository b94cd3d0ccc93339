#pragma once

#include <string>
#include <cstdint>
#include <ostream>
#include <utility>
#include <stdexcept>

#include <boost/json.hpp>

namespace gather
{
  // Catalog metadata that cannot be turned into a record (missing field,
  // unexpected type, and so on).
  //
  class invalid_metadata: public std::runtime_error
  {
  public:
    using std::runtime_error::runtime_error;
  };

  // Remote file as described by the catalog.
  //
  struct file_record
  {
    std::string file_id;     // <dataset_id>.<filename>
    std::string dataset_id;  // <dataset master>.<version>
    std::string master_id;   // file_id without the version segment
    std::string url;
    std::string version;
    std::string filename;
    std::string local_path;  // Relative directory of the final file.
    std::string data_node;
    std::string checksum;
    std::string checksum_type;
    std::uint64_t size = 0;

    // Deduplication key: the checksum when the catalog provides one, the
    // file id otherwise.
    //
    const std::string&
    identity () const noexcept
    {
      return checksum.empty () ? file_id : checksum;
    }
  };

  inline std::ostream&
  operator<< (std::ostream& o, const file_record& f)
  {
    return o << f.file_id;
  }

  // Dataset as described by the catalog.
  //
  struct dataset_record
  {
    std::string dataset_id;
    std::string master_id;
    std::string version;
    std::string data_node;
    std::uint64_t size = 0;
    std::uint64_t number_of_files = 0;

    const std::string&
    identity () const noexcept
    {
      return dataset_id;
    }
  };

  inline std::ostream&
  operator<< (std::ostream& o, const dataset_record& d)
  {
    return o << d.dataset_id;
  }

  // Drop the trailing |authority suffix from a catalog identifier
  // (CMIP6.x.v20200101|esgf.example.org).
  //
  std::string
  strip_authority (const std::string&);

  // Split a dataset id into its master id and version at the last dot.
  // Throw invalid_metadata if there is no dot.
  //
  std::pair<std::string, std::string>
  split_version (const std::string& dataset_id);

  // Solr field accessors. Solr returns most fields as single-element arrays;
  // take the first element in that case. Throw invalid_metadata if the field
  // is absent or has an unexpected type.
  //
  std::string
  find_str (const boost::json::object&, const char* name);

  std::uint64_t
  find_int (const boost::json::object&, const char* name);

  // Expand the catalog directory_format_template_ of a document:
  // %(root)s/ prefix dropped, %(name)s replaced by the document's value of
  // the field. Without a template, use the dataset id with dots as
  // separators.
  //
  std::string
  local_path_of (const boost::json::object& doc,
                 const std::string& dataset_id,
                 const std::string& version);

  // Build records from Solr documents. Throw invalid_metadata on documents
  // that lack required fields.
  //
  file_record
  file_from_solr (const boost::json::object& doc);

  dataset_record
  dataset_from_solr (const boost::json::object& doc);
}
