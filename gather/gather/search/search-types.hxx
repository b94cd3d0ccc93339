#pragma once

#include <map>
#include <string>
#include <vector>
#include <cstdint>
#include <utility>
#include <ostream>
#include <optional>
#include <stdexcept>

namespace gather
{
  // Kind of catalog entry a search returns.
  //
  enum class result_type
  {
    dataset,
    file
  };

  // Catalog type name (Dataset, File).
  //
  std::string
  to_string (result_type);

  inline std::ostream&
  operator<< (std::ostream& o, result_type t)
  {
    return o << to_string (t);
  }

  // Catalog protocol.
  //
  enum class api_backend
  {
    solr,
    stac
  };

  std::string
  to_string (api_backend);

  api_backend
  to_api_backend (const std::string&);

  inline std::ostream&
  operator<< (std::ostream& o, api_backend b)
  {
    return o << to_string (b);
  }

  // Catalog index node.
  //
  // The value is either a bare host name or a complete URL.
  //
  class index_node
  {
  public:
    explicit
    index_node (std::string value, api_backend b = api_backend::solr)
      : value_ (std::move (value)), backend_ (b) {}

    const std::string&
    value () const noexcept
    {
      return value_;
    }

    api_backend
    backend () const noexcept
    {
      return backend_;
    }

    // Bridge nodes serve the search API at their root.
    //
    bool
    bridge () const;

    // Search endpoint URL. Throw std::invalid_argument if the value does not
    // look like a host name.
    //
    std::string
    url () const;

  private:
    std::string value_;
    api_backend backend_;
  };

  inline bool
  operator== (const index_node& x, const index_node& y)
  {
    return x.value () == y.value () && x.backend () == y.backend ();
  }

  // Boolean and temporal options attached to a query.
  //
  struct query_options
  {
    std::optional<bool> distrib;
    std::optional<bool> latest;
    std::optional<bool> replica;
    std::optional<bool> retracted;

    // Only entries modified in this window (ISO 8601, as the catalog
    // expects).
    //
    std::optional<std::string> date_from;
    std::optional<std::string> date_to;
  };

  // Facet and the values selected for it. A name starting with '!' negates
  // the selection.
  //
  struct facet_selection
  {
    std::string name;
    std::vector<std::string> values;
  };

  // Fully expanded query: ordered facet selections plus options.
  //
  struct flat_query
  {
    std::vector<facet_selection> selection;
    query_options options;

    // Append values to the facet, adding it if not yet selected.
    //
    flat_query&
    add (const std::string& name, std::vector<std::string> values);

    const facet_selection*
    find (const std::string& name) const;

    bool
    empty () const noexcept
    {
      return selection.empty ();
    }
  };

  std::ostream&
  operator<< (std::ostream&, const flat_query&);

  // Logical query.
  //
  // The query description and its algebra live outside of this library; what
  // we see is the flattened form, one flat query per alternative, plus a
  // content hash carried for bookkeeping.
  //
  class query
  {
  public:
    query () = default;

    explicit
    query (std::vector<flat_query> flat, std::string sha = std::string ())
      : flat_ (std::move (flat)), sha_ (std::move (sha)) {}

    std::vector<flat_query>
    flatten () const
    {
      return flat_;
    }

    const std::string&
    sha () const noexcept
    {
      return sha_;
    }

  private:
    std::vector<flat_query> flat_;
    std::string sha_;
  };

  // Facet value counts: facet name to value to number of matches.
  //
  using facet_counts = std::map<std::string, std::map<std::string, std::uint64_t>>;

  // Hit count derived from facet counts: the sum over the values of the first
  // facet (in name order), 0 if there are none. Meant for counts requested
  // for a single facet.
  //
  std::uint64_t
  hits_from_hints (const facet_counts&);

  // Search engine configuration.
  //
  struct search_settings
  {
    std::string index_node = "esgf-node.ipsl.upmc.fr";
    api_backend backend = api_backend::solr;

    // Seconds.
    //
    std::uint32_t http_timeout = 20;

    // Concurrent requests per remote host.
    //
    std::size_t max_concurrent = 5;

    std::uint64_t page_limit = 50;

    // Log and skip failed pages instead of throwing.
    //
    bool noraise = false;
  };

  // Invalid or unsupported catalog query.
  //
  class catalog_error: public std::runtime_error
  {
  public:
    using std::runtime_error::runtime_error;
  };

  // Query combination known to return unstable results across paginated or
  // distributed requests.
  //
  class unstable_query_error: public catalog_error
  {
  public:
    using catalog_error::catalog_error;
  };

  // One or more catalog requests failed.
  //
  class search_error: public catalog_error
  {
  public:
    search_error (const std::string& what, std::size_t failed)
      : catalog_error (what), failed_ (failed) {}

    std::size_t
    failed () const noexcept
    {
      return failed_;
    }

  private:
    std::size_t failed_;
  };
}
