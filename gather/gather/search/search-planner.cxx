#include <gather/search/search-planner.hxx>

#include <stdexcept>

#include <gather/search/search-solr.hxx>
#include <gather/search/search-stac.hxx>
#include <gather/search/search-distribute.hxx>

using namespace std;

namespace gather
{
  string search_planner::
  endpoint () const
  {
    return index_node (settings_.index_node, settings_.backend).url ();
  }

  vector<search_request> search_planner::
  hits (const vector<flat_query>& qs, result_type t) const
  {
    string ep (endpoint ());
    vector<search_request> r;

    for (size_t i (0); i != qs.size (); ++i)
    {
      if (settings_.backend == api_backend::solr)
        r.emplace_back (ep, t, i, 0, 0, solr_params (qs[i], t, 0, 0, {}));
      else
        r.emplace_back (ep, t, i, 0, 1, stac_body (qs[i], 1));
    }

    return r;
  }

  vector<search_request> search_planner::
  hints (const vector<flat_query>& qs,
         result_type t,
         const vector<string>& facets) const
  {
    if (settings_.backend != api_backend::solr)
      throw catalog_error ("facet counts are not supported by the " +
                           to_string (settings_.backend) + " backend");

    if (facets.empty ())
      throw catalog_error ("no facets to count");

    string ep (endpoint ());
    vector<search_request> r;

    for (size_t i (0); i != qs.size (); ++i)
      r.emplace_back (ep, t, i, 0, 0, solr_params (qs[i], t, 0, 0, {}, facets));

    return r;
  }

  vector<search_request> search_planner::
  search (const vector<flat_query>& qs,
          result_type t,
          const vector<uint64_t>& hits,
          uint64_t offset,
          optional<uint64_t> cap,
          const vector<string>& fields) const
  {
    if (hits.size () != qs.size ())
      throw invalid_argument ("hit counts do not match queries");

    string ep (endpoint ());
    vector<hit_slice> plan (distribute (hits, offset, cap));
    vector<search_request> r;

    if (settings_.backend == api_backend::stac)
    {
      for (size_t i (0); i != qs.size (); ++i)
      {
        const hit_slice& s (plan[i]);

        if (s.count != 0)
          r.emplace_back (ep, t, i, s.offset, s.count,
                          stac_body (qs[i], settings_.page_limit));
      }

      return r;
    }

    for (const page_window& w: paginate (plan, settings_.page_limit))
      r.emplace_back (ep, t, w.bucket, w.offset, w.limit,
                      solr_params (qs[w.bucket], t, w.offset, w.limit, fields));

    return r;
  }

  vector<search_request> search_planner::
  search_distributed (const vector<flat_query>& qs,
                      result_type t,
                      const vector<facet_counts>& hints,
                      uint64_t offset,
                      optional<uint64_t> cap,
                      const vector<string>& fields) const
  {
    if (settings_.backend != api_backend::solr)
      throw catalog_error ("distributed search is not supported by the " +
                           to_string (settings_.backend) + " backend");

    if (hints.size () != qs.size ())
      throw invalid_argument ("facet counts do not match queries");

    // One bucket per (query, index node).
    //
    struct bucket
    {
      size_t query;
      string node;
    };

    vector<bucket> bs;
    vector<uint64_t> hits;

    for (size_t i (0); i != qs.size (); ++i)
    {
      auto n (hints[i].find ("index_node"));

      if (n == hints[i].end ())
      {
        bs.push_back (bucket {i, settings_.index_node});
        hits.push_back (hits_from_hints (hints[i]));
        continue;
      }

      for (const auto& nc: n->second)
      {
        bs.push_back (bucket {i, nc.first});
        hits.push_back (nc.second);
      }
    }

    vector<search_request> r;

    for (const page_window& w:
           paginate (distribute (hits, offset, cap), settings_.page_limit))
    {
      const bucket& b (bs[w.bucket]);

      flat_query q (qs[b.query]);
      q.options.distrib = false;

      r.emplace_back (index_node (b.node, api_backend::solr).url (),
                      t,
                      b.query,
                      w.offset,
                      w.limit,
                      solr_params (q, t, w.offset, w.limit, fields));
    }

    return r;
  }

  vector<size_t> search_planner::
  number_of_requests (const vector<uint64_t>& hits,
                      uint64_t offset,
                      optional<uint64_t> cap) const
  {
    vector<hit_slice> plan (distribute (hits, offset, cap));

    if (settings_.backend == api_backend::stac)
    {
      vector<size_t> r;
      for (const hit_slice& s: plan)
        r.push_back (s.count != 0 ? 1 : 0);
      return r;
    }

    return page_counts (plan, settings_.page_limit);
  }
}
