#include <set>
#include <utility>
#include <exception>

#include <boost/system/system_error.hpp>

#include <gather/gather-diagnostics.hxx>
#include <gather/http/http-json.hxx>
#include <gather/async/async-group.hxx>
#include <gather/search/search-solr.hxx>
#include <gather/search/search-stac.hxx>

namespace gather
{
  template <typename C>
  boost::asio::awaitable<std::vector<std::uint64_t>> basic_search_fetcher<C>::
  hits (const std::vector<flat_query>& qs, result_type t)
  {
    stats_ = search_stats ();
    co_return co_await count (qs, t);
  }

  template <typename C>
  boost::asio::awaitable<std::vector<facet_counts>> basic_search_fetcher<C>::
  hints (const std::vector<flat_query>& qs,
         result_type t,
         const std::vector<std::string>& facets)
  {
    stats_ = search_stats ();
    co_return co_await count_facets (qs, t, facets);
  }

  template <typename C>
  boost::asio::awaitable<std::vector<file_record>> basic_search_fetcher<C>::
  files (const std::vector<flat_query>& qs, const search_options& o)
  {
    stats_ = search_stats ();

    std::vector<boost::json::object> ds (
      co_await documents (qs, result_type::file, o));

    bool solr (settings ().backend == api_backend::solr);
    std::vector<file_record> r;

    for (const boost::json::object& d: ds)
    {
      try
      {
        if (solr)
          r.push_back (file_from_solr (d));
        else
        {
          for (file_record& f: stac_files (d))
            r.push_back (std::move (f));
        }
      }
      catch (const invalid_metadata& e)
      {
        ++stats_.invalid;
        warn () << "skipping file with invalid metadata: " << e.what ();
      }
    }

    co_return deduplicate (std::move (r), o, "file");
  }

  template <typename C>
  boost::asio::awaitable<std::vector<dataset_record>> basic_search_fetcher<C>::
  datasets (const std::vector<flat_query>& qs, const search_options& o)
  {
    stats_ = search_stats ();

    std::vector<boost::json::object> ds (
      co_await documents (qs, result_type::dataset, o));

    bool solr (settings ().backend == api_backend::solr);
    std::vector<dataset_record> r;

    for (const boost::json::object& d: ds)
    {
      try
      {
        r.push_back (solr ? dataset_from_solr (d) : stac_dataset (d));
      }
      catch (const invalid_metadata& e)
      {
        ++stats_.invalid;
        warn () << "skipping dataset with invalid metadata: " << e.what ();
      }
    }

    co_return deduplicate (std::move (r), o, "dataset");
  }

  template <typename C>
  boost::asio::awaitable<std::vector<std::uint64_t>> basic_search_fetcher<C>::
  count (const std::vector<flat_query>& qs, result_type t)
  {
    std::vector<search_request> rs (planner_.hits (qs, t));
    std::vector<pages> ps (co_await fetch_all (rs));

    std::vector<std::uint64_t> r (qs.size (), 0);

    for (std::size_t i (0); i != rs.size (); ++i)
    {
      if (ps[i].empty ())
        continue;

      r[rs[i].query ()] = settings ().backend == api_backend::solr
        ? solr_hits (ps[i].front ())
        : stac_hits (ps[i].front ());
    }

    co_return r;
  }

  template <typename C>
  boost::asio::awaitable<std::vector<facet_counts>> basic_search_fetcher<C>::
  count_facets (const std::vector<flat_query>& qs,
                result_type t,
                const std::vector<std::string>& facets)
  {
    std::vector<search_request> rs (planner_.hints (qs, t, facets));
    std::vector<pages> ps (co_await fetch_all (rs));

    std::vector<facet_counts> r (qs.size ());

    for (std::size_t i (0); i != rs.size (); ++i)
      if (!ps[i].empty ())
        r[rs[i].query ()] = solr_facets (ps[i].front ());

    co_return r;
  }

  template <typename C>
  boost::asio::awaitable<std::vector<boost::json::object>> basic_search_fetcher<C>::
  documents (const std::vector<flat_query>& qs,
             result_type t,
             const search_options& o)
  {
    std::vector<search_request> rs;

    if (o.distributed && settings ().backend == api_backend::solr)
    {
      // Ask the federation where the matches are.
      //
      std::vector<flat_query> dq (qs);
      for (flat_query& q: dq)
        q.options.distrib = true;

      std::vector<facet_counts> h (
        co_await count_facets (dq, t, {"index_node"}));

      rs = planner_.search_distributed (qs, t, h, o.offset, o.max_hits, o.fields);
    }
    else
    {
      std::vector<std::uint64_t> h;

      if (o.hits)
        h = *o.hits;
      else
        h = co_await count (qs, t);

      rs = planner_.search (qs, t, h, o.offset, o.max_hits, o.fields);
    }

    info () << "fetching " << rs.size () << " page(s) of " << t << " results";

    std::vector<pages> ps (co_await fetch_all (rs));
    std::vector<boost::json::object> r;

    for (std::size_t i (0); i != rs.size (); ++i)
    {
      if (rs[i].backend () == api_backend::solr)
      {
        for (const boost::json::object& p: ps[i])
          for (const boost::json::value& d: solr_docs (p))
            if (d.is_object ())
              r.push_back (d.get_object ());

        continue;
      }

      // Keep the window [offset, offset + limit) of the cursor.
      //
      std::uint64_t skip (rs[i].offset ()), keep (rs[i].limit ());

      for (const boost::json::object& p: ps[i])
      {
        for (const boost::json::value& f: stac_features (p))
        {
          if (skip != 0)
          {
            --skip;
            continue;
          }

          if (keep == 0)
            break;

          if (f.is_object ())
          {
            r.push_back (f.get_object ());
            --keep;
          }
        }
      }
    }

    co_return r;
  }

  template <typename C>
  boost::asio::awaitable<std::vector<typename basic_search_fetcher<C>::pages>>
  basic_search_fetcher<C>::
  fetch_all (const std::vector<search_request>& rs)
  {
    if (!limiter_)
      limiter_ = std::make_unique<host_limiter> (
        co_await boost::asio::this_coro::executor,
        settings ().max_concurrent);

    std::vector<boost::asio::awaitable<pages>> ts;
    ts.reserve (rs.size ());

    for (const search_request& r: rs)
      ts.push_back (fetch_gated (r));

    group_result<pages> g (co_await when_all (std::move (ts)));

    std::size_t failed (0);
    std::string first;

    for (std::size_t i: g.order)
    {
      if (!g.errors[i])
        continue;

      std::string m;

      try
      {
        std::rethrow_exception (g.errors[i]);
      }
      catch (const boost::system::system_error& e)
      {
        if (e.code () == boost::asio::error::operation_aborted)
          throw;

        m = e.what ();
      }
      catch (const std::exception& e)
      {
        m = e.what ();
      }

      if (failed++ == 0)
        first = rs[i].url () + ": " + m;

      if (settings ().noraise)
        warn () << "skipping failed catalog request " << rs[i] << ": " << m;
    }

    stats_.failed += failed;

    if (failed != 0 && !settings ().noraise)
    {
      std::string m ("catalog request failed: " + first);

      if (failed > 1)
        m += " (and " + std::to_string (failed - 1) + " more)";

      throw search_error (m, failed);
    }

    co_return std::move (g.values);
  }

  template <typename C>
  boost::asio::awaitable<typename basic_search_fetcher<C>::pages>
  basic_search_fetcher<C>::
  fetch_gated (const search_request& r)
  {
    semaphore_permit p (co_await limiter_->acquire (r.url ()));
    co_return co_await fetch (r);
  }

  template <typename C>
  boost::asio::awaitable<typename basic_search_fetcher<C>::pages>
  basic_search_fetcher<C>::
  fetch (const search_request& r)
  {
    pages ps;
    http_request req (r.http ());

    if (r.backend () == api_backend::solr)
    {
      trace () << "GET " << req.url;

      auto res (co_await client_.request (req));
      boost::json::object p (parse_json_object (res, req.url));

      // Validate the shape.
      //
      solr_hits (p);

      ps.push_back (std::move (p));
      co_return ps;
    }

    boost::json::object body (*r.body ());
    std::uint64_t seen (0), need (r.offset () + r.limit ());

    for (;;)
    {
      trace () << to_string (req.method) << ' ' << req.url;

      auto res (co_await client_.request (req));
      boost::json::object p (parse_json_object (res, req.url));

      std::size_t n (stac_features (p).size ());
      seen += n;

      boost::json::object nb;
      std::optional<http_request> next;

      if (n != 0 && seen < need)
        next = stac_next (p, body, nb);

      ps.push_back (std::move (p));

      if (!next)
        break;

      if (next->method == http_method::post)
        body = std::move (nb);

      req = std::move (*next);
    }

    co_return ps;
  }

  template <typename C>
  template <typename R>
  std::vector<R> basic_search_fetcher<C>::
  deduplicate (std::vector<R> v, const search_options& o, const char* what)
  {
    if (o.keep_duplicates)
      return v;

    std::set<std::string> seen;
    std::vector<R> r;
    r.reserve (v.size ());

    for (R& x: v)
    {
      if (seen.insert (x.identity ()).second)
        r.push_back (std::move (x));
      else
        ++stats_.duplicates;
    }

    if (stats_.duplicates != 0)
      info () << "dropped " << stats_.duplicates << " duplicate " << what
              << " record(s)";

    return r;
  }
}
