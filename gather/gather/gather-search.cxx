#include <gather/gather-search.hxx>

#include <gather/gather-diagnostics.hxx>

using namespace std;

namespace gather
{
  static http_client_traits<>
  client_traits (uint32_t timeout)
  {
    http_client_traits<> r;
    r.connect_timeout = timeout * 1000;
    r.request_timeout = timeout * 1000;
    return r;
  }

  search_coordinator::
  search_coordinator (asio::io_context& ioc, const search_settings& s)
      : client_ (ioc, client_traits (s.http_timeout)),
        fetcher_ (client_, s)
  {
  }

  asio::awaitable<vector<uint64_t>> search_coordinator::
  hits (const query& q, result_type t)
  {
    co_return co_await fetcher_.hits (q.flatten (), t);
  }

  asio::awaitable<vector<facet_counts>> search_coordinator::
  hints (const query& q, result_type t, const vector<string>& facets)
  {
    co_return co_await fetcher_.hints (q.flatten (), t, facets);
  }

  asio::awaitable<vector<file_record>> search_coordinator::
  files (const query& q, const search_options& o)
  {
    vector<file_record> r (co_await fetcher_.files (q.flatten (), o));

    const search_stats& s (fetcher_.last_stats ());

    if (s.invalid != 0)
      warn () << "skipped " << s.invalid << " file(s) with invalid metadata";

    co_return r;
  }

  asio::awaitable<vector<dataset_record>> search_coordinator::
  datasets (const query& q, const search_options& o)
  {
    vector<dataset_record> r (co_await fetcher_.datasets (q.flatten (), o));

    const search_stats& s (fetcher_.last_stats ());

    if (s.invalid != 0)
      warn () << "skipped " << s.invalid << " dataset(s) with invalid metadata";

    co_return r;
  }

  asio::awaitable<vector<file_record>> search_coordinator::
  replicas (const file_record& f)
  {
    if (fetcher_.settings ().backend != api_backend::solr)
      co_return vector<file_record> ();

    flat_query q;
    q.add ("instance_id", {f.file_id});
    q.options.distrib = true;

    // Replicas share the checksum, so keep what deduplication would drop.
    //
    search_options o;
    o.keep_duplicates = true;

    vector<file_record> r;

    try
    {
      r = co_await fetcher_.files ({q}, o);
    }
    catch (const catalog_error& e)
    {
      warn () << "unable to look up replicas of " << f.file_id << ": "
              << e.what ();
    }

    co_return r;
  }
}
