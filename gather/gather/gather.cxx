#include <csignal>
#include <iostream>
#include <optional>
#include <exception>

#include <boost/asio.hpp>

#include <gather/gather-search.hxx>
#include <gather/gather-options.hxx>
#include <gather/gather-settings.hxx>
#include <gather/gather-transfer.hxx>
#include <gather/gather-diagnostics.hxx>

#include <gather/version.hxx>

using namespace std;
namespace asio = boost::asio;

namespace gather
{
  // Parse name=v1,v2 into a facet selection.
  //
  static facet_selection
  parse_facet (const string& s)
  {
    size_t p (s.find ('='));

    if (p == string::npos || p == 0 || p + 1 == s.size ())
      throw invalid_argument ("invalid facet '" + s + "', expected "
                              "<name>=<values>");

    facet_selection r {s.substr (0, p), {}};

    for (size_t b (p + 1);;)
    {
      size_t e (s.find (',', b));
      string v (s.substr (b, e == string::npos ? string::npos : e - b));

      if (!v.empty ())
        r.values.push_back (move (v));

      if (e == string::npos)
        break;

      b = e + 1;
    }

    return r;
  }

  static query
  make_query (const options& o)
  {
    flat_query q;

    for (const string& f: o.facet ())
    {
      facet_selection s (parse_facet (f));
      q.add (s.name, move (s.values));
    }

    if (o.distrib ())
      q.options.distrib = true;

    if (o.latest ())
      q.options.latest = true;

    if (o.replica ())
      q.options.replica = true;

    return query ({q});
  }

  static settings
  make_settings (const options& o)
  {
    settings r (default_settings ());

    if (o.data_specified ())
      r.paths.data = o.data ();

    if (o.tmp_specified ())
      r.paths.tmp = o.tmp ();

    if (o.index_node_specified ())
      r.search.index_node = o.index_node ();

    if (o.stac ())
      r.search.backend = api_backend::stac;

    r.search.http_timeout = o.timeout ();
    r.search.max_concurrent = o.jobs ();
    r.search.page_limit = o.page_limit ();
    r.search.noraise = o.noraise ();

    r.download.http_timeout = o.timeout ();
    r.download.max_concurrent = o.jobs ();
    r.download.chunk_size = o.chunk_size ();
    r.download.chunk_threshold = o.chunk_size ();
    r.download.kind = to_transfer_kind (o.transfer ());
    r.download.probe_timeout = chrono::seconds (o.probe_timeout ());
    r.download.resume = !o.no_resume ();

    r.validate ();
    return r;
  }

  // Driver state shared with the signal handler.
  //
  struct driver
  {
    const options& opt;
    const settings& cfg;
    search_coordinator& search;
    transfer_coordinator& transfer;
    bool downloading = false;
  };

  static asio::awaitable<int>
  run (driver& d)
  {
    const options& o (d.opt);

    query q (make_query (o));
    result_type t (o.dataset () ? result_type::dataset : result_type::file);

    if (o.hits ())
    {
      vector<uint64_t> hs (co_await d.search.hits (q, t));

      for (uint64_t n: hs)
        cout << n << endl;

      co_return 0;
    }

    if (o.hints_specified ())
    {
      vector<facet_counts> hs (co_await d.search.hints (q, t, o.hints ()));

      for (const facet_counts& h: hs)
        for (const auto& f: h)
          for (const auto& vc: f.second)
            cout << f.first << ' ' << vc.first << ' ' << vc.second << endl;

      co_return 0;
    }

    search_options so;
    so.offset = o.offset ();
    so.distributed = o.distributed ();
    so.keep_duplicates = o.keep_duplicates ();

    if (o.max_hits_specified ())
      so.max_hits = o.max_hits ();

    if (t == result_type::dataset)
    {
      vector<dataset_record> ds (co_await d.search.datasets (q, so));

      for (const dataset_record& r: ds)
        cout << r.dataset_id << ' ' << r.number_of_files << ' ' << r.size
             << ' ' << r.data_node << endl;

      co_return 0;
    }

    vector<file_record> files (co_await d.search.files (q, so));

    if (o.search ())
    {
      for (const file_record& f: files)
        cout << f.file_id << ' ' << f.size << ' ' << f.url << endl;

      co_return 0;
    }

    if (files.empty ())
    {
      warn () << "no files match the query";
      co_return 0;
    }

    search_coordinator& sc (d.search);
    d.transfer.set_mirror_lookup (
      [&sc] (const file_record& f) {return sc.replicas (f);});

    d.transfer.set_observer (transfer_observer {
      [] (const file_record& f)
      {
        info () << "started " << f.file_id;
      },
      [] (const file_record&, const fs::path& p)
      {
        cout << p.string () << endl;
      },
      [] (const file_record& f, const transfer_err& e)
      {
        error () << "unable to download " << f.file_id << ": " << e.kind
                 << ": " << e.message;
      }});

    d.downloading = true;
    transfer_batch b (co_await d.transfer.download (move (files)));
    d.downloading = false;

    if (!b.errors.empty ())
    {
      error () << b.errors.size () << " of " << b.size ()
               << " file(s) failed";
      co_return 1;
    }

    co_return 0;
  }
}

int
main (int argc, char* argv[])
{
  using namespace gather;

  try
  {
    options opt (argc, argv);

    // Handle --version.
    //
    if (opt.version ())
    {
      cout << "gather " << GATHER_VERSION_ID << endl;
      return 0;
    }

    // Handle --help.
    //
    if (opt.help ())
    {
      auto& o (cout);

      o << "usage: gather [options]" << "\n"
        << "options:"                << "\n";

      opt.print_usage (o);
      return 0;
    }

    verb = opt.verbose ();

    settings cfg (make_settings (opt));

    asio::io_context ioc;

    search_coordinator sc (ioc, cfg.search);
    transfer_coordinator tc (ioc, cfg);

    driver d {opt, cfg, sc, tc};

    // Interrupting stops the search, or cancels the downloads and lets the
    // batch report what became of every file.
    //
    asio::cancellation_signal stop;
    asio::signal_set signals (ioc, SIGINT, SIGTERM);

    signals.async_wait (
      [&d, &stop] (const boost::system::error_code& ec, int)
      {
        if (ec)
          return;

        warn () << "interrupted, cancelling";

        if (d.downloading)
          d.transfer.cancel ();
        else
          stop.emit (asio::cancellation_type::terminal);
      });

    int r (1);

    asio::co_spawn (
      ioc,
      run (d),
      asio::bind_cancellation_slot (
        stop.slot (),
        [&r, &signals] (exception_ptr ex, int v)
        {
          r = v;

          if (ex)
          {
            r = 1;

            try
            {
              rethrow_exception (ex);
            }
            catch (const exception& e)
            {
              error () << e.what ();
            }
          }

          signals.cancel ();
        }));

    ioc.run ();
    return r;
  }
  catch (const cli::exception& ex)
  {
    error () << ex;
    return 1;
  }
  catch (const exception& ex)
  {
    error () << ex.what ();
    return 1;
  }
}
