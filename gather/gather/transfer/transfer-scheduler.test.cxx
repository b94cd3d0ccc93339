#include <gather/transfer/transfer-scheduler.hxx>

#include <gather/http/http-memory.hxx>

#include <string>
#include <vector>
#include <cassert>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <exception>

using namespace std;
using namespace gather;

namespace asio = boost::asio;

using scheduler = basic_transfer_scheduler<memory_client>;

static void
run (asio::io_context& ioc, asio::awaitable<void> a)
{
  bool done (false);

  asio::co_spawn (ioc,
                  move (a),
                  [&done] (exception_ptr e)
  {
    if (e)
      rethrow_exception (e);

    done = true;
  });

  ioc.run ();
  assert (done);
}

static fs::path
scratch (const char* name)
{
  fs::path d (fs::temp_directory_path () / "gather-tests" / name);
  fs::remove_all (d);
  fs::create_directories (d);
  return d;
}

static string
content (size_t n, char seed)
{
  string r;
  for (size_t i (0); i != n; ++i)
    r += static_cast<char> (seed + i % 13);
  return r;
}

static string
sha256 (const string& s)
{
  digest d (digest_algorithm::sha256);
  d.update (s.data (), s.size ());
  return d.hex ();
}

static string
read (const fs::path& p)
{
  ifstream ifs (p, ios::binary);
  return string (istreambuf_iterator<char> (ifs), istreambuf_iterator<char> ());
}

static file_record
file (const string& name, const string& body)
{
  file_record f;
  f.dataset_id = "CMIP6.x.v1";
  f.filename = name;
  f.file_id = f.dataset_id + '.' + name;
  f.master_id = "CMIP6.x." + name;
  f.version = "v1";
  f.local_path = "CMIP6/x/v1";
  f.url = "https://data.test.org/" + name;
  f.data_node = "data.test.org";
  f.size = body.size ();
  f.checksum = sha256 (body);
  f.checksum_type = "SHA256";
  return f;
}

// Five files, two at a time, the third one missing from the server.
//
static void
test_batch ()
{
  fs::path d (scratch ("batch"));
  transfer_storage s (d / "data", d / "tmp");

  asio::io_context ioc;
  memory_client c;
  c.delay (chrono::milliseconds (5));

  vector<file_record> files;
  for (size_t i (0); i != 5; ++i)
  {
    string name ("f" + std::to_string (i) + ".nc");
    string body (content (100 + i, static_cast<char> ('a' + i)));

    files.push_back (file (name, body));

    if (i != 2)
      c.serve (files.back ().url, body);
  }

  scheduler sc (c, s, download_settings ());

  size_t active (0), peak (0), started (0), completed (0), failed (0);
  size_t results (0);

  transfer_observer o;
  o.started = [&] (const file_record&)
  {
    ++started;
    if (++active > peak)
      peak = active;
  };
  o.completed = [&] (const file_record& f, const fs::path& p)
  {
    ++completed;
    --active;
    assert (p == s.final_path (f));
  };
  o.failed = [&] (const file_record&, const transfer_err&)
  {
    ++failed;
    --active;
  };

  sc.observer (move (o));
  sc.on_result ([&results] (const transfer_result&) {++results;});

  transfer_batch b;

  run (ioc, [&] () -> asio::awaitable<void>
  {
    b = co_await sc.process (files, 2);
  } ());

  assert (b.size () == 5);
  assert (b.ok.size () == 4);
  assert (b.errors.size () == 1);

  const transfer_err& e (b.errors[0]);
  assert (e.file.filename == "f2.nc");
  assert (e.kind == transfer_error_kind::transport);
  assert (e.cause);
  assert (!e.message.empty ());

  assert (results == 5);
  assert (started == 5 && completed == 4 && failed == 1);
  assert (peak == 2);
  assert (active == 0);
  assert (sc.tasks ().empty ());

  for (const transfer_ok& r: b.ok)
  {
    assert (r.bytes == r.file.size);
    assert (fs::file_size (r.path) == r.file.size);
    assert (sha256 (read (r.path)) == r.file.checksum);
    assert (!fs::exists (s.temporary_path (r.file)));
  }

  assert (!fs::exists (s.final_path (files[2])));

  // Zero concurrency is refused.
  //
  ioc.restart ();

  run (ioc, [&] () -> asio::awaitable<void>
  {
    try
    {
      co_await sc.process (files, 0);
      assert (false);
    }
    catch (const invalid_argument&)
    {
    }
  } ());
}

static void
test_corrupt ()
{
  fs::path d (scratch ("corrupt"));
  transfer_storage s (d / "data", d / "tmp");

  asio::io_context ioc;
  memory_client c;

  string body (content (64, 'a'));

  file_record good (file ("good.nc", body));
  file_record bad (file ("bad.nc", body));
  file_record small (file ("small.nc", body));

  c.serve (good.url, body);
  c.serve (bad.url, content (64, 'b'));
  c.serve (small.url, body.substr (0, 40));

  download_settings ds;
  ds.kind = transfer_kind::simple;

  scheduler sc (c, s, ds);
  transfer_batch b;

  run (ioc, [&] () -> asio::awaitable<void>
  {
    b = co_await sc.process ({good, bad, small});
  } ());

  assert (b.ok.size () == 1);
  assert (b.errors.size () == 2);

  for (const transfer_err& e: b.errors)
  {
    if (e.file.filename == "bad.nc")
      assert (e.kind == transfer_error_kind::checksum_mismatch);
    else
      assert (e.kind == transfer_error_kind::size_mismatch);

    // Nothing left behind to resume from.
    //
    assert (!fs::exists (s.temporary_path (e.file)));
    assert (!fs::exists (s.final_path (e.file)));
  }
}

// Cancel in the middle of a chunked transfer, then pick it up again.
//
static void
test_cancel_resume ()
{
  fs::path d (scratch ("cancel"));
  transfer_storage s (d / "data", d / "tmp");

  asio::io_context ioc;
  memory_client c;

  string b0 (content (30, 'a')), b1 (content (30, 'n'));
  file_record f0 (file ("f0.nc", b0)), f1 (file ("f1.nc", b1));

  c.serve (f0.url, b0);
  c.serve (f1.url, b1);
  c.delay (chrono::milliseconds (40));

  download_settings ds;
  ds.kind = transfer_kind::chunked;
  ds.chunk_size = 10;
  ds.max_concurrent = 1;

  scheduler sc (c, s, ds);

  size_t started (0), failed (0);

  transfer_observer o;
  o.started = [&started] (const file_record&) {++started;};
  o.failed = [&failed] (const file_record&, const transfer_err&) {++failed;};
  sc.observer (o);

  transfer_batch b;

  // The first chunk arrives at 40ms, the second one would at 80ms.
  //
  asio::co_spawn (ioc,
                  [&] () -> asio::awaitable<void>
  {
    asio::steady_timer t (co_await asio::this_coro::executor,
                          chrono::milliseconds (60));
    co_await t.async_wait (asio::use_awaitable);

    assert (sc.tasks ().size () == 2);
    assert (sc.tasks ()[0]->state () == transfer_state::downloading);
    assert (sc.tasks ()[0]->progress ().acquired_bytes == 10);
    assert (sc.tasks ()[1]->state () == transfer_state::pending);

    sc.cancel ();
  },
                  asio::detached);

  run (ioc, [&] () -> asio::awaitable<void>
  {
    b = co_await sc.process ({f0, f1});
  } ());

  assert (sc.cancelled ());
  assert (b.ok.empty ());
  assert (b.errors.size () == 2);

  for (const transfer_err& e: b.errors)
  {
    assert (e.kind == transfer_error_kind::cancelled);

    if (e.file.filename == "f0.nc")
      assert (e.completed == 10);
  }

  // Only the running task was started; the partial artifact stays.
  //
  assert (started == 1);
  assert (failed == 2);
  assert (fs::file_size (s.temporary_path (f0)) == 10);
  assert (!fs::exists (s.final_path (f0)));

  // Resume: only the missing ranges are requested.
  //
  c.delay (chrono::milliseconds (0));
  size_t before (c.requests ().size ());

  ioc.restart ();

  run (ioc, [&] () -> asio::awaitable<void>
  {
    b = co_await sc.process ({f0, f1});
  } ());

  assert (!sc.cancelled ());
  assert (b.ok.size () == 2);
  assert (read (s.final_path (f0)) == b0);
  assert (read (s.final_path (f1)) == b1);

  const http_request& r (c.requests ()[before]);
  assert (r.url == f0.url);
  assert (r.get_header ("Range") && *r.get_header ("Range") == "bytes=10-19");
}

// Spread over the catalog URL and a replica found through the lookup.
//
static void
test_mirrors ()
{
  fs::path d (scratch ("mirrors"));
  transfer_storage s (d / "data", d / "tmp");

  asio::io_context ioc;
  memory_client c;
  c.delay (chrono::milliseconds (1));

  string body (content (95, 'a'));
  file_record f (file ("m.nc", body));

  file_record replica (f);
  replica.url = "https://mirror.test.org/m.nc";
  replica.data_node = "mirror.test.org";

  c.serve (f.url, body);
  c.serve (replica.url, body);

  download_settings ds;
  ds.kind = transfer_kind::distributed;
  ds.chunk_size = 10;

  scheduler sc (c, s, ds);

  sc.mirrors ([replica] (const file_record&)
                -> asio::awaitable<vector<file_record>>
  {
    co_return vector<file_record> {replica};
  });

  transfer_batch b;

  run (ioc, [&] () -> asio::awaitable<void>
  {
    b = co_await sc.process ({f});
  } ());

  assert (b.ok.size () == 1);
  assert (read (b.ok[0].path) == body);

  assert (c.count (http_method::head, f.url) == 1);
  assert (c.count (http_method::head, replica.url) == 1);
  assert (c.count (http_method::get, f.url) +
          c.count (http_method::get, replica.url) == 10);
}

static void
test_strategy ()
{
  file_record f;
  download_settings ds;
  ds.chunk_threshold = 100;
  ds.chunk_size = 10;

  f.size = 99;
  assert (select_strategy (f, ds).index () == 0);

  f.size = 100;
  assert (select_strategy (f, ds).index () == 1);
  assert (get<chunked_transfer> (select_strategy (f, ds)).chunk_size == 10);

  ds.kind = transfer_kind::simple;
  assert (string (strategy_name (select_strategy (f, ds))) == "whole");

  ds.kind = transfer_kind::distributed;
  assert (string (strategy_name (select_strategy (f, ds))) == "multi-source");
  assert (get<multi_source_transfer> (select_strategy (f, ds)).probe_timeout ==
          chrono::milliseconds (5000));

  assert (to_transfer_kind ("auto") == transfer_kind::automatic);
  assert (to_string (transfer_kind::distributed) == "distributed");

  try
  {
    to_transfer_kind ("parallel");
    assert (false);
  }
  catch (const invalid_argument&)
  {
  }
}

int
main ()
{
  test_strategy ();
  test_batch ();
  test_corrupt ();
  test_cancel_resume ();
  test_mirrors ();
}
