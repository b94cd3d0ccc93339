#include <gather/search/search-fetcher.hxx>

#include <gather/http/http-memory.hxx>

#include <string>
#include <vector>
#include <cassert>
#include <exception>

using namespace std;
using namespace gather;

namespace json = boost::json;

using fetcher = basic_search_fetcher<memory_client>;

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

// Decoded value of a query parameter, empty if absent.
//
static string
param (const string& url, const string& name)
{
  size_t p (url.find ('?'));

  while (p != string::npos)
  {
    size_t b (p + 1), e (url.find ('&', b));
    string kv (url.substr (b, e == string::npos ? string::npos : e - b));

    size_t eq (kv.find ('='));
    if (kv.substr (0, eq) == name && eq != string::npos)
      return url_decode (kv.substr (eq + 1));

    p = e;
  }

  return string ();
}

static http_response
json_response (const json::value& v)
{
  http_response r (http_status::ok);
  r.set_header ("Content-Type", "application/json");
  r.body = json::serialize (v);
  return r;
}

static json::object
file_doc (const string& dataset, const string& name, const string& checksum)
{
  return json::object {
    {"dataset_id", dataset + "|esgf.test.org"},
    {"title", name},
    {"url", json::array {"http://data.test.org/" + name +
                         "|application/netcdf|HTTPServer"}},
    {"data_node", "data.test.org"},
    {"checksum", json::array {checksum}},
    {"checksum_type", json::array {"SHA256"}},
    {"size", 10}};
}

// Solr node answering count requests with the number of documents and
// record requests with the requested page.
//
static memory_client::handler_type
solr_node (json::array docs)
{
  return [docs] (const http_request& req)
  {
    size_t offset (stoul (param (req.url, "offset")));
    size_t limit (stoul (param (req.url, "limit")));

    json::array page;
    for (size_t i (offset); i < docs.size () && i < offset + limit; ++i)
      page.push_back (docs[i]);

    return json_response (json::object {
      {"response", json::object {{"numFound", docs.size ()},
                                 {"docs", move (page)}}}});
  };
}

static flat_query
project (const string& p)
{
  flat_query q;
  q.add ("project", {p});
  return q;
}

static search_settings
settings (const string& node)
{
  search_settings s;
  s.index_node = node;
  s.page_limit = 2;
  s.max_concurrent = 2;
  return s;
}

static const string endpoint ("https://esgf.test.org/esg-search/search");

static void
test_files ()
{
  asio::io_context ioc;
  memory_client c;

  json::object bad (file_doc ("CMIP6.x.v1", "bad.nc", "c3"));
  bad.erase ("size");

  c.route (endpoint, solr_node (json::array {
    file_doc ("CMIP6.x.v1", "a.nc", "c1"),
    file_doc ("CMIP6.x.v1", "b.nc", "c2"),
    file_doc ("CMIP6.y.v1", "b.nc", "c2"), // Same content, other dataset.
    bad}));

  fetcher f (c, settings ("esgf.test.org"));

  run (ioc, [&] () -> asio::awaitable<void>
  {
    vector<uint64_t> h (co_await f.hits ({project ("CMIP6")},
                                         result_type::file));
    assert ((h == vector<uint64_t> {4}));

    vector<file_record> fs (co_await f.files ({project ("CMIP6")}));

    // One count request and two pages.
    //
    assert (c.requests ().size () == 4);

    assert (fs.size () == 2);
    assert (fs[0].filename == "a.nc");
    assert (fs[1].filename == "b.nc");
    assert (fs[1].url == "http://data.test.org/b.nc");

    assert (f.last_stats ().duplicates == 1);
    assert (f.last_stats ().invalid == 1);
    assert (f.last_stats ().failed == 0);

    // With known hits there is no count request.
    //
    search_options o;
    o.hits = vector<uint64_t> {4};
    o.keep_duplicates = true;

    fs = co_await f.files ({project ("CMIP6")}, o);

    assert (c.requests ().size () == 6);
    assert (fs.size () == 3);
    assert (f.last_stats ().duplicates == 0);

    // Capped with an offset.
    //
    o.offset = 1;
    o.max_hits = 1;
    fs = co_await f.files ({project ("CMIP6")}, o);

    assert (fs.size () == 1);
    assert (fs[0].filename == "b.nc");
    assert (param (c.requests ().back ().url, "offset") == "1");
    assert (param (c.requests ().back ().url, "limit") == "1");
  } ());
}

static void
test_failures ()
{
  asio::io_context ioc;
  memory_client c;

  memory_client::handler_type ok (
    solr_node (json::array {file_doc ("CMIP6.x.v1", "a.nc", "c1")}));

  c.route (endpoint, [ok] (const http_request& req)
  {
    if (param (req.url, "query") == "project:CORDEX")
      return http_response (http_status::internal_server_error);

    return ok (req);
  });

  search_options o;
  o.hits = vector<uint64_t> {1, 1};

  {
    fetcher f (c, settings ("esgf.test.org"));

    run (ioc, [&] () -> asio::awaitable<void>
    {
      try
      {
        co_await f.files ({project ("CMIP6"), project ("CORDEX")}, o);
        assert (false);
      }
      catch (const search_error& e)
      {
        assert (e.failed () == 1);
      }

      // Every request was still made.
      //
      assert (c.requests ().size () == 2);
    } ());
  }

  {
    ioc.restart ();

    search_settings s (settings ("esgf.test.org"));
    s.noraise = true;
    fetcher f (c, s);

    run (ioc, [&] () -> asio::awaitable<void>
    {
      vector<file_record> fs (
        co_await f.files ({project ("CMIP6"), project ("CORDEX")}, o));

      assert (fs.size () == 1);
      assert (f.last_stats ().failed == 1);
    } ());
  }
}

static void
test_distributed ()
{
  asio::io_context ioc;
  memory_client c;

  // The configured node reports where the matches are.
  //
  c.route (endpoint, [] (const http_request& req)
  {
    assert (param (req.url, "facets") == "index_node");
    assert (param (req.url, "distrib") == "true");

    return json_response (json::object {
      {"response", json::object {{"numFound", 2}, {"docs", json::array ()}}},
      {"facet_counts", json::object {
        {"facet_fields", json::object {
          {"index_node", json::array {"esgf.a.org", 1, "esgf.b.org", 1}}}}}}});
  });

  c.route ("https://esgf.a.org/esg-search/search",
           solr_node (json::array {file_doc ("CMIP6.a.v1", "a.nc", "c1")}));

  c.route ("https://esgf.b.org/esg-search/search",
           solr_node (json::array {file_doc ("CMIP6.b.v1", "b.nc", "c2")}));

  fetcher f (c, settings ("esgf.test.org"));

  run (ioc, [&] () -> asio::awaitable<void>
  {
    search_options o;
    o.distributed = true;

    vector<file_record> fs (co_await f.files ({project ("CMIP6")}, o));

    assert (fs.size () == 2);
    assert (c.requests ().size () == 3);

    for (size_t i (1); i != 3; ++i)
      assert (param (c.requests ()[i].url, "distrib") == "false");
  } ());
}

static json::object
item (const string& id)
{
  return json::object {
    {"id", "CMIP6.x." + id + ".v1"},
    {"properties", json::object ()},
    {"assets", json::object {
      {"data0000", json::object {
        {"type", "application/netcdf"},
        {"href", "https://data.test.org/" + id + ".nc"},
        {"alternate:name", "data.test.org"},
        {"file:size", 10},
        {"file:checksum", "1220" + id}}}}}};
}

static void
test_stac ()
{
  asio::io_context ioc;
  memory_client c;

  // Three items served two per page through a POST cursor.
  //
  c.route ("https://api.stac.test.org/search", [] (const http_request& req)
  {
    assert (req.method == http_method::post && req.body);

    json::object b (json::parse (*req.body).as_object ());
    assert (b.at ("collections").as_array ().size () == 1);

    json::object r {{"numMatched", 3}};

    if (b.contains ("token"))
      r["features"] = json::array {item ("i2")};
    else
    {
      r["features"] = json::array {item ("i0"), item ("i1")};
      r["links"] = json::array {
        json::object {{"rel", "next"},
                      {"method", "POST"},
                      {"merge", true},
                      {"href", "https://api.stac.test.org/search"},
                      {"body", json::object {{"token", "next:i1"}}}}};
    }

    return json_response (r);
  });

  search_settings s (settings ("api.stac.test.org"));
  s.backend = api_backend::stac;

  fetcher f (c, s);

  run (ioc, [&] () -> asio::awaitable<void>
  {
    vector<uint64_t> h (co_await f.hits ({project ("CMIP6")},
                                         result_type::file));
    assert ((h == vector<uint64_t> {3}));

    vector<file_record> fs (co_await f.files ({project ("CMIP6")}));

    assert (fs.size () == 3);
    assert (fs[2].filename == "i2.nc");

    // Two counts and two cursor pages.
    //
    assert (c.requests ().size () == 4);

    // A window in the middle stops following the cursor once covered.
    //
    search_options o;
    o.hits = vector<uint64_t> {3};
    o.offset = 1;
    o.max_hits = 1;

    fs = co_await f.files ({project ("CMIP6")}, o);

    assert (fs.size () == 1);
    assert (fs[0].filename == "i1.nc");
    assert (c.requests ().size () == 5);

    vector<dataset_record> ds (co_await f.datasets ({project ("CMIP6")}));
    assert (ds.size () == 3);
  } ());
}

int
main ()
{
  test_files ();
  test_failures ();
  test_distributed ();
  test_stac ();
}
