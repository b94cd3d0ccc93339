#include <gather/search/search-planner.hxx>

#include <cassert>

using namespace std;
using namespace gather;

static search_settings
solr_settings ()
{
  search_settings s;
  s.index_node = "esgf.test.org";
  s.page_limit = 50;
  return s;
}

static flat_query
project (const string& p)
{
  flat_query q;
  q.add ("project", {p});
  return q;
}

static void
check_request (const search_request& r,
               size_t query,
               uint64_t offset,
               uint64_t limit)
{
  if (r.query () != query || r.offset () != offset || r.limit () != limit)
    assert (false);
}

static void
test_hits ()
{
  search_planner p (solr_settings ());

  vector<search_request> rs (
    p.hits ({project ("CMIP6"), project ("CORDEX")}, result_type::file));

  assert (rs.size () == 2);

  const search_request& r (rs[1]);
  assert (r.backend () == api_backend::solr);
  assert (r.endpoint () == "https://esgf.test.org/esg-search/search");
  assert (r.query () == 1);
  assert (r.filter () == "project:CORDEX");
  assert (*r.params ().find ("limit") == "0");

  assert (r.url () ==
          "https://esgf.test.org/esg-search/search?type=File&offset=0&"
          "limit=0&format=application%2Fsolr%2Bjson&fields=instance_id&"
          "query=project%3ACORDEX");

  http_request h (r.http ());
  assert (h.method == http_method::get);
  assert (h.get_header ("Accept") && *h.get_header ("Accept") ==
          "application/json");
}

static void
test_hints ()
{
  search_planner p (solr_settings ());

  vector<search_request> rs (
    p.hints ({project ("CMIP6")}, result_type::dataset, {"index_node"}));

  assert (rs.size () == 1);
  assert (*rs[0].params ().find ("facets") == "index_node");

  try
  {
    p.hints ({project ("CMIP6")}, result_type::dataset, {});
    assert (false);
  }
  catch (const catalog_error&)
  {
  }

  // Unstable facets are refused before anything is sent.
  //
  try
  {
    p.hints ({project ("CMIP6")}, result_type::dataset, {"instance_id"});
    assert (false);
  }
  catch (const unstable_query_error&)
  {
  }
}

static void
test_search ()
{
  search_planner p (solr_settings ());

  vector<search_request> rs (
    p.search ({project ("CMIP6"), project ("CORDEX")},
              result_type::file,
              {120, 30},
              0,
              100,
              {"*"}));

  assert (rs.size () == 3);
  check_request (rs[0], 0, 0, 50);
  check_request (rs[1], 0, 50, 30);
  check_request (rs[2], 1, 0, 20);

  assert (*rs[1].params ().find ("offset") == "50");
  assert (*rs[1].params ().find ("fields") == "*");

  assert ((p.number_of_requests ({120, 30}, 0, 100) ==
           vector<size_t> {2, 1}));

  // Offset without cap.
  //
  rs = p.search ({project ("A"), project ("B")},
                 result_type::dataset, {10, 5}, 3, nullopt, {});

  assert (rs.size () == 2);
  check_request (rs[0], 0, 2, 8);
  check_request (rs[1], 1, 1, 4);

  try
  {
    p.search ({project ("A")}, result_type::file, {1, 2}, 0, nullopt, {});
    assert (false);
  }
  catch (const invalid_argument&)
  {
  }
}

static void
test_distributed ()
{
  search_planner p (solr_settings ());

  facet_counts h0 {{"index_node", {{"esgf.a.org", 20}, {"esgf.b.org", 10}}}};
  facet_counts h1; // No index_node counts: goes to the configured node.

  vector<search_request> rs (
    p.search_distributed ({project ("CMIP6"), project ("CORDEX")},
                          result_type::file,
                          {h0, h1},
                          0,
                          nullopt,
                          {}));

  assert (rs.size () == 2);

  assert (rs[0].endpoint () == "https://esgf.a.org/esg-search/search");
  check_request (rs[0], 0, 0, 20);
  assert (*rs[0].params ().find ("distrib") == "false");

  assert (rs[1].endpoint () == "https://esgf.b.org/esg-search/search");
  check_request (rs[1], 0, 0, 10);

  search_settings s (solr_settings ());
  s.backend = api_backend::stac;
  search_planner stac (s);

  try
  {
    stac.search_distributed ({project ("CMIP6")}, result_type::file,
                             {h0}, 0, nullopt, {});
    assert (false);
  }
  catch (const catalog_error&)
  {
  }
}

static void
test_stac ()
{
  search_settings s;
  s.index_node = "api.stac.test.org";
  s.backend = api_backend::stac;
  s.page_limit = 50;

  search_planner p (s);

  vector<search_request> hs (p.hits ({project ("CMIP6")}, result_type::file));
  assert (hs.size () == 1);
  assert (hs[0].backend () == api_backend::stac);
  assert (hs[0].url () == "https://api.stac.test.org/search");
  assert (hs[0].body () && hs[0].body ()->at ("limit").to_number<uint64_t> () == 1);
  assert (hs[0].http ().method == http_method::post);

  // One request per query, covering its whole window.
  //
  vector<search_request> rs (
    p.search ({project ("CMIP6"), project ("CORDEX")},
              result_type::file, {120, 0}, 0, 100, {}));

  assert (rs.size () == 1);
  check_request (rs[0], 0, 0, 100);
  assert (rs[0].body ()->at ("limit").to_number<uint64_t> () == 50);

  assert ((p.number_of_requests ({120, 0}, 0, 100) ==
           vector<size_t> {1, 0}));

  try
  {
    p.hints ({project ("CMIP6")}, result_type::file, {"variable"});
    assert (false);
  }
  catch (const catalog_error&)
  {
  }

  // A STAC query must name a project.
  //
  try
  {
    p.hits ({flat_query ()}, result_type::file);
    assert (false);
  }
  catch (const catalog_error&)
  {
  }
}

int
main ()
{
  test_hits ();
  test_hints ();
  test_search ();
  test_distributed ();
  test_stac ();
}
