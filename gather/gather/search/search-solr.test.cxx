#include <gather/search/search-solr.hxx>

#include <cassert>

using namespace std;
using namespace gather;

namespace json = boost::json;

static void
check_param (const http_query& q, const string& n, const string& v)
{
  const string* p (q.find (n));

  if (p == nullptr || *p != v)
    assert (false);
}

static void
test_filter ()
{
  flat_query q;
  assert (solr_filter (q).empty ());

  q.add ("project", {"CMIP6"})
    .add ("variable", {"tas", "pr"})
    .add ("!experiment_id", {"historical"})
    .add ("frequency", {})
    .add ("query", {"tas_day*"});

  assert (solr_filter (q) ==
          "project:CMIP6 AND variable:(tas pr) AND "
          "-experiment_id:historical AND tas_day*");

  // Adding to a selected facet extends it.
  //
  q.add ("project", {"CORDEX"});
  assert (q.find ("project")->values.size () == 2);
  assert (solr_filter (q).compare (0, 23, "project:(CMIP6 CORDEX) ") == 0);
}

static void
test_params ()
{
  flat_query q;
  q.add ("project", {"CMIP6"});
  q.options.distrib = false;
  q.options.latest = true;
  q.options.date_from = "2020-01-01T00:00:00Z";

  http_query p (solr_params (q, result_type::file, 100, 50, {}));

  check_param (p, "type", "File");
  check_param (p, "offset", "100");
  check_param (p, "limit", "50");
  check_param (p, "format", "application/solr+json");
  check_param (p, "fields", "instance_id");
  check_param (p, "distrib", "false");
  check_param (p, "latest", "true");
  check_param (p, "from", "2020-01-01T00:00:00Z");
  check_param (p, "query", "project:CMIP6");

  assert (p.find ("facets") == nullptr);
  assert (p.find ("replica") == nullptr);
  assert (p.find ("to") == nullptr);

  http_query h (solr_params (q, result_type::dataset, 0, 0,
                             {"*"}, {"index_node", "variable"}));

  check_param (h, "type", "Dataset");
  check_param (h, "fields", "*");
  check_param (h, "facets", "index_node,variable");
}

static void
test_unstable ()
{
  assert (solr_unstable_facet ("instance_id"));
  assert (solr_unstable_facet ("tracking_id"));
  assert (!solr_unstable_facet ("variable"));

  flat_query q;

  try
  {
    solr_params (q, result_type::file, 0, 0, {}, {"dataset_id"});
    assert (false);
  }
  catch (const unstable_query_error&)
  {
  }

  // All facets is fine on a single node but not when distributed.
  //
  solr_params (q, result_type::file, 0, 0, {}, {"*"});

  q.options.distrib = true;

  try
  {
    solr_params (q, result_type::file, 0, 0, {}, {"*"});
    assert (false);
  }
  catch (const unstable_query_error&)
  {
  }
}

static void
test_response ()
{
  json::object o (json::parse (R"({
    "response": {"numFound": 3, "docs": [{"instance_id": "a"}]},
    "facet_counts": {"facet_fields": {
      "index_node": ["esgf.a.org", 2, "esgf.b.org", 1],
      "variable": []}}})").as_object ());

  assert (solr_hits (o) == 3);
  assert (solr_docs (o).size () == 1);

  facet_counts f (solr_facets (o));
  assert (f.size () == 2);
  assert (f["index_node"]["esgf.a.org"] == 2);
  assert (f["index_node"]["esgf.b.org"] == 1);
  assert (f["variable"].empty ());

  // Facets absent altogether is not an error.
  //
  assert (solr_facets (json::object ()).empty ());

  facet_counts one {{"index_node", {{"x", 5}, {"y", 7}}}};
  assert (hits_from_hints (one) == 12);
  assert (hits_from_hints (facet_counts ()) == 0);

  try
  {
    solr_hits (json::parse (R"({"response": {}})").as_object ());
    assert (false);
  }
  catch (const catalog_error&)
  {
  }

  try
  {
    solr_docs (json::parse (R"({"error": "x"})").as_object ());
    assert (false);
  }
  catch (const catalog_error&)
  {
  }

  try
  {
    solr_facets (json::parse (R"({"facet_counts": {"facet_fields":
                                  {"v": ["a", "b"]}}})").as_object ());
    assert (false);
  }
  catch (const catalog_error&)
  {
  }
}

static void
test_index_node ()
{
  assert (index_node ("esgf-node.ipsl.upmc.fr").url () ==
          "https://esgf-node.ipsl.upmc.fr/esg-search/search");

  assert (index_node ("esgf-1-5-bridge.llnl.gov").bridge ());
  assert (index_node ("esgf-1-5-bridge.llnl.gov").url () ==
          "https://esgf-1-5-bridge.llnl.gov");

  assert (index_node ("http://localhost.test:8080/search").url () ==
          "http://localhost.test:8080/search");

  assert (index_node ("api.stac.esgf.ceda.ac.uk", api_backend::stac).url () ==
          "https://api.stac.esgf.ceda.ac.uk");

  try
  {
    index_node ("localhost").url ();
    assert (false);
  }
  catch (const invalid_argument&)
  {
  }
}

int
main ()
{
  test_filter ();
  test_params ();
  test_unstable ();
  test_response ();
  test_index_node ();
}
