#include <gather/search/search-stac.hxx>

#include <cassert>

using namespace std;
using namespace gather;

namespace json = boost::json;

static json::object
parse (const char* s)
{
  return json::parse (s).as_object ();
}

static void
check_json (const json::value& v, const char* expected)
{
  if (v != json::parse (expected))
    assert (false);
}

static void
test_filter ()
{
  flat_query q;

  try
  {
    stac_collections (q);
    assert (false);
  }
  catch (const catalog_error&)
  {
  }

  q.add ("project", {"CMIP6"});
  assert (stac_filter (q).empty ());

  // Single facet, single value: no and/or wrapping.
  //
  q.add ("variable_id", {"tas"});

  check_json (stac_filter (q), R"({
    "op": "=",
    "args": [{"property": "properties.cmip6:variable_id"}, "tas"]})");

  q.add ("variable_id", {"pr*"});
  q.add ("!experiment_id", {"historical"});

  check_json (stac_filter (q), R"({
    "op": "and",
    "args": [
      {"op": "or", "args": [
        {"op": "=",
         "args": [{"property": "properties.cmip6:variable_id"}, "tas"]},
        {"op": "like",
         "args": [{"property": "properties.cmip6:variable_id"}, "pr%"]}]},
      {"op": "not", "args": [
        {"op": "=",
         "args": [{"property": "properties.cmip6:experiment_id"},
                  "historical"]}]}]})");
}

static void
test_body ()
{
  flat_query q;
  q.add ("project", {"CMIP6"});

  check_json (stac_body (q, 10), R"({"collections": ["CMIP6"], "limit": 10})");

  q.add ("source_id", {"IPSL-CM6A-LR"});

  check_json (stac_body (q, 1), R"({
    "collections": ["CMIP6"],
    "filter-lang": "cql2-json",
    "filter": {"op": "=", "args": [
      {"property": "properties.cmip6:source_id"}, "IPSL-CM6A-LR"]},
    "limit": 1})");
}

static void
test_page ()
{
  assert (stac_hits (parse (R"({"numMatched": 12})")) == 12);
  assert (stac_hits (parse (R"({"context": {"matched": 4}})")) == 4);

  try
  {
    stac_hits (parse (R"({"features": []})"));
    assert (false);
  }
  catch (const catalog_error&)
  {
  }

  assert (stac_features (parse (R"({"features": [{}, {}]})")).size () == 2);

  json::object body (parse (R"({"collections": ["CMIP6"], "limit": 2})"));
  json::object next;

  // Last page.
  //
  assert (!stac_next (parse (R"({"links": [{"rel": "self",
                                            "href": "https://s.org"}]})"),
                      body, next));

  // Cursor as a plain link.
  //
  {
    optional<http_request> r (
      stac_next (parse (R"({"links": [{"rel": "next",
                                       "href": "https://s.org/search?t=x"}]})"),
                 body, next));

    assert (r && r->method == http_method::get);
    assert (r->url == "https://s.org/search?t=x");
  }

  // Cursor as a POST body merged into the previous one.
  //
  {
    optional<http_request> r (
      stac_next (parse (R"({"links": [{"rel": "next", "method": "POST",
                                       "href": "https://s.org/search",
                                       "merge": true,
                                       "body": {"token": "n:2"}}]})"),
                 body, next));

    assert (r && r->method == http_method::post);
    assert (r->body);

    check_json (next, R"({"collections": ["CMIP6"], "limit": 2,
                          "token": "n:2"})");
    check_json (json::parse (*r->body), R"({"collections": ["CMIP6"],
                                            "limit": 2, "token": "n:2"})");
  }
}

static const char* item = R"({
  "id": "CMIP6.CMIP.IPSL.IPSL-CM6A-LR.historical.r1i1p1f1.day.tas.gr.v20180803",
  "properties": {"cmip6:data_node": "esgf.ceda.ac.uk"},
  "assets": {
    "data0000": {
      "type": "application/netcdf",
      "alternate": {
        "ceda": {
          "type": "application/netcdf",
          "href": "https://dap.ceda.ac.uk/x/tas_day_1850.nc",
          "alternate:name": "esgf.ceda.ac.uk",
          "file:size": 100,
          "file:checksum": "1220abcd"},
        "dkrz": {
          "type": "application/netcdf",
          "href": "https://esgf.dkrz.de/x/tas_day_1850.nc",
          "alternate:name": "esgf.dkrz.de",
          "file:size": 100,
          "file:checksum": "1220abcd"}}},
    "data0001": {
      "type": "application/netcdf",
      "href": "https://dap.ceda.ac.uk/x/tas_day_1900.nc",
      "alternate:name": "esgf.ceda.ac.uk",
      "file:size": 50,
      "file:checksum": "1220ef01"},
    "opendap": {
      "type": "application/netcdf",
      "href": "dap4://dap.ceda.ac.uk/x/tas_day_1900.nc",
      "alternate:name": "esgf.ceda.ac.uk",
      "file:size": 50,
      "file:checksum": "1220ef01"},
    "thumbnail": {"type": "image/png", "href": "https://x/t.png"}}})";

static void
test_records ()
{
  json::object it (parse (item));

  vector<file_record> fs (stac_files (it));
  assert (fs.size () == 2);

  const file_record& f (fs[0]);
  assert (f.url == "https://dap.ceda.ac.uk/x/tas_day_1850.nc");
  assert (f.filename == "tas_day_1850.nc");
  assert (f.version == "v20180803");
  assert (f.data_node == "esgf.ceda.ac.uk");
  assert (f.size == 100);
  assert (f.checksum_type == "MULTIHASH");
  assert (f.local_path ==
          "CMIP6/CMIP/IPSL/IPSL-CM6A-LR/historical/r1i1p1f1/day/tas/gr/"
          "v20180803");
  assert (f.file_id == f.dataset_id + ".tas_day_1850.nc");

  assert (fs[1].size == 50);

  dataset_record d (stac_dataset (it));
  assert (d.version == "v20180803");
  assert (d.data_node == "esgf.ceda.ac.uk");
  assert (d.number_of_files == 3);
  assert (d.size == 200);

  // No version segment.
  //
  dataset_record n (stac_dataset (parse (R"({"id": "plain",
                                             "properties": {},
                                             "assets": {}})")));
  assert (n.version == "1");
  assert (n.data_node == "unknown");

  try
  {
    stac_files (parse (R"({"id": "x.v1"})"));
    assert (false);
  }
  catch (const invalid_metadata&)
  {
  }
}

int
main ()
{
  test_filter ();
  test_body ();
  test_page ();
  test_records ();
}
