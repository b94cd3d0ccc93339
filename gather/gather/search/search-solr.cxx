#include <gather/search/search-solr.hxx>

using namespace std;

namespace gather
{
  namespace json = boost::json;

  bool
  solr_unstable_facet (const string& f)
  {
    return f == "instance_id" ||
           f == "dataset_id"  ||
           f == "master_id"   ||
           f == "tracking_id" ||
           f == "url";
  }

  string
  solr_filter (const flat_query& q)
  {
    string r;

    auto append = [&r] (const string& term)
    {
      if (!r.empty ())
        r += " AND ";

      r += term;
    };

    for (const facet_selection& f: q.selection)
    {
      if (f.values.empty ())
        continue;

      if (f.name == "query")
      {
        for (const string& v: f.values)
          append (v);

        continue;
      }

      bool neg (!f.name.empty () && f.name[0] == '!');
      string t (neg ? "-" + f.name.substr (1) : f.name);

      t += ':';

      if (f.values.size () == 1)
        t += f.values[0];
      else
      {
        t += '(';
        for (size_t i (0); i != f.values.size (); ++i)
        {
          if (i != 0)
            t += ' ';
          t += f.values[i];
        }
        t += ')';
      }

      append (t);
    }

    return r;
  }

  static const char*
  to_param (bool v)
  {
    return v ? "true" : "false";
  }

  static string
  join (const vector<string>& v)
  {
    string r;
    for (const string& s: v)
    {
      if (!r.empty ())
        r += ',';
      r += s;
    }
    return r;
  }

  http_query
  solr_params (const flat_query& q,
               result_type t,
               uint64_t offset,
               uint64_t limit,
               const vector<string>& fields,
               const vector<string>& facets)
  {
    const query_options& o (q.options);

    if (!facets.empty ())
    {
      for (const string& f: facets)
      {
        if (solr_unstable_facet (f))
          throw unstable_query_error ("facet counts for '" + f +
                                      "' are not stable across requests");

        if (f == "*" && o.distrib && *o.distrib)
          throw unstable_query_error (
            "counting all facets is not stable on a distributed search");
      }
    }

    http_query r;

    r.add ("type", gather::to_string (t));
    r.add ("offset", std::to_string (offset));
    r.add ("limit", std::to_string (limit));
    r.add ("format", "application/solr+json");
    r.add ("fields", fields.empty () ? string ("instance_id") : join (fields));

    if (!facets.empty ())
      r.add ("facets", join (facets));

    if (o.distrib)   r.add ("distrib",   to_param (*o.distrib));
    if (o.latest)    r.add ("latest",    to_param (*o.latest));
    if (o.replica)   r.add ("replica",   to_param (*o.replica));
    if (o.retracted) r.add ("retracted", to_param (*o.retracted));
    if (o.date_from) r.add ("from",      *o.date_from);
    if (o.date_to)   r.add ("to",        *o.date_to);

    string f (solr_filter (q));
    if (!f.empty ())
      r.add ("query", move (f));

    return r;
  }

  static const json::object&
  response_of (const json::object& o)
  {
    const json::value* r (o.if_contains ("response"));

    if (r == nullptr || !r->is_object ())
      throw catalog_error ("catalog response has no 'response' object");

    return r->get_object ();
  }

  uint64_t
  solr_hits (const json::object& o)
  {
    const json::value* n (response_of (o).if_contains ("numFound"));

    if (n != nullptr)
    {
      if (n->is_uint64 ())
        return n->get_uint64 ();

      if (n->is_int64 () && n->get_int64 () >= 0)
        return static_cast<uint64_t> (n->get_int64 ());
    }

    throw catalog_error ("catalog response has no valid 'numFound'");
  }

  const json::array&
  solr_docs (const json::object& o)
  {
    const json::value* d (response_of (o).if_contains ("docs"));

    if (d == nullptr || !d->is_array ())
      throw catalog_error ("catalog response has no 'docs' array");

    return d->get_array ();
  }

  facet_counts
  solr_facets (const json::object& o)
  {
    facet_counts r;

    const json::value* fc (o.if_contains ("facet_counts"));
    if (fc == nullptr || !fc->is_object ())
      return r;

    const json::value* ff (fc->get_object ().if_contains ("facet_fields"));
    if (ff == nullptr || !ff->is_object ())
      return r;

    for (const auto& kv: ff->get_object ())
    {
      if (!kv.value ().is_array ())
        throw catalog_error ("facet '" + string (kv.key ()) +
                             "' counts are not a list");

      const json::array& a (kv.value ().get_array ());
      map<string, uint64_t>& m (r[string (kv.key ())]);

      for (size_t i (0); i + 1 < a.size (); i += 2)
      {
        if (!a[i].is_string ())
          throw catalog_error ("facet '" + string (kv.key ()) +
                               "' value is not a string");

        boost::system::error_code ec;
        uint64_t n (a[i + 1].to_number<uint64_t> (ec));

        if (ec)
          throw catalog_error ("facet '" + string (kv.key ()) +
                               "' count is not a number");

        m[string (a[i].get_string ())] = n;
      }
    }

    return r;
  }
}
