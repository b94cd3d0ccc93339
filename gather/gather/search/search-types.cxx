#include <gather/search/search-types.hxx>

#include <gather/http/http-url.hxx>

using namespace std;

namespace gather
{
  string
  to_string (result_type t)
  {
    switch (t)
    {
    case result_type::dataset: return "Dataset";
    case result_type::file:    return "File";
    }
    return "Dataset";
  }

  string
  to_string (api_backend b)
  {
    switch (b)
    {
    case api_backend::solr: return "solr";
    case api_backend::stac: return "stac";
    }
    return "solr";
  }

  api_backend
  to_api_backend (const string& s)
  {
    if (s == "solr") return api_backend::solr;
    if (s == "stac") return api_backend::stac;

    throw invalid_argument ("invalid catalog backend '" + s + "'");
  }

  bool index_node::
  bridge () const
  {
    return backend_ == api_backend::solr &&
           value_.find ("esgf-1-5-bridge") != string::npos;
  }

  string index_node::
  url () const
  {
    string r;

    if (value_.find ("://") != string::npos)
      r = value_;
    else if (backend_ == api_backend::solr && !bridge ())
      r = "https://" + value_ + "/esg-search/search";
    else
      r = "https://" + value_;

    // Also validates the URL shape.
    //
    if (parse_url (r).host.find ('.') == string::npos)
      throw invalid_argument ("invalid index node '" + value_ + "'");

    return r;
  }

  flat_query& flat_query::
  add (const string& name, vector<string> values)
  {
    for (facet_selection& f: selection)
    {
      if (f.name == name)
      {
        for (string& v: values)
          f.values.push_back (move (v));

        return *this;
      }
    }

    selection.push_back (facet_selection {name, move (values)});
    return *this;
  }

  const facet_selection* flat_query::
  find (const string& name) const
  {
    for (const facet_selection& f: selection)
      if (f.name == name)
        return &f;

    return nullptr;
  }

  ostream&
  operator<< (ostream& o, const flat_query& q)
  {
    o << '{';

    bool first (true);
    for (const facet_selection& f: q.selection)
    {
      if (!first)
        o << ", ";

      first = false;
      o << f.name << ':';

      if (f.values.size () == 1)
        o << f.values[0];
      else
      {
        o << '[';
        for (size_t i (0); i < f.values.size (); ++i)
          o << (i != 0 ? "," : "") << f.values[i];
        o << ']';
      }
    }

    if (q.options.distrib)
      o << (first ? "" : ", ") << "distrib:"
        << (*q.options.distrib ? "true" : "false");

    return o << '}';
  }

  uint64_t
  hits_from_hints (const facet_counts& h)
  {
    if (h.empty ())
      return 0;

    uint64_t n (0);
    for (const auto& vc: h.begin ()->second)
      n += vc.second;

    return n;
  }
}
