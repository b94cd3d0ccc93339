#include <gather/search/search-stac.hxx>

#include <cctype>
#include <sstream>
#include <utility>

#include <gather/http/http-json.hxx>

using namespace std;

namespace gather
{
  namespace json = boost::json;

  vector<string>
  stac_collections (const flat_query& q)
  {
    const facet_selection* p (q.find ("project"));

    if (p == nullptr || p->values.empty ())
    {
      ostringstream os;
      os << "query " << q << " does not select a project";
      throw catalog_error (os.str ());
    }

    return p->values;
  }

  static json::object
  compare (string name, const string& value, const string& prefix)
  {
    bool neg (!name.empty () && name[0] == '!');

    if (neg)
      name.erase (0, 1);

    json::object prop {{"property", "properties." + prefix + ':' + name}};
    json::object r;

    if (value.find ('*') != string::npos)
    {
      string v (value);
      for (char& c: v)
        if (c == '*')
          c = '%';

      r = json::object {{"op", "like"}, {"args", json::array {prop, v}}};
    }
    else
      r = json::object {{"op", "="}, {"args", json::array {prop, value}}};

    if (neg)
      r = json::object {{"op", "not"}, {"args", json::array {move (r)}}};

    return r;
  }

  // Combine the operands with op, leaving a single operand as is.
  //
  static json::object
  combine (vector<json::object> v, const char* op)
  {
    if (v.empty ())
      return json::object ();

    if (v.size () == 1)
      return move (v.front ());

    json::array args;
    for (json::object& o: v)
      args.emplace_back (move (o));

    return json::object {{"op", op}, {"args", move (args)}};
  }

  json::object
  stac_filter (const flat_query& q)
  {
    vector<json::object> projects;

    for (const string& p: stac_collections (q))
    {
      string prefix (p);
      for (char& c: prefix)
        c = static_cast<char> (tolower (static_cast<unsigned char> (c)));

      vector<json::object> facets;

      for (const facet_selection& f: q.selection)
      {
        if (f.name == "project")
          continue;

        vector<json::object> values;
        for (const string& v: f.values)
          values.push_back (compare (f.name, v, prefix));

        json::object o (combine (move (values), "or"));
        if (!o.empty ())
          facets.push_back (move (o));
      }

      json::object o (combine (move (facets), "and"));
      if (!o.empty ())
        projects.push_back (move (o));
    }

    return combine (move (projects), "or");
  }

  json::object
  stac_body (const flat_query& q, uint64_t limit)
  {
    json::array cs;
    for (const string& c: stac_collections (q))
      cs.emplace_back (c);

    json::object r;
    r["collections"] = move (cs);

    json::object f (stac_filter (q));
    if (!f.empty ())
    {
      r["filter-lang"] = "cql2-json";
      r["filter"] = move (f);
    }

    r["limit"] = limit;
    return r;
  }

  static optional<uint64_t>
  count_of (const json::value* v)
  {
    if (v != nullptr)
    {
      if (v->is_uint64 ())
        return v->get_uint64 ();

      if (v->is_int64 () && v->get_int64 () >= 0)
        return static_cast<uint64_t> (v->get_int64 ());
    }

    return nullopt;
  }

  uint64_t
  stac_hits (const json::object& page)
  {
    if (optional<uint64_t> n = count_of (page.if_contains ("numMatched")))
      return *n;

    if (const json::value* c = page.if_contains ("context"))
    {
      if (c->is_object ())
        if (optional<uint64_t> n = count_of (c->get_object ().if_contains ("matched")))
          return *n;
    }

    throw catalog_error ("catalog did not report the number of matches");
  }

  const json::array&
  stac_features (const json::object& page)
  {
    const json::value* f (page.if_contains ("features"));

    if (f == nullptr || !f->is_array ())
      throw catalog_error ("catalog response has no 'features' array");

    return f->get_array ();
  }

  optional<http_request>
  stac_next (const json::object& page,
             const json::object& body,
             json::object& next_body)
  {
    const json::value* ls (page.if_contains ("links"));

    if (ls == nullptr || !ls->is_array ())
      return nullopt;

    for (const json::value& l: ls->get_array ())
    {
      if (!l.is_object ())
        continue;

      const json::object& o (l.get_object ());
      const json::value* rel (o.if_contains ("rel"));
      const json::value* href (o.if_contains ("href"));

      if (rel == nullptr || !rel->is_string () || rel->get_string () != "next" ||
          href == nullptr || !href->is_string ())
        continue;

      string url (href->get_string ());

      const json::value* m (o.if_contains ("method"));
      bool post (m != nullptr && m->is_string () && m->get_string () == "POST");

      if (!post)
        return http_request (http_method::get, url);

      const json::value* b (o.if_contains ("body"));
      const json::value* mg (o.if_contains ("merge"));
      bool merge (mg != nullptr && mg->is_bool () && mg->get_bool ());

      next_body = merge ? body : json::object ();

      if (b != nullptr && b->is_object ())
        for (const auto& kv: b->get_object ())
          next_body[kv.key ()] = kv.value ();

      return make_json_request (http_method::post, url, next_body);
    }

    return nullopt;
  }

  // Asset to use: the first alternate if the asset has any.
  //
  static const json::object&
  asset_of (const json::value& v)
  {
    if (!v.is_object ())
      throw invalid_metadata ("item asset is not an object");

    const json::object& a (v.get_object ());
    const json::value* alt (a.if_contains ("alternate"));

    if (alt != nullptr && alt->is_object () && !alt->get_object ().empty ())
    {
      const json::value& f (alt->get_object ().begin ()->value ());

      if (!f.is_object ())
        throw invalid_metadata ("item asset alternate is not an object");

      return f.get_object ();
    }

    return a;
  }

  static bool
  netcdf (const json::object& a)
  {
    const json::value* t (a.if_contains ("type"));
    return t != nullptr && t->is_string () &&
           t->get_string () == "application/netcdf";
  }

  static const json::object&
  properties_of (const json::object& item)
  {
    const json::value* p (item.if_contains ("properties"));

    if (p == nullptr || !p->is_object ())
      throw invalid_metadata ("item has no properties");

    return p->get_object ();
  }

  static const json::object&
  assets_of (const json::object& item)
  {
    const json::value* a (item.if_contains ("assets"));

    if (a == nullptr || !a->is_object ())
      throw invalid_metadata ("item has no assets");

    return a->get_object ();
  }

  static string
  dataset_id_of (const json::object& item)
  {
    const json::object& p (properties_of (item));

    return p.contains ("cmip6:dataset_id")
      ? find_str (p, "cmip6:dataset_id")
      : find_str (item, "id");
  }

  // Split at the last dot, version 1 if there is none.
  //
  static pair<string, string>
  master_version (const string& id)
  {
    size_t p (id.rfind ('.'));

    return p == string::npos
      ? make_pair (id, string ("1"))
      : make_pair (id.substr (0, p), id.substr (p + 1));
  }

  vector<file_record>
  stac_files (const json::object& item)
  {
    string dataset_id (dataset_id_of (item));
    pair<string, string> mv (master_version (dataset_id));

    string local_path (dataset_id);
    for (char& c: local_path)
      if (c == '.')
        c = '/';

    vector<file_record> r;

    for (const auto& kv: assets_of (item))
    {
      const json::object& a (asset_of (kv.value ()));

      if (!netcdf (a))
        continue;

      string url (find_str (a, "href"));

      if (url.compare (0, 4, "http") != 0)
        continue;

      file_record f;

      f.url = url;
      f.filename = url.substr (url.rfind ('/') + 1);
      f.dataset_id = dataset_id;
      f.file_id = dataset_id + '.' + f.filename;
      f.master_id = mv.first + '.' + f.filename;
      f.version = mv.second;
      f.local_path = local_path;
      f.data_node = find_str (a, "alternate:name");
      f.size = find_int (a, "file:size");
      f.checksum = find_str (a, "file:checksum");
      f.checksum_type = "MULTIHASH";

      r.push_back (move (f));
    }

    return r;
  }

  dataset_record
  stac_dataset (const json::object& item)
  {
    const json::object& p (properties_of (item));

    dataset_record r;

    r.dataset_id = dataset_id_of (item);

    pair<string, string> mv (master_version (r.dataset_id));
    r.master_id = move (mv.first);
    r.version = move (mv.second);

    r.data_node = p.contains ("cmip6:data_node")
      ? find_str (p, "cmip6:data_node")
      : string ("unknown");

    for (const auto& kv: assets_of (item))
    {
      const json::object& a (asset_of (kv.value ()));

      if (!netcdf (a))
        continue;

      if (a.contains ("file:size"))
        r.size += find_int (a, "file:size");

      ++r.number_of_files;
    }

    return r;
  }
}
