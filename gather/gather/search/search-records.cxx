#include <gather/search/search-records.hxx>

#include <utility>
#include <vector>

using namespace std;

namespace gather
{
  namespace json = boost::json;

  string
  strip_authority (const string& id)
  {
    return id.substr (0, id.find ('|'));
  }

  pair<string, string>
  split_version (const string& dataset_id)
  {
    size_t p (dataset_id.rfind ('.'));

    if (p == string::npos || p == 0 || p + 1 == dataset_id.size ())
      throw invalid_metadata ("dataset id '" + dataset_id +
                              "' has no version segment");

    return make_pair (dataset_id.substr (0, p), dataset_id.substr (p + 1));
  }

  // First scalar of a possibly array-wrapped value.
  //
  static const json::value&
  first_of (const json::value& v, const char* name)
  {
    if (v.is_array ())
    {
      const json::array& a (v.get_array ());

      if (a.empty ())
        throw invalid_metadata (string ("field '") + name + "' is empty");

      return first_of (a.front (), name);
    }

    return v;
  }

  string
  find_str (const json::object& o, const char* name)
  {
    const json::value* v (o.if_contains (name));

    if (v == nullptr)
      throw invalid_metadata (string ("missing field '") + name + '\'');

    const json::value& s (first_of (*v, name));

    if (!s.is_string ())
      throw invalid_metadata (string ("field '") + name + "' is not a string");

    return string (s.get_string ());
  }

  uint64_t
  find_int (const json::object& o, const char* name)
  {
    const json::value* v (o.if_contains (name));

    if (v == nullptr)
      throw invalid_metadata (string ("missing field '") + name + '\'');

    const json::value& n (first_of (*v, name));

    if (n.is_uint64 ())
      return n.get_uint64 ();

    if (n.is_int64 () && n.get_int64 () >= 0)
      return static_cast<uint64_t> (n.get_int64 ());

    throw invalid_metadata (string ("field '") + name +
                            "' is not a non-negative integer");
  }

  // Value of a document field as a string for template substitution.
  //
  static string
  template_value (const json::object& doc, const string& name)
  {
    const json::value* v (doc.if_contains (name));

    if (v == nullptr)
      throw invalid_metadata ("path template field '" + name +
                              "' missing from document");

    const json::value& s (first_of (*v, name.c_str ()));

    if (s.is_string ())
      return string (s.get_string ());

    if (s.is_int64 ())
      return std::to_string (s.get_int64 ());

    if (s.is_uint64 ())
      return std::to_string (s.get_uint64 ());

    throw invalid_metadata ("path template field '" + name +
                            "' is not a scalar");
  }

  string
  local_path_of (const json::object& doc,
                 const string& dataset_id,
                 const string& version)
  {
    if (!doc.contains ("directory_format_template_"))
    {
      string r (dataset_id);
      for (char& c: r)
        if (c == '.')
          c = '/';
      return r;
    }

    string t (find_str (doc, "directory_format_template_"));

    const string root ("%(root)s/");
    if (t.compare (0, root.size (), root) == 0)
      t.erase (0, root.size ());

    string r;

    for (size_t i (0); i < t.size ();)
    {
      if (t.compare (i, 2, "%(") != 0)
      {
        r += t[i++];
        continue;
      }

      size_t e (t.find (")s", i + 2));
      if (e == string::npos)
        throw invalid_metadata ("malformed path template '" + t + '\'');

      string name (t.substr (i + 2, e - i - 2));

      if (name == "version")
        r += version;
      else if (name == "rcm_model" && doc.contains ("rcm_name"))
      {
        // CORDEX names the model after the institute and the RCM.
        //
        r += template_value (doc, "institute");
        r += '-';
        r += template_value (doc, "rcm_name");
      }
      else
        r += template_value (doc, name);

      i = e + 2;
    }

    return r;
  }

  // Pick the HTTP download endpoint out of the url field. Each entry has the
  // <url>|<mime>|<service> form; prefer the HTTPServer service.
  //
  static string
  http_url_of (const json::object& doc)
  {
    const json::value* v (doc.if_contains ("url"));

    if (v != nullptr && v->is_array ())
    {
      for (const json::value& e: v->get_array ())
      {
        if (!e.is_string ())
          continue;

        string s (e.get_string ());

        if (s.size () > 11 &&
            s.compare (s.size () - 11, 11, "|HTTPServer") == 0)
          return s.substr (0, s.find ('|'));
      }
    }

    return strip_authority (find_str (doc, "url"));
  }

  file_record
  file_from_solr (const json::object& doc)
  {
    file_record r;

    r.dataset_id = strip_authority (find_str (doc, "dataset_id"));
    r.filename = find_str (doc, "title");
    r.url = http_url_of (doc);
    r.data_node = find_str (doc, "data_node");
    r.checksum = find_str (doc, "checksum");
    r.checksum_type = find_str (doc, "checksum_type");
    r.size = find_int (doc, "size");

    pair<string, string> mv (split_version (r.dataset_id));

    r.file_id = r.dataset_id + '.' + r.filename;
    r.master_id = mv.first + '.' + r.filename;
    r.version = mv.second;
    r.local_path = local_path_of (doc, r.dataset_id, r.version);

    return r;
  }

  dataset_record
  dataset_from_solr (const json::object& doc)
  {
    dataset_record r;

    r.dataset_id = strip_authority (find_str (doc, "instance_id"));

    pair<string, string> mv (split_version (r.dataset_id));
    r.master_id = move (mv.first);
    r.version = move (mv.second);

    r.data_node = find_str (doc, "data_node");
    r.size = find_int (doc, "size");
    r.number_of_files = find_int (doc, "number_of_files");

    return r;
  }
}
