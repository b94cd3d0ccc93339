#include <gather/http/http-url.hxx>

#include <cctype>
#include <stdexcept>

using namespace std;

namespace gather
{
  string url_parts::
  authority () const
  {
    return scheme + "://" + host + ':' + port;
  }

  url_parts
  parse_url (const string& url)
  {
    url_parts r;
    size_t pos (0);

    size_t p (url.find ("://"));
    if (p != string::npos)
    {
      r.scheme = url.substr (0, p);
      for (char& c: r.scheme)
        c = static_cast<char> (tolower (static_cast<unsigned char> (c)));

      pos = p + 3;
    }
    else
      r.scheme = "http";

    // The authority ends at the start of the path or query.
    //
    size_t end (url.find_first_of ("/?#", pos));
    if (end == string::npos)
      end = url.size ();

    string auth (url.substr (pos, end - pos));
    size_t colon (auth.rfind (':'));

    if (colon != string::npos)
    {
      r.host = auth.substr (0, colon);
      r.port = auth.substr (colon + 1);
    }
    else
    {
      r.host = move (auth);
      r.port = r.secure () ? "443" : "80";
    }

    if (r.host.empty ())
      throw invalid_argument ("invalid URL '" + url + "': no host");

    if (end < url.size ())
    {
      r.target = url.substr (end);

      if (r.target[0] != '/')
        r.target.insert (0, 1, '/');
    }
    else
      r.target = "/";

    return r;
  }

  string
  url_encode (const string& s)
  {
    static const char hex[] = "0123456789ABCDEF";

    string r;
    r.reserve (s.size ());

    for (unsigned char c: s)
    {
      if (isalnum (c) || c == '-' || c == '_' || c == '.' || c == '~')
        r += static_cast<char> (c);
      else
      {
        r += '%';
        r += hex[c >> 4];
        r += hex[c & 0x0F];
      }
    }

    return r;
  }

  string
  url_decode (const string& s)
  {
    auto digit = [] (char c) -> int
    {
      if (c >= '0' && c <= '9') return c - '0';
      if (c >= 'a' && c <= 'f') return c - 'a' + 10;
      if (c >= 'A' && c <= 'F') return c - 'A' + 10;
      return -1;
    };

    string r;
    r.reserve (s.size ());

    for (size_t i (0); i < s.size (); ++i)
    {
      char c (s[i]);

      if (c == '%' && i + 2 < s.size ())
      {
        int h (digit (s[i + 1])), l (digit (s[i + 2]));

        if (h >= 0 && l >= 0)
        {
          r += static_cast<char> (h * 16 + l);
          i += 2;
          continue;
        }
      }

      r += (c == '+' ? ' ' : c);
    }

    return r;
  }

  const string* http_query::
  find (const std::string& name) const
  {
    for (const auto& p: params_)
      if (p.first == name)
        return &p.second;

    return nullptr;
  }

  string http_query::
  string () const
  {
    std::string r;

    for (const auto& p: params_)
    {
      if (!r.empty ())
        r += '&';

      r += url_encode (p.first);
      r += '=';
      r += url_encode (p.second);
    }

    return r;
  }

  string http_query::
  apply (const std::string& url) const
  {
    if (params_.empty ())
      return url;

    return url + (url.find ('?') == std::string::npos ? '?' : '&') + string ();
  }
}
