#include <gather/search/search-request.hxx>

#include <gather/http/http-json.hxx>

using namespace std;

namespace gather
{
  string search_request::
  filter () const
  {
    if (backend_ == api_backend::solr)
    {
      const string* q (params_.find ("query"));
      return q != nullptr ? *q : string ();
    }

    const boost::json::value* f (body_->if_contains ("filter"));
    return f != nullptr ? boost::json::serialize (*f) : string ();
  }

  string search_request::
  url () const
  {
    return backend_ == api_backend::solr
      ? params_.apply (endpoint_)
      : endpoint_ + "/search";
  }

  http_request search_request::
  http () const
  {
    if (backend_ == api_backend::stac)
      return make_json_request (http_method::post, url (), *body_);

    http_request r (http_method::get, url ());
    r.set_header ("Accept", "application/json");
    r.normalize ();
    return r;
  }
}
