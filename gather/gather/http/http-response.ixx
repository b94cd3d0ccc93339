#include <cctype>
#include <charconv>

namespace gather
{
  template <typename S, typename B>
  inline std::optional<std::uint64_t> basic_http_response<S, B>::
  content_length () const
  {
    auto cl (get_header (string_type ("Content-Length")));

    if (!cl || cl->empty ())
      return std::nullopt;

    std::uint64_t n (0);
    auto r (std::from_chars (cl->data (), cl->data () + cl->size (), n));

    if (r.ec != std::errc () || r.ptr != cl->data () + cl->size ())
      return std::nullopt;

    return n;
  }

  template <typename S, typename B>
  inline bool basic_http_response<S, B>::
  accepts_ranges () const
  {
    auto v (get_header (string_type ("Accept-Ranges")));

    if (!v)
      return false;

    string_type s;
    for (char c: *v)
      if (!std::isspace (static_cast<unsigned char> (c)))
        s += static_cast<char> (std::tolower (static_cast<unsigned char> (c)));

    return s == "bytes";
  }
}
