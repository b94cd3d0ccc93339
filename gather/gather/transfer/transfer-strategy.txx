#include <optional>

#include <gather/gather-diagnostics.hxx>
#include <gather/http/http-types.hxx>
#include <gather/transfer/transfer-chunk.hxx>
#include <gather/transfer/transfer-error.hxx>

namespace gather
{
  template <typename C>
  boost::asio::awaitable<void> whole_transfer::
  acquire (C& c, transfer_context& x) const
  {
    partial_artifact& a (x.artifact);

    // Nothing left to ask for (and an empty range would not be
    // satisfiable).
    //
    if (a.size () != 0 && a.size () == a.expected ())
      co_return;

    std::optional<std::uint64_t> resume;
    if (a.size () != 0)
      resume = a.size ();

    x.sources = {x.file.url};

    co_await c.download (
      x.file.url,
      [&a, resume] (const typename C::response_type& r)
      {
        if (resume && r.status == http_status::ok)
        {
          info () << "server ignored range request, restarting "
                  << a.path ();
          a.restart ();
        }
      },
      [&x] (const char* d, std::size_t n)
      {
        x.write (d, n);
      },
      resume);
  }

  template <typename C>
  boost::asio::awaitable<void> chunked_transfer::
  acquire (C& c, transfer_context& x) const
  {
    const file_record& f (x.file);

    x.sources = {f.url};

    for (const chunk& k: plan_chunks (f.size, chunk_size, x.artifact.size ()))
    {
      auto r (co_await c.get_range (f.url, k.first, k.last));

      if (r.status != http_status::partial_content)
        throw transport_error (f.url + ": expected partial content for bytes " +
                               std::to_string (k.first) + '-' +
                               std::to_string (k.last) + ", got status " +
                               std::to_string (r.status_code ()));

      if (!r.body || r.body->size () != k.size ())
        throw transport_error (f.url + ": short range for bytes " +
                               std::to_string (k.first) + '-' +
                               std::to_string (k.last));

      x.write (r.body->data (), r.body->size ());
    }
  }

  template <typename C>
  boost::asio::awaitable<void> multi_source_transfer::
  acquire (C& c, transfer_context& x) const
  {
    const file_record& f (x.file);

    std::vector<file_record> ms;
    if (x.lookup)
      ms = co_await x.lookup (f);

    std::vector<std::string> cs (candidate_sources (f, ms));

    info () << f.file_id << ": probing " << cs.size () << " source(s)";

    x.sources = co_await probe_sources (c, cs, f.size, probe_timeout);

    std::vector<chunk> plan (plan_chunks (f.size, chunk_size, x.artifact.size ()));

    if (plan.empty ())
      co_return;

    chunk_queue q (plan);
    chunk_assembler as ([&x] (const char* d, std::size_t n) {x.write (d, n);},
                        plan.front ().index,
                        plan.size ());

    co_await fetch_chunks (c, x.sources, q, as);
  }
}
