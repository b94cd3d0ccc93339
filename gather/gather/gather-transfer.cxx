#include <gather/gather-transfer.hxx>

#include <gather/gather-diagnostics.hxx>

using namespace std;

namespace gather
{
  static http_client_traits<>
  client_traits (const download_settings& s)
  {
    http_client_traits<> r;
    r.connect_timeout = s.http_timeout * 1000;
    r.request_timeout = s.http_timeout * 1000;
    return r;
  }

  transfer_coordinator::
  transfer_coordinator (asio::io_context& ioc, const settings& s)
      : client_ (ioc, client_traits (s.download)),
        storage_ (s.paths.data, s.paths.tmp),
        scheduler_ (client_, storage_, s.download)
  {
  }

  void transfer_coordinator::
  set_observer (transfer_observer o)
  {
    scheduler_.observer (move (o));
  }

  void transfer_coordinator::
  set_result_callback (result_callback f)
  {
    scheduler_.on_result (move (f));
  }

  void transfer_coordinator::
  set_mirror_lookup (mirror_lookup f)
  {
    scheduler_.mirrors (move (f));
  }

  asio::awaitable<transfer_batch> transfer_coordinator::
  download (vector<file_record> files)
  {
    info () << "downloading " << files.size () << " file(s) into "
            << storage_.data ();

    transfer_batch b (co_await scheduler_.process (move (files)));

    info () << b.ok.size () << " file(s) downloaded, " << b.errors.size ()
            << " failed";

    co_return b;
  }

  void transfer_coordinator::
  cancel ()
  {
    scheduler_.cancel ();
  }
}
