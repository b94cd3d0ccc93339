#pragma once

#include <vector>

#include <boost/asio.hpp>

#include <gather/gather-settings.hxx>
#include <gather/http/http-client.hxx>
#include <gather/search/search-records.hxx>
#include <gather/transfer/transfer-result.hxx>
#include <gather/transfer/transfer-mirror.hxx>
#include <gather/transfer/transfer-storage.hxx>
#include <gather/transfer/transfer-scheduler.hxx>

namespace gather
{
  namespace asio = boost::asio;

  // File download over HTTP into the configured data directory.
  //
  class transfer_coordinator
  {
  public:
    using result_callback = transfer_scheduler::result_callback;

    transfer_coordinator (asio::io_context&, const settings&);

    transfer_coordinator (const transfer_coordinator&) = delete;
    transfer_coordinator& operator= (const transfer_coordinator&) = delete;

    void
    set_observer (transfer_observer);

    void
    set_result_callback (result_callback);

    void
    set_mirror_lookup (mirror_lookup);

    asio::awaitable<transfer_batch>
    download (std::vector<file_record>);

    // Abort the running batch.
    //
    void
    cancel ();

    const transfer_storage&
    storage () const noexcept
    {
      return storage_;
    }

    transfer_scheduler&
    scheduler () noexcept
    {
      return scheduler_;
    }

  private:
    http_client client_;
    transfer_storage storage_;
    transfer_scheduler scheduler_;
  };
}
