#pragma once

#include <memory>
#include <vector>
#include <cstddef>
#include <functional>

#include <boost/asio.hpp>
#include <boost/asio/experimental/channel.hpp>

#include <gather/http/http-client.hxx>
#include <gather/async/async-semaphore.hxx>
#include <gather/search/search-records.hxx>
#include <gather/transfer/transfer-task.hxx>
#include <gather/transfer/transfer-types.hxx>
#include <gather/transfer/transfer-result.hxx>
#include <gather/transfer/transfer-mirror.hxx>
#include <gather/transfer/transfer-storage.hxx>
#include <gather/transfer/transfer-strategy.hxx>

namespace gather
{
  // Life-cycle notifications. For every task, started precedes the first
  // byte and is followed by exactly one of completed or failed. A task
  // cancelled before it got a slot only reports failed.
  //
  struct transfer_observer
  {
    std::function<void (const file_record&)> started;
    std::function<void (const file_record&, const fs::path&)> completed;
    std::function<void (const file_record&, const transfer_err&)> failed;
  };

  // Download scheduler.
  //
  // Runs one task per file, at most max_concurrent at a time, and merges
  // their results in completion order. A failing file never affects the
  // others.
  //
  template <typename C>
  class basic_transfer_scheduler
  {
  public:
    using client_type     = C;
    using result_callback = std::function<void (const transfer_result&)>;

    basic_transfer_scheduler (client_type& c,
                              const transfer_storage& s,
                              download_settings ds)
      : client_ (c), storage_ (s), settings_ (std::move (ds)) {}

    basic_transfer_scheduler (const basic_transfer_scheduler&) = delete;
    basic_transfer_scheduler& operator= (const basic_transfer_scheduler&) = delete;

    void
    observer (transfer_observer o)
    {
      observer_ = std::move (o);
    }

    // Called for every result as soon as it is available.
    //
    void
    on_result (result_callback f)
    {
      on_result_ = std::move (f);
    }

    // Replica lookup for the multi-source strategy.
    //
    void
    mirrors (mirror_lookup f)
    {
      lookup_ = std::move (f);
    }

    const download_settings&
    settings () const noexcept
    {
      return settings_;
    }

    // Download the files. Throw std::invalid_argument if max_concurrent is
    // 0.
    //
    boost::asio::awaitable<transfer_batch>
    process (std::vector<file_record> files, std::size_t max_concurrent);

    boost::asio::awaitable<transfer_batch>
    process (std::vector<file_record> files)
    {
      return process (std::move (files), settings_.max_concurrent);
    }

    // Abort all tasks of the running batch. Partial artifacts are kept. Must
    // be called on the executor running the batch.
    //
    void
    cancel ();

    bool
    cancelled () const noexcept
    {
      return cancelled_;
    }

    // Tasks of the running batch.
    //
    const std::vector<std::shared_ptr<transfer_task>>&
    tasks () const noexcept
    {
      return tasks_;
    }

  private:
    using channel_type =
      boost::asio::experimental::channel<void (boost::system::error_code,
                                               transfer_result)>;

    boost::asio::awaitable<void>
    run (std::shared_ptr<transfer_task>,
         std::shared_ptr<async_semaphore>,
         std::shared_ptr<channel_type>);

    boost::asio::awaitable<transfer_result>
    execute (transfer_task&, async_semaphore&, semaphore_permit&);

    transfer_err
    failure (transfer_task&, std::uint64_t completed, std::exception_ptr);

  private:
    client_type& client_;
    const transfer_storage& storage_;
    download_settings settings_;

    transfer_observer observer_;
    result_callback on_result_;
    mirror_lookup lookup_;

    std::vector<std::shared_ptr<transfer_task>> tasks_;
    bool cancelled_ = false;
  };

  using transfer_scheduler = basic_transfer_scheduler<http_client>;
}

#include <gather/transfer/transfer-scheduler.txx>
