#pragma once

#include <mutex>
#include <atomic>
#include <string>
#include <vector>
#include <cstdint>
#include <functional>

#include <boost/asio.hpp>

#include <gather/search/search-records.hxx>
#include <gather/transfer/transfer-types.hxx>
#include <gather/transfer/transfer-strategy.hxx>

namespace gather
{
  // Transfer of a single file.
  //
  // Created by the scheduler when a batch starts and dropped once its result
  // has been emitted. State and progress may be observed from other threads.
  //
  class transfer_task
  {
  public:
    using state_callback = std::function<void (transfer_state, transfer_state)>;

    transfer_task (file_record f, transfer_strategy s)
      : file_ (std::move (f)), strategy_ (std::move (s))
    {
      total_bytes_.store (file_.size);
    }

    transfer_task (const transfer_task&) = delete;
    transfer_task& operator= (const transfer_task&) = delete;

    const file_record&
    file () const noexcept
    {
      return file_;
    }

    // Chosen once, when the task is created.
    //
    const transfer_strategy&
    strategy () const noexcept
    {
      return strategy_;
    }

    transfer_state
    state () const noexcept
    {
      return state_.load ();
    }

    void
    set_state (transfer_state s)
    {
      transfer_state o (state_.exchange (s));

      if (o != s && on_state_change)
        on_state_change (o, s);
    }

    bool
    terminal () const noexcept
    {
      transfer_state s (state ());
      return s == transfer_state::completed ||
             s == transfer_state::failed    ||
             s == transfer_state::cancelled;
    }

    transfer_progress
    progress () const noexcept
    {
      return transfer_progress {total_bytes_.load (), acquired_bytes_.load ()};
    }

    void
    update_progress (std::uint64_t acquired)
    {
      acquired_bytes_.store (acquired);
    }

    // Length of the prefix found in the temporary artifact when the
    // transfer started.
    //
    std::uint64_t
    resumed () const noexcept
    {
      return resumed_.load ();
    }

    void
    set_resumed (std::uint64_t n)
    {
      resumed_.store (n);
      acquired_bytes_.store (n);
    }

    // Source URLs the transfer is spread over.
    //
    std::vector<std::string>
    sources () const
    {
      std::lock_guard<std::mutex> l (m_);
      return sources_;
    }

    void
    set_sources (std::vector<std::string> s)
    {
      std::lock_guard<std::mutex> l (m_);
      sources_ = std::move (s);
    }

    // Terminal cancellation of everything the task is waiting on.
    //
    boost::asio::cancellation_signal&
    cancellation () noexcept
    {
      return cancel_;
    }

    state_callback on_state_change;

  private:
    file_record file_;
    transfer_strategy strategy_;

    std::atomic<transfer_state> state_ {transfer_state::pending};
    std::atomic<std::uint64_t> total_bytes_ {0};
    std::atomic<std::uint64_t> acquired_bytes_ {0};
    std::atomic<std::uint64_t> resumed_ {0};

    mutable std::mutex m_;
    std::vector<std::string> sources_;

    boost::asio::cancellation_signal cancel_;
  };
}
