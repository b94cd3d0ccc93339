#include <utility>
#include <optional>
#include <stdexcept>
#include <exception>

#include <boost/system/system_error.hpp>
#include <boost/asio/experimental/channel_error.hpp>

#include <gather/gather-diagnostics.hxx>
#include <gather/http/http-types.hxx>
#include <gather/transfer/transfer-error.hxx>
#include <gather/transfer/transfer-verify.hxx>

namespace gather
{
  template <typename C>
  boost::asio::awaitable<transfer_batch> basic_transfer_scheduler<C>::
  process (std::vector<file_record> files, std::size_t n)
  {
    namespace asio = boost::asio;

    if (n == 0)
      throw std::invalid_argument ("concurrency limit must be positive");

    transfer_batch b;

    if (files.empty ())
      co_return b;

    auto ex (co_await asio::this_coro::executor);

    cancelled_ = false;
    tasks_.clear ();

    // The channel can hold every result so that sending never waits.
    //
    auto sem (std::make_shared<async_semaphore> (ex, n));
    auto ch (std::make_shared<channel_type> (ex, files.size ()));

    for (file_record& f: files)
    {
      transfer_strategy s (select_strategy (f, settings_));
      tasks_.push_back (std::make_shared<transfer_task> (std::move (f), s));
    }

    for (const std::shared_ptr<transfer_task>& t: tasks_)
    {
      trace () << t->file ().file_id << ": " << strategy_name (t->strategy ())
               << " transfer of " << t->file ().size << " bytes";

      asio::co_spawn (
        ex,
        run (t, sem, ch),
        asio::bind_cancellation_slot (t->cancellation ().slot (),
                                      asio::detached));
    }

    for (std::size_t i (0); i != tasks_.size (); ++i)
    {
      transfer_result r (co_await ch->async_receive (asio::use_awaitable));

      if (on_result_)
        on_result_ (r);

      b.add (std::move (r));
    }

    tasks_.clear ();
    co_return b;
  }

  template <typename C>
  void basic_transfer_scheduler<C>::
  cancel ()
  {
    cancelled_ = true;

    for (const std::shared_ptr<transfer_task>& t: tasks_)
      if (!t->terminal ())
        t->cancellation ().emit (boost::asio::cancellation_type::terminal);
  }

  template <typename C>
  boost::asio::awaitable<void> basic_transfer_scheduler<C>::
  run (std::shared_ptr<transfer_task> t,
       std::shared_ptr<async_semaphore> sem,
       std::shared_ptr<channel_type> ch)
  {
    semaphore_permit p;
    transfer_result r (co_await execute (*t, *sem, p));

    // Free the slot before the result is seen so that the next task can
    // start right away.
    //
    p.release ();

    if (!ch->try_send (boost::system::error_code (), std::move (r)))
      error () << "unable to deliver transfer result for "
               << t->file ().file_id;
  }

  template <typename C>
  boost::asio::awaitable<transfer_result> basic_transfer_scheduler<C>::
  execute (transfer_task& t, async_semaphore& sem, semaphore_permit& p)
  {
    const file_record& f (t.file ());

    std::optional<partial_artifact> a;
    std::exception_ptr ep;

    try
    {
      p = co_await sem.acquire ();

      if (cancelled_)
        throw transfer_cancelled ();

      t.set_state (transfer_state::starting);

      std::optional<expected_digest> e (expected_checksum (f));
      std::optional<digest_algorithm> da;
      if (e)
        da = e->algorithm;

      a.emplace (storage_, f, da, settings_.resume);
      t.set_resumed (a->size ());

      if (a->size () != 0)
        info () << f.file_id << ": resuming at byte " << a->size ();

      if (observer_.started)
        observer_.started (f);

      t.set_state (transfer_state::downloading);

      transfer_context x {
        f,
        *a,
        [&t] (std::uint64_t n) {t.update_progress (n);},
        lookup_,
        {}};

      co_await std::visit (
        [this, &x] (const auto& s) {return s.acquire (client_, x);},
        t.strategy ());

      t.set_sources (std::move (x.sources));
      t.set_state (transfer_state::verifying);

      verify (*a, e);

      transfer_ok r {f, a->promote (), a->size ()};

      t.set_state (transfer_state::completed);

      if (observer_.completed)
        observer_.completed (f, r.path);

      co_return r;
    }
    catch (const std::exception&)
    {
      ep = std::current_exception ();
    }

    transfer_err r (failure (t, a ? a->size () : 0, ep));

    // A wrong byte count or digest means the bytes are useless. Anything
    // else leaves the artifact to resume from.
    //
    if (a && (r.kind == transfer_error_kind::size_mismatch ||
              r.kind == transfer_error_kind::checksum_mismatch))
      a->discard ();

    t.set_state (r.kind == transfer_error_kind::cancelled
                 ? transfer_state::cancelled
                 : transfer_state::failed);

    if (observer_.failed)
      observer_.failed (f, r);

    co_return r;
  }

  template <typename C>
  transfer_err basic_transfer_scheduler<C>::
  failure (transfer_task& t, std::uint64_t completed, std::exception_ptr ep)
  {
    namespace asio = boost::asio;

    transfer_err r;
    r.file = t.file ();
    r.completed = completed;
    r.cause = ep;

    try
    {
      std::rethrow_exception (ep);
    }
    catch (const transfer_error& e)
    {
      r.kind = e.kind ();
      r.message = e.what ();
    }
    catch (const boost::system::system_error& e)
    {
      const boost::system::error_code& ec (e.code ());

      r.kind = ec == asio::error::operation_aborted ||
               ec == asio::experimental::error::channel_cancelled
        ? transfer_error_kind::cancelled
        : transfer_error_kind::transport;

      r.message = e.what ();
    }
    catch (const fs::filesystem_error& e)
    {
      r.kind = transfer_error_kind::storage;
      r.message = e.what ();
    }
    catch (const std::exception& e)
    {
      r.kind = transfer_error_kind::transport;
      r.message = e.what ();
    }

    if (cancelled_ &&
        r.kind != transfer_error_kind::size_mismatch &&
        r.kind != transfer_error_kind::checksum_mismatch)
    {
      r.kind = transfer_error_kind::cancelled;
      r.message = "transfer cancelled";
    }

    return r;
  }
}
