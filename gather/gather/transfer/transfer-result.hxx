#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <variant>
#include <utility>
#include <exception>

#include <gather/search/search-records.hxx>
#include <gather/transfer/transfer-types.hxx>
#include <gather/transfer/transfer-error.hxx>

namespace gather
{
  // File promoted to its final path.
  //
  struct transfer_ok
  {
    file_record file;
    fs::path path;
    std::uint64_t bytes = 0;
  };

  // File that could not be acquired. Completed is the number of bytes held
  // in the temporary artifact when the transfer stopped.
  //
  struct transfer_err
  {
    file_record file;
    std::uint64_t completed = 0;
    transfer_error_kind kind = transfer_error_kind::transport;
    std::string message;
    std::exception_ptr cause;
  };

  // Outcome of one transfer task.
  //
  class transfer_result
  {
  public:
    transfer_result () = default;
    transfer_result (transfer_ok v): v_ (std::move (v)) {}
    transfer_result (transfer_err v): v_ (std::move (v)) {}

    bool
    ok () const noexcept
    {
      return v_.index () == 0;
    }

    const file_record&
    file () const noexcept
    {
      return ok () ? std::get<0> (v_).file : std::get<1> (v_).file;
    }

    const transfer_ok&
    value () const
    {
      return std::get<0> (v_);
    }

    const transfer_err&
    error () const
    {
      return std::get<1> (v_);
    }

    transfer_ok&
    value ()
    {
      return std::get<0> (v_);
    }

    transfer_err&
    error ()
    {
      return std::get<1> (v_);
    }

  private:
    std::variant<transfer_ok, transfer_err> v_;
  };

  // Outcome of a batch, in completion order.
  //
  struct transfer_batch
  {
    std::vector<transfer_ok> ok;
    std::vector<transfer_err> errors;

    void
    add (transfer_result r)
    {
      if (r.ok ())
        ok.push_back (std::move (r.value ()));
      else
        errors.push_back (std::move (r.error ()));
    }

    std::size_t
    size () const noexcept
    {
      return ok.size () + errors.size ();
    }
  };
}
