#pragma once

#include <string>
#include <sstream>
#include <utility>

namespace gather
{
  // Process-wide verbosity level.
  //
  //   0  errors only
  //   1  errors and warnings (default)
  //   2  plus informational messages
  //   3  plus per-request tracing
  //
  extern int verb;

  // Diagnostics record.
  //
  // Accumulates a single line and writes it to stderr, prefixed with the
  // severity, when the record goes out of scope. Records below the current
  // verbosity level swallow their input.
  //
  class diag_record
  {
  public:
    diag_record (const char* prefix, bool active)
      : prefix_ (prefix), active_ (active) {}

    diag_record (diag_record&& r) noexcept
      : os_ (std::move (r.os_)), prefix_ (r.prefix_), active_ (r.active_)
    {
      r.active_ = false;
    }

    diag_record (const diag_record&) = delete;
    diag_record& operator= (const diag_record&) = delete;

    ~diag_record ();

    template <typename T>
    diag_record&
    operator<< (const T& x)
    {
      if (active_)
        os_ << x;

      return *this;
    }

    bool
    active () const noexcept
    {
      return active_;
    }

  private:
    std::ostringstream os_;
    const char* prefix_;
    bool active_;
  };

  diag_record
  error ();

  diag_record
  warn ();

  diag_record
  info ();

  diag_record
  trace ();
}
