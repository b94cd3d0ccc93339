#pragma once

#include <string>
#include <cstdint>
#include <cstddef>
#include <fstream>
#include <optional>

#include <gather/search/search-records.hxx>
#include <gather/transfer/transfer-types.hxx>
#include <gather/transfer/transfer-digest.hxx>

namespace gather
{
  // Local layout of downloaded files.
  //
  //   <tmp>/<sha1 (file_id)>.part       while acquiring
  //   <data>/<local_path>/<filename>    once verified
  //
  class transfer_storage
  {
  public:
    transfer_storage (fs::path data, fs::path tmp)
      : data_ (std::move (data)), tmp_ (std::move (tmp)) {}

    const fs::path&
    data () const noexcept
    {
      return data_;
    }

    const fs::path&
    tmp () const noexcept
    {
      return tmp_;
    }

    fs::path
    temporary_path (const file_record&) const;

    fs::path
    final_path (const file_record&) const;

  private:
    fs::path data_;
    fs::path tmp_;
  };

  // Temporary artifact of a file being acquired.
  //
  // Opening creates the temporary directory and file. With resume, existing
  // bytes are kept as the acquired prefix and fed to the digest; otherwise
  // the file is truncated. The artifact stays on disk unless discarded or
  // promoted.
  //
  class partial_artifact
  {
  public:
    partial_artifact (const transfer_storage&,
                      const file_record&,
                      std::optional<digest_algorithm>,
                      bool resume);

    partial_artifact (const partial_artifact&) = delete;
    partial_artifact& operator= (const partial_artifact&) = delete;

    const fs::path&
    path () const noexcept
    {
      return path_;
    }

    const fs::path&
    target () const noexcept
    {
      return target_;
    }

    // Bytes held so far.
    //
    std::uint64_t
    size () const noexcept
    {
      return size_;
    }

    std::uint64_t
    expected () const noexcept
    {
      return expected_;
    }

    // Append. Throw size_mismatch_error if this would exceed the expected
    // size (nothing is written in this case).
    //
    void
    write (const char*, std::size_t);

    // Drop the bytes held so far.
    //
    void
    restart ();

    // Hex digest of the bytes held so far or nullopt if there is nothing to
    // check against.
    //
    std::optional<std::string>
    digest () const;

    void
    close ();

    // Atomically move to the final path, creating its directory. Return the
    // final path.
    //
    fs::path
    promote ();

    // Close and remove.
    //
    void
    discard () noexcept;

  private:
    void
    open (std::ios::openmode);

  private:
    fs::path path_;
    fs::path target_;
    std::uint64_t expected_;
    std::uint64_t size_ = 0;
    std::ofstream ofs_;
    std::optional<gather::digest> digest_;
  };
}
