#include <gather/transfer/transfer-storage.hxx>

#include <algorithm>
#include <system_error>

#include <gather/transfer/transfer-error.hxx>

using namespace std;

namespace gather
{
  fs::path transfer_storage::
  temporary_path (const file_record& f) const
  {
    gather::digest d (digest_algorithm::sha1);
    d.update (f.file_id.data (), f.file_id.size ());
    return tmp_ / (d.hex () + ".part");
  }

  fs::path transfer_storage::
  final_path (const file_record& f) const
  {
    return data_ / fs::path (f.local_path) / f.filename;
  }

  partial_artifact::
  partial_artifact (const transfer_storage& s,
                    const file_record& f,
                    optional<digest_algorithm> a,
                    bool resume)
    : path_ (s.temporary_path (f)),
      target_ (s.final_path (f)),
      expected_ (f.size)
  {
    if (a)
      digest_.emplace (*a);

    error_code ec;
    fs::create_directories (path_.parent_path (), ec);

    if (ec)
      throw storage_error ("unable to create " +
                           path_.parent_path ().string () + ": " +
                           ec.message ());

    if (resume && fs::exists (path_))
    {
      size_ = fs::file_size (path_);

      // A prefix longer than the file cannot be resumed from.
      //
      if (size_ > expected_)
        size_ = 0;
    }

    if (size_ == 0)
    {
      open (ios::binary | ios::trunc);
      return;
    }

    // Seed the digest with the bytes already acquired.
    //
    if (digest_)
    {
      ifstream ifs (path_, ios::binary);
      char buf[1 << 16];

      for (uint64_t n (size_); n != 0;)
      {
        streamsize m (static_cast<streamsize> (min<uint64_t> (n, sizeof (buf))));

        if (!ifs.read (buf, m))
          throw storage_error ("unable to read " + path_.string ());

        digest_->update (buf, static_cast<size_t> (m));
        n -= static_cast<uint64_t> (m);
      }
    }

    open (ios::binary | ios::app);
  }

  void partial_artifact::
  open (ios::openmode m)
  {
    ofs_.open (path_, m);

    if (!ofs_)
      throw storage_error ("unable to open " + path_.string ());
  }

  void partial_artifact::
  write (const char* d, size_t n)
  {
    if (size_ + n > expected_)
      throw size_mismatch_error (expected_, size_ + n);

    if (!ofs_.write (d, static_cast<streamsize> (n)))
      throw storage_error ("unable to write " + path_.string ());

    if (digest_)
      digest_->update (d, n);

    size_ += n;
  }

  void partial_artifact::
  restart ()
  {
    ofs_.close ();
    open (ios::binary | ios::trunc);

    size_ = 0;

    if (digest_)
      digest_->reset ();
  }

  optional<string> partial_artifact::
  digest () const
  {
    return digest_ ? optional<string> (digest_->hex ()) : nullopt;
  }

  void partial_artifact::
  close ()
  {
    if (ofs_.is_open ())
    {
      ofs_.flush ();

      if (!ofs_)
        throw storage_error ("unable to write " + path_.string ());

      ofs_.close ();
    }
  }

  fs::path partial_artifact::
  promote ()
  {
    close ();

    error_code ec;
    fs::create_directories (target_.parent_path (), ec);

    if (ec)
      throw storage_error ("unable to create " +
                           target_.parent_path ().string () + ": " +
                           ec.message ());

    fs::rename (path_, target_, ec);

    if (ec)
      throw storage_error ("unable to move " + path_.string () + " to " +
                           target_.string () + ": " + ec.message ());

    return target_;
  }

  void partial_artifact::
  discard () noexcept
  {
    ofs_.close ();

    error_code ec;
    fs::remove (path_, ec);
  }
}
