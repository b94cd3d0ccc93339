#include <gather/transfer/transfer-chunk.hxx>

#include <utility>
#include <algorithm>
#include <stdexcept>

using namespace std;

namespace gather
{
  vector<chunk>
  plan_chunks (uint64_t size, uint64_t chunk_size, uint64_t acquired)
  {
    if (chunk_size == 0)
      throw invalid_argument ("chunk size must be positive");

    vector<chunk> r;

    for (uint64_t i (acquired / chunk_size); i * chunk_size < size; ++i)
    {
      uint64_t first (max (i * chunk_size, acquired));
      uint64_t last (min (size, (i + 1) * chunk_size) - 1);

      r.push_back (chunk {static_cast<size_t> (i), first, last});
    }

    return r;
  }

  chunk_queue::
  chunk_queue (const vector<chunk>& cs)
    : q_ (cs.begin (), cs.end ())
  {
  }

  optional<chunk> chunk_queue::
  pop ()
  {
    lock_guard<mutex> l (m_);

    if (q_.empty ())
      return nullopt;

    chunk c (q_.front ());
    q_.pop_front ();
    return c;
  }

  void chunk_queue::
  requeue (const chunk& c)
  {
    lock_guard<mutex> l (m_);
    q_.push_back (c);
  }

  size_t chunk_queue::
  size () const
  {
    lock_guard<mutex> l (m_);
    return q_.size ();
  }

  chunk_assembler::
  chunk_assembler (sink_type s, size_t first, size_t count)
    : sink_ (move (s)), next_ (first), end_ (first + count)
  {
  }

  void chunk_assembler::
  put (size_t index, string data)
  {
    if (index < next_ || index >= end_)
      throw out_of_range ("chunk " + std::to_string (index) +
                          " is not expected");

    pending_.emplace (index, move (data));

    // Flush the contiguous run starting at the next index.
    //
    for (auto i (pending_.find (next_)); i != pending_.end ();
         i = pending_.find (next_))
    {
      sink_ (i->second.data (), i->second.size ());
      pending_.erase (i);
      ++next_;
    }
  }
}
