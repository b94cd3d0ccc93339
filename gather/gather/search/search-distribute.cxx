#include <gather/search/search-distribute.hxx>

#include <numeric>
#include <stdexcept>
#include <algorithm>

using namespace std;

namespace gather
{
  // floor (a * b / c) without overflow, c != 0.
  //
  // The product is formed in two 64-bit halves and divided by shift and
  // subtract. Cheap enough for the handful of calls the search makes.
  //
  static uint64_t
  mul_div (uint64_t a, uint64_t b, uint64_t c)
  {
    const uint64_t m (0xFFFFFFFFULL);

    uint64_t al (a & m), ah (a >> 32), bl (b & m), bh (b >> 32);

    uint64_t ll (al * bl), lh (al * bh), hl (ah * bl), hh (ah * bh);

    uint64_t mid ((ll >> 32) + (lh & m) + (hl & m));

    uint64_t lo ((mid << 32) | (ll & m));
    uint64_t hi (hh + (lh >> 32) + (hl >> 32) + (mid >> 32));

    if (hi == 0)
      return lo / c;

    // Restoring division of the 128-bit (hi, lo) by c. The quotient fits 64
    // bits for all our callers (a <= c).
    //
    uint64_t q (0), r (0);

    for (int i (127); i >= 0; --i)
    {
      bool carry ((r >> 63) != 0);

      r <<= 1;
      r |= (i >= 64 ? (hi >> (i - 64)) : (lo >> i)) & 1;

      if (carry || r >= c)
      {
        r -= c;

        if (i < 64)
          q |= uint64_t (1) << i;
      }
    }

    return q;
  }

  vector<uint64_t>
  distribute (const vector<uint64_t>& hits, uint64_t target)
  {
    size_t n (hits.size ());
    vector<uint64_t> r (n, 0);

    uint64_t sum (accumulate (hits.begin (), hits.end (), uint64_t (0)));

    if (target == 0 || sum == 0)
      return r;

    if (target >= sum)
      return hits;

    // After k full rounds bucket i holds floor (k * hits[i] / sum). Find the
    // last k for which the total is still below the target. The total
    // reaches sum at k == sum so the answer is in [0, sum).
    //
    auto total = [&hits, sum] (uint64_t k)
    {
      uint64_t t (0);
      for (uint64_t h: hits)
        t += mul_div (k, h, sum);
      return t;
    };

    uint64_t lo (0), hi (sum); // total (lo) < target <= total (hi)

    while (hi - lo > 1)
    {
      uint64_t mid (lo + (hi - lo) / 2);

      if (total (mid) < target)
        lo = mid;
      else
        hi = mid;
    }

    uint64_t t (0);
    for (size_t i (0); i != n; ++i)
    {
      r[i] = mul_div (lo, hits[i], sum);
      t += r[i];
    }

    // Replay the round that crosses the target.
    //
    for (size_t i (0); i != n; ++i)
    {
      uint64_t step (mul_div (lo + 1, hits[i], sum) - r[i]);

      if (t + step >= target)
      {
        r[i] += target - t;
        break;
      }

      t += step;
      r[i] += step;
    }

    return r;
  }

  vector<hit_slice>
  distribute (const vector<uint64_t>& hits,
              uint64_t offset,
              optional<uint64_t> cap)
  {
    size_t n (hits.size ());
    vector<hit_slice> r (n);

    uint64_t sum (accumulate (hits.begin (), hits.end (), uint64_t (0)));

    if (offset >= sum && sum != 0)
      return r;

    vector<uint64_t> offsets (distribute (hits, offset));
    vector<uint64_t> remaining (n);

    for (size_t i (0); i != n; ++i)
      remaining[i] = hits[i] - offsets[i];

    vector<uint64_t> counts (cap ? distribute (remaining, *cap) : remaining);

    for (size_t i (0); i != n; ++i)
    {
      r[i].offset = offsets[i];
      r[i].count = counts[i];
    }

    return r;
  }

  vector<page_window>
  paginate (const vector<hit_slice>& slices, uint64_t page_limit)
  {
    if (page_limit == 0)
      throw invalid_argument ("page limit must be positive");

    vector<page_window> r;

    for (size_t i (0); i != slices.size (); ++i)
    {
      const hit_slice& s (slices[i]);
      uint64_t stop (s.offset + s.count);

      for (uint64_t start (s.offset); start < stop; start += page_limit)
        r.push_back (page_window {i, start, min (page_limit, stop - start)});
    }

    return r;
  }

  vector<size_t>
  page_counts (const vector<hit_slice>& slices, uint64_t page_limit)
  {
    if (page_limit == 0)
      throw invalid_argument ("page limit must be positive");

    vector<size_t> r;
    r.reserve (slices.size ());

    for (const hit_slice& s: slices)
      r.push_back (static_cast<size_t> ((s.count + page_limit - 1) /
                                        page_limit));

    return r;
  }
}
