#include <gather/search/search-distribute.hxx>

#include <numeric>
#include <cassert>
#include <stdexcept>

using namespace std;
using namespace gather;

using counts = vector<uint64_t>;

static uint64_t
sum (const counts& v)
{
  return accumulate (v.begin (), v.end (), uint64_t (0));
}

static void
check (const counts& hits, uint64_t target, const counts& expected)
{
  counts r (distribute (hits, target));

  if (r != expected)
    assert (false);

  // Never more than a bucket has, never more than asked for.
  //
  for (size_t i (0); i != r.size (); ++i)
    if (r[i] > hits[i])
      assert (false);

  if (sum (r) != min (target, sum (hits)))
    assert (false);
}

static void
test_proportional ()
{
  check ({10, 10, 10}, 15, {5, 5, 5});
  check ({10, 20, 30}, 30, {5, 10, 15});
  check ({5, 0, 5}, 7, {4, 0, 3});
  check ({100, 1}, 10, {10, 0});
  check ({3, 7}, 5, {1, 4});
  check ({1, 2, 3, 4}, 6, {0, 1, 2, 3});
  check ({4}, 3, {3});
}

static void
test_edges ()
{
  // Target of zero, nothing to distribute, target beyond the total.
  //
  check ({7, 7}, 0, {0, 0});
  check ({0, 0}, 5, {0, 0});
  check ({3, 4}, 100, {3, 4});
  check ({}, 10, {});

  // Large counts go through the wide multiplication.
  //
  const uint64_t t (uint64_t (1) << 40);
  check ({t, t}, t, {t / 2, t / 2});
  check ({3 * t, t}, t, {3 * (t / 4), t / 4});
}

// Distributing the result of a distribution again yields the same split.
//
static void
test_idempotent ()
{
  const counts hits {17, 3, 250, 0, 42};

  for (uint64_t t: {1, 5, 50, 100, 312})
  {
    counts r (distribute (hits, t));

    if (distribute (r, sum (r)) != r)
      assert (false);
  }
}

static void
test_plan ()
{
  // Offset removed proportionally, then the cap.
  //
  {
    vector<hit_slice> r (distribute ({10, 10, 10}, 6, 9));
    assert (r.size () == 3);

    for (const hit_slice& s: r)
      assert ((s == hit_slice {2, 3}));
  }

  {
    vector<hit_slice> r (distribute ({50, 50}, 10, 20));
    assert ((r[0] == hit_slice {5, 10}));
    assert ((r[1] == hit_slice {5, 10}));
  }

  // No cap takes everything.
  //
  {
    vector<hit_slice> r (distribute ({10, 20}, 0, nullopt));
    assert ((r[0] == hit_slice {0, 10}));
    assert ((r[1] == hit_slice {0, 20}));
  }

  // Offset past the end leaves nothing.
  //
  {
    vector<hit_slice> r (distribute ({10, 20}, 30, 5));
    assert ((r[0] == hit_slice {}));
    assert ((r[1] == hit_slice {}));
  }
}

static void
test_paginate ()
{
  vector<hit_slice> s {{0, 120}, {10, 0}, {5, 50}};

  vector<page_window> p (paginate (s, 50));
  assert (p.size () == 4);

  assert (p[0].bucket == 0 && p[0].offset == 0 && p[0].limit == 50);
  assert (p[1].bucket == 0 && p[1].offset == 50 && p[1].limit == 50);
  assert (p[2].bucket == 0 && p[2].offset == 100 && p[2].limit == 20);
  assert (p[3].bucket == 2 && p[3].offset == 5 && p[3].limit == 50);

  vector<size_t> c (page_counts (s, 50));
  assert ((c == vector<size_t> {3, 0, 1}));

  try
  {
    paginate (s, 0);
    assert (false);
  }
  catch (const invalid_argument&)
  {
  }
}

int
main ()
{
  test_proportional ();
  test_edges ();
  test_idempotent ();
  test_plan ();
  test_paginate ();
}
