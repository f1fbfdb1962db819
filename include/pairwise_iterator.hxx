#ifndef GREENHAUL_PAIRWISE_ITERATOR
#define GREENHAUL_PAIRWISE_ITERATOR

#include <iterator>
#include <utility>

namespace greenhaul {

/// Consecutive pairs of a forward range: (a, b), (b, c), ...
template<typename ForwardIterator>
class pairwise_iterator
{
private:
  ForwardIterator mFirst;
  ForwardIterator mNext;

public:
  using reference_t =
    typename std::iterator_traits<ForwardIterator>::reference;
  using pair_t = std::pair<reference_t, reference_t>;

  pairwise_iterator(ForwardIterator first, ForwardIterator last)
    : mFirst(first)
    , mNext(first == last ? first : std::next(first))
  {}

  auto operator!=(const pairwise_iterator& other) const -> bool
  {
    return mNext != other.mNext;
  }

  auto operator++() -> pairwise_iterator&
  {
    ++mFirst;
    ++mNext;
    return *this;
  }

  auto operator*() const -> pair_t { return pair_t(*mFirst, *mNext); }
};

template<typename ForwardIterator>
class pairwise_range
{
private:
  ForwardIterator mFirst;
  ForwardIterator mLast;

public:
  pairwise_range(ForwardIterator first, ForwardIterator last)
    : mFirst(first)
    , mLast(last)
  {}

  auto begin() const -> pairwise_iterator<ForwardIterator>
  {
    return pairwise_iterator<ForwardIterator>(mFirst, mLast);
  }

  auto end() const -> pairwise_iterator<ForwardIterator>
  {
    return pairwise_iterator<ForwardIterator>(mLast, mLast);
  }
};

template<typename C>
auto
make_pairwise_range(const C& container)
  -> pairwise_range<decltype(std::cbegin(container))>
{
  return pairwise_range<decltype(std::cbegin(container))>(
    std::cbegin(container), std::cend(container));
}

}

#endif
