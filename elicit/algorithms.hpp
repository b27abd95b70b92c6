#pragma once
#include <elicit/types.hpp>
#include <iterator>
#include <type_traits>
#include <vector>

namespace elicit {

/** Transforms the range `[first, last)` into the next strictly-increasing sequence with maximum
 * value `max`.  To cover all values, the range should initially be in sorted order from `min` to
 * `min+n`, where `n` is the size of the range.  Each permutation will be in sorted,
 * strictly-increasing order.  The last permutation will consist of `{max-n, max-n+1, ..., max-1,
 * max}`, where `n` is the size of the given range.
 *
 * Note that this algorithm does not check that values are sorted, so may behave in an undefined
 * manner if called with initially-unsorted values.
 *
 * \returns `true` if the range was updated to the next permutation, `false` if no next permutation
 * exists.
 *
 * For example, enumerating every unordered pair of `n` profiles:
 *
 *     std::vector<size_t> pair({0, 1});
 *     do { ... profiles[pair[0]] vs. profiles[pair[1]] ... }
 *     while (elicit::next_increasing_integer_permutation(pair.begin(), pair.end(), n-1));
 */
template <class BidirIt, std::enable_if_t<
    std::is_integral<typename BidirIt::value_type>::value &&
    std::is_base_of<std::bidirectional_iterator_tag, typename std::iterator_traits<BidirIt>::iterator_category>::value
, int> = 0>
bool next_increasing_integer_permutation(BidirIt first, BidirIt last, typename BidirIt::value_type max) {
    auto it = last;
    --it;
    while (true) {
        if (*it < max) {
            auto last_val = ++*it;
            for (++it; it != last; ++it) {
                *it = ++last_val;
            }
            return true;
        }
        if (it == first) break;
        --it;
        --max;
    }
    return false;
}

/** Advances `index` to the next element of the Cartesian product of `{0, ..., sizes[i]-1}`, in
 * odometer order: the last position varies fastest.  `index` must have the same size as `sizes`
 * and should start at all zeros.
 *
 * \returns `true` if the index was advanced, `false` (with `index` reset to all zeros) if it was
 * already at the last element.
 *
 * For example, with sizes `{2, 3}` the sequence is `{0,0}`, `{0,1}`, `{0,2}`, `{1,0}`, `{1,1}`,
 * `{1,2}`.
 */
inline bool next_cartesian_index(std::vector<size_t> &index, const std::vector<size_t> &sizes) {
    for (size_t i = index.size(); i-- > 0; ) {
        if (++index[i] < sizes[i]) return true;
        index[i] = 0;
    }
    return false;
}

}
