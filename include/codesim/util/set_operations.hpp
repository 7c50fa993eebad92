#pragma once

#include <cstddef>
#include <set>

namespace codesim {

/**
 * SetOperations - Counting set operations over ordered sets.
 *
 * Similarity scoring only needs cardinalities, so these walk both sets in
 * order and never materialize the intersection or union.
 */
class SetOperations {
public:
    /**
     * Size of the intersection of two ordered sets.
     * Linear merge; returns early once either side is exhausted.
     *
     * @param a First set
     * @param b Second set
     * @return |a ∩ b|
     */
    template <typename T, typename Compare>
    static size_t intersection_size(const std::set<T, Compare>& a,
                                    const std::set<T, Compare>& b) {
        if (a.empty() || b.empty()) {
            return 0;
        }

        const Compare less = a.key_comp();
        size_t count = 0;
        auto it_a = a.begin();
        auto it_b = b.begin();

        while (it_a != a.end() && it_b != b.end()) {
            if (less(*it_a, *it_b)) {
                ++it_a;
            } else if (less(*it_b, *it_a)) {
                ++it_b;
            } else {
                ++count;
                ++it_a;
                ++it_b;
            }
        }

        return count;
    }

    /**
     * Size of the union, |a| + |b| - |a ∩ b|.
     *
     * @param a First set
     * @param b Second set
     * @param intersection Precomputed |a ∩ b|
     */
    template <typename T, typename Compare>
    static size_t union_size(const std::set<T, Compare>& a,
                             const std::set<T, Compare>& b,
                             size_t intersection) {
        return a.size() + b.size() - intersection;
    }
};

}  // namespace codesim
