#ifndef KEYED_PERMUTATION_HPP
#define KEYED_PERMUTATION_HPP

#include "slot_extractor.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace svgstego {

    // SVGSTEGO-PERM-1
    //
    //   seed      = SHA-256(PERMUTATION_DOMAIN || key)
    //   block i   = SHA-256(seed || uint64_be(i)), read as big-endian u32 words
    //   uniform n = reject words below (2^32 mod n), then word mod n
    //   shuffle   = Fisher-Yates, i from count-1 down to 1, j = uniform(i + 1)
    //
    // Embedder and extractor rebuild the same order from the key alone, so
    // none of the above may change without changing PERMUTATION_DOMAIN.
    bool permutationOrder(size_t count, const std::string& key,
                          std::vector<size_t>& outOrder);

    bool permuteSlots(const std::vector<EmbeddingSlot>& slots,
                      const std::string& key,
                      std::vector<EmbeddingSlot>& outPermuted);

}

#endif
