#include "keyed_permutation.hpp"
#include "crypto.hpp"
#include "stego_config.hpp"

#include <cstdint>
#include <iostream>
#include <limits>
#include <utility>

namespace svgstego {

    bool permutationOrder(size_t count, const std::string& key,
                          std::vector<size_t>& outOrder)
    {
        outOrder.clear();

        if (count > std::numeric_limits<uint32_t>::max()) {
            std::cerr << "[permute] Too many slots: " << count << "\n";
            return false;
        }

        crypto::Digest seed;
        if (!crypto::deriveSeed(PERMUTATION_DOMAIN, key, seed)) {
            std::cerr << "[permute] Failed to derive seed from stego-key\n";
            return false;
        }

        outOrder.resize(count);
        for (size_t i = 0; i < count; ++i) {
            outOrder[i] = i;
        }

        crypto::KeyStream stream(seed);
        for (size_t i = count; i > 1; --i) {
            uint32_t j = 0;
            if (!stream.uniform(static_cast<uint32_t>(i), j)) {
                outOrder.clear();
                return false;
            }
            std::swap(outOrder[i - 1], outOrder[j]);
        }

        return true;
    }

    bool permuteSlots(const std::vector<EmbeddingSlot>& slots,
                      const std::string& key,
                      std::vector<EmbeddingSlot>& outPermuted)
    {
        outPermuted.clear();

        std::vector<size_t> order;
        if (!permutationOrder(slots.size(), key, order)) {
            return false;
        }

        outPermuted.reserve(slots.size());
        for (size_t idx : order) {
            outPermuted.push_back(slots[idx]);
        }
        return true;
    }

}
