#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "store.hpp"

#include "sum_tree.pb.h"

namespace pdp::sumtree
{
    struct Selection
    {
        std::uint64_t leaf = 0;
        // distance of the target from the start of the selected leaf
        std::uint64_t offset = 0;
    };

    /**
     * @brief Binary indexed tree of leaf weights, one per tree id, persisted node by node.
     *
     * Node `i` holds the sum of leaves [i - 2^h + 1, i] where h = heightFromIndex(i).
     * Every tree is bounded to 2^max_height leaves, which keeps ancestor sums valid
     * no matter in which order leaves are added.
     * Nodes are created lazily at zero and never deleted.
     */
    class SumTree
    {
    public:
        static constexpr std::uint32_t DEFAULT_MAX_HEIGHT = 32;
        static constexpr std::uint32_t MAX_HEIGHT_LIMIT = 63;

        explicit SumTree(store::IEntityStore & store, std::uint32_t max_height = DEFAULT_MAX_HEIGHT);

        /**
         * @brief Number of trailing zero bits of `index + 1`.
         */
        static std::uint32_t heightFromIndex(std::uint64_t index) noexcept;

        static std::string nodeKey(std::uint64_t tree_id, std::uint64_t index);

        std::uint32_t maxHeight() const noexcept;

        std::uint64_t capacity() const noexcept;

        /**
         * @brief Adds `delta` to the weight of `leaf`.
         *
         * @return false if the leaf is outside the tree or a node could not be saved.
         */
        bool inc(std::uint64_t tree_id, std::uint64_t leaf, std::uint64_t delta);

        /**
         * @brief Subtracts `delta` from the weight of `leaf` at `epoch`.
         *
         * At most the current weight of `leaf` is removed, the same amount from every
         * node on its path. Every touched node remembers its sum before the update and
         * the epoch. A leaf without weight is left untouched and the call succeeds.
         */
        bool dec(std::uint64_t tree_id, std::uint64_t leaf, std::uint64_t delta, std::uint64_t epoch);

        /**
         * @brief Weighted selection over the first `leaf_count` leaves.
         *
         * Finds the leaf whose cumulative range contains `target`.
         *
         * @return std::nullopt when `target` is not below the total weight of those leaves.
         */
        std::optional<Selection> select(std::uint64_t tree_id, std::uint64_t target, std::uint64_t leaf_count) const;

        /**
         * @brief Total weight of leaves [0, end).
         */
        std::uint64_t prefixSum(std::uint64_t tree_id, std::uint64_t end) const;

        /**
         * @brief Total weight of leaves [first, last).
         */
        std::uint64_t rangeSum(std::uint64_t tree_id, std::uint64_t first, std::uint64_t last) const;

        std::uint64_t leafWeight(std::uint64_t tree_id, std::uint64_t leaf) const;

        std::optional<SumTreeCount> node(std::uint64_t tree_id, std::uint64_t index) const;

    private:
        std::uint64_t _subtreeSum(std::uint64_t tree_id, std::uint64_t index) const;

        store::IEntityStore & _store;
        std::uint32_t _max_height;
    };
}
