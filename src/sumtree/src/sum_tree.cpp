#include "sum_tree.hpp"

#include <algorithm>
#include <bit>
#include <format>

#include <spdlog/spdlog.h>

namespace pdp::sumtree
{
    SumTree::SumTree(store::IEntityStore & store, std::uint32_t max_height)
    : _store(store),
      _max_height(std::clamp<std::uint32_t>(max_height, 1, MAX_HEIGHT_LIMIT))
    {
        if(_max_height != max_height)
        {
            spdlog::warn("Sum tree height {} is out of range, using {}", max_height, _max_height);
        }
    }

    std::uint32_t SumTree::heightFromIndex(std::uint64_t index) noexcept
    {
        return static_cast<std::uint32_t>(std::countr_zero(index + 1));
    }

    std::string SumTree::nodeKey(std::uint64_t tree_id, std::uint64_t index)
    {
        return std::format("{}-{}", tree_id, index);
    }

    std::uint32_t SumTree::maxHeight() const noexcept
    {
        return _max_height;
    }

    std::uint64_t SumTree::capacity() const noexcept
    {
        return std::uint64_t{1} << _max_height;
    }

    std::optional<SumTreeCount> SumTree::node(std::uint64_t tree_id, std::uint64_t index) const
    {
        return store::load<SumTreeCount>(_store, nodeKey(tree_id, index));
    }

    std::uint64_t SumTree::_subtreeSum(std::uint64_t tree_id, std::uint64_t index) const
    {
        const auto entry = node(tree_id, index);
        if(!entry) return 0;
        return entry->subtree_sum();
    }

    bool SumTree::inc(std::uint64_t tree_id, std::uint64_t leaf, std::uint64_t delta)
    {
        if(leaf >= capacity())
        {
            spdlog::error("Leaf {} does not fit into tree {} of height {}", leaf, tree_id, _max_height);
            return false;
        }

        spdlog::debug("Tree {}: leaf {} += {}", tree_id, leaf, delta);

        for(std::uint64_t index = leaf; index < capacity(); index += std::uint64_t{1} << heightFromIndex(index))
        {
            SumTreeCount entry = store::loadOrCreate<SumTreeCount>(_store, nodeKey(tree_id, index));
            entry.set_tree_id(tree_id);
            entry.set_node_index(index);
            entry.set_subtree_sum(entry.subtree_sum() + delta);

            if(!store::save(_store, entry))
            {
                spdlog::error("Failed to save sum tree node {}", entry.id());
                return false;
            }
        }
        return true;
    }

    bool SumTree::dec(std::uint64_t tree_id, std::uint64_t leaf, std::uint64_t delta, std::uint64_t epoch)
    {
        const std::uint64_t weight = leafWeight(tree_id, leaf);
        if(weight == 0)
        {
            spdlog::debug("Tree {}: leaf {} has no weight, nothing to remove", tree_id, leaf);
            return true;
        }

        if(delta > weight)
        {
            spdlog::warn("Tree {}: leaf {} holds {} but {} is removed, removing {}", tree_id, leaf, weight, delta, weight);
            delta = weight;
        }

        spdlog::debug("Tree {}: leaf {} -= {} at epoch {}", tree_id, leaf, delta, epoch);

        // every node on the path covers the leaf, so none holds less than `delta`
        for(std::uint64_t index = leaf; index < capacity(); index += std::uint64_t{1} << heightFromIndex(index))
        {
            SumTreeCount entry = store::loadOrCreate<SumTreeCount>(_store, nodeKey(tree_id, index));
            entry.set_tree_id(tree_id);
            entry.set_node_index(index);

            const std::uint64_t previous = entry.subtree_sum();
            entry.set_last_leaf_weight(previous);
            entry.set_subtree_sum(previous - delta);
            entry.set_last_decay_epoch(epoch);

            if(!store::save(_store, entry))
            {
                spdlog::error("Failed to save sum tree node {}", entry.id());
                return false;
            }
        }
        return true;
    }

    std::optional<Selection> SumTree::select(std::uint64_t tree_id, std::uint64_t target, std::uint64_t leaf_count) const
    {
        const std::uint64_t leaves = std::min(leaf_count, capacity());
        if(leaves == 0)
        {
            return std::nullopt;
        }

        std::uint64_t position = 0;
        std::uint64_t remaining = target;
        for(std::uint64_t step = std::bit_floor(leaves); step > 0; step >>= 1)
        {
            if(position + step > leaves)
            {
                continue;
            }

            // node position + step - 1 covers exactly [position, position + step)
            const std::uint64_t sum = _subtreeSum(tree_id, position + step - 1);
            if(remaining >= sum)
            {
                position += step;
                remaining -= sum;
            }
        }

        if(position >= leaves)
        {
            return std::nullopt;
        }

        return Selection{.leaf = position, .offset = remaining};
    }

    std::uint64_t SumTree::prefixSum(std::uint64_t tree_id, std::uint64_t end) const
    {
        std::uint64_t sum = 0;
        for(std::uint64_t count = std::min(end, capacity()); count > 0; count &= count - 1)
        {
            sum += _subtreeSum(tree_id, count - 1);
        }
        return sum;
    }

    std::uint64_t SumTree::rangeSum(std::uint64_t tree_id, std::uint64_t first, std::uint64_t last) const
    {
        if(last <= first) return 0;

        const std::uint64_t upper = prefixSum(tree_id, last);
        const std::uint64_t lower = prefixSum(tree_id, first);
        return upper >= lower ? upper - lower : 0;
    }

    std::uint64_t SumTree::leafWeight(std::uint64_t tree_id, std::uint64_t leaf) const
    {
        return rangeSum(tree_id, leaf, leaf + 1);
    }
}
