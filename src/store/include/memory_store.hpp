#pragma once

#include <cstddef>
#include <string>

#include <absl/container/flat_hash_map.h>

#include "store.hpp"

namespace pdp::store
{
    class MemoryStore final : public IEntityStore
    {
    public:
        MemoryStore() = default;

        bool load(const std::string & key, google::protobuf::Message & out) const override;

        bool save(const std::string & key, const google::protobuf::Message & record) override;

        std::size_t size() const noexcept;

        bool contains(const std::string & type_name, const std::string & key) const;

    private:
        static std::string _scopedKey(const std::string & type_name, const std::string & key);

        // "<message type>/<key>" -> serialized record
        absl::flat_hash_map<std::string, std::string> _records;
    };
}
