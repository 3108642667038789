#include "memory_store.hpp"

#include <spdlog/spdlog.h>

namespace pdp::store
{
    std::string MemoryStore::_scopedKey(const std::string & type_name, const std::string & key)
    {
        return type_name + "/" + key;
    }

    bool MemoryStore::load(const std::string & key, google::protobuf::Message & out) const
    {
        const auto it = _records.find(_scopedKey(recordTypeName(out), key));
        if(it == _records.end())
        {
            return false;
        }

        out.Clear();
        if(!out.ParseFromString(it->second))
        {
            spdlog::error("Corrupted {} record '{}'", recordTypeName(out), key);
            return false;
        }
        return true;
    }

    bool MemoryStore::save(const std::string & key, const google::protobuf::Message & record)
    {
        std::string serialized;
        if(!record.SerializeToString(&serialized))
        {
            spdlog::error("Failed to serialize {} record '{}'", recordTypeName(record), key);
            return false;
        }

        _records.insert_or_assign(_scopedKey(recordTypeName(record), key), std::move(serialized));
        return true;
    }

    std::size_t MemoryStore::size() const noexcept
    {
        return _records.size();
    }

    bool MemoryStore::contains(const std::string & type_name, const std::string & key) const
    {
        return _records.contains(_scopedKey(type_name, key));
    }
}
