#pragma once

#include <optional>
#include <string>

#include <google/protobuf/descriptor.h>
#include <google/protobuf/message.h>

namespace pdp::store
{
    /**
     * @brief Persistent repository of protobuf records.
     *
     * Keys are scoped per record type, so a DataSet and a Rail may share the same key.
     */
    class IEntityStore
    {
    public:
        virtual ~IEntityStore() = default;

        /**
         * @brief Fills `out` with the record stored under `key`.
         *
         * @return false when no record of the type of `out` exists under `key`.
         */
        virtual bool load(const std::string & key, google::protobuf::Message & out) const = 0;

        /**
         * @brief Inserts or replaces the record stored under `key`.
         */
        virtual bool save(const std::string & key, const google::protobuf::Message & record) = 0;
    };

    /**
     * @brief Unqualified message name, e.g. "DataSet". Used to scope keys.
     */
    inline std::string recordTypeName(const google::protobuf::Message & record)
    {
        return std::string(record.GetDescriptor()->name());
    }

    template<class RecordT>
    std::optional<RecordT> load(const IEntityStore & store, const std::string & key)
    {
        RecordT record;
        if(!store.load(key, record)) return std::nullopt;
        return record;
    }

    /**
     * @brief Fresh record with its `id` set. Nothing is written until it is saved.
     */
    template<class RecordT>
    RecordT create(const std::string & key)
    {
        RecordT record;
        record.set_id(key);
        return record;
    }

    template<class RecordT>
    RecordT loadOrCreate(const IEntityStore & store, const std::string & key)
    {
        auto record = load<RecordT>(store, key);
        if(record) return std::move(*record);
        return create<RecordT>(key);
    }

    /**
     * @brief Saves a record under its own `id`.
     */
    template<class RecordT>
    bool save(IEntityStore & store, const RecordT & record)
    {
        return store.save(record.id(), record);
    }
}
