#pragma once

#include <filesystem>
#include <string>

#include "store.hpp"

namespace pdp::store
{
    /**
     * @brief Store keeping one protobuf-JSON file per record.
     *
     * Records live under `<root>/<message type>/<key>.json`. Characters that are not
     * valid in file names are replaced by '_' in the key.
     * Every save is written through to disk.
     */
    class JsonFileStore final : public IEntityStore
    {
    public:
        explicit JsonFileStore(std::filesystem::path root);

        const std::filesystem::path & root() const noexcept;

        bool load(const std::string & key, google::protobuf::Message & out) const override;

        bool save(const std::string & key, const google::protobuf::Message & record) override;

        std::filesystem::path recordPath(const std::string & type_name, const std::string & key) const;

    private:
        std::filesystem::path _root;
    };
}
