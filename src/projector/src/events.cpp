#include "events.hpp"

#include <absl/container/flat_hash_map.h>

#include "crypto.hpp"

namespace pdp::projector
{
    namespace
    {
        struct TopicTable
        {
            std::array<evmc::bytes32, EVENT_SIGNATURES.size()> topics{};
            absl::flat_hash_map<evmc::bytes32, EventKind> kinds;
        };

        const TopicTable & _topicTable()
        {
            static const TopicTable table = []()
            {
                TopicTable t;
                for(std::size_t i = 0; i < EVENT_SIGNATURES.size(); ++i)
                {
                    t.topics[i] = crypto::constructEventTopic(EVENT_SIGNATURES[i].signature);
                    t.kinds.emplace(t.topics[i], EVENT_SIGNATURES[i].kind);
                }
                return t;
            }();
            return table;
        }

        std::size_t _indexOf(EventKind kind)
        {
            for(std::size_t i = 0; i < EVENT_SIGNATURES.size(); ++i)
            {
                if(EVENT_SIGNATURES[i].kind == kind) return i;
            }
            return EVENT_SIGNATURES.size();
        }
    }

    const EventSignature & signatureOf(EventKind kind)
    {
        static const EventSignature unknown{};
        const std::size_t index = _indexOf(kind);
        if(index == EVENT_SIGNATURES.size()) return unknown;
        return EVENT_SIGNATURES[index];
    }

    const evmc::bytes32 & eventTopic(EventKind kind)
    {
        static const evmc::bytes32 zero{};
        const std::size_t index = _indexOf(kind);
        if(index == EVENT_SIGNATURES.size()) return zero;
        return _topicTable().topics[index];
    }

    EventKind classifyTopic(const evmc::bytes32 & topic0)
    {
        const auto & kinds = _topicTable().kinds;
        const auto it = kinds.find(topic0);
        if(it == kinds.end()) return EventKind::UNKNOWN;
        return it->second;
    }
}
