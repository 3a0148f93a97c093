#pragma once
#include "crosslane/core/types.hpp"
#include "crosslane/interfaces/i_relay_event_handler.hpp"
#include "crosslane/state/operation_journal.hpp"
#include <unordered_set>

namespace crosslane::relay::registry {
    using state::OperationJournal;

    // Four independent default-deny sets. Mutators are reached only through
    // AdminControl; each change is journaled and announced on commit.
    class AllowlistRegistry {
    public:
        AllowlistRegistry() = default;

        AllowlistRegistry(const AllowlistRegistry &) = delete;

        AllowlistRegistry &operator=(const AllowlistRegistry &) = delete;

        [[nodiscard]] bool IsDestinationAllowed(NetworkId network) const;

        [[nodiscard]] bool IsSourceAllowed(NetworkId network) const;

        [[nodiscard]] bool IsAssetAllowed(const AssetType &asset) const;

        [[nodiscard]] bool IsSenderAllowed(const Address &sender) const;

        void SetDestinationAllowed(NetworkId network, bool allowed, OperationJournal &journal);

        void SetSourceAllowed(NetworkId network, bool allowed, OperationJournal &journal);

        void SetAssetAllowed(const AssetType &asset, bool allowed, OperationJournal &journal);

        void SetSenderAllowed(const Address &sender, bool allowed, OperationJournal &journal);

        [[nodiscard]] size_t Size(AllowlistKind kind) const noexcept;

    private:
        template<typename Key, typename Hash>
        static void Apply(std::unordered_set<Key, Hash> &set,
                          const Key &key,
                          bool allowed,
                          AllowlistKind kind,
                          std::string identifier,
                          OperationJournal &journal);

        std::unordered_set<NetworkId, NetworkId::Hash> destinations_;
        std::unordered_set<NetworkId, NetworkId::Hash> sources_;
        std::unordered_set<AssetType, AssetType::Hash> assets_;
        std::unordered_set<Address, Address::Hash> senders_;
    };
}
