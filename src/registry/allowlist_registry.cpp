#include "crosslane/registry/allowlist_registry.hpp"
#include <string>

namespace crosslane::relay {
    std::string_view ToString(const AllowlistKind kind) noexcept {
        switch (kind) {
            case AllowlistKind::DestinationNetwork: return "destination_network";
            case AllowlistKind::SourceNetwork: return "source_network";
            case AllowlistKind::Asset: return "asset";
            case AllowlistKind::Sender: return "sender";
        }
        return "unknown";
    }
}

namespace crosslane::relay::registry {
    bool AllowlistRegistry::IsDestinationAllowed(const NetworkId network) const {
        return destinations_.contains(network);
    }

    bool AllowlistRegistry::IsSourceAllowed(const NetworkId network) const {
        return sources_.contains(network);
    }

    bool AllowlistRegistry::IsAssetAllowed(const AssetType &asset) const {
        return assets_.contains(asset);
    }

    bool AllowlistRegistry::IsSenderAllowed(const Address &sender) const {
        return senders_.contains(sender);
    }

    void AllowlistRegistry::SetDestinationAllowed(const NetworkId network, const bool allowed,
                                                  OperationJournal &journal) {
        Apply(destinations_, network, allowed, AllowlistKind::DestinationNetwork,
              std::to_string(network.value), journal);
    }

    void AllowlistRegistry::SetSourceAllowed(const NetworkId network, const bool allowed,
                                             OperationJournal &journal) {
        Apply(sources_, network, allowed, AllowlistKind::SourceNetwork,
              std::to_string(network.value), journal);
    }

    void AllowlistRegistry::SetAssetAllowed(const AssetType &asset, const bool allowed,
                                            OperationJournal &journal) {
        Apply(assets_, asset, allowed, AllowlistKind::Asset, asset.value, journal);
    }

    void AllowlistRegistry::SetSenderAllowed(const Address &sender, const bool allowed,
                                             OperationJournal &journal) {
        Apply(senders_, sender, allowed, AllowlistKind::Sender, sender.value, journal);
    }

    size_t AllowlistRegistry::Size(const AllowlistKind kind) const noexcept {
        switch (kind) {
            case AllowlistKind::DestinationNetwork: return destinations_.size();
            case AllowlistKind::SourceNetwork: return sources_.size();
            case AllowlistKind::Asset: return assets_.size();
            case AllowlistKind::Sender: return senders_.size();
        }
        return 0;
    }

    template<typename Key, typename Hash>
    void AllowlistRegistry::Apply(std::unordered_set<Key, Hash> &set,
                                  const Key &key,
                                  const bool allowed,
                                  const AllowlistKind kind,
                                  std::string identifier,
                                  OperationJournal &journal) {
        const bool was_allowed = set.contains(key);
        if (allowed) {
            set.insert(key);
        } else {
            set.erase(key);
        }
        journal.Record("allowlist update", [&set, key, was_allowed]() {
            if (was_allowed) {
                set.insert(key);
            } else {
                set.erase(key);
            }
            return Result<Unit, RelayFailure>::Ok(unit);
        });
        // Emitted on every call, including ones that leave membership unchanged.
        journal.Defer([event = AllowlistChangedEvent{kind, std::move(identifier), allowed}](
            IRelayEventHandler &handler) {
                handler.OnAllowlistChanged(event);
            });
    }
}
