#include "crosslane/transport/local_transport.hpp"
#include "crosslane/codec/payload_codec.hpp"
#include "crosslane/core/format.hpp"
#include "crosslane/crypto/sodium_interop.hpp"
#include "crosslane/observability/logging.hpp"
#include <array>
#include <span>

namespace crosslane::relay::transport {
    using codec::PayloadCodec;
    using crypto::SodiumInterop;
    using observability::StringField;
    using observability::UIntField;

    namespace {
        struct Credit {
            AssetType asset;
            Amount amount;
        };

        // Moves each credit from `from` to `to`; on failure returns the ones already moved.
        Result<Unit, RelayFailure> MoveAll(IAssetLedger &ledger, const Address &from, const Address &to,
                                           const std::vector<Credit> &credits) {
            for (size_t i = 0; i < credits.size(); ++i) {
                auto moved = ledger.Transfer(credits[i].asset, from, to, credits[i].amount);
                if (moved.IsOk()) {
                    continue;
                }
                for (size_t j = i; j-- > 0;) {
                    if (auto back = ledger.Transfer(credits[j].asset, to, from, credits[j].amount); back.IsErr()) {
                        CROSSLANE_LOG_ERROR("Transport could not return a partial transfer", {
                            StringField("asset", credits[j].asset.value),
                            UIntField("amount", credits[j].amount),
                            StringField("error", back.UnwrapErr().message)
                        });
                    }
                }
                return moved;
            }
            return Result<Unit, RelayFailure>::Ok(unit);
        }
    }

    LocalTransport::LocalTransport(FeeSchedule schedule)
        : schedule_(schedule) {
    }

    Result<Unit, RelayFailure> LocalTransport::RegisterNetwork(const NetworkId network,
                                                               std::shared_ptr<IAssetLedger> ledger,
                                                               Address collector) {
        if (!ledger || collector.IsNull()) {
            return Result<Unit, RelayFailure>::Err(
                RelayFailure::InvalidInput("Network registration requires a ledger and a collector"));
        }
        std::lock_guard guard(lock_);
        Route &route = routes_[network];
        route.ledger = std::move(ledger);
        route.collector = std::move(collector);
        return Result<Unit, RelayFailure>::Ok(unit);
    }

    Result<Unit, RelayFailure> LocalTransport::RegisterEndpoint(const NetworkId network,
                                                                std::weak_ptr<IRelayEndpoint> endpoint,
                                                                Address node_address) {
        std::lock_guard guard(lock_);
        const auto it = routes_.find(network);
        if (it == routes_.end()) {
            return Result<Unit, RelayFailure>::Err(
                RelayFailure::InvalidInput(compat::format("Network {} is not registered", network.value)));
        }
        if (endpoint.expired() || node_address.IsNull()) {
            return Result<Unit, RelayFailure>::Err(
                RelayFailure::InvalidInput("Endpoint registration requires a live endpoint and its address"));
        }
        it->second.endpoint = std::move(endpoint);
        it->second.node_address = std::move(node_address);
        return Result<Unit, RelayFailure>::Ok(unit);
    }

    void LocalTransport::SetFeeSchedule(const FeeSchedule schedule) {
        std::lock_guard guard(lock_);
        schedule_ = schedule;
    }

    void LocalTransport::FailNextDispatch() {
        std::lock_guard guard(lock_);
        fail_next_dispatch_ = true;
    }

    Result<Amount, RelayFailure> LocalTransport::Quote(const NetworkId destination, const Message &message) const {
        std::lock_guard guard(lock_);
        return QuoteLocked(destination, message);
    }

    Result<Amount, RelayFailure> LocalTransport::QuoteLocked(const NetworkId destination,
                                                             const Message &message) const {
        if (!routes_.contains(destination)) {
            return Result<Amount, RelayFailure>::Err(
                RelayFailure::TransportFailed(compat::format("Unknown destination network {}", destination.value)));
        }
        const Amount transfers = static_cast<Amount>(message.asset_transfers.size());
        const Amount bytes = static_cast<Amount>(message.payload.size());
        if ((bytes != 0 && schedule_.fee_per_byte > UINT64_MAX / bytes) ||
            (transfers != 0 && schedule_.fee_per_transfer > UINT64_MAX / transfers)) {
            return Result<Amount, RelayFailure>::Err(
                RelayFailure::TransportFailed(std::string(ErrorMessages::AMOUNT_OVERFLOW)));
        }
        const auto partial = CheckedAdd(schedule_.base_fee, schedule_.fee_per_byte * bytes);
        const auto total = partial.has_value()
                               ? CheckedAdd(*partial, schedule_.fee_per_transfer * transfers)
                               : std::nullopt;
        if (!total.has_value()) {
            return Result<Amount, RelayFailure>::Err(
                RelayFailure::TransportFailed(std::string(ErrorMessages::AMOUNT_OVERFLOW)));
        }
        return Result<Amount, RelayFailure>::Ok(*total);
    }

    Result<MessageId, RelayFailure> LocalTransport::Dispatch(const NetworkId destination, const Message &message,
                                                             const FeeAuthorization &authorization) {
        Route source;
        uint64_t sequence = 0;
        {
            std::lock_guard guard(lock_);
            if (fail_next_dispatch_) {
                fail_next_dispatch_ = false;
                return Result<MessageId, RelayFailure>::Err(
                    RelayFailure::TransportFailed("Transport refused the dispatch"));
            }
            if (message.destination_network != destination) {
                return Result<MessageId, RelayFailure>::Err(
                    RelayFailure::TransportFailed("Message addressed to a different destination"));
            }
            if (message.sender.IsNull() || message.asset_transfers.empty()) {
                return Result<MessageId, RelayFailure>::Err(
                    RelayFailure::TransportFailed("Message has no sender or no asset transfer"));
            }
            const auto source_it = routes_.find(message.source_network);
            if (source_it == routes_.end()) {
                return Result<MessageId, RelayFailure>::Err(
                    RelayFailure::TransportFailed(
                        compat::format("Unknown source network {}", message.source_network.value)));
            }
            auto quoted = QuoteLocked(destination, message);
            if (quoted.IsErr()) {
                return Result<MessageId, RelayFailure>::Err(std::move(quoted).UnwrapErr());
            }
            if (authorization.fee_amount < quoted.Unwrap()) {
                return Result<MessageId, RelayFailure>::Err(
                    RelayFailure::TransportFailed(
                        compat::format("Authorized fee {} is below quote {}",
                                       authorization.fee_amount, quoted.Unwrap())));
            }
            source = source_it->second;
            sequence = sequence_++;
        }

        // Nothing is collected for a message that cannot be given an id.
        auto id = DeriveId(message, sequence);
        if (id.IsErr()) {
            return id;
        }
        CROSSLANE_TRY(Collect(source, authorization, message));

        std::lock_guard guard(lock_);
        Message queued = message;
        queued.id = id.Unwrap();
        dispatched_.emplace(queued.id, queued);
        pending_.push_back(std::move(queued));
        CROSSLANE_LOG_DEBUG("Transport queued message", {
            StringField("id", id.Unwrap().ToHex()),
            UIntField("sequence", sequence),
            UIntField("destination", destination.value)
        });
        return id;
    }

    Result<Address, RelayFailure> LocalTransport::GetCollectorAddress(const NetworkId network) const {
        std::lock_guard guard(lock_);
        const auto it = routes_.find(network);
        if (it == routes_.end()) {
            return Result<Address, RelayFailure>::Err(
                RelayFailure::TransportFailed(compat::format("Unknown network {}", network.value)));
        }
        return Result<Address, RelayFailure>::Ok(it->second.collector);
    }

    std::optional<DeliveryOutcome> LocalTransport::DeliverNext() {
        Message next;
        {
            std::lock_guard guard(lock_);
            if (pending_.empty()) {
                return std::nullopt;
            }
            next = std::move(pending_.front());
            pending_.pop_front();
        }
        return DeliveryOutcome{next.id, Handover(next)};
    }

    std::vector<DeliveryOutcome> LocalTransport::DeliverAll() {
        std::vector<DeliveryOutcome> outcomes;
        while (auto outcome = DeliverNext()) {
            outcomes.push_back(std::move(*outcome));
        }
        return outcomes;
    }

    Result<Unit, RelayFailure> LocalTransport::Redeliver(const MessageId &id) {
        auto message = FindDispatched(id);
        if (!message.has_value()) {
            return Result<Unit, RelayFailure>::Err(
                RelayFailure::InvalidInput(compat::format("Unknown message {}", id.ToHex())));
        }
        return Handover(*message);
    }

    size_t LocalTransport::PendingCount() const {
        std::lock_guard guard(lock_);
        return pending_.size();
    }

    std::optional<Message> LocalTransport::FindDispatched(const MessageId &id) const {
        std::lock_guard guard(lock_);
        const auto it = dispatched_.find(id);
        if (it == dispatched_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    Result<Unit, RelayFailure> LocalTransport::Collect(const Route &source, const FeeAuthorization &authorization,
                                                       const Message &message) {
        std::vector<std::pair<AssetType, Amount>> pulled;
        auto pull = [&](const AssetType &asset, const Amount amount) -> Result<Unit, RelayFailure> {
            if (amount == RelayConstants::ZERO_AMOUNT) {
                return Result<Unit, RelayFailure>::Ok(unit);
            }
            auto taken = source.ledger->TransferFrom(asset, source.collector, authorization.payer,
                                                     source.collector, amount);
            if (taken.IsErr()) {
                return Result<Unit, RelayFailure>::Err(
                    RelayFailure::TransportFailed(
                        compat::format("Could not collect {} {}: {}", amount, asset.value,
                                       taken.UnwrapErr().message)));
            }
            pulled.emplace_back(asset, amount);
            return Result<Unit, RelayFailure>::Ok(unit);
        };

        auto collected = pull(authorization.fee_asset, authorization.fee_amount);
        for (const auto &[asset, amount]: message.asset_transfers) {
            if (collected.IsErr()) {
                break;
            }
            collected = pull(asset, amount);
        }
        if (collected.IsErr()) {
            for (auto it = pulled.rbegin(); it != pulled.rend(); ++it) {
                if (auto back = source.ledger->Transfer(it->first, source.collector, authorization.payer, it->second);
                    back.IsErr()) {
                    CROSSLANE_LOG_ERROR("Transport could not return a collected amount", {
                        StringField("asset", it->first.value),
                        UIntField("amount", it->second),
                        StringField("error", back.UnwrapErr().message)
                    });
                }
            }
        }
        return collected;
    }

    Result<MessageId, RelayFailure> LocalTransport::DeriveId(const Message &message, const uint64_t sequence) const {
        if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
            return Result<MessageId, RelayFailure>::Err(RelayFailure::FromSodiumFailure(init.UnwrapErr()));
        }
        auto envelope = PayloadCodec::EncodeEnvelope(message, sequence);
        if (envelope.IsErr()) {
            return Result<MessageId, RelayFailure>::Err(std::move(envelope).UnwrapErr());
        }
        const auto &domain = TransportConstants::MESSAGE_ID_DOMAIN;
        const std::array<std::span<const uint8_t>, 2> parts = {
            std::span(reinterpret_cast<const uint8_t *>(domain.data()), domain.size()),
            std::span<const uint8_t>(envelope.Unwrap())
        };
        auto digest = SodiumInterop::GenericHash(parts, RelayConstants::MESSAGE_ID_SIZE);
        if (digest.IsErr()) {
            return Result<MessageId, RelayFailure>::Err(RelayFailure::FromSodiumFailure(digest.UnwrapErr()));
        }
        return MessageId::FromBytes(digest.Unwrap());
    }

    Result<Unit, RelayFailure> LocalTransport::Handover(const Message &message) {
        Route destination;
        {
            std::lock_guard guard(lock_);
            const auto it = routes_.find(message.destination_network);
            if (it == routes_.end()) {
                return Result<Unit, RelayFailure>::Err(
                    RelayFailure::TransportFailed(
                        compat::format("Unknown destination network {}", message.destination_network.value)));
            }
            destination = it->second;
        }
        const auto endpoint = destination.endpoint.lock();
        if (!endpoint) {
            return Result<Unit, RelayFailure>::Err(
                RelayFailure::TransportFailed(
                    compat::format("No live endpoint on network {}", message.destination_network.value)));
        }

        std::vector<Credit> credits;
        credits.reserve(message.asset_transfers.size());
        for (const auto &[asset, amount]: message.asset_transfers) {
            credits.push_back(Credit{asset, amount});
        }
        if (auto credited = MoveAll(*destination.ledger, destination.collector, destination.node_address, credits);
            credited.IsErr()) {
            return Result<Unit, RelayFailure>::Err(
                RelayFailure::TransportFailed(
                    compat::format("Destination pool cannot fund message {}: {}",
                                   message.id.ToHex(), credited.UnwrapErr().message)));
        }

        auto delivered = endpoint->Deliver(message);
        if (delivered.IsErr()) {
            if (auto reclaimed = MoveAll(*destination.ledger, destination.node_address, destination.collector,
                                         credits); reclaimed.IsErr()) {
                CROSSLANE_LOG_ERROR("Transport could not reclaim an undelivered credit", {
                    StringField("id", message.id.ToHex()),
                    StringField("error", reclaimed.UnwrapErr().message)
                });
            }
        }
        return delivered;
    }
}
