#pragma once
#include "crosslane/core/result.hpp"
#include "crosslane/core/failures.hpp"
#include "crosslane/core/types.hpp"
#include "crosslane/codec/payload_codec.hpp"
#include "crosslane/configuration/relay_config.hpp"
#include "crosslane/custody/custody.hpp"
#include "crosslane/registry/allowlist_registry.hpp"
#include "crosslane/security/processed_message_ledger.hpp"
#include "crosslane/state/operation_journal.hpp"
#include <optional>
#include <vector>

namespace crosslane::relay {
    using configuration::RelayConfig;
    using custody::Custody;
    using registry::AllowlistRegistry;
    using security::ProcessedMessageLedger;
    using state::OperationJournal;

    struct ReceivedSnapshot {
        MessageId id;
        std::vector<uint8_t> data;
        AssetType asset;
        Amount amount = 0;
    };

    /**
     * @brief Applies messages handed over by the transport
     *
     * The id is marked processed before custody is released. Once marked, a
     * payload that cannot be decoded or names a disallowed asset consumes the
     * message: the mark commits, a MessageRejected event is emitted and the
     * failure is still reported to the transport. A failed release aborts the
     * whole delivery, mark included, so the message may be delivered again.
     */
    class InboundReceiver {
    public:
        InboundReceiver(const RelayConfig &config,
                        const AllowlistRegistry &registry,
                        ProcessedMessageLedger &processed,
                        Custody &custody);

        InboundReceiver(const InboundReceiver &) = delete;

        InboundReceiver &operator=(const InboundReceiver &) = delete;

        [[nodiscard]] Result<Unit, RelayFailure> Deliver(const Message &message, OperationJournal &journal);

        [[nodiscard]] const std::optional<ReceivedSnapshot> &LastReceived() const noexcept;

    private:
        [[nodiscard]] Result<Unit, RelayFailure> Authenticate(const Message &message) const;

        [[nodiscard]] Result<codec::RelayPayload, RelayFailure> Open(const Message &message) const;

        [[nodiscard]] Result<Unit, RelayFailure> Reject(const MessageId &id, RelayFailure failure,
                                                        OperationJournal &journal) const;

        void RecordSnapshot(ReceivedSnapshot snapshot, OperationJournal &journal);

        const RelayConfig &config_;
        const AllowlistRegistry &registry_;
        ProcessedMessageLedger &processed_;
        Custody &custody_;
        std::optional<ReceivedSnapshot> last_received_;
    };
}
