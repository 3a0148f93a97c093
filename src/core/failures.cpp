#include "crosslane/core/failures.hpp"

namespace crosslane::relay {
    std::string_view ToString(const RelayFailureType type) noexcept {
        switch (type) {
            case RelayFailureType::ChainNotAllowed: return "ChainNotAllowed";
            case RelayFailureType::TokenNotAllowed: return "TokenNotAllowed";
            case RelayFailureType::SenderNotAllowed: return "SenderNotAllowed";
            case RelayFailureType::InvalidReceiver: return "InvalidReceiver";
            case RelayFailureType::InvalidAmount: return "InvalidAmount";
            case RelayFailureType::InsufficientFeeBalance: return "InsufficientFeeBalance";
            case RelayFailureType::ReplayedMessage: return "ReplayedMessage";
            case RelayFailureType::TransferFailed: return "TransferFailed";
            case RelayFailureType::NothingToWithdraw: return "NothingToWithdraw";
            case RelayFailureType::Unauthorized: return "Unauthorized";
            case RelayFailureType::UnsupportedSettlement: return "UnsupportedSettlement";
            case RelayFailureType::PayloadNotSupported: return "PayloadNotSupported";
            case RelayFailureType::DecodeFailed: return "DecodeFailed";
            case RelayFailureType::TransportFailed: return "TransportFailed";
            case RelayFailureType::InvalidInput: return "InvalidInput";
            case RelayFailureType::InvalidConfiguration: return "InvalidConfiguration";
        }
        return "Unknown";
    }
}
