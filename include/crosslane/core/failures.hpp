#pragma once
#include <string>
#include <string_view>
#include <cstdint>
namespace crosslane::relay {
enum class SodiumFailureType {
    InitializationFailed,
    BufferTooLarge,
    ComparisonFailed,
    HashFailed,
    InvalidOperation
};
enum class RelayFailureType : uint8_t {
    ChainNotAllowed,
    TokenNotAllowed,
    SenderNotAllowed,
    InvalidReceiver,
    InvalidAmount,
    InsufficientFeeBalance,
    ReplayedMessage,
    TransferFailed,
    NothingToWithdraw,
    Unauthorized,
    UnsupportedSettlement,
    PayloadNotSupported,
    DecodeFailed,
    TransportFailed,
    InvalidInput,
    InvalidConfiguration
};
[[nodiscard]] std::string_view ToString(RelayFailureType type) noexcept;
class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooLarge(std::string msg) {
        return {SodiumFailureType::BufferTooLarge, std::move(msg)};
    }
    static SodiumFailure ComparisonFailed(std::string msg) {
        return {SodiumFailureType::ComparisonFailed, std::move(msg)};
    }
    static SodiumFailure HashFailed(std::string msg) {
        return {SodiumFailureType::HashFailed, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
};
class RelayFailure {
public:
    RelayFailureType type;
    std::string message;
    RelayFailure(const RelayFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    [[nodiscard]] bool Is(const RelayFailureType t) const noexcept { return type == t; }
    static RelayFailure ChainNotAllowed(std::string msg) {
        return {RelayFailureType::ChainNotAllowed, std::move(msg)};
    }
    static RelayFailure TokenNotAllowed(std::string msg) {
        return {RelayFailureType::TokenNotAllowed, std::move(msg)};
    }
    static RelayFailure SenderNotAllowed(std::string msg) {
        return {RelayFailureType::SenderNotAllowed, std::move(msg)};
    }
    static RelayFailure InvalidReceiver(std::string msg) {
        return {RelayFailureType::InvalidReceiver, std::move(msg)};
    }
    static RelayFailure InvalidAmount(std::string msg) {
        return {RelayFailureType::InvalidAmount, std::move(msg)};
    }
    static RelayFailure InsufficientFeeBalance(std::string msg) {
        return {RelayFailureType::InsufficientFeeBalance, std::move(msg)};
    }
    static RelayFailure ReplayedMessage(std::string msg) {
        return {RelayFailureType::ReplayedMessage, std::move(msg)};
    }
    static RelayFailure TransferFailed(std::string msg) {
        return {RelayFailureType::TransferFailed, std::move(msg)};
    }
    static RelayFailure NothingToWithdraw(std::string msg) {
        return {RelayFailureType::NothingToWithdraw, std::move(msg)};
    }
    static RelayFailure Unauthorized(std::string msg) {
        return {RelayFailureType::Unauthorized, std::move(msg)};
    }
    static RelayFailure UnsupportedSettlement(std::string msg) {
        return {RelayFailureType::UnsupportedSettlement, std::move(msg)};
    }
    static RelayFailure PayloadNotSupported(std::string msg) {
        return {RelayFailureType::PayloadNotSupported, std::move(msg)};
    }
    static RelayFailure DecodeFailed(std::string msg) {
        return {RelayFailureType::DecodeFailed, std::move(msg)};
    }
    static RelayFailure TransportFailed(std::string msg) {
        return {RelayFailureType::TransportFailed, std::move(msg)};
    }
    static RelayFailure InvalidInput(std::string msg) {
        return {RelayFailureType::InvalidInput, std::move(msg)};
    }
    static RelayFailure InvalidConfiguration(std::string msg) {
        return {RelayFailureType::InvalidConfiguration, std::move(msg)};
    }
    static RelayFailure FromSodiumFailure(const SodiumFailure& sf) {
        return InvalidConfiguration(sf.message);
    }
};
}
