#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
namespace crosslane::relay {
struct RelayConstants {
    static constexpr size_t MESSAGE_ID_SIZE = 32;
    static constexpr size_t ADMIN_CAPABILITY_SIZE = 32;
    static constexpr size_t DEFAULT_MAX_PAYLOAD_SIZE = 64 * 1024;
    static constexpr size_t MAX_PAYLOAD_SIZE_LIMIT = 10 * 1024 * 1024;
    static constexpr uint64_t ZERO_AMOUNT = 0;
    static constexpr size_t MIN_ADMIN_CAPABILITIES = 1;
};
struct TransportConstants {
    static constexpr uint64_t DEFAULT_BASE_FEE = 100;
    static constexpr uint64_t DEFAULT_FEE_PER_BYTE = 1;
    static constexpr uint64_t DEFAULT_FEE_PER_TRANSFER = 25;
    static constexpr uint64_t INITIAL_SEQUENCE = 1;
    static constexpr std::string_view MESSAGE_ID_DOMAIN = "crosslane-message-id-v1";
};
struct LoggingConstants {
    static constexpr std::string_view LOGGER_NAME = "crosslane";
    static constexpr std::string_view DEFAULT_LEVEL = "info";
    static constexpr std::string_view DEFAULT_PATTERN = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
    static constexpr std::string_view LEVEL_ENV = "CROSSLANE_LOG_LEVEL";
    static constexpr std::string_view PATTERN_ENV = "CROSSLANE_LOG_PATTERN";
};
struct ErrorMessages {
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
    static constexpr std::string_view NOT_INITIALIZED = "Libsodium not initialized";
    static constexpr std::string_view DESTINATION_NOT_ALLOWED = "Destination network is not allowlisted";
    static constexpr std::string_view SOURCE_NOT_ALLOWED = "Source network is not allowlisted";
    static constexpr std::string_view ASSET_NOT_ALLOWED = "Asset type is not allowlisted";
    static constexpr std::string_view SENDER_NOT_ALLOWED = "Sender is not allowlisted";
    static constexpr std::string_view NULL_RECEIVER = "Receiver must not be null";
    static constexpr std::string_view ZERO_AMOUNT = "Transfer amount must be greater than zero";
    static constexpr std::string_view ALREADY_PROCESSED = "Message already processed";
    static constexpr std::string_view NOT_AUTHORIZED = "Administrator capability not granted";
    static constexpr std::string_view NOTHING_TO_WITHDRAW = "Nothing to withdraw";
    static constexpr std::string_view PAYLOAD_ENCODE_FAILED = "Failed to serialize relay payload";
    static constexpr std::string_view PAYLOAD_DECODE_FAILED = "Failed to parse relay payload";
    static constexpr std::string_view AMOUNT_OVERFLOW = "Amount arithmetic overflow";
};
}
