// SPDX-License-Identifier: MIT

// src/message_dispatcher.hpp
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "geyser.pb.h"

namespace geyser_pipe {

struct SlotUpdate {
    uint64_t slot = 0;
    uint64_t parent = 0;   ///< 0 when the server omits it
    std::string status;    ///< "processed", "confirmed", ...
};

struct AccountUpdate {
    uint64_t slot = 0;
    std::optional<std::string> pubkey;  ///< base58; nullopt when the account record is absent
    uint64_t lamports = 0;
};

struct TransactionUpdate {
    uint64_t slot = 0;
    std::optional<std::string> signature;  ///< base58; nullopt when the transaction record is absent
};

struct BlockUpdate {
    uint64_t slot = 0;
    std::string blockhash;
};

struct PingUpdate {
    int32_t id = 0;
};

struct PongUpdate {
    int32_t id = 0;
};

/// Update carrying no variant at all. Ends the session.
struct MissingUpdate {};

/// Variant this client does not model (newer or unsubscribed schema case).
struct UnrecognizedUpdate {
    int field_number = 0;
};

/// One inbound update; exactly one alternative is active.
using InboundUpdate = std::variant<SlotUpdate, AccountUpdate, TransactionUpdate, BlockUpdate,
                                   PingUpdate, PongUpdate, MissingUpdate, UnrecognizedUpdate>;

enum class DispatchResult {
    Continue,
    Stop,
};

/// Lower-case name for a slot status ("confirmed", "first_shred_received", ...).
std::string_view SlotStatusName(geyser::SlotStatus status);

/// Map the wire message onto InboundUpdate.
InboundUpdate Classify(const geyser::SubscribeUpdate& update);

/// Stateless classification and logging of inbound updates.
///
/// Every variant logs a summary and continues, except MissingUpdate, which
/// logs an error and stops. Never throws: a fault while classifying is
/// logged and reported as Stop.
class MessageDispatcher {
public:
    DispatchResult Dispatch(const geyser::SubscribeUpdate& update) const noexcept;
    DispatchResult Dispatch(const InboundUpdate& update) const noexcept;
};

}  // namespace geyser_pipe
