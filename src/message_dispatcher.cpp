// SPDX-License-Identifier: MIT

// src/message_dispatcher.cpp
#include "src/message_dispatcher.hpp"

#include <exception>

#include <spdlog/spdlog.h>

#include "src/base58.hpp"

namespace geyser_pipe {

namespace {

template <typename... Fs>
struct Overloaded : Fs... {
    using Fs::operator()...;
};

}  // namespace

std::string_view SlotStatusName(geyser::SlotStatus status) {
    switch (status) {
        case geyser::SLOT_PROCESSED:
            return "processed";
        case geyser::SLOT_CONFIRMED:
            return "confirmed";
        case geyser::SLOT_FINALIZED:
            return "finalized";
        case geyser::SLOT_FIRST_SHRED_RECEIVED:
            return "first_shred_received";
        case geyser::SLOT_COMPLETED:
            return "completed";
        case geyser::SLOT_CREATED_BANK:
            return "created_bank";
        case geyser::SLOT_DEAD:
            return "dead";
        default:
            return "unknown";
    }
}

InboundUpdate Classify(const geyser::SubscribeUpdate& update) {
    using Case = geyser::SubscribeUpdate::UpdateOneofCase;

    switch (update.update_oneof_case()) {
        case Case::kSlot: {
            const auto& slot = update.slot();
            return SlotUpdate{
                .slot = slot.slot(),
                .parent = slot.has_parent() ? slot.parent() : 0,
                .status = std::string(SlotStatusName(slot.status())),
            };
        }
        case Case::kAccount: {
            const auto& account = update.account();
            AccountUpdate out{.slot = account.slot()};
            if (account.has_account()) {
                out.pubkey = EncodeBase58(account.account().pubkey());
                out.lamports = account.account().lamports();
            }
            return out;
        }
        case Case::kTransaction: {
            const auto& tx = update.transaction();
            TransactionUpdate out{.slot = tx.slot()};
            if (tx.has_transaction()) {
                out.signature = EncodeBase58(tx.transaction().signature());
            }
            return out;
        }
        case Case::kBlock:
            return BlockUpdate{
                .slot = update.block().slot(),
                .blockhash = update.block().blockhash(),
            };
        case Case::kPing:
            return PingUpdate{.id = update.ping().id()};
        case Case::kPong:
            return PongUpdate{.id = update.pong().id()};
        case Case::UPDATE_ONEOF_NOT_SET:
            return MissingUpdate{};
        default:
            return UnrecognizedUpdate{.field_number = static_cast<int>(update.update_oneof_case())};
    }
}

DispatchResult MessageDispatcher::Dispatch(const geyser::SubscribeUpdate& update) const noexcept {
    try {
        return Dispatch(Classify(update));
    } catch (const std::exception& e) {
        spdlog::error("Error handling message: {}", e.what());
        return DispatchResult::Stop;
    }
}

DispatchResult MessageDispatcher::Dispatch(const InboundUpdate& update) const noexcept {
    try {
        return std::visit(
            Overloaded{
                [](const SlotUpdate& u) {
                    spdlog::info("Slot update: slot={}, parent={}, status={}",
                                 u.slot, u.parent, u.status);
                    return DispatchResult::Continue;
                },
                [](const AccountUpdate& u) {
                    if (u.pubkey) {
                        spdlog::info("Account update: pubkey={}, slot={}, lamports={}",
                                     *u.pubkey, u.slot, u.lamports);
                    }
                    return DispatchResult::Continue;
                },
                [](const TransactionUpdate& u) {
                    if (u.signature) {
                        spdlog::info("Transaction update: slot={}, signature={}",
                                     u.slot, *u.signature);
                    }
                    return DispatchResult::Continue;
                },
                [](const BlockUpdate& u) {
                    spdlog::info("Block update: slot={}, blockhash={}", u.slot, u.blockhash);
                    return DispatchResult::Continue;
                },
                // Pings are answered by the session before dispatch
                [](const PingUpdate& u) {
                    spdlog::debug("Ping update: id={}", u.id);
                    return DispatchResult::Continue;
                },
                [](const PongUpdate& u) {
                    spdlog::info("Received pong response with id: {}", u.id);
                    return DispatchResult::Continue;
                },
                [](const MissingUpdate&) {
                    spdlog::error("Update not found in the message");
                    return DispatchResult::Stop;
                },
                [](const UnrecognizedUpdate& u) {
                    spdlog::warn("Received unknown update type (field {})", u.field_number);
                    return DispatchResult::Continue;
                },
            },
            update);
    } catch (const std::exception& e) {
        spdlog::error("Error handling message: {}", e.what());
        return DispatchResult::Stop;
    }
}

}  // namespace geyser_pipe
