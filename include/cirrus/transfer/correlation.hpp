/**
 * @file correlation.hpp
 * @brief Awaitable calls over the one-way orchestration channel
 *
 * WHY:
 * Replies from the orchestration service arrive as independent inbound
 * messages carrying the item id. The engine wants to write
 *
 *     auto urls = await_external(table, id, emit_request, 30s, "...");
 *
 * so each id gets a single-use slot (a promise) that the inbound handler
 * resolves.
 *
 * ORDERING:
 * The slot is registered before the request is emitted; a reply racing
 * ahead of the waiter still finds it.
 *
 * END STATES OF A SLOT:
 * - resolved with a reply or an explicit error
 * - timed out by the waiter (slot removed, late replies find no slot)
 * - failed by the engine (cancellation, staleness sweep, shutdown)
 * - receiver gone (the waiter abandoned the ticket before resolution)
 */

#pragma once

#include "cirrus/core/error.hpp"
#include "cirrus/transfer/types.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace cirrus::transfer {

enum class DeliveryStatus {
    Delivered,
    ReceiverGone,
    NoSlot
};

/**
 * @brief One-shot reply slots keyed by item id
 *
 * THREAD SAFETY:
 * open/deliver/fail may race freely; a slot is resolved at most once.
 */
template<typename Response>
class ReplyTable {
public:
    using Reply = TransferResult<Response>;

    class Ticket {
    public:
        const std::string& id() const { return id_; }

    private:
        friend class ReplyTable;

        Ticket(std::string id, std::uint64_t generation, std::future<Reply> future, std::shared_ptr<bool> receiver)
            : id_(std::move(id))
            , generation_(generation)
            , future_(std::move(future))
            , receiver_(std::move(receiver)) {}

        std::string id_;
        std::uint64_t generation_;
        std::future<Reply> future_;
        std::shared_ptr<bool> receiver_;
    };

    explicit ReplyTable(std::string name) : name_(std::move(name)) {}

    ReplyTable(const ReplyTable&) = delete;
    ReplyTable& operator=(const ReplyTable&) = delete;

    /// Register a slot for id; an older slot for the same id is failed as orphaned
    Ticket open(const std::string& id) {
        std::promise<Reply> promise;
        auto future = promise.get_future();
        auto receiver = std::make_shared<bool>(true);

        std::optional<std::promise<Reply>> superseded;
        std::uint64_t generation = 0;
        {
            std::lock_guard lock(mutex_);
            if (closed_) {
                promise.set_value(Reply(ErrValue<TransferError>(*closed_)));
                return Ticket(id, 0, std::move(future), std::move(receiver));
            }
            auto it = slots_.find(id);
            if (it != slots_.end()) {
                superseded = std::move(it->second.promise);
                slots_.erase(it);
            }
            generation = ++next_generation_;
            slots_.emplace(id, Slot{std::move(promise), receiver, generation});
        }

        if (superseded) {
            spdlog::warn("[Correlation] table={} id={} superseded by a newer request", name_, id);
            superseded->set_value(Fail<Response>(ErrorKind::Orphaned, "Superseded by a newer request"));
        }
        return Ticket(id, generation, std::move(future), std::move(receiver));
    }

    DeliveryStatus deliver(const std::string& id, Reply reply) {
        std::promise<Reply> promise;
        bool receiver_gone = false;
        {
            std::lock_guard lock(mutex_);
            auto it = slots_.find(id);
            if (it == slots_.end()) {
                return DeliveryStatus::NoSlot;
            }
            promise = std::move(it->second.promise);
            receiver_gone = it->second.receiver.expired();
            slots_.erase(it);
        }

        if (receiver_gone) {
            spdlog::debug("[Correlation] table={} id={} receiver gone", name_, id);
            return DeliveryStatus::ReceiverGone;
        }
        promise.set_value(std::move(reply));
        return DeliveryStatus::Delivered;
    }

    DeliveryStatus fail(const std::string& id, const TransferError& error) {
        return deliver(id, Reply(ErrValue<TransferError>(error)));
    }

    /**
     * @brief Resolve every open slot with error
     *
     * With close set, later open() calls resolve immediately with the same
     * error instead of waiting for a reply that can no longer arrive.
     */
    std::size_t fail_all(const TransferError& error, bool close = false) {
        std::unordered_map<std::string, Slot> drained;
        {
            std::lock_guard lock(mutex_);
            drained.swap(slots_);
            if (close) {
                closed_ = error;
            }
        }
        for (auto& [id, slot] : drained) {
            if (!slot.receiver.expired()) {
                slot.promise.set_value(Reply(ErrValue<TransferError>(error)));
            }
        }
        return drained.size();
    }

    /**
     * @brief Block until the slot resolves or timeout elapses
     *
     * On timeout the slot is removed so a late reply is reported as NoSlot.
     */
    Reply wait(Ticket& ticket, std::chrono::milliseconds timeout, const std::string& timeout_message) {
        if (ticket.future_.wait_for(timeout) != std::future_status::ready) {
            std::unique_lock lock(mutex_);
            auto it = slots_.find(ticket.id_);
            if (it != slots_.end() && it->second.generation == ticket.generation_) {
                slots_.erase(it);
                lock.unlock();
                spdlog::warn("[Correlation] table={} id={} timed out after {}ms", name_, ticket.id_, timeout.count());
                return Fail<Response>(ErrorKind::Timeout, timeout_message);
            }
            // Resolution already claimed the slot; its value is about to land
        }
        return ticket.future_.get();
    }

    std::size_t size() const {
        std::lock_guard lock(mutex_);
        return slots_.size();
    }

    [[nodiscard]] bool has_slot(const std::string& id) const {
        std::lock_guard lock(mutex_);
        return slots_.count(id) > 0;
    }

private:
    struct Slot {
        std::promise<Reply> promise;
        std::weak_ptr<bool> receiver;
        std::uint64_t generation;
    };

    std::string name_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Slot> slots_;
    std::uint64_t next_generation_ = 0;
    std::optional<TransferError> closed_;
};

/**
 * @brief The two reply tables of the engine
 *
 * Upload-URL negotiation and folder creation each have their own table so
 * a folder reply can never satisfy a file request with the same id.
 */
class CorrelationManager {
public:
    CorrelationManager() : upload_urls_("upload-urls"), folders_("folders") {}

    ReplyTable<UploadUrlsResponse>& upload_urls() { return upload_urls_; }
    ReplyTable<FolderResponse>& folders() { return folders_; }

    /**
     * @brief Register, emit, wait
     *
     * emit runs on the calling thread after the slot exists and may
     * deliver the reply synchronously.
     */
    template<typename Response, typename EmitFn>
    static TransferResult<Response> await_external(ReplyTable<Response>& table,
                                                   const std::string& id,
                                                   EmitFn&& emit,
                                                   std::chrono::milliseconds timeout,
                                                   const std::string& timeout_message) {
        auto ticket = table.open(id);
        emit();
        return table.wait(ticket, timeout, timeout_message);
    }

    /// Resolve whatever slot id holds in either table
    void fail_all_for(const std::string& id, const TransferError& error) {
        upload_urls_.fail(id, error);
        folders_.fail(id, error);
    }

    /// Resolve every slot and refuse new ones, used at shutdown
    std::size_t close_all(const TransferError& error) {
        return upload_urls_.fail_all(error, true) + folders_.fail_all(error, true);
    }

    std::size_t outstanding() const {
        return upload_urls_.size() + folders_.size();
    }

private:
    ReplyTable<UploadUrlsResponse> upload_urls_;
    ReplyTable<FolderResponse> folders_;
};

} // namespace cirrus::transfer
