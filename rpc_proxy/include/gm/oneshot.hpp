/*
    This file is part of gm wallet (devrpc).

    gm wallet is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 2 of the License, or
    (at your option) any later version.

    gm wallet is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with gm wallet.  If not, see <http://www.gnu.org/licenses/>.

    This program is released under the GPL with the additional exemption
    that compiling, linking, and/or using OpenSSL is allowed.
    You are free to remove this exemption from derived works.
*/

#pragma once
#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include "gm/rpc_types.hpp"

namespace gm {

namespace detail {

struct ReplySlot {
    std::mutex mtx;
    std::condition_variable cv;
    std::optional<ResponsePayload> value;
    bool sender_alive = true;
    bool receiver_alive = true;
};

} // namespace detail

using CancelFn = std::function<bool()>;

enum class RecvStatus { received, timed_out, sender_dropped, cancelled };

// Sending half of a single-use reply channel. Destroying it without
// calling send() wakes the receiver with sender_dropped.
class ReplySender {
    std::shared_ptr<detail::ReplySlot> slot_;

public:
    ReplySender() = default;
    explicit ReplySender(std::shared_ptr<detail::ReplySlot> slot) : slot_(std::move(slot)) {}
    ReplySender(ReplySender&&) noexcept = default;
    ReplySender& operator=(ReplySender&& o) noexcept {
        if (this != &o) {
            close();
            slot_ = std::move(o.slot_);
        }
        return *this;
    }
    ReplySender(const ReplySender&) = delete;
    ReplySender& operator=(const ReplySender&) = delete;
    ~ReplySender() { close(); }

    explicit operator bool() const { return slot_ != nullptr; }

    // Consumes the sender. False if it was already used or the receiver
    // is gone (timeout, client disconnect).
    bool send(ResponsePayload payload) {
        if (!slot_) return false;
        bool delivered = false;
        {
            std::lock_guard<std::mutex> lock(slot_->mtx);
            if (slot_->receiver_alive) {
                slot_->value = std::move(payload);
                delivered = true;
            }
            slot_->sender_alive = false;
        }
        slot_->cv.notify_all();
        slot_.reset();
        return delivered;
    }

    // True once nobody will ever read a reply.
    bool is_closed() const {
        if (!slot_) return true;
        std::lock_guard<std::mutex> lock(slot_->mtx);
        return !slot_->receiver_alive;
    }

private:
    void close() {
        if (!slot_) return;
        {
            std::lock_guard<std::mutex> lock(slot_->mtx);
            slot_->sender_alive = false;
        }
        slot_->cv.notify_all();
        slot_.reset();
    }
};

class ReplyReceiver {
    std::shared_ptr<detail::ReplySlot> slot_;

public:
    // granularity of cancellation checks while waiting
    static constexpr std::chrono::milliseconds POLL_INTERVAL{100};

    ReplyReceiver() = default;
    explicit ReplyReceiver(std::shared_ptr<detail::ReplySlot> slot) : slot_(std::move(slot)) {}
    ReplyReceiver(ReplyReceiver&&) noexcept = default;
    ReplyReceiver& operator=(ReplyReceiver&& o) noexcept {
        if (this != &o) {
            close();
            slot_ = std::move(o.slot_);
        }
        return *this;
    }
    ReplyReceiver(const ReplyReceiver&) = delete;
    ReplyReceiver& operator=(const ReplyReceiver&) = delete;
    ~ReplyReceiver() { close(); }

    explicit operator bool() const { return slot_ != nullptr; }

    // Blocks until a payload arrives, the sender is dropped, the timeout
    // expires or cancelled() turns true. The receiver is consumed in
    // every case.
    RecvStatus wait(std::chrono::milliseconds timeout, const CancelFn& cancelled,
                    ResponsePayload& out) {
        if (!slot_) return RecvStatus::sender_dropped;
        auto deadline = std::chrono::steady_clock::now() + timeout;
        RecvStatus status = RecvStatus::timed_out;
        {
            std::unique_lock<std::mutex> lock(slot_->mtx);
            for (;;) {
                if (slot_->value) {
                    out = std::move(*slot_->value);
                    slot_->value.reset();
                    status = RecvStatus::received;
                    break;
                }
                if (!slot_->sender_alive) {
                    status = RecvStatus::sender_dropped;
                    break;
                }
                auto now = std::chrono::steady_clock::now();
                if (now >= deadline) {
                    status = RecvStatus::timed_out;
                    break;
                }
                if (cancelled && cancelled()) {
                    status = RecvStatus::cancelled;
                    break;
                }
                auto until = cancelled ? std::min(deadline, now + POLL_INTERVAL) : deadline;
                slot_->cv.wait_until(lock, until);
            }
            slot_->receiver_alive = false;
        }
        slot_.reset();
        return status;
    }

    RecvStatus wait(std::chrono::milliseconds timeout, ResponsePayload& out) {
        return wait(timeout, CancelFn(), out);
    }

private:
    void close() {
        if (!slot_) return;
        {
            std::lock_guard<std::mutex> lock(slot_->mtx);
            slot_->receiver_alive = false;
            slot_->value.reset();
        }
        slot_.reset();
    }
};

inline std::pair<ReplySender, ReplyReceiver> make_reply_channel() {
    auto slot = std::make_shared<detail::ReplySlot>();
    return {ReplySender(slot), ReplyReceiver(slot)};
}

} // namespace gm
