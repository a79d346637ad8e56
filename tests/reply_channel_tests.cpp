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

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <thread>
#include "gm/oneshot.hpp"
#include "test_support.hpp"

using gm_test::check;
using namespace std::chrono_literals;

namespace {

bool test_send_before_wait() {
    auto ch = gm::make_reply_channel();
    if (!check(ch.first.send(gm::ResponsePayload::success("0x110")), "send delivered")) return false;
    gm::ResponsePayload out;
    auto st = ch.second.wait(1000ms, out);
    return check(st == gm::RecvStatus::received, "received") &&
           check(!out.is_error() && out.result == "0x110", "payload") &&
           check(!ch.first, "sender consumed");
}

bool test_send_from_other_thread() {
    auto ch = gm::make_reply_channel();
    gm::ReplySender tx = std::move(ch.first);
    std::thread producer([&tx] {
        std::this_thread::sleep_for(50ms);
        tx.send(gm::ResponsePayload::failure(gm::ErrorObj::user_denied()));
    });
    gm::ResponsePayload out;
    auto st = ch.second.wait(5000ms, out);
    producer.join();
    return check(st == gm::RecvStatus::received, "received from thread") &&
           check(out.is_error() && out.error->code == -4001, "rejection payload");
}

bool test_sender_dropped() {
    auto ch = gm::make_reply_channel();
    gm::ReplyReceiver rx = std::move(ch.second);
    std::thread dropper([tx = std::move(ch.first)]() mutable {
        std::this_thread::sleep_for(30ms);
        gm::ReplySender gone = std::move(tx);
    });
    gm::ResponsePayload out;
    auto started = std::chrono::steady_clock::now();
    auto st = rx.wait(10000ms, out);
    dropper.join();
    return check(st == gm::RecvStatus::sender_dropped, "drop observed") &&
           check(std::chrono::steady_clock::now() - started < 5000ms, "drop did not hang");
}

bool test_timeout() {
    auto ch = gm::make_reply_channel();
    gm::ResponsePayload out;
    auto st = ch.second.wait(100ms, out);
    return check(st == gm::RecvStatus::timed_out, "timed out") &&
           check(ch.first.is_closed(), "sender sees receiver gone after timeout") &&
           check(!ch.first.send(gm::ResponsePayload::success(1)), "late send refused");
}

bool test_cancel() {
    auto ch = gm::make_reply_channel();
    std::atomic<bool> gone{false};
    std::thread client([&gone] {
        std::this_thread::sleep_for(50ms);
        gone = true;
    });
    gm::ResponsePayload out;
    auto st = ch.second.wait(10000ms, [&gone] { return gone.load(); }, out);
    client.join();
    return check(st == gm::RecvStatus::cancelled, "cancelled") &&
           check(ch.first.is_closed(), "producer sees cancellation");
}

bool test_receiver_dropped() {
    auto ch = gm::make_reply_channel();
    if (!check(!ch.first.is_closed(), "open while receiver alive")) return false;
    {
        gm::ReplyReceiver rx = std::move(ch.second);
    }
    return check(ch.first.is_closed(), "closed after receiver drop") &&
           check(!ch.first.send(gm::ResponsePayload::success(1)), "send after receiver drop");
}

bool test_move_assign_closes_old_sender() {
    auto a = gm::make_reply_channel();
    auto b = gm::make_reply_channel();
    gm::ReplySender tx = std::move(a.first);
    tx = std::move(b.first);
    gm::ResponsePayload out;
    return check(a.second.wait(1000ms, out) == gm::RecvStatus::sender_dropped, "overwritten sender counts as dropped") &&
           check(tx.send(gm::ResponsePayload::success("b")), "new sender works") &&
           check(b.second.wait(1000ms, out) == gm::RecvStatus::received && out.result == "b", "b received");
}

} // namespace

int main() {
    if (!test_send_before_wait()) return EXIT_FAILURE;
    if (!test_send_from_other_thread()) return EXIT_FAILURE;
    if (!test_sender_dropped()) return EXIT_FAILURE;
    if (!test_timeout()) return EXIT_FAILURE;
    if (!test_cancel()) return EXIT_FAILURE;
    if (!test_receiver_dropped()) return EXIT_FAILURE;
    if (!test_move_assign_closes_old_sender()) return EXIT_FAILURE;
    return EXIT_SUCCESS;
}
