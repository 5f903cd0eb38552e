#include <catch2/catch_test_macros.hpp>
#include "contextvm/protocol/pending_request_table.hpp"
#include <chrono>
#include <thread>
using namespace contextvm;
using namespace contextvm::protocol;
using namespace std::chrono_literals;
namespace {
proto::nostr::Event Reply(const std::string& content) {
    proto::nostr::Event event;
    event.set_content(content);
    return event;
}
}
TEST_CASE("Pending request table - Register and fulfill", "[pending_requests]") {
    PendingRequestTable table;
    auto registered = table.Register("req-1");
    REQUIRE(registered.IsOk());
    auto future = std::move(registered).Unwrap();
    REQUIRE(table.Contains("req-1"));
    REQUIRE(table.Size() == 1);
    SECTION("Fulfill resolves the waiter and consumes the entry") {
        REQUIRE(table.Fulfill("req-1", Reply("pong")));
        REQUIRE(future.wait_for(0s) == std::future_status::ready);
        REQUIRE(future.get().content() == "pong");
        REQUIRE_FALSE(table.Contains("req-1"));
    }
    SECTION("A second fulfill finds nothing") {
        REQUIRE(table.Fulfill("req-1", Reply("first")));
        REQUIRE_FALSE(table.Fulfill("req-1", Reply("second")));
        REQUIRE(future.get().content() == "first");
    }
    SECTION("Fulfill after remove finds nothing") {
        REQUIRE(table.Remove("req-1"));
        REQUIRE_FALSE(table.Fulfill("req-1", Reply("late")));
        REQUIRE(table.Size() == 0);
    }
    SECTION("Remove after fulfill reports the entry as consumed") {
        REQUIRE(table.Fulfill("req-1", Reply("pong")));
        REQUIRE_FALSE(table.Remove("req-1"));
        REQUIRE(future.get().content() == "pong");
    }
}
TEST_CASE("Pending request table - Unknown and duplicate ids", "[pending_requests]") {
    PendingRequestTable table;
    REQUIRE_FALSE(table.Fulfill("unsolicited", Reply("x")));
    REQUIRE(table.Register("req-1").IsOk());
    auto duplicate = table.Register("req-1");
    REQUIRE(duplicate.IsErr());
    REQUIRE(duplicate.UnwrapErr().type == TransportFailureType::Protocol);
    REQUIRE(table.Size() == 1);
}
TEST_CASE("Pending request table - Clear breaks waiters", "[pending_requests]") {
    PendingRequestTable table;
    auto future = std::move(table.Register("req-1")).Unwrap();
    table.Clear();
    REQUIRE(table.Size() == 0);
    REQUIRE_THROWS_AS(future.get(), std::future_error);
}
TEST_CASE("Pending request table - Fulfill from another thread", "[pending_requests]") {
    PendingRequestTable table;
    auto future = std::move(table.Register("req-1")).Unwrap();
    std::thread responder([&table]() {
        std::this_thread::sleep_for(10ms);
        (void)table.Fulfill("req-1", Reply("async"));
    });
    REQUIRE(future.wait_for(2s) == std::future_status::ready);
    REQUIRE(future.get().content() == "async");
    responder.join();
}
