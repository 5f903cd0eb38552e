#include <catch2/catch_test_macros.hpp>
#include "contextvm/gateway/gateway.hpp"
#include "contextvm/transport/client_transport.hpp"
#include "contextvm/transport/server_transport.hpp"
#include "contextvm/protocol/session_table.hpp"
#include "helpers/loopback_network.hpp"
#include <algorithm>
#include <atomic>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>
#include <vector>

using namespace contextvm;
using namespace contextvm::transport;
using namespace contextvm::protocol;
using namespace contextvm::test_helpers;
using namespace std::chrono_literals;

namespace {
    using StartFn = std::function<Result<Unit, TransportFailure>()>;

    /// Calls @p stop either before or alongside @p start and reports whether
    /// start came back Ok. A start still blocked after five seconds is freed
    /// with another stop and counts as a failure.
    bool StartEndsAfterStop(const StartFn& start, const std::function<void()>& stop, const bool stop_first) {
        if (stop_first) {
            stop();
        }
        auto running = std::async(std::launch::async, start);
        if (!stop_first) {
            stop();
        }
        if (running.wait_for(5s) != std::future_status::ready) {
            stop();
            running.wait();
            return false;
        }
        return running.get().IsOk();
    }

    bool AnswersPing(const std::shared_ptr<LocalRelay>& relay, const std::string& server_key) {
        auto client = std::move(ClientTransport::Create(MakeRelayClient(relay), MakeClientConfig())).Unwrap();
        if (client->Connect().IsErr()) {
            return false;
        }
        auto reply = client->SendRequest(server_key, ParseMessage(R"({"op":"ping"})"), false);
        return reply.IsOk() && reply.Unwrap().FindString("op") == "pong";
    }

    McpMessage EchoRequest(const int value) {
        google::protobuf::Struct body;
        (*body.mutable_fields())["op"].set_string_value("echo");
        (*body.mutable_fields())["value"].set_string_value(std::to_string(value));
        return McpMessage::FromStruct(std::move(body));
    }

    /// Holds every request back and lets the test answer them later, in any order.
    class DeferredHandler : public IMessageHandler {
    public:
        std::optional<McpMessage> OnMessage(const IncomingMessage& incoming) override {
            std::lock_guard lock(mutex_);
            held_.push_back(incoming);
            return std::nullopt;
        }

        [[nodiscard]] size_t HeldCount() const {
            std::lock_guard lock(mutex_);
            return held_.size();
        }

        [[nodiscard]] std::vector<IncomingMessage> TakeAll() {
            std::lock_guard lock(mutex_);
            return std::exchange(held_, {});
        }

    private:
        mutable std::mutex mutex_;
        std::vector<IncomingMessage> held_;
    };
}

TEST_CASE("Concurrency - Parallel requests from one client", "[concurrency][request_response]") {
    auto relay = MakeRelay();
    auto server_relay = MakeRelayClient(relay);
    auto server = std::move(ServerTransport::Create(server_relay, MakeServerConfig())).Unwrap();
    server->SetMessageHandler(std::make_shared<PingHandler>());
    auto running = RunServer(*server);
    auto client = std::move(ClientTransport::Create(MakeRelayClient(relay), MakeClientConfig())).Unwrap();
    REQUIRE(client->Connect().IsOk());
    const auto server_key = server->PublicKey();

    constexpr int THREAD_COUNT = 16;
    constexpr int REQUESTS_PER_THREAD = 8;

    std::atomic<int> matched{0};
    std::atomic<int> mismatched{0};
    std::atomic<int> failed{0};

    std::vector<std::thread> threads;
    threads.reserve(THREAD_COUNT);
    for (int t = 0; t < THREAD_COUNT; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < REQUESTS_PER_THREAD; ++i) {
                const int value = t * 1000 + i;
                auto reply = client->SendRequest(server_key, EchoRequest(value), (value % 2) == 0);
                if (reply.IsErr()) {
                    failed.fetch_add(1);
                    continue;
                }
                if (reply.Unwrap().FindString("value") == std::to_string(value)) {
                    matched.fetch_add(1);
                } else {
                    mismatched.fetch_add(1);
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(failed.load() == 0);
    REQUIRE(mismatched.load() == 0);
    REQUIRE(matched.load() == THREAD_COUNT * REQUESTS_PER_THREAD);
    REQUIRE(client->PendingRequestCount() == 0);
    REQUIRE(server->SessionCount() == 1);
}

TEST_CASE("Concurrency - Replies delivered out of order", "[concurrency][request_response]") {
    auto relay = MakeRelay();
    auto server_relay = MakeRelayClient(relay);
    auto server = std::move(ServerTransport::Create(server_relay, MakeServerConfig())).Unwrap();
    auto handler = std::make_shared<DeferredHandler>();
    server->SetMessageHandler(handler);
    auto running = RunServer(*server);
    auto client = std::move(ClientTransport::Create(MakeRelayClient(relay), MakeClientConfig())).Unwrap();
    REQUIRE(client->Connect().IsOk());
    const auto server_key = server->PublicKey();

    constexpr int REQUEST_COUNT = 12;
    std::vector<std::optional<std::string>> answers(REQUEST_COUNT);
    std::vector<std::thread> callers;
    for (int i = 0; i < REQUEST_COUNT; ++i) {
        callers.emplace_back([&, i]() {
            auto reply = client->SendRequest(server_key, EchoRequest(i), i % 3 == 0);
            if (reply.IsOk()) {
                answers[static_cast<size_t>(i)] = reply.Unwrap().FindString("value");
            }
        });
    }

    REQUIRE(WaitUntil([&]() { return handler->HeldCount() == REQUEST_COUNT; }, std::chrono::seconds(5)));
    REQUIRE(client->PendingRequestCount() == REQUEST_COUNT);

    auto held = handler->TakeAll();
    std::reverse(held.begin(), held.end());
    for (const auto& incoming : held) {
        auto sent = server->SendResponse(incoming.sender_pubkey, incoming.message, incoming.event_id,
                                         incoming.is_encrypted);
        REQUIRE(sent.IsOk());
    }
    for (auto& caller : callers) {
        caller.join();
    }

    for (int i = 0; i < REQUEST_COUNT; ++i) {
        CAPTURE(i);
        REQUIRE(answers[static_cast<size_t>(i)] == std::to_string(i));
    }
    REQUIRE(client->PendingRequestCount() == 0);
}

TEST_CASE("Concurrency - Several clients against one server", "[concurrency][sessions]") {
    auto relay = MakeRelay();
    auto server = std::move(ServerTransport::Create(MakeRelayClient(relay), MakeServerConfig())).Unwrap();
    server->SetMessageHandler(std::make_shared<PingHandler>());
    auto running = RunServer(*server);
    const auto server_key = server->PublicKey();

    constexpr int CLIENT_COUNT = 6;
    std::vector<std::unique_ptr<ClientTransport>> clients;
    for (int c = 0; c < CLIENT_COUNT; ++c) {
        clients.push_back(std::move(ClientTransport::Create(MakeRelayClient(relay), MakeClientConfig())).Unwrap());
        REQUIRE(clients.back()->Connect().IsOk());
    }

    const auto ping = ParseMessage(R"({"op":"ping"})");
    std::atomic<int> pongs{0};
    std::atomic<bool> sweeping{true};
    std::thread sweeper([&]() {
        while (sweeping.load()) {
            (void)server->CleanupInactiveSessions();
            std::this_thread::yield();
        }
    });

    std::vector<std::thread> threads;
    for (int c = 0; c < CLIENT_COUNT; ++c) {
        threads.emplace_back([&, c]() {
            for (int i = 0; i < 5; ++i) {
                auto reply = clients[static_cast<size_t>(c)]->SendRequest(server_key, ping, c % 2 == 0);
                if (reply.IsOk() && reply.Unwrap().FindString("op") == "pong") {
                    pongs.fetch_add(1);
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    sweeping.store(false);
    sweeper.join();

    REQUIRE(pongs.load() == CLIENT_COUNT * 5);
    REQUIRE(server->SessionCount() == CLIENT_COUNT);
    for (const auto& client : clients) {
        auto session = server->GetSession(client->PublicKey());
        REQUIRE(session.IsOk());
    }
}

TEST_CASE("Concurrency - Session table under contention", "[concurrency][sessions]") {
    SessionTable table;
    constexpr int THREAD_COUNT = 8;
    constexpr int TOUCHES = 500;
    std::atomic<int> created{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < THREAD_COUNT; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < TOUCHES; ++i) {
                const auto key = "client-" + std::to_string(i % 50);
                if (table.Touch(key, (t + i) % 2 == 0).created) {
                    created.fetch_add(1);
                }
                if (i % 7 == 0) {
                    (void)table.MarkInitialized(key);
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    REQUIRE(created.load() == 50);
    REQUIRE(table.Size() == 50);
}

TEST_CASE("Concurrency - Stop racing Start", "[concurrency][lifecycle]") {
    constexpr int ROUNDS = 25;
    auto relay = MakeRelay();

    SECTION("Server stopped before it starts") {
        auto server = std::move(ServerTransport::Create(MakeRelayClient(relay), MakeServerConfig())).Unwrap();
        server->SetMessageHandler(std::make_shared<PingHandler>());
        REQUIRE(StartEndsAfterStop([&] { return server->Start(); }, [&] { server->Stop(); }, true));
        REQUIRE_FALSE(server->IsRunning());
        REQUIRE(relay->SubscriptionCount() == 0);

        auto running = RunServer(*server);
        REQUIRE(AnswersPing(relay, server->PublicKey()));
    }
    SECTION("Server stop issued alongside start") {
        auto server = std::move(ServerTransport::Create(MakeRelayClient(relay), MakeServerConfig())).Unwrap();
        server->SetMessageHandler(std::make_shared<PingHandler>());
        int returned = 0;
        for (int round = 0; round < ROUNDS; ++round) {
            if (StartEndsAfterStop([&] { return server->Start(); }, [&] { server->Stop(); }, false)) {
                ++returned;
            }
        }
        REQUIRE(returned == ROUNDS);
        REQUIRE(relay->SubscriptionCount() == 0);

        auto running = RunServer(*server);
        REQUIRE(AnswersPing(relay, server->PublicKey()));
    }
    SECTION("Gateway stopped before it starts") {
        auto gateway = std::move(contextvm::gateway::Gateway::Create(MakeRelayClient(relay), MakeServerConfig(), 10ms)).Unwrap();
        gateway->Transport().SetMessageHandler(std::make_shared<PingHandler>());
        REQUIRE(StartEndsAfterStop([&] { return gateway->Start(); }, [&] { gateway->Stop(); }, true));
        REQUIRE_FALSE(gateway->Transport().IsRunning());

        LoopRunner running([&] { return gateway->Start(); }, [&] { gateway->Stop(); },
                           [&] { return gateway->Transport().IsRunning(); });
        REQUIRE(AnswersPing(relay, gateway->Transport().PublicKey()));
        running.Stop();
        REQUIRE(running.Succeeded());
    }
    SECTION("Gateway stop issued alongside start") {
        auto gateway = std::move(contextvm::gateway::Gateway::Create(MakeRelayClient(relay), MakeServerConfig(), 10ms)).Unwrap();
        int returned = 0;
        for (int round = 0; round < ROUNDS; ++round) {
            if (StartEndsAfterStop([&] { return gateway->Start(); }, [&] { gateway->Stop(); }, false)) {
                ++returned;
            }
        }
        REQUIRE(returned == ROUNDS);
        REQUIRE_FALSE(gateway->Transport().IsRunning());
        REQUIRE(relay->SubscriptionCount() == 0);
    }
}
