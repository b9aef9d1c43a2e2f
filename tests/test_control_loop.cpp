#include <doctest/doctest.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>
#include "fixturelink/channel_config.hpp"
#include "fixturelink/connection.hpp"
#include "fixturelink/control_loop.hpp"
#include "fixturelink/logger.hpp"
#include "fixturelink/moving_average.hpp"
#include "fixturelink/protocols/comm_header.hpp"
#include "fixturelink/protocols/safety_messages.hpp"
#include "fixturelink/transport/transport_memory.hpp"
#include "test_support.hpp"

using namespace fixturelink;
using transport::MemoryTransport;
using fixturelink_test::eventually;

// Cliff sensor peer: answers each request with the current millivolt level,
// except every Nth request when drop_every is set.
struct CliffPeer {
    std::atomic<uint16_t> millivolts{0};
    std::atomic<int> requests{0};
    std::atomic<int> drop_every{0};
    std::atomic<bool> silent{false};

    void attach(MemoryTransport& wire) {
        wire.on_write([this](MemoryTransport& self, const Bytes&) {
            const int n = ++requests;
            if (silent.load()) return;
            const int every = drop_every.load();
            if (every > 0 && n % every == 0) return;
            Message m(*safety::responses().find(safety::CLIFF));
            m.set("command", uint64_t{safety::CLIFF}).set("response", uint64_t{1})
             .set("millivolts", uint64_t{millivolts.load()});
            self.feed(build_frame(safety::frame_format(), safety::MESSAGE_FORMAT, m.encode()));
        });
    }
};

// Cliff peer that answers after a per-request latency. Each reply echoes the
// request's sensor byte, and reports that byte as its millivolt level.
struct SlowCliffPeer {
    std::function<int(int request_number)> latency_ms;

    std::mutex mu;
    std::condition_variable cv;
    std::vector<std::pair<Clock::time_point, Bytes>> pending;
    int requests = 0;
    bool stopping = false;
    std::thread feeder;

    ~SlowCliffPeer() {
        {
            std::lock_guard<std::mutex> lk(mu);
            stopping = true;
        }
        cv.notify_all();
        if (feeder.joinable()) feeder.join();
    }

    void attach(MemoryTransport& wire) {
        wire.on_write([this](MemoryTransport&, const Bytes& request) {
            const uint8_t sensor = request.at(comm::HEADER_SIZE + 2);
            Message m(*safety::responses().find(safety::CLIFF));
            m.set("command", uint64_t{safety::CLIFF}).set("response", uint64_t{1})
             .set("sensor", uint64_t{sensor}).set("millivolts", uint64_t{sensor});
            const Bytes reply = build_frame(safety::frame_format(), safety::MESSAGE_FORMAT, m.encode());
            std::lock_guard<std::mutex> lk(mu);
            const int n = ++requests;
            pending.emplace_back(Clock::now() + std::chrono::milliseconds(latency_ms(n)), reply);
            cv.notify_all();
        });
        feeder = std::thread([this, &wire] {
            std::unique_lock<std::mutex> lk(mu);
            while (!stopping) {
                if (pending.empty()) {
                    cv.wait(lk);
                    continue;
                }
                auto next = pending.begin();
                for (auto it = pending.begin(); it != pending.end(); ++it)
                    if (it->first < next->first) next = it;
                if (Clock::now() < next->first) {
                    cv.wait_until(lk, next->first);
                    continue;
                }
                const Bytes reply = next->second;
                pending.erase(next);
                lk.unlock();
                wire.feed(reply);
                lk.lock();
            }
        });
    }
};

static ControlLoop::RequestBuilder cliff_request() {
    return [](uint32_t seq, uint32_t) { return safety::make_request(safety::CLIFF, static_cast<uint8_t>(seq & 0x03)); };
}

static ControlLoop::Telemetry cliff_millivolts() {
    return [](const Frame& reply) -> std::optional<double> {
        const MessageDescriptor* d = safety::response_for_body(reply.body);
        if (!d || d->type_id != safety::CLIFF) return std::nullopt;
        return Message(*d, reply.body).as_real("millivolts");
    };
}

// Connected safety channel over memory, with a cliff peer attached.
struct LoopRig {
    MemoryTransport wire;
    CliffPeer peer;
    ConnectionManager channel{safety_channel("mem"), wire, nullptr, Logger::null()};

    LoopRig() {
        peer.attach(wire);
        REQUIRE(channel.start() == LinkStatus::Ok);
    }
};

static ControlLoopConfig fast_config() {
    ControlLoopConfig c;
    c.period_ms = 5;
    c.tick_deadline_ms = 100;
    c.window_size = 3;
    c.target = 500.0;
    c.tolerance = 2.0;
    c.max_consecutive_failures = 2;
    return c;
}

// Records the loop's callbacks.
struct Signals {
    std::mutex mu;
    std::vector<double> reached;
    std::vector<StopReason> stopped;

    void attach(ControlLoop& loop) {
        loop.on_reached_target([this](double avg) {
            std::lock_guard<std::mutex> lk(mu);
            reached.push_back(avg);
        });
        loop.on_stopped([this](StopReason r) {
            std::lock_guard<std::mutex> lk(mu);
            stopped.push_back(r);
        });
    }
    size_t reached_count() {
        std::lock_guard<std::mutex> lk(mu);
        return reached.size();
    }
};

TEST_CASE("Moving average evicts the oldest sample") {
    MovingAverage avg(3);
    CHECK(avg.value() == doctest::Approx(0.0));
    avg.push(1.0);
    avg.push(2.0);
    CHECK_FALSE(avg.full());
    avg.push(3.0);
    CHECK(avg.full());
    CHECK(avg.value() == doctest::Approx(2.0));
    avg.push(10.0);
    CHECK(avg.size() == 3);
    CHECK(avg.value() == doctest::Approx(5.0));

    CHECK_THROWS_AS(MovingAverage(0), ConfigError);
    CHECK_THROWS_AS(MovingAverage(FIXTURELINK_MAX_AVERAGE_WINDOW + 1), ConfigError);
}

TEST_CASE("Reached-target fires once however long the average stays in range") {
    LoopRig rig;
    rig.peer.millivolts = 501;
    Signals sig;
    ControlLoop loop(rig.channel, fast_config(), Logger::null());
    sig.attach(loop);

    REQUIRE(loop.start(cliff_request(), cliff_millivolts()));
    REQUIRE(eventually([&] { return loop.ticks() >= 10; }));
    CHECK(sig.reached_count() == 1);
    CHECK(loop.reached());
    REQUIRE(loop.average().has_value());
    CHECK(*loop.average() == doctest::Approx(501.0));

    loop.cancel();
    REQUIRE(loop.wait_stopped(1000));
    CHECK_FALSE(loop.running());
    REQUIRE(sig.stopped.size() == 1);
    CHECK(sig.stopped[0] == StopReason::Cancelled);
    CHECK(sig.reached[0] == doctest::Approx(501.0));
}

TEST_CASE("Convergence needs a full window") {
    LoopRig rig;
    rig.peer.millivolts = 500;
    ControlLoopConfig cfg = fast_config();
    cfg.window_size = 4;
    cfg.period_ms = 40;
    Signals sig;
    ControlLoop loop(rig.channel, cfg, Logger::null());
    sig.attach(loop);

    REQUIRE(loop.start(cliff_request(), cliff_millivolts()));
    REQUIRE(eventually([&] { return loop.ticks() >= 2; }));
    CHECK(sig.reached_count() == 0);
    REQUIRE(eventually([&] { return sig.reached_count() == 1; }));
    CHECK(loop.ticks() >= 4);
}

TEST_CASE("set_target re-arms the reached signal") {
    LoopRig rig;
    rig.peer.millivolts = 300;
    Signals sig;
    ControlLoop loop(rig.channel, fast_config(), Logger::null());
    sig.attach(loop);

    REQUIRE(loop.start(cliff_request(), cliff_millivolts()));
    REQUIRE(eventually([&] { return loop.ticks() >= 6; }));
    CHECK(sig.reached_count() == 0);

    loop.set_target(300.0, 1.0);
    REQUIRE(eventually([&] { return sig.reached_count() == 1; }));

    loop.set_target(300.0, 1.0);
    REQUIRE(eventually([&] { return sig.reached_count() == 2; }));
}

TEST_CASE("A single missed reply is tolerated") {
    LoopRig rig;
    rig.peer.millivolts = 500;
    rig.peer.drop_every = 3;
    ControlLoopConfig cfg = fast_config();
    cfg.tick_deadline_ms = 30;
    cfg.max_consecutive_failures = 1;
    Signals sig;
    ControlLoop loop(rig.channel, cfg, Logger::null());
    sig.attach(loop);

    REQUIRE(loop.start(cliff_request(), cliff_millivolts()));
    REQUIRE(eventually([&] { return loop.ticks() >= 12; }));
    CHECK(loop.running());
    CHECK(rig.channel.state() == ConnectionState::Connected);
    CHECK(sig.reached_count() == 1);
}

TEST_CASE("Consecutive failures beyond the limit fault the channel") {
    LoopRig rig;
    rig.peer.silent = true;
    ControlLoopConfig cfg = fast_config();
    cfg.tick_deadline_ms = 20;
    cfg.max_consecutive_failures = 2;
    Signals sig;
    ControlLoop loop(rig.channel, cfg, Logger::null());
    sig.attach(loop);

    REQUIRE(loop.start(cliff_request(), cliff_millivolts()));
    REQUIRE(loop.wait_stopped(2000));
    CHECK(loop.ticks() == 3);
    CHECK(rig.channel.state() == ConnectionState::Faulted);
    CHECK(rig.channel.fault_reason().find("3 consecutive") != std::string::npos);
    REQUIRE(sig.stopped.size() == 1);
    CHECK(sig.stopped[0] == StopReason::Faulted);
    CHECK(sig.reached_count() == 0);
}

TEST_CASE("Unreadable replies count as failures") {
    LoopRig rig;
    rig.peer.millivolts = 500;
    ControlLoopConfig cfg = fast_config();
    cfg.max_consecutive_failures = 0;
    Signals sig;
    ControlLoop loop(rig.channel, cfg, Logger::null());
    sig.attach(loop);

    auto reject_all = [](const Frame&) -> std::optional<double> { return std::nullopt; };
    REQUIRE(loop.start(cliff_request(), reject_all));
    REQUIRE(loop.wait_stopped(2000));
    CHECK(sig.stopped[0] == StopReason::Faulted);
    CHECK(loop.ticks() == 1);
}

TEST_CASE("Losing the channel stops the loop") {
    LoopRig rig;
    rig.peer.millivolts = 500;
    Signals sig;
    ControlLoop loop(rig.channel, fast_config(), Logger::null());
    sig.attach(loop);

    REQUIRE(loop.start(cliff_request(), cliff_millivolts()));
    REQUIRE(eventually([&] { return loop.ticks() >= 2; }));
    rig.channel.fault("cable pulled");
    REQUIRE(loop.wait_stopped(1000));
    REQUIRE(sig.stopped.size() == 1);
    CHECK(sig.stopped[0] == StopReason::ChannelLost);
}

TEST_CASE("A throwing request builder ends the loop with an error") {
    LoopRig rig;
    Signals sig;
    ControlLoop loop(rig.channel, fast_config(), Logger::null());
    sig.attach(loop);

    auto broken = [](uint32_t, uint32_t) -> Bytes { throw std::runtime_error("no request for you"); };
    REQUIRE(loop.start(broken, cliff_millivolts()));
    REQUIRE(loop.wait_stopped(1000));
    REQUIRE(sig.stopped.size() == 1);
    CHECK(sig.stopped[0] == StopReason::Error);
    CHECK(rig.channel.acquire_control_loop());
}

TEST_CASE("One control loop per channel") {
    LoopRig rig;
    rig.peer.millivolts = 500;
    Signals second_sig;
    ControlLoop first(rig.channel, fast_config(), Logger::null());
    ControlLoop second(rig.channel, fast_config(), Logger::null());
    second_sig.attach(second);

    REQUIRE(first.start(cliff_request(), cliff_millivolts()));
    CHECK_FALSE(second.start(cliff_request(), cliff_millivolts()));

    first.cancel();
    REQUIRE(first.wait_stopped(1000));
    CHECK(second.start(cliff_request(), cliff_millivolts()));
    second.cancel();
    REQUIRE(second.wait_stopped(1000));
    CHECK(second_sig.stopped.size() == 1);

    CHECK_FALSE(first.start(cliff_request(), cliff_millivolts()));
}

TEST_CASE("A loop never starts on a channel that is not connected") {
    MemoryTransport wire;
    ConnectionManager channel(safety_channel("mem"), wire, nullptr, Logger::null());
    Signals sig;
    ControlLoop loop(channel, fast_config(), Logger::null());
    sig.attach(loop);

    CHECK_FALSE(loop.start(cliff_request(), cliff_millivolts()));
    CHECK_FALSE(loop.wait_stopped(20));
    CHECK(sig.stopped.empty());
}

TEST_CASE("Cancel interrupts a long period") {
    LoopRig rig;
    rig.peer.millivolts = 500;
    ControlLoopConfig cfg = fast_config();
    cfg.period_ms = 10000;
    Signals sig;
    ControlLoop loop(rig.channel, cfg, Logger::null());
    sig.attach(loop);

    REQUIRE(loop.start(cliff_request(), cliff_millivolts()));
    REQUIRE(eventually([&] { return loop.ticks() == 1; }));
    const auto t0 = std::chrono::steady_clock::now();
    loop.cancel();
    REQUIRE(loop.wait_stopped(1000));
    CHECK(fixturelink_test::elapsed_ms(t0) < 500);
    CHECK(sig.stopped[0] == StopReason::Cancelled);
}

TEST_CASE("Bad loop settings are refused") {
    LoopRig rig;
    ControlLoopConfig cfg = fast_config();
    cfg.window_size = 0;
    CHECK_THROWS_AS(ControlLoop(rig.channel, cfg, Logger::null()), ConfigError);
    cfg = fast_config();
    cfg.period_ms = 0;
    CHECK_THROWS_AS(ControlLoop(rig.channel, cfg, Logger::null()), ConfigError);
}

TEST_CASE("A reply that misses its tick is not taken as the next tick's reply") {
    MemoryTransport wire;
    SlowCliffPeer peer;
    // Request 1 answers after its tick has given up; request 2 lands while
    // tick 2 is still waiting, after reply 1 has already arrived.
    peer.latency_ms = [](int n) { return n == 1 ? 150 : (n == 2 ? 60 : 0); };
    peer.attach(wire);
    ConnectionManager channel(safety_channel("mem"), wire, nullptr, Logger::null());
    REQUIRE(channel.start() == LinkStatus::Ok);

    ControlLoopConfig cfg = fast_config();
    cfg.tick_deadline_ms = 100;
    cfg.max_consecutive_failures = 5;

    std::mutex mu;
    std::vector<std::pair<uint32_t, double>> samples;   // (tick seq, millivolts)
    std::atomic<uint32_t> current_seq{0};
    ControlLoop loop(channel, cfg, Logger::null());

    auto build = [&](uint32_t seq, uint32_t) {
        current_seq = seq;
        return safety::make_request(safety::CLIFF, static_cast<uint8_t>(seq));
    };
    auto extract = [&](const Frame& reply) -> std::optional<double> {
        const std::optional<double> mv = cliff_millivolts()(reply);
        if (mv) {
            std::lock_guard<std::mutex> lk(mu);
            samples.emplace_back(current_seq.load(), *mv);
        }
        return mv;
    };
    auto match = [](const Frame& reply, uint32_t seq) {
        return reply.body.size() > 2 && reply.body[2] == static_cast<uint8_t>(seq);
    };

    REQUIRE(loop.start(build, extract, match));
    REQUIRE(eventually([&] { return loop.ticks() >= 5; }));
    loop.cancel();
    REQUIRE(loop.wait_stopped(1000));

    std::lock_guard<std::mutex> lk(mu);
    REQUIRE_FALSE(samples.empty());
    CHECK(samples.front().first == 2);
    for (const auto& s : samples) {
        CAPTURE(s.first);
        CHECK(s.second == doctest::Approx(static_cast<double>(s.first & 0xFF)));
    }
}

TEST_CASE("Cancel interrupts a tick that is waiting for a reply") {
    LoopRig rig;
    rig.peer.silent = true;
    ControlLoopConfig cfg = fast_config();
    cfg.tick_deadline_ms = 10000;
    Signals sig;
    ControlLoop loop(rig.channel, cfg, Logger::null());
    sig.attach(loop);

    REQUIRE(loop.start(cliff_request(), cliff_millivolts()));
    REQUIRE(eventually([&] { return rig.peer.requests.load() == 1; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    const auto t0 = std::chrono::steady_clock::now();
    loop.cancel();
    REQUIRE(loop.wait_stopped(1000));
    CHECK(fixturelink_test::elapsed_ms(t0) < 500);
    CHECK(loop.ticks() == 1);
    REQUIRE(sig.stopped.size() == 1);
    CHECK(sig.stopped[0] == StopReason::Cancelled);
    CHECK(rig.channel.state() == ConnectionState::Connected);
}
