#include <catch2/catch_test_macros.hpp>
#include "server/admission_controller.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace rsproxy;
using namespace std::chrono_literals;

namespace {

class FakeSession : public Evictable {
public:
    explicit FakeSession(uint64_t id) : id_(id), last_(std::chrono::steady_clock::now()) {}

    uint64_t id() const override { return id_; }
    std::chrono::steady_clock::time_point last_activity() const override { return last_; }
    bool in_exchange() const override { return busy_; }
    void evict(EvictionReason reason) override {
        evicted_ = true;
        reason_ = reason;
    }

    uint64_t id_;
    std::chrono::steady_clock::time_point last_;
    bool busy_ = false;
    bool evicted_ = false;
    EvictionReason reason_ = EvictionReason::IDLE;
};

AdmissionController::Config small(uint32_t backends, uint32_t sessions) {
    AdmissionController::Config config;
    config.max_backend_connections = backends;
    config.max_client_sessions = sessions;
    config.idle_timeout = 1000ms;
    return config;
}

} // namespace

TEST_CASE("AdmissionController: backend slots are capped", "[admission]") {
    AdmissionController admission(small(2, 10));

    auto a = admission.try_reserve_backend();
    auto b = admission.try_reserve_backend();
    REQUIRE(a.has_value());
    REQUIRE(b.has_value());
    CHECK_FALSE(admission.try_reserve_backend().has_value());

    auto stats = admission.get_stats();
    CHECK(stats.open_backend_connections == 2);
    CHECK(stats.refused_backend_slots == 1);

    a.reset();
    CHECK(admission.get_stats().open_backend_connections == 1);
    CHECK(admission.try_reserve_backend().has_value());
}

TEST_CASE("AdmissionController: moved slot releases once", "[admission]") {
    AdmissionController admission(small(1, 10));
    {
        auto slot = admission.try_reserve_backend();
        REQUIRE(slot.has_value());
        AdmissionController::BackendSlot moved = std::move(*slot);
        slot.reset();
        CHECK(admission.get_stats().open_backend_connections == 1);
    }
    CHECK(admission.get_stats().open_backend_connections == 0);
}

TEST_CASE("AdmissionController: cap holds under contention", "[admission]") {
    AdmissionController admission(small(8, 10));
    std::atomic<int> granted{0};
    std::atomic<int> peak{0};
    std::atomic<int> current{0};

    {
        std::vector<std::jthread> threads;
        for (int t = 0; t < 8; ++t) {
            threads.emplace_back([&] {
                for (int i = 0; i < 200; ++i) {
                    auto slot = admission.try_reserve_backend();
                    if (!slot) continue;
                    granted.fetch_add(1);
                    const int now = current.fetch_add(1) + 1;
                    int prev = peak.load();
                    while (now > prev && !peak.compare_exchange_weak(prev, now)) {}
                    current.fetch_sub(1);
                }
            });
        }
    }

    CHECK(granted.load() > 0);
    CHECK(peak.load() <= 8);
    CHECK(admission.get_stats().open_backend_connections == 0);
}

TEST_CASE("AdmissionController: session cap rejects extra sessions", "[admission]") {
    AdmissionController admission(small(4, 2));
    auto s1 = std::make_shared<FakeSession>(1);
    auto s2 = std::make_shared<FakeSession>(2);
    auto s3 = std::make_shared<FakeSession>(3);

    auto t1 = admission.admit(s1);
    auto t2 = admission.admit(s2);
    REQUIRE(t1.has_value());
    REQUIRE(t2.has_value());
    CHECK_FALSE(admission.admit(s3).has_value());

    auto stats = admission.get_stats();
    CHECK(stats.active_sessions == 2);
    CHECK(stats.admitted_sessions == 2);
    CHECK(stats.rejected_sessions == 1);

    t1.reset();
    CHECK(admission.get_stats().active_sessions == 1);
    CHECK(admission.admit(s3).has_value());
}

TEST_CASE("AdmissionController: sweep evicts only idle sessions", "[admission]") {
    AdmissionController admission(small(4, 10));
    const auto now = std::chrono::steady_clock::now();

    auto idle = std::make_shared<FakeSession>(1);
    idle->last_ = now - 5s;
    auto busy = std::make_shared<FakeSession>(2);
    busy->last_ = now - 5s;
    busy->busy_ = true;
    auto fresh = std::make_shared<FakeSession>(3);

    auto t1 = admission.admit(idle);
    auto t2 = admission.admit(busy);
    auto t3 = admission.admit(fresh);

    CHECK(admission.sweep_idle(now) == 1);
    CHECK(idle->evicted_);
    CHECK(idle->reason_ == EvictionReason::IDLE);
    CHECK_FALSE(busy->evicted_);
    CHECK_FALSE(fresh->evicted_);
    CHECK(admission.get_stats().idle_evictions == 1);
}

TEST_CASE("AdmissionController: expired sessions are skipped", "[admission]") {
    AdmissionController admission(small(4, 10));
    std::optional<AdmissionController::SessionTicket> ticket;
    {
        auto gone = std::make_shared<FakeSession>(7);
        gone->last_ = std::chrono::steady_clock::now() - 5s;
        ticket = admission.admit(gone);
    }
    CHECK(admission.sweep_idle(std::chrono::steady_clock::now()) == 0);
}

TEST_CASE("AdmissionController: evict_all reaches every session", "[admission]") {
    AdmissionController admission(small(4, 10));
    auto a = std::make_shared<FakeSession>(1);
    auto b = std::make_shared<FakeSession>(2);
    b->busy_ = true;
    auto ta = admission.admit(a);
    auto tb = admission.admit(b);

    admission.evict_all(EvictionReason::SHUTDOWN);
    CHECK(a->evicted_);
    CHECK(b->evicted_);
    CHECK(b->reason_ == EvictionReason::SHUTDOWN);
}

TEST_CASE("AdmissionController: reason names", "[admission]") {
    CHECK(std::string(eviction_reason_name(EvictionReason::CHATTY)) == "chatty");
    CHECK(std::string(eviction_reason_name(EvictionReason::SHUTDOWN)) == "shutdown");
}
