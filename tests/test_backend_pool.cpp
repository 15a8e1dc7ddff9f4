#include <catch2/catch_test_macros.hpp>
#include "executor/backend_pool.hpp"
#include "executor/pool_registry.hpp"
#include "server/admission_controller.hpp"
#include "mocks/pair_connector.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <stop_token>
#include <thread>
#include <vector>

using namespace rsproxy;
using namespace std::chrono_literals;

namespace {

std::shared_ptr<BackendPool> make_pool(const std::shared_ptr<test::PairConnector>& connector,
                                       size_t capacity,
                                       std::shared_ptr<AdmissionController> admission = nullptr,
                                       const std::string& address = "db1:27017") {
    BackendPool::Config config;
    config.capacity = capacity;
    config.idle_timeout = 1000ms;
    return std::make_shared<BackendPool>(address, config, connector, std::move(admission));
}

} // namespace

// ============================================================================
// Capacity and checkout
// ============================================================================

TEST_CASE("BackendPool: never exceeds capacity", "[pool]") {
    auto connector = std::make_shared<test::PairConnector>();
    auto pool = make_pool(connector, 2);

    auto a = pool->acquire(100ms);
    auto b = pool->acquire(100ms);
    REQUIRE(a.is_ok());
    REQUIRE(b.is_ok());

    auto c = pool->acquire(50ms);
    REQUIRE(c.is_error());
    CHECK(c.error_category() == ErrorCategory::POOL_EXHAUSTED);

    const auto stats = pool->get_stats();
    CHECK(stats.total_connections == 2);
    CHECK(stats.in_use_connections == 2);
    CHECK(stats.timeouts == 1);
    CHECK(connector->connects() == 2);
}

TEST_CASE("BackendPool: released connection is reused", "[pool]") {
    auto connector = std::make_shared<test::PairConnector>();
    auto pool = make_pool(connector, 4);

    uint64_t first_id = 0;
    {
        auto handle = pool->acquire(100ms);
        REQUIRE(handle.is_ok());
        first_id = handle.value()->id();
    }
    CHECK(pool->get_stats().idle_connections == 1);

    auto again = pool->acquire(100ms);
    REQUIRE(again.is_ok());
    CHECK(again.value()->id() == first_id);
    CHECK(connector->connects() == 1);
    CHECK(pool->get_stats().releases == 1);
}

TEST_CASE("BackendPool: moved handle returns exactly once", "[pool]") {
    auto connector = std::make_shared<test::PairConnector>();
    auto pool = make_pool(connector, 2);

    {
        auto handle = pool->acquire(100ms);
        REQUIRE(handle.is_ok());
        PooledBackend moved = std::move(handle.value());
        CHECK(moved.is_valid());
        CHECK_FALSE(handle.value().is_valid());
    }
    const auto stats = pool->get_stats();
    CHECK(stats.releases == 1);
    CHECK(stats.idle_connections == 1);
    CHECK(stats.total_connections == 1);
}

TEST_CASE("BackendPool: unhealthy connection is discarded", "[pool]") {
    auto connector = std::make_shared<test::PairConnector>();
    auto pool = make_pool(connector, 2);

    {
        auto handle = pool->acquire(100ms);
        REQUIRE(handle.is_ok());
        handle.value().mark_unhealthy();
    }
    auto stats = pool->get_stats();
    CHECK(stats.total_connections == 0);
    CHECK(stats.discarded == 1);

    auto fresh = pool->acquire(100ms);
    REQUIRE(fresh.is_ok());
    CHECK(connector->connects() == 2);
}

TEST_CASE("BackendPool: idle connection closed by the peer is not handed out", "[pool]") {
    auto connector = std::make_shared<test::PairConnector>();
    auto pool = make_pool(connector, 2);

    {
        auto handle = pool->acquire(100ms);
        REQUIRE(handle.is_ok());
    }
    connector->close_peers();

    auto handle = pool->acquire(100ms);
    REQUIRE(handle.is_ok());
    CHECK(connector->connects() == 2);
    CHECK(pool->get_stats().discarded == 1);
}

TEST_CASE("BackendPool: waiter is served by a release", "[pool]") {
    auto connector = std::make_shared<test::PairConnector>();
    auto pool = make_pool(connector, 1);

    auto held = pool->acquire(100ms);
    REQUIRE(held.is_ok());

    std::jthread releaser([&held] {
        std::this_thread::sleep_for(50ms);
        PooledBackend done = std::move(held.value());
    });

    auto waited = pool->acquire(2000ms);
    REQUIRE(waited.is_ok());
    CHECK(connector->connects() == 1);
}

TEST_CASE("BackendPool: stop_token cancels a waiting acquire", "[pool]") {
    auto connector = std::make_shared<test::PairConnector>();
    auto pool = make_pool(connector, 1);

    auto held = pool->acquire(100ms);
    REQUIRE(held.is_ok());

    std::stop_source source;
    std::optional<Result<PooledBackend>> outcome;
    std::jthread waiter([&] {
        outcome = pool->acquire(5000ms, source.get_token());
    });

    std::this_thread::sleep_for(50ms);
    source.request_stop();
    waiter.join();

    REQUIRE(outcome.has_value());
    REQUIRE(outcome->is_error());
    CHECK(outcome->error_category() == ErrorCategory::CANCELLED);
}

TEST_CASE("BackendPool: connect failure is BACKEND_UNREACHABLE", "[pool]") {
    auto connector = std::make_shared<test::PairConnector>();
    connector->set_fail(true);
    auto pool = make_pool(connector, 2);

    auto handle = pool->acquire(100ms);
    REQUIRE(handle.is_error());
    CHECK(handle.error_category() == ErrorCategory::BACKEND_UNREACHABLE);

    const auto stats = pool->get_stats();
    CHECK(stats.total_connections == 0);
    CHECK(stats.connect_failures == 1);

    connector->set_fail(false);
    CHECK(pool->acquire(100ms).is_ok());
}

// ============================================================================
// drop / shrink / close
// ============================================================================

TEST_CASE("BackendPool: drop closes idle now and checked-out on return", "[pool]") {
    auto connector = std::make_shared<test::PairConnector>();
    auto pool = make_pool(connector, 4);

    auto out = pool->acquire(100ms);
    REQUIRE(out.is_ok());
    {
        auto idle = pool->acquire(100ms);
        REQUIRE(idle.is_ok());
    }
    REQUIRE(pool->get_stats().idle_connections == 1);

    pool->drop();
    auto stats = pool->get_stats();
    CHECK(stats.idle_connections == 0);
    CHECK(stats.total_connections == 1);

    {
        PooledBackend returned = std::move(out.value());
    }
    stats = pool->get_stats();
    CHECK(stats.total_connections == 0);
    CHECK(stats.idle_connections == 0);
}

TEST_CASE("BackendPool: shrink closes cold idle connections above min_idle", "[pool]") {
    auto connector = std::make_shared<test::PairConnector>();
    BackendPool::Config config;
    config.capacity = 4;
    config.min_idle = 1;
    config.idle_timeout = 1000ms;
    auto pool = std::make_shared<BackendPool>("db1:27017", config, connector);

    {
        auto a = pool->acquire(100ms);
        auto b = pool->acquire(100ms);
        auto c = pool->acquire(100ms);
        REQUIRE(a.is_ok());
        REQUIRE(b.is_ok());
        REQUIRE(c.is_ok());
    }
    REQUIRE(pool->get_stats().idle_connections == 3);

    CHECK(pool->shrink(std::chrono::steady_clock::now()) == 0);
    CHECK(pool->shrink(std::chrono::steady_clock::now() + 5s) == 2);
    CHECK(pool->get_stats().idle_connections == 1);
    CHECK(pool->get_stats().total_connections == 1);
}

TEST_CASE("BackendPool: closed pool refuses acquires", "[pool]") {
    auto connector = std::make_shared<test::PairConnector>();
    auto pool = make_pool(connector, 2);
    pool->close();

    auto handle = pool->acquire(100ms);
    REQUIRE(handle.is_error());
    CHECK(handle.error_category() == ErrorCategory::CANCELLED);
}

// ============================================================================
// Global cap
// ============================================================================

TEST_CASE("BackendPool: global cap limits connections across pools", "[pool][admission]") {
    AdmissionController::Config ac;
    ac.max_backend_connections = 1;
    auto admission = std::make_shared<AdmissionController>(ac);
    auto connector = std::make_shared<test::PairConnector>();

    auto pool_a = make_pool(connector, 2, admission, "db1:27017");
    auto pool_b = make_pool(connector, 2, admission, "db2:27017");

    auto held = pool_a->acquire(100ms);
    REQUIRE(held.is_ok());
    CHECK(admission->get_stats().open_backend_connections == 1);

    auto refused = pool_b->acquire(80ms);
    REQUIRE(refused.is_error());
    CHECK(refused.error_category() == ErrorCategory::POOL_EXHAUSTED);
    CHECK(admission->get_stats().refused_backend_slots >= 1);

    {
        PooledBackend gone = std::move(held.value());
        gone.mark_unhealthy();
    }
    CHECK(admission->get_stats().open_backend_connections == 0);

    auto granted = pool_b->acquire(100ms);
    REQUIRE(granted.is_ok());
    CHECK(admission->get_stats().open_backend_connections == 1);
}

TEST_CASE("PoolRegistry: idle connection elsewhere is reclaimed for a new pool", "[pool][admission]") {
    AdmissionController::Config ac;
    ac.max_backend_connections = 1;
    auto admission = std::make_shared<AdmissionController>(ac);
    auto connector = std::make_shared<test::PairConnector>();

    BackendPool::Config config;
    config.capacity = 2;
    auto registry = std::make_shared<PoolRegistry>(config, connector, admission);

    {
        auto idle = registry->pool_for("db1:27017")->acquire(100ms);
        REQUIRE(idle.is_ok());
    }
    REQUIRE(registry->pool_for("db1:27017")->get_stats().idle_connections == 1);

    auto other = registry->pool_for("db2:27017")->acquire(100ms);
    REQUIRE(other.is_ok());
    CHECK(registry->pool_for("db1:27017")->get_stats().total_connections == 0);
    CHECK(admission->get_stats().open_backend_connections == 1);
}

// ============================================================================
// PoolRegistry
// ============================================================================

TEST_CASE("PoolRegistry: one pool per address", "[pool]") {
    auto connector = std::make_shared<test::PairConnector>();
    auto registry = std::make_shared<PoolRegistry>(BackendPool::Config{}, connector, nullptr);

    auto a1 = registry->pool_for("db1:27017");
    auto a2 = registry->pool_for("db1:27017");
    auto b = registry->pool_for("db2:27017");
    CHECK(a1 == a2);
    CHECK(a1 != b);
    CHECK(registry->pool_count() == 2);
    CHECK(registry->stats().size() == 2);
}

TEST_CASE("PoolRegistry: remove forgets the pool and closes it", "[pool]") {
    auto connector = std::make_shared<test::PairConnector>();
    auto registry = std::make_shared<PoolRegistry>(BackendPool::Config{}, connector, nullptr);

    auto pool = registry->pool_for("db1:27017");
    auto out = pool->acquire(100ms);
    REQUIRE(out.is_ok());

    registry->remove("db1:27017");
    CHECK(registry->pool_count() == 0);
    CHECK(pool->acquire(50ms).error_category() == ErrorCategory::CANCELLED);

    {
        PooledBackend returned = std::move(out.value());
    }
    CHECK(pool->get_stats().total_connections == 0);

    auto recreated = registry->pool_for("db1:27017");
    CHECK(recreated != pool);
    CHECK(recreated->acquire(100ms).is_ok());
}

TEST_CASE("PoolRegistry: close_all closes pools created later too", "[pool]") {
    auto connector = std::make_shared<test::PairConnector>();
    auto registry = std::make_shared<PoolRegistry>(BackendPool::Config{}, connector, nullptr);

    registry->close_all();
    auto late = registry->pool_for("db3:27017");
    CHECK(late->acquire(50ms).error_category() == ErrorCategory::CANCELLED);
}
