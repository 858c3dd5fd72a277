#include "routing/routing_resolver.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "capability/capability_store.hpp"

using namespace nodegate;
using namespace nodegate::routing;
using namespace testing;

class RoutingResolverTest : public Test {
protected:
    void SetUp() override {
        store = std::make_unique<capability::CapabilityStore>();
        resolver = std::make_unique<RoutingResolver>(*store);
    }

    std::unique_ptr<capability::CapabilityStore> store;
    std::unique_ptr<RoutingResolver> resolver;
};

TEST_F(RoutingResolverTest, IndexedDeviceUsesFastPath) {
    store->register_capabilities("c1", std::string("dev-1"), {{"echo", "ping"}});

    auto route = resolver->resolve("echo", std::string("dev-1"));
    ASSERT_TRUE(route.has_value());
    EXPECT_EQ(route->conn_id, "c1");
    EXPECT_EQ(route->source, RouteSource::DEVICE_INDEX);
}

TEST_F(RoutingResolverTest, IndexedDeviceWinsOverServiceScan) {
    store->register_capabilities("c1", std::nullopt, {{"echo", "ping"}});
    store->register_capabilities("c2", std::string("dev-2"), {{"echo", "ping"}});

    EXPECT_EQ(resolver->resolve_target("echo", std::string("dev-2")), std::optional<std::string>("c2"));
}

TEST_F(RoutingResolverTest, NoDeviceIdScansWithoutTouchingIndex) {
    store->register_capabilities("c1", std::nullopt, {{"echo", "ping"}});

    auto route = resolver->resolve("echo", std::nullopt);
    ASSERT_TRUE(route.has_value());
    EXPECT_EQ(route->conn_id, "c1");
    EXPECT_EQ(route->source, RouteSource::SERVICE_SCAN);
    EXPECT_EQ(store->device_count(), 0);
}

TEST_F(RoutingResolverTest, SelfHealingRepairsIndex) {
    store->register_capabilities("c1", std::nullopt, {{"svc", "run"}});
    ASSERT_FALSE(store->lookup_by_device("D").has_value());

    auto first = resolver->resolve("svc", std::string("D"));
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->conn_id, "c1");
    EXPECT_EQ(first->source, RouteSource::FALLBACK_REPAIRED);
    EXPECT_EQ(store->lookup_by_device("D"), std::optional<std::string>("c1"));

    auto second = resolver->resolve("svc", std::string("D"));
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->conn_id, "c1");
    EXPECT_EQ(second->source, RouteSource::DEVICE_INDEX);
}

TEST_F(RoutingResolverTest, UnknownServiceNotFound) {
    store->register_capabilities("c1", std::string("dev-1"), {{"echo", "ping"}});

    EXPECT_FALSE(resolver->resolve_target("nonexistent", std::nullopt).has_value());
    EXPECT_FALSE(resolver->resolve_target("nonexistent", std::string("dev-9")).has_value());
    EXPECT_FALSE(store->lookup_by_device("dev-9").has_value());
}

TEST_F(RoutingResolverTest, IndexedDeviceReturnedEvenIfServiceMissing) {
    // The method check happens later; routing only follows the index
    store->register_capabilities("c1", std::string("dev-1"), {{"echo", "ping"}});

    EXPECT_EQ(resolver->resolve_target("camera", std::string("dev-1")), std::optional<std::string>("c1"));
}

TEST_F(RoutingResolverTest, FallbackAfterOwnerDisconnects) {
    store->register_capabilities("c1", std::string("dev-1"), {{"echo", "ping"}});
    store->register_capabilities("c2", std::nullopt, {{"echo", "ping"}});

    store->remove("c1");

    auto route = resolver->resolve("echo", std::string("dev-1"));
    ASSERT_TRUE(route.has_value());
    EXPECT_EQ(route->conn_id, "c2");
    EXPECT_EQ(route->source, RouteSource::FALLBACK_REPAIRED);
}

TEST_F(RoutingResolverTest, LastRegisteredConnectionReceivesDevice) {
    store->register_capabilities("c1", std::string("dev-1"), {{"echo", "ping"}});
    store->register_capabilities("c2", std::string("dev-1"), {{"echo", "ping"}});

    EXPECT_EQ(resolver->resolve_target("echo", std::string("dev-1")), std::optional<std::string>("c2"));

    store->remove("c1");
    EXPECT_EQ(resolver->resolve_target("echo", std::string("dev-1")), std::optional<std::string>("c2"));
}

TEST_F(RoutingResolverTest, RouteSourceNames) {
    EXPECT_STREQ(route_source_to_string(RouteSource::DEVICE_INDEX), "device_index");
    EXPECT_STREQ(route_source_to_string(RouteSource::FALLBACK_REPAIRED), "fallback_repaired");
    EXPECT_STREQ(route_source_to_string(RouteSource::SERVICE_SCAN), "service_scan");
}
