#include "connection/connection_lifecycle.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>

#include "capability/capability_store.hpp"
#include "connection/connection_registry.hpp"
#include "connection/queued_connection.hpp"
#include "invocation/pending_invocations.hpp"
#include "mocks/mock_connection.hpp"

using namespace nodegate;
using namespace nodegate::connection;
using namespace testing;
using namespace std::chrono_literals;

class ConnectionLifecycleTest : public Test {
protected:
    void SetUp() override {
        store = std::make_unique<capability::CapabilityStore>();
        table = std::make_unique<invocation::PendingInvocationTable>();
        registry = std::make_unique<ConnectionRegistry>();
        lifecycle = std::make_unique<ConnectionLifecycle>(*registry, *store, *table);
    }

    std::unique_ptr<capability::CapabilityStore> store;
    std::unique_ptr<invocation::PendingInvocationTable> table;
    std::unique_ptr<ConnectionRegistry> registry;
    std::unique_ptr<ConnectionLifecycle> lifecycle;
};

TEST_F(ConnectionLifecycleTest, ConnectRegistersHandleWithoutCapabilities) {
    auto conn = std::make_shared<QueuedConnection>("c1", "node", 4);
    lifecycle->on_connect(conn);

    EXPECT_EQ(registry->get("c1"), conn);
    EXPECT_FALSE(store->get("c1").has_value());
}

TEST_F(ConnectionLifecycleTest, ConnectNullIgnored) {
    lifecycle->on_connect(nullptr);
    EXPECT_EQ(registry->count(), 0);
}

TEST_F(ConnectionLifecycleTest, DisconnectPurgesEverything) {
    auto conn = std::make_shared<QueuedConnection>("c1", "node", 4);
    lifecycle->on_connect(conn);
    store->register_capabilities("c1", std::string("dev-1"), {{"echo", "ping"}});

    auto as_target = table->create("t", "c1", "op", 5000ms);
    auto as_caller = table->create("c", "other", "c1", 5000ms);
    auto unrelated = table->create("u", "other", "op", 5000ms);

    lifecycle->on_disconnect("c1");

    EXPECT_FALSE(registry->has("c1"));
    EXPECT_FALSE(conn->is_open());
    EXPECT_FALSE(store->get("c1").has_value());
    EXPECT_FALSE(store->lookup_by_device("dev-1").has_value());

    EXPECT_EQ(as_target->wait().error, rpc::ErrorKind::DEVICE_DISCONNECTED);
    EXPECT_EQ(as_caller->wait().error, rpc::ErrorKind::CANCELLED);
    EXPECT_TRUE(table->contains("u"));
    table->expire("u");
}

TEST_F(ConnectionLifecycleTest, DisconnectKeepsRepointedDevice) {
    lifecycle->on_connect(std::make_shared<QueuedConnection>("c1", "node", 4));
    lifecycle->on_connect(std::make_shared<QueuedConnection>("c2", "node", 4));
    store->register_capabilities("c1", std::string("dev-1"), {{"echo", "ping"}});
    store->register_capabilities("c2", std::string("dev-1"), {{"echo", "ping"}});

    lifecycle->on_disconnect("c1");

    EXPECT_EQ(store->lookup_by_device("dev-1"), std::optional<std::string>("c2"));
    EXPECT_TRUE(registry->has("c2"));
}

TEST_F(ConnectionLifecycleTest, DisconnectUnknownIsHarmless) {
    lifecycle->on_disconnect("never-connected");
    EXPECT_EQ(registry->count(), 0);
}

TEST_F(ConnectionLifecycleTest, DisconnectClosesHandle) {
    auto mock = std::make_shared<NiceMock<tests::MockConnection>>();
    ON_CALL(*mock, conn_id()).WillByDefault(ReturnRef(mock->_id));
    ON_CALL(*mock, role()).WillByDefault(ReturnRef(mock->_role));
    EXPECT_CALL(*mock, close()).Times(1);

    lifecycle->on_connect(mock);
    lifecycle->on_disconnect("conn-1");
    lifecycle->on_disconnect("conn-1");
}

TEST_F(ConnectionLifecycleTest, DisconnectClosesHandleBeforePurge) {
    auto mock = std::make_shared<NiceMock<tests::MockConnection>>();
    ON_CALL(*mock, conn_id()).WillByDefault(ReturnRef(mock->_id));
    ON_CALL(*mock, role()).WillByDefault(ReturnRef(mock->_role));

    lifecycle->on_connect(mock);
    store->register_capabilities("conn-1", std::string("dev-1"), {{"echo", "ping"}});
    auto as_target = table->create("t", "conn-1", "op", 5000ms);

    bool registered_at_close = false;
    bool pending_at_close = false;
    EXPECT_CALL(*mock, close()).WillOnce(Invoke([&]() {
        registered_at_close = store->get("conn-1").has_value();
        pending_at_close = table->contains("t");
    }));

    lifecycle->on_disconnect("conn-1");

    EXPECT_TRUE(registered_at_close);
    EXPECT_TRUE(pending_at_close);
    EXPECT_EQ(as_target->wait().error, rpc::ErrorKind::DEVICE_DISCONNECTED);
}
