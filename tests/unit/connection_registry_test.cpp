#include "connection/connection_registry.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "connection/queued_connection.hpp"
#include "mocks/mock_connection.hpp"

using namespace nodegate;
using namespace nodegate::connection;
using namespace testing;

class ConnectionRegistryTest : public Test {
protected:
    void SetUp() override { registry = std::make_unique<ConnectionRegistry>(); }

    static std::shared_ptr<QueuedConnection> make_conn(const std::string &id) {
        return std::make_shared<QueuedConnection>(id, "node", 8);
    }

    std::unique_ptr<ConnectionRegistry> registry;
};

TEST_F(ConnectionRegistryTest, EmptyRegistry) {
    EXPECT_EQ(registry->count(), 0);
    EXPECT_EQ(registry->get("c1"), nullptr);
    EXPECT_FALSE(registry->has("c1"));
    EXPECT_TRUE(registry->get_all().empty());
}

TEST_F(ConnectionRegistryTest, AddAndGet) {
    auto conn = make_conn("c1");
    registry->add(conn);

    EXPECT_TRUE(registry->has("c1"));
    EXPECT_EQ(registry->get("c1"), conn);
    EXPECT_EQ(registry->count(), 1);
    EXPECT_THAT(registry->ids(), ElementsAre("c1"));
}

TEST_F(ConnectionRegistryTest, AddNullIgnored) {
    registry->add(nullptr);
    EXPECT_EQ(registry->count(), 0);
}

TEST_F(ConnectionRegistryTest, AddReplacesSameId) {
    auto first = make_conn("c1");
    auto second = make_conn("c1");
    registry->add(first);
    registry->add(second);

    EXPECT_EQ(registry->count(), 1);
    EXPECT_EQ(registry->get("c1"), second);
}

TEST_F(ConnectionRegistryTest, RemoveReturnsHandle) {
    auto conn = make_conn("c1");
    registry->add(conn);

    auto removed = registry->remove("c1");
    EXPECT_EQ(removed, conn);
    EXPECT_FALSE(registry->has("c1"));
    EXPECT_EQ(registry->remove("c1"), nullptr);

    // remove() does not close; the lifecycle decides that
    EXPECT_TRUE(conn->is_open());
}

TEST_F(ConnectionRegistryTest, HandleOutlivesRemoval) {
    registry->add(make_conn("c1"));
    auto handle = registry->get("c1");
    registry->remove("c1");

    ASSERT_NE(handle, nullptr);
    EXPECT_TRUE(handle->send("frame"));
}

TEST_F(ConnectionRegistryTest, ClearClosesEveryConnection) {
    auto a = std::make_shared<NiceMock<tests::MockConnection>>();
    auto b = std::make_shared<NiceMock<tests::MockConnection>>();
    a->_id = "a";
    b->_id = "b";
    ON_CALL(*a, conn_id()).WillByDefault(ReturnRef(a->_id));
    ON_CALL(*b, conn_id()).WillByDefault(ReturnRef(b->_id));
    EXPECT_CALL(*a, close()).Times(1);
    EXPECT_CALL(*b, close()).Times(1);

    registry->add(a);
    registry->add(b);
    registry->clear();

    EXPECT_EQ(registry->count(), 0);
}

TEST_F(ConnectionRegistryTest, ConcurrentAddRemove) {
    std::atomic<bool> stop{false};
    std::vector<std::thread> readers;
    for (int i = 0; i < 4; ++i) {
        readers.emplace_back([&]() {
            while (!stop.load()) {
                for (const auto &conn : registry->get_all()) {
                    EXPECT_NE(conn, nullptr);
                }
            }
        });
    }

    std::vector<std::thread> writers;
    for (int w = 0; w < 4; ++w) {
        writers.emplace_back([&, w]() {
            for (int i = 0; i < 200; ++i) {
                std::string id = "w" + std::to_string(w) + "-" + std::to_string(i);
                registry->add(make_conn(id));
                registry->remove(id);
            }
        });
    }

    for (auto &t : writers) {
        t.join();
    }
    stop.store(true);
    for (auto &t : readers) {
        t.join();
    }
    EXPECT_EQ(registry->count(), 0);
}
