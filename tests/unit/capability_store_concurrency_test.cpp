#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "capability/capability_store.hpp"

using namespace nodegate;
using namespace nodegate::capability;
using namespace testing;

class CapabilityStoreConcurrencyTest : public Test {
protected:
    void SetUp() override { store = std::make_unique<CapabilityStore>(); }

    std::unique_ptr<CapabilityStore> store;
};

// ============================================================================
// Concurrency Tests
// ============================================================================

// Test: Readers never observe a device mapping to a connection whose capability entry is gone
TEST_F(CapabilityStoreConcurrencyTest, LookupsStayConsistentDuringChurn) {
    std::atomic<bool> stop{false};
    std::atomic<size_t> found{0};
    std::atomic<size_t> not_found{0};
    std::atomic<size_t> inconsistent{0};
    std::vector<std::thread> readers;

    for (int i = 0; i < 8; ++i) {
        readers.emplace_back([&]() {
            while (!stop.load()) {
                auto conn_id = store->lookup_by_device("dev-1");
                if (conn_id) {
                    ++found;
                    // The entry may be removed right after the lookup; a snapshot either exists or not
                    auto entry = store->get(*conn_id);
                    if (entry && !entry->advertises_service("echo")) {
                        ++inconsistent;
                    }
                } else {
                    ++not_found;
                }
                std::this_thread::sleep_for(std::chrono::microseconds(10));
            }
        });
    }

    for (int round = 0; round < 500; ++round) {
        std::string conn_id = "c" + std::to_string(round);
        store->register_capabilities(conn_id, std::string("dev-1"), {{"echo", "ping"}});
        store->remove(conn_id);
    }

    stop.store(true);
    for (auto &t : readers) {
        t.join();
    }

    EXPECT_EQ(inconsistent.load(), 0);
    EXPECT_EQ(store->connection_count(), 0);
    EXPECT_EQ(store->device_count(), 0);
    EXPECT_GT(found.load() + not_found.load(), 0);
    std::cout << "Lookups: " << found.load() << " found, " << not_found.load() << " not found\n";
}

// Test: bind_device racing with remove never resurrects a removed connection
TEST_F(CapabilityStoreConcurrencyTest, BindRacingRemoveNeverResurrects) {
    for (int round = 0; round < 200; ++round) {
        std::string conn_id = "c" + std::to_string(round);
        store->register_capabilities(conn_id, std::nullopt, {{"echo", "ping"}});

        std::thread binder([&]() { store->bind_device("dev-x", conn_id); });
        std::thread remover([&]() { store->remove(conn_id); });
        binder.join();
        remover.join();

        auto mapped = store->lookup_by_device("dev-x");
        EXPECT_FALSE(mapped.has_value()) << "dev-x still points at removed " << *mapped;
    }
}

// Test: Concurrent registrations of the same device from many connections leave exactly one mapping
TEST_F(CapabilityStoreConcurrencyTest, ConcurrentRegistrationsLastWriterWins) {
    std::vector<std::thread> writers;
    for (int i = 0; i < 16; ++i) {
        writers.emplace_back([this, i]() {
            store->register_capabilities("c" + std::to_string(i), std::string("dev-1"), {{"echo", "ping"}});
        });
    }
    for (auto &t : writers) {
        t.join();
    }

    EXPECT_EQ(store->connection_count(), 16);
    EXPECT_EQ(store->device_count(), 1);

    auto owner = store->lookup_by_device("dev-1");
    ASSERT_TRUE(owner.has_value());
    EXPECT_TRUE(store->get(*owner).has_value());

    // Removing every other connection leaves the mapping intact
    for (int i = 0; i < 16; ++i) {
        std::string conn_id = "c" + std::to_string(i);
        if (conn_id != *owner) {
            store->remove(conn_id);
        }
    }
    EXPECT_EQ(store->lookup_by_device("dev-1"), owner);
}
