#include <gtest/gtest.h>
#include "generator/bulk_generator.hpp"
#include "generator/namespaces.hpp"

#include <set>
#include <stdexcept>

using namespace uuidpp;

class BulkGeneratorTest : public ::testing::Test {
protected:
    GenerationState state_;
    Generator generator_{state_, PosixIdentity{1000, 100}};
};

// Test: generate_one dispatches on every supported version
TEST_F(BulkGeneratorTest, GenerateOneEveryVersion) {
    GenerationRequest request;
    request.namespace_id = namespace_dns();
    request.name = "example.com";

    for (unsigned v = 1; v <= 6; ++v) {
        request.version = v;
        Uuid uuid = generate_one(generator_, request);
        EXPECT_EQ(uuid.version(), v);
        EXPECT_EQ(uuid.variant(), Variant::RFC4122);
    }
}

// Test: generate_one rejects versions outside 1..6
TEST_F(BulkGeneratorTest, GenerateOneRejectsUnknownVersion) {
    GenerationRequest request;
    request.version = 0;
    EXPECT_THROW(generate_one(generator_, request), std::invalid_argument);
    request.version = 7;
    EXPECT_THROW(generate_one(generator_, request), std::invalid_argument);
}

// Test: Version 2 request passes the domain through
TEST_F(BulkGeneratorTest, GenerateOneVersionTwoDomain) {
    GenerationRequest request;
    request.version = 2;
    request.domain = Domain::Group;

    Uuid uuid = generate_one(generator_, request);
    EXPECT_EQ(uuid[9], static_cast<uint8_t>(Domain::Group));
    EXPECT_EQ(uuid[3], 100);
}

// Test: Bulk random generation returns count distinct UUIDs
TEST_F(BulkGeneratorTest, BulkVersionFour) {
    ThreadPool pool(4);
    GenerationRequest request;
    request.version = 4;
    request.count = 2000;

    std::vector<Uuid> uuids = generate_bulk(generator_, request, pool);

    ASSERT_EQ(uuids.size(), 2000u);
    std::set<Uuid> unique(uuids.begin(), uuids.end());
    EXPECT_EQ(unique.size(), uuids.size());
    for (const auto& uuid : uuids) {
        EXPECT_EQ(uuid.version(), 4u);
    }
}

// Test: Bulk time-based generation never repeats across workers
TEST_F(BulkGeneratorTest, BulkVersionOne) {
    ThreadPool pool(8);
    GenerationRequest request;
    request.version = 1;
    request.count = 5000;

    std::vector<Uuid> uuids = generate_bulk(generator_, request, pool);

    std::set<Uuid> unique(uuids.begin(), uuids.end());
    EXPECT_EQ(unique.size(), 5000u);
}

// Test: Bulk name-based generation fills every slot with the same value
TEST_F(BulkGeneratorTest, BulkVersionFiveFillsEverySlot) {
    ThreadPool pool(3);
    GenerationRequest request;
    request.version = 5;
    request.count = 10;
    request.namespace_id = namespace_dns();
    request.name = "python.org";

    std::vector<Uuid> uuids = generate_bulk(generator_, request, pool);

    ASSERT_EQ(uuids.size(), 10u);
    for (const auto& uuid : uuids) {
        EXPECT_EQ(uuid, generator_.new_v5(namespace_dns(), "python.org"));
    }
}

// Test: Fewer items than workers
TEST_F(BulkGeneratorTest, CountSmallerThanPool) {
    ThreadPool pool(8);
    GenerationRequest request;
    request.count = 3;

    std::vector<Uuid> uuids = generate_bulk(generator_, request, pool);
    ASSERT_EQ(uuids.size(), 3u);
    for (const auto& uuid : uuids) {
        EXPECT_FALSE(uuid.is_nil());
    }
}

// Test: Zero count yields an empty result
TEST_F(BulkGeneratorTest, ZeroCount) {
    ThreadPool pool(2);
    GenerationRequest request;
    request.count = 0;
    EXPECT_TRUE(generate_bulk(generator_, request, pool).empty());
}

// Test: Unknown version is rejected before any work is queued
TEST_F(BulkGeneratorTest, BulkRejectsUnknownVersion) {
    ThreadPool pool(2);
    GenerationRequest request;
    request.version = 8;
    request.count = 100;
    EXPECT_THROW(generate_bulk(generator_, request, pool), std::invalid_argument);
}

// Test: Stopped pool surfaces PoolStoppedError
TEST_F(BulkGeneratorTest, StoppedPoolThrows) {
    ThreadPool pool(2);
    pool.shutdown();
    GenerationRequest request;
    request.count = 10;
    EXPECT_THROW(generate_bulk(generator_, request, pool), PoolStoppedError);
}
