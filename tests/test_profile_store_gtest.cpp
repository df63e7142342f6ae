/**
 * @file test_profile_store_gtest.cpp
 * @brief Google Test suite for the persisted profile store
 */
#include <gtest/gtest.h>
#include <string.h>
#include "uvc_profile_store.h"
#include "uvc_board.h"
#include "uvc_config.h"
#include "tests/mocks/mock_api.h"
#include "tests/mocks/mock_logging.h"

static uvc_profile_t named(const char* name, uint8_t intensity) {
    uvc_profile_t p;
    uvc_profile_init(&p, name);
    uvc_segment_t s = uvc_segment_constant(intensity, 1000);
    uvc_profile_add_segment(&p, UVC_NODE_NONE, &s);
    return p;
}

// Test fixture: store on the mock flash file
class ProfileStoreTest : public ::testing::Test {
protected:
    uvc_profile_store_t store;

    void SetUp() override {
        mock_reset();
        mock_log_reset();
        uvc_reset_config_to_defaults();
        uvc_storage_port_t port;
        uvc_board_storage(&port);
        uvc_store_init(&store, &port);
    }

    // Reload into a fresh store from the same file
    uvc_store_result_t reload(uvc_profile_store_t* other) {
        uvc_storage_port_t port;
        uvc_board_storage(&port);
        uvc_store_init(other, &port);
        return uvc_store_load(other);
    }
};

TEST_F(ProfileStoreTest, MissingFileIsEmptyStore) {
    EXPECT_EQ(uvc_store_load(&store), UVC_STORE_OK);
    EXPECT_EQ(uvc_store_count(&store), 0);
}

TEST_F(ProfileStoreTest, ReadErrorReported) {
    mock_storage_fail_read(true);
    EXPECT_EQ(uvc_store_load(&store), UVC_STORE_IO_ERROR);
}

TEST_F(ProfileStoreTest, SaveAndReload) {
    uvc_profile_t a = named("P-01", 40);
    uvc_profile_t b = named("P-02", 90);
    ASSERT_EQ(uvc_store_save(&store, &a), UVC_STORE_OK);
    ASSERT_EQ(uvc_store_save(&store, &b), UVC_STORE_OK);
    EXPECT_EQ(mock_storage_write_count(), 2u);

    uvc_profile_store_t other;
    ASSERT_EQ(reload(&other), UVC_STORE_OK);
    ASSERT_EQ(uvc_store_count(&other), 2);
    EXPECT_TRUE(uvc_profile_equal(uvc_store_at(&other, 0), &a));
    EXPECT_TRUE(uvc_profile_equal(uvc_store_at(&other, 1), &b));
    EXPECT_EQ(uvc_store_at(&other, 2), nullptr);
}

TEST_F(ProfileStoreTest, SaveReplacesByName) {
    uvc_profile_t a = named("cure", 40);
    ASSERT_EQ(uvc_store_save(&store, &a), UVC_STORE_OK);
    uvc_profile_t a2 = named("cure", 70);
    ASSERT_EQ(uvc_store_save(&store, &a2), UVC_STORE_OK);

    EXPECT_EQ(uvc_store_count(&store), 1);
    EXPECT_EQ(uvc_store_at(&store, 0)->nodes[0].u.segment.start_intensity, 70);
}

TEST_F(ProfileStoreTest, SaveRejectsInvalidAndUnnamed) {
    uvc_profile_t bad = named("bad", 40);
    bad.nodes[0].u.segment.duration_ms = 0;
    EXPECT_EQ(uvc_store_save(&store, &bad), UVC_STORE_INVALID);
    EXPECT_TRUE(mock_log_contains("non-positive duration"));

    uvc_profile_t unnamed = named("", 40);
    EXPECT_EQ(uvc_store_save(&store, &unnamed), UVC_STORE_NO_NAME);
    EXPECT_EQ(uvc_store_count(&store), 0);
    EXPECT_EQ(mock_storage_write_count(), 0u);
}

TEST_F(ProfileStoreTest, ManualStopProfileCanBeStored) {
    uvc_profile_t p;
    uvc_profile_init(&p, "manual");
    p.manual_stop = true;
    uint8_t loop = uvc_profile_add_loop(&p, UVC_NODE_NONE, UVC_REPEAT_INFINITE);
    uvc_segment_t s = uvc_segment_pulse(100, 50, 50, 10);
    uvc_profile_add_segment(&p, loop, &s);
    EXPECT_EQ(uvc_store_save(&store, &p), UVC_STORE_OK);
}

TEST_F(ProfileStoreTest, FullStoreRejectsNewName) {
    char name[UVC_PROFILE_NAME_LEN];
    for (unsigned i = 0; i < UVC_STORE_MAX_PROFILES; ++i) {
        ASSERT_TRUE(uvc_store_next_free_name(&store, name, sizeof(name)));
        uvc_profile_t p = named(name, 50);
        ASSERT_EQ(uvc_store_save(&store, &p), UVC_STORE_OK);
    }
    uvc_profile_t extra = named("extra", 50);
    EXPECT_EQ(uvc_store_save(&store, &extra), UVC_STORE_FULL);

    uvc_profile_t replace = named("P-03", 10);
    EXPECT_EQ(uvc_store_save(&store, &replace), UVC_STORE_OK) << "Replacing still works when full";
}

TEST_F(ProfileStoreTest, WriteFailureRollsBack) {
    uvc_profile_t a = named("keep", 40);
    ASSERT_EQ(uvc_store_save(&store, &a), UVC_STORE_OK);

    mock_storage_fail_write(true);
    uvc_profile_t b = named("lost", 40);
    EXPECT_EQ(uvc_store_save(&store, &b), UVC_STORE_IO_ERROR);
    EXPECT_EQ(uvc_store_count(&store), 1);
    EXPECT_LT(uvc_store_find(&store, "lost"), 0);

    uvc_profile_t a2 = named("keep", 99);
    EXPECT_EQ(uvc_store_save(&store, &a2), UVC_STORE_IO_ERROR);
    EXPECT_EQ(uvc_store_at(&store, 0)->nodes[0].u.segment.start_intensity, 40) << "Old copy restored";

    EXPECT_EQ(uvc_store_remove(&store, "keep"), UVC_STORE_IO_ERROR);
    EXPECT_EQ(uvc_store_count(&store), 1);
}

TEST_F(ProfileStoreTest, RemoveKeepsOrder) {
    uvc_profile_t a = named("a", 10);
    uvc_profile_t b = named("b", 20);
    uvc_profile_t c = named("c", 30);
    ASSERT_EQ(uvc_store_save(&store, &a), UVC_STORE_OK);
    ASSERT_EQ(uvc_store_save(&store, &b), UVC_STORE_OK);
    ASSERT_EQ(uvc_store_save(&store, &c), UVC_STORE_OK);

    EXPECT_EQ(uvc_store_remove(&store, "b"), UVC_STORE_OK);
    EXPECT_EQ(uvc_store_remove(&store, "b"), UVC_STORE_NOT_FOUND);
    ASSERT_EQ(uvc_store_count(&store), 2);
    EXPECT_STREQ(uvc_store_at(&store, 0)->name, "a");
    EXPECT_STREQ(uvc_store_at(&store, 1)->name, "c");

    uvc_profile_store_t other;
    ASSERT_EQ(reload(&other), UVC_STORE_OK);
    EXPECT_EQ(uvc_store_count(&other), 2);
}

TEST_F(ProfileStoreTest, NextFreeNameFillsGaps) {
    char name[8];
    ASSERT_TRUE(uvc_store_next_free_name(&store, name, sizeof(name)));
    EXPECT_STREQ(name, "P-01");

    uvc_profile_t p1 = named("P-01", 10);
    uvc_profile_t p3 = named("P-03", 10);
    ASSERT_EQ(uvc_store_save(&store, &p1), UVC_STORE_OK);
    ASSERT_EQ(uvc_store_save(&store, &p3), UVC_STORE_OK);
    ASSERT_TRUE(uvc_store_next_free_name(&store, name, sizeof(name)));
    EXPECT_STREQ(name, "P-02");

    char tiny[4];
    EXPECT_FALSE(uvc_store_next_free_name(&store, tiny, sizeof(tiny)));
}

TEST_F(ProfileStoreTest, CorruptFileYieldsEmptyStore) {
    mock_storage_set("{ definitely not a profile list");
    EXPECT_EQ(uvc_store_load(&store), UVC_STORE_CORRUPT);
    EXPECT_EQ(uvc_store_count(&store), 0);
    EXPECT_TRUE(mock_log_contains("store parse error"));

    mock_storage_set("{\"name\":\"x\"}");
    EXPECT_EQ(uvc_store_load(&store), UVC_STORE_CORRUPT);
}

TEST_F(ProfileStoreTest, BadEntriesSkippedGoodKept) {
    mock_storage_set(
        "[{\"name\":\"good\",\"manual\":false,\"nodes\":["
        "{\"k\":\"constant\",\"s\":50,\"e\":0,\"d\":1000,\"on\":0,\"off\":0,\"n\":0,\"r\":0,\"p\":-1}]},"
        "{\"name\":\"bad\",\"manual\":false,\"nodes\":[{\"k\":\"wave\",\"p\":-1}]},"
        "{\"name\":\"good\",\"manual\":false,\"nodes\":[]},"
        "42]");
    EXPECT_EQ(uvc_store_load(&store), UVC_STORE_CORRUPT);
    ASSERT_EQ(uvc_store_count(&store), 1);
    EXPECT_STREQ(uvc_store_at(&store, 0)->name, "good");
    EXPECT_TRUE(mock_log_contains("bad or duplicate name"));
}

// Main function for running all tests
int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
