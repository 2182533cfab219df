#include "store/memory_record_store.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace squirrel::store;

class MemoryRecordStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::string error;
        ASSERT_TRUE(store.open(error)) << error;
    }

    RecordId Insert(const std::string &name, const std::string &size = "medium") {
        Record created;
        EXPECT_TRUE(store.insert(name, size, created)) << store.last_error();
        return created.id;
    }

    MemoryRecordStore store;
};

TEST_F(MemoryRecordStoreTest, StartsEmpty) {
    EXPECT_EQ(store.size(), 0u);
    EXPECT_TRUE(store.list().empty());
    EXPECT_FALSE(store.get(1).has_value());
}

TEST_F(MemoryRecordStoreTest, InsertAssignsIncreasingIds) {
    Record created;
    ASSERT_TRUE(store.insert("Chip", "small", created));
    EXPECT_EQ(created.id, 1);
    EXPECT_EQ(created.name, "Chip");
    EXPECT_EQ(created.size, "small");

    EXPECT_EQ(Insert("Dale"), 2);
    EXPECT_EQ(Insert("Nutkin"), 3);
    EXPECT_EQ(store.size(), 3u);
}

TEST_F(MemoryRecordStoreTest, ListIsOrderedById) {
    Insert("A");
    Insert("B");
    Insert("C");

    auto records = store.list();
    ASSERT_EQ(records.size(), 3u);
    EXPECT_LT(records[0].id, records[1].id);
    EXPECT_LT(records[1].id, records[2].id);
    EXPECT_EQ(records[0].name, "A");
    EXPECT_EQ(records[2].name, "C");
}

TEST_F(MemoryRecordStoreTest, IdsAreNotReusedAfterDelete) {
    Insert("S1");
    RecordId middle = Insert("S2");
    RecordId last = Insert("S3");

    ASSERT_TRUE(store.remove(middle));
    ASSERT_TRUE(store.remove(last));

    RecordId next = Insert("S4");
    EXPECT_GT(next, last);
}

TEST_F(MemoryRecordStoreTest, UpdateChangesFieldsInPlace) {
    RecordId id = Insert("Dale", "medium");

    ASSERT_TRUE(store.update(id, "Dale", "large"));

    auto record = store.get(id);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->id, id);
    EXPECT_EQ(record->size, "large");
    EXPECT_EQ(store.size(), 1u);
}

TEST_F(MemoryRecordStoreTest, UpdateUnknownIdFails) {
    EXPECT_FALSE(store.update(99, "X", "Y"));
    EXPECT_NE(store.last_error().find("not found"), std::string::npos);
}

TEST_F(MemoryRecordStoreTest, RejectsEmptyFields) {
    Record created;
    EXPECT_FALSE(store.insert("", "small", created));
    EXPECT_FALSE(store.insert("Chip", "", created));
    EXPECT_EQ(store.size(), 0u);

    RecordId id = Insert("Chip", "small");
    EXPECT_FALSE(store.update(id, "", "large"));
    EXPECT_EQ(store.get(id)->name, "Chip");
}

TEST_F(MemoryRecordStoreTest, RemoveTwiceFails) {
    RecordId id = Insert("DeleteMe");

    EXPECT_TRUE(store.remove(id));
    EXPECT_FALSE(store.remove(id));
    EXPECT_FALSE(store.get(id).has_value());
    EXPECT_EQ(store.size(), 0u);
}
