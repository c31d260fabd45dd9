#include <gtest/gtest.h>
#include <atomic>
#include <filesystem>
#include <memory>
#include <set>
#include <thread>
#include <vector>
#include "store/local_record_store.hpp"
#include "test_utils.hpp"

using namespace distore::store;

class LocalRecordStoreTest : public ::testing::Test {
protected:
  TempDir dir{"record_store_test"};
  std::unique_ptr<LocalRecordStore> store;
  const std::string container = "files";

  void SetUp() override {
    init_test_logging();
    store = std::make_unique<LocalRecordStore>(dir.path(), 3, 64);
    ASSERT_NE(store, nullptr);
  }

  static OutgoingAttachment attachment(const std::string& name, const std::string& data) {
    return {name, Bytes(data.begin(), data.end())};
  }

  static std::string fetch_text(const Attachment& attachment) {
    Bytes bytes = attachment.fetch();
    return std::string(bytes.begin(), bytes.end());
  }

  // Helper to create a record and check it reads back unchanged
  RecordId create_and_verify(const std::vector<OutgoingAttachment>& attachments, const std::string& content) {
    Record created = store->create(container, attachments, content);
    Record loaded = store->get(container, created.id);

    EXPECT_EQ(loaded.id, created.id);
    EXPECT_EQ(loaded.content, content);
    EXPECT_EQ(loaded.attachments.size(), attachments.size());
    for (std::size_t i = 0; i < attachments.size() && i < loaded.attachments.size(); ++i) {
      EXPECT_EQ(loaded.attachments[i].filename, attachments[i].filename);
      EXPECT_EQ(loaded.attachments[i].size, attachments[i].data.size());
      EXPECT_EQ(loaded.attachments[i].fetch(), attachments[i].data);
    }
    return created.id;
  }
};

TEST_F(LocalRecordStoreTest, BasicOperations) {
  RecordId id = create_and_verify({attachment("a.part0", "hello"), attachment("a.part1", "world")}, "text");
  EXPECT_EQ(id, 1u);

  // Record without attachments
  create_and_verify({}, "only text");
}

TEST_F(LocalRecordStoreTest, IdsIncreaseWithinContainer) {
  RecordId first = store->create(container, {}, "1").id;
  RecordId second = store->create(container, {}, "2").id;
  RecordId other = store->create("elsewhere", {}, "3").id;

  EXPECT_LT(first, second);
  EXPECT_EQ(other, 1u);
}

TEST_F(LocalRecordStoreTest, EditReplacesContentOnly) {
  RecordId id = store->create(container, {attachment("x.part0", "data")}, "before").id;
  store->edit(container, id, "after");

  Record loaded = store->get(container, id);
  EXPECT_EQ(loaded.content, "after");
  ASSERT_EQ(loaded.attachments.size(), 1u);
  EXPECT_EQ(fetch_text(loaded.attachments[0]), "data");
}

TEST_F(LocalRecordStoreTest, RemoveDeletesRecordAndBlobs) {
  RecordId id = store->create(container, {attachment("x.part0", "data")}, "text").id;
  store->remove(container, id);

  EXPECT_THROW(store->get(container, id), StoreError);
  EXPECT_TRUE(std::filesystem::is_empty(dir.path() / "blobs"));
}

TEST_F(LocalRecordStoreTest, FetchAfterRemoveFails) {
  Record record = store->create(container, {attachment("x.part0", "data")}, "text");
  Record loaded = store->get(container, record.id);
  store->remove(container, record.id);

  EXPECT_THROW(loaded.attachments[0].fetch(), StoreError);
}

TEST_F(LocalRecordStoreTest, ErrorHandling) {
  EXPECT_THROW(store->get(container, 42), StoreError);
  EXPECT_THROW(store->edit(container, 42, "x"), StoreError);
  EXPECT_THROW(store->remove(container, 42), StoreError);

  // Limits
  std::vector<OutgoingAttachment> too_many = {
    attachment("1", "a"), attachment("2", "b"), attachment("3", "c"), attachment("4", "d")
  };
  std::vector<OutgoingAttachment> too_large = {attachment("big", std::string(65, 'X'))};
  EXPECT_THROW(store->create(container, too_many, "x"), StoreError);
  EXPECT_THROW(store->create(container, too_large, "x"), StoreError);
}

TEST_F(LocalRecordStoreTest, InvalidContainerNames) {
  std::vector<std::string> bad_names = {"", ".", "..", "../escape", "a/b", "a\\b"};
  for (const auto& name : bad_names) {
    EXPECT_THROW(store->create(name, {}, "x"), StoreError) << "Container: " << name;
  }
}

TEST_F(LocalRecordStoreTest, ListsPagesNewestFirst) {
  for (int i = 0; i < 5; ++i) {
    store->create(container, {}, "record " + std::to_string(i));
  }

  auto first = store->list_page(container, std::nullopt, 2);
  ASSERT_EQ(first.size(), 2u);
  EXPECT_EQ(first[0].id, 5u);
  EXPECT_EQ(first[1].id, 4u);

  auto second = store->list_page(container, first.back().id, 2);
  ASSERT_EQ(second.size(), 2u);
  EXPECT_EQ(second[0].id, 3u);
  EXPECT_EQ(second[1].id, 2u);

  auto last = store->list_page(container, second.back().id, 2);
  ASSERT_EQ(last.size(), 1u);
  EXPECT_EQ(last[0].id, 1u);

  EXPECT_TRUE(store->list_page(container, last.back().id, 2).empty());
  EXPECT_TRUE(store->list_page("unused", std::nullopt, 2).empty());
}

TEST_F(LocalRecordStoreTest, SameFilenameInDifferentRecordsDoesNotCollide) {
  RecordId a = store->create(container, {attachment("same", "first")}, "a").id;
  RecordId b = store->create(container, {attachment("same", "second")}, "b").id;

  EXPECT_EQ(fetch_text(store->get(container, a).attachments[0]), "first");
  EXPECT_EQ(fetch_text(store->get(container, b).attachments[0]), "second");
}

TEST_F(LocalRecordStoreTest, ConcurrentAccess) {
  const std::size_t num_threads = 5;
  const std::size_t ops_per_thread = 20;
  std::atomic<std::size_t> successful_ops{0};
  std::vector<std::thread> threads;
  std::vector<std::vector<RecordId>> ids(num_threads);

  for (std::size_t i = 0; i < num_threads; ++i) {
    threads.emplace_back([this, i, ops_per_thread, &successful_ops, &ids]() {
      for (std::size_t j = 0; j < ops_per_thread; ++j) {
        try {
          std::string data = "Data " + std::to_string(i) + "_" + std::to_string(j);
          Record record = store->create(container, {attachment("part", data)}, data);
          ids[i].push_back(record.id);
          successful_ops++;
        } catch (const std::exception& e) {
          ADD_FAILURE() << "Thread " << i << " failed: " << e.what();
        }
      }
    });
  }

  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(successful_ops, num_threads * ops_per_thread);

  std::set<RecordId> unique;
  for (const auto& thread_ids : ids) {
    unique.insert(thread_ids.begin(), thread_ids.end());
  }
  EXPECT_EQ(unique.size(), num_threads * ops_per_thread);
}
