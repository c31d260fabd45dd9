#include <gtest/gtest.h>
#include <chrono>
#include <stdexcept>
#include <thread>
#include "transfer/transfer_error.hpp"
#include "transfer/transfer_task.hpp"
#include "test_utils.hpp"

using namespace distore::transfer;

class TransferTaskTest : public ::testing::Test {
protected:
  ProgressChannel channel;

  void SetUp() override {
    init_test_logging();
  }

  // Drains the channel until a terminal event arrives
  TransferEvent wait_for_result() {
    TransferEvent event;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (std::chrono::steady_clock::now() < deadline) {
      if (channel.consume(event) && event.type != EventType::PROGRESS) {
        return event;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    ADD_FAILURE() << "No result event within the deadline";
    return event;
  }
};

TEST_F(TransferTaskTest, ReportsSummaryOnSuccess) {
  TransferTask task(channel, [](ProgressChannel& events) {
    TransferEvent progress;
    progress.progress = {Phase::UPLOADING, "Uploading", 0.5};
    events.produce(progress);
    return std::string("uploaded");
  });

  TransferEvent event = wait_for_result();
  EXPECT_EQ(event.type, EventType::FINISHED);
  EXPECT_EQ(event.message, "uploaded");

  task.join();
  EXPECT_FALSE(task.running());
}

TEST_F(TransferTaskTest, ReportsErrorMessageOnFailure) {
  TransferTask task(channel, [](ProgressChannel&) -> std::string {
    throw InvalidRecord("Downloading: record 3 is not the head of a chain");
  });

  TransferEvent event = wait_for_result();
  EXPECT_EQ(event.type, EventType::FAILED);
  EXPECT_EQ(event.message, "Downloading: record 3 is not the head of a chain");
}

TEST_F(TransferTaskTest, AbortedTransferPublishesNothing) {
  channel.close();
  TransferTask task(channel, [](ProgressChannel&) -> std::string {
    throw TransferAborted("Uploading: progress consumer disconnected");
  });
  task.join();

  EXPECT_FALSE(task.running());
  EXPECT_TRUE(channel.empty());
}
