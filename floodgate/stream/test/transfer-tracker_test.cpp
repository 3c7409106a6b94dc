#include "floodgate/transfer-tracker.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include "floodgate/timedef.hpp"
#include "floodgate/transfer-record.hpp"
#include "floodgate/transfer-sink.hpp"

namespace floodgate {

namespace {

class RecordingSink : public TransferSink {
 public:
  void consume(const TransferRecord& record) override {
    std::lock_guard lock(mutex);
    records.push_back(record);
  }

  std::mutex mutex;
  std::vector<TransferRecord> records;
};

TransferRecord MakeRecord() {
  TransferRecord record;
  record.method = "GET";
  record.path = "/10MB.bin";
  record.httpVersion = "HTTP/1.1";
  record.status = 200;
  record.requestedBytes = 10000000;
  record.contentLength = 10000000;
  record.startTime = SysClock::now();
  return record;
}

}  // namespace

class TransferTrackerTest : public ::testing::Test {
 protected:
  RecordingSink sink;
};

TEST_F(TransferTrackerTest, CompleteFinalizesOnce) {
  TransferTracker tracker(MakeRecord(), &sink);
  tracker.onWritten(6000000);
  tracker.onWritten(4000000);
  EXPECT_FALSE(tracker.finalized());
  EXPECT_TRUE(tracker.complete());
  EXPECT_TRUE(tracker.finalized());
  EXPECT_FALSE(tracker.complete());
  EXPECT_FALSE(tracker.abort("late"));

  ASSERT_EQ(sink.records.size(), 1U);
  const auto& record = sink.records.front();
  EXPECT_TRUE(record.completed);
  EXPECT_EQ(record.bytesWritten, 10000000U);
  EXPECT_TRUE(record.abortReason.empty());
  EXPECT_GE(record.endTime, record.startTime);
}

TEST_F(TransferTrackerTest, AbortKeepsPartialCount) {
  {
    TransferTracker tracker(MakeRecord(), &sink);
    tracker.onWritten(16384);
    EXPECT_TRUE(tracker.abort("write error"));
  }
  ASSERT_EQ(sink.records.size(), 1U);
  EXPECT_FALSE(sink.records.front().completed);
  EXPECT_EQ(sink.records.front().bytesWritten, 16384U);
  EXPECT_EQ(sink.records.front().abortReason, "write error");
}

TEST_F(TransferTrackerTest, DestructionAbortsUnfinishedTransfer) {
  {
    TransferTracker tracker(MakeRecord(), &sink);
    tracker.onWritten(1);
  }
  ASSERT_EQ(sink.records.size(), 1U);
  EXPECT_FALSE(sink.records.front().completed);
  EXPECT_EQ(sink.records.front().abortReason, "connection closed");
}

TEST_F(TransferTrackerTest, NullSink) {
  TransferTracker tracker(MakeRecord(), nullptr);
  EXPECT_TRUE(tracker.complete());
  EXPECT_TRUE(tracker.record().completed);
}

TEST_F(TransferTrackerTest, RacingFinalizationsProduceOneRecord) {
  for (int iter = 0; iter < 50; ++iter) {
    std::optional<TransferTracker> tracker(std::in_place, MakeRecord(), &sink);
    std::atomic<int> nbFinalized{0};
    std::atomic<bool> go{false};
    std::vector<std::jthread> threads;
    for (int threadPos = 0; threadPos < 4; ++threadPos) {
      threads.emplace_back([&, threadPos] {
        while (!go.load()) {
        }
        const bool won = threadPos % 2 == 0 ? tracker->complete() : tracker->abort("cancelled");
        nbFinalized += static_cast<int>(won);
      });
    }
    go = true;
    threads.clear();
    EXPECT_EQ(nbFinalized.load(), 1);
    tracker.reset();
  }
  EXPECT_EQ(sink.records.size(), 50U);
}

}  // namespace floodgate
