#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "../dynrep/replication/backoff_writer.h"
#include "../dynrep/storage/errors.h"
#include "in_memory_table_service.h"
#include "sleep_recorder.h"

namespace replication {
namespace {

using std::chrono::milliseconds;
using testing_support::InMemoryTableService;
using testing_support::MakeItem;

class BackoffWriterTest : public ::testing::Test {
 protected:
  void SetUp() override {
    service_ = std::make_shared<InMemoryTableService>();
    service_->CreateTable("orders", storage::KeySchema{"pk", std::string("sk")});
    table_ = std::make_unique<TableHandle>("dev", "orders", service_);
    service_->ClearCallLog();
  }

  std::vector<storage::Item> MakeBatch(size_t n) {
    std::vector<storage::Item> items;
    for (size_t i = 0; i < n; ++i) {
      items.push_back(MakeItem({{"pk", "p" + std::to_string(i)}, {"sk", "s"}, {"payload", "x"}}));
    }
    return items;
  }

  std::shared_ptr<InMemoryTableService> service_;
  std::unique_ptr<TableHandle> table_;
  testing_support::SleepRecorder sleeps_;
};

TEST_F(BackoffWriterTest, RetriesShrinkingUnprocessedSetWithDoublingDelay) {
  service_->ScriptUnprocessed({25, 10, 0});
  BackoffWriter writer(*table_, storage::WriteKind::kPut, BackoffPolicy{milliseconds(3), 0}, sleeps_.Fn());

  writer.Execute(MakeBatch(25));

  EXPECT_EQ(service_->BatchSizes(), (std::vector<size_t>{25, 25, 10}));
  EXPECT_EQ(sleeps_.Delays(), (std::vector<milliseconds>{milliseconds(3), milliseconds(6)}));
  EXPECT_EQ(service_->Items("orders").size(), 25u);
}

TEST_F(BackoffWriterTest, DelaysKeepDoublingUntilDrained) {
  service_->ScriptUnprocessed({5, 5, 5, 5, 0});
  BackoffWriter writer(*table_, storage::WriteKind::kPut, BackoffPolicy{milliseconds(3000), 0}, sleeps_.Fn());

  writer.Execute(MakeBatch(5));

  EXPECT_EQ(sleeps_.Delays(), (std::vector<milliseconds>{milliseconds(3000), milliseconds(6000),
                                                          milliseconds(12000), milliseconds(24000)}));
  EXPECT_EQ(service_->BatchSizes().size(), 5u);
}

TEST_F(BackoffWriterTest, NoRetryWhenEverythingIsProcessed) {
  BackoffWriter writer(*table_, storage::WriteKind::kPut, BackoffPolicy{}, sleeps_.Fn());
  writer.Execute(MakeBatch(3));
  EXPECT_EQ(service_->BatchSizes(), (std::vector<size_t>{3}));
  EXPECT_TRUE(sleeps_.Delays().empty());
}

TEST_F(BackoffWriterTest, NonSuccessStatusFailsWithoutRetry) {
  service_->ScriptWriteStatus({500});
  BackoffWriter writer(*table_, storage::WriteKind::kPut, BackoffPolicy{}, sleeps_.Fn());

  try {
    writer.Execute(MakeBatch(4));
    FAIL() << "expected ServiceError";
  } catch (const storage::ServiceError& e) {
    EXPECT_EQ(e.http_status(), 500);
  }
  EXPECT_EQ(service_->BatchSizes().size(), 1u);
  EXPECT_TRUE(sleeps_.Delays().empty());
  EXPECT_TRUE(service_->Items("orders").empty());
}

TEST_F(BackoffWriterTest, NonSuccessStatusDuringRetryFails) {
  service_->ScriptUnprocessed({2});
  service_->ScriptWriteStatus({200, 503});
  BackoffWriter writer(*table_, storage::WriteKind::kPut, BackoffPolicy{milliseconds(1), 0}, sleeps_.Fn());

  EXPECT_THROW(writer.Execute(MakeBatch(4)), storage::ServiceError);
  EXPECT_EQ(service_->BatchSizes(), (std::vector<size_t>{4, 2}));
  EXPECT_EQ(service_->Items("orders").size(), 2u);
}

TEST_F(BackoffWriterTest, MaxAttemptsEndsRetryLoop) {
  service_->ScriptUnprocessed({1, 1, 1, 1, 1});
  BackoffWriter writer(*table_, storage::WriteKind::kPut, BackoffPolicy{milliseconds(3), 2}, sleeps_.Fn());

  try {
    writer.Execute(MakeBatch(3));
    FAIL() << "expected RetryExhaustedError";
  } catch (const storage::RetryExhaustedError& e) {
    EXPECT_EQ(e.attempts(), 2);
  }
  EXPECT_EQ(service_->BatchSizes(), (std::vector<size_t>{3, 1, 1}));
  EXPECT_EQ(sleeps_.Delays(), (std::vector<milliseconds>{milliseconds(3), milliseconds(6)}));
}

TEST_F(BackoffWriterTest, ExhaustedRetriesAreNotReportedAsAServiceFailure) {
  service_->ScriptUnprocessed({1, 1});
  BackoffWriter writer(*table_, storage::WriteKind::kPut, BackoffPolicy{milliseconds(3), 1}, sleeps_.Fn());

  bool exhausted = false;
  try {
    writer.Execute(MakeBatch(2));
  } catch (const storage::ServiceError& e) {
    ADD_FAILURE() << "caught as ServiceError with HTTP " << e.http_status();
  } catch (const storage::RetryExhaustedError& e) {
    exhausted = true;
    EXPECT_EQ(e.attempts(), 1);
  }
  EXPECT_TRUE(exhausted);
}

TEST_F(BackoffWriterTest, OversizeBatchIsRejectedBeforeAnyCall) {
  BackoffWriter writer(*table_, storage::WriteKind::kPut, BackoffPolicy{}, sleeps_.Fn());
  EXPECT_THROW(writer.Execute(MakeBatch(26)), storage::ConfigurationError);
  EXPECT_TRUE(service_->CallLog().empty());
}

TEST_F(BackoffWriterTest, EmptyBatchIsANoOp) {
  BackoffWriter writer(*table_, storage::WriteKind::kDelete, BackoffPolicy{}, sleeps_.Fn());
  writer.Execute({});
  EXPECT_TRUE(service_->CallLog().empty());
}

TEST_F(BackoffWriterTest, DeleteRemovesItemsByKey) {
  auto items = MakeBatch(10);
  service_->PutItems("orders", items);
  service_->ClearCallLog();

  BackoffWriter writer(*table_, storage::WriteKind::kDelete, BackoffPolicy{}, sleeps_.Fn());
  writer.Execute(items);

  EXPECT_TRUE(service_->Items("orders").empty());
  for (const auto& w : service_->AppliedWrites()) EXPECT_EQ(w.kind, storage::WriteKind::kDelete);
  EXPECT_EQ(service_->CallLog(), (std::vector<std::string>{"batch_write:orders:DeleteRequest:10"}));
}

TEST_F(BackoffWriterTest, DeleteOfItemWithoutKeyIsRejected) {
  BackoffWriter writer(*table_, storage::WriteKind::kDelete, BackoffPolicy{}, sleeps_.Fn());
  EXPECT_THROW(writer.Execute({MakeItem({{"pk", "a"}})}), storage::ConfigurationError);
  EXPECT_TRUE(service_->CallLog().empty());
}

}  // namespace
}  // namespace replication
