#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <memory>

#include <nlohmann/json.hpp>

#include "../client/src/errors.h"
#include "../client/src/resume_store.h"

using namespace converthub::client;
using json = nlohmann::json;

namespace {

ResumeRecord SampleRecord(const std::string &session_id = "sess-42") {
  ResumeRecord record;
  record.session_id = session_id;
  record.filename = "archive.zip";
  record.target_format = "7z";
  record.total_size = 2500;
  record.chunk_size = 1000;
  record.acknowledged_parts = {0, 2};
  return record;
}

class FileResumeStoreTest : public ::testing::Test {
 protected:
  void SetUp() override {
    directory_ = std::filesystem::temp_directory_path() /
                 ("converthub_resume_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
    std::filesystem::remove_all(directory_);
  }
  void TearDown() override { std::filesystem::remove_all(directory_); }

  std::filesystem::path directory_;
};

}  // namespace

TEST(ResumeRecordTest, ComputesPartGeometry) {
  const auto record = SampleRecord();
  EXPECT_EQ(record.TotalParts(), 3u);
  EXPECT_EQ(record.PartLength(0), 1000u);
  EXPECT_EQ(record.PartLength(2), 500u);
  EXPECT_EQ(record.PartLength(3), 0u);
  EXPECT_EQ(record.AcknowledgedBytes(), 1500u);
  EXPECT_FALSE(record.AllAcknowledged());
}

TEST(ResumeRecordTest, SurvivesSerialization) {
  auto record = SampleRecord();
  record.finalize_state = FinalizeState::kDone;
  record.job_id = "job-7";
  const auto restored = ResumeRecord::FromJson(json::parse(record.ToJson().dump()));
  EXPECT_EQ(restored.session_id, "sess-42");
  EXPECT_EQ(restored.acknowledged_parts, record.acknowledged_parts);
  EXPECT_EQ(restored.finalize_state, FinalizeState::kDone);
  EXPECT_EQ(restored.job_id, "job-7");
}

TEST(ResumeRecordTest, RejectsInconsistentDocuments) {
  auto payload = SampleRecord().ToJson();
  payload["acknowledgedParts"] = json::array({0, 3});
  EXPECT_THROW(ResumeRecord::FromJson(payload), InvalidResumeRecordError);

  payload = SampleRecord().ToJson();
  payload["finalizeState"] = "done";
  EXPECT_THROW(ResumeRecord::FromJson(payload), InvalidResumeRecordError);

  payload = SampleRecord().ToJson();
  payload["finalizeState"] = "halfway";
  EXPECT_THROW(ResumeRecord::FromJson(payload), InvalidResumeRecordError);

  payload = SampleRecord().ToJson();
  payload.erase("chunkSize");
  EXPECT_THROW(ResumeRecord::FromJson(payload), InvalidResumeRecordError);

  EXPECT_THROW(ResumeRecord::FromJson(json::array()), InvalidResumeRecordError);
}

TEST(MemoryResumeStoreTest, LeaseIsExclusiveUntilReleased) {
  MemoryResumeStore store;
  store.Save(SampleRecord());
  ASSERT_TRUE(store.Load("sess-42").has_value());
  {
    auto lease = store.AcquireLease("sess-42");
    EXPECT_THROW(store.AcquireLease("sess-42"), SessionBusyError);
    EXPECT_NO_THROW(store.AcquireLease("sess-43"));
  }
  EXPECT_NO_THROW(store.AcquireLease("sess-42"));
  store.Remove("sess-42");
  EXPECT_FALSE(store.Load("sess-42").has_value());
}

TEST_F(FileResumeStoreTest, PersistsAcrossInstances) {
  {
    FileResumeStore store(directory_);
    store.Save(SampleRecord());
  }
  FileResumeStore reopened(directory_);
  const auto loaded = reopened.Load("sess-42");
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->filename, "archive.zip");
  EXPECT_EQ(loaded->acknowledged_parts, (std::set<std::uint64_t>{0, 2}));
  EXPECT_FALSE(std::filesystem::exists(directory_ / "sess-42.json.tmp"));

  reopened.Remove("sess-42");
  EXPECT_FALSE(reopened.Load("sess-42").has_value());
  EXPECT_FALSE(reopened.Load("sess-never").has_value());
}

TEST_F(FileResumeStoreTest, RepeatedSavesReplaceTheRecord) {
  FileResumeStore store(directory_);
  auto record = SampleRecord();
  store.Save(record);
  record.acknowledged_parts.insert(1);
  store.Save(record);

  const auto loaded = FileResumeStore(directory_).Load("sess-42");
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->acknowledged_parts, (std::set<std::uint64_t>{0, 1, 2}));
  EXPECT_FALSE(std::filesystem::exists(directory_ / "sess-42.json.tmp"));
}

TEST_F(FileResumeStoreTest, CorruptRecordIsReported) {
  FileResumeStore store(directory_);
  {
    std::ofstream out(directory_ / "sess-bad.json");
    out << "{\"sessionId\": ";
  }
  EXPECT_THROW(store.Load("sess-bad"), InvalidResumeRecordError);

  auto foreign = SampleRecord("sess-other");
  {
    std::ofstream out(directory_ / "sess-renamed.json");
    out << foreign.ToJson().dump();
  }
  EXPECT_THROW(store.Load("sess-renamed"), InvalidResumeRecordError);
}

TEST_F(FileResumeStoreTest, RefusesSessionIdsThatEscapeTheDirectory) {
  FileResumeStore store(directory_);
  EXPECT_THROW(store.Load("../etc/passwd"), InvalidResumeRecordError);
  EXPECT_THROW(store.Save(SampleRecord("a/b")), InvalidResumeRecordError);
  EXPECT_THROW(store.AcquireLease(".."), InvalidResumeRecordError);
}

TEST_F(FileResumeStoreTest, LeaseExcludesOtherStoreInstances) {
  FileResumeStore first(directory_);
  FileResumeStore second(directory_);
  {
    auto lease = first.AcquireLease("sess-42");
    EXPECT_THROW(second.AcquireLease("sess-42"), SessionBusyError);
    EXPECT_THROW(first.AcquireLease("sess-42"), SessionBusyError);
  }
  EXPECT_NO_THROW(second.AcquireLease("sess-42"));
}
