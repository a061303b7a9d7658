#include <unity.h>

#include <string>

#include "io/TrialStore.h"
#include "support/Fakes.h"
#include "util/RunLog.h"

using patchprobe::RunLog;
using patchprobe::io::TrialStore;
using patchprobe::testing::ScratchDir;

namespace {

bool writeRaw(const juce::File& file, const juce::String& text) { return file.replaceWithText(text, false, false, nullptr); }

}  // namespace

void test_trial_store_absent_log_starts_at_zero() {
  ScratchDir scratch("store_absent");
  RunLog log;
  TrialStore store(scratch.path("trials.csv"), log);

  TEST_ASSERT_EQUAL_INT(-1, store.lastIndex());
  TEST_ASSERT_EQUAL_INT(0, store.nextIndex());
  TEST_ASSERT_TRUE(store.loadExisting().empty());
  TEST_ASSERT_TRUE(store.records().empty());

  const auto empty = scratch.file("empty.csv");
  TEST_ASSERT_TRUE(empty.create().wasOk());
  TrialStore emptyStore(empty.getFullPathName().toStdString(), log);
  TEST_ASSERT_EQUAL_INT(0, emptyStore.nextIndex());
}

void test_trial_store_resumes_after_highest_index() {
  ScratchDir scratch("store_resume");
  const auto file = scratch.file("trials.csv");
  TEST_ASSERT_TRUE(writeRaw(file,
                            "index,timestamp,parameters\n"
                            "0,2026-10-19T10:00:00.000Z,\"{\"\"0\"\":0}\"\n"
                            "2,2026-10-19T10:01:00.000Z,\"{\"\"0\"\":85}\"\n"
                            "1,2026-10-19T10:02:00.000Z,\"{ \"\"0\"\" : 170 }\"\n"));
  RunLog log;
  TrialStore store(file.getFullPathName().toStdString(), log);

  const auto resume = store.resumeState();
  TEST_ASSERT_EQUAL_INT(3, resume.nextIndex);
  TEST_ASSERT_EQUAL_INT(3, static_cast<int>(resume.rows));
  TEST_ASSERT_EQUAL_INT(3, static_cast<int>(resume.tried.size()));
  // Stored text is canonicalized on the way in.
  TEST_ASSERT_TRUE(resume.tried.count(R"({"0":170})") == 1);
  TEST_ASSERT_EQUAL_INT(3, store.nextIndex());
}

void test_trial_store_append_creates_header_and_row() {
  ScratchDir scratch("store_append");
  RunLog log;
  TrialStore store(scratch.path("trials.csv"), log);

  TEST_ASSERT_TRUE(store.append(0, {{1, 0}, {0, 170}}).wasOk());
  TEST_ASSERT_TRUE(store.append(1, {{0, 85}, {1, 127}}).wasOk());

  juce::StringArray lines;
  lines.addLines(scratch.file("trials.csv").loadFileAsString());
  lines.removeEmptyStrings();
  TEST_ASSERT_EQUAL_INT(3, lines.size());
  TEST_ASSERT_EQUAL_STRING(TrialStore::kHeader, lines[0].toRawUTF8());
  TEST_ASSERT_TRUE(lines[1].startsWith("0,"));
  TEST_ASSERT_TRUE(lines[1].endsWith(R"("{""0"":170,""1"":0}")"));

  const auto records = store.records();
  TEST_ASSERT_EQUAL_INT(2, static_cast<int>(records.size()));
  TEST_ASSERT_EQUAL_INT(1, records[1].index);
  TEST_ASSERT_EQUAL_INT(127, records[1].assignment.at(1));
  TEST_ASSERT_FALSE(records[0].timestamp.empty());
  TEST_ASSERT_EQUAL_INT(2, store.nextIndex());
}

void test_trial_store_skips_malformed_rows() {
  ScratchDir scratch("store_bad");
  const auto file = scratch.file("trials.csv");
  TEST_ASSERT_TRUE(writeRaw(file,
                            "index,timestamp,parameters\n"
                            "x,ts,\"{\"\"0\"\":1}\"\n"
                            "3,ts,not json\n"
                            "5,ts,\"broken\n"
                            "4,ts,\"{\"\"0\"\":2}\"\n"));
  RunLog log;
  TrialStore store(file.getFullPathName().toStdString(), log);

  const auto records = store.records();
  TEST_ASSERT_EQUAL_INT(1, static_cast<int>(records.size()));
  TEST_ASSERT_EQUAL_INT(4, records[0].index);
  TEST_ASSERT_TRUE(log.count(RunLog::Level::kWarning) >= 3);

  // The row with a bad index still marks its assignment as tried; the row with
  // bad parameters still reserves its index.
  const auto resume = store.resumeState();
  TEST_ASSERT_EQUAL_INT(5, resume.nextIndex);
  TEST_ASSERT_TRUE(resume.tried.count(R"({"0":1})") == 1);
}

void test_trial_store_ignores_partial_trailing_row() {
  ScratchDir scratch("store_partial");
  const auto file = scratch.file("trials.csv");
  TEST_ASSERT_TRUE(writeRaw(file,
                            "index,timestamp,parameters\n"
                            "0,ts,\"{\"\"0\"\":1}\"\n"
                            "1,ts,\"{\"\"0"));
  RunLog log;
  TrialStore store(file.getFullPathName().toStdString(), log);
  TEST_ASSERT_EQUAL_INT(1, static_cast<int>(store.records().size()));
  TEST_ASSERT_EQUAL_INT(1, store.nextIndex());
  TEST_ASSERT_EQUAL_INT(0, static_cast<int>(log.count(RunLog::Level::kWarning)));

  // Our row lands on a line of its own; the torn fragment is then a complete
  // but malformed line and gets skipped.
  TEST_ASSERT_TRUE(store.append(1, {{0, 2}}).wasOk());
  const auto records = store.records();
  TEST_ASSERT_EQUAL_INT(2, static_cast<int>(records.size()));
  TEST_ASSERT_EQUAL_INT(2, records[1].assignment.at(0));
}

void test_trial_store_maps_columns_by_name() {
  ScratchDir scratch("store_columns");
  const auto file = scratch.file("trials.csv");
  TEST_ASSERT_TRUE(writeRaw(file,
                            "parameters,index,timestamp\n"
                            "\"{\"\"7\"\":9}\",6,ts\n"));
  RunLog log;
  TrialStore store(file.getFullPathName().toStdString(), log);
  const auto records = store.records();
  TEST_ASSERT_EQUAL_INT(1, static_cast<int>(records.size()));
  TEST_ASSERT_EQUAL_INT(6, records[0].index);
  TEST_ASSERT_EQUAL_INT(9, records[0].assignment.at(7));
}

void test_trial_store_reads_past_byte_order_mark() {
  ScratchDir scratch("store_bom");
  const auto file = scratch.file("trials.csv");
  const std::string text =
      "\xEF\xBB\xBF"
      "index,timestamp,parameters\r\n"
      "0,ts,\"{\"\"0\"\":0}\"\r\n"
      "1,ts,\"{\"\"0\"\":85}\"\r\n"
      "2,ts,\"{\"\"0\"\":170}\"\r\n";
  TEST_ASSERT_TRUE(file.replaceWithData(text.data(), text.size()));
  RunLog log;
  TrialStore store(file.getFullPathName().toStdString(), log);

  TEST_ASSERT_TRUE(store.verify().wasOk());
  TEST_ASSERT_EQUAL_INT(3, store.nextIndex());
  TEST_ASSERT_EQUAL_INT(3, static_cast<int>(store.loadExisting().size()));
  TEST_ASSERT_EQUAL_INT(0, static_cast<int>(log.count(RunLog::Level::kError)));

  TEST_ASSERT_TRUE(store.append(3, {{0, 255}}).wasOk());
  TEST_ASSERT_EQUAL_INT(4, static_cast<int>(store.records().size()));
}

void test_trial_store_refuses_log_with_unknown_header() {
  ScratchDir scratch("store_bad_header");
  const auto file = scratch.file("trials.csv");
  TEST_ASSERT_TRUE(writeRaw(file,
                            "trial,when,patch\n"
                            "0,ts,\"{\"\"0\"\":0}\"\n"));
  const auto before = file.getSize();
  RunLog log;
  TrialStore store(file.getFullPathName().toStdString(), log);

  const auto checked = store.verify();
  TEST_ASSERT_TRUE(checked.failed());
  TEST_ASSERT_TRUE(checked.getErrorMessage().contains("lacks index/parameters"));
  // Appending would restart at index 0 on top of existing rows.
  TEST_ASSERT_TRUE(store.append(0, {{0, 85}}).failed());
  TEST_ASSERT_TRUE(file.getSize() == before);

  const auto empty = scratch.file("empty.csv");
  TEST_ASSERT_TRUE(empty.create().wasOk());
  TEST_ASSERT_TRUE(TrialStore(empty.getFullPathName().toStdString(), log).verify().wasOk());
  TEST_ASSERT_TRUE(TrialStore(scratch.path("absent.csv"), log).verify().wasOk());
}
