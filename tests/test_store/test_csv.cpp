#include <unity.h>

#include <string>

#include "io/Csv.h"

namespace csv = patchprobe::io::csv;

void test_csv_split_row_handles_quotes() {
  const auto fields = csv::splitRow(R"(7,"0,85,170",plain)");
  TEST_ASSERT_TRUE(fields.has_value());
  TEST_ASSERT_EQUAL_INT(3, static_cast<int>(fields->size()));
  TEST_ASSERT_EQUAL_STRING("7", (*fields)[0].c_str());
  TEST_ASSERT_EQUAL_STRING("0,85,170", (*fields)[1].c_str());
  TEST_ASSERT_EQUAL_STRING("plain", (*fields)[2].c_str());

  const auto json = csv::splitRow(R"(0,2026-10-19T10:00:00.000Z,"{""0"":170,""1"":0}")");
  TEST_ASSERT_TRUE(json.has_value());
  TEST_ASSERT_EQUAL_STRING(R"({"0":170,"1":0})", (*json)[2].c_str());
}

void test_csv_split_row_rejects_malformed() {
  TEST_ASSERT_FALSE(csv::splitRow(R"(1,"never closed)").has_value());
  TEST_ASSERT_FALSE(csv::splitRow(R"(1,"closed"junk)").has_value());
  // Empty fields are still fields.
  const auto blanks = csv::splitRow(",,");
  TEST_ASSERT_TRUE(blanks.has_value());
  TEST_ASSERT_EQUAL_INT(3, static_cast<int>(blanks->size()));
}

void test_csv_quote_and_join() {
  TEST_ASSERT_EQUAL_STRING("bare", csv::quoteField("bare").c_str());
  TEST_ASSERT_EQUAL_STRING(R"("a,b")", csv::quoteField("a,b").c_str());
  TEST_ASSERT_EQUAL_STRING(R"("say ""hi""")", csv::quoteField(R"(say "hi")").c_str());

  const std::string row = csv::joinRow({"3", "ts", R"({"5":1})"});
  TEST_ASSERT_EQUAL_STRING(R"(3,ts,"{""5"":1}")", row.c_str());
  const auto back = csv::splitRow(row);
  TEST_ASSERT_TRUE(back.has_value());
  TEST_ASSERT_EQUAL_STRING(R"({"5":1})", (*back)[2].c_str());
}

void test_csv_split_lines_drops_unterminated_tail_on_request() {
  const std::string text = "header\r\n1,a\n\n2,b\n3,partial";

  const auto complete = csv::splitLines(text, false);
  TEST_ASSERT_EQUAL_INT(3, static_cast<int>(complete.size()));
  TEST_ASSERT_EQUAL_STRING("header", complete[0].text.c_str());
  TEST_ASSERT_EQUAL_STRING("2,b", complete[2].text.c_str());
  TEST_ASSERT_EQUAL_INT(4, static_cast<int>(complete[2].number));

  const auto all = csv::splitLines(text, true);
  TEST_ASSERT_EQUAL_INT(4, static_cast<int>(all.size()));
  TEST_ASSERT_EQUAL_STRING("3,partial", all[3].text.c_str());
}

void test_csv_parse_integer() {
  TEST_ASSERT_EQUAL_INT(42, static_cast<int>(*csv::parseInteger(" 42 ")));
  TEST_ASSERT_EQUAL_INT(7, static_cast<int>(*csv::parseInteger("+7")));
  TEST_ASSERT_EQUAL_INT(-3, static_cast<int>(*csv::parseInteger("-3")));
  TEST_ASSERT_FALSE(csv::parseInteger("").has_value());
  TEST_ASSERT_FALSE(csv::parseInteger("4x").has_value());
  TEST_ASSERT_FALSE(csv::parseInteger("1.5").has_value());
}
