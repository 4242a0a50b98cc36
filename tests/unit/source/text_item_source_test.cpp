#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "../../common/mocks_test.hpp"
#include "../../common/utilities_test.hpp"
#include "vectorlink_core/errors.hpp"
#include "vectorlink_core/source/text_item_source.hpp"

namespace vectorlink_tests {

using namespace vectorlink_core;

class TextItemSourceTest : public TempDirectoryTestBase {
 protected:
  std::vector<std::string> drain(TextItemStream& stream) {
    std::vector<std::string> items;
    while (auto item = stream.next()) {
      items.push_back(*item);
    }
    return items;
  }

  std::filesystem::path log_path() const {
    return temp_dir_ / "operations.jsonl";
  }
};

TEST_F(TextItemSourceTest, YieldsPayloadsInOrderAndSkipsOperationsWithoutText) {
  TestUtilities::write_lines(log_path(), {
      TestUtilities::inserted_line("1", "alpha"),
      TestUtilities::deleted_line("7"),
      TestUtilities::changed_line("2", "beta"),
      R"({"op":"Error","message":"upstream hiccup"})",
      TestUtilities::inserted_line("3", "gamma"),
  });

  TextItemSource source(log_path());
  EXPECT_EQ(drain(source), (std::vector<std::string>{"alpha", "beta", "gamma"}));
  EXPECT_EQ(source.lines_read(), 5u);
}

TEST_F(TextItemSourceTest, SameLogYieldsSameSequenceOnReopen) {
  TestUtilities::write_lines(log_path(), {
      TestUtilities::inserted_line("1", "one"),
      TestUtilities::deleted_line("1"),
      TestUtilities::inserted_line("2", "two"),
  });

  TextItemSource first(log_path());
  TextItemSource second(log_path());
  EXPECT_EQ(drain(first), drain(second));
}

TEST_F(TextItemSourceTest, AcceptsMissingTrailingNewlineAndCrlf) {
  TestUtilities::write_raw(log_path(), TestUtilities::inserted_line("1", "a") + "\r\n" +
                                           TestUtilities::inserted_line("2", "b"));

  TextItemSource source(log_path());
  EXPECT_EQ(drain(source), (std::vector<std::string>{"a", "b"}));
}

TEST_F(TextItemSourceTest, KeepsUnicodePayloadIntact) {
  TestUtilities::write_lines(log_path(), {TestUtilities::inserted_line("1", "caf\xC3\xA9 \xE2\x9C\x93")});

  TextItemSource source(log_path());
  auto item = source.next();
  ASSERT_TRUE(item.has_value());
  EXPECT_EQ(*item, "caf\xC3\xA9 \xE2\x9C\x93");
}

TEST_F(TextItemSourceTest, InvalidUtf8IsFatalAndStopsTheSource) {
  TestUtilities::write_lines(log_path(), {
      TestUtilities::inserted_line("1", "fine"),
      "{\"op\":\"Inserted\",\"id\":\"2\",\"string\":\"bad \xFF\xFE\"}",
      TestUtilities::inserted_line("3", "never reached"),
  });

  TextItemSource source(log_path());
  EXPECT_EQ(source.next(), std::optional<std::string>("fine"));
  try {
    source.next();
    FAIL() << "expected ParseError";
  } catch (const ParseError& e) {
    EXPECT_EQ(e.line_number(), 2u);
  }
  // No silent skip to line 3
  EXPECT_FALSE(source.next().has_value());
}

TEST_F(TextItemSourceTest, InvalidJsonIsParseError) {
  TestUtilities::write_lines(log_path(), {"{not json"});

  TextItemSource source(log_path());
  EXPECT_THROW(source.next(), ParseError);
}

TEST_F(TextItemSourceTest, UnknownOperationTagIsParseError) {
  TestUtilities::write_lines(log_path(), {R"({"op":"Renamed","id":"1","string":"x"})"});

  TextItemSource source(log_path());
  EXPECT_THROW(source.next(), ParseError);
}

TEST_F(TextItemSourceTest, MissingPayloadFieldIsParseError) {
  TestUtilities::write_lines(log_path(), {R"({"op":"Inserted","id":"1"})"});

  TextItemSource source(log_path());
  EXPECT_THROW(source.next(), ParseError);
}

TEST_F(TextItemSourceTest, MistypedPayloadFieldIsParseError) {
  TestUtilities::write_lines(log_path(), {R"({"op":"Changed","id":"1","string":42})"});

  TextItemSource source(log_path());
  EXPECT_THROW(source.next(), ParseError);
}

TEST_F(TextItemSourceTest, EmptyLineIsParseError) {
  TestUtilities::write_lines(log_path(), {TestUtilities::inserted_line("1", "a"), ""});

  TextItemSource source(log_path());
  EXPECT_TRUE(source.next().has_value());
  EXPECT_THROW(source.next(), ParseError);
}

TEST_F(TextItemSourceTest, MissingLogIsIoError) {
  EXPECT_THROW(TextItemSource(temp_dir_ / "absent.jsonl"), IoError);
}

TEST_F(TextItemSourceTest, EmptyLogYieldsNothing) {
  TestUtilities::write_raw(log_path(), "");

  TextItemSource source(log_path());
  EXPECT_FALSE(source.next().has_value());
}

TEST(SkipItemsTest, SkipsLeadingItemsLazily) {
  VectorItemStream upstream({"a", "b", "c", "d"});
  SkipItems skip(upstream, 2);

  EXPECT_EQ(upstream.pulled(), 0u);
  EXPECT_EQ(skip.next(), std::optional<std::string>("c"));
  EXPECT_EQ(skip.next(), std::optional<std::string>("d"));
  EXPECT_FALSE(skip.next().has_value());
  EXPECT_EQ(skip.skipped(), 2u);
}

TEST(SkipItemsTest, SkippingPastTheEndIsEmptyNotAnError) {
  VectorItemStream upstream({"a", "b"});
  SkipItems skip(upstream, 5);

  EXPECT_FALSE(skip.next().has_value());
  EXPECT_EQ(skip.skipped(), 2u);
  EXPECT_FALSE(skip.next().has_value());
}

TEST(SkipItemsTest, ZeroSkipPassesEverythingThrough) {
  VectorItemStream upstream({"a"});
  SkipItems skip(upstream, 0);

  EXPECT_EQ(skip.next(), std::optional<std::string>("a"));
  EXPECT_FALSE(skip.next().has_value());
}

}  // namespace vectorlink_tests
