#include <gtest/gtest.h>
#include <string>
#include "transfer/chain_record.hpp"
#include "test_utils.hpp"

using namespace distore::transfer;

class ChainRecordTest : public ::testing::Test {
protected:
  void SetUp() override {
    init_test_logging();
  }

  static std::string marker_line() {
    return std::string(RECORD_MARKER) + "\n";
  }
};

TEST_F(ChainRecordTest, EncodesHeadWithMarkerAndFieldOrder) {
  ChainRecord record;
  record.name = "movie.mkv";
  record.total_size = 25000000;
  record.extent_count = 3;
  record.next = 42;

  EXPECT_EQ(ChainRecordCodec::encode(record),
            marker_line() + "name=movie.mkv\nsize=25000000\nlen=3\nnext=42\n");
}

TEST_F(ChainRecordTest, EncodesTailWithoutNext) {
  ChainRecord record;
  record.name = "a.bin";
  record.total_size = 5;
  record.extent_count = 1;

  EXPECT_EQ(ChainRecordCodec::encode(record), marker_line() + "name=a.bin\nsize=5\nlen=1\n");
}

TEST_F(ChainRecordTest, EncodesMiddleRecordWithOnlyNext) {
  ChainRecord record;
  record.next = 7;

  EXPECT_EQ(ChainRecordCodec::encode(record), marker_line() + "next=7\n");
}

TEST_F(ChainRecordTest, EmptyRecordIsJustTheMarker) {
  EXPECT_EQ(ChainRecordCodec::encode(ChainRecord{}), marker_line());
}

TEST_F(ChainRecordTest, RejectsNameWithLineBreak) {
  ChainRecord record;
  record.name = "bad\nname";
  EXPECT_THROW(ChainRecordCodec::encode(record), MalformedRecord);

  record.name = "bad\rname";
  EXPECT_THROW(ChainRecordCodec::encode(record), MalformedRecord);
}

TEST_F(ChainRecordTest, ChecksNamesWithoutEncoding) {
  EXPECT_NO_THROW(ChainRecordCodec::check_name("plain name.txt"));
  EXPECT_THROW(ChainRecordCodec::check_name("line\nbreak"), MalformedRecord);
  EXPECT_THROW(ChainRecordCodec::check_name("carriage\rreturn"), MalformedRecord);
}

TEST_F(ChainRecordTest, DecodesEncodedRecord) {
  ChainRecord record;
  record.name = "report.pdf";
  record.total_size = 123456;
  record.extent_count = 2;
  record.next = 99;

  ChainRecord decoded = ChainRecordCodec::decode(ChainRecordCodec::encode(record));
  EXPECT_EQ(decoded, record);
  EXPECT_TRUE(decoded.is_head());
  EXPECT_FALSE(decoded.is_tail());
}

TEST_F(ChainRecordTest, DecodeSkipsCommentsBlankLinesAndUnknownKeys) {
  std::string content = marker_line()
      + "\n"
      + "# a comment\n"
      + "name=x\n"
      + "colour=blue\n"
      + "size=10\n"
      + "len=1\n";

  ChainRecord decoded = ChainRecordCodec::decode(content);
  ASSERT_TRUE(decoded.name.has_value());
  EXPECT_EQ(*decoded.name, "x");
  EXPECT_EQ(decoded.total_size, 10u);
  EXPECT_EQ(decoded.extent_count, 1u);
  EXPECT_FALSE(decoded.next.has_value());
  EXPECT_TRUE(decoded.is_tail());
}

TEST_F(ChainRecordTest, DecodeSplitsAtFirstSeparator) {
  ChainRecord decoded = ChainRecordCodec::decode("name=a=b.txt\n");
  ASSERT_TRUE(decoded.name.has_value());
  EXPECT_EQ(*decoded.name, "a=b.txt");
}

TEST_F(ChainRecordTest, DecodeToleratesCarriageReturns) {
  ChainRecord decoded = ChainRecordCodec::decode(std::string(RECORD_MARKER) + "\r\nnext=12\r\n");
  EXPECT_EQ(decoded.next, 12u);
}

TEST_F(ChainRecordTest, DecodeOfEmptyTextIsEmptyRecord) {
  ChainRecord decoded = ChainRecordCodec::decode("");
  EXPECT_EQ(decoded, ChainRecord{});
  EXPECT_FALSE(decoded.is_head());
}

TEST_F(ChainRecordTest, DecodeRejectsLineWithoutSeparator) {
  EXPECT_THROW(ChainRecordCodec::decode(marker_line() + "garbage\n"), MalformedRecord);
}

TEST_F(ChainRecordTest, DecodeRejectsBadNumbers) {
  EXPECT_THROW(ChainRecordCodec::decode("size=-1\n"), MalformedRecord);
  EXPECT_THROW(ChainRecordCodec::decode("len=abc\n"), MalformedRecord);
  EXPECT_THROW(ChainRecordCodec::decode("next=\n"), MalformedRecord);
  EXPECT_THROW(ChainRecordCodec::decode("next=99999999999999999999999\n"), MalformedRecord);
}

TEST_F(ChainRecordTest, DetectsMarker) {
  EXPECT_TRUE(ChainRecordCodec::has_marker(marker_line() + "name=a\n"));
  EXPECT_TRUE(ChainRecordCodec::has_marker(RECORD_MARKER));
  EXPECT_FALSE(ChainRecordCodec::has_marker("hello world"));
  EXPECT_FALSE(ChainRecordCodec::has_marker(""));
  EXPECT_FALSE(ChainRecordCodec::has_marker(std::string(RECORD_MARKER) + " extra\n"));
}
