#include <gtest/gtest.h>
#include <stdexcept>
#include "store/read_options.hpp"

using namespace xs::store;

namespace {

const std::string SAMPLE_ID = "03BIDZVKNOTGJPVUEW3K23G45";

} // namespace

TEST(ReadOptionsTest, NoQueryGivesDefaults) {
  ReadOptions options = ReadOptions::from_query(std::nullopt);
  EXPECT_EQ(options.follow, FollowOption::off());
  EXPECT_FALSE(options.tail);
  EXPECT_FALSE(options.last_id.has_value());
  EXPECT_FALSE(options.compaction_strategy);

  EXPECT_EQ(ReadOptions::from_query(std::string()).follow, FollowOption::off());
}

TEST(ReadOptionsTest, FollowValues) {
  EXPECT_EQ(ReadOptions::from_query(std::string("follow")).follow, FollowOption::on());
  EXPECT_EQ(ReadOptions::from_query(std::string("follow=")).follow, FollowOption::on());
  EXPECT_EQ(ReadOptions::from_query(std::string("follow=yes")).follow, FollowOption::on());
  EXPECT_EQ(ReadOptions::from_query(std::string("follow=true")).follow, FollowOption::on());
  EXPECT_EQ(ReadOptions::from_query(std::string("follow=no")).follow, FollowOption::off());
  EXPECT_EQ(ReadOptions::from_query(std::string("follow=false")).follow, FollowOption::off());

  FollowOption heartbeat = ReadOptions::from_query(std::string("follow=5000")).follow;
  EXPECT_EQ(heartbeat.mode, FollowMode::WithHeartbeat);
  EXPECT_EQ(heartbeat.interval, std::chrono::milliseconds(5000));
  EXPECT_TRUE(heartbeat.enabled());
}

TEST(ReadOptionsTest, TailValues) {
  EXPECT_TRUE(ReadOptions::from_query(std::string("tail")).tail);
  EXPECT_TRUE(ReadOptions::from_query(std::string("tail=yes")).tail);
  EXPECT_TRUE(ReadOptions::from_query(std::string("tail=anything")).tail);
  EXPECT_FALSE(ReadOptions::from_query(std::string("tail=false")).tail);
  EXPECT_FALSE(ReadOptions::from_query(std::string("tail=no")).tail);
  EXPECT_FALSE(ReadOptions::from_query(std::string("tail=0")).tail);
}

TEST(ReadOptionsTest, LastId) {
  ReadOptions options = ReadOptions::from_query("last-id=" + SAMPLE_ID);
  ASSERT_TRUE(options.last_id.has_value());
  EXPECT_EQ(*options.last_id, FrameId::parse(SAMPLE_ID));
}

TEST(ReadOptionsTest, CombinedQuery) {
  ReadOptions options = ReadOptions::from_query("follow=250&tail=no&last-id=" + SAMPLE_ID + "&other=1");
  EXPECT_EQ(options.follow, FollowOption::with_heartbeat(std::chrono::milliseconds(250)));
  EXPECT_FALSE(options.tail);
  ASSERT_TRUE(options.last_id.has_value());
  EXPECT_EQ(options.last_id->to_string(), SAMPLE_ID);
}

TEST(ReadOptionsTest, PercentEncodedValues) {
  EXPECT_EQ(ReadOptions::from_query(std::string("follow=%74rue")).follow, FollowOption::on());
  EXPECT_THROW(ReadOptions::from_query(std::string("follow=%7")), std::invalid_argument);
}

TEST(ReadOptionsTest, RejectsBadValues) {
  EXPECT_THROW(ReadOptions::from_query(std::string("last-id=123")), std::invalid_argument);
  EXPECT_THROW(ReadOptions::from_query(std::string("follow=sometimes")), std::invalid_argument);
  EXPECT_THROW(ReadOptions::from_query(std::string("follow=-5")), std::invalid_argument);
  EXPECT_THROW(ReadOptions::from_query(std::string("follow=18446744073709551615")), std::invalid_argument);
  EXPECT_THROW(ReadOptions::from_query(std::string("follow=9223372036854775808")), std::invalid_argument);
  EXPECT_THROW(ReadOptions::from_query(std::string("follow=99999999999999999999999")), std::invalid_argument);
}

TEST(ReadOptionsTest, LargestHeartbeatIntervalAccepted) {
  ReadOptions options = ReadOptions::from_query(std::string("follow=9223372036854775807"));
  EXPECT_EQ(options.follow.mode, FollowMode::WithHeartbeat);
  EXPECT_EQ(options.follow.interval, std::chrono::milliseconds::max());
}

TEST(ReadOptionsTest, UnknownKeysIgnored) {
  ReadOptions options = ReadOptions::from_query(std::string("limit=10&&sort=asc"));
  EXPECT_EQ(options.follow, FollowOption::off());
  EXPECT_FALSE(options.tail);
}
