#include <gtest/gtest.h>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>
#include "store/frame_id.hpp"

using namespace xs::store;

TEST(FrameIdTest, ParsesAndFormatsBase36) {
  const std::string text = "03BIDZVKNOTGJPVUEW3K23G45";
  FrameId id = FrameId::parse(text);
  EXPECT_EQ(id.to_string(), text);
  EXPECT_EQ(FrameId::parse(id.to_string()), id);
}

TEST(FrameIdTest, ParseAcceptsLowercase) {
  EXPECT_EQ(FrameId::parse("03bidzvknotgjpvuew3k23g45"), FrameId::parse("03BIDZVKNOTGJPVUEW3K23G45"));
}

TEST(FrameIdTest, ParseRejectsMalformedText) {
  EXPECT_THROW(FrameId::parse("123"), std::invalid_argument);
  EXPECT_THROW(FrameId::parse(""), std::invalid_argument);
  EXPECT_THROW(FrameId::parse("03BIDZVKNOTGJPVUEW3K23G4!"), std::invalid_argument);
  // Larger than 128 bits
  EXPECT_THROW(FrameId::parse("ZZZZZZZZZZZZZZZZZZZZZZZZZ"), std::invalid_argument);
}

TEST(FrameIdTest, FieldsRoundTripThroughBytes) {
  FrameId id = FrameId::from_fields(0x0123456789AB, 0xABCDEF, 0x123456, 0xDEADBEEF);
  EXPECT_EQ(id.timestamp(), 0x0123456789ABULL);
  EXPECT_EQ(id.counter_hi(), 0xABCDEFu);
  EXPECT_EQ(id.counter_lo(), 0x123456u);
  EXPECT_EQ(id.entropy(), 0xDEADBEEFu);

  EXPECT_EQ(id.to_key().size(), FrameId::SIZE);
  EXPECT_EQ(FrameId::from_bytes(id.to_key()), id);
  EXPECT_THROW(FrameId::from_bytes("short"), std::invalid_argument);
}

TEST(FrameIdTest, FromFieldsRejectsOutOfRange) {
  EXPECT_THROW(FrameId::from_fields(FrameId::MAX_TIMESTAMP + 1, 0, 0, 0), std::invalid_argument);
  EXPECT_THROW(FrameId::from_fields(0, FrameId::MAX_COUNTER + 1, 0, 0), std::invalid_argument);
}

TEST(FrameIdTest, TextOrderMatchesKeyOrder) {
  FrameId earlier = FrameId::from_fields(1000, 5, 9, 0xFFFFFFFF);
  FrameId later = FrameId::from_fields(1001, 0, 0, 0);
  EXPECT_LT(earlier, later);
  EXPECT_LT(earlier.to_key(), later.to_key());
  EXPECT_LT(earlier.to_string(), later.to_string());
}

TEST(FrameIdGeneratorTest, StrictlyIncreasing) {
  FrameIdGenerator generator;
  FrameId previous = generator.generate();
  for (int i = 0; i < 10000; ++i) {
    FrameId next = generator.generate();
    ASSERT_LT(previous, next);
    previous = next;
  }
}

TEST(FrameIdGeneratorTest, ClockGoingBackKeepsOrder) {
  FrameIdGenerator generator;
  FrameId first = generator.generate_at(50000);
  FrameId second = generator.generate_at(10000);
  EXPECT_LT(first, second);
  EXPECT_EQ(second.timestamp(), 50000u);
}

TEST(FrameIdGeneratorTest, ObserveResumesAfterGivenId) {
  FrameIdGenerator generator;
  FrameId persisted = FrameId::from_fields(90000, 100, 200, 0xFFFFFFFF);
  generator.observe(persisted);

  FrameId next = generator.generate_at(80000);
  EXPECT_GT(next, persisted);
  EXPECT_EQ(next.timestamp(), 90000u);

  // Observing an older identifier changes nothing
  generator.observe(FrameId::from_fields(1, 0, 0, 0));
  EXPECT_GT(generator.generate_at(80000), next);
}

TEST(FrameIdGeneratorTest, UniqueAcrossThreads) {
  FrameIdGenerator generator;
  const int thread_count = 4;
  const int per_thread = 2000;

  std::vector<std::vector<FrameId>> results(thread_count);
  std::vector<std::thread> threads;
  for (int t = 0; t < thread_count; ++t) {
    threads.emplace_back([&generator, &results, t]() {
      for (int i = 0; i < per_thread; ++i) {
        results[t].push_back(generator.generate());
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  std::set<FrameId> unique;
  for (const auto& ids : results) {
    unique.insert(ids.begin(), ids.end());
  }
  EXPECT_EQ(unique.size(), static_cast<std::size_t>(thread_count * per_thread));
}
