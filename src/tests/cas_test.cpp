#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>
#include "cas/cas.hpp"
#include "test_utils.hpp"

using namespace xs::cas;

class CasTest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;
  std::unique_ptr<Cas> cas;

  void SetUp() override {
    init_logging();
    test_dir = make_test_dir("cas_test");
    cas = std::make_unique<Cas>(test_dir / "cacache");
  }

  void TearDown() override {
    cas.reset();
    std::filesystem::remove_all(test_dir);
  }

  std::size_t count_files(const std::filesystem::path& dir) {
    if (!std::filesystem::exists(dir)) {
      return 0;
    }
    std::size_t count = 0;
    for (const auto& entry : std::filesystem::recursive_directory_iterator(dir)) {
      if (entry.is_regular_file()) {
        ++count;
      }
    }
    return count;
  }
};

TEST(IntegrityTest, ParsesCanonicalDigest) {
  const std::string text = "sha256-LPJNul+wow4m6DsqxbninhsWHlwfp0JecwQzYpOLmCQ=";
  Integrity integrity = Integrity::parse(text);
  EXPECT_EQ(integrity.to_string(), text);
  EXPECT_EQ(integrity.hex(), "2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824");
}

TEST(IntegrityTest, RejectsMalformedDigests) {
  EXPECT_THROW(Integrity::parse(""), std::invalid_argument);
  EXPECT_THROW(Integrity::parse("md5-LPJNul+wow4m6DsqxbninhsWHlwfp0JecwQzYpOLmCQ="), std::invalid_argument);
  EXPECT_THROW(Integrity::parse("sha256-LPJNul+wow4m6Dsqxbninh"), std::invalid_argument);
  EXPECT_THROW(Integrity::parse("sha256-LPJNul+wow4m6DsqxbninhsWHlwfp0JecwQzYpOLm!="), std::invalid_argument);
}

TEST_F(CasTest, StreamingRoundTrip) {
  Writer writer = cas->writer();
  writer.write("hello");
  writer.write(" ");
  writer.write(std::string("world"));
  EXPECT_EQ(writer.bytes_written(), 11u);
  Integrity integrity = writer.commit();

  EXPECT_EQ(integrity.to_string(), "sha256-uU0nuZNNPgilLlLX2n2r+sSE7+N6U4DukIj3rOLvzek=");
  EXPECT_TRUE(cas->has(integrity));

  auto reader = cas->reader(integrity);
  ASSERT_TRUE(reader.has_value());
  EXPECT_EQ(reader->size(), 11u);
  EXPECT_EQ(reader->read_to_end(), "hello world");
}

TEST_F(CasTest, ContentLayout) {
  Integrity integrity = cas->insert("hello");
  std::filesystem::path expected = test_dir / "cacache" / "content" / "sha256" / "2c" / "f2" /
    "4dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824";
  EXPECT_EQ(cas->content_path(integrity), expected);
  EXPECT_TRUE(std::filesystem::exists(expected));
}

TEST_F(CasTest, IdenticalContentSameDigest) {
  Integrity first = cas->insert("repeat me");

  Writer writer = cas->writer();
  writer.write("repeat ");
  writer.write("me");
  Integrity second = writer.commit();

  EXPECT_EQ(first, second);
  EXPECT_EQ(count_files(test_dir / "cacache" / "content"), 1u);
  EXPECT_EQ(count_files(test_dir / "cacache" / "tmp"), 0u);
}

TEST_F(CasTest, EmptyContent) {
  Integrity integrity = cas->insert("");
  EXPECT_EQ(integrity.to_string(), "sha256-47DEQpj8HBSa+/TImW+5JCeuQeRkm5NMpJWZG3hSuFU=");
  EXPECT_EQ(cas->read(integrity).value_or("missing"), "");
}

TEST_F(CasTest, UncommittedWriterLeavesNothing) {
  {
    Writer writer = cas->writer();
    writer.write("abandoned");
  }
  EXPECT_EQ(count_files(test_dir / "cacache" / "content"), 0u);
  EXPECT_EQ(count_files(test_dir / "cacache" / "tmp"), 0u);
}

TEST_F(CasTest, WriteAfterCommitThrows) {
  Writer writer = cas->writer();
  writer.write("once");
  writer.commit();
  EXPECT_THROW(writer.write("twice"), CasError);
  EXPECT_THROW(writer.commit(), CasError);
}

TEST_F(CasTest, UnknownDigestIsNotFound) {
  Integrity unknown = Integrity::parse("sha256-LPJNul+wow4m6DsqxbninhsWHlwfp0JecwQzYpOLmCQ=");
  EXPECT_FALSE(cas->has(unknown));
  EXPECT_FALSE(cas->reader(unknown).has_value());
  EXPECT_FALSE(cas->read(unknown).has_value());
}

TEST_F(CasTest, TamperedContentFailsVerification) {
  Integrity integrity = cas->insert("original");
  {
    std::ofstream file(cas->content_path(integrity), std::ios::binary | std::ios::trunc);
    file << "tampered";
  }
  EXPECT_THROW(cas->read(integrity), CasError);
}

TEST_F(CasTest, LargeStreamInChunks) {
  const std::string chunk(4096, 'x');
  Writer writer = cas->writer();
  for (int i = 0; i < 64; ++i) {
    writer.write(chunk);
  }
  Integrity integrity = writer.commit();

  auto reader = cas->reader(integrity);
  ASSERT_TRUE(reader.has_value());
  char buffer[1000];
  std::size_t total = 0;
  std::size_t n = 0;
  while ((n = reader->read(buffer, sizeof(buffer))) > 0) {
    total += n;
  }
  EXPECT_EQ(total, chunk.size() * 64);
}
