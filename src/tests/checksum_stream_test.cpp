#include <gtest/gtest.h>
#include <iterator>
#include <sstream>
#include "crypto/checksum_stream.hpp"
#include "test_utils.hpp"

using namespace ftecho::crypto;

namespace {
const std::string EMPTY_DIGEST = "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";
const std::string ABC_DIGEST = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
}

class ChecksumStreamTest : public ::testing::Test {
protected:
  static void SetUpTestSuite() { init_test_logging(); }

  // Digest of data fed to a fresh stream in pieces of chunk_size bytes
  static std::string chunked_digest(const std::string& data, std::size_t chunk_size) {
    ChecksumStream checksum;
    for (std::size_t pos = 0; pos < data.size(); pos += chunk_size) {
      checksum.update(data.substr(pos, chunk_size));
    }
    return checksum.finalize();
  }
};

TEST_F(ChecksumStreamTest, KnownVectors) {
  EXPECT_EQ(ChecksumStream::digest_of(""), EMPTY_DIGEST);
  EXPECT_EQ(ChecksumStream::digest_of("abc"), ABC_DIGEST);
}

TEST_F(ChecksumStreamTest, EmptyStreamDigest) {
  ChecksumStream checksum;
  EXPECT_EQ(checksum.finalize(), EMPTY_DIGEST);
  EXPECT_EQ(checksum.bytes_processed(), 0u);
}

TEST_F(ChecksumStreamTest, DigestIsLowercaseHex) {
  std::string digest = ChecksumStream::digest_of(generate_random_data(1000));
  ASSERT_EQ(digest.size(), ChecksumStream::HEX_DIGEST_SIZE);
  for (char c : digest) {
    EXPECT_TRUE((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')) << "Unexpected character " << c;
  }
}

TEST_F(ChecksumStreamTest, ChunkBoundariesDoNotAffectDigest) {
  std::string data = generate_random_data(10 * 4096 + 1);
  std::string expected = ChecksumStream::digest_of(data);

  for (std::size_t chunk_size : {std::size_t(1), std::size_t(7), std::size_t(4096), data.size()}) {
    SCOPED_TRACE("chunk size " + std::to_string(chunk_size));
    EXPECT_EQ(chunked_digest(data, chunk_size), expected);
  }
}

TEST_F(ChecksumStreamTest, ConsumeWholeStream) {
  std::string data = generate_random_data(20000);
  std::istringstream input(data);

  ChecksumStream checksum;
  EXPECT_EQ(checksum.consume(input), data.size());
  EXPECT_EQ(checksum.bytes_processed(), data.size());
  EXPECT_EQ(checksum.finalize(), ChecksumStream::digest_of(data));
}

TEST_F(ChecksumStreamTest, ConsumeStopsAtLimit) {
  std::string data = generate_random_data(20000);
  std::istringstream input(data);

  ChecksumStream checksum;
  EXPECT_EQ(checksum.consume(input, 8193), 8193u);
  EXPECT_EQ(checksum.finalize(), ChecksumStream::digest_of(data.substr(0, 8193)));

  // The rest of the stream is left for the caller
  std::string rest((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
  EXPECT_EQ(rest, data.substr(8193));
}

TEST_F(ChecksumStreamTest, ConsumeShortStream) {
  std::istringstream input("abc");
  ChecksumStream checksum;
  EXPECT_EQ(checksum.consume(input, 100), 3u);
  EXPECT_EQ(checksum.finalize(), ABC_DIGEST);
}

TEST_F(ChecksumStreamTest, WriteThroughForwardsBytes) {
  std::ostringstream sink;
  ChecksumStream checksum;
  checksum.write_through(sink, "ab", 2);
  checksum.write_through(sink, "c", 1);
  EXPECT_EQ(sink.str(), "abc");
  EXPECT_EQ(checksum.finalize(), ABC_DIGEST);
}

TEST_F(ChecksumStreamTest, FinalizeTwiceThrows) {
  ChecksumStream checksum;
  checksum.update("abc");
  EXPECT_EQ(checksum.finalize(), ABC_DIGEST);
  EXPECT_TRUE(checksum.is_finalized());
  EXPECT_THROW(checksum.finalize(), DigestError);
}

TEST_F(ChecksumStreamTest, UpdateAfterFinalizeThrows) {
  ChecksumStream checksum;
  checksum.finalize();
  EXPECT_THROW(checksum.update("more"), DigestError);
  EXPECT_THROW(checksum.update("", 0), DigestError);
}

TEST_F(ChecksumStreamTest, ToHex) {
  const unsigned char bytes[] = {0x00, 0x0f, 0xa0, 0xff};
  EXPECT_EQ(ChecksumStream::to_hex(bytes, sizeof(bytes)), "000fa0ff");
  EXPECT_EQ(ChecksumStream::to_hex(bytes, 0), "");
}
