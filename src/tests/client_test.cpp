#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <atomic>
#include <thread>
#include "client/client.hpp"
#include "config/server_config.hpp"
#include "crypto/checksum_stream.hpp"
#include "network/listener.hpp"
#include "network/protocol_error.hpp"
#include "transfer/transfer_error.hpp"
#include "test_utils.hpp"

using namespace ftecho::client;
using ftecho::crypto::ChecksumStream;
using ftecho::network::Frame;
using ftecho::network::FrameType;
using ftecho::store::FileEntry;
using ftecho::store::StorageManager;

class ClientTest : public ::testing::Test {
protected:
  static void SetUpTestSuite() { init_test_logging(); }

  void SetUp() override {
    temp_dir = std::make_unique<TempDir>("ftecho_client_test");
    storage = std::make_unique<StorageManager>(temp_dir->path());

    ftecho::config::ServerConfig config;
    config.address = "127.0.0.1";
    config.port = 0;
    config.storage_root = temp_dir->path().string();
    listener = std::make_unique<ftecho::network::Listener>(config, *storage);
    ASSERT_TRUE(listener->start_listener());

    client.connect("127.0.0.1", listener->port());
  }

  void TearDown() override {
    client.close();
    listener->shutdown();
    listener.reset();
    storage.reset();
    temp_dir.reset();
  }

  // Helper to upload a whole buffer through a client
  std::string put(Client& with, const std::string& name, const std::string& data) {
    std::istringstream source(data);
    return with.put_file(name, source, data.size());
  }

  std::string get(Client& with, const std::string& name) {
    std::ostringstream out;
    with.get_file(name, out);
    return out.str();
  }

  std::filesystem::path partial_path(const std::string& name) const {
    return temp_dir->path() / (name + StorageManager::PARTIAL_SUFFIX);
  }

  std::unique_ptr<TempDir> temp_dir;
  std::unique_ptr<StorageManager> storage;
  std::unique_ptr<ftecho::network::Listener> listener;
  Client client;
};

TEST_F(ClientTest, PutListGet) {
  std::string data = generate_random_data(10 * 4096 + 1);
  EXPECT_EQ(put(client, "data.bin", data), ChecksumStream::digest_of(data));
  EXPECT_EQ(put(client, "empty", ""), ChecksumStream::digest_of(""));

  EXPECT_THAT(client.list_files(), ::testing::ElementsAre(FileEntry{"data.bin", data.size()},
                                                        FileEntry{"empty", 0}));

  std::ostringstream out;
  TransferResult result = client.get_file("data.bin", out);
  EXPECT_EQ(out.str(), data);
  EXPECT_EQ(result.bytes, data.size());
  EXPECT_EQ(result.sha256, ChecksumStream::digest_of(data));
}

TEST_F(ClientTest, RemoteErrorKeepsConnectionUsable) {
  std::ostringstream out;
  try {
    client.get_file("missing", out);
    FAIL() << "Expected RemoteError";
  } catch (const RemoteError& e) {
    EXPECT_EQ(e.remote_message(), "File not found: missing");
  }
  EXPECT_TRUE(out.str().empty());

  EXPECT_TRUE(client.is_connected());
  EXPECT_TRUE(client.list_files().empty());
}

TEST_F(ClientTest, InvalidFilenameIsRemoteError) {
  std::istringstream source("x");
  EXPECT_THROW(client.put_file("../escape", source, 1), RemoteError);
  EXPECT_TRUE(client.list_files().empty());
}

TEST_F(ClientTest, ShortSourceAbortsUpload) {
  std::istringstream source("only five");
  EXPECT_THROW(client.put_file("short", source, 100), ftecho::transfer::SizeMismatchError);
  EXPECT_FALSE(client.is_connected());

  ASSERT_TRUE(wait_until([&]() { return !storage->is_writing("short"); }));
  EXPECT_EQ(storage->partial_size("short"), 9u);
  EXPECT_THROW(storage->open_committed("short"), ftecho::store::NotFoundError);
}

TEST_F(ClientTest, ResumePutAfterInterruptedUpload) {
  std::string data = generate_random_data(5 * 4096 + 123);
  std::size_t cut = 2 * 4096 + 7;

  {
    // Upload that stops early
    std::istringstream prefix(data.substr(0, cut));
    EXPECT_THROW(client.put_file("movie", prefix, data.size()), ftecho::transfer::SizeMismatchError);
  }
  ASSERT_TRUE(wait_until([&]() { return !storage->is_writing("movie"); }));
  std::uint64_t offset = storage->partial_size("movie");
  ASSERT_EQ(offset, cut);

  client.connect("127.0.0.1", listener->port());
  std::istringstream source(data);
  EXPECT_EQ(client.resume_put("movie", source, offset), ChecksumStream::digest_of(data));

  EXPECT_EQ(read_file(temp_dir->path() / "movie"), data);
  EXPECT_FALSE(std::filesystem::exists(partial_path("movie")));
}

TEST_F(ClientTest, ResumePutWrongOffsetIsRemoteError) {
  write_file(partial_path("f"), "12345");
  std::istringstream source("1234567890");
  try {
    client.resume_put("f", source, 3);
    FAIL() << "Expected RemoteError";
  } catch (const RemoteError& e) {
    EXPECT_EQ(e.remote_message(), "Offset mismatch: expected 5, got 3");
  }
  EXPECT_EQ(read_file(partial_path("f")), "12345");
}

TEST_F(ClientTest, ResumeGetFetchesTail) {
  std::string data = generate_random_data(3 * 4096 + 99);
  put(client, "doc", data);

  for (std::size_t offset : {std::size_t(0), std::size_t(4096), data.size()}) {
    SCOPED_TRACE("offset " + std::to_string(offset));
    std::istringstream existing(data.substr(0, offset));
    std::ostringstream tail;
    TransferResult result = client.resume_get("doc", existing, tail);

    EXPECT_EQ(tail.str(), data.substr(offset));
    EXPECT_EQ(result.bytes, data.size());
    EXPECT_EQ(result.sha256, ChecksumStream::digest_of(data));
  }
}

TEST_F(ClientTest, ResumeGetWithDivergentPrefixDetectsMismatch) {
  put(client, "doc", "hello world");
  std::istringstream existing("HELLO");
  std::ostringstream tail;
  EXPECT_THROW(client.resume_get("doc", existing, tail), ftecho::transfer::ChecksumMismatchError);
  EXPECT_EQ(tail.str(), " world");
}

TEST_F(ClientTest, ResumeGetBeyondEndIsRemoteError) {
  put(client, "doc", "abc");
  std::istringstream existing("abcdef");
  std::ostringstream tail;
  EXPECT_THROW(client.resume_get("doc", existing, tail), RemoteError);
}

TEST_F(ClientTest, ConcurrentReadersSeeWholeVersions) {
  const std::string old_content = generate_random_data(50000, 1);
  const std::string new_content = generate_random_data(30000, 2);
  put(client, "hot", old_content);

  std::atomic<bool> done{false};
  std::atomic<int> reads{0};
  std::atomic<int> bad_reads{0};
  std::thread reader([&]() {
    Client reader_client;
    reader_client.connect("127.0.0.1", listener->port());
    while (!done || reads == 0) {
      std::string content = get(reader_client, "hot");
      if (content != old_content && content != new_content) {
        ++bad_reads;
      }
      ++reads;
    }
    reader_client.quit();
  });

  for (int i = 0; i < 10; ++i) {
    put(client, "hot", i % 2 == 0 ? new_content : old_content);
  }
  done = true;
  reader.join();

  EXPECT_GT(reads.load(), 0);
  EXPECT_EQ(bad_reads.load(), 0);
}

TEST_F(ClientTest, RawFramesAfterOperation) {
  client.send_frame(Frame(FrameType::FILE_CHUNK, "stray"));
  Frame reply = client.receive_frame();
  EXPECT_EQ(reply.type, FrameType::ERROR);
  EXPECT_TRUE(client.list_files().empty());
}

TEST_F(ClientTest, QuitClosesConnection) {
  client.quit();
  EXPECT_FALSE(client.is_connected());
  EXPECT_THROW(client.list_files(), ftecho::network::TransportError);
}

TEST_F(ClientTest, ConnectFailure) {
  // Bind then release a port so nothing listens on it
  std::uint16_t port = 0;
  {
    boost::asio::io_context io;
    boost::asio::ip::tcp::acceptor acceptor(io,
      boost::asio::ip::tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
    port = acceptor.local_endpoint().port();
  }
  Client other;
  EXPECT_THROW(other.connect("127.0.0.1", port), ftecho::network::TransportError);
  EXPECT_FALSE(other.is_connected());
}

TEST_F(ClientTest, InvalidChunkSize) {
  EXPECT_THROW(Client(0), std::invalid_argument);
}
