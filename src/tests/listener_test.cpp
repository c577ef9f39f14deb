#include <gtest/gtest.h>
#include <boost/asio.hpp>
#include "config/server_config.hpp"
#include "network/listener.hpp"
#include "network/protocol_error.hpp"
#include "transfer/metadata.hpp"
#include "test_utils.hpp"

using namespace ftecho::network;
using ftecho::config::ServerConfig;
using ftecho::store::StorageManager;

class ListenerTest : public ::testing::Test {
protected:
  static void SetUpTestSuite() { init_test_logging(); }

  void SetUp() override {
    temp_dir = std::make_unique<TempDir>("ftecho_listener_test");
    storage = std::make_unique<StorageManager>(temp_dir->path());

    config.address = "127.0.0.1";
    config.port = 0;
    config.storage_root = temp_dir->path().string();
    config.idle_timeout = std::chrono::seconds(30);
  }

  void TearDown() override {
    if (listener) {
      listener->shutdown();
      listener.reset();
    }
    storage.reset();
    temp_dir.reset();
  }

  void start() {
    listener = std::make_unique<Listener>(config, *storage);
    ASSERT_TRUE(listener->start_listener());
    ASSERT_NE(listener->port(), 0);
  }

  // Raw connection speaking frames directly, with a deadline so a broken
  // server fails the test instead of hanging it
  std::unique_ptr<boost::asio::ip::tcp::iostream> connect_raw() {
    auto stream = std::make_unique<boost::asio::ip::tcp::iostream>();
    stream->expires_after(std::chrono::seconds(10));
    stream->connect("127.0.0.1", std::to_string(listener->port()));
    EXPECT_TRUE(stream->good()) << stream->error().message();
    return stream;
  }

  Frame round_trip(boost::asio::ip::tcp::iostream& stream, const Frame& request) {
    codec.serialize(request, stream);
    return codec.deserialize(stream);
  }

  Codec codec;
  ServerConfig config;
  std::unique_ptr<TempDir> temp_dir;
  std::unique_ptr<StorageManager> storage;
  std::unique_ptr<Listener> listener;
};

TEST_F(ListenerTest, ServesListOverTcp) {
  write_file(temp_dir->path() / "hello.txt", "hi");
  start();

  auto stream = connect_raw();
  Frame reply = round_trip(*stream, Frame(FrameType::LIST));
  EXPECT_EQ(reply.type, FrameType::OK);
  EXPECT_EQ(reply.payload, "hello.txt|2\n");

  reply = round_trip(*stream, Frame(FrameType::QUIT));
  EXPECT_EQ(reply.type, FrameType::OK);
  EXPECT_EQ(reply.payload, "Goodbye");

  // Server closes after QUIT
  EXPECT_THROW(codec.deserialize(*stream), ConnectionClosed);
}

TEST_F(ListenerTest, StartTwiceFails) {
  start();
  EXPECT_TRUE(listener->is_running());
  EXPECT_FALSE(listener->start_listener());
}

TEST_F(ListenerTest, InvalidAddressFailsToStart) {
  config.address = "not-an-address";
  Listener bad(config, *storage);
  EXPECT_FALSE(bad.start_listener());
  EXPECT_FALSE(bad.is_running());
}

TEST_F(ListenerTest, RestartAfterShutdown) {
  start();
  listener->shutdown();
  EXPECT_FALSE(listener->is_running());

  ASSERT_TRUE(listener->start_listener());
  auto stream = connect_raw();
  EXPECT_EQ(round_trip(*stream, Frame(FrameType::LIST)).type, FrameType::OK);
}

TEST_F(ListenerTest, MalformedFrameClosesOnlyThatConnection) {
  start();
  auto healthy = connect_raw();
  auto broken = connect_raw();

  // Unknown type byte
  broken->write("\x00\x00\x00\x01X", 5);
  broken->flush();
  EXPECT_THROW(codec.deserialize(*broken), ConnectionClosed);

  Frame reply = round_trip(*healthy, Frame(FrameType::LIST));
  EXPECT_EQ(reply.type, FrameType::OK);

  auto fresh = connect_raw();
  EXPECT_EQ(round_trip(*fresh, Frame(FrameType::LIST)).type, FrameType::OK);
}

TEST_F(ListenerTest, ConcurrentUploadOfSameNameIsBusy) {
  start();
  auto first = connect_raw();
  auto second = connect_raw();

  std::string put = ftecho::transfer::encode_put_request(ftecho::transfer::PutRequest{"shared.bin", 6});
  Frame ready = round_trip(*first, Frame(FrameType::PUT, put));
  ASSERT_EQ(ready.type, FrameType::OK);
  codec.serialize(Frame(FrameType::FILE_CHUNK, "abc"), *first);

  Frame busy = round_trip(*second, Frame(FrameType::PUT, put));
  EXPECT_EQ(busy.type, FrameType::ERROR);
  EXPECT_NE(busy.payload.find("Busy"), std::string::npos) << busy.payload;

  // The first upload is unaffected
  codec.serialize(Frame(FrameType::FILE_CHUNK, "def"), *first);
  Frame done = codec.deserialize(*first);
  EXPECT_EQ(done.type, FrameType::OK);
  EXPECT_EQ(read_file(temp_dir->path() / "shared.bin"), "abcdef");

  // And the name is free again
  EXPECT_EQ(round_trip(*second, Frame(FrameType::PUT, put)).type, FrameType::OK);
}

TEST_F(ListenerTest, DisconnectMidUploadReleasesName) {
  start();
  {
    auto stream = connect_raw();
    std::string put = ftecho::transfer::encode_put_request(ftecho::transfer::PutRequest{"big", 100});
    ASSERT_EQ(round_trip(*stream, Frame(FrameType::PUT, put)).type, FrameType::OK);
    codec.serialize(Frame(FrameType::FILE_CHUNK, std::string(40, 'x')), *stream);
  }

  ASSERT_TRUE(wait_until([&]() { return !storage->is_writing("big"); }));
  EXPECT_EQ(storage->partial_size("big"), 40u);
  EXPECT_TRUE(wait_until([&]() { return listener->active_connections() == 0; }));
}

TEST_F(ListenerTest, IdleConnectionIsClosed) {
  config.idle_timeout = std::chrono::seconds(1);
  start();

  auto stream = connect_raw();
  EXPECT_EQ(round_trip(*stream, Frame(FrameType::LIST)).type, FrameType::OK);

  auto started = std::chrono::steady_clock::now();
  EXPECT_THROW(codec.deserialize(*stream), ConnectionClosed);
  EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(8));
}

TEST_F(ListenerTest, ShutdownClosesOpenConnections) {
  start();
  auto stream = connect_raw();
  EXPECT_EQ(round_trip(*stream, Frame(FrameType::LIST)).type, FrameType::OK);
  ASSERT_TRUE(wait_until([&]() { return listener->active_connections() == 1; }));

  listener->shutdown();
  EXPECT_EQ(listener->active_connections(), 0u);
  EXPECT_THROW(codec.deserialize(*stream), ConnectionClosed);
}

TEST_F(ListenerTest, ShortLivedConnectionsAreReaped) {
  start();
  for (int i = 0; i < 20; ++i) {
    auto stream = connect_raw();
    Frame reply = round_trip(*stream, Frame(FrameType::QUIT));
    EXPECT_EQ(reply.payload, "Goodbye");
  }

  ASSERT_TRUE(wait_until([&]() { return listener->active_connections() == 0; }));

  // Later connections are still accepted after finished threads were joined
  auto stream = connect_raw();
  EXPECT_EQ(round_trip(*stream, Frame(FrameType::LIST)).type, FrameType::OK);
  listener->shutdown();
  EXPECT_FALSE(listener->is_running());
}
