#include <gtest/gtest.h>

#include "streaming/stream_reader.hpp"
#include "streaming/streaming_session.hpp"

using namespace taskstream;
using namespace std::chrono_literals;

class StreamReaderTest : public ::testing::Test {
 protected:
  void SetUp() override {
    channel_ = std::make_shared<InMemoryStreamChannel>();
    sink_ = std::make_shared<InMemoryMessageSink>();
    service_ = std::make_shared<StreamingService>(channel_, sink_);
  }

  std::shared_ptr<InMemoryStreamChannel> channel_;
  std::shared_ptr<InMemoryMessageSink> sink_;
  std::shared_ptr<StreamingService> service_;
  StreamReader reader_;
};

TEST_F(StreamReaderTest, RebuildsWhatTheSinkStored) {
  auto session = service_->open_session("t1");
  session->publish(Delta{DeltaKind::Reasoning, "plan"});
  session->publish(Delta{DeltaKind::Text, "Hel"});
  session->publish(Delta{DeltaKind::Text, "lo"});
  session->publish(Full{ToolRequestContent{Author::Agent, "call_1", "search", json{{"q", "x"}}}});
  session->publish(Done{});

  EXPECT_EQ(reader_.poll(*channel_, "task:t1"), 6);

  auto rebuilt = reader_.message(session->message_id());
  auto stored = sink_->get("t1", session->message_id());
  ASSERT_TRUE(rebuilt.has_value());
  ASSERT_TRUE(stored.has_value());
  EXPECT_TRUE(rebuilt->same_content(*stored));
  EXPECT_TRUE(reader_.completed(session->message_id()));
}

TEST_F(StreamReaderTest, CharacterSplitAcrossDeltasArrivesWhole) {
  auto session = service_->open_session("t1");
  session->publish(Delta{DeltaKind::Text, "caf\xC3"});
  session->publish(Delta{DeltaKind::Text, "\xA9 ok"});
  session->publish(Done{});

  // 频道上每个 delta 都是完整的 UTF-8
  std::vector<std::string> texts;
  for (const auto &entry : channel_->read("task:t1")) {
    if (entry.payload["type"] == "delta") {
      texts.push_back(entry.payload["delta"]["text"].get<std::string>());
    }
  }
  EXPECT_EQ(texts, (std::vector<std::string>{"caf", "\xC3\xA9 ok"}));

  reader_.poll(*channel_, "task:t1");
  auto rebuilt = reader_.message(session->message_id());
  auto stored = sink_->get("t1", session->message_id());
  ASSERT_TRUE(rebuilt.has_value());
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(rebuilt->text(), "caf\xC3\xA9 ok");
  EXPECT_TRUE(rebuilt->same_content(*stored));
}

TEST_F(StreamReaderTest, UnfinishedCharacterStaysInItsBlock) {
  auto session = service_->open_session("t1");
  session->publish(Delta{DeltaKind::Reasoning, "think\xE2\x82"});
  session->publish(Delta{DeltaKind::Text, "answer"});
  session->publish(Full{ToolRequestContent{Author::Agent, "call_1", "search", json{{"q", "x"}}}});
  session->publish(Done{});

  EXPECT_EQ(reader_.poll(*channel_, "task:t1"), 6);
  auto rebuilt = reader_.message(session->message_id());
  auto stored = sink_->get("t1", session->message_id());
  ASSERT_TRUE(rebuilt.has_value());
  ASSERT_TRUE(stored.has_value());
  ASSERT_EQ(rebuilt->blocks().size(), 3);
  EXPECT_EQ(rebuilt->to_json()["content"], stored->to_json()["content"]);
}

TEST_F(StreamReaderTest, PollOnlyReadsNewEntries) {
  auto session = service_->open_session("t1");
  session->publish(Delta{DeltaKind::Text, "a"});
  EXPECT_EQ(reader_.poll(*channel_, "task:t1"), 2);
  EXPECT_FALSE(reader_.completed(session->message_id()));

  session->publish(Delta{DeltaKind::Text, "b"});
  session->close();
  EXPECT_EQ(reader_.poll(*channel_, "task:t1"), 2);
  EXPECT_EQ(reader_.poll(*channel_, "task:t1"), 0);

  EXPECT_EQ(reader_.message(session->message_id())->text(), "ab");
  EXPECT_EQ(reader_.duplicates(), 0);
}

TEST_F(StreamReaderTest, DuplicateDeliveryIsIgnored) {
  auto session = service_->open_session("t1");
  session->publish(Delta{DeltaKind::Text, "once"});
  session->close();

  // 重复投递全部信封
  for (int round = 0; round < 2; ++round) {
    for (const auto &entry : channel_->read("task:t1")) {
      reader_.ingest(entry.payload);
    }
  }

  EXPECT_EQ(reader_.message(session->message_id())->text(), "once");
  EXPECT_EQ(reader_.duplicates(), 3);
}

TEST_F(StreamReaderTest, InterleavedSessionsStaySeparate) {
  auto first = service_->open_session("t1");
  auto second = service_->open_session("t1");
  first->publish(Delta{DeltaKind::Text, "one"});
  second->publish(Delta{DeltaKind::Text, "two"});
  first->close();
  second->abort("attempt failed");

  reader_.poll(*channel_, "task:t1");
  auto messages = reader_.messages();
  ASSERT_EQ(messages.size(), 2);
  EXPECT_EQ(messages[0].message_id(), first->message_id());
  EXPECT_EQ(messages[0].text(), "one");
  EXPECT_TRUE(messages[0].is_final());
  EXPECT_EQ(messages[1].text(), "two");
  EXPECT_FALSE(messages[1].is_final());
}

TEST_F(StreamReaderTest, SilentSessionIsAbandoned) {
  auto done = service_->open_session("t1");
  done->close();
  auto stuck = service_->open_session("t1");
  stuck->publish(Delta{DeltaKind::Text, "partial"});

  auto received = std::chrono::system_clock::now();
  for (const auto &entry : channel_->read("task:t1")) {
    reader_.ingest(entry.payload, received);
  }

  EXPECT_TRUE(reader_.abandoned(received + 10s, 30s).empty());
  EXPECT_EQ(reader_.abandoned(received + 31s, 30s), (std::vector<MessageId>{stuck->message_id()}));

  stuck->abort("test over");
}

TEST_F(StreamReaderTest, SeedComesFromStartMarker) {
  auto session = service_->open_session("t1", ContentBlock{TextContent{Author::Agent, "Draft: "}});
  session->publish(Delta{DeltaKind::Text, "done"});
  session->close();

  reader_.poll(*channel_, "task:t1");
  EXPECT_EQ(reader_.message(session->message_id())->text(), "Draft: done");
}

TEST_F(StreamReaderTest, MalformedEnvelopeIsRejected) {
  EXPECT_FALSE(reader_.ingest(json{{"type", "bogus"}}));
  EXPECT_FALSE(reader_.ingest(json{{"type", "delta"}, {"task_id", "t1"}, {"message_id", "m1"}}));
  EXPECT_FALSE(reader_.ingest(json{{"type", "delta"}, {"task_id", "t1"}, {"message_id", "m1"}, {"sequence", 1}}));
  EXPECT_FALSE(reader_.ingest(json::array()));

  EXPECT_EQ(reader_.rejected(), 4);
  EXPECT_TRUE(reader_.messages().empty());
}

TEST(StreamUpdateTest, DeltaEnvelopeLayout) {
  auto update = StreamUpdate::from_event("t1", "m1", 3, Delta{DeltaKind::Reasoning, "why"});
  auto j = update.to_json();

  EXPECT_EQ(j["type"], "delta");
  EXPECT_EQ(j["task_id"], "t1");
  EXPECT_EQ(j["message_id"], "m1");
  EXPECT_EQ(j["sequence"], 3);
  EXPECT_EQ(j["delta"]["kind"], "reasoning");
  EXPECT_EQ(j["delta"]["text"], "why");

  auto parsed = StreamUpdate::from_json(j);
  ASSERT_TRUE(parsed.has_value());
  ASSERT_TRUE(parsed->delta.has_value());
  EXPECT_EQ(parsed->delta->kind, DeltaKind::Reasoning);
}

TEST(InMemoryStreamChannelTest, PublishReadAndCleanup) {
  InMemoryStreamChannel channel;
  EXPECT_EQ(channel.publish("a", json{{"n", 1}}), 1);
  EXPECT_EQ(channel.publish("a", json{{"n", 2}}), 2);
  EXPECT_EQ(channel.publish("b", json{{"n", 3}}), 1);

  auto tail = channel.read("a", 1);
  ASSERT_EQ(tail.size(), 1);
  EXPECT_EQ(tail[0].payload["n"], 2);
  EXPECT_TRUE(channel.read("missing").empty());

  channel.cleanup("a");
  EXPECT_EQ(channel.size("a"), 0);
  EXPECT_EQ(channel.topics(), (std::vector<std::string>{"b"}));
  EXPECT_EQ(channel.publish("a", json{{"n", 4}}), 1);
}

TEST(InMemoryStreamChannelTest, SubscribersSeeTheirTopicOnly) {
  InMemoryStreamChannel channel;
  std::vector<uint64_t> seen;
  auto id = channel.subscribe("a", [&seen](const std::string &, const ChannelEntry &entry) {
    seen.push_back(entry.id);
  });

  channel.publish("a", json::object());
  channel.publish("b", json::object());
  channel.publish("a", json::object());
  channel.unsubscribe(id);
  channel.publish("a", json::object());

  EXPECT_EQ(seen, (std::vector<uint64_t>{1, 2}));
}
