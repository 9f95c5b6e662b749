// Loopback tests for the poll()-based UDP transport.
#include "coapstatus/test_hooks.h"

#include <gtest/gtest.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

namespace {

using std::chrono::milliseconds;

coapstatus::Config QuietConfig() {
  coapstatus::Config config;
  config.log_callback = [](const std::string&) {};
  return config;
}

// An ephemeral port that was free a moment ago.
uint16_t FreeUdpPort() {
  const int fd = ::socket(AF_INET, SOCK_DGRAM, 0);
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_ANY);
  socklen_t len = sizeof(addr);
  uint16_t port = 0;
  if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0 &&
      ::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0) {
    port = ntohs(addr.sin_port);
  }
  ::close(fd);
  return port;
}

// Plain UDP socket on 127.0.0.1 acting as a remote CoAP endpoint.
class Client {
 public:
  Client() {
    fd_ = ::socket(AF_INET, SOCK_DGRAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    ::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    timeval tv{};
    tv.tv_usec = 300000;
    ::setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
  }
  ~Client() {
    if (fd_ >= 0) {
      ::close(fd_);
    }
  }

  uint16_t port() const {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len);
    return ntohs(addr.sin_port);
  }

  bool SendTo(uint16_t port, const std::vector<uint8_t>& data) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = htons(port);
    return ::sendto(fd_, data.data(), data.size(), 0, reinterpret_cast<sockaddr*>(&addr),
                    sizeof(addr)) == static_cast<ssize_t>(data.size());
  }

  bool Receive(coapstatus::Message* message, uint16_t* from_port = nullptr) {
    std::vector<uint8_t> buffer(2048);
    sockaddr_in from{};
    socklen_t from_len = sizeof(from);
    const ssize_t bytes = ::recvfrom(fd_, buffer.data(), buffer.size(), 0,
                                     reinterpret_cast<sockaddr*>(&from), &from_len);
    if (bytes <= 0) {
      return false;
    }
    if (from_port) {
      *from_port = ntohs(from.sin_port);
    }
    buffer.resize(static_cast<size_t>(bytes));
    return coapstatus::ParseMessage(buffer, message);
  }

 private:
  int fd_ = -1;
};

coapstatus::Message StatusGet(coapstatus::MessageType type) {
  coapstatus::Message request;
  request.type = type;
  request.code = static_cast<uint8_t>(coapstatus::Code::kGet);
  request.message_id = 0x4321;
  request.token = {0xde, 0xad};
  request.SetUriPath(coapstatus::kStatusPath);
  return request;
}

std::vector<uint8_t> Encode(const coapstatus::Message& message) {
  std::vector<uint8_t> packet;
  EXPECT_TRUE(coapstatus::EncodeMessage(message, &packet));
  return packet;
}

class UdpTransportTest : public ::testing::Test {
 protected:
  UdpTransportTest() : transport_(QuietConfig()) {}

  uint16_t ListenLoopback(coapstatus::Transport::RequestHandler handler) {
    coapstatus::ListenOptions options;
    options.bind_address = "127.0.0.1";
    options.port = 0;
    std::string error;
    EXPECT_TRUE(transport_.Listen(options, std::move(handler), &listener_, &error)) << error;
    return coapstatus::test::GetListenerPort(transport_, listener_);
  }

  coapstatus::UdpTransport transport_;
  coapstatus::Transport::ListenerId listener_ = 0;
};

TEST_F(UdpTransportTest, ConfirmableRequestGetsPiggybackedResponse) {
  std::string seen_url;
  const uint16_t port = ListenLoopback(
      [&](const coapstatus::Message& request, const coapstatus::Endpoint& source) {
        seen_url = request.GetUrl();
        EXPECT_EQ(source.address, "127.0.0.1");
        coapstatus::Message response;
        response.code = static_cast<uint8_t>(coapstatus::Code::kContent);
        const std::string body = "{\"on\":true}";
        response.payload.assign(body.begin(), body.end());
        return std::optional<coapstatus::Message>(response);
      });
  ASSERT_NE(port, 0);

  Client client;
  ASSERT_TRUE(client.SendTo(port, Encode(StatusGet(coapstatus::MessageType::kConfirmable))));
  transport_.RunOnce(milliseconds(500));

  coapstatus::Message reply;
  ASSERT_TRUE(client.Receive(&reply));
  EXPECT_EQ(seen_url, "/cit/s");
  EXPECT_EQ(reply.type, coapstatus::MessageType::kAcknowledgement);
  EXPECT_EQ(reply.message_id, 0x4321);
  EXPECT_EQ(reply.token, (std::vector<uint8_t>{0xde, 0xad}));
  EXPECT_EQ(reply.code, 0x45);
  EXPECT_EQ(reply.PayloadString(), "{\"on\":true}");

  const auto metrics = transport_.GetMetrics();
  EXPECT_EQ(metrics.datagrams_received, 1u);
  EXPECT_EQ(metrics.datagrams_sent, 1u);
}

TEST_F(UdpTransportTest, UnansweredNonConfirmableGetsNoReply) {
  int calls = 0;
  const uint16_t port = ListenLoopback(
      [&](const coapstatus::Message&, const coapstatus::Endpoint&) {
        ++calls;
        return std::optional<coapstatus::Message>();
      });

  Client client;
  ASSERT_TRUE(client.SendTo(port, Encode(StatusGet(coapstatus::MessageType::kNonConfirmable))));
  transport_.RunOnce(milliseconds(500));

  EXPECT_EQ(calls, 1);
  coapstatus::Message reply;
  EXPECT_FALSE(client.Receive(&reply));
}

TEST_F(UdpTransportTest, UnansweredConfirmableGetsEmptyAck) {
  const uint16_t port = ListenLoopback(
      [](const coapstatus::Message&, const coapstatus::Endpoint&) {
        return std::optional<coapstatus::Message>();
      });

  Client client;
  ASSERT_TRUE(client.SendTo(port, Encode(StatusGet(coapstatus::MessageType::kConfirmable))));
  transport_.RunOnce(milliseconds(500));

  coapstatus::Message reply;
  ASSERT_TRUE(client.Receive(&reply));
  EXPECT_EQ(reply.type, coapstatus::MessageType::kAcknowledgement);
  EXPECT_EQ(reply.code, 0);
  EXPECT_EQ(reply.message_id, 0x4321);
}

TEST_F(UdpTransportTest, MalformedDatagramIsCounted) {
  int calls = 0;
  const uint16_t port = ListenLoopback(
      [&](const coapstatus::Message&, const coapstatus::Endpoint&) {
        ++calls;
        return std::optional<coapstatus::Message>();
      });

  Client client;
  ASSERT_TRUE(client.SendTo(port, {0x40, 0x01}));
  transport_.RunOnce(milliseconds(500));

  EXPECT_EQ(calls, 0);
  EXPECT_EQ(transport_.GetMetrics().parse_errors, 1u);
  EXPECT_EQ(transport_.GetMetrics().datagrams_received, 1u);
}

TEST_F(UdpTransportTest, HandlerExceptionIsContained) {
  const uint16_t port = ListenLoopback(
      [](const coapstatus::Message&, const coapstatus::Endpoint&)
          -> std::optional<coapstatus::Message> {
        throw std::runtime_error("handler failed");
      });

  Client client;
  ASSERT_TRUE(client.SendTo(port, Encode(StatusGet(coapstatus::MessageType::kConfirmable))));
  EXPECT_NO_THROW(transport_.RunOnce(milliseconds(500)));
  EXPECT_EQ(transport_.GetMetrics().callback_exceptions, 1u);
}

TEST_F(UdpTransportTest, CloseListenerReleasesSocket) {
  ListenLoopback([](const coapstatus::Message&, const coapstatus::Endpoint&) {
    return std::optional<coapstatus::Message>();
  });
  EXPECT_EQ(coapstatus::test::GetListenerCount(transport_), 1u);
  transport_.CloseListener(listener_);
  EXPECT_EQ(coapstatus::test::GetListenerCount(transport_), 0u);
  transport_.CloseListener(listener_);
}

TEST_F(UdpTransportTest, ListenRejectsInvalidAddress) {
  coapstatus::ListenOptions options;
  options.bind_address = "300.1.1.1";
  coapstatus::Transport::ListenerId id = 0;
  std::string error;
  EXPECT_FALSE(transport_.Listen(options, nullptr, &id, &error));
  EXPECT_NE(error.find("300.1.1.1"), std::string::npos);
  EXPECT_EQ(coapstatus::test::GetListenerCount(transport_), 0u);
}

TEST_F(UdpTransportTest, SendFillsMessageIdAndToken) {
  Client client;
  coapstatus::Message announcement;
  announcement.type = coapstatus::MessageType::kNonConfirmable;
  announcement.code = static_cast<uint8_t>(coapstatus::Code::kStatusAnnouncement);
  announcement.SetUriPath(coapstatus::kStatusPath);

  coapstatus::SendOptions options;
  options.host = "127.0.0.1";
  options.port = client.port();
  options.multicast = true;
  options.multicast_timeout = milliseconds(50);
  std::string error;
  ASSERT_TRUE(transport_.Send(options, announcement, &error)) << error;
  EXPECT_TRUE(coapstatus::test::IsCollectingReplies(transport_));

  coapstatus::Message received;
  ASSERT_TRUE(client.Receive(&received));
  EXPECT_EQ(received.code, 0x1e);
  EXPECT_EQ(received.token.size(), 4u);
  EXPECT_EQ(received.GetUriPath(), "/cit/s");

  const auto deadline = std::chrono::steady_clock::now() + milliseconds(1000);
  while (coapstatus::test::IsCollectingReplies(transport_) &&
         std::chrono::steady_clock::now() < deadline) {
    transport_.RunOnce(milliseconds(20));
  }
  EXPECT_FALSE(coapstatus::test::IsCollectingReplies(transport_));
}

TEST_F(UdpTransportTest, SendsReuseOneSocket) {
  Client client;
  coapstatus::Message announcement;
  announcement.type = coapstatus::MessageType::kNonConfirmable;
  announcement.code = static_cast<uint8_t>(coapstatus::Code::kStatusAnnouncement);

  coapstatus::SendOptions options;
  options.host = "127.0.0.1";
  options.port = client.port();
  options.multicast = true;
  options.multicast_timeout = milliseconds(100);

  // More sends than a select() fd_set can describe.
  constexpr int kSends = 1100;
  for (int i = 0; i < kSends; ++i) {
    std::string error;
    ASSERT_TRUE(transport_.Send(options, announcement, &error)) << i << ": " << error;
  }
  EXPECT_EQ(coapstatus::test::GetOpenSocketCount(transport_), 1u);
  EXPECT_EQ(transport_.GetMetrics().datagrams_sent, static_cast<uint64_t>(kSends));

  transport_.RunOnce(milliseconds(10));
  EXPECT_EQ(transport_.GetMetrics().send_errors, 0u);
}

TEST_F(UdpTransportTest, RepliesToAnnouncementsAreDiscarded) {
  Client client;
  coapstatus::Message announcement;
  announcement.type = coapstatus::MessageType::kNonConfirmable;
  announcement.code = static_cast<uint8_t>(coapstatus::Code::kStatusAnnouncement);

  coapstatus::SendOptions options;
  options.host = "127.0.0.1";
  options.port = client.port();
  options.multicast = true;
  options.multicast_timeout = milliseconds(500);
  std::string error;
  ASSERT_TRUE(transport_.Send(options, announcement, &error)) << error;

  coapstatus::Message received;
  uint16_t sender_port = 0;
  ASSERT_TRUE(client.Receive(&received, &sender_port));
  coapstatus::Message reply;
  reply.type = coapstatus::MessageType::kNonConfirmable;
  reply.code = static_cast<uint8_t>(coapstatus::Code::kContent);
  reply.token = received.token;
  ASSERT_TRUE(client.SendTo(sender_port, Encode(reply)));

  transport_.RunOnce(milliseconds(200));
  EXPECT_EQ(transport_.GetMetrics().datagrams_received, 1u);
  EXPECT_EQ(transport_.GetMetrics().parse_errors, 0u);
}

TEST_F(UdpTransportTest, SendRejectsInvalidHost) {
  coapstatus::SendOptions options;
  options.host = "not-a-host";
  coapstatus::Message message;
  std::string error;
  EXPECT_FALSE(transport_.Send(options, message, &error));
  EXPECT_NE(error.find("not-a-host"), std::string::npos);
  EXPECT_EQ(transport_.GetMetrics().send_errors, 1u);
}

TEST_F(UdpTransportTest, TimersFireInDeadlineOrder) {
  std::vector<int> fired;
  transport_.ScheduleTimer(milliseconds(30), [&]() { fired.push_back(2); });
  transport_.ScheduleTimer(milliseconds(5), [&]() { fired.push_back(1); });
  const auto cancelled = transport_.ScheduleTimer(milliseconds(10), [&]() {
    fired.push_back(99);
  });
  transport_.CancelTimer(cancelled);
  EXPECT_EQ(coapstatus::test::GetTimerCount(transport_), 2u);

  const auto deadline = std::chrono::steady_clock::now() + milliseconds(2000);
  while (fired.size() < 2 && std::chrono::steady_clock::now() < deadline) {
    transport_.RunOnce(milliseconds(100));
  }
  EXPECT_EQ(fired, (std::vector<int>{1, 2}));
  EXPECT_EQ(coapstatus::test::GetTimerCount(transport_), 0u);
}

TEST_F(UdpTransportTest, ThrowingTimerIsContained) {
  bool later = false;
  transport_.ScheduleTimer(milliseconds(0), []() { throw std::runtime_error("timer"); });
  transport_.ScheduleTimer(milliseconds(0), [&]() { later = true; });
  transport_.RunOnce(milliseconds(10));
  EXPECT_TRUE(later);
  EXPECT_EQ(transport_.GetMetrics().callback_exceptions, 1u);
}

TEST_F(UdpTransportTest, PostFromAnotherThreadWakesLoop) {
  std::atomic<bool> ran{false};
  std::thread poster([&]() {
    std::this_thread::sleep_for(milliseconds(20));
    transport_.Post([&]() { ran = true; });
  });

  const auto start = std::chrono::steady_clock::now();
  while (!ran && std::chrono::steady_clock::now() - start < milliseconds(5000)) {
    transport_.RunOnce(milliseconds(5000));
  }
  poster.join();
  EXPECT_TRUE(ran);
  EXPECT_LT(std::chrono::steady_clock::now() - start, milliseconds(2000));
}

TEST_F(UdpTransportTest, QuitStopsRun) {
  std::thread runner([&]() { transport_.Run(); });
  std::this_thread::sleep_for(milliseconds(20));
  transport_.Quit();
  runner.join();

  int ran = 0;
  transport_.Post([&]() {
    ++ran;
    transport_.Quit();
  });
  transport_.Run();
  EXPECT_EQ(ran, 1);
}

TEST(UdpServerTest, AnswersStatusGetOverLoopback) {
  coapstatus::Config config = QuietConfig();
  config.bind_address = "127.0.0.1";
  config.port = FreeUdpPort();
  config.multicast_interface = "127.0.0.1";
  ASSERT_NE(config.port, 0);

  coapstatus::SimpleDevice device("lamp", "7", {{"on", true}, {"level", 40}});
  coapstatus::UdpTransport transport(config);
  coapstatus::Server server(device, transport, config);
  if (!server.Start()) {
    const std::string error = server.GetLastError();
    if (error.find("IP_ADD_MEMBERSHIP") != std::string::npos) {
      GTEST_SKIP() << "multicast group join unavailable: " << error;
    }
    FAIL() << error;
  }

  Client client;
  ASSERT_TRUE(client.SendTo(config.port,
                            Encode(StatusGet(coapstatus::MessageType::kConfirmable))));
  for (int i = 0; i < 5; ++i) {
    transport.RunOnce(milliseconds(50));
  }

  coapstatus::Message reply;
  ASSERT_TRUE(client.Receive(&reply));
  EXPECT_EQ(reply.type, coapstatus::MessageType::kAcknowledgement);
  EXPECT_EQ(reply.message_id, 0x4321);
  EXPECT_EQ(reply.token, (std::vector<uint8_t>{0xde, 0xad}));
  EXPECT_EQ(reply.code, static_cast<uint8_t>(coapstatus::Code::kContent));
  EXPECT_EQ(reply.GetUriPath(), "/cit/s");

  coapstatus::OptionValue value;
  ASSERT_TRUE(reply.GetOption(coapstatus::kOptionDeviceId).has_value());
  ASSERT_TRUE(coapstatus::DecodeOption(coapstatus::kOptionDeviceId,
                                       *reply.GetOption(coapstatus::kOptionDeviceId), &value));
  EXPECT_EQ(std::get<std::string>(value), "lamp#7#1");
  ASSERT_TRUE(reply.GetOption(coapstatus::kOptionStatusValidity).has_value());
  ASSERT_TRUE(coapstatus::DecodeOption(coapstatus::kOptionStatusValidity,
                                       *reply.GetOption(coapstatus::kOptionStatusValidity),
                                       &value));
  EXPECT_EQ(std::get<uint32_t>(value), 38400u);
  ASSERT_TRUE(reply.GetOption(coapstatus::kOptionStatusSerial).has_value());
  ASSERT_TRUE(coapstatus::DecodeOption(coapstatus::kOptionStatusSerial,
                                       *reply.GetOption(coapstatus::kOptionStatusSerial),
                                       &value));
  // Serial 1 went out with the start-up announcement.
  EXPECT_EQ(std::get<uint32_t>(value), 2u);
  EXPECT_EQ(nlohmann::json::parse(reply.PayloadString()), device.GetStatusPayload());
  EXPECT_EQ(server.GetMetrics().status_responses, 1u);

  server.Stop();
  EXPECT_EQ(coapstatus::test::GetListenerCount(transport), 0u);
  EXPECT_EQ(coapstatus::test::GetTimerCount(transport), 0u);
}

TEST(UdpServerTest, GroupListenerReceivesMulticast) {
  coapstatus::Config config = QuietConfig();
  config.multicast_interface = "127.0.0.1";
  const uint16_t port = FreeUdpPort();
  ASSERT_NE(port, 0);
  coapstatus::UdpTransport transport(config);

  int group_calls = 0;
  std::string group_url;
  coapstatus::ListenOptions group;
  group.port = port;
  group.multicast_address = coapstatus::kMulticastAddress;
  coapstatus::Transport::ListenerId group_id = 0;
  std::string error;
  if (!transport.Listen(group,
                        [&](const coapstatus::Message& request, const coapstatus::Endpoint&) {
                          ++group_calls;
                          group_url = request.GetUrl();
                          return std::optional<coapstatus::Message>();
                        },
                        &group_id, &error)) {
    GTEST_SKIP() << "multicast group join unavailable: " << error;
  }

  // Same port, not a member: must not see group traffic.
  int unicast_calls = 0;
  coapstatus::ListenOptions unicast;
  unicast.port = port;
  coapstatus::Transport::ListenerId unicast_id = 0;
  ASSERT_TRUE(transport.Listen(unicast,
                               [&](const coapstatus::Message&, const coapstatus::Endpoint&) {
                                 ++unicast_calls;
                                 return std::optional<coapstatus::Message>();
                               },
                               &unicast_id, &error))
      << error;

  coapstatus::SendOptions options;
  options.host = coapstatus::kMulticastAddress;
  options.port = port;
  options.multicast = true;
  if (!transport.Send(options, StatusGet(coapstatus::MessageType::kNonConfirmable), &error)) {
    GTEST_SKIP() << "multicast send unavailable: " << error;
  }

  const auto deadline = std::chrono::steady_clock::now() + milliseconds(1000);
  while (group_calls == 0 && std::chrono::steady_clock::now() < deadline) {
    transport.RunOnce(milliseconds(50));
  }
  if (group_calls == 0) {
    GTEST_SKIP() << "multicast loopback delivery unavailable on this host";
  }
  EXPECT_EQ(group_calls, 1);
  EXPECT_EQ(group_url, "/cit/s");
  EXPECT_EQ(unicast_calls, 0);
}

}  // namespace
