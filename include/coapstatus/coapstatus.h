#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace coapstatus {

class Server;
class UdpTransport;

#ifdef COAPSTATUS_TESTING
namespace test {
void SetSerial(Server& server, uint16_t serial);
bool HasPendingBroadcast(Server& server);
size_t GetListenerCount(UdpTransport& transport);
size_t GetTimerCount(UdpTransport& transport);
bool IsCollectingReplies(UdpTransport& transport);
size_t GetOpenSocketCount(UdpTransport& transport);
uint16_t GetListenerPort(UdpTransport& transport, uint32_t listener_id);
}  // namespace test
#endif

/**
 * Well-known CoAP UDP port and the IPv4 "All CoAP Nodes" group.
 */
constexpr uint16_t kCoapPort = 5683;
constexpr char kMulticastAddress[] = "224.0.1.187";

/**
 * The single resource served and announced by a status server.
 */
constexpr char kStatusPath[] = "/cit/s";

/**
 * Option numbers. The status options are vendor-specific (elective, safe to
 * forward) and carry the announcement metadata.
 */
constexpr uint16_t kOptionUriPath = 11;
constexpr uint16_t kOptionUriQuery = 15;
constexpr uint16_t kOptionDeviceId = 3332;
constexpr uint16_t kOptionStatusValidity = 3412;
constexpr uint16_t kOptionStatusSerial = 3420;

/**
 * Announcement timing and freshness defaults.
 */
constexpr uint16_t kStatusValiditySeconds = 38400;
constexpr std::chrono::milliseconds kStatusBroadcastInterval{30000};
constexpr std::chrono::milliseconds kMulticastTimeout{100};

/**
 * Message type from the 2-bit T field of the CoAP header.
 */
enum class MessageType : uint8_t {
  kConfirmable = 0,
  kNonConfirmable = 1,
  kAcknowledgement = 2,
  kReset = 3,
};

/**
 * Message codes used by the status protocol (class << 5 | detail).
 */
enum class Code : uint8_t {
  kEmpty = 0x00,
  kGet = 0x01,
  kPost = 0x02,
  kPut = 0x03,
  kDelete = 0x04,
  kStatusAnnouncement = 0x1e,  // 0.30
  kContent = 0x45,             // 2.05
};

/**
 * A single option instance. Values are opaque bytes; use EncodeOption and
 * DecodeOption for registered formats.
 */
struct Option {
  uint16_t number = 0;
  std::vector<uint8_t> value;
};

/**
 * A CoAP message (request, response, or empty ACK/RST).
 */
struct Message {
  MessageType type = MessageType::kNonConfirmable;
  /// Raw code byte; compare against Code values.
  uint8_t code = 0;
  uint16_t message_id = 0;
  /// Token, 0-8 bytes.
  std::vector<uint8_t> token;
  /// Options in insertion order; the encoder sorts by number.
  std::vector<Option> options;
  std::vector<uint8_t> payload;

  /// Append an option value. Repeated numbers keep their relative order.
  void AddOption(uint16_t number, std::vector<uint8_t> value);
  /// Remove every instance of an option.
  void RemoveOption(uint16_t number);
  /// First value of an option, if present.
  std::optional<std::vector<uint8_t>> GetOption(uint16_t number) const;

  /// Replace Uri-Path options with the non-empty segments of path.
  void SetUriPath(const std::string& path);
  /// Uri-Path segments joined as "/a/b" ("/" when there are none).
  std::string GetUriPath() const;
  /// Uri-Path followed by "?" and the Uri-Query segments joined by "&".
  std::string GetUrl() const;
  /// Payload bytes as a string.
  std::string PayloadString() const;
};

/**
 * Serialize a message into its RFC 7252 wire form.
 *
 * @param error Optional output string describing why encoding failed.
 * @return false for tokens over 8 bytes or oversized option values.
 */
bool EncodeMessage(const Message& message, std::vector<uint8_t>* out,
                   std::string* error = nullptr);

/**
 * Parse a datagram into a message.
 *
 * @param error Optional output string describing why parsing failed.
 * @return false for malformed or truncated datagrams.
 */
bool ParseMessage(const uint8_t* data, size_t length, Message* out,
                  std::string* error = nullptr);
bool ParseMessage(const std::vector<uint8_t>& data, Message* out,
                  std::string* error = nullptr);

/**
 * Decoded option value: text for string formats, integer for uint formats.
 */
using OptionValue = std::variant<std::string, uint32_t>;
using OptionEncoder = std::function<bool(const std::string& text,
                                         std::vector<uint8_t>* out,
                                         std::string* error)>;
using OptionDecoder =
    std::function<bool(const std::vector<uint8_t>& bytes, OptionValue* out)>;

/**
 * Install (or replace) the format for an option number in the process-wide
 * option table.
 */
void RegisterOption(uint16_t number, OptionEncoder encoder, OptionDecoder decoder);

/**
 * Register the DeviceId, StatusValidity and StatusSerial formats. Runs once
 * per process; later calls do nothing.
 */
void RegisterStatusOptions();

/// Whether a format is registered for the option number.
bool IsOptionRegistered(uint16_t number);

/**
 * Encode a value with the registered format for an option number.
 *
 * Numeric formats parse text as a leading base-10 integer and reject
 * anything outside [0, 65535].
 */
bool EncodeOption(uint16_t number, const std::string& value,
                  std::vector<uint8_t>* out, std::string* error = nullptr);
bool EncodeOption(uint16_t number, uint32_t value,
                  std::vector<uint8_t>* out, std::string* error = nullptr);

/// Decode option bytes with the registered format for an option number.
bool DecodeOption(uint16_t number, const std::vector<uint8_t>& bytes,
                  OptionValue* out);

/**
 * Device whose status is served. Owned by the caller and must outlive any
 * Server that references it.
 */
class Device {
 public:
  using ChangeCallback = std::function<void()>;
  using SubscriptionId = uint64_t;

  virtual ~Device() = default;

  virtual std::string type() const = 0;
  virtual std::string id() const = 0;
  /// Current status, serialized as JSON into message bodies.
  virtual nlohmann::json GetStatusPayload() const = 0;
  /// Register a callback for the "changed" signal. May be invoked from any thread.
  virtual SubscriptionId SubscribeChange(ChangeCallback callback) = 0;
  virtual void UnsubscribeChange(SubscriptionId subscription) = 0;
};

/**
 * In-memory device holding a JSON status. Thread-safe.
 */
class SimpleDevice : public Device {
 public:
  SimpleDevice(std::string type, std::string id,
               nlohmann::json status = nlohmann::json::object());

  SimpleDevice(const SimpleDevice&) = delete;
  SimpleDevice& operator=(const SimpleDevice&) = delete;

  std::string type() const override;
  std::string id() const override;
  nlohmann::json GetStatusPayload() const override;
  SubscriptionId SubscribeChange(ChangeCallback callback) override;
  void UnsubscribeChange(SubscriptionId subscription) override;

  /// Replace the status and notify subscribers.
  void SetStatus(nlohmann::json status);
  /// Notify subscribers without changing the status.
  void NotifyChanged();
  size_t GetSubscriberCount() const;

 private:
  const std::string type_;
  const std::string id_;
  mutable std::mutex mutex_;
  nlohmann::json status_;
  SubscriptionId next_subscription_ = 1;
  std::map<SubscriptionId, ChangeCallback> subscribers_;
};

/**
 * Identifier carried in the DeviceId option: "{type}#{id}#1".
 */
std::string BuildDeviceIdentifier(const std::string& type, const std::string& id);
std::string BuildDeviceIdentifier(const Device& device);

/**
 * Remote address of an inbound datagram.
 */
struct Endpoint {
  std::string address;
  uint16_t port = 0;
};

/**
 * Where a transport listener binds.
 */
struct ListenOptions {
  std::string bind_address = "0.0.0.0";
  uint16_t port = kCoapPort;
  /// Non-empty selects group listening mode on this multicast address.
  std::string multicast_address;
};

/**
 * Destination of an outbound message.
 */
struct SendOptions {
  std::string host;
  uint16_t port = kCoapPort;
  bool multicast = false;
  /// How long replies to a multicast send are collected (and discarded).
  std::chrono::milliseconds multicast_timeout{0};
};

/**
 * Listening, sending and scheduling primitives of a single-threaded event
 * loop. Everything except Post() is called on the loop thread.
 */
class Transport {
 public:
  using ListenerId = uint32_t;
  using TimerId = uint64_t;
  using Task = std::function<void()>;
  /// Return a response to send it, or nullopt to send none.
  using RequestHandler = std::function<std::optional<Message>(
      const Message& request, const Endpoint& source)>;

  virtual ~Transport() = default;

  virtual bool Listen(const ListenOptions& options, RequestHandler handler,
                      ListenerId* id, std::string* error) = 0;
  virtual void CloseListener(ListenerId id) = 0;
  /// Fire-and-forget send. The transport fills in message id and token.
  virtual bool Send(const SendOptions& options, const Message& message,
                    std::string* error) = 0;
  /// One-shot timer.
  virtual TimerId ScheduleTimer(std::chrono::milliseconds delay, Task task) = 0;
  virtual void CancelTimer(TimerId id) = 0;
  /// Queue a task for the loop thread. Safe to call from any thread.
  virtual void Post(Task task) = 0;
};

/**
 * Counters for a status server.
 */
struct ServerMetrics {
  uint64_t announcements_sent = 0;
  uint64_t status_responses = 0;
  uint64_t requests_ignored = 0;
  uint64_t send_errors = 0;
  uint64_t handler_exceptions = 0;
};

/**
 * Counters for datagram flow through a UdpTransport.
 */
struct TransportMetrics {
  uint64_t datagrams_received = 0;
  uint64_t datagrams_sent = 0;
  uint64_t parse_errors = 0;
  uint64_t send_errors = 0;
  uint64_t callback_exceptions = 0;
};

/**
 * Server and transport configuration.
 */
struct Config {
  using LogCallback = std::function<void(const std::string&)>;

  /// Local bind address for the unicast listener (usually 0.0.0.0).
  std::string bind_address = "0.0.0.0";
  /// Port for both listeners and for announcements.
  uint16_t port = kCoapPort;
  /// Group joined by the multicast listener and targeted by announcements.
  std::string multicast_address = kMulticastAddress;
  /// IPv4 address of the interface used for multicast (empty = default route).
  std::string multicast_interface;
  /// Hop limit for announcements.
  uint8_t multicast_ttl = 1;

  /// Re-broadcast interval, reset by every device change.
  std::chrono::milliseconds broadcast_interval = kStatusBroadcastInterval;
  /// Seconds advertised in the StatusValidity option.
  uint16_t status_validity = kStatusValiditySeconds;
  /// Reply collection window for announcements.
  std::chrono::milliseconds multicast_timeout = kMulticastTimeout;

  /// Optional log callback (defaults to stderr).
  LogCallback log_callback;

  /**
   * Validate configuration values.
   *
   * @param error Optional output string describing the first validation error.
   * @return true if the configuration is valid.
   */
  bool Validate(std::string* error = nullptr) const;
};

/**
 * Event loop and UDP sockets implementing Transport with poll().
 */
class UdpTransport : public Transport {
 public:
  explicit UdpTransport(Config config = Config());
  ~UdpTransport() override;

  UdpTransport(const UdpTransport&) = delete;
  UdpTransport& operator=(const UdpTransport&) = delete;

  bool Listen(const ListenOptions& options, RequestHandler handler,
              ListenerId* id, std::string* error) override;
  void CloseListener(ListenerId id) override;
  bool Send(const SendOptions& options, const Message& message,
            std::string* error) override;
  TimerId ScheduleTimer(std::chrono::milliseconds delay, Task task) override;
  void CancelTimer(TimerId id) override;
  void Post(Task task) override;

  /// Dispatch events until Quit() is called.
  void Run();
  /// Wait up to max_wait for one batch of events and dispatch it.
  void RunOnce(std::chrono::milliseconds max_wait);
  /// Make Run() return. Safe to call from any thread.
  void Quit();

  TransportMetrics GetMetrics() const;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;

#ifdef COAPSTATUS_TESTING
  friend size_t test::GetListenerCount(UdpTransport& transport);
  friend size_t test::GetTimerCount(UdpTransport& transport);
  friend bool test::IsCollectingReplies(UdpTransport& transport);
  friend size_t test::GetOpenSocketCount(UdpTransport& transport);
  friend uint16_t test::GetListenerPort(UdpTransport& transport, uint32_t listener_id);
#endif
};

/**
 * Serves GET /cit/s for one device and announces its status to the
 * multicast group on start, on every device change, and every
 * broadcast_interval after the latest announcement.
 *
 * Not thread-safe: use it from the transport's loop thread. Device change
 * notifications may arrive on any thread.
 */
class Server {
 public:
  /// The device and transport must outlive the server.
  Server(Device& device, Transport& transport, Config config = Config());
  /// Stop listening and cancel the announcement timer.
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  /// Open both listeners, subscribe to changes and announce once.
  bool Start();
  /// Close listeners, unsubscribe and cancel the timer. Idempotent.
  void Stop();
  bool IsRunning() const;

  /// Send an announcement now and restart the re-broadcast timer.
  void BroadcastStatus();
  /// Route a request; only GET /cit/s is answered. Rethrows handler errors.
  std::optional<Message> HandleRequest(const Message& request);
  /// Build the status response for a request.
  Message HandleStatusRequest(const Message& request);

  /// Serial value the next announcement or response will carry.
  uint16_t GetNextSerial() const;
  /// Return the last Start() error message, if any.
  std::string GetLastError() const;
  ServerMetrics GetMetrics() const;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;

#ifdef COAPSTATUS_TESTING
  friend void test::SetSerial(Server& server, uint16_t serial);
  friend bool test::HasPendingBroadcast(Server& server);
#endif
};

}  // namespace coapstatus
