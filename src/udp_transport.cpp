#include "coapstatus/coapstatus.h"
#include "coapstatus/test_hooks.h"
#include "internal.h"

#include <algorithm>
#include <array>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <map>
#include <mutex>
#include <random>
#include <sstream>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace coapstatus {
namespace {

constexpr size_t kMaxDatagramSize = 2048;
constexpr size_t kTokenLength = 4;
constexpr int64_t kMaxPollWaitMs = 60 * 60 * 1000;

// Convert a string address and port into a sockaddr_in. Empty and 0.0.0.0
// map to INADDR_ANY.
bool MakeSockaddr(const std::string& address, uint16_t port, sockaddr_in* out) {
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  if (address.empty() || address == "0.0.0.0") {
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
  } else if (inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1) {
    return false;
  }
  *out = addr;
  return true;
}

std::string AddrToString(const sockaddr_in& addr) {
  char buffer[INET_ADDRSTRLEN] = {0};
  if (inet_ntop(AF_INET, &addr.sin_addr, buffer, sizeof(buffer)) != nullptr) {
    return buffer;
  }
  return {};
}

bool SetNonBlocking(int fd) {
  const int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags < 0) {
    return false;
  }
  return ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

// Minimal non-blocking UDP socket wrapper with multicast support.
class UdpSocket {
 public:
  UdpSocket() = default;
  ~UdpSocket() { Close(); }

  UdpSocket(const UdpSocket&) = delete;
  UdpSocket& operator=(const UdpSocket&) = delete;

  bool Open(const std::string& bind_address, uint16_t port, bool reuse_address) {
    if (fd_ >= 0) {
      return true;
    }
    sockaddr_in addr{};
    if (!MakeSockaddr(bind_address, port, &addr)) {
      last_error_ = "invalid bind address: " + bind_address;
      return false;
    }
    fd_ = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (fd_ < 0) {
      last_error_ = "socket() failed: " + std::string(std::strerror(errno));
      return false;
    }
    if (reuse_address) {
      int reuse = 1;
      if (!SetOption(SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse), "SO_REUSEADDR")) {
        return false;
      }
    }
    if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
      std::ostringstream oss;
      oss << "bind(" << (bind_address.empty() ? "0.0.0.0" : bind_address) << ":"
          << port << ") failed: " << std::strerror(errno);
      last_error_ = oss.str();
      Close();
      return false;
    }
    if (!SetNonBlocking(fd_)) {
      last_error_ = "fcntl(O_NONBLOCK) failed: " + std::string(std::strerror(errno));
      Close();
      return false;
    }
    return true;
  }

  bool JoinGroup(const std::string& group, const std::string& interface_address) {
    ip_mreq request{};
    if (inet_pton(AF_INET, group.c_str(), &request.imr_multiaddr) != 1) {
      last_error_ = "invalid multicast address: " + group;
      Close();
      return false;
    }
    request.imr_interface.s_addr = htonl(INADDR_ANY);
    if (!interface_address.empty() &&
        inet_pton(AF_INET, interface_address.c_str(), &request.imr_interface) != 1) {
      last_error_ = "invalid multicast interface: " + interface_address;
      Close();
      return false;
    }
    return SetOption(IPPROTO_IP, IP_ADD_MEMBERSHIP, &request, sizeof(request),
                     "IP_ADD_MEMBERSHIP");
  }

  // Keep group traffic joined by other sockets off a unicast listener.
  bool IgnoreForeignGroups() {
#ifdef IP_MULTICAST_ALL
    int all = 0;
    return SetOption(IPPROTO_IP, IP_MULTICAST_ALL, &all, sizeof(all), "IP_MULTICAST_ALL");
#else
    return true;
#endif
  }

  bool ConfigureMulticastSend(uint8_t ttl, const std::string& interface_address) {
    const unsigned char hops = ttl;
    if (!SetOption(IPPROTO_IP, IP_MULTICAST_TTL, &hops, sizeof(hops), "IP_MULTICAST_TTL")) {
      return false;
    }
    const unsigned char loop = 1;
    if (!SetOption(IPPROTO_IP, IP_MULTICAST_LOOP, &loop, sizeof(loop), "IP_MULTICAST_LOOP")) {
      return false;
    }
    if (!interface_address.empty()) {
      in_addr iface{};
      if (inet_pton(AF_INET, interface_address.c_str(), &iface) != 1) {
        last_error_ = "invalid multicast interface: " + interface_address;
        Close();
        return false;
      }
      return SetOption(IPPROTO_IP, IP_MULTICAST_IF, &iface, sizeof(iface),
                       "IP_MULTICAST_IF");
    }
    return true;
  }

  void Close() {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

  int fd() const { return fd_; }
  const std::string& last_error() const { return last_error_; }

  uint16_t local_port() const {
    sockaddr_in addr{};
    socklen_t addr_len = sizeof(addr);
    if (fd_ < 0 ||
        ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &addr_len) < 0) {
      return 0;
    }
    return ntohs(addr.sin_port);
  }

  ssize_t SendTo(const std::vector<uint8_t>& data, const sockaddr_in& addr) {
    return ::sendto(fd_, data.data(), data.size(), 0,
                    reinterpret_cast<const sockaddr*>(&addr), sizeof(addr));
  }

  ssize_t RecvFrom(uint8_t* buffer, size_t length, sockaddr_in* addr,
                   socklen_t* addr_len) {
    return ::recvfrom(fd_, buffer, length, 0,
                      reinterpret_cast<sockaddr*>(addr), addr_len);
  }

 private:
  bool SetOption(int level, int name, const void* value, socklen_t length,
                 const char* label) {
    if (::setsockopt(fd_, level, name, value, length) < 0) {
      last_error_ = std::string("setsockopt(") + label + ") failed: " +
                    std::strerror(errno);
      Close();
      return false;
    }
    return true;
  }

  int fd_ = -1;
  std::string last_error_;
};

std::string DescribeSendError(const char* what, ssize_t result, size_t expected) {
  std::ostringstream oss;
  if (result < 0) {
    oss << "Failed to send " << what << ": " << std::strerror(errno);
  } else {
    oss << "Partial send of " << what << ": " << result << " of " << expected
        << " bytes";
  }
  return oss.str();
}

// Requests carry a 0.xx code other than 0.00 on a CON or NON message.
bool IsRequest(const Message& message) {
  if (message.type != MessageType::kConfirmable &&
      message.type != MessageType::kNonConfirmable) {
    return false;
  }
  return message.code != static_cast<uint8_t>(Code::kEmpty) && (message.code >> 5) == 0;
}

}  // namespace

struct UdpTransport::Impl {
  using Clock = std::chrono::steady_clock;

  struct Listener {
    std::unique_ptr<UdpSocket> socket;
    RequestHandler handler;
  };

  struct Timer {
    Clock::time_point deadline;
    Task task;
  };

  explicit Impl(Config config) : config_(std::move(config)), rng_(std::random_device{}()) {
    next_message_id_ = static_cast<uint16_t>(rng_());
    int fds[2] = {-1, -1};
    if (::pipe(fds) == 0) {
      wake_read_ = fds[0];
      wake_write_ = fds[1];
      if (!SetNonBlocking(wake_read_) || !SetNonBlocking(wake_write_)) {
        detail::LogError("fcntl(O_NONBLOCK) failed on wake pipe: " +
                             std::string(std::strerror(errno)),
                         &config_);
      }
    } else {
      detail::LogError("pipe() failed: " + std::string(std::strerror(errno)), &config_);
    }
  }

  ~Impl() {
    if (wake_read_ >= 0) {
      ::close(wake_read_);
    }
    if (wake_write_ >= 0) {
      ::close(wake_write_);
    }
  }

  bool Listen(const ListenOptions& options, RequestHandler handler, ListenerId* id,
              std::string* error) {
    auto fail = [&](const std::string& message) {
      if (error) {
        *error = message;
      }
      return false;
    };
    if (!id) {
      return fail("listener id output is null");
    }
    auto socket = std::make_unique<UdpSocket>();
    if (!socket->Open(options.bind_address, options.port, true)) {
      return fail(socket->last_error());
    }
    if (!options.multicast_address.empty()) {
      if (!socket->JoinGroup(options.multicast_address, config_.multicast_interface)) {
        return fail(socket->last_error());
      }
    } else if (!socket->IgnoreForeignGroups()) {
      return fail(socket->last_error());
    }
    const ListenerId listener_id = next_listener_id_++;
    listeners_.emplace(listener_id, Listener{std::move(socket), std::move(handler)});
    *id = listener_id;
    return true;
  }

  void CloseListener(ListenerId id) { listeners_.erase(id); }

  bool Send(const SendOptions& options, const Message& message, std::string* error) {
    auto fail = [&](const std::string& reason) {
      ++metrics_.send_errors;
      if (error) {
        *error = reason;
      }
      return false;
    };
    sockaddr_in addr{};
    if (options.host.empty() || !MakeSockaddr(options.host, options.port, &addr)) {
      return fail("invalid destination host: " + options.host);
    }

    std::string open_error;
    if (!OpenSendSocket(&open_error)) {
      return fail(open_error);
    }

    Message outgoing = message;
    outgoing.message_id = NextMessageId();
    if (outgoing.token.empty() && outgoing.code != static_cast<uint8_t>(Code::kEmpty)) {
      outgoing.token = NewToken();
    }
    std::vector<uint8_t> packet;
    std::string encode_error;
    if (!EncodeMessage(outgoing, &packet, &encode_error)) {
      return fail(encode_error);
    }

    // Replies left over from an earlier window are not collected.
    if (Clock::now() >= collect_until_) {
      DiscardReplies(*send_socket_);
    }
    const ssize_t result = send_socket_->SendTo(packet, addr);
    if (result < 0 || static_cast<size_t>(result) != packet.size()) {
      return fail(DescribeSendError("message", result, packet.size()));
    }
    ++metrics_.datagrams_sent;
    if (options.multicast && options.multicast_timeout.count() > 0) {
      collect_until_ = std::max(collect_until_, Clock::now() + options.multicast_timeout);
    }
    return true;
  }

  // Every outbound message leaves through one socket, which also receives
  // the replies to multicast announcements.
  bool OpenSendSocket(std::string* error) {
    if (send_socket_) {
      return true;
    }
    auto socket = std::make_unique<UdpSocket>();
    if (!socket->Open(config_.bind_address, 0, false) ||
        !socket->ConfigureMulticastSend(config_.multicast_ttl, config_.multicast_interface)) {
      *error = socket->last_error();
      return false;
    }
    send_socket_ = std::move(socket);
    return true;
  }

  TimerId ScheduleTimer(std::chrono::milliseconds delay, Task task) {
    const TimerId id = next_timer_id_++;
    timers_.emplace(id, Timer{Clock::now() + delay, std::move(task)});
    return id;
  }

  void CancelTimer(TimerId id) { timers_.erase(id); }

  void Post(Task task) {
    {
      std::lock_guard<std::mutex> lock(posted_mutex_);
      posted_.push_back(std::move(task));
    }
    Wake();
  }

  void Quit() {
    quit_ = true;
    Wake();
  }

  void Run() {
    while (!quit_) {
      RunOnce(std::chrono::milliseconds(1000));
    }
    quit_ = false;
  }

  void RunOnce(std::chrono::milliseconds max_wait) {
    RunPostedTasks();
    RunExpiredTimers(Clock::now());

    const auto now = Clock::now();
    const bool collecting = send_socket_ && now < collect_until_;
    auto deadline = now + max_wait;
    for (const auto& entry : timers_) {
      deadline = std::min(deadline, entry.second.deadline);
    }
    if (collecting) {
      deadline = std::min(deadline, collect_until_);
    }
    if (HasPostedTasks() || quit_) {
      deadline = now;
    }

    // Slots 0 and 1 are the wake pipe and the send socket; poll() skips
    // negative descriptors.
    std::vector<pollfd> fds;
    std::vector<ListenerId> listener_ids;
    auto watch = [&fds](int fd) {
      pollfd entry{};
      entry.fd = fd;
      entry.events = POLLIN;
      fds.push_back(entry);
    };
    watch(wake_read_);
    watch(collecting ? send_socket_->fd() : -1);
    for (const auto& entry : listeners_) {
      watch(entry.second.socket->fd());
      listener_ids.push_back(entry.first);
    }

    const auto wait = std::max(Clock::duration::zero(), deadline - now);
    const auto wait_ms = std::min<int64_t>(
        std::chrono::ceil<std::chrono::milliseconds>(wait).count(), kMaxPollWaitMs);
    const int ready = ::poll(fds.data(), static_cast<nfds_t>(fds.size()),
                             static_cast<int>(wait_ms));
    if (ready < 0) {
      if (errno != EINTR) {
        detail::LogError("poll() failed: " + std::string(std::strerror(errno)), &config_);
      }
      return;
    }
    if (ready > 0) {
      if (fds[0].revents & POLLIN) {
        DrainWakePipe();
      }
      // Handlers may close listeners, so ReceiveRequest looks each one up again.
      for (size_t i = 0; i < listener_ids.size(); ++i) {
        if (fds[i + 2].revents & (POLLIN | POLLERR)) {
          ReceiveRequest(listener_ids[i]);
        }
      }
      if ((fds[1].revents & POLLIN) && send_socket_) {
        DiscardReplies(*send_socket_);
      }
    }
    RunPostedTasks();
    RunExpiredTimers(Clock::now());
  }

  void ReceiveRequest(ListenerId id) {
    auto it = listeners_.find(id);
    if (it == listeners_.end()) {
      return;
    }
    std::array<uint8_t, kMaxDatagramSize> buffer{};
    sockaddr_in addr{};
    socklen_t addr_len = sizeof(addr);
    const ssize_t bytes = it->second.socket->RecvFrom(buffer.data(), buffer.size(),
                                                      &addr, &addr_len);
    if (bytes < 0) {
      if (errno != EAGAIN && errno != EWOULDBLOCK) {
        detail::LogError("recvfrom() failed: " + std::string(std::strerror(errno)),
                         &config_);
      }
      return;
    }
    ++metrics_.datagrams_received;

    const Endpoint source{AddrToString(addr), ntohs(addr.sin_port)};
    Message request;
    std::string error;
    if (!ParseMessage(buffer.data(), static_cast<size_t>(bytes), &request, &error)) {
      ++metrics_.parse_errors;
      detail::LogError("Dropping malformed datagram from " + source.address + ": " + error,
                       &config_);
      return;
    }
    if (!IsRequest(request)) {
      return;
    }

    // Copy: the handler may close this listener.
    const RequestHandler handler = it->second.handler;
    std::optional<Message> response;
    try {
      response = handler(request, source);
    } catch (const std::exception& ex) {
      RecordCallbackException("request handler", ex.what());
      return;
    }

    Message reply;
    if (!detail::FrameReply(request, response, NextMessageId(), &reply)) {
      return;
    }
    std::vector<uint8_t> packet;
    if (!EncodeMessage(reply, &packet, &error)) {
      ++metrics_.send_errors;
      detail::LogError("Failed to encode response: " + error, &config_);
      return;
    }
    it = listeners_.find(id);
    if (it == listeners_.end()) {
      return;
    }
    const ssize_t result = it->second.socket->SendTo(packet, addr);
    RecordSendResult("response", result, packet.size());
  }

  void DiscardReplies(UdpSocket& socket) {
    std::array<uint8_t, kMaxDatagramSize> buffer{};
    while (true) {
      sockaddr_in addr{};
      socklen_t addr_len = sizeof(addr);
      const ssize_t bytes = socket.RecvFrom(buffer.data(), buffer.size(), &addr, &addr_len);
      if (bytes < 0) {
        return;
      }
      ++metrics_.datagrams_received;
    }
  }

  // Fire due timers in deadline order. A timer scheduled from a callback
  // fires in a later pass.
  void RunExpiredTimers(Clock::time_point now) {
    while (true) {
      auto due = timers_.end();
      for (auto it = timers_.begin(); it != timers_.end(); ++it) {
        if (it->second.deadline <= now &&
            (due == timers_.end() || it->second.deadline < due->second.deadline)) {
          due = it;
        }
      }
      if (due == timers_.end()) {
        return;
      }
      Task task = std::move(due->second.task);
      timers_.erase(due);
      Invoke("timer", task);
    }
  }

  void RunPostedTasks() {
    std::vector<Task> tasks;
    {
      std::lock_guard<std::mutex> lock(posted_mutex_);
      tasks.swap(posted_);
    }
    for (const auto& task : tasks) {
      Invoke("posted task", task);
    }
  }

  bool HasPostedTasks() {
    std::lock_guard<std::mutex> lock(posted_mutex_);
    return !posted_.empty();
  }

  void Invoke(const char* name, const Task& task) {
    if (!task) {
      return;
    }
    try {
      task();
    } catch (const std::exception& ex) {
      RecordCallbackException(name, ex.what());
    }
  }

  void Wake() {
    if (wake_write_ < 0) {
      return;
    }
    const uint8_t byte = 1;
    if (::write(wake_write_, &byte, sizeof(byte)) < 0 && errno != EAGAIN &&
        errno != EWOULDBLOCK) {
      detail::LogError("wake pipe write failed: " + std::string(std::strerror(errno)),
                       &config_);
    }
  }

  void DrainWakePipe() {
    std::array<uint8_t, 64> buffer{};
    while (::read(wake_read_, buffer.data(), buffer.size()) > 0) {
    }
  }

  void RecordCallbackException(const char* name, const char* what) {
    ++metrics_.callback_exceptions;
    detail::LogError(std::string(name) + " threw exception: " + what, &config_);
  }

  void RecordSendResult(const char* what, ssize_t result, size_t expected) {
    if (result < 0 || static_cast<size_t>(result) != expected) {
      ++metrics_.send_errors;
      detail::LogError(DescribeSendError(what, result, expected), &config_);
      return;
    }
    ++metrics_.datagrams_sent;
  }

  uint16_t NextMessageId() { return next_message_id_++; }

  std::vector<uint8_t> NewToken() {
    std::vector<uint8_t> token(kTokenLength);
    std::uniform_int_distribution<int> byte(0, 0xff);
    for (auto& b : token) {
      b = static_cast<uint8_t>(byte(rng_));
    }
    return token;
  }

  Config config_;
  TransportMetrics metrics_;
  std::mt19937 rng_;
  uint16_t next_message_id_ = 0;

  std::map<ListenerId, Listener> listeners_;
  ListenerId next_listener_id_ = 1;
  std::map<TimerId, Timer> timers_;
  TimerId next_timer_id_ = 1;
  std::unique_ptr<UdpSocket> send_socket_;
  Clock::time_point collect_until_{};

  std::mutex posted_mutex_;
  std::vector<Task> posted_;
  std::atomic<bool> quit_{false};
  int wake_read_ = -1;
  int wake_write_ = -1;
};

UdpTransport::UdpTransport(Config config) : impl_(new Impl(std::move(config))) {}

UdpTransport::~UdpTransport() = default;

bool UdpTransport::Listen(const ListenOptions& options, RequestHandler handler,
                          ListenerId* id, std::string* error) {
  return impl_->Listen(options, std::move(handler), id, error);
}

void UdpTransport::CloseListener(ListenerId id) { impl_->CloseListener(id); }

bool UdpTransport::Send(const SendOptions& options, const Message& message,
                        std::string* error) {
  return impl_->Send(options, message, error);
}

Transport::TimerId UdpTransport::ScheduleTimer(std::chrono::milliseconds delay, Task task) {
  return impl_->ScheduleTimer(delay, std::move(task));
}

void UdpTransport::CancelTimer(TimerId id) { impl_->CancelTimer(id); }
void UdpTransport::Post(Task task) { impl_->Post(std::move(task)); }
void UdpTransport::Run() { impl_->Run(); }
void UdpTransport::RunOnce(std::chrono::milliseconds max_wait) { impl_->RunOnce(max_wait); }
void UdpTransport::Quit() { impl_->Quit(); }
TransportMetrics UdpTransport::GetMetrics() const { return impl_->metrics_; }

#ifdef COAPSTATUS_TESTING
namespace test {

size_t GetListenerCount(UdpTransport& transport) {
  return transport.impl_->listeners_.size();
}

size_t GetTimerCount(UdpTransport& transport) {
  return transport.impl_->timers_.size();
}

bool IsCollectingReplies(UdpTransport& transport) {
  const auto& impl = *transport.impl_;
  return impl.send_socket_ && UdpTransport::Impl::Clock::now() < impl.collect_until_;
}

size_t GetOpenSocketCount(UdpTransport& transport) {
  return transport.impl_->listeners_.size() + (transport.impl_->send_socket_ ? 1 : 0);
}

uint16_t GetListenerPort(UdpTransport& transport, uint32_t listener_id) {
  auto it = transport.impl_->listeners_.find(listener_id);
  if (it == transport.impl_->listeners_.end()) {
    return 0;
  }
  return it->second.socket->local_port();
}

}  // namespace test
#endif

}  // namespace coapstatus
