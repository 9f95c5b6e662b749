#include "coapstatus/coapstatus.h"
#include "coapstatus/test_hooks.h"
#include "internal.h"

#include <iostream>
#include <sstream>
#include <stdexcept>

#include <arpa/inet.h>
#include <netinet/in.h>

namespace coapstatus {
namespace detail {

void LogInfo(const std::string& message, const Config* config) {
  if (config && config->log_callback) {
    config->log_callback(message);
    return;
  }
  std::cerr << "[coapstatus] " << message << std::endl;
}

void LogError(const std::string& message, const Config* config) {
  if (config && config->log_callback) {
    config->log_callback(message);
    return;
  }
  std::cerr << "[coapstatus] error: " << message << std::endl;
}

}  // namespace detail

bool Config::Validate(std::string* error) const {
  auto fail = [&](const std::string& message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  auto is_valid_ipv4 = [](const std::string& addr) {
    if (addr.empty()) {
      return false;
    }
    in_addr parsed{};
    return inet_pton(AF_INET, addr.c_str(), &parsed) == 1;
  };
  if (!bind_address.empty() && bind_address != "0.0.0.0") {
    if (!is_valid_ipv4(bind_address)) {
      return fail("bind_address must be a valid IPv4 address");
    }
  }
  if (port == 0) {
    return fail("port must be non-zero");
  }
  in_addr group{};
  if (inet_pton(AF_INET, multicast_address.c_str(), &group) != 1 ||
      !IN_MULTICAST(ntohl(group.s_addr))) {
    return fail("multicast_address must be an IPv4 multicast address");
  }
  if (!multicast_interface.empty() && !is_valid_ipv4(multicast_interface)) {
    return fail("multicast_interface must be a valid IPv4 address");
  }
  if (multicast_ttl == 0) {
    return fail("multicast_ttl must be non-zero");
  }
  if (broadcast_interval.count() <= 0) {
    return fail("broadcast_interval must be positive");
  }
  if (multicast_timeout.count() < 0) {
    return fail("multicast_timeout must not be negative");
  }
  if (status_validity == 0) {
    return fail("status_validity must be non-zero");
  }
  return true;
}

std::string BuildDeviceIdentifier(const std::string& type, const std::string& id) {
  return type + "#" + id + "#1";
}

std::string BuildDeviceIdentifier(const Device& device) {
  return BuildDeviceIdentifier(device.type(), device.id());
}

SimpleDevice::SimpleDevice(std::string type, std::string id, nlohmann::json status)
    : type_(std::move(type)), id_(std::move(id)), status_(std::move(status)) {}

std::string SimpleDevice::type() const { return type_; }

std::string SimpleDevice::id() const { return id_; }

nlohmann::json SimpleDevice::GetStatusPayload() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return status_;
}

Device::SubscriptionId SimpleDevice::SubscribeChange(ChangeCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  const SubscriptionId subscription = next_subscription_++;
  subscribers_.emplace(subscription, std::move(callback));
  return subscription;
}

void SimpleDevice::UnsubscribeChange(SubscriptionId subscription) {
  std::lock_guard<std::mutex> lock(mutex_);
  subscribers_.erase(subscription);
}

void SimpleDevice::SetStatus(nlohmann::json status) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    status_ = std::move(status);
  }
  NotifyChanged();
}

void SimpleDevice::NotifyChanged() {
  std::vector<ChangeCallback> callbacks;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks.reserve(subscribers_.size());
    for (const auto& entry : subscribers_) {
      callbacks.push_back(entry.second);
    }
  }
  // Invoke outside the lock so subscribers may call back into the device.
  for (const auto& callback : callbacks) {
    if (!callback) {
      continue;
    }
    try {
      callback();
    } catch (const std::exception& ex) {
      detail::LogError(std::string("change callback threw exception: ") + ex.what(),
                       nullptr);
    }
  }
}

size_t SimpleDevice::GetSubscriberCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return subscribers_.size();
}

struct Server::Impl {
#ifdef COAPSTATUS_TESTING
  friend void test::SetSerial(Server& server, uint16_t serial);
  friend bool test::HasPendingBroadcast(Server& server);
#endif

  Impl(Device& device, Transport& transport, Config config)
      : device_(device),
        transport_(transport),
        config_(std::move(config)),
        epoch_(std::make_shared<uint64_t>(0)) {
    RegisterStatusOptions();
  }

  ~Impl() { Stop(); }

  bool Start() {
    if (running_) {
      return true;
    }
    start_error_.clear();
    std::string error;
    if (!config_.Validate(&error)) {
      start_error_ = error;
      detail::LogError(error, &config_);
      return false;
    }

    ListenOptions unicast;
    unicast.bind_address = config_.bind_address;
    unicast.port = config_.port;
    ListenOptions multicast;
    multicast.bind_address = "0.0.0.0";
    multicast.port = config_.port;
    multicast.multicast_address = config_.multicast_address;

    if (!StartListener(unicast, &unicast_listener_) ||
        !StartListener(multicast, &multicast_listener_)) {
      Stop();
      return false;
    }

    subscription_ = device_.SubscribeChange(MakeChangeHandler());
    running_ = true;
    try {
      BroadcastStatus();
    } catch (const std::exception& ex) {
      start_error_ = std::string("initial announcement failed: ") + ex.what();
      detail::LogError(start_error_, &config_);
      Stop();
      return false;
    }
    return true;
  }

  void Stop() {
    if (subscription_.has_value()) {
      device_.UnsubscribeChange(subscription_.value());
      subscription_.reset();
    }
    CloseListener(&unicast_listener_);
    CloseListener(&multicast_listener_);
    if (broadcast_timer_.has_value()) {
      transport_.CancelTimer(broadcast_timer_.value());
      broadcast_timer_.reset();
    }
    // Invalidates change tasks already queued on the loop.
    ++*epoch_;
    running_ = false;
  }

  bool StartListener(const ListenOptions& options,
                     std::optional<Transport::ListenerId>* listener) {
    if (listener->has_value()) {
      return true;
    }
    Transport::ListenerId id = 0;
    std::string error;
    const bool ok = transport_.Listen(
        options,
        [this](const Message& request, const Endpoint& /*source*/) {
          return HandleRequest(request);
        },
        &id, &error);
    if (!ok) {
      start_error_ = error;
      detail::LogError(start_error_, &config_);
      return false;
    }
    *listener = id;
    return true;
  }

  void CloseListener(std::optional<Transport::ListenerId>* listener) {
    if (listener->has_value()) {
      transport_.CloseListener(listener->value());
      listener->reset();
    }
  }

  // Change notifications may arrive on any thread; hop onto the loop before
  // touching server state.
  Device::ChangeCallback MakeChangeHandler() {
    std::weak_ptr<uint64_t> epoch = epoch_;
    const uint64_t current = *epoch_;
    Transport* transport = &transport_;
    return [this, epoch, current, transport]() {
      if (epoch.expired()) {
        return;
      }
      transport->Post([this, epoch, current]() {
        auto alive = epoch.lock();
        if (!alive || *alive != current) {
          return;
        }
        BroadcastStatus();
      });
    };
  }

  void BroadcastStatus() {
    if (!running_) {
      return;
    }
    if (broadcast_timer_.has_value()) {
      transport_.CancelTimer(broadcast_timer_.value());
      broadcast_timer_.reset();
    }
    std::weak_ptr<uint64_t> epoch = epoch_;
    const uint64_t current = *epoch_;
    broadcast_timer_ = transport_.ScheduleTimer(
        config_.broadcast_interval, [this, epoch, current]() {
          auto alive = epoch.lock();
          if (!alive || *alive != current) {
            return;
          }
          broadcast_timer_.reset();
          BroadcastStatus();
        });

    Message announcement;
    announcement.type = MessageType::kNonConfirmable;
    announcement.code = static_cast<uint8_t>(Code::kStatusAnnouncement);
    announcement.SetUriPath(kStatusPath);
    AddStatusOptions(&announcement);
    announcement.payload = SerializeStatus();

    SendOptions options;
    options.host = config_.multicast_address;
    options.port = config_.port;
    options.multicast = true;
    options.multicast_timeout = config_.multicast_timeout;
    std::string error;
    if (!transport_.Send(options, announcement, &error)) {
      ++metrics_.send_errors;
      detail::LogError("Failed to send status announcement: " + error, &config_);
      return;
    }
    ++metrics_.announcements_sent;
  }

  std::optional<Message> HandleRequest(const Message& request) {
    // Announcements, including our own looped back to the group listener,
    // are not requests.
    if (request.code == static_cast<uint8_t>(Code::kStatusAnnouncement)) {
      return std::nullopt;
    }
    try {
      if (request.code == static_cast<uint8_t>(Code::kGet) &&
          request.GetUrl() == kStatusPath) {
        return HandleStatusRequest(request);
      }
    } catch (const std::exception& ex) {
      ++metrics_.handler_exceptions;
      detail::LogError(std::string("Status request failed: ") + ex.what(), &config_);
      throw;
    }
    ++metrics_.requests_ignored;
    return std::nullopt;
  }

  Message HandleStatusRequest(const Message& request) {
    detail::LogInfo(std::string("GET ") + kStatusPath, &config_);
    Message response;
    response.code = static_cast<uint8_t>(Code::kContent);
    response.SetUriPath(request.GetUriPath());
    AddStatusOptions(&response);
    response.payload = SerializeStatus();
    ++metrics_.status_responses;
    return response;
  }

  // Announcements and responses draw from one serial sequence.
  void AddStatusOptions(Message* message) {
    AddEncodedOption(message, kOptionDeviceId, BuildDeviceIdentifier(device_));
    AddEncodedOption(message, kOptionStatusValidity, std::to_string(config_.status_validity));
    AddEncodedOption(message, kOptionStatusSerial, std::to_string(serial_));
    serial_ = static_cast<uint16_t>(serial_ + 1);
  }

  void AddEncodedOption(Message* message, uint16_t number, const std::string& value) {
    std::vector<uint8_t> bytes;
    std::string error;
    if (!EncodeOption(number, value, &bytes, &error)) {
      std::ostringstream oss;
      oss << "cannot encode option " << number << ": " << error;
      throw std::runtime_error(oss.str());
    }
    message->AddOption(number, std::move(bytes));
  }

  std::vector<uint8_t> SerializeStatus() const {
    // Invalid UTF-8 in device strings becomes U+FFFD instead of failing.
    const std::string body = device_.GetStatusPayload().dump(
        -1, ' ', false, nlohmann::json::error_handler_t::replace);
    return std::vector<uint8_t>(body.begin(), body.end());
  }

  Device& device_;
  Transport& transport_;
  Config config_;
  std::string start_error_;
  ServerMetrics metrics_;

  bool running_ = false;
  uint16_t serial_ = 1;
  std::optional<Transport::ListenerId> unicast_listener_;
  std::optional<Transport::ListenerId> multicast_listener_;
  std::optional<Transport::TimerId> broadcast_timer_;
  std::optional<Device::SubscriptionId> subscription_;
  std::shared_ptr<uint64_t> epoch_;
};

Server::Server(Device& device, Transport& transport, Config config)
    : impl_(new Impl(device, transport, std::move(config))) {}

Server::~Server() = default;

bool Server::Start() { return impl_->Start(); }
void Server::Stop() { impl_->Stop(); }
bool Server::IsRunning() const { return impl_->running_; }

void Server::BroadcastStatus() { impl_->BroadcastStatus(); }

std::optional<Message> Server::HandleRequest(const Message& request) {
  return impl_->HandleRequest(request);
}

Message Server::HandleStatusRequest(const Message& request) {
  return impl_->HandleStatusRequest(request);
}

uint16_t Server::GetNextSerial() const { return impl_->serial_; }
std::string Server::GetLastError() const { return impl_->start_error_; }
ServerMetrics Server::GetMetrics() const { return impl_->metrics_; }

#ifdef COAPSTATUS_TESTING
namespace test {

void SetSerial(Server& server, uint16_t serial) {
  server.impl_->serial_ = serial;
}

bool HasPendingBroadcast(Server& server) {
  return server.impl_->broadcast_timer_.has_value();
}

}  // namespace test
#endif

}  // namespace coapstatus
