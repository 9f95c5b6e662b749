#include "coapstatus/coapstatus.h"
#include "coapstatus/test_hooks.h"
#include "internal.h"

#include <algorithm>
#include <cstdlib>
#include <map>
#include <mutex>
#include <sstream>

namespace coapstatus {
namespace {

constexpr uint8_t kCoapVersion = 1;
constexpr size_t kHeaderSize = 4;
constexpr size_t kMaxTokenLength = 8;
constexpr uint8_t kPayloadMarker = 0xff;

// Option delta/length nibbles: 0-12 inline, 13 and 14 take 1 or 2
// extension bytes, 15 is reserved.
constexpr uint8_t kNibbleExtended8 = 13;
constexpr uint8_t kNibbleExtended16 = 14;
constexpr uint8_t kNibbleReserved = 15;
constexpr uint32_t kExtended8Base = 13;
constexpr uint32_t kExtended16Base = 269;
constexpr size_t kMaxOptionLength = 0xffff + kExtended16Base;

constexpr uint32_t kMaxUint16 = 0xffff;
constexpr size_t kMaxUintOptionLength = 2;

bool SetError(std::string* error, const std::string& message) {
  if (error) {
    *error = message;
  }
  return false;
}

uint16_t ReadBe16(const uint8_t* data, size_t offset) {
  return static_cast<uint16_t>((data[offset] << 8) | data[offset + 1]);
}

void AppendBe16(std::vector<uint8_t>& data, uint32_t value) {
  data.push_back(static_cast<uint8_t>((value >> 8) & 0xff));
  data.push_back(static_cast<uint8_t>(value & 0xff));
}

uint8_t OptionNibble(uint32_t value) {
  if (value < kExtended8Base) {
    return static_cast<uint8_t>(value);
  }
  if (value < kExtended16Base) {
    return kNibbleExtended8;
  }
  return kNibbleExtended16;
}

void AppendOptionExtension(std::vector<uint8_t>& data, uint32_t value) {
  if (value >= kExtended16Base) {
    AppendBe16(data, value - kExtended16Base);
  } else if (value >= kExtended8Base) {
    data.push_back(static_cast<uint8_t>(value - kExtended8Base));
  }
}

// Resolve a delta or length nibble, consuming its extension bytes.
bool ReadOptionExtension(uint8_t nibble, const uint8_t* data, size_t length,
                         size_t* offset, uint32_t* value) {
  switch (nibble) {
    case kNibbleExtended8:
      if (*offset + 1 > length) {
        return false;
      }
      *value = data[*offset] + kExtended8Base;
      *offset += 1;
      return true;
    case kNibbleExtended16:
      if (*offset + 2 > length) {
        return false;
      }
      *value = ReadBe16(data, *offset) + kExtended16Base;
      *offset += 2;
      return true;
    case kNibbleReserved:
      return false;
    default:
      *value = nibble;
      return true;
  }
}

struct OptionFormat {
  OptionEncoder encoder;
  OptionDecoder decoder;
};

// Process-wide option table shared by every server and transport.
struct OptionRegistry {
  std::mutex mutex;
  std::map<uint16_t, OptionFormat> formats;
};

OptionRegistry& Registry() {
  static OptionRegistry registry;
  return registry;
}

std::once_flag status_options_once;

bool FindFormat(uint16_t number, OptionFormat* out) {
  OptionRegistry& registry = Registry();
  std::lock_guard<std::mutex> lock(registry.mutex);
  auto it = registry.formats.find(number);
  if (it == registry.formats.end()) {
    return false;
  }
  *out = it->second;
  return true;
}

bool EncodeString(const std::string& text, std::vector<uint8_t>* out,
                  std::string* /*error*/) {
  out->assign(text.begin(), text.end());
  return true;
}

bool DecodeString(const std::vector<uint8_t>& bytes, OptionValue* out) {
  *out = std::string(bytes.begin(), bytes.end());
  return true;
}

// Fixed two-byte big-endian form; wider values are rejected, not truncated.
bool EncodeUint16(const std::string& text, std::vector<uint8_t>* out,
                  std::string* error) {
  int64_t value = 0;
  if (!detail::ParseInteger(text, &value)) {
    return SetError(error, "not a number: \"" + text + "\"");
  }
  if (value < 0 || value > kMaxUint16) {
    return SetError(error, "value " + std::to_string(value) +
                               " out of range for uint16 option");
  }
  out->clear();
  AppendBe16(*out, static_cast<uint32_t>(value));
  return true;
}

bool DecodeUint(const std::vector<uint8_t>& bytes, OptionValue* out) {
  if (bytes.size() > kMaxUintOptionLength) {
    return false;
  }
  uint32_t value = 0;
  for (uint8_t byte : bytes) {
    value = (value << 8) | byte;
  }
  *out = value;
  return true;
}

}  // namespace

void Message::AddOption(uint16_t number, std::vector<uint8_t> value) {
  options.push_back(Option{number, std::move(value)});
}

void Message::RemoveOption(uint16_t number) {
  options.erase(std::remove_if(options.begin(), options.end(),
                               [number](const Option& option) {
                                 return option.number == number;
                               }),
                options.end());
}

std::optional<std::vector<uint8_t>> Message::GetOption(uint16_t number) const {
  for (const auto& option : options) {
    if (option.number == number) {
      return option.value;
    }
  }
  return std::nullopt;
}

void Message::SetUriPath(const std::string& path) {
  RemoveOption(kOptionUriPath);
  std::stringstream ss(path);
  std::string segment;
  while (std::getline(ss, segment, '/')) {
    if (!segment.empty()) {
      AddOption(kOptionUriPath, std::vector<uint8_t>(segment.begin(), segment.end()));
    }
  }
}

std::string Message::GetUriPath() const {
  std::string path;
  for (const auto& option : options) {
    if (option.number == kOptionUriPath) {
      path += '/';
      path.append(option.value.begin(), option.value.end());
    }
  }
  return path.empty() ? "/" : path;
}

std::string Message::GetUrl() const {
  std::string query;
  for (const auto& option : options) {
    if (option.number == kOptionUriQuery) {
      query += query.empty() ? '?' : '&';
      query.append(option.value.begin(), option.value.end());
    }
  }
  return GetUriPath() + query;
}

std::string Message::PayloadString() const {
  return std::string(payload.begin(), payload.end());
}

bool EncodeMessage(const Message& message, std::vector<uint8_t>* out,
                   std::string* error) {
  if (!out) {
    return SetError(error, "output buffer is null");
  }
  if (message.token.size() > kMaxTokenLength) {
    return SetError(error, "token longer than 8 bytes");
  }

  std::vector<const Option*> sorted;
  sorted.reserve(message.options.size());
  size_t options_size = 0;
  for (const auto& option : message.options) {
    if (option.value.size() > kMaxOptionLength) {
      return SetError(error, "option " + std::to_string(option.number) +
                                 " value too long");
    }
    sorted.push_back(&option);
    options_size += option.value.size() + 5;
  }
  std::stable_sort(sorted.begin(), sorted.end(),
                   [](const Option* a, const Option* b) {
                     return a->number < b->number;
                   });

  std::vector<uint8_t> packet;
  packet.reserve(kHeaderSize + message.token.size() + options_size + 1 +
                 message.payload.size());
  packet.push_back(static_cast<uint8_t>((kCoapVersion << 6) |
                                        (static_cast<uint8_t>(message.type) << 4) |
                                        message.token.size()));
  packet.push_back(message.code);
  AppendBe16(packet, message.message_id);
  packet.insert(packet.end(), message.token.begin(), message.token.end());

  uint32_t previous = 0;
  for (const Option* option : sorted) {
    const uint32_t delta = option->number - previous;
    const uint32_t length = static_cast<uint32_t>(option->value.size());
    packet.push_back(static_cast<uint8_t>((OptionNibble(delta) << 4) |
                                          OptionNibble(length)));
    AppendOptionExtension(packet, delta);
    AppendOptionExtension(packet, length);
    packet.insert(packet.end(), option->value.begin(), option->value.end());
    previous = option->number;
  }

  if (!message.payload.empty()) {
    packet.push_back(kPayloadMarker);
    packet.insert(packet.end(), message.payload.begin(), message.payload.end());
  }
  *out = std::move(packet);
  return true;
}

bool ParseMessage(const uint8_t* data, size_t length, Message* out,
                  std::string* error) {
  if (!out || (!data && length > 0)) {
    return SetError(error, "invalid arguments");
  }
  if (length < kHeaderSize) {
    return SetError(error, "datagram shorter than CoAP header");
  }
  if ((data[0] >> 6) != kCoapVersion) {
    return SetError(error, "unsupported CoAP version");
  }
  const size_t token_length = data[0] & 0x0f;
  if (token_length > kMaxTokenLength) {
    return SetError(error, "invalid token length");
  }
  if (length < kHeaderSize + token_length) {
    return SetError(error, "truncated token");
  }

  Message message;
  message.type = static_cast<MessageType>((data[0] >> 4) & 0x03);
  message.code = data[1];
  message.message_id = ReadBe16(data, 2);
  message.token.assign(data + kHeaderSize, data + kHeaderSize + token_length);

  size_t offset = kHeaderSize + token_length;
  uint32_t number = 0;
  while (offset < length) {
    const uint8_t header = data[offset++];
    if (header == kPayloadMarker) {
      if (offset >= length) {
        return SetError(error, "payload marker without payload");
      }
      message.payload.assign(data + offset, data + length);
      break;
    }
    uint32_t delta = 0;
    uint32_t value_length = 0;
    if (!ReadOptionExtension(header >> 4, data, length, &offset, &delta) ||
        !ReadOptionExtension(header & 0x0f, data, length, &offset, &value_length)) {
      return SetError(error, "malformed option header");
    }
    number += delta;
    if (number > kMaxUint16) {
      return SetError(error, "option number out of range");
    }
    if (offset + value_length > length) {
      return SetError(error, "truncated option value");
    }
    message.options.push_back(
        Option{static_cast<uint16_t>(number),
               std::vector<uint8_t>(data + offset, data + offset + value_length)});
    offset += value_length;
  }
  *out = std::move(message);
  return true;
}

bool ParseMessage(const std::vector<uint8_t>& data, Message* out,
                  std::string* error) {
  return ParseMessage(data.data(), data.size(), out, error);
}

void RegisterOption(uint16_t number, OptionEncoder encoder, OptionDecoder decoder) {
  OptionRegistry& registry = Registry();
  std::lock_guard<std::mutex> lock(registry.mutex);
  registry.formats[number] = OptionFormat{std::move(encoder), std::move(decoder)};
}

void RegisterStatusOptions() {
  std::call_once(status_options_once, []() {
    RegisterOption(kOptionDeviceId, EncodeString, DecodeString);
    RegisterOption(kOptionStatusValidity, EncodeUint16, DecodeUint);
    RegisterOption(kOptionStatusSerial, EncodeUint16, DecodeUint);
  });
}

bool IsOptionRegistered(uint16_t number) {
  OptionRegistry& registry = Registry();
  std::lock_guard<std::mutex> lock(registry.mutex);
  return registry.formats.count(number) != 0;
}

bool EncodeOption(uint16_t number, const std::string& value,
                  std::vector<uint8_t>* out, std::string* error) {
  if (!out) {
    return SetError(error, "output buffer is null");
  }
  OptionFormat format;
  if (!FindFormat(number, &format) || !format.encoder) {
    return SetError(error, "option " + std::to_string(number) + " is not registered");
  }
  std::vector<uint8_t> bytes;
  if (!format.encoder(value, &bytes, error)) {
    return false;
  }
  *out = std::move(bytes);
  return true;
}

bool EncodeOption(uint16_t number, uint32_t value,
                  std::vector<uint8_t>* out, std::string* error) {
  return EncodeOption(number, std::to_string(value), out, error);
}

bool DecodeOption(uint16_t number, const std::vector<uint8_t>& bytes,
                  OptionValue* out) {
  if (!out) {
    return false;
  }
  OptionFormat format;
  if (!FindFormat(number, &format) || !format.decoder) {
    return false;
  }
  return format.decoder(bytes, out);
}

namespace detail {

bool ParseInteger(const std::string& text, int64_t* out) {
  const char* begin = text.c_str();
  char* end = nullptr;
  const long long value = std::strtoll(begin, &end, 10);
  if (end == begin) {
    return false;
  }
  // Overflow saturates, which every caller then rejects as out of range.
  *out = static_cast<int64_t>(value);
  return true;
}

bool FrameReply(const Message& request,
                const std::optional<Message>& response,
                uint16_t message_id,
                Message* out) {
  if (!out) {
    return false;
  }
  if (request.type == MessageType::kConfirmable) {
    Message reply;
    if (response.has_value()) {
      reply = response.value();
      reply.token = request.token;
    }
    reply.type = MessageType::kAcknowledgement;
    reply.message_id = request.message_id;
    *out = std::move(reply);
    return true;
  }
  if (request.type == MessageType::kNonConfirmable && response.has_value()) {
    Message reply = response.value();
    reply.type = MessageType::kNonConfirmable;
    reply.message_id = message_id;
    reply.token = request.token;
    *out = std::move(reply);
    return true;
  }
  return false;
}

}  // namespace detail

#ifdef COAPSTATUS_TESTING
namespace test {

bool FrameReply(const Message& request,
                const std::optional<Message>& response,
                uint16_t message_id,
                Message* out) {
  return detail::FrameReply(request, response, message_id, out);
}

}  // namespace test
#endif

}  // namespace coapstatus
