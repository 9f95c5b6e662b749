#pragma once

#include "coapstatus/coapstatus.h"

#include <cstdint>
#include <optional>
#include <string>

namespace coapstatus {
namespace detail {

// Log through config->log_callback when set, otherwise to stderr.
void LogInfo(const std::string& message, const Config* config);
void LogError(const std::string& message, const Config* config);

// Parse a leading base-10 integer ("  42abc" -> 42). Returns false when no
// digits are present.
bool ParseInteger(const std::string& text, int64_t* out);

// CON requests get a piggybacked ACK (or an empty ACK when unanswered);
// NON requests get a NON response carrying message_id, or nothing.
bool FrameReply(const Message& request,
                const std::optional<Message>& response,
                uint16_t message_id,
                Message* out);

}  // namespace detail
}  // namespace coapstatus
