#include "intraday/logging/event_logger.hpp"
#include "intraday/events/event_format.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace intraday {

namespace {

std::string tagFor(const std::string& type) {
  std::string tag = type;
  std::transform(tag.begin(), tag.end(), tag.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return "[" + tag + "]";
}

}  // namespace

EventLogger::EventLogger(EventBus& bus, std::ostream& out, std::ostream& err)
    : bus_(bus), out_(out), err_(err) {
  sub_id_ = bus_.subscribe([this](const Event& e) { onEvent(e); });
}

EventLogger::~EventLogger() { bus_.unsubscribe(sub_id_); }

std::uint64_t EventLogger::linesWritten() const {
  std::lock_guard lock(mutex_);
  return lines_written_;
}

void EventLogger::onEvent(const Event& event) {
  std::optional<nlohmann::json> record = formatEvent(event);
  if (!record) {
    return;
  }

  const std::string type = (*record)["type"].get<std::string>();
  std::ostream& stream = std::holds_alternative<RiskEvent>(event) ? err_ : out_;

  std::lock_guard lock(mutex_);
  stream << tagFor(type) << " " << record->dump() << "\n";
  ++lines_written_;
}

}  // namespace intraday
