#include "intraday/gateway/message_decoder.hpp"
#include "intraday/domain/errors.hpp"
#include "intraday/time/time_utils.hpp"

#include <array>
#include <optional>
#include <string>

namespace intraday {

namespace {

using nlohmann::json;

template <typename T>
T requiredField(const json& message, const char* key) {
  auto it = message.find(key);
  if (it == message.end()) {
    throw DataError(std::string("missing field '") + key + "'");
  }
  try {
    return it->get<T>();
  } catch (const json::type_error&) {
    throw DataError(std::string("field '") + key + "' has the wrong type");
  }
}

template <typename T>
std::optional<T> optionalField(const json& message, const char* key) {
  if (!message.contains(key) || message.at(key).is_null()) {
    return std::nullopt;
  }
  return requiredField<T>(message, key);
}

// Three related optional fields must be present together.
std::optional<std::array<double, 3>> triple(const json& message,
                                            const char* a, const char* b,
                                            const char* c) {
  const int present = static_cast<int>(message.contains(a)) +
                      static_cast<int>(message.contains(b)) +
                      static_cast<int>(message.contains(c));
  if (present == 0) {
    return std::nullopt;
  }
  if (present != 3) {
    throw DataError(std::string("fields '") + a + "', '" + b + "', '" + c +
                    "' must be given together");
  }
  return std::array<double, 3>{requiredField<double>(message, a),
                               requiredField<double>(message, b),
                               requiredField<double>(message, c)};
}

BarEvent decodeBar(const json& m, std::int64_t timestamp_ms) {
  BarEvent bar;
  bar.symbol = requiredField<std::string>(m, "symbol");
  bar.portfolio_value = requiredField<double>(m, "portfolio_value");
  bar.is_invested = optionalField<bool>(m, "is_invested").value_or(false);
  bar.is_warming_up =
      optionalField<bool>(m, "is_warming_up").value_or(false);
  bar.indicators_ready =
      optionalField<bool>(m, "indicators_ready").value_or(true);

  domain::IndicatorSnapshot& s = bar.snapshot;
  s.timestamp = ms_to_timestamp(timestamp_ms);
  s.close = requiredField<double>(m, "close");
  s.ema = requiredField<double>(m, "ema");
  s.rsi = requiredField<double>(m, "rsi");
  s.obv = optionalField<double>(m, "obv");

  if (auto bb = triple(m, "bb_upper", "bb_middle", "bb_lower")) {
    s.bollinger_bands = domain::BollingerBands{(*bb)[0], (*bb)[1], (*bb)[2]};
  }
  if (auto macd = triple(m, "macd", "macd_signal", "macd_histogram")) {
    s.macd = domain::MacdValues{(*macd)[0], (*macd)[1], (*macd)[2]};
  }
  return bar;
}

}  // namespace

DecodedMessage decodeJson(const nlohmann::json& message) {
  if (!message.is_object()) {
    throw DataError("message is not a JSON object");
  }

  const auto type = requiredField<std::string>(message, "type");
  const auto timestamp_ms =
      requiredField<std::int64_t>(message, "timestamp_ms");
  const Timestamp ts = ms_to_timestamp(timestamp_ms);

  DecodedMessage decoded;
  decoded.timestamp_ms = timestamp_ms;

  if (type == "bar") {
    decoded.event = decodeBar(message, timestamp_ms);
  } else if (type == "tick") {
    TickEvent tick;
    tick.timestamp = ts;
    tick.obv = requiredField<double>(message, "obv");
    tick.is_warming_up =
        optionalField<bool>(message, "is_warming_up").value_or(false);
    decoded.event = tick;
  } else if (type == "day_end") {
    decoded.event =
        DayEndEvent{ts, requiredField<double>(message, "portfolio_value")};
  } else if (type == "run_end") {
    decoded.event =
        RunEndEvent{ts, requiredField<double>(message, "portfolio_value")};
  } else {
    throw DataError("unknown message type '" + type + "'");
  }
  return decoded;
}

DecodedMessage decodeMessage(const std::string& payload) {
  json message;
  try {
    message = json::parse(payload);
  } catch (const json::parse_error& e) {
    throw DataError(std::string("invalid JSON: ") + e.what());
  }
  return decodeJson(message);
}

}  // namespace intraday
