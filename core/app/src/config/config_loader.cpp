#include "intraday/config/config_loader.hpp"
#include "intraday/domain/errors.hpp"

#include <fstream>
#include <initializer_list>
#include <iostream>
#include <sstream>
#include <utility>

namespace intraday {
namespace config {

namespace {

using nlohmann::json;

constexpr std::initializer_list<const char*> kTopLevelSections = {
    "trading", "indicators", "entry", "exit", "risk", "behavior"};

// -----------------------------------------------------------------------------
// SectionReader: walks one JSON object and copies recognised keys into the
// typed config, recording a warning for anything it cannot use.
// -----------------------------------------------------------------------------
class SectionReader {
 public:
  explicit SectionReader(std::vector<std::string>& warnings)
      : warnings_(warnings) {}

  void warn(std::string message) {
    std::cerr << "[ConfigLoader] WARNING: " << message << "\n";
    warnings_.push_back(std::move(message));
  }

  // Returns the nested object `key` of `parent`, or nullptr if it is absent
  // or not an object.
  const json* section(const json& parent, const char* key,
                      const std::string& path) {
    auto it = parent.find(key);
    if (it == parent.end()) {
      return nullptr;
    }
    if (!it->is_object()) {
      warn("'" + path + "' is not an object; using defaults");
      return nullptr;
    }
    return &*it;
  }

  // Warns about every key of `object` that is not in `known`.
  void checkKeys(const json& object, std::initializer_list<const char*> known,
                 const std::string& path) {
    for (const auto& item : object.items()) {
      bool recognised = false;
      for (const char* k : known) {
        if (item.key() == k) {
          recognised = true;
          break;
        }
      }
      if (!recognised) {
        warn("unknown key '" + path + "." + item.key() + "' ignored");
      }
    }
  }

  void read(const json& object, const char* key, const std::string& path,
            double& target) {
    auto it = object.find(key);
    if (it == object.end()) {
      return;
    }
    if (!it->is_number()) {
      warn(typeMessage(path, key, "a number", target));
      return;
    }
    target = it->get<double>();
  }

  void read(const json& object, const char* key, const std::string& path,
            int& target) {
    auto it = object.find(key);
    if (it == object.end()) {
      return;
    }
    if (!it->is_number_integer()) {
      warn(typeMessage(path, key, "an integer", target));
      return;
    }
    target = it->get<int>();
  }

  void read(const json& object, const char* key, const std::string& path,
            bool& target) {
    auto it = object.find(key);
    if (it == object.end()) {
      return;
    }
    if (!it->is_boolean()) {
      warn(typeMessage(path, key, "a boolean", target));
      return;
    }
    target = it->get<bool>();
  }

  void read(const json& object, const char* key, const std::string& path,
            std::string& target) {
    auto it = object.find(key);
    if (it == object.end()) {
      return;
    }
    if (!it->is_string()) {
      warn(typeMessage(path, key, "a string", target));
      return;
    }
    target = it->get<std::string>();
  }

  // Positive-integer read (indicator periods, minutes).
  void readPositive(const json& object, const char* key,
                    const std::string& path, int& target) {
    int value = target;
    read(object, key, path, value);
    if (value <= 0) {
      warn("'" + path + "." + key + "' must be positive; keeping default " +
           std::to_string(target));
      return;
    }
    target = value;
  }

  // Portfolio-fraction read, valid range (0, 1].
  void readFraction(const json& object, const char* key,
                    const std::string& path, double& target) {
    double value = target;
    read(object, key, path, value);
    if (!(value > 0.0 && value <= 1.0)) {
      warn("'" + path + "." + key + "' must be in (0, 1]; keeping default " +
           std::to_string(target));
      return;
    }
    target = value;
  }

 private:
  template <typename T>
  static std::string typeMessage(const std::string& path, const char* key,
                                 const char* expected, const T& fallback) {
    std::ostringstream oss;
    oss << "'" << path << "." << key << "' must be " << expected
        << "; keeping default " << std::boolalpha << fallback;
    return oss.str();
  }

  std::vector<std::string>& warnings_;
};

void readTrading(SectionReader& r, const json& s, TradingConfig& c) {
  r.checkKeys(s,
              {"symbol", "market", "resolution", "consolidation_minutes",
               "position_size", "trade_duration_minutes"},
              "trading");
  r.read(s, "symbol", "trading", c.symbol);
  r.read(s, "market", "trading", c.market);
  r.read(s, "resolution", "trading", c.resolution);
  r.readPositive(s, "consolidation_minutes", "trading",
                 c.consolidation_minutes);
  r.readFraction(s, "position_size", "trading", c.position_size);
  r.readPositive(s, "trade_duration_minutes", "trading",
                 c.trade_duration_minutes);
}

void readIndicators(SectionReader& r, const json& s, IndicatorsConfig& c) {
  r.checkKeys(s, {"ema", "rsi", "obv", "bollinger_bands", "macd"},
              "indicators");

  if (const json* ema = r.section(s, "ema", "indicators.ema")) {
    // "type" is accepted for compatibility with older files; EMA is the only
    // moving average the core consumes.
    r.checkKeys(*ema, {"period", "type"}, "indicators.ema");
    r.readPositive(*ema, "period", "indicators.ema", c.ema.period);
  }

  if (const json* rsi = r.section(s, "rsi", "indicators.rsi")) {
    r.checkKeys(*rsi, {"period", "oversold", "overbought"}, "indicators.rsi");
    r.readPositive(*rsi, "period", "indicators.rsi", c.rsi.period);
    r.read(*rsi, "oversold", "indicators.rsi", c.rsi.oversold);
    r.read(*rsi, "overbought", "indicators.rsi", c.rsi.overbought);
  }

  if (const json* obv = r.section(s, "obv", "indicators.obv")) {
    r.checkKeys(*obv, {"enabled"}, "indicators.obv");
    r.read(*obv, "enabled", "indicators.obv", c.obv.enabled);
  }

  if (const json* bb =
          r.section(s, "bollinger_bands", "indicators.bollinger_bands")) {
    r.checkKeys(*bb, {"enabled", "period", "std_dev"},
                "indicators.bollinger_bands");
    r.read(*bb, "enabled", "indicators.bollinger_bands",
           c.bollinger_bands.enabled);
    r.readPositive(*bb, "period", "indicators.bollinger_bands",
                   c.bollinger_bands.period);
    r.read(*bb, "std_dev", "indicators.bollinger_bands",
           c.bollinger_bands.std_dev);
  }

  if (const json* macd = r.section(s, "macd", "indicators.macd")) {
    r.checkKeys(*macd,
                {"enabled", "fast_period", "slow_period", "signal_period"},
                "indicators.macd");
    r.read(*macd, "enabled", "indicators.macd", c.macd.enabled);
    r.readPositive(*macd, "fast_period", "indicators.macd",
                   c.macd.fast_period);
    r.readPositive(*macd, "slow_period", "indicators.macd",
                   c.macd.slow_period);
    r.readPositive(*macd, "signal_period", "indicators.macd",
                   c.macd.signal_period);
  }
}

void readEntry(SectionReader& r, const json& s, EntryConfig& c) {
  r.checkKeys(s, {"conditions"}, "entry");
  if (const json* cond = r.section(s, "conditions", "entry.conditions")) {
    r.checkKeys(*cond, {"price_above_ema", "rsi_oversold", "obv_increasing"},
                "entry.conditions");
    r.read(*cond, "price_above_ema", "entry.conditions",
           c.conditions.price_above_ema);
    r.read(*cond, "rsi_oversold", "entry.conditions",
           c.conditions.rsi_oversold);
    r.read(*cond, "obv_increasing", "entry.conditions",
           c.conditions.obv_increasing);
  }
}

void readExit(SectionReader& r, const json& s, ExitConfig& c) {
  r.checkKeys(s, {"stop_loss_percent", "take_profit_percent"}, "exit");
  r.read(s, "stop_loss_percent", "exit", c.stop_loss_percent);
  r.read(s, "take_profit_percent", "exit", c.take_profit_percent);
}

void readRisk(SectionReader& r, const json& s, RiskConfig& c) {
  r.checkKeys(s, {"portfolio", "position_sizing", "stop_loss"}, "risk");

  if (const json* p = r.section(s, "portfolio", "risk.portfolio")) {
    r.checkKeys(*p, {"max_drawdown_percent", "daily_loss_limit_percent"},
                "risk.portfolio");
    r.read(*p, "max_drawdown_percent", "risk.portfolio",
           c.portfolio.max_drawdown_percent);
    r.read(*p, "daily_loss_limit_percent", "risk.portfolio",
           c.portfolio.daily_loss_limit_percent);
  }

  if (const json* ps =
          r.section(s, "position_sizing", "risk.position_sizing")) {
    r.checkKeys(*ps, {"method", "fixed", "percent_risk"},
                "risk.position_sizing");

    std::string method = toString(c.position_sizing.method);
    r.read(*ps, "method", "risk.position_sizing", method);
    if (method != "fixed" && method != "percent_risk") {
      r.warn("unsupported sizing method '" + method +
             "'; treated as 'fixed'");
    }
    c.position_sizing.method = parseSizingMethod(method);

    if (const json* fixed =
            r.section(*ps, "fixed", "risk.position_sizing.fixed")) {
      r.checkKeys(*fixed, {"size"}, "risk.position_sizing.fixed");
      auto size = fixed->find("size");
      if (size != fixed->end()) {
        if (size->is_number() && size->get<double>() > 0.0 &&
            size->get<double>() <= 1.0) {
          c.position_sizing.fixed_size = size->get<double>();
        } else {
          r.warn("'risk.position_sizing.fixed.size' must be a number in "
                 "(0, 1]; falling back to trading.position_size");
        }
      }
    }

    if (const json* pr = r.section(*ps, "percent_risk",
                                   "risk.position_sizing.percent_risk")) {
      r.checkKeys(*pr, {"risk_per_trade"},
                  "risk.position_sizing.percent_risk");
      r.read(*pr, "risk_per_trade", "risk.position_sizing.percent_risk",
             c.position_sizing.risk_per_trade);
    }
  }

  if (const json* sl = r.section(s, "stop_loss", "risk.stop_loss")) {
    r.checkKeys(*sl, {"default_percent"}, "risk.stop_loss");
    r.read(*sl, "default_percent", "risk.stop_loss",
           c.stop_loss.default_percent);
  }
}

void readBehavior(SectionReader& r, const json& s, BehaviorConfig& c) {
  r.checkKeys(s,
              {"debug_mode", "log_performance", "log_signals", "log_trades",
               "log_indicators", "warmup_buffer"},
              "behavior");
  r.read(s, "debug_mode", "behavior", c.debug_mode);
  r.read(s, "log_performance", "behavior", c.log_performance);
  r.read(s, "log_signals", "behavior", c.log_signals);
  r.read(s, "log_trades", "behavior", c.log_trades);
  r.read(s, "log_indicators", "behavior", c.log_indicators);
  r.read(s, "warmup_buffer", "behavior", c.warmup_buffer);
  if (c.warmup_buffer < 0) {
    r.warn("'behavior.warmup_buffer' must not be negative; using 1");
    c.warmup_buffer = 1;
  }
}

}  // namespace

// -----------------------------------------------------------------------------
// loadFile()
// -----------------------------------------------------------------------------
ConfigLoadResult ConfigLoader::loadFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    ConfigLoadResult result;
    result.used_defaults = true;
    SectionReader(result.warnings)
        .warn("configuration file '" + path +
              "' could not be opened; using default configuration");
    return result;
  }

  std::ostringstream buffer;
  buffer << in.rdbuf();
  ConfigLoadResult result = loadString(buffer.str());
  if (!result.used_defaults) {
    std::cout << "[ConfigLoader] loaded configuration from " << path << "\n";
  }
  return result;
}

// -----------------------------------------------------------------------------
// loadString()
// -----------------------------------------------------------------------------
ConfigLoadResult ConfigLoader::loadString(const std::string& text) {
  json document;
  try {
    document = json::parse(text);
  } catch (const json::parse_error& e) {
    ConfigLoadResult result;
    result.used_defaults = true;
    SectionReader(result.warnings)
        .warn(std::string("configuration is not valid JSON (") + e.what() +
              "); using default configuration");
    return result;
  }
  return fromJson(document);
}

// -----------------------------------------------------------------------------
// fromJson()
// -----------------------------------------------------------------------------
ConfigLoadResult ConfigLoader::fromJson(const nlohmann::json& document) {
  ConfigLoadResult result;
  SectionReader reader(result.warnings);

  if (!document.is_object()) {
    result.used_defaults = true;
    reader.warn("configuration root is not an object; using default "
                "configuration");
    return result;
  }

  for (const auto& item : document.items()) {
    bool known = false;
    for (const char* name : kTopLevelSections) {
      if (item.key() == name) {
        known = true;
        break;
      }
    }
    if (!known) {
      throw ConfigurationError("unknown configuration section '" +
                               item.key() + "'");
    }
  }

  StrategyConfig& c = result.config;
  if (const json* s = reader.section(document, "trading", "trading")) {
    readTrading(reader, *s, c.trading);
  }
  if (const json* s = reader.section(document, "indicators", "indicators")) {
    readIndicators(reader, *s, c.indicators);
  }
  if (const json* s = reader.section(document, "entry", "entry")) {
    readEntry(reader, *s, c.entry);
  }
  if (const json* s = reader.section(document, "exit", "exit")) {
    readExit(reader, *s, c.exit);
  }
  if (const json* s = reader.section(document, "risk", "risk")) {
    readRisk(reader, *s, c.risk);
  }
  if (const json* s = reader.section(document, "behavior", "behavior")) {
    readBehavior(reader, *s, c.behavior);
  }

  return result;
}

}  // namespace config
}  // namespace intraday
