#include "common/Config.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <type_traits>
#include <vector>

namespace tickpilot {

namespace {
std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

std::string upperCopy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return trimCopy(s);
}

// A JSON object plus its dotted location, so every failure names the key
class Section {
public:
    Section(const nlohmann::json& node, std::string path)
        : node_(node)
        , path_(std::move(path))
    {
        if (!node_.is_object()) {
            throw ConfigError(path_.empty() ? "<root>" : path_, "must be an object");
        }
    }

    std::string keyPath(const char* key) const {
        return path_.empty() ? std::string(key) : path_ + "." + key;
    }

    bool has(const char* key) const {
        return node_.contains(key) && !node_.at(key).is_null();
    }

    Section child(const char* key) const {
        if (!has(key)) {
            throw ConfigError(keyPath(key), "required section is missing");
        }
        return Section(node_.at(key), keyPath(key));
    }

    const nlohmann::json& raw(const char* key) const {
        if (!has(key)) {
            throw ConfigError(keyPath(key), "required key is missing");
        }
        return node_.at(key);
    }

    template<typename T>
    T get(const char* key) const {
        const auto& value = raw(key);
        checkType<T>(value, key);
        try {
            return value.get<T>();
        } catch (const nlohmann::json::exception& e) {
            throw ConfigError(keyPath(key), e.what());
        }
    }

    template<typename T>
    T getOr(const char* key, T fallback) const {
        return has(key) ? get<T>(key) : fallback;
    }

    int positiveInt(const char* key) const {
        const int value = get<int>(key);
        if (value <= 0) {
            throw ConfigError(keyPath(key), "must be positive");
        }
        return value;
    }

    std::chrono::milliseconds millis(const char* key) const {
        const long long value = get<long long>(key);
        if (value < 0) {
            throw ConfigError(keyPath(key), "must not be negative");
        }
        return std::chrono::milliseconds(value);
    }

    std::chrono::milliseconds millisOr(const char* key, std::chrono::milliseconds fallback) const {
        return has(key) ? millis(key) : fallback;
    }

private:
    template<typename T>
    void checkType(const nlohmann::json& value, const char* key) const {
        bool ok = true;
        if constexpr (std::is_same<T, bool>::value) {
            ok = value.is_boolean();
        } else if constexpr (std::is_integral<T>::value) {
            ok = value.is_number_integer();
        } else if constexpr (std::is_floating_point<T>::value) {
            ok = value.is_number();
        } else if constexpr (std::is_same<T, std::string>::value) {
            ok = value.is_string();
        }
        if (!ok) {
            throw ConfigError(keyPath(key), "has the wrong type (" + std::string(value.type_name()) + ")");
        }
    }

    const nlohmann::json& node_;
    std::string path_;
};

ConsumptionMode parseConsumptionMode(const Section& s, const char* key) {
    const std::string mode = upperCopy(s.get<std::string>(key));
    if (mode == "POLL") return ConsumptionMode::POLL;
    if (mode == "CALLBACK") return ConsumptionMode::CALLBACK;
    throw ConfigError(s.keyPath(key), "expected POLL or CALLBACK, got '" + mode + "'");
}

feed::FeedSourceKind parseSourceKind(const Section& s, const char* key) {
    const std::string kind = upperCopy(s.get<std::string>(key));
    if (kind == "WEBSOCKET") return feed::FeedSourceKind::WEBSOCKET;
    if (kind == "FILE_REPLAY") return feed::FeedSourceKind::FILE_REPLAY;
    throw ConfigError(s.keyPath(key), "expected WEBSOCKET or FILE_REPLAY, got '" + kind + "'");
}

core::DiagnosticLimitMode parseLimitMode(const Section& s, const char* key) {
    const std::string mode = upperCopy(s.get<std::string>(key));
    if (mode == "COUNT") return core::DiagnosticLimitMode::COUNT;
    if (mode == "TIME") return core::DiagnosticLimitMode::TIME;
    throw ConfigError(s.keyPath(key), "expected COUNT or TIME, got '" + mode + "'");
}

risk::InstrumentConfig parseInstrument(const Section& s) {
    risk::InstrumentConfig cfg;
    cfg.symbol = trimCopy(s.get<std::string>("symbol"));
    cfg.exchange = trimCopy(s.get<std::string>("exchange"));
    cfg.lot_size = s.get<double>("lot_size");
    cfg.tick_size = s.get<double>("tick_size");
    return cfg;
}

feed::NormalizerConfig parseNormalizer(const Section& s) {
    feed::NormalizerConfig cfg;
    cfg.price_field = s.getOr<std::string>("price_field", cfg.price_field);
    cfg.timestamp_field = s.getOr<std::string>("timestamp_field", cfg.timestamp_field);
    cfg.volume_field = s.getOr<std::string>("volume_field", cfg.volume_field);
    cfg.instrument_field = s.getOr<std::string>("instrument_field", cfg.instrument_field);
    cfg.sequence_field = s.getOr<std::string>("sequence_field", cfg.sequence_field);
    cfg.price_divisor = s.getOr<double>("price_divisor", cfg.price_divisor);
    cfg.stamp_on_receive = s.getOr<bool>("stamp_on_receive", cfg.stamp_on_receive);
    return cfg;
}

feed::FeedConfig parseFeed(const Section& s) {
    feed::FeedConfig cfg;
    cfg.source = parseSourceKind(s, "source");
    cfg.consumption_mode = parseConsumptionMode(s, "consumption_mode");
    cfg.queue_capacity = static_cast<std::size_t>(s.positiveInt("queue_capacity"));
    cfg.silence_threshold = s.millis("silence_threshold_ms");
    cfg.backoff_initial = s.millis("backoff_initial_ms");
    cfg.backoff_max = s.millis("backoff_max_ms");
    cfg.max_reconnect_attempts = s.positiveInt("max_reconnect_attempts");

    // loop tuning
    cfg.liveness_check_interval = s.millisOr("liveness_check_interval_ms", cfg.liveness_check_interval);
    cfg.poll_interval = s.millisOr("poll_interval_ms", cfg.poll_interval);
    cfg.heartbeat_interval = s.millisOr("heartbeat_interval_ms", cfg.heartbeat_interval);
    cfg.source_poll_timeout = s.millisOr("source_poll_timeout_ms", cfg.source_poll_timeout);

    if (s.has("normalizer")) {
        cfg.normalizer = parseNormalizer(s.child("normalizer"));
    }

    if (cfg.source == feed::FeedSourceKind::WEBSOCKET) {
        const Section ws = s.child("websocket");
        cfg.websocket.host = trimCopy(ws.get<std::string>("host"));
        cfg.websocket.port = ws.getOr<std::string>("port", cfg.websocket.port);
        cfg.websocket.target = ws.getOr<std::string>("target", cfg.websocket.target);
        cfg.websocket.use_tls = ws.getOr<bool>("use_tls", cfg.websocket.use_tls);
        cfg.websocket.bearer_token_env = ws.getOr<std::string>("bearer_token_env", "");
        if (ws.has("subscribe")) {
            const auto& sub = ws.raw("subscribe");
            cfg.websocket.subscribe_payload = sub.is_string() ? sub.get<std::string>() : sub.dump();
        }
        if (cfg.websocket.host.empty()) {
            throw ConfigError(ws.keyPath("host"), "must not be empty");
        }
    } else {
        const Section replay = s.child("replay");
        cfg.replay.file_path = trimCopy(replay.get<std::string>("file_path"));
        cfg.replay.speed_mode = upperCopy(replay.getOr<std::string>("speed_mode", cfg.replay.speed_mode));
        if (cfg.replay.file_path.empty()) {
            throw ConfigError(replay.keyPath("file_path"), "must not be empty");
        }
    }
    return cfg;
}

risk::RiskConfig parseRisk(const Section& s) {
    risk::RiskConfig cfg;
    cfg.base_sl_points = s.get<double>("base_sl_points");

    const auto& ladder = s.raw("take_profit");
    if (!ladder.is_array()) {
        throw ConfigError(s.keyPath("take_profit"), "must be an array");
    }
    cfg.take_profit_ladder.clear();
    for (std::size_t i = 0; i < ladder.size(); ++i) {
        const Section rung(ladder[i], s.keyPath("take_profit") + "[" + std::to_string(i) + "]");
        cfg.take_profit_ladder.emplace_back(rung.get<double>("points"), rung.get<double>("fraction"));
    }

    cfg.use_trail_stop = s.get<bool>("use_trail_stop");
    cfg.trail_activation_points = s.get<double>("trail_activation_points");
    cfg.trail_distance_points = s.get<double>("trail_distance_points");
    cfg.risk_per_trade_percent = s.get<double>("risk_per_trade_percent");
    cfg.max_position_value_percent = s.get<double>("max_position_value_percent");
    cfg.commission_percent = s.get<double>("commission_percent");

    if (s.has("exit_precedence")) {
        const auto& order = s.raw("exit_precedence");
        if (!order.is_array()) {
            throw ConfigError(s.keyPath("exit_precedence"), "must be an array");
        }
        std::vector<risk::ExitCause> parsed;
        for (const auto& item : order) {
            const std::string name = item.is_string() ? upperCopy(item.get<std::string>()) : "";
            auto cause = risk::exitCauseFromString(name);
            if (!cause) {
                throw ConfigError(s.keyPath("exit_precedence"), "unknown exit cause '" + name + "'");
            }
            if (std::find(parsed.begin(), parsed.end(), *cause) != parsed.end()) {
                throw ConfigError(s.keyPath("exit_precedence"), "duplicate exit cause '" + name + "'");
            }
            parsed.push_back(*cause);
        }
        cfg.exit_precedence = parsed;
    }
    return cfg;
}

strategy::StrategyConfig parseStrategy(const Section& s) {
    strategy::StrategyConfig cfg;
    cfg.use_ema_crossover = s.get<bool>("use_ema_crossover");
    cfg.fast_ema = s.positiveInt("fast_ema");
    cfg.slow_ema = s.positiveInt("slow_ema");

    cfg.use_macd = s.get<bool>("use_macd");
    cfg.macd_fast = s.positiveInt("macd_fast");
    cfg.macd_slow = s.positiveInt("macd_slow");
    cfg.macd_signal = s.positiveInt("macd_signal");

    cfg.use_vwap = s.get<bool>("use_vwap");

    cfg.use_rsi_filter = s.get<bool>("use_rsi_filter");
    cfg.rsi_length = s.positiveInt("rsi_length");
    cfg.rsi_overbought = s.get<double>("rsi_overbought");
    cfg.rsi_oversold = s.get<double>("rsi_oversold");

    cfg.use_htf_trend = s.get<bool>("use_htf_trend");
    cfg.htf_period = s.positiveInt("htf_period");

    cfg.use_atr = s.get<bool>("use_atr");
    cfg.atr_len = s.positiveInt("atr_len");
    cfg.min_atr_points = s.get<double>("min_atr_points");

    cfg.use_consecutive_ticks = s.get<bool>("use_consecutive_ticks");
    cfg.consecutive_ticks_required = s.positiveInt("consecutive_ticks_required");
    cfg.noise_filter_enabled = s.get<bool>("noise_filter_enabled");
    cfg.noise_filter_percentage = s.get<double>("noise_filter_percentage");
    cfg.noise_filter_min_ticks = s.get<double>("noise_filter_min_ticks");

    cfg.use_momentum = s.get<bool>("use_momentum");
    cfg.momentum_threshold_points = s.get<double>("momentum_threshold_points");

    cfg.use_volume_confirmation = s.get<bool>("use_volume_confirmation");
    cfg.volume_window = s.positiveInt("volume_window");
    cfg.volume_multiplier = s.get<double>("volume_multiplier");

    cfg.use_variance_filter = s.get<bool>("use_variance_filter");
    cfg.variance_window = s.positiveInt("variance_window");
    cfg.min_stddev_points = s.get<double>("min_stddev_points");

    cfg.allow_short = s.get<bool>("allow_short");
    cfg.exit_on_decline = s.get<bool>("exit_on_decline");
    cfg.exit_on_opposite_crossover = s.get<bool>("exit_on_opposite_crossover");
    return cfg;
}

// "HH:MM" -> hour, minute
void parseClock(const Section& s, const char* key, int& hour, int& minute) {
    const std::string text = trimCopy(s.get<std::string>(key));
    const auto colon = text.find(':');
    bool ok = colon != std::string::npos && colon > 0 && colon + 1 < text.size();
    if (ok) {
        try {
            std::size_t used_h = 0;
            std::size_t used_m = 0;
            hour = std::stoi(text.substr(0, colon), &used_h);
            minute = std::stoi(text.substr(colon + 1), &used_m);
            ok = used_h == colon && used_m == text.size() - colon - 1;
        } catch (const std::exception&) {
            ok = false;
        }
    }
    if (!ok || hour < 0 || hour > 23 || minute < 0 || minute > 59) {
        throw ConfigError(s.keyPath(key), "expected HH:MM, got '" + text + "'");
    }
}

strategy::SessionWindowConfig parseSession(const Section& s) {
    strategy::SessionWindowConfig cfg;
    parseClock(s, "start", cfg.start_hour, cfg.start_min);
    parseClock(s, "end", cfg.end_hour, cfg.end_min);
    cfg.utc_offset_minutes = s.get<int>("utc_offset_minutes");
    cfg.no_trade_start_minutes = s.get<int>("no_trade_start_minutes");
    cfg.no_trade_end_minutes = s.get<int>("no_trade_end_minutes");
    cfg.flatten_before_end_minutes = s.get<int>("flatten_before_end_minutes");
    cfg.max_trades_per_day = s.positiveInt("max_trades_per_day");
    return cfg;
}

engine::LimitsConfig parseLimits(const Section& s) {
    engine::LimitsConfig cfg;
    cfg.error_streak_threshold = s.positiveInt("error_streak_threshold");
    cfg.diagnostic_limit_mode = parseLimitMode(s, "diagnostic_limit_mode");
    if (cfg.diagnostic_limit_mode == core::DiagnosticLimitMode::COUNT) {
        cfg.diagnostic_every_n = s.positiveInt("diagnostic_every_n");
    } else {
        cfg.diagnostic_window = s.millis("diagnostic_window_ms");
    }
    return cfg;
}
}

engine::SessionConfig Config::fromJson(const nlohmann::json& j) {
    const Section root(j, "");
    engine::SessionConfig cfg;

    cfg.instrument = parseInstrument(root.child("instrument"));
    cfg.feed = parseFeed(root.child("feed"));
    cfg.initial_capital = root.child("capital").get<double>("initial_capital");
    cfg.risk = parseRisk(root.child("risk"));
    cfg.strategy = parseStrategy(root.child("strategy"));
    cfg.session = parseSession(root.child("session"));
    cfg.limits = parseLimits(root.child("limits"));

    if (root.has("logging")) {
        const Section logging = root.child("logging");
        cfg.logging.log_dir = logging.getOr<std::string>("log_dir", cfg.logging.log_dir);
        cfg.logging.level = logging.getOr<std::string>("level", cfg.logging.level);
        cfg.logging.diagnostics_journal = logging.getOr<std::string>("diagnostics_journal", "");
    }
    if (root.has("report")) {
        cfg.report.output_path = root.child("report").getOr<std::string>("output_path", cfg.report.output_path);
    }

    const auto errors = cfg.validate();
    if (!errors.empty()) {
        std::ostringstream oss;
        for (std::size_t i = 0; i < errors.size(); ++i) {
            if (i > 0) oss << "; ";
            oss << errors[i];
        }
        throw ConfigError("config", oss.str());
    }
    return cfg;
}

engine::SessionConfig Config::loadFile(const std::string& path) {
    std::filesystem::path config_path;
    if (std::filesystem::path(path).is_absolute()) {
        config_path = path;
    } else {
        config_path = utils::PathUtils::resolveRelativePath(path);
    }

    if (!std::filesystem::exists(config_path)) {
        throw ConfigError(config_path.string(), "config file not found");
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        throw ConfigError(config_path.string(), "config file cannot be opened");
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError(config_path.string(), std::string("invalid JSON: ") + e.what());
    }
    return fromJson(j);
}

} // namespace tickpilot
