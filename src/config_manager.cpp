#include "driftwatch/config_manager.hpp"
#include "driftwatch/alert.hpp"
#include "driftwatch/drift_detector.hpp"
#include "driftwatch/errors.hpp"
#include "driftwatch/logger.hpp"
#include <fstream>
#include <set>
#include <sstream>

// Minimal YAML reader for the subset driftwatch configs use: nested maps,
// block lists (of scalars or of maps), inline [a, b] lists, quoted scalars
// and comments.
namespace driftwatch {

bool DriftWatchConfig::validate() const {
    if (monitor.scan_interval <= 0.0 || monitor.batch_size <= 0 || monitor.queue_capacity <= 0) {
        return false;
    }
    if (monitor.worker_threads <= 0 || monitor.max_cpu_percent <= 0.0 || monitor.max_memory_mb <= 0.0) {
        return false;
    }
    if (drift.min_confidence < 0.0 || drift.min_confidence > 1.0) {
        return false;
    }
    return true;
}

ConfigManager::ConfigManager(const std::string& config_path)
    : config_path_(config_path)
    , last_modified_{}
{
}

namespace {

struct YamlNode {
    enum class Kind { Scalar, Map, List };

    Kind kind = Kind::Scalar;
    std::string scalar;
    std::vector<std::pair<std::string, YamlNode>> entries;
    std::vector<YamlNode> items;

    const YamlNode* get(const std::string& key) const {
        for (const auto& [name, node] : entries) {
            if (name == key) {
                return &node;
            }
        }
        return nullptr;
    }
};

struct Line {
    size_t indent;
    std::string text;
    int number;
};

// Helper function to trim whitespace
std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(" \t\n\r");
    return str.substr(first, last - first + 1);
}

std::string unquote(const std::string& value) {
    if (value.size() >= 2 &&
        ((value.front() == '"' && value.back() == '"') || (value.front() == '\'' && value.back() == '\''))) {
        return value.substr(1, value.length() - 2);
    }
    return value;
}

// Drop a trailing "# comment" that is not inside quotes
std::string strip_comment(const std::string& line) {
    char quote = 0;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quote) {
            if (c == quote) quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#' && (i == 0 || line[i - 1] == ' ' || line[i - 1] == '\t')) {
            return line.substr(0, i);
        }
    }
    return line;
}

// Position of the ':' separating key from value, or npos
size_t find_key_separator(const std::string& text) {
    char quote = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (quote) {
            if (c == quote) quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '[') {
            return std::string::npos;
        } else if (c == ':' && (i + 1 == text.size() || text[i + 1] == ' ')) {
            return i;
        }
    }
    return std::string::npos;
}

bool is_list_item(const std::string& text) {
    return text == "-" || text.rfind("- ", 0) == 0;
}

YamlNode parse_inline_list(const std::string& value, int line_number) {
    if (value.back() != ']') {
        throw ConfigError("line " + std::to_string(line_number) + ": unterminated inline list");
    }
    YamlNode node;
    node.kind = YamlNode::Kind::List;
    std::string body = trim(value.substr(1, value.size() - 2));
    if (body.empty()) {
        return node;
    }

    std::string current;
    char quote = 0;
    for (char c : body) {
        if (quote) {
            if (c == quote) quote = 0;
            current += c;
        } else if (c == '"' || c == '\'') {
            quote = c;
            current += c;
        } else if (c == ',') {
            YamlNode item;
            item.scalar = unquote(trim(current));
            node.items.push_back(std::move(item));
            current.clear();
        } else {
            current += c;
        }
    }
    YamlNode item;
    item.scalar = unquote(trim(current));
    node.items.push_back(std::move(item));
    return node;
}

YamlNode parse_value(const std::string& value, int line_number) {
    if (!value.empty() && value.front() == '[') {
        return parse_inline_list(value, line_number);
    }
    YamlNode node;
    node.scalar = unquote(value);
    return node;
}

YamlNode parse_block(std::vector<Line>& lines, size_t& index, size_t indent);

YamlNode parse_list(std::vector<Line>& lines, size_t& index, size_t indent) {
    YamlNode node;
    node.kind = YamlNode::Kind::List;

    while (index < lines.size() && lines[index].indent == indent && is_list_item(lines[index].text)) {
        Line& line = lines[index];
        std::string rest = line.text == "-" ? std::string() : trim(line.text.substr(2));

        if (rest.empty()) {
            ++index;
            if (index < lines.size() && lines[index].indent > indent) {
                node.items.push_back(parse_block(lines, index, lines[index].indent));
            } else {
                node.items.push_back(YamlNode{});
            }
            continue;
        }

        if (find_key_separator(rest) != std::string::npos) {
            // "- key: value" opens a map whose keys align with "key"
            size_t offset = line.text.find(rest);
            line.indent += offset;
            line.text = rest;
            node.items.push_back(parse_block(lines, index, line.indent));
            continue;
        }

        node.items.push_back(parse_value(rest, line.number));
        ++index;
    }
    return node;
}

YamlNode parse_map(std::vector<Line>& lines, size_t& index, size_t indent) {
    YamlNode node;
    node.kind = YamlNode::Kind::Map;

    while (index < lines.size() && lines[index].indent >= indent) {
        const Line& line = lines[index];
        if (line.indent > indent) {
            throw ConfigError("line " + std::to_string(line.number) + ": unexpected indentation");
        }
        if (is_list_item(line.text)) {
            throw ConfigError("line " + std::to_string(line.number) + ": list item where a key was expected");
        }

        size_t colon = find_key_separator(line.text);
        if (colon == std::string::npos) {
            throw ConfigError("line " + std::to_string(line.number) + ": expected 'key: value'");
        }
        std::string key = unquote(trim(line.text.substr(0, colon)));
        std::string value = trim(line.text.substr(colon + 1));
        int number = line.number;
        ++index;

        if (!value.empty()) {
            node.entries.emplace_back(key, parse_value(value, number));
            continue;
        }

        if (index < lines.size() && lines[index].indent > indent) {
            node.entries.emplace_back(key, parse_block(lines, index, lines[index].indent));
        } else if (index < lines.size() && lines[index].indent == indent && is_list_item(lines[index].text)) {
            node.entries.emplace_back(key, parse_list(lines, index, indent));
        } else {
            node.entries.emplace_back(key, YamlNode{});
        }
    }
    return node;
}

YamlNode parse_block(std::vector<Line>& lines, size_t& index, size_t indent) {
    if (is_list_item(lines[index].text)) {
        return parse_list(lines, index, indent);
    }
    return parse_map(lines, index, indent);
}

YamlNode parse_document(std::istream& in) {
    std::vector<Line> lines;
    std::string raw;
    int number = 0;
    while (std::getline(in, raw)) {
        ++number;
        if (raw.find('\t') != std::string::npos && raw.find_first_not_of(" \t") != std::string::npos &&
            raw.find('\t') < raw.find_first_not_of(" \t")) {
            throw ConfigError("line " + std::to_string(number) + ": tabs are not allowed for indentation");
        }
        std::string content = strip_comment(raw);
        std::string text = trim(content);
        if (text.empty() || text == "---") {
            continue;
        }
        lines.push_back({content.find_first_not_of(' '), text, number});
    }

    if (lines.empty()) {
        return YamlNode{YamlNode::Kind::Map, {}, {}, {}};
    }
    size_t index = 0;
    YamlNode root = parse_map(lines, index, lines.front().indent);
    if (index < lines.size()) {
        throw ConfigError("line " + std::to_string(lines[index].number) + ": unexpected indentation");
    }
    return root;
}

// Binding helpers

std::string scalar(const YamlNode& node, const std::string& path) {
    if (node.kind != YamlNode::Kind::Scalar) {
        throw ConfigError(path + ": expected a scalar value");
    }
    return node.scalar;
}

// Helper to parse double value from string
double parse_double(const YamlNode& node, const std::string& path) {
    std::string value = scalar(node, path);
    size_t used = 0;
    double result = 0.0;
    try {
        result = std::stod(value, &used);
    } catch (const std::exception&) {
        throw ConfigError(path + ": expected a number, got '" + value + "'");
    }
    if (used != value.size()) {
        throw ConfigError(path + ": expected a number, got '" + value + "'");
    }
    return result;
}

// Helper to parse int value from string
int parse_int(const YamlNode& node, const std::string& path) {
    std::string value = scalar(node, path);
    size_t used = 0;
    int result = 0;
    try {
        result = std::stoi(value, &used);
    } catch (const std::exception&) {
        throw ConfigError(path + ": expected an integer, got '" + value + "'");
    }
    if (used != value.size()) {
        throw ConfigError(path + ": expected an integer, got '" + value + "'");
    }
    return result;
}

// Helper to parse bool value from string
bool parse_bool(const YamlNode& node, const std::string& path) {
    std::string lower = scalar(node, path);
    for (char& c : lower) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") return true;
    if (lower == "false" || lower == "no" || lower == "off" || lower == "0") return false;
    throw ConfigError(path + ": expected a boolean, got '" + lower + "'");
}

std::vector<std::string> parse_string_list(const YamlNode& node, const std::string& path) {
    std::vector<std::string> values;
    if (node.kind == YamlNode::Kind::Scalar) {
        // "key:" with nothing under it is an empty list
        if (!node.scalar.empty()) {
            values.push_back(node.scalar);
        }
        return values;
    }
    if (node.kind != YamlNode::Kind::List) {
        throw ConfigError(path + ": expected a list");
    }
    for (const auto& item : node.items) {
        values.push_back(scalar(item, path + "[]"));
    }
    return values;
}

void require_map(const YamlNode& node, const std::string& path) {
    if (node.kind != YamlNode::Kind::Map) {
        throw ConfigError(path + ": expected a mapping");
    }
}

void unknown_key(const std::string& path, const std::string& key) {
    Logger::warning("Ignoring unknown config key '", path.empty() ? key : path + "." + key, "'");
}

void bind(const YamlNode& node, MonitorConfig& config) {
    require_map(node, "monitor");
    for (const auto& [key, value] : node.entries) {
        const std::string path = "monitor." + key;
        if (key == "scan_interval") config.scan_interval = parse_double(value, path);
        else if (key == "watch_patterns") config.watch_patterns = parse_string_list(value, path);
        else if (key == "ignore_patterns") config.ignore_patterns = parse_string_list(value, path);
        else if (key == "max_cpu_percent") config.max_cpu_percent = parse_double(value, path);
        else if (key == "max_memory_mb") config.max_memory_mb = parse_double(value, path);
        else if (key == "batch_size") config.batch_size = parse_int(value, path);
        else if (key == "enabled_checks") config.enabled_checks = parse_string_list(value, path);
        else if (key == "queue_capacity") config.queue_capacity = parse_int(value, path);
        else if (key == "overflow_policy") config.overflow_policy = scalar(value, path);
        else if (key == "worker_threads") config.worker_threads = parse_int(value, path);
        else if (key == "watch_filesystem") config.watch_filesystem = parse_bool(value, path);
        else if (key == "poll_interval") config.poll_interval = parse_double(value, path);
        else if (key == "scan_on_start") config.scan_on_start = parse_bool(value, path);
        else if (key == "max_retries") config.max_retries = parse_int(value, path);
        else if (key == "suggest_on_alert") config.suggest_on_alert = parse_bool(value, path);
        else unknown_key("monitor", key);
    }
}

void bind(const YamlNode& node, DriftConfig& config) {
    require_map(node, "drift");
    for (const auto& [key, value] : node.entries) {
        const std::string path = "drift." + key;
        if (key == "min_confidence") {
            config.min_confidence = parse_double(value, path);
        } else if (key == "weights") {
            require_map(value, path);
            WeightsConfig& w = config.weights;
            for (const auto& [name, weight] : value.entries) {
                const std::string weight_path = path + "." + name;
                if (name == "missing_implementation") w.missing_implementation = parse_double(weight, weight_path);
                else if (name == "signature_mismatch") w.signature_mismatch = parse_double(weight, weight_path);
                else if (name == "behavior_deviation") w.behavior_deviation = parse_double(weight, weight_path);
                else if (name == "documentation_stale") w.documentation_stale = parse_double(weight, weight_path);
                else if (name == "dependency_drift") w.dependency_drift = parse_double(weight, weight_path);
                else if (name == "api_breaking_change") w.api_breaking_change = parse_double(weight, weight_path);
                else unknown_key(path, name);
            }
        } else {
            unknown_key("drift", key);
        }
    }
}

ChannelConfig bind_channel(const YamlNode& node, const std::string& path) {
    require_map(node, path);
    ChannelConfig channel;
    for (const auto& [key, value] : node.entries) {
        const std::string field = path + "." + key;
        if (key == "name") channel.name = scalar(value, field);
        else if (key == "kind" || key == "type") channel.kind = scalar(value, field);
        else if (key == "path") channel.path = scalar(value, field);
        else if (key == "url") channel.url = scalar(value, field);
        else if (key == "headers") channel.headers = parse_string_list(value, field);
        else if (key == "recipients") channel.recipients = parse_string_list(value, field);
        else if (key == "sender") channel.sender = scalar(value, field);
        else if (key == "username") channel.username = scalar(value, field);
        else if (key == "password") channel.password = scalar(value, field);
        else if (key == "color_scheme") channel.color_scheme = scalar(value, field);
        else if (key == "timeout_ms") channel.timeout_ms = parse_int(value, field);
        else unknown_key(path, key);
    }
    return channel;
}

AlertRuleConfig bind_rule(const YamlNode& node, const std::string& path) {
    require_map(node, path);
    AlertRuleConfig rule;
    for (const auto& [key, value] : node.entries) {
        const std::string field = path + "." + key;
        if (key == "name") rule.name = scalar(value, field);
        else if (key == "types") rule.types = parse_string_list(value, field);
        else if (key == "min_severity") rule.min_severity = scalar(value, field);
        else if (key == "channels") rule.channels = parse_string_list(value, field);
        else if (key == "suppression_window") rule.suppression_window = parse_int(value, field);
        else unknown_key(path, key);
    }
    return rule;
}

void bind(const YamlNode& node, AlertsConfig& config) {
    require_map(node, "alerts");
    for (const auto& [key, value] : node.entries) {
        const std::string path = "alerts." + key;
        if (key == "db_path") {
            config.db_path = scalar(value, path);
        } else if (key == "default_suppression_window") {
            config.default_suppression_window = parse_int(value, path);
        } else if (key == "channel_timeout_ms") {
            config.channel_timeout_ms = parse_int(value, path);
        } else if (key == "max_per_minute") {
            config.max_per_minute = parse_int(value, path);
        } else if (key == "max_per_hour") {
            config.max_per_hour = parse_int(value, path);
        } else if (key == "channels" || key == "rules") {
            if (value.kind == YamlNode::Kind::Scalar && value.scalar.empty()) {
                continue;
            }
            if (value.kind != YamlNode::Kind::List) {
                throw ConfigError(path + ": expected a list");
            }
            for (size_t i = 0; i < value.items.size(); ++i) {
                std::string item_path = path + "[" + std::to_string(i) + "]";
                if (key == "channels") {
                    config.channels.push_back(bind_channel(value.items[i], item_path));
                } else {
                    config.rules.push_back(bind_rule(value.items[i], item_path));
                }
            }
        } else {
            unknown_key("alerts", key);
        }
    }
}

void bind(const YamlNode& node, SuggestionsConfig& config) {
    require_map(node, "suggestions");
    for (const auto& [key, value] : node.entries) {
        const std::string path = "suggestions." + key;
        if (key == "enricher_timeout_ms") config.enricher_timeout_ms = parse_int(value, path);
        else if (key == "max_suggestions") config.max_suggestions = parse_int(value, path);
        else unknown_key("suggestions", key);
    }
}

void bind(const YamlNode& node, SourcesConfig& config) {
    require_map(node, "sources");
    for (const auto& [key, value] : node.entries) {
        const std::string path = "sources." + key;
        if (key == "spec_catalog") config.spec_catalog = scalar(value, path);
        else if (key == "signature_index") config.signature_index = scalar(value, path);
        else unknown_key("sources", key);
    }
}

void bind(const YamlNode& root, DriftWatchConfig& config) {
    for (const auto& [key, value] : root.entries) {
        if (key == "version") config.version = scalar(value, key);
        else if (key == "project_path") config.project_path = scalar(value, key);
        else if (key == "log_level") config.log_level = scalar(value, key);
        else if (key == "monitor") bind(value, config.monitor);
        else if (key == "drift") bind(value, config.drift);
        else if (key == "alerts") bind(value, config.alerts);
        else if (key == "suggestions") bind(value, config.suggestions);
        else if (key == "sources") bind(value, config.sources);
        else unknown_key("", key);
    }
}

} // namespace

bool ConfigManager::load() {
    std::ifstream file(config_path_);
    if (!file.is_open()) {
        last_error_ = "Failed to open config file: " + config_path_;
        Logger::error(last_error_);
        return false;
    }

    // Store file modification time
    try {
        last_modified_ = std::filesystem::last_write_time(config_path_);
    } catch (const std::exception& e) {
        last_error_ = std::string("Failed to get file modification time: ") + e.what();
        Logger::error(last_error_);
        return false;
    }

    // Bind into a fresh copy so a bad file leaves the previous config intact
    DriftWatchConfig loaded;
    try {
        YamlNode root = parse_document(file);
        bind(root, loaded);
    } catch (const ConfigError& e) {
        last_error_ = config_path_ + ": " + e.what();
        Logger::error(last_error_);
        return false;
    }

    config_ = std::move(loaded);
    last_error_.clear();
    return true;
}

bool ConfigManager::check_and_reload() {
    try {
        auto current_time = std::filesystem::last_write_time(config_path_);
        if (current_time != last_modified_) {
            return load();
        }
    } catch (const std::exception& e) {
        Logger::warning("Error checking file modification: ", e.what());
    }
    return false;
}

bool ConfigManager::validate_config(std::string& error_msg) const {
    const MonitorConfig& monitor = config_.monitor;

    LogLevel level;
    if (!parse_log_level(config_.log_level, level)) {
        error_msg = "Unknown log_level '" + config_.log_level + "'";
        return false;
    }

    if (monitor.scan_interval <= 0.0) {
        error_msg = "monitor.scan_interval must be positive";
        return false;
    }
    if (monitor.batch_size <= 0 || monitor.queue_capacity <= 0 || monitor.worker_threads <= 0) {
        error_msg = "monitor.batch_size, queue_capacity and worker_threads must be positive";
        return false;
    }
    if (monitor.max_cpu_percent <= 0.0 || monitor.max_memory_mb <= 0.0) {
        error_msg = "monitor resource budgets must be positive";
        return false;
    }
    if (monitor.poll_interval <= 0.0 || monitor.max_retries < 0) {
        error_msg = "monitor.poll_interval must be positive and max_retries non-negative";
        return false;
    }
    if (monitor.overflow_policy != "block" && monitor.overflow_policy != "drop_oldest") {
        error_msg = "Unknown monitor.overflow_policy '" + monitor.overflow_policy + "'";
        return false;
    }
    for (const auto& check : monitor.enabled_checks) {
        if (!drift_type_from_string(check)) {
            error_msg = "Unknown check '" + check + "' in monitor.enabled_checks";
            return false;
        }
    }

    const WeightsConfig& w = config_.drift.weights;
    for (double weight : {config_.drift.min_confidence, w.missing_implementation, w.signature_mismatch,
                          w.behavior_deviation, w.documentation_stale, w.dependency_drift,
                          w.api_breaking_change}) {
        if (weight < 0.0 || weight > 1.0) {
            error_msg = "drift.min_confidence and drift.weights must lie in [0, 1]";
            return false;
        }
    }

    const AlertsConfig& alerts = config_.alerts;
    if (alerts.default_suppression_window < 0 || alerts.channel_timeout_ms <= 0 ||
        alerts.max_per_minute < 0 || alerts.max_per_hour < 0) {
        error_msg = "alerts windows, timeouts and rate limits must not be negative";
        return false;
    }

    std::set<std::string> channel_names;
    for (const auto& channel : alerts.channels) {
        if (channel.name.empty()) {
            error_msg = "Every alert channel needs a name";
            return false;
        }
        if (!channel_names.insert(channel.name).second) {
            error_msg = "Duplicate alert channel '" + channel.name + "'";
            return false;
        }
        if (channel.kind == "file" && channel.path.empty()) {
            error_msg = "File channel '" + channel.name + "' needs a path";
            return false;
        }
        if (channel.kind == "webhook" && channel.url.empty()) {
            error_msg = "Webhook channel '" + channel.name + "' needs a url";
            return false;
        }
        if (channel.kind == "email" && channel.recipients.empty()) {
            error_msg = "Email channel '" + channel.name + "' needs recipients";
            return false;
        }
        if (channel.kind != "log" && channel.kind != "file" && channel.kind != "console" &&
            channel.kind != "webhook" && channel.kind != "email") {
            error_msg = "Unknown kind '" + channel.kind + "' for channel '" + channel.name + "'";
            return false;
        }
    }

    for (const auto& rule : alerts.rules) {
        if (!alert_severity_from_string(rule.min_severity)) {
            error_msg = "Rule '" + rule.name + "' has unknown min_severity '" + rule.min_severity + "'";
            return false;
        }
        for (const auto& type : rule.types) {
            if (!alert_type_from_string(type)) {
                error_msg = "Rule '" + rule.name + "' has unknown alert type '" + type + "'";
                return false;
            }
        }
        for (const auto& channel : rule.channels) {
            if (channel_names.count(channel) == 0) {
                error_msg = "Rule '" + rule.name + "' references unknown channel '" + channel + "'";
                return false;
            }
        }
        if (rule.suppression_window < 0) {
            error_msg = "Rule '" + rule.name + "' has a negative suppression_window";
            return false;
        }
    }

    if (config_.suggestions.enricher_timeout_ms <= 0 || config_.suggestions.max_suggestions <= 0) {
        error_msg = "suggestions.enricher_timeout_ms and max_suggestions must be positive";
        return false;
    }

    if (!config_.validate()) {
        error_msg = "Configuration validation failed";
        return false;
    }
    return true;
}

} // namespace driftwatch
