#ifndef UTILS_HPP
#define UTILS_HPP

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "../config/AppConfig.hpp"
#include "../models/CacheOptions.hpp"

class Utils {
public:
    // Converts a string to a LogLevel enum
    static LogUtils::LogLevel stringToLogLevel(const std::string& level) {
        if (level == "DEBUG") return LogUtils::LogLevel::DEBUG;
        if (level == "INFO") return LogUtils::LogLevel::INFO;
        if (level == "WARNING" || level == "WARN") return LogUtils::LogLevel::WARN;
        if (level == "CERROR" || level == "ERROR") return LogUtils::LogLevel::CERROR;
        throw std::invalid_argument("Invalid log level: " + level);
    }

    // Helper to parse integer safely
    static std::optional<int> stringToInt(const std::string& str) {
        try {
            size_t pos;
            int val = std::stoi(str, &pos);
            if (pos == str.length()) {
                return val;
            }
        } catch (const std::invalid_argument&) {
            // Not an integer
        } catch (const std::out_of_range&) {
            // Integer out of range
        }
        return std::nullopt;
    }

    static std::optional<std::size_t> stringToSize(const std::string& str) {
        if (str.empty() || str[0] == '-') {
            return std::nullopt;
        }
        try {
            size_t pos;
            unsigned long long val = std::stoull(str, &pos);
            if (pos == str.length()) {
                return static_cast<std::size_t>(val);
            }
        } catch (const std::invalid_argument&) {
        } catch (const std::out_of_range&) {
        }
        return std::nullopt;
    }

    static std::optional<double> stringToDouble(const std::string& str) {
        try {
            size_t pos;
            double val = std::stod(str, &pos);
            if (pos == str.length()) {
                return val;
            }
        } catch (const std::invalid_argument&) {
        } catch (const std::out_of_range&) {
        }
        return std::nullopt;
    }

    // Accepts true/false, 1/0, yes/no, on/off.
    static std::optional<bool> stringToBool(const std::string& str) {
        std::string lowered = toLower(str);
        if (lowered == "true" || lowered == "1" || lowered == "yes" || lowered == "on") return true;
        if (lowered == "false" || lowered == "0" || lowered == "no" || lowered == "off") return false;
        return std::nullopt;
    }

    // Helper to trim whitespace from start and end of string
    static std::string trim(const std::string& str) {
        size_t first = str.find_first_not_of(" \t\n\r");
        if (std::string::npos == first) return "";
        size_t last = str.find_last_not_of(" \t\n\r");
        return str.substr(first, (last - first + 1));
    }

    static std::string toLower(std::string str) {
        std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c) { return std::tolower(c); });
        return str;
    }

    static std::string toUpper(std::string str) {
        std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c) { return std::toupper(c); });
        return str;
    }

    // "a, b,,c" -> {"a", "b", "c"}
    static std::vector<std::string> splitCsv(const std::string& str) {
        std::vector<std::string> parts;
        std::stringstream ss(str);
        std::string item;
        while (std::getline(ss, item, ',')) {
            item = trim(item);
            if (!item.empty()) {
                parts.push_back(item);
            }
        }
        return parts;
    }

    // "host:port,host:port"; a missing port means 6379.
    static std::vector<RemoteNode> parseRemoteNodes(const std::string& str) {
        std::vector<RemoteNode> nodes;
        for (const auto& item : splitCsv(str)) {
            RemoteNode node;
            size_t colon = item.rfind(':');
            if (colon == std::string::npos) {
                node.host = item;
            } else {
                node.host = item.substr(0, colon);
                auto port = stringToInt(item.substr(colon + 1));
                if (!port || *port <= 0 || *port > 65535) {
                    throw std::invalid_argument("Invalid port in remote node: " + item);
                }
                node.port = *port;
            }
            if (node.host.empty()) {
                throw std::invalid_argument("Missing host in remote node: " + item);
            }
            nodes.push_back(node);
        }
        if (nodes.empty()) {
            throw std::invalid_argument("remote_nodes must list at least one host:port");
        }
        return nodes;
    }

    // Function to parse key-value pairs from a string (using optional version)
    static std::optional<std::map<std::string, std::string>> parseArguments(const std::vector<std::string>& args) {
        std::map<std::string, std::string> argMap;
        for (const std::string& arg : args) {
            size_t delimiterPos = arg.find('=');
            if (delimiterPos != std::string::npos && delimiterPos > 0) {
                argMap[arg.substr(0, delimiterPos)] = arg.substr(delimiterPos + 1);
            } else {
                std::cerr << "Error: Invalid argument format: '" << arg << "'. Expected non-empty key=value format." << std::endl;
                return std::nullopt;
            }
        }
        return argMap;
    }

    // Every key understood by applyConfigValue, also used to look up TIERCACHE_* variables.
    static const std::vector<std::string>& configKeys() {
        static const std::vector<std::string> keys = {
            "admin_port", "num_io_threads", "admin_worker_threads", "max_response_queue_size",
            "log_level", "metrics_prefix", "statsd_endpoint", "metrics_batch_size", "metrics_send_interval",
            "key_namespace", "default_ttl_seconds", "max_key_length", "read_through",
            "sweep_interval_seconds", "latency_window_size", "backfill_threads",
            "drain_backfill_on_shutdown", "shutdown_drain_timeout_ms",
            "memory_enabled", "memory_max_bytes", "memory_max_items", "eviction_policy",
            "use_remote", "remote_nodes", "remote_cluster_mode", "remote_username", "remote_password",
            "remote_database", "remote_connect_timeout_ms", "remote_command_timeout_ms",
            "remote_io_threads", "remote_max_redirects", "remote_compression", "compression_min_bytes",
            "health_check_interval_ms", "health_failure_threshold", "health_degrade_threshold", "health_success_threshold",
            "reconnect_initial_delay_ms", "reconnect_multiplier", "reconnect_max_delay_ms",
            "reconnect_max_attempts", "warmup_file", "response_cache_ttl_seconds"
        };
        return keys;
    }

    // Returns false for an unknown key. Throws std::invalid_argument for a malformed value.
    static bool applyConfigValue(AppConfig& config, const std::string& key, const std::string& value) {
        auto requireInt = [&key, &value](int min_value) {
            auto parsed = stringToInt(value);
            if (!parsed || *parsed < min_value) {
                throw std::invalid_argument("Invalid integer for " + key + ": " + value);
            }
            return *parsed;
        };
        auto requireSize = [&key, &value]() {
            auto parsed = stringToSize(value);
            if (!parsed || *parsed == 0) {
                throw std::invalid_argument("Invalid size for " + key + ": " + value);
            }
            return *parsed;
        };
        auto requireBool = [&key, &value]() {
            auto parsed = stringToBool(value);
            if (!parsed) {
                throw std::invalid_argument("Invalid boolean for " + key + ": " + value);
            }
            return *parsed;
        };

        if (key == "admin_port") config.admin_port = requireInt(1);
        else if (key == "num_io_threads") config.num_io_threads = static_cast<unsigned int>(requireInt(1));
        else if (key == "admin_worker_threads") config.admin_worker_threads = requireInt(1);
        else if (key == "max_response_queue_size") config.max_response_queue_size = requireSize();
        else if (key == "log_level") config.log_level = stringToLogLevel(value);
        else if (key == "metrics_prefix") config.metrics_prefix = value;
        else if (key == "statsd_endpoint") config.statsd_endpoint = value;
        else if (key == "metrics_batch_size") config.metrics_batch_size = requireInt(1);
        else if (key == "metrics_send_interval") config.metrics_send_interval_in_millis = requireInt(1);
        else if (key == "key_namespace") config.key_namespace = value;
        else if (key == "default_ttl_seconds") config.default_ttl_seconds = requireInt(1);
        else if (key == "max_key_length") config.max_key_length = requireInt(1);
        else if (key == "read_through") config.read_through = requireBool();
        else if (key == "sweep_interval_seconds") config.sweep_interval_seconds = requireInt(1);
        else if (key == "latency_window_size") config.latency_window_size = requireSize();
        else if (key == "backfill_threads") config.backfill_threads = requireInt(1);
        else if (key == "drain_backfill_on_shutdown") config.drain_backfill_on_shutdown = requireBool();
        else if (key == "shutdown_drain_timeout_ms") config.shutdown_drain_timeout_ms = requireInt(0);
        else if (key == "memory_enabled") config.memory_enabled = requireBool();
        else if (key == "memory_max_bytes") config.memory_max_bytes = requireSize();
        else if (key == "memory_max_items") config.memory_max_items = requireSize();
        else if (key == "eviction_policy") {
            std::string policy = toLower(value);
            if (policy != "lru" && policy != "lfu" && policy != "ttl") {
                throw std::invalid_argument("Invalid eviction_policy: " + value);
            }
            config.eviction_policy = policy;
        }
        else if (key == "use_remote") config.use_remote = requireBool();
        else if (key == "remote_nodes") config.remote_nodes = parseRemoteNodes(value);
        else if (key == "remote_cluster_mode") config.remote_cluster_mode = requireBool();
        else if (key == "remote_username") config.remote_username = value;
        else if (key == "remote_password") config.remote_password = value;
        else if (key == "remote_database") config.remote_database = requireInt(0);
        else if (key == "remote_connect_timeout_ms") config.remote_connect_timeout_ms = requireInt(1);
        else if (key == "remote_command_timeout_ms") config.remote_command_timeout_ms = requireInt(1);
        else if (key == "remote_io_threads") config.remote_io_threads = requireInt(1);
        else if (key == "remote_max_redirects") config.remote_max_redirects = requireInt(0);
        else if (key == "remote_compression") config.remote_compression = requireBool();
        else if (key == "compression_min_bytes") config.compression_min_bytes = requireSize();
        else if (key == "health_check_interval_ms") config.health_check_interval_ms = requireInt(1);
        else if (key == "health_failure_threshold") config.health_failure_threshold = requireInt(1);
        else if (key == "health_degrade_threshold") config.health_degrade_threshold = requireInt(1);
        else if (key == "health_success_threshold") config.health_success_threshold = requireInt(1);
        else if (key == "reconnect_initial_delay_ms") config.reconnect_initial_delay_ms = requireInt(1);
        else if (key == "reconnect_multiplier") {
            auto parsed = stringToDouble(value);
            if (!parsed || *parsed < 1.0) {
                throw std::invalid_argument("Invalid reconnect_multiplier: " + value);
            }
            config.reconnect_multiplier = *parsed;
        }
        else if (key == "reconnect_max_delay_ms") config.reconnect_max_delay_ms = requireInt(1);
        else if (key == "reconnect_max_attempts") config.reconnect_max_attempts = requireInt(1);
        else if (key == "warmup_file") config.warmup_file = value;
        else if (key == "response_cache_ttl_seconds") config.response_cache_ttl_seconds = requireInt(1);
        else return false;
        return true;
    }

    // Config file -> TIERCACHE_* environment -> command-line key=value, later sources win.
    static AppConfig loadConfiguration(const std::map<std::string, std::string>& startupArguments,
                                       const std::vector<std::string>& config_paths = defaultConfigPaths()) {
        AppConfig config;

        bool config_found = false;
        for (const auto& config_path : config_paths) {
            std::ifstream configFile(config_path);
            if (!configFile.is_open()) {
                continue;
            }
            std::cout << "Reading configuration from " << config_path << "..." << std::endl;
            config_found = true;
            std::string line;
            int line_number = 0;
            while (std::getline(configFile, line)) {
                ++line_number;
                line = trim(line);
                if (line.empty() || line[0] == '#') {
                    continue;
                }
                size_t delimiterPos = line.find('=');
                if (delimiterPos == std::string::npos || delimiterPos == 0) {
                    std::cerr << "Warning: Ignoring malformed line " << line_number << " in " << config_path << std::endl;
                    continue;
                }
                applyReported(config, trim(line.substr(0, delimiterPos)), trim(line.substr(delimiterPos + 1)), config_path);
            }
            break;
        }
        if (!config_found) {
            std::cerr << "Warning: Configuration file not found in any standard location. Using defaults, environment and command-line arguments." << std::endl;
        }

        for (const auto& key : configKeys()) {
            const char* env_value = std::getenv((std::string(Constants::ENV_PREFIX) + toUpper(key)).c_str());
            if (env_value != nullptr) {
                applyReported(config, key, env_value, "environment");
            }
        }

        for (const auto& pair : startupArguments) {
            applyReported(config, pair.first, pair.second, "command line");
        }

        return config;
    }

    static std::vector<std::string> defaultConfigPaths() {
        return {
            Constants::CONFIG_FILE_NAME,                          // Current directory
            std::string("../") + Constants::CONFIG_FILE_NAME,     // Parent directory
            std::string("/app/") + Constants::CONFIG_FILE_NAME,   // Docker container path
            std::string("../../") + Constants::CONFIG_FILE_NAME   // Development path
        };
    }

    // Glob over the whole text: '*', '?', '[abc]', '[a-z]', '[!x]' / '[^x]', '\' escapes.
    static bool globMatch(const std::string& pattern, const std::string& text) {
        size_t p = 0, t = 0;
        size_t star_p = std::string::npos, star_t = 0;
        while (t < text.size()) {
            if (p < pattern.size()) {
                char pc = pattern[p];
                if (pc == '*') {
                    star_p = p++;
                    star_t = t;
                    continue;
                }
                if (pc == '?') {
                    ++p;
                    ++t;
                    continue;
                }
                if (pc == '[') {
                    size_t next = p;
                    if (matchClass(pattern, next, text[t])) {
                        p = next;
                        ++t;
                        continue;
                    }
                } else {
                    if (pc == '\\' && p + 1 < pattern.size()) {
                        pc = pattern[++p];
                    }
                    if (pc == text[t]) {
                        ++p;
                        ++t;
                        continue;
                    }
                }
            }
            if (star_p == std::string::npos) {
                return false;
            }
            p = star_p + 1;
            t = ++star_t;
        }
        while (p < pattern.size() && pattern[p] == '*') {
            ++p;
        }
        return p == pattern.size();
    }

    // Escapes glob metacharacters so text matches only itself.
    static std::string escapeGlob(const std::string& text) {
        std::string escaped;
        escaped.reserve(text.size());
        for (char c : text) {
            if (c == '*' || c == '?' || c == '[' || c == ']' || c == '\\') {
                escaped.push_back('\\');
            }
            escaped.push_back(c);
        }
        return escaped;
    }

    // "/path?a=1&b=2" -> {"/path", "a=1&b=2"}
    static std::pair<std::string, std::string> splitTarget(const std::string& target) {
        size_t query_pos = target.find('?');
        if (query_pos == std::string::npos) {
            return {target, ""};
        }
        return {target.substr(0, query_pos), target.substr(query_pos + 1)};
    }

    // Malformed escapes are kept verbatim. '+' is a space only in query components.
    static std::string percentDecode(const std::string& str, bool plus_as_space = true) {
        std::string decoded;
        decoded.reserve(str.size());
        for (size_t i = 0; i < str.size(); ++i) {
            char c = str[i];
            if (c == '+' && plus_as_space) {
                decoded.push_back(' ');
            } else if (c == '%' && i + 2 < str.size() && std::isxdigit(static_cast<unsigned char>(str[i + 1])) &&
                       std::isxdigit(static_cast<unsigned char>(str[i + 2]))) {
                decoded.push_back(static_cast<char>(std::stoi(str.substr(i + 1, 2), nullptr, 16)));
                i += 2;
            } else {
                decoded.push_back(c);
            }
        }
        return decoded;
    }

    // Escapes '%', every byte in reserved, control characters and non-ASCII bytes as %XX.
    static std::string percentEncode(const std::string& str, const std::string& reserved) {
        static const char* hex = "0123456789ABCDEF";
        std::string encoded;
        encoded.reserve(str.size());
        for (char c : str) {
            const auto byte = static_cast<unsigned char>(c);
            if (c == '%' || byte < 0x20 || byte >= 0x7F || reserved.find(c) != std::string::npos) {
                encoded.push_back('%');
                encoded.push_back(hex[byte >> 4]);
                encoded.push_back(hex[byte & 0x0F]);
            } else {
                encoded.push_back(c);
            }
        }
        return encoded;
    }

    // Decoded key/value pairs in their original order. "flag" yields {"flag", ""}.
    static std::vector<std::pair<std::string, std::string>> parseQuery(const std::string& query) {
        std::vector<std::pair<std::string, std::string>> params;
        std::stringstream ss(query);
        std::string item;
        while (std::getline(ss, item, '&')) {
            if (item.empty()) {
                continue;
            }
            size_t eq = item.find('=');
            if (eq == std::string::npos) {
                params.emplace_back(percentDecode(item), "");
            } else {
                params.emplace_back(percentDecode(item.substr(0, eq)), percentDecode(item.substr(eq + 1)));
            }
        }
        return params;
    }

    // [{"key": "...", "value": <json>, "type": "...", "ttl": 60, "tags": [...], "dependencies": [...]}]
    // A string value is stored as-is, anything else as its JSON text. Malformed items
    // are skipped and described in errors.
    static std::vector<WarmUpItem> parseWarmUpItems(const nlohmann::json& document, std::vector<std::string>* errors = nullptr) {
        if (!document.is_array()) {
            throw std::invalid_argument("Warm-up document must be a JSON array");
        }
        std::vector<WarmUpItem> items;
        for (std::size_t i = 0; i < document.size(); ++i) {
            const auto& element = document[i];
            try {
                if (!element.is_object() || !element.contains("key") || !element["key"].is_string() || !element.contains("value")) {
                    throw std::invalid_argument("expected an object with 'key' and 'value'");
                }
                WarmUpItem item;
                item.key = element["key"].get<std::string>();
                const auto& value = element["value"];
                if (value.is_string()) {
                    item.value.data = value.get<std::string>();
                    item.value.type = element.value("type", std::string("text/plain"));
                } else {
                    item.value.data = value.dump();
                    item.value.type = element.value("type", std::string("application/json"));
                }
                if (element.contains("ttl") && !element["ttl"].is_null()) {
                    item.ttl_seconds = element["ttl"].get<int>();
                }
                if (element.contains("tags")) {
                    item.tags = element["tags"].get<std::set<std::string>>();
                }
                if (element.contains("dependencies")) {
                    item.dependencies = element["dependencies"].get<std::set<std::string>>();
                }
                items.push_back(std::move(item));
            } catch (const std::exception& e) {
                if (errors) {
                    errors->push_back("item " + std::to_string(i) + ": " + e.what());
                }
            }
        }
        return items;
    }

private:
    static void applyReported(AppConfig& config, const std::string& key, const std::string& value, const std::string& source) {
        try {
            if (!applyConfigValue(config, key, value)) {
                std::cerr << "Warning: Unknown configuration key '" << key << "' from " << source << std::endl;
            }
        } catch (const std::invalid_argument& e) {
            std::cerr << "Warning: " << e.what() << " (from " << source << ")" << std::endl;
        }
    }

    // On entry pattern[pos] == '['. On a match pos is moved past the closing ']'.
    static bool matchClass(const std::string& pattern, size_t& pos, char c) {
        size_t p = pos + 1;
        bool negate = false;
        if (p < pattern.size() && (pattern[p] == '!' || pattern[p] == '^')) {
            negate = true;
            ++p;
        }
        bool matched = false;
        bool first = true;
        while (p < pattern.size() && (pattern[p] != ']' || first)) {
            first = false;
            char low = pattern[p];
            if (low == '\\' && p + 1 < pattern.size()) {
                low = pattern[++p];
            }
            char high = low;
            if (p + 2 < pattern.size() && pattern[p + 1] == '-' && pattern[p + 2] != ']') {
                high = pattern[p + 2];
                if (high == '\\' && p + 3 < pattern.size()) {
                    high = pattern[p + 3];
                    ++p;
                }
                p += 2;
                if (low > high) std::swap(low, high);
            }
            if (c >= low && c <= high) {
                matched = true;
            }
            ++p;
        }
        if (p >= pattern.size()) {
            // Unterminated class: treat '[' as a literal.
            if (c == '[') {
                ++pos;
                return true;
            }
            return false;
        }
        if (matched != negate) {
            pos = p + 1;
            return true;
        }
        return false;
    }
};

#endif // UTILS_HPP
