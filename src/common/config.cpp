#include "config.h"

#include <cstdlib>
#include <functional>

#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_split.h>

#include "logging.h"

namespace insightx {

namespace {

/// Environment suffix → config key. Integer keys are parsed before storing.
struct EnvBinding {
    const char* suffix;
    const char* key;
    bool is_integer;
};

constexpr EnvBinding kEnvBindings[] = {
    {"DATA_PATH", "data.path", false},
    {"CONTEXT_WINDOW", "session.context_window", true},
    {"SESSION_STORE", "session.store", false},
    {"MAX_SESSIONS", "session.max_sessions", true},
    {"SESSION_TTL_SECONDS", "session.idle_ttl_seconds", true},
    {"RATE_LIMIT_PER_MIN", "rate_limit.requests_per_minute", true},
    {"TOP_K", "analysis.top_k", true},
    {"QUERY_TIMEOUT_MS", "analysis.query_timeout_ms", true},
    {"CONFIDENCE_THRESHOLD", "extraction.confidence_threshold", false},
    {"LLM_ENDPOINT", "llm.endpoint", false},
    {"LLM_MODEL", "llm.model", false},
    {"LLM_API_KEY", "llm.api_key", false},
    {"LLM_TIMEOUT_MS", "llm.timeout_ms", true},
    {"LLM_MAX_RETRIES", "llm.max_retries", true},
    {"REDIS_HOST", "redis.host", false},
    {"REDIS_PORT", "redis.port", true},
    {"REDIS_PASSWORD", "redis.password", false},
    {"REDIS_DATABASE", "redis.database", true},
    {"LOG_LEVEL", "logging.level", false},
    {"LOG_FILE", "logging.file", false},
};

}  // namespace

absl::StatusOr<Config> Config::LoadFromFile(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return absl::NotFoundError(
            absl::StrCat("Configuration file not found: ", path.string()));
    }

    try {
        Config config;
        config.root_ = YAML::LoadFile(path.string());
        return config;
    } catch (const YAML::Exception& e) {
        return absl::InvalidArgumentError(
            absl::StrCat("Failed to parse YAML configuration: ", e.what()));
    }
}

absl::StatusOr<Config> Config::LoadFromString(std::string_view yaml_content) {
    try {
        Config config;
        config.root_ = YAML::Load(std::string(yaml_content));
        return config;
    } catch (const YAML::Exception& e) {
        return absl::InvalidArgumentError(
            absl::StrCat("Failed to parse YAML content: ", e.what()));
    }
}

Config Config::LoadFromEnvironment(std::string_view prefix) {
    Config config;

    for (const auto& binding : kEnvBindings) {
        const std::string name = absl::StrCat(prefix, binding.suffix);
        const char* value = std::getenv(name.c_str());
        if (value == nullptr) {
            continue;
        }

        if (binding.is_integer) {
            int64_t parsed = 0;
            if (!absl::SimpleAtoi(value, &parsed)) {
                INSIGHTX_LOG_WARN("Ignoring {}: '{}' is not an integer", name, value);
                continue;
            }
            config.Set(binding.key, parsed);
        } else {
            config.Set(binding.key, std::string(value));
        }
    }

    // The conventional variable is honoured when no prefixed key is set
    if (!config.HasKey("llm.api_key")) {
        if (const char* api_key = std::getenv("OPENAI_API_KEY")) {
            config.Set("llm.api_key", std::string(api_key));
        }
    }

    return config;
}

void Config::Merge(const Config& other) {
    std::function<void(YAML::Node&, const YAML::Node&)> merge_nodes;
    merge_nodes = [&merge_nodes](YAML::Node& base, const YAML::Node& overlay) {
        if (overlay.IsMap()) {
            for (const auto& kv : overlay) {
                const std::string key = kv.first.as<std::string>();
                if (base[key] && base[key].IsMap() && kv.second.IsMap()) {
                    YAML::Node base_child = base[key];
                    merge_nodes(base_child, kv.second);
                } else {
                    base[key] = kv.second;
                }
            }
        }
    };

    merge_nodes(root_, other.root_);
}

std::optional<YAML::Node> Config::GetNestedNode(std::string_view key) const {
    std::vector<std::string> parts = absl::StrSplit(key, '.');
    // Node::operator= assigns through the handle; reset() rebinds it instead
    YAML::Node current;
    current.reset(root_);

    for (const auto& part : parts) {
        if (!current || !current.IsMap()) {
            return std::nullopt;
        }
        const YAML::Node& view = current;
        YAML::Node child = view[part];
        current.reset(child);
    }

    if (!current || current.IsNull()) {
        return std::nullopt;
    }

    return current;
}

std::string Config::GetString(std::string_view key, std::string_view default_value) const {
    auto node = GetNestedNode(key);
    if (node && node->IsScalar()) {
        return node->as<std::string>();
    }
    return std::string(default_value);
}

int64_t Config::GetInt(std::string_view key, int64_t default_value) const {
    auto node = GetNestedNode(key);
    if (node && node->IsScalar()) {
        try {
            return node->as<int64_t>();
        } catch (const YAML::Exception&) {
            INSIGHTX_LOG_WARN("Config key {} is not an integer, using {}", key, default_value);
        }
    }
    return default_value;
}

double Config::GetDouble(std::string_view key, double default_value) const {
    auto node = GetNestedNode(key);
    if (node && node->IsScalar()) {
        try {
            return node->as<double>();
        } catch (const YAML::Exception&) {
            INSIGHTX_LOG_WARN("Config key {} is not a number, using {}", key, default_value);
        }
    }
    return default_value;
}

bool Config::GetBool(std::string_view key, bool default_value) const {
    auto node = GetNestedNode(key);
    if (node && node->IsScalar()) {
        try {
            return node->as<bool>();
        } catch (const YAML::Exception&) {
            INSIGHTX_LOG_WARN("Config key {} is not a boolean, using {}", key, default_value);
        }
    }
    return default_value;
}

std::vector<std::string> Config::GetStringList(std::string_view key) const {
    std::vector<std::string> result;
    auto node = GetNestedNode(key);
    if (node && node->IsSequence()) {
        for (const auto& item : *node) {
            if (item.IsScalar()) {
                result.push_back(item.as<std::string>());
            }
        }
    }
    return result;
}

bool Config::HasKey(std::string_view key) const {
    return GetNestedNode(key).has_value();
}

void Config::Set(std::string_view key, ConfigValue value) {
    std::vector<std::string> parts = absl::StrSplit(key, '.');

    // yaml-cpp nodes are handles; reassigning `current` walks down the tree
    YAML::Node current = root_;
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        if (!current[parts[i]] || !current[parts[i]].IsMap()) {
            current[parts[i]] = YAML::Node(YAML::NodeType::Map);
        }
        current.reset(current[parts[i]]);
    }

    std::visit([&](auto&& val) {
        using T = std::decay_t<decltype(val)>;
        if constexpr (std::is_same_v<T, std::vector<std::string>>) {
            YAML::Node seq(YAML::NodeType::Sequence);
            for (const auto& item : val) {
                seq.push_back(item);
            }
            current[parts.back()] = seq;
        } else {
            current[parts.back()] = val;
        }
    }, value);
}

absl::StatusOr<Config> LoadLayeredConfig(
    const std::optional<std::filesystem::path>& config_path,
    std::string_view env_prefix) {

    Config config;

    if (config_path.has_value()) {
        auto file_config = Config::LoadFromFile(*config_path);
        if (!file_config.ok()) {
            return file_config.status();
        }
        config.Merge(*file_config);
    }

    // Environment has the highest priority
    config.Merge(Config::LoadFromEnvironment(env_prefix));
    return config;
}

}  // namespace insightx
