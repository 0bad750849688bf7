#include "creator_config.h"
#include "logger.h"
#include "fs.h"

#include <nlohmann/json.hpp>

#include <limits>

// Config module logging macros
#define LOG_CONFIG_DEBUG(message) LOG_DEBUG("config", message)
#define LOG_CONFIG_INFO(message)  LOG_INFO("config", message)
#define LOG_CONFIG_ERROR(message) LOG_ERROR("config", message)

namespace qtm {

namespace {

bool config_error(TorrentCreateError* error, const std::string& message) {
    LOG_CONFIG_ERROR(message);
    set_error(error, TorrentCreateErrorCode::Config, message);
    return false;
}

template <typename T>
bool read_key(const nlohmann::json& config, const char* key, T& out, TorrentCreateError* error) {
    if (!config.contains(key)) {
        return true;
    }
    try {
        out = config.at(key).get<T>();
        return true;
    } catch (const nlohmann::json::exception& e) {
        return config_error(error, std::string("Invalid value for '") + key + "': " + e.what());
    }
}

bool read_unsigned(const nlohmann::json& config, const char* key, uint32_t max_value,
                   uint32_t& out, TorrentCreateError* error) {
    if (!config.contains(key)) {
        return true;
    }
    const nlohmann::json& value = config.at(key);
    if (!value.is_number_integer()) {
        return config_error(error, std::string("Invalid value for '") + key + "': expected an integer");
    }
    int64_t number = value.get<int64_t>();
    if (number < 0 || number > static_cast<int64_t>(max_value)) {
        return config_error(error, std::string("Value for '") + key + "' out of range: "
                            + std::to_string(number));
    }
    out = static_cast<uint32_t>(number);
    return true;
}

// Leading decimal digits of @p text, stopping early once the value passes @p limit
bool parse_decimal_prefix(const std::string& text, uint64_t limit, uint64_t& value, size_t& consumed) {
    value = 0;
    consumed = 0;
    while (consumed < text.size() && text[consumed] >= '0' && text[consumed] <= '9') {
        value = value * 10 + static_cast<uint64_t>(text[consumed] - '0');
        ++consumed;
        if (value > limit) {
            return false;
        }
    }
    return consumed > 0;
}

bool argument_error(TorrentCreateError* error, const std::string& message) {
    set_error(error, TorrentCreateErrorCode::Config, message);
    return false;
}

} // namespace

bool parse_size_argument(const std::string& text, uint32_t& out, TorrentCreateError* error) {
    uint64_t value = 0;
    size_t consumed = 0;
    if (!parse_decimal_prefix(text, QTM_MAX_PIECE_LENGTH, value, consumed)) {
        if (consumed == 0) {
            return argument_error(error, "Invalid size '" + text + "': expected a number");
        }
        return argument_error(error, "Size '" + text + "' is too large");
    }

    std::string suffix = text.substr(consumed);
    uint64_t multiplier = 1;
    if (suffix == "K" || suffix == "k" || suffix == "KiB") {
        multiplier = 1024;
    } else if (suffix == "M" || suffix == "m" || suffix == "MiB") {
        multiplier = 1024 * 1024;
    } else if (!suffix.empty()) {
        return argument_error(error, "Invalid size '" + text + "': unknown suffix '" + suffix + "'");
    }

    if (value > QTM_MAX_PIECE_LENGTH / multiplier) {
        return argument_error(error, "Size '" + text + "' is too large");
    }
    out = static_cast<uint32_t>(value * multiplier);
    return true;
}

bool parse_thread_argument(const std::string& text, unsigned& out, TorrentCreateError* error) {
    uint64_t value = 0;
    size_t consumed = 0;
    bool in_range = parse_decimal_prefix(text, QTM_MAX_SETTINGS_THREADS, value, consumed);
    if (consumed == 0 || consumed != text.size()) {
        return argument_error(error, "Invalid thread count '" + text + "'");
    }
    if (!in_range) {
        return argument_error(error, "Thread count '" + text + "' is too large");
    }
    out = static_cast<unsigned>(value);
    return true;
}

bool parse_creator_settings(const std::string& json_text, CreatorSettings& out,
                            TorrentCreateError* error) {
    nlohmann::json config;
    try {
        config = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::exception& e) {
        return config_error(error, std::string("Failed to parse settings: ") + e.what());
    }

    if (!config.is_object()) {
        return config_error(error, "Settings must be a JSON object");
    }

    CreatorSettings settings;

    if (config.contains("announce")) {
        const nlohmann::json& announce = config.at("announce");
        if (announce.is_string()) {
            settings.announce = announce.get<std::string>();
        } else if (announce.is_array()) {
            std::vector<std::string> urls;
            if (!read_key(config, "announce", urls, error)) {
                return false;
            }
            settings.announce = std::move(urls);
        } else {
            return config_error(error, "Invalid value for 'announce': expected a string or an array of strings");
        }
    }

    std::string comment;
    std::string created_by;
    uint32_t threads = 0;
    if (!read_key(config, "private", settings.is_private, error) ||
        !read_key(config, "comment", comment, error) ||
        !read_key(config, "created_by", created_by, error) ||
        !read_unsigned(config, "piece_size", QTM_MAX_PIECE_LENGTH, settings.piece_size, error) ||
        !read_unsigned(config, "threads", QTM_MAX_SETTINGS_THREADS, threads, error) ||
        !read_key(config, "include_hidden", settings.include_hidden, error) ||
        !read_key(config, "web_seeds", settings.web_seeds, error) ||
        !read_key(config, "log_level", settings.log_level, error)) {
        return false;
    }
    settings.threads = threads;

    if (config.contains("comment")) {
        settings.comment = comment;
    }
    if (config.contains("created_by")) {
        settings.created_by = created_by;
    }

    LogLevel level;
    if (!parse_log_level(settings.log_level, level)) {
        return config_error(error, "Unknown log level '" + settings.log_level + "'");
    }

    out = std::move(settings);
    return true;
}

bool load_creator_settings(const std::string& path, CreatorSettings& out,
                           TorrentCreateError* error) {
    LOG_CONFIG_DEBUG("Loading settings from " << path);

    std::vector<uint8_t> data;
    if (!is_file(path) || !read_file_bytes(path, data)) {
        LOG_CONFIG_ERROR("Cannot read settings file " << path);
        set_error(error, TorrentCreateErrorCode::IoError, "Cannot read settings file: " + path, path);
        return false;
    }

    if (!parse_creator_settings(std::string(data.begin(), data.end()), out, error)) {
        if (error) error->path = path;
        return false;
    }

    LOG_CONFIG_INFO("Loaded settings from " << path);
    return true;
}

std::string creator_settings_to_json(const CreatorSettings& settings) {
    nlohmann::json config;

    if (const auto* single = std::get_if<std::string>(&settings.announce)) {
        config["announce"] = *single;
    } else {
        config["announce"] = std::get<std::vector<std::string>>(settings.announce);
    }
    config["private"] = settings.is_private;
    if (settings.comment) {
        config["comment"] = *settings.comment;
    }
    if (settings.created_by) {
        config["created_by"] = *settings.created_by;
    }
    config["piece_size"] = settings.piece_size;
    config["threads"] = settings.threads;
    config["include_hidden"] = settings.include_hidden;
    config["web_seeds"] = settings.web_seeds;
    config["log_level"] = settings.log_level;

    return config.dump(4); // Pretty print with 4 spaces
}

bool save_creator_settings(const std::string& path, const CreatorSettings& settings,
                           TorrentCreateError* error) {
    std::string config_data = creator_settings_to_json(settings);
    if (!create_file(path, config_data)) {
        LOG_CONFIG_ERROR("Failed to save settings file " << path);
        set_error(error, TorrentCreateErrorCode::IoError, "Failed to save settings file: " + path, path);
        return false;
    }

    LOG_CONFIG_DEBUG("Settings saved to " << path);
    return true;
}

TorrentCreatorConfig to_creator_config(const CreatorSettings& settings) {
    TorrentCreatorConfig config;
    config.announce = settings.announce;
    config.is_private = settings.is_private;
    config.piece_size = settings.piece_size;
    config.num_threads = settings.threads;
    config.include_hidden_files = settings.include_hidden;
    config.web_seeds = settings.web_seeds;

    if (settings.created_by) {
        config.created_by = *settings.created_by;
        config.comment = default_comment(config.created_by);
    }
    if (settings.comment) {
        config.comment = *settings.comment;
    }
    return config;
}

} // namespace qtm
