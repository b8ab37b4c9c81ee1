#include "source/source_options.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cctype>

namespace geosplit {
namespace source {

namespace {

bool parseBool(const nlohmann::json& value, const std::string& key) {
    if (value.is_boolean()) {
        return value.get<bool>();
    }
    if (value.is_number_integer()) {
        return value.get<int>() != 0;
    }
    if (value.is_string()) {
        std::string text = value.get<std::string>();
        std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return std::tolower(c); });
        if (text == "true" || text == "1" || text == "yes") {
            return true;
        }
        if (text == "false" || text == "0" || text == "no") {
            return false;
        }
    }
    throw core::ConfigurationError("Option " + key + " must be a boolean, got " + value.dump());
}

int parseInt(const nlohmann::json& value, const std::string& key) {
    if (value.is_number_integer()) {
        return value.get<int>();
    }
    if (value.is_string()) {
        const std::string text = value.get<std::string>();
        try {
            size_t consumed = 0;
            int result = std::stoi(text, &consumed);
            if (consumed == text.size()) {
                return result;
            }
        } catch (const std::exception&) {
            // Reported below
        }
    }
    throw core::ConfigurationError("Option " + key + " must be an integer, got " + value.dump());
}

std::string parseString(const nlohmann::json& value, const std::string& key) {
    if (!value.is_string()) {
        throw core::ConfigurationError("Option " + key + " must be a string, got " + value.dump());
    }
    return value.get<std::string>();
}

int parsePositiveInt(const nlohmann::json& value, const std::string& key) {
    int result = parseInt(value, key);
    if (result <= 0) {
        throw core::ConfigurationError("Option " + key + " must be positive, got " + value.dump());
    }
    return result;
}

} // namespace

io::CRSSpec SourceOptions::crsSpec() const {
    io::CRSSpec spec;
    spec.epsg = in_epsg;
    spec.definition = in_proj;
    return spec;
}

io::RetryPolicy SourceOptions::retryPolicy() const {
    io::RetryPolicy policy;
    policy.max_retries = max_retries;
    policy.initial_backoff_ms = initial_backoff_ms;
    return policy;
}

SourceOptions parseSourceOptions(const nlohmann::json& options_json) {
    SourceOptions options;

    if (options_json.is_null()) {
        return options;
    }
    if (!options_json.is_object()) {
        throw core::ConfigurationError("Source options must be a JSON object");
    }

    for (const auto& item : options_json.items()) {
        const std::string& key = item.key();
        const nlohmann::json& value = item.value();

        if (key == "skip_reproject") {
            options.skip_reproject = parseBool(value, key);
        } else if (key == "in_epsg") {
            options.in_epsg = parsePositiveInt(value, key);
        } else if (key == "in_proj") {
            options.in_proj = parseString(value, key);
        } else if (key == "out_epsg") {
            options.out_epsg = parsePositiveInt(value, key);
        } else if (key == "band_number") {
            options.band_number = parsePositiveInt(value, key);
        } else if (key == "include_nodata") {
            options.include_nodata = parseBool(value, key);
        } else if (key == "layer_name") {
            options.layer_name = parseString(value, key);
        } else if (key == "gdb_name") {
            options.gdb_name = parseString(value, key);
        } else if (key == "page_size") {
            options.page_size = parsePositiveInt(value, key);
        } else if (key == "max_retries") {
            options.max_retries = parseInt(value, key);
            if (options.max_retries < 0) {
                throw core::ConfigurationError("Option max_retries must not be negative");
            }
        } else if (key == "initial_backoff_ms") {
            options.initial_backoff_ms = parseInt(value, key);
            if (options.initial_backoff_ms < 0) {
                throw core::ConfigurationError("Option initial_backoff_ms must not be negative");
            }
        } else {
            throw core::ConfigurationError("Unknown source option: " + key);
        }
    }

    return options;
}

} // namespace source
} // namespace geosplit
