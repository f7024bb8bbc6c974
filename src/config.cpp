#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace execrelay {

nlohmann::json Config::defaults_json() {
    return {
        {"default_engine", "codex"},
        {"render", {
            {"max_actions", 5},
            {"max_chars", 4000},
            {"command_width", 120}
        }},
        {"engines", {
            {"codex", {{"command", "codex"}, {"extra_args", nlohmann::json::array({"-c", "notify=[]"})}}},
            {"claude", {{"command", "claude"}, {"extra_args", nlohmann::json::array()}}},
            {"opencode", {{"command", "opencode"}, {"extra_args", nlohmann::json::array()}}},
            {"pi", {{"command", "pi"}, {"extra_args", nlohmann::json::array()}}}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

// Positive integer from an env var, or 0 when unset or malformed
static int positive_env(const char* name) {
    const char* v = std::getenv(name);
    if (!v) return 0;
    char* end = nullptr;
    long n = std::strtol(v, &end, 10);
    if (end == v || *end != '\0' || n < 1 || n > 1000000000L) {
        std::cerr << "[config] Ignoring " << name << "=" << v
                  << " (not a positive integer)\n";
        return 0;
    }
    return static_cast<int>(n);
}

std::string Config::default_path() {
    return expand_home("~/.execrelay/config.json");
}

Config Config::load() {
    return load_from(default_path());
}

Config Config::load_from(const std::string& config_path) {
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            if (!original.is_object()) {
                std::cerr << "[config] " << config_path
                          << " is not a JSON object, using defaults\n";
                return from_json(defaults_json());
            }
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                if (atomic_write_file(config_path, j.dump(4) + "\n")) {
                    std::cerr << "[config] Migrated config with new defaults: "
                              << config_path << "\n";
                }
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Malformed " << config_path << ", using defaults: "
                      << e.what() << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << config_path << "\n";
        }
    }

    return from_json(j);
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;

    if (j.contains("default_engine") && j["default_engine"].is_string())
        cfg.default_engine = j["default_engine"].get<std::string>();

    if (j.contains("render") && j["render"].is_object()) {
        auto& r = j["render"];
        if (r.contains("max_actions") && r["max_actions"].is_number_integer())
            cfg.render.max_actions = r["max_actions"].get<int>();
        if (r.contains("max_chars") && r["max_chars"].is_number_integer())
            cfg.render.max_chars = r["max_chars"].get<int>();
        if (r.contains("command_width") && r["command_width"].is_number_integer())
            cfg.render.command_width = r["command_width"].get<int>();
    }

    if (j.contains("engines") && j["engines"].is_object()) {
        for (auto& [name, obj] : j["engines"].items()) {
            if (!obj.is_object()) continue;
            EngineEntry entry;
            if (obj.contains("command") && obj["command"].is_string())
                entry.command = obj["command"].get<std::string>();
            if (obj.contains("extra_args") && obj["extra_args"].is_array()) {
                for (const auto& arg : obj["extra_args"]) {
                    if (arg.is_string()) entry.extra_args.push_back(arg.get<std::string>());
                }
            }
            cfg.engines[name] = std::move(entry);
        }
    }

    // Environment variables always override config file
    if (const char* v = std::getenv("EXECRELAY_ENGINE"); v && *v)
        cfg.default_engine = v;
    if (int n = positive_env("EXECRELAY_MAX_ACTIONS"))
        cfg.render.max_actions = n;
    if (int n = positive_env("EXECRELAY_MAX_CHARS"))
        cfg.render.max_chars = n;

    return cfg;
}

RenderBudget Config::budget() const {
    RenderBudget b;
    b.max_actions = render.max_actions;
    b.max_chars = render.max_chars;
    b.command_width = render.command_width;
    return b;
}

EngineEntry Config::engine_entry(const std::string& id) const {
    auto it = engines.find(id);
    if (it != engines.end()) return it->second;
    return {};
}

} // namespace execrelay
