#pragma once
#include "render_state.hpp"
#include <string>
#include <vector>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace execrelay {

struct EngineEntry {
    std::string command;                 // executable; empty = engine default
    std::vector<std::string> extra_args; // inserted into the engine's argv
};

struct RenderConfig {
    int max_actions = 5;
    int max_chars = 4000;
    int command_width = 120;
};

struct Config {
    std::string default_engine = "codex";
    RenderConfig render;
    std::unordered_map<std::string, EngineEntry> engines;

    // Load from ~/.execrelay/config.json + env vars
    static Config load();

    // Same, from an explicit path. Creates or migrates the file as needed.
    static Config load_from(const std::string& path);

    // Parse an already-loaded JSON document, then apply env overrides
    static Config from_json(const nlohmann::json& j);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    static std::string default_path();

    // Render budget from the render section. Validated by RenderState.
    RenderBudget budget() const;

    // Entry for an engine id (empty entry if absent)
    EngineEntry engine_entry(const std::string& id) const;
};

} // namespace execrelay
