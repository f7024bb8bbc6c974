#pragma once
#include "event.hpp"
#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <unordered_map>
#include <mutex>

namespace execrelay {

// Maps one raw protocol line to the canonical events it describes.
// Throws DecodeError for lines the engine cannot interpret at all.
using DecodeFn = std::function<std::vector<Event>(const std::string& line)>;

using ArgsBuilder = std::function<std::vector<std::string>(
    const std::string& prompt, const std::string& resume_token,
    const std::vector<std::string>& extra_args)>;

struct EngineDescriptor {
    std::string id;
    DecodeFn decode;
    std::string command;          // default executable name
    ArgsBuilder build_args;
    bool prompt_on_stdin = false; // prompt piped on stdin rather than passed as argv
    std::function<std::string(const std::string& token)> format_resume;
    std::function<std::optional<std::string>(const std::string& text)> extract_resume;
};

// Central registry of engine descriptors, filled by self-registering
// translation units under engines/. All methods are thread-safe.
class EngineRegistry {
public:
    static EngineRegistry& instance();

    void register_engine(EngineDescriptor descriptor);

    // Returns a copy so the caller holds a stable value for the whole run.
    // Throws ConfigError for an unknown id.
    EngineDescriptor resolve(const std::string& id) const;

    bool has_engine(const std::string& id) const;
    std::vector<std::string> engine_ids() const;

private:
    EngineRegistry() = default;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, EngineDescriptor> engines_;
};

// Used at file scope in each engine .cpp
struct EngineRegistrar {
    explicit EngineRegistrar(EngineDescriptor descriptor) {
        EngineRegistry::instance().register_engine(std::move(descriptor));
    }
};

} // namespace execrelay
