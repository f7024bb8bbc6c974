#include "config.hpp"
#include "engine.hpp"
#include "errors.hpp"
#include "event_stream.hpp"
#include "line_source.hpp"
#include "run_relay.hpp"
#include "subprocess.hpp"
#include <iostream>
#include <fstream>
#include <memory>
#include <string>
#include <cstring>
#include <cstdlib>
#include <atomic>
#include <csignal>
#include <signal.h>
#include <sys/types.h>

static std::atomic<bool> g_cancel{false};
static std::atomic<pid_t> g_child_pid{0};

static void signal_handler(int /*sig*/) {
    g_cancel.store(true);
    pid_t pid = g_child_pid.load();
    if (pid > 0) kill(-pid, SIGTERM);
}

static void install_signal_handlers() {
    struct sigaction sa {};
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;  // no SA_RESTART: a blocked read returns so the run can stop
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
    std::signal(SIGPIPE, SIG_IGN);
}

static void print_usage() {
    std::cout << "Usage: execrelay [options] [FILE]\n"
              << "\n"
              << "Reads an engine's JSONL event stream from FILE (or stdin) and prints\n"
              << "a trace while it runs and a final summary when it ends.\n"
              << "\n"
              << "Options:\n"
              << "  -e, --engine ID      Engine wire format (codex, claude, opencode, pi)\n"
              << "  --max-actions N      Actions shown in progress renders\n"
              << "  --max-chars N        Size limit for progress and final renders\n"
              << "  --progress           Print the progress render after each change\n"
              << "  --run PROMPT         Launch the engine with PROMPT instead of reading JSONL\n"
              << "  --resume TOKEN       Resume token passed to the engine with --run\n"
              << "  --list-engines       List registered engines\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  EXECRELAY_ENGINE       Default engine\n"
              << "  EXECRELAY_MAX_ACTIONS  Default for --max-actions\n"
              << "  EXECRELAY_MAX_CHARS    Default for --max-chars\n";
}

static bool parse_count(const char* text, int& out) {
    char* end = nullptr;
    long n = std::strtol(text, &end, 10);
    if (end == text || *end != '\0' || n < 1 || n > 1000000000L) return false;
    out = static_cast<int>(n);
    return true;
}

int main(int argc, char* argv[]) try {
    // Parse arguments
    std::string engine_id;
    std::string prompt;
    std::string resume_token;
    std::string input_path;
    int max_actions = 0;
    int max_chars = 0;
    bool show_progress = false;
    bool run_engine = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--list-engines") == 0) {
            for (const auto& id : execrelay::EngineRegistry::instance().engine_ids()) {
                std::cout << id << "\n";
            }
            return 0;
        } else if ((std::strcmp(argv[i], "-e") == 0 || std::strcmp(argv[i], "--engine") == 0) && i + 1 < argc) {
            engine_id = argv[++i];
        } else if (std::strcmp(argv[i], "--max-actions") == 0 && i + 1 < argc) {
            if (!parse_count(argv[++i], max_actions)) {
                std::cerr << "Invalid --max-actions: " << argv[i] << "\n";
                return 1;
            }
        } else if (std::strcmp(argv[i], "--max-chars") == 0 && i + 1 < argc) {
            if (!parse_count(argv[++i], max_chars)) {
                std::cerr << "Invalid --max-chars: " << argv[i] << "\n";
                return 1;
            }
        } else if (std::strcmp(argv[i], "--progress") == 0) {
            show_progress = true;
        } else if (std::strcmp(argv[i], "--run") == 0 && i + 1 < argc) {
            prompt = argv[++i];
            run_engine = true;
        } else if (std::strcmp(argv[i], "--resume") == 0 && i + 1 < argc) {
            resume_token = argv[++i];
        } else if (argv[i][0] != '-' && input_path.empty()) {
            input_path = argv[i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    if (run_engine && !input_path.empty()) {
        std::cerr << "--run and FILE are mutually exclusive\n";
        return 1;
    }

    auto config = execrelay::Config::load();

    // Override config with CLI args
    if (!engine_id.empty()) config.default_engine = engine_id;
    if (max_actions > 0) config.render.max_actions = max_actions;
    if (max_chars > 0) config.render.max_chars = max_chars;

    execrelay::EngineDescriptor engine;
    try {
        engine = execrelay::EngineRegistry::instance().resolve(config.default_engine);
        execrelay::validate_budget(config.budget());
    } catch (const execrelay::ConfigError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    // SIGPIPE must be ignored before the prompt is written to the engine.
    install_signal_handlers();

    // Pick the line source
    std::unique_ptr<execrelay::ChildProcess> child;
    std::unique_ptr<execrelay::LineSource> source;
    std::ifstream file;
    if (run_engine) {
        auto entry = config.engine_entry(engine.id);
        std::string program = entry.command.empty() ? engine.command : entry.command;
        auto args = engine.build_args(prompt, resume_token, entry.extra_args);
        child = std::make_unique<execrelay::ChildProcess>(
            program, args, engine.prompt_on_stdin ? prompt : std::string());
        g_child_pid.store(child->pid());
        source = std::make_unique<execrelay::FdLineSource>(child->stdout_fd());
    } else if (!input_path.empty()) {
        file.open(input_path);
        if (!file.is_open()) {
            std::cerr << "Error: cannot open " << input_path << "\n";
            return 1;
        }
        source = std::make_unique<execrelay::IstreamLineSource>(file);
    } else {
        source = std::make_unique<execrelay::IstreamLineSource>(std::cin);
    }

    execrelay::RunCallbacks callbacks;
    callbacks.on_trace = [](const std::vector<std::string>& lines) {
        for (const auto& line : lines) std::cerr << line << "\n";
    };
    if (show_progress) {
        callbacks.on_progress = [](const std::string& progress) {
            std::cerr << "----\n" << progress << "\n----\n";
        };
    }

    execrelay::EventStream stream(*source, engine);
    execrelay::RunRelay relay(stream, config.budget(), callbacks);
    auto status = relay.run(&g_cancel);

    if (child) {
        if (status == execrelay::RunStatus::Cancelled) child->terminate();
        int rc = child->wait();
        g_child_pid.store(0);
        if (rc != 0 && relay.state().terminated_early()) {
            std::cerr << "[run] " << engine.id << " exited with code " << rc << "\n";
        }
    }
    if (stream.dropped_lines() > 0) {
        std::cerr << "[stream] " << engine.id << ": " << stream.dropped_lines()
                  << " of " << stream.lines_read() << " lines dropped\n";
    }

    std::cout << relay.render_final() << "\n";
    const auto& thread_id = relay.state().thread_id();
    if (!thread_id.empty() && engine.format_resume) {
        std::cout << "\n" << engine.format_resume(thread_id) << "\n";
    }

    return status == execrelay::RunStatus::Done ? 0 : 1;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
