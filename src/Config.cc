#include "Config.hh"
#include "Base58.hh"

#include <cstdlib>
#include <limits>
#include <ostream>

namespace {

uint64_t parse_unsigned(const std::string& name, const std::string& text, uint64_t max_value) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        throw ConfigError("Invalid value for " + name + ": '" + text + "'");
    }
    uint64_t value = 0;
    try {
        value = std::stoull(text);
    } catch (const std::out_of_range&) {
        throw ConfigError("Value for " + name + " is out of range: " + text);
    }
    if (value > max_value) {
        throw ConfigError("Value for " + name + " is out of range: " + text);
    }
    return value;
}

// Applies one setting by its flag name, shared between environment and argv.
void apply(FeedConfig& config, const std::string& name, const std::string& value) {
    if (name == "--bind") {
        if (value.empty()) {
            throw ConfigError("Bind address must not be empty");
        }
        config.bind_address = value;
    } else if (name == "--port") {
        config.port = static_cast<uint16_t>(parse_unsigned(name, value, std::numeric_limits<uint16_t>::max()));
    } else if (name == "--log-level") {
        if (!parse_log_level(value, config.log_level)) {
            throw ConfigError("Unknown log level '" + value + "'");
        }
    } else if (name == "--max-age-ms") {
        config.max_age_ms = static_cast<uint32_t>(parse_unsigned(name, value, std::numeric_limits<uint32_t>::max()));
    } else if (name == "--max-pending") {
        config.max_pending = static_cast<size_t>(parse_unsigned(name, value, std::numeric_limits<uint32_t>::max()));
    } else if (name == "--evict-interval-ms") {
        config.evict_interval_ms = static_cast<uint32_t>(parse_unsigned(name, value, std::numeric_limits<uint32_t>::max()));
        if (config.evict_interval_ms == 0) {
            throw ConfigError("Evict interval must be positive");
        }
    } else if (name == "--stats-interval-s") {
        config.stats_interval_s = static_cast<uint32_t>(parse_unsigned(name, value, 86400));
    } else if (name == "--program-id") {
        Address address;
        if (!parse_address(value, address)) {
            throw ConfigError("Program id is not a base58 32-byte address: '" + value + "'");
        }
        config.program_id = value;
    } else if (name == "--replay") {
        config.replay_file = value;
    } else {
        throw ConfigError("Unknown option " + name);
    }
}

struct EnvBinding {
    const char* variable;
    const char* flag;
};

const EnvBinding kEnvBindings[] = {
    {"SHRED_BIND_ADDRESS", "--bind"},
    {"SHRED_PORT", "--port"},
    {"SHRED_LOG_LEVEL", "--log-level"},
    {"SHRED_MAX_AGE_MS", "--max-age-ms"},
    {"SHRED_MAX_PENDING", "--max-pending"},
    {"SHRED_EVICT_INTERVAL_MS", "--evict-interval-ms"},
    {"SHRED_STATS_INTERVAL_S", "--stats-interval-s"},
    {"SHRED_PROGRAM_ID", "--program-id"},
};

} // namespace

PipelineOptions FeedConfig::pipeline_options() const {
    PipelineOptions options;
    options.max_pending = max_pending;
    options.max_age = std::chrono::milliseconds(max_age_ms);
    return options;
}

ScannerConfig FeedConfig::scanner_config() const {
    ScannerConfig config = ScannerConfig::pump_create();
    if (!program_id.empty()) {
        Address address;
        if (!parse_address(program_id, address)) {
            throw ConfigError("Program id is not a base58 32-byte address: '" + program_id + "'");
        }
        for (auto& rule : config.rules) {
            rule.program_id = address;
        }
    }
    return config;
}

FeedConfig load_config(const std::vector<std::string>& args, const EnvLookup& env) {
    FeedConfig config;

    for (const auto& binding : kEnvBindings) {
        const char* value = env ? env(binding.variable) : nullptr;
        if (value != nullptr && *value != '\0') {
            try {
                apply(config, binding.flag, value);
            } catch (const ConfigError& e) {
                throw ConfigError(std::string(binding.variable) + ": " + e.what());
            }
        }
    }

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "-h" || arg == "--help") {
            config.show_help = true;
            continue;
        }
        std::string name = arg;
        std::string value;
        const size_t eq = arg.find('=');
        if (arg.compare(0, 2, "--") == 0 && eq != std::string::npos) {
            name = arg.substr(0, eq);
            value = arg.substr(eq + 1);
        } else if (i + 1 < args.size()) {
            value = args[++i];
        } else {
            throw ConfigError("Missing value for " + arg);
        }
        apply(config, name, value);
    }
    return config;
}

FeedConfig load_config(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return load_config(args, [](const char* name) -> const char* { return std::getenv(name); });
}

void print_usage(std::ostream& out, const std::string& progname) {
    out << "Usage: " << progname << " [options]\n"
        << "  --bind <address>           UDP bind address (SHRED_BIND_ADDRESS, default 0.0.0.0)\n"
        << "  --port <port>              UDP port (SHRED_PORT, default 8001)\n"
        << "  --log-level <level>        error, warn, info or debug (SHRED_LOG_LEVEL, default info)\n"
        << "  --max-age-ms <ms>          drop unfinished messages older than this (SHRED_MAX_AGE_MS, default 2000)\n"
        << "  --max-pending <n>          cap on pending message ids, 0 for none (SHRED_MAX_PENDING, default 1024)\n"
        << "  --evict-interval-ms <ms>   how often stale messages are dropped (SHRED_EVICT_INTERVAL_MS, default 500)\n"
        << "  --stats-interval-s <s>     stats line period, 0 disables (SHRED_STATS_INTERVAL_S, default 15)\n"
        << "  --program-id <base58>      program whose create instruction is watched (SHRED_PROGRAM_ID)\n"
        << "  --replay <file>            process a capture of length-prefixed datagrams and exit\n"
        << "  -h, --help                 show this message" << std::endl;
}
