// Config.hh
#ifndef CONFIG_H
#define CONFIG_H
#pragma once
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <stdexcept>
#include <string>
#include <vector>
#include "InstructionScanner.hh"
#include "Log.hh"
#include "ShredPipeline.hh"

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

struct FeedConfig {
    std::string bind_address = "0.0.0.0";
    uint16_t port = 8001;
    LogLevel log_level = LogLevel::Info;
    uint32_t max_age_ms = 2000;
    size_t max_pending = 1024;
    uint32_t evict_interval_ms = 500;
    uint32_t stats_interval_s = 15;
    std::string program_id; // empty keeps the built-in program id
    std::string replay_file;
    bool show_help = false;

    PipelineOptions pipeline_options() const;
    ScannerConfig scanner_config() const;
};

// Returns the value of an environment variable or nullptr
using EnvLookup = std::function<const char*(const char*)>;

/*
Defaults first, then SHRED_* environment variables, then command line flags.
Throws ConfigError for unknown flags, missing flag values and values that do not parse.
*/
FeedConfig load_config(const std::vector<std::string>& args, const EnvLookup& env);
FeedConfig load_config(int argc, char* argv[]);

void print_usage(std::ostream& out, const std::string& progname);

#endif
