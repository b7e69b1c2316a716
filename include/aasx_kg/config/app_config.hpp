#pragma once

#include <aasx_kg/core/terminal.hpp>

#include <optional>
#include <string>

namespace aasx_kg {

struct StoreConfig {
    std::string uri = "http://localhost:7474";
    std::string database = "neo4j";
    std::string user = "neo4j";
    std::string password;
    std::optional<std::string> password_env; // env var name to read password from
    int connect_timeout_seconds = 10;
    int read_timeout_seconds = 60;
    int ready_timeout_seconds = 60;
    int initial_backoff_ms = 500;
    int max_backoff_ms = 5000;
};

struct EtlConfig {
    std::string output_directory = "output";
    int max_workers = 4;
    std::string file_pattern = ".aasx"; // matched against the file extension
    bool recursive = false;
};

struct AppConfig {
    StoreConfig store;
    EtlConfig etl;
    std::optional<std::string> log_file;
    bool log_json = false;
    bool json_output = false;
    int verbosity = 0; // -v = 1, -vv = 2
    bool quiet = false;
    ColorChoice color = ColorChoice::Auto;
};

} // namespace aasx_kg
