#include "config.hpp"
#include "constants.hpp"
#include "errors.hpp"
#include <ssh/command.hpp>
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

bool default_config_exists() {
    return fs::exists(get_default_config_path());
}

fs::path get_config_dir() {
    return platform::home_dir() / CONFIG_DIR_NAME;
}

fs::path get_default_config_path() {
    return get_config_dir() / CONFIG_FILE_NAME;
}

std::string expand_home(const std::string& path) {
    if (path.rfind("~/", 0) == 0) {
        return (platform::home_dir() / path.substr(2)).string();
    }
    return path;
}

static HopConfig parse_hop_config(const YAML::Node& node, size_t index) {
    HopConfig hop;
    hop.host = node["host"].as<std::string>("");
    hop.port = node["port"].as<int>(SSH_PORT);
    hop.user = node["user"].as<std::string>("");
    hop.retry = node["retry"].as<int>(0);
    hop.retry_interval = node["retry_interval"].as<int>(DEFAULT_CONNECT_RETRY_INTERVAL_SECS);

    if (node["password"]) {
        hop.password = node["password"].as<std::string>();
    }

    if (node["private_key_file"]) {
        hop.private_key_file = expand_home(node["private_key_file"].as<std::string>());
    }

    if (hop.host.empty()) {
        throw YAML::Exception(node.Mark(), fmt::format("hop #{} has no host", index + 1));
    }

    return hop;
}

static RunDefaults parse_run_defaults(const YAML::Node& node) {
    RunDefaults run;
    if (node["timeout"]) {
        run.timeout = node["timeout"].as<int>();
    }
    run.retry = node["retry"].as<int>(0);
    run.retry_interval = node["retry_interval"].as<int>(DEFAULT_CMD_RETRY_INTERVAL_SECS);

    if (node["success_exit_code"]) {
        auto codes = SuccessCodes::from_yaml(node["success_exit_code"]);
        run.success_exit_code.assign(codes.values().begin(), codes.values().end());
    }

    if (node["sudo_user"]) {
        run.sudo_user = node["sudo_user"].as<std::string>();
    }

    return run;
}

static LogConfig parse_log_config(const YAML::Node& node) {
    LogConfig log;
    log.file = expand_home(node["file"].as<std::string>(""));
    log.level = node["level"].as<std::string>("info");
    return log;
}

Result<Config> Config::parse(const std::string& yaml_text) {
    try {
        YAML::Node root = YAML::Load(yaml_text);
        Config config;

        if (!root["hops"] || !root["hops"].IsSequence() || root["hops"].size() == 0) {
            return Result<Config>::Err("Config must define a non-empty 'hops' list");
        }

        size_t index = 0;
        for (const auto& hop_node : root["hops"]) {
            config.hops_.push_back(parse_hop_config(hop_node, index++));
        }

        // Hops without a user inherit the previous hop's user
        for (size_t i = 1; i < config.hops_.size(); ++i) {
            if (config.hops_[i].user.empty()) {
                config.hops_[i].user = config.hops_[i - 1].user;
            }
        }
        if (config.hops_.front().user.empty()) {
            return Result<Config>::Err("First hop must define a user");
        }

        if (root["run"] && root["run"].IsMap()) {
            config.run_ = parse_run_defaults(root["run"]);
        }

        if (root["log"] && root["log"].IsMap()) {
            config.log_ = parse_log_config(root["log"]);
        }

        return Result<Config>::Ok(config);
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(std::string("Invalid config: ") + e.what());
    } catch (const InvalidArgument& e) {
        return Result<Config>::Err(std::string("Invalid config: ") + e.what());
    }
}

Result<Config> Config::load(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Result<Config>::Err("Cannot read config file: " + path.string());
    }
    std::stringstream buf;
    buf << in.rdbuf();
    return parse(buf.str());
}

Result<Config> Config::load_default() {
    if (!default_config_exists()) {
        return Result<Config>::Err("Config not found at " + get_default_config_path().string());
    }
    return load(get_default_config_path());
}
