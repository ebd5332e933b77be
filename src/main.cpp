#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <core/config.hpp>
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <http/rest_client.hpp>
#include <ssh/session.hpp>
#include "cli/theme.hpp"

void print_usage() {
    std::cout << theme::section("Usage");
    std::cout << theme::usage("jumpline", "run <command...>", "Run a command on the last hop");
    std::cout << theme::usage("jumpline", "http <METHOD> <uri> [data]", "Send an HTTP request from the last hop");
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    --config FILE           Hop chain and defaults (default ~/.jumpline/config.yaml)\n"
              << "    --version               Show version\n"
              << "    --help                  Show this help"
              << theme::color::RESET << "\n\n";
}

static void setup_logging(const LogConfig& log) {
    if (!log.file.empty()) {
        set_log_file(log.file);
    }
    set_log_level(parse_log_level(log.level));
}

// Open every hop in order, each one through the previous one. Returns the
// last hop; the root owns the whole chain.
static Session& open_chain(const Config& config, std::unique_ptr<Session>& root) {
    const auto& hops = config.hops();
    const HopConfig& first = hops.front();

    root = std::make_unique<Session>(first.host, first.user, first.password,
                                     first.private_key_file, first.port);
    root->open(first.retry, std::chrono::seconds(first.retry_interval));

    Session* current = root.get();
    for (size_t i = 1; i < hops.size(); i++) {
        const HopConfig& hop = hops[i];
        current = &current->get_remote_session(hop.host, hop.port, hop.user, hop.password,
                                               hop.private_key_file, hop.retry,
                                               std::chrono::seconds(hop.retry_interval));
    }
    return *current;
}

static int run_command(const Config& config, const std::vector<std::string>& words) {
    std::string command;
    for (const auto& w : words) {
        if (!command.empty()) command += " ";
        command += w;
    }

    const RunDefaults& defaults = config.run();
    CommandRequest request(command);
    request.continuous_output = true;
    request.raise_if_error = false;
    request.retry = defaults.retry;
    request.retry_interval = std::chrono::seconds(defaults.retry_interval);
    request.success_exit_code = std::set<int>(defaults.success_exit_code.begin(),
                                              defaults.success_exit_code.end());
    if (defaults.timeout) {
        request.timeout = std::chrono::seconds(*defaults.timeout);
    }
    request.username = defaults.sudo_user;

    std::unique_ptr<Session> root;
    Session& target = open_chain(config, root);
    CommandResult result = target.run_cmd(request);
    std::cout << std::endl;
    return result.exit_code;
}

static int run_http(const Config& config, const std::string& method, const std::string& uri,
                    const std::string& data) {
    RestOptions options;
    if (!data.empty()) {
        options.data = data;
    }

    std::unique_ptr<Session> root;
    Session& target = open_chain(config, root);
    RestClient client(target);
    HttpResponse response = client.request(method, uri, options);
    std::cout << response.str() << "\n";
    return (response.status_code() >= 200 && response.status_code() < 300) ? 0 : 1;
}

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    std::string config_path;

    if (args.size() >= 2 && args[0] == "--config") {
        config_path = args[1];
        args.erase(args.begin(), args.begin() + 2);
    }

    if (args.empty() || args[0] == "--help") {
        print_usage();
        return args.empty() ? 1 : 0;
    }
    if (args[0] == "--version") {
        std::cout << theme::bold("jumpline") << theme::dim(std::string(" version ") + JUMPLINE_VERSION) << "\n";
        return 0;
    }

    try {
        auto loaded = config_path.empty() ? Config::load_default() : Config::load(config_path);
        if (loaded.is_err()) {
            std::cerr << theme::fail(loaded.error);
            return 1;
        }
        const Config& config = loaded.value;
        setup_logging(config.log());

        std::string cmd = args[0];
        if (cmd == "run") {
            if (args.size() < 2) {
                std::cerr << theme::fail("Missing command.");
                std::cerr << theme::step("Usage: jumpline run <command...>");
                return 1;
            }
            return run_command(config, std::vector<std::string>(args.begin() + 1, args.end()));
        } else if (cmd == "http") {
            if (args.size() < 3) {
                std::cerr << theme::fail("Missing method or uri.");
                std::cerr << theme::step("Usage: jumpline http <METHOD> <uri> [data]");
                return 1;
            }
            return run_http(config, args[1], args[2], args.size() >= 4 ? args[3] : "");
        }

        std::cerr << theme::fail("Unknown command: " + cmd);
        print_usage();
        return 1;
    } catch (const CommandInterrupted& e) {
        std::cerr << "\n" << theme::fail(e.what());
        return 130;
    } catch (const JumplineError& e) {
        log_error(e.what());
        std::cerr << theme::fail(e.what());
        return 1;
    } catch (const std::exception& e) {
        std::cerr << theme::fail(std::string(e.what()));
        return 1;
    }
}
