#include "rest_client.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <ssh/session.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

static std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::toupper(c); });
    return s;
}

std::string RestClient::curl_command(const std::string& method, const std::string& uri,
                                     const RestOptions& options) {
    // HTTP/1.0 keeps curl away from chunked transfer encoding
    std::string cmd = CURL_BASE_COMMAND;

    if (!options.verify) {
        cmd += "-k ";
    }
    if (options.document_info_only) {
        cmd += "-I ";
    }
    if (options.auth) {
        cmd += fmt::format("-u {}:{} ", options.auth->first, options.auth->second);
    }

    cmd += fmt::format("-X {} ", to_upper(method));

    for (const auto& [key, value] : options.headers) {
        cmd += fmt::format("-H \"{}:{}\" ", key, value);
    }

    cmd += "\"" + uri;
    if (!options.params.empty()) {
        cmd += "?";
        for (size_t i = 0; i < options.params.size(); i++) {
            if (i > 0) cmd += "&";
            cmd += quote_plus(options.params[i].first) + "=" + quote_plus(options.params[i].second);
        }
    }
    cmd += "\" ";

    if (options.local_file) {
        cmd += "-d @" + fs::path(*options.local_file).filename().string() + " ";
    } else if (options.remote_file) {
        cmd += "-d @" + *options.remote_file + " ";
    } else if (options.data) {
        cmd += "-d " + shell_single_quote(*options.data) + " ";
    }

    trim_right(cmd);
    return cmd;
}

static std::string read_local_file(const std::string& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw RestError(fmt::format("Invalid file path given '{}'", path));
    }
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw RestError(fmt::format("Cannot read local file '{}'", path));
    }
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

HttpResponse RestClient::request(const std::string& method, const std::string& uri,
                                 const RestOptions& options) {
    std::string verb = to_upper(method);
    std::string staged;

    if (options.local_file) {
        std::string content = read_local_file(*options.local_file);
        staged = fs::path(*options.local_file).filename().string();
        FileOptions upload;
        upload.silent = true;
        session_.write_file(staged, content, upload);
    } else if (options.remote_file) {
        if (!session_.exists(*options.remote_file)) {
            throw RestError(fmt::format("Invalid remote file path given '{}' on host '{}'",
                                        *options.remote_file, session_.host()));
        }
    }

    // Best effort: a failed cleanup is logged and never replaces the
    // response or the error of the call itself
    auto remove_staged = [&] {
        if (staged.empty()) return;
        if (!session_.is_active()) {
            log_warning(fmt::format("Connection to '{}' lost, staged file '{}' left in place",
                                    session_.host(), staged));
            return;
        }
        CommandRequest cleanup("rm -f " + shell_single_quote(staged));
        cleanup.silent = Silence::on();
        cleanup.raise_if_error = false;
        try {
            session_.run_cmd(cleanup);
        } catch (const JumplineError& e) {
            log_warning(fmt::format("Unable to remove staged file '{}' on '{}': {}",
                                    staged, session_.host(), e.what()));
        }
    };

    CommandRequest request(curl_command(verb, uri, options));
    // Some calls succeed with a non-zero curl exit code
    request.raise_if_error = false;
    request.silent = options.silent;

    CommandResult result;
    try {
        result = session_.run_cmd(request);
    } catch (...) {
        try {
            remove_staged();
        } catch (const CommandInterrupted&) {
            log_warning(fmt::format("Removal of staged file '{}' interrupted", staged));
        }
        throw;
    }
    remove_staged();

    // curl reports CURLE_PARTIAL_FILE for HEAD when the advertised length
    // does not match the (absent) body
    bool ok = result.exit_code == 0 ||
              (result.exit_code == CURL_EXIT_PARTIAL_FILE && verb == "HEAD");
    if (!ok) {
        throw RestError(fmt::format("Remote command ({}) returned exit status ({}): {}",
                                    options.silent.conceal(result.command), result.exit_code,
                                    result.output));
    }

    return HttpResponse(result.output);
}

HttpResponse RestClient::get(const std::string& uri, const RestOptions& options) {
    return request("GET", uri, options);
}

HttpResponse RestClient::head(const std::string& uri, const RestOptions& options) {
    return request("HEAD", uri, options);
}

HttpResponse RestClient::options(const std::string& uri, const RestOptions& options) {
    return request("OPTIONS", uri, options);
}

HttpResponse RestClient::post(const std::string& uri, const RestOptions& options) {
    return request("POST", uri, options);
}

HttpResponse RestClient::put(const std::string& uri, const RestOptions& options) {
    return request("PUT", uri, options);
}

HttpResponse RestClient::patch(const std::string& uri, const RestOptions& options) {
    return request("PATCH", uri, options);
}

HttpResponse RestClient::del(const std::string& uri, const RestOptions& options) {
    return request("DELETE", uri, options);
}
