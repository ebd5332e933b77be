#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <ssh/command.hpp>
#include "http_response.hpp"

class Session;

struct RestOptions {
    std::vector<std::pair<std::string, std::string>> params;    // query string
    std::vector<std::pair<std::string, std::string>> headers;
    // Body, first one set wins: local file, remote file, inline data
    std::optional<std::string> local_file;
    std::optional<std::string> remote_file;
    std::optional<std::string> data;
    bool document_info_only = false;                            // curl -I
    std::optional<std::pair<std::string, std::string>> auth;    // basic auth
    bool verify = true;                                         // TLS certificate check
    Silence silent = Silence::off();
};

// HTTP client for services only reachable from a remote host: each request
// runs curl on the session's host and decodes its output.
class RestClient {
public:
    explicit RestClient(Session& session) : session_(session) {}

    // Throws RestError when curl fails, the response cannot be decoded or a
    // body file is missing.
    HttpResponse request(const std::string& method, const std::string& uri,
                         const RestOptions& options = {});

    HttpResponse get(const std::string& uri, const RestOptions& options = {});
    HttpResponse head(const std::string& uri, const RestOptions& options = {});
    HttpResponse options(const std::string& uri, const RestOptions& options = {});
    HttpResponse post(const std::string& uri, const RestOptions& options = {});
    HttpResponse put(const std::string& uri, const RestOptions& options = {});
    HttpResponse patch(const std::string& uri, const RestOptions& options = {});
    HttpResponse del(const std::string& uri, const RestOptions& options = {});

    // The curl command line for a request. A local file is referenced by
    // its base name, where request() stages it.
    static std::string curl_command(const std::string& method, const std::string& uri,
                                    const RestOptions& options);

private:
    Session& session_;
};
