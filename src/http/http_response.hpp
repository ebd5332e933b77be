#pragma once

#include <map>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

// HTTP response recovered as text from `curl -i` output on a remote host.
//
// The header block is cleaned of terminal escape sequences a pseudo-terminal
// may have injected; the body is taken as everything after the blank line,
// whatever Content-Length says. Throws RestError when the status line is
// malformed or the body is not UTF-8.
class HttpResponse {
public:
    explicit HttpResponse(const std::string& raw);

    int status_code() const { return status_code_; }
    const std::string& reason() const { return reason_; }
    const std::map<std::string, std::string>& headers() const { return headers_; }
    const std::string& text() const { return text_; }

    // Case-insensitive header lookup.
    std::optional<std::string> header(const std::string& name) const;

    // Throws RestError unless the status is 200 or 201.
    void check_for_success() const;

    bool is_valid_json() const;

    // Throws RestError (carrying the body) when the body is not JSON.
    nlohmann::json json() const;

    // "<code> <reason>" then the body, pretty-printed when it is JSON.
    std::string str() const;

private:
    int status_code_ = 0;
    std::string reason_;
    std::map<std::string, std::string> headers_;
    std::string text_;

    // Parses one header block; returns false for an interim 1xx response.
    bool parse_header_block(const std::string& block);
};

// Removes the VT100 escape sequences a remote pty may add (case-insensitive).
std::string strip_ansi(const std::string& text);
