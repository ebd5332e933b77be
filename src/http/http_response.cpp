#include "http_response.hpp"
#include <core/errors.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <regex>
#include <sstream>

// VT100 escape sequences, see http://ascii-table.com/ansi-escape-sequences-vt-100.php
static const char* ANSI_PATTERN =
    R"re(\x1b()re"
    R"re((\[\??\d+[hl])|)re"
    R"re(([=<>a-kzNM78])|)re"
    R"re(([\(\)][a-b0-2])|)re"
    R"re((\[\d{0,2}[ma-dgkjqi])|)re"
    R"re((\[\d+;\d+[hfy]?)|)re"
    R"re((\[;?[hf])|)re"
    R"re((#[3-68])|)re"
    R"re(([01356]n)|)re"
    R"re((O[mlnp-z]?)|)re"
    R"re((/Z)|)re"
    R"re((\d+)|)re"
    R"re((\[\?\d;\d0c)|)re"
    R"re((\d;\dR)))re";

std::string strip_ansi(const std::string& text) {
    static const std::regex ansi(ANSI_PATTERN, std::regex::ECMAScript | std::regex::icase);
    return std::regex_replace(text, ansi, "");
}

// Split at the first blank line, CRLF or bare LF
static bool split_head(const std::string& text, std::string& head, std::string& rest) {
    size_t crlf = text.find("\r\n\r\n");
    size_t lf = text.find("\n\n");

    size_t pos = std::string::npos;
    size_t sep = 0;
    if (crlf != std::string::npos && (lf == std::string::npos || crlf < lf)) {
        pos = crlf;
        sep = 4;
    } else if (lf != std::string::npos) {
        pos = lf;
        sep = 2;
    }

    if (pos == std::string::npos) {
        head = text;
        rest.clear();
        return false;
    }
    head = text.substr(0, pos);
    rest = text.substr(pos + sep);
    return true;
}

bool HttpResponse::parse_header_block(const std::string& block) {
    static const std::regex status_re(R"(^HTTP/\d+(\.\d+)?\s+(\d{3})(\s+(.*))?$)");

    std::istringstream in(block);
    std::string line;

    // Leading blank lines can precede the status line in pty output
    do {
        if (!std::getline(in, line)) {
            throw RestError("Empty HTTP response");
        }
        trim(line);
    } while (line.empty());

    std::smatch m;
    if (!std::regex_match(line, m, status_re)) {
        throw RestError(fmt::format("Malformed HTTP status line: '{}'", line));
    }
    status_code_ = safe_stoi(m[2].str());
    reason_ = m[4].str();
    trim(reason_);

    headers_.clear();
    std::string last_key;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        // Folded continuation of the previous header
        if ((line[0] == ' ' || line[0] == '\t') && !last_key.empty()) {
            std::string more = line;
            trim(more);
            headers_[last_key] += " " + more;
            continue;
        }

        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;

        std::string key = line.substr(0, colon);
        std::string value = line.substr(colon + 1);
        trim(key);
        trim(value);
        if (key.empty()) continue;
        headers_[key] = value;
        last_key = key;
    }

    return status_code_ != 100;
}

HttpResponse::HttpResponse(const std::string& raw) {
    std::string remaining = replace_all(raw, "\r\r\n", "\r\n");

    std::string head;
    std::string body;
    while (true) {
        split_head(remaining, head, body);
        if (parse_header_block(strip_ansi(head))) {
            break;
        }
        // 100 Continue: the final response follows
        remaining = body;
    }

    if (!is_valid_utf8(body)) {
        throw RestError("HTTP response body is not valid UTF-8");
    }
    trim_right(body);
    text_ = body;
}

std::optional<std::string> HttpResponse::header(const std::string& name) const {
    std::string wanted = to_lower(name);
    for (const auto& [key, value] : headers_) {
        if (to_lower(key) == wanted) {
            return value;
        }
    }
    return std::nullopt;
}

void HttpResponse::check_for_success() const {
    if (status_code_ != 200 && status_code_ != 201) {
        throw RestError("http error received: " + str());
    }
}

bool HttpResponse::is_valid_json() const {
    return nlohmann::json::accept(text_);
}

nlohmann::json HttpResponse::json() const {
    try {
        return nlohmann::json::parse(text_);
    } catch (const nlohmann::json::parse_error&) {
        throw RestError("http response body is not in a valid json format: " + text_);
    }
}

std::string HttpResponse::str() const {
    std::string result = fmt::format("{} {}\n", status_code_, reason_);
    if (is_valid_json()) {
        result += nlohmann::json::parse(text_).dump(4);
    } else {
        result += text_;
    }
    return result;
}
