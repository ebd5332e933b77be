#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <core/utils.hpp>

// Identity of a child session under its parent. Host and user compare
// case-insensitively.
struct SessionKey {
    std::string host;
    int port = 22;
    std::string user;

    SessionKey() = default;
    SessionKey(const std::string& h, int p, const std::string& u)
        : host(to_lower(h)), port(p), user(to_lower(u)) {}

    bool operator==(const SessionKey& other) const {
        return port == other.port && host == other.host && user == other.user;
    }
    bool operator!=(const SessionKey& other) const { return !(*this == other); }

    std::string str() const { return user + "@" + host + ":" + std::to_string(port); }
};

struct SessionKeyHash {
    size_t operator()(const SessionKey& key) const {
        size_t h = std::hash<std::string>()(key.host);
        h ^= std::hash<int>()(key.port) + 0x9e3779b9 + (h << 6) + (h >> 2);
        h ^= std::hash<std::string>()(key.user) + 0x9e3779b9 + (h << 6) + (h >> 2);
        return h;
    }
};
