#include "../include/http_client.hpp"
#include <cstdio>

std::string HttpResponse::cookie(const std::string& name) const {
    auto it = headers.find("Set-Cookie");
    if (it == headers.end()) it = headers.find("set-cookie");
    if (it == headers.end()) return "";
    const std::string& raw = it->second;
    std::string key = name + "=";
    size_t pos = 0;
    while ((pos = raw.find(key, pos)) != std::string::npos) {
        // Must be at the start of a cookie pair.
        if (pos == 0 || raw[pos - 1] == ' ' || raw[pos - 1] == ';' || raw[pos - 1] == ',') {
            size_t start = pos + key.size();
            size_t end = raw.find_first_of(";,", start);
            return raw.substr(start, end == std::string::npos ? std::string::npos : end - start);
        }
        pos += key.size();
    }
    return "";
}

std::string urlEncode(const std::string& value) {
    std::string out;
    char hex[4];
    for (unsigned char c : value) {
        if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
            c == '-' || c == '_' || c == '.' || c == '~') {
            out += (char)c;
        } else if (c == ' ') {
            out += '+';
        } else {
            snprintf(hex, sizeof(hex), "%%%02X", c);
            out += hex;
        }
    }
    return out;
}

std::string formEncode(const std::map<std::string, std::string>& fields) {
    std::string out;
    for (const auto& kv : fields) {
        if (!out.empty()) out += '&';
        out += urlEncode(kv.first);
        out += '=';
        out += urlEncode(kv.second);
    }
    return out;
}
