#pragma once
#include <stdint.h>
#include <map>
#include <string>

struct HttpResponse {
    int status_code = 0;
    std::string body;
    std::map<std::string, std::string> headers;
    bool isSuccess() const { return status_code >= 200 && status_code < 300; }
    // Value of one cookie from the Set-Cookie header, empty when absent.
    std::string cookie(const std::string& name) const;
};

using HttpHeaders = std::map<std::string, std::string>;

class HttpClient {
public:
    virtual ~HttpClient() {}
    // Transport-level failures (DNS, refused, timeout) are reported as status_code <= 0.
    virtual HttpResponse post(const std::string& url, const std::string& body,
                              const HttpHeaders& headers) = 0;
};

std::string urlEncode(const std::string& value);
std::string formEncode(const std::map<std::string, std::string>& fields);
