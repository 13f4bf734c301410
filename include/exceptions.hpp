#pragma once

#include <string>
#include <exception>

enum ErrorCode {
    ERR_NONE = 0,
    ERR_AUTH,
    ERR_CONNECTION,
    ERR_TIMEOUT,
    ERR_DECODING,
    ERR_MODBUS_CRC,
    ERR_MODBUS_EXCEPTION,
    ERR_UNSUPPORTED,
    ERR_API,
    ERR_VALIDATION,
    ERR_CONFIG,
    ERR_UNKNOWN
};

const char* errorCodeName(ErrorCode code);

class TransportException : public std::exception {
public:
    TransportException(const std::string& msg, ErrorCode code = ERR_UNKNOWN) : message_(msg), code_(code) {}
    const char* what() const noexcept override { return message_.c_str(); }
    ErrorCode code() const { return code_; }
    virtual ~TransportException() noexcept {}
private:
    std::string message_;
    ErrorCode code_;
};

class AuthException : public TransportException {
public:
    AuthException(const std::string& msg) : TransportException(msg, ERR_AUTH) {}
};

class ConnectionException : public TransportException {
public:
    ConnectionException(const std::string& msg, ErrorCode code = ERR_CONNECTION) : TransportException(msg, code) {}
    bool isTimeout() const { return code() == ERR_TIMEOUT; }
};

class DecodingException : public TransportException {
public:
    DecodingException(const std::string& msg, ErrorCode code = ERR_DECODING) : TransportException(msg, code) {}
};

class UnsupportedException : public TransportException {
public:
    UnsupportedException(const std::string& msg) : TransportException(msg, ERR_UNSUPPORTED) {}
};

class ApiException : public TransportException {
public:
    ApiException(const std::string& msg) : TransportException(msg, ERR_API) {}
};

class ConfigException : public std::exception {
public:
    ConfigException(const std::string& msg, ErrorCode code = ERR_CONFIG) : message_(msg), code_(code) {}
    const char* what() const noexcept override { return message_.c_str(); }
    ErrorCode code() const { return code_; }
    virtual ~ConfigException() noexcept {}
private:
    std::string message_;
    ErrorCode code_;
};

class ValidationException : public ConfigException {
public:
    ValidationException(const std::string& msg) : ConfigException(msg, ERR_VALIDATION) {}
};
