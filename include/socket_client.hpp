#pragma once
#include <stdint.h>
#include <stddef.h>
#include <string>

// Blocking TCP byte stream used by the local transports.
// Implementations throw ConnectionException on failure.
class SocketClient {
public:
    virtual ~SocketClient() {}
    virtual void open(const std::string& host, uint16_t port, uint32_t timeout_ms) = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;
    virtual void write(const uint8_t* data, size_t len) = 0;
    // Reads exactly len bytes or throws (ERR_TIMEOUT when the deadline passes).
    virtual void readExact(uint8_t* out, size_t len, uint32_t timeout_ms) = 0;
};
