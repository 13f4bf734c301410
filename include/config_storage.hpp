#pragma once
#include <string>

// Backing store for the JSON configuration document.
class ConfigStorage {
public:
    virtual ~ConfigStorage() {}
    virtual bool read(const std::string& path, std::string& out) = 0;
    virtual bool write(const std::string& path, const std::string& data) = 0;
};
