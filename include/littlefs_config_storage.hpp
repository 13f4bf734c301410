#pragma once
#include "config_storage.hpp"

// ConfigStorage on the ESP32 LittleFS partition.
class LittleFsConfigStorage : public ConfigStorage {
public:
    // Mounts the partition, formatting it if the mount fails
    bool begin();
    bool read(const std::string& path, std::string& out) override;
    bool write(const std::string& path, const std::string& data) override;

private:
    bool mounted_ = false;
};
