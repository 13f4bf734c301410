#include "../include/littlefs_config_storage.hpp"
#include "../include/logger.hpp"
#include <Arduino.h>
#include <FS.h>
#include <LittleFS.h>

bool LittleFsConfigStorage::begin() {
    if (!LittleFS.begin(true)) {
        Logger::error("[Storage] LittleFS mount failed");
        return false;
    }
    mounted_ = true;
    return true;
}

bool LittleFsConfigStorage::read(const std::string& path, std::string& out) {
    if (!mounted_) return false;
    File f = LittleFS.open(path.c_str(), "r");
    if (!f) return false;
    out.clear();
    out.reserve(f.size());
    while (f.available()) {
        char buf[128];
        size_t n = f.readBytes(buf, sizeof(buf));
        if (n == 0) break;
        out.append(buf, n);
    }
    f.close();
    return true;
}

bool LittleFsConfigStorage::write(const std::string& path, const std::string& data) {
    if (!mounted_) return false;
    size_t slash = path.rfind('/');
    if (slash != std::string::npos && slash > 0) {
        std::string dir = path.substr(0, slash);
        if (!LittleFS.exists(dir.c_str())) LittleFS.mkdir(dir.c_str());
    }
    File f = LittleFS.open(path.c_str(), "w");
    if (!f) {
        Logger::error("[Storage] Cannot open %s for writing", path.c_str());
        return false;
    }
    size_t written = f.write((const uint8_t*)data.data(), data.size());
    f.close();
    if (written != data.size()) {
        Logger::error("[Storage] Short write to %s (%u of %u bytes)", path.c_str(),
                      (unsigned)written, (unsigned)data.size());
        return false;
    }
    return true;
}
