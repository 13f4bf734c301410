#include "../include/cloud_api_client.hpp"
#include "../include/exceptions.hpp"
#include "../include/logger.hpp"
#include <ArduinoJson.h>
#include <algorithm>
#include <cctype>

static const char* const LOGIN_PATH = "/WManage/api/login";
static const char* const RUNTIME_PATH = "/WManage/api/inverter/getInverterRuntime";
static const char* const ENERGY_PATH = "/WManage/api/inverter/getInverterEnergyInfo";
static const char* const PARALLEL_ENERGY_PATH = "/WManage/api/inverter/getInverterEnergyInfoParallel";
static const char* const BATTERY_PATH = "/WManage/api/battery/getBatteryInfo";
static const char* const MIDBOX_PATH = "/WManage/api/midbox/getMidboxRuntime";

static std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return (char)tolower(c); });
    return s;
}

// Copies the scalar members of a JSON object; nested objects and arrays are skipped.
static void copyScalars(JsonObjectConst obj, RawPayload& out) {
    for (JsonPairConst kv : obj) {
        JsonVariantConst v = kv.value();
        if (v.is<bool>()) {
            out.values[kv.key().c_str()] = SensorValue(v.as<bool>() ? 1 : 0);
        } else if (v.is<long>()) {
            out.values[kv.key().c_str()] = SensorValue((long long)v.as<long>());
        } else if (v.is<double>()) {
            out.values[kv.key().c_str()] = SensorValue(v.as<double>());
        } else if (v.is<const char*>()) {
            out.values[kv.key().c_str()] = SensorValue(v.as<const char*>());
        }
    }
}

static void parseBody(const std::string& body, DynamicJsonDocument& doc, const std::string& path) {
    DeserializationError err = deserializeJson(doc, body);
    if (err || !doc.is<JsonObject>()) {
        throw DecodingException(std::string("Unparsable response from ") + path + ": " +
                                (err ? err.c_str() : "not an object"));
    }
}

CloudApiClient::CloudApiClient(const CloudCredentials& credentials, std::shared_ptr<HttpClient> http, Clock clock)
    : credentials_(credentials), http_(http), clock_(clock) {
    base_url_ = credentials.base_url.empty() ? DEFAULT_CLOUD_BASE_URL : credentials.base_url;
    while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
}

std::time_t CloudApiClient::now() const {
    return clock_ ? clock_() : std::time(nullptr);
}

bool CloudApiClient::hasSession() const {
    std::lock_guard<std::mutex> lock(session_mutex_);
    return !session_id_.empty() && now() < session_expires_;
}

void CloudApiClient::connect() {
    std::lock_guard<std::mutex> lock(session_mutex_);
    loginLocked();
}

void CloudApiClient::disconnect() {
    std::lock_guard<std::mutex> lock(session_mutex_);
    session_id_.clear();
    session_expires_ = 0;
}

void CloudApiClient::ensureSession() {
    std::lock_guard<std::mutex> lock(session_mutex_);
    if (session_id_.empty() || now() >= session_expires_) loginLocked();
}

void CloudApiClient::loginLocked() {
    if (!http_) throw ConnectionException("No HTTP client configured");
    if (!credentials_.isSet()) throw AuthException("Cloud credentials are not configured");

    std::map<std::string, std::string> form = {
        {"account", credentials_.username},
        {"password", credentials_.password},
    };
    HttpHeaders headers = {
        {"Content-Type", "application/x-www-form-urlencoded; charset=UTF-8"},
        {"Accept", "application/json"},
    };
    HttpResponse resp = http_->post(base_url_ + LOGIN_PATH, formEncode(form), headers);
    if (resp.status_code <= 0) throw ConnectionException("Login request failed: no response");
    if (resp.status_code == 401) throw AuthException("Authentication failed");
    if (!resp.isSuccess()) throw ConnectionException("Login HTTP " + std::to_string(resp.status_code));

    DynamicJsonDocument doc(resp.body.size() * 2 + 1024);
    DeserializationError err = deserializeJson(doc, resp.body);
    if (!err && doc["success"].is<bool>() && !doc["success"].as<bool>()) {
        const char* msg = doc["message"] | "Login rejected";
        throw AuthException(msg);
    }

    std::string session = resp.cookie("JSESSIONID");
    if (session.empty()) throw AuthException("Login response carried no session cookie");
    session_id_ = session;
    session_expires_ = now() + CLOUD_SESSION_LIFETIME_S;
    Logger::info("[Cloud] Authenticated as %s", credentials_.username.c_str());
}

std::string CloudApiClient::request(const std::string& path, const std::map<std::string, std::string>& form,
                                    bool authenticated) {
    if (!http_) throw ConnectionException("No HTTP client configured");
    HttpHeaders headers = {
        {"Content-Type", "application/x-www-form-urlencoded; charset=UTF-8"},
        {"Accept", "application/json"},
    };
    if (authenticated) {
        ensureSession();
        std::lock_guard<std::mutex> lock(session_mutex_);
        headers["Cookie"] = "JSESSIONID=" + session_id_;
    }

    Logger::debug("[Cloud] POST %s", path.c_str());
    HttpResponse resp = http_->post(base_url_ + path, formEncode(form), headers);
    if (resp.status_code <= 0) {
        throw ConnectionException("Request to " + path + " failed: no response");
    }
    if (resp.status_code == 401) {
        std::lock_guard<std::mutex> lock(session_mutex_);
        session_id_.clear();
        throw AuthException("Authentication failed");
    }
    if (!resp.isSuccess()) {
        throw ConnectionException("HTTP " + std::to_string(resp.status_code) + " from " + path);
    }

    DynamicJsonDocument doc(resp.body.size() * 2 + 1024);
    parseBody(resp.body, doc, path);
    if (doc["success"].is<bool>() && !doc["success"].as<bool>()) {
        std::string msg = doc["message"] | "Unknown API error";
        std::string lower = toLower(msg);
        if (lower.find("login") != std::string::npos || lower.find("auth") != std::string::npos) {
            std::lock_guard<std::mutex> lock(session_mutex_);
            session_id_.clear();
            throw AuthException(msg);
        }
        if (msg.find("DEVICE_ERROR_UNSUPPORT_DEVICE_TYPE") != std::string::npos) {
            throw UnsupportedException(msg);
        }
        throw ApiException(msg);
    }
    return resp.body;
}

static RawPayload readFlat(const std::string& body, PayloadKind kind, const std::string& path) {
    DynamicJsonDocument doc(body.size() * 2 + 1024);
    parseBody(body, doc, path);
    RawPayload payload(kind);
    copyScalars(doc.as<JsonObjectConst>(), payload);
    return payload;
}

RawPayload CloudApiClient::readRuntime(const std::string& serial) {
    return readFlat(request(RUNTIME_PATH, {{"serialNum", serial}}, true), PayloadKind::RUNTIME, RUNTIME_PATH);
}

RawPayload CloudApiClient::readEnergy(const std::string& serial) {
    return readFlat(request(ENERGY_PATH, {{"serialNum", serial}}, true), PayloadKind::ENERGY, ENERGY_PATH);
}

RawPayload CloudApiClient::readParallelEnergy(const std::string& master_serial) {
    return readFlat(request(PARALLEL_ENERGY_PATH, {{"serialNum", master_serial}}, true),
                    PayloadKind::PARALLEL_ENERGY, PARALLEL_ENERGY_PATH);
}

BatteryReading CloudApiClient::readBattery(const std::string& serial) {
    std::string body = request(BATTERY_PATH, {{"serialNum", serial}}, true);
    DynamicJsonDocument doc(body.size() * 2 + 1024);
    parseBody(body, doc, BATTERY_PATH);

    BatteryReading reading;
    copyScalars(doc.as<JsonObjectConst>(), reading.bank);
    for (JsonVariantConst item : doc["batteryArray"].as<JsonArrayConst>()) {
        JsonObjectConst obj = item.as<JsonObjectConst>();
        if (obj.isNull()) continue;
        BatteryPayload module;
        module.battery_key = obj["batteryKey"] | "";
        copyScalars(obj, module.payload);
        reading.modules.push_back(module);
    }
    return reading;
}

RawPayload CloudApiClient::readMidbox(const std::string& serial) {
    std::string body = request(MIDBOX_PATH, {{"serialNum", serial}}, true);
    DynamicJsonDocument doc(body.size() * 2 + 1024);
    parseBody(body, doc, MIDBOX_PATH);

    JsonObjectConst data = doc["midboxData"].as<JsonObjectConst>();
    if (data.isNull()) throw DecodingException("Midbox response without midboxData");
    RawPayload payload(PayloadKind::MIDBOX);
    copyScalars(data, payload);
    if (doc["fwCode"].is<const char*>()) payload.values["fwCode"] = SensorValue(doc["fwCode"].as<const char*>());
    return payload;
}

int CloudApiClient::readDeviceType(const std::string& serial) {
    RawPayload runtime = readRuntime(serial);
    SensorValue v = runtime.get("deviceType");
    if (!v.isNumber()) throw UnsupportedException("Cloud runtime does not report a device type");
    return (int)v.number;
}

std::string CloudApiClient::readFirmwareVersion(const std::string& serial) {
    SensorValue fw = readRuntime(serial).get("fwCode");
    return fw.isText() ? fw.text : "";
}

uint16_t CloudApiClient::readParallelConfig(const std::string& serial) {
    (void)serial;
    throw UnsupportedException("Parallel configuration is read from local registers only");
}
