#pragma once
#include <string>
#include <vector>
#include "device_transport.hpp"
#include "types.hpp"

enum class ScaleOp { IDENTITY, DIV_10, DIV_100, DIV_1000, SMART_PORT_STATUS };

struct FieldRule {
    std::string raw;
    std::string canonical;
    ScaleOp op;
};

// Static per-transport allow-lists turning raw transport fields into
// canonical sensor keys. Fields without a rule are dropped.
class FieldMapper {
public:
    static SensorMap normalize(TransportKind transport, const RawPayload& raw);
    static SensorValue applyScale(ScaleOp op, const SensorValue& raw);
    static const std::vector<FieldRule>& rulesFor(TransportKind transport, PayloadKind kind);
    static std::string smartPortStatusText(int code);
};
