#include <gelfbridge/core/gelf/log_record.hpp>

#include <cmath>
#include <limits>

namespace GelfBridge {

LogRecord::LogRecord(nlohmann::json object, std::string rawPayload)
    : fields_(std::move(object)), raw_(std::move(rawPayload)) {}

std::string LogRecord::scalarAsString(const char* name) const {
    const auto* v = field(name);
    if (!v || v->is_null()) return {};
    if (v->is_string()) return v->get<std::string>();
    return v->dump();
}

std::string LogRecord::version() const { return scalarAsString("version"); }
std::string LogRecord::host() const { return scalarAsString("host"); }
std::string LogRecord::shortMessage() const { return scalarAsString("short_message"); }

double LogRecord::timestamp() const {
    const auto* v = field("timestamp");
    return (v && v->is_number()) ? v->get<double>() : 0.0;
}

std::optional<int64_t> LogRecord::level() const {
    const auto* v = field("level");
    if (!v) return std::nullopt;
    return integralLevel(*v);
}

std::optional<int64_t> LogRecord::integralLevel(const nlohmann::json& value) {
    if (value.is_number_unsigned()) {
        auto u = value.get<uint64_t>();
        if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) return std::nullopt;
        return static_cast<int64_t>(u);
    }
    if (value.is_number_integer()) {
        return value.get<int64_t>();
    }
    if (value.is_number_float()) {
        double d = value.get<double>();
        // 2^63 is exact as a double; anything at or past it does not fit
        if (!std::isfinite(d) || std::trunc(d) != d || d < -9223372036854775808.0 || d >= 9223372036854775808.0) {
            return std::nullopt;
        }
        return static_cast<int64_t>(d);
    }
    return std::nullopt;
}

const nlohmann::json* LogRecord::field(const std::string& name) const {
    auto it = fields_.find(name);
    if (it == fields_.end()) return nullptr;
    return &(*it);
}

std::string LogRecord::toCanonicalJson() const {
    // nlohmann::json objects are std::map backed, so dump() is already key-sorted
    return fields_.dump();
}

} // namespace GelfBridge
