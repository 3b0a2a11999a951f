#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace GelfBridge {

/**
 * @brief A validated GELF message.
 *
 * Always holds `version`, `host`, `short_message` and `timestamp`; values are
 * strings, numbers, booleans or null. Immutable once built by MessageDecoder.
 */
class LogRecord {
public:
    LogRecord(nlohmann::json object, std::string rawPayload);

    std::string version() const;
    std::string host() const;
    std::string shortMessage() const;
    double timestamp() const;
    std::optional<int64_t> level() const;

    // Whole number within int64 range (6 and 6.0 both qualify), else nullopt
    static std::optional<int64_t> integralLevel(const nlohmann::json& value);

    // nullptr if absent
    const nlohmann::json* field(const std::string& name) const;

    const nlohmann::json& fields() const { return fields_; }

    // Exact text the record was decoded from
    const std::string& rawPayload() const { return raw_; }

    // Compact serialization with keys in lexicographic order
    std::string toCanonicalJson() const;

private:
    std::string scalarAsString(const char* name) const;

    nlohmann::json fields_;
    std::string raw_;
};

} // namespace GelfBridge
