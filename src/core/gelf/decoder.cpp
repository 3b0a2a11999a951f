#include <gelfbridge/core/gelf/decoder.hpp>
#include <gelfbridge/core/errors.hpp>

namespace GelfBridge {

using Reason = DecodeError::Reason;

const char* DecodeError::toString(Reason reason) {
    switch (reason) {
        case Reason::INVALID_JSON: return "invalid_json";
        case Reason::COMPRESSED: return "compressed";
        case Reason::NOT_AN_OBJECT: return "not_an_object";
        case Reason::MISSING_FIELD: return "missing_field";
        case Reason::INVALID_FIELD: return "invalid_field";
        case Reason::UNSUPPORTED_VERSION: return "unsupported_version";
    }
    return "unknown";
}

namespace {

const nlohmann::json* findField(const nlohmann::json& obj, const char* name) {
    auto it = obj.find(name);
    return it == obj.end() ? nullptr : &(*it);
}

void requireNonNull(const nlohmann::json& obj, const char* name) {
    const auto* v = findField(obj, name);
    if (!v || v->is_null()) {
        throw DecodeError(Reason::MISSING_FIELD, std::string("Missing required field '") + name + "'");
    }
}

} // anonymous namespace

bool MessageDecoder::isCompressed(const std::string& payload) {
    if (payload.size() < 2) return false;
    const auto b0 = static_cast<uint8_t>(payload[0]);
    const auto b1 = static_cast<uint8_t>(payload[1]);

    // gzip
    if (b0 == 0x1f && b1 == 0x8b) return true;

    // zlib: CMF 0x78 with the common FLG values
    if (b0 == 0x78 && (b1 == 0x01 || b1 == 0x5e || b1 == 0x9c || b1 == 0xda)) return true;

    return false;
}

bool MessageDecoder::isSupportedVersion(const std::string& version) {
    return version == "1.1" || version == "1.0";
}

LogRecord MessageDecoder::decode(std::string payload, double receivedEpoch) const {
    if (isCompressed(payload)) {
        throw DecodeError(Reason::COMPRESSED, "Compressed GELF payloads are not supported");
    }

    nlohmann::json obj;
    try {
        obj = nlohmann::json::parse(payload);
    } catch (const nlohmann::json::parse_error& e) {
        throw DecodeError(Reason::INVALID_JSON, std::string("JSON parse error: ") + e.what());
    }

    if (!obj.is_object()) {
        throw DecodeError(Reason::NOT_AN_OBJECT, "GELF payload must be a JSON object");
    }

    requireNonNull(obj, "version");
    const auto& version = obj["version"];
    if (!version.is_string() || !isSupportedVersion(version.get<std::string>())) {
        throw DecodeError(Reason::UNSUPPORTED_VERSION, "Unsupported GELF version " + version.dump());
    }

    requireNonNull(obj, "host");
    requireNonNull(obj, "short_message");

    if (obj.contains("_id")) {
        throw DecodeError(Reason::INVALID_FIELD, "Field '_id' is reserved");
    }

    for (const auto& [name, value] : obj.items()) {
        if (value.is_object() || value.is_array()) {
            throw DecodeError(Reason::INVALID_FIELD, "Field '" + name + "' must be a scalar");
        }
    }

    const auto* level = findField(obj, "level");
    if (level && !level->is_null() && !LogRecord::integralLevel(*level)) {
        throw DecodeError(Reason::INVALID_FIELD, "Field 'level' must be a whole number");
    }

    const auto* ts = findField(obj, "timestamp");
    if (!ts || ts->is_null()) {
        obj["timestamp"] = receivedEpoch;
    } else if (!ts->is_number()) {
        throw DecodeError(Reason::INVALID_FIELD, "Field 'timestamp' must be a number");
    }

    return LogRecord(std::move(obj), std::move(payload));
}

} // namespace GelfBridge
