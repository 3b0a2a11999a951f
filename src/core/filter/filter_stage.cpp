#include <gelfbridge/core/filter/filter_stage.hpp>
#include <gelfbridge/core/errors.hpp>

#include <limits>

namespace GelfBridge {

FilterMode parseFilterMode(const std::string& name) {
    if (name == "json") return FilterMode::JSON;
    if (name == "raw") return FilterMode::RAW;
    if (name == "field") return FilterMode::FIELD;
    if (name == "fields") return FilterMode::FIELDS;
    throw ConfigError("Unknown filter mode '" + name + "' (expected json, raw, field or fields)");
}

const char* toString(FilterMode mode) {
    switch (mode) {
        case FilterMode::JSON: return "json";
        case FilterMode::RAW: return "raw";
        case FilterMode::FIELD: return "field";
        case FilterMode::FIELDS: return "fields";
    }
    return "unknown";
}

FilterStage FilterStage::fromConfig(const AppConfig::FilterConfig& config) {
    FilterMode mode = parseFilterMode(config.mode);

    switch (mode) {
        case FilterMode::FIELD:
            if (config.field.empty()) {
                throw ConfigError("filter.mode 'field' requires filter.field");
            }
            return FilterStage(mode, {config.field});
        case FilterMode::FIELDS:
            if (config.fields.empty()) {
                throw ConfigError("filter.mode 'fields' requires a non-empty filter.fields list");
            }
            for (const auto& f : config.fields) {
                if (f.empty()) {
                    throw ConfigError("filter.fields contains an empty field name");
                }
            }
            return FilterStage(mode, config.fields);
        default:
            return FilterStage(mode, {});
    }
}

FilterStage::FilterStage(FilterMode mode, std::vector<std::string> fields)
    : mode_(mode), fields_(std::move(fields)) {}

size_t FilterStage::arity() const {
    return mode_ == FilterMode::FIELDS ? fields_.size() : 1;
}

SqlValue FilterStage::toSqlValue(const nlohmann::json* value) {
    if (!value || value->is_null()) return std::monostate{};
    if (value->is_string()) return value->get<std::string>();
    if (value->is_boolean()) return static_cast<int64_t>(value->get<bool>() ? 1 : 0);
    if (value->is_number_unsigned()) {
        auto u = value->get<uint64_t>();
        if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            return static_cast<double>(u);
        }
        return static_cast<int64_t>(u);
    }
    if (value->is_number_integer()) return value->get<int64_t>();
    if (value->is_number_float()) return value->get<double>();

    // Decoder rejects nested values, so this is only reachable for hand-built records
    throw std::runtime_error("Field value is not a scalar: " + value->dump());
}

FilteredPayload FilterStage::apply(const LogRecord& record) const {
    FilteredPayload out;
    out.reserve(arity());

    switch (mode_) {
        case FilterMode::JSON:
            out.emplace_back(record.toCanonicalJson());
            break;
        case FilterMode::RAW:
            out.emplace_back(record.rawPayload());
            break;
        case FilterMode::FIELD:
        case FilterMode::FIELDS:
            for (const auto& name : fields_) {
                out.push_back(toSqlValue(record.field(name)));
            }
            break;
    }
    return out;
}

} // namespace GelfBridge
