#pragma once

#include <gelfbridge/core/config/app_config.hpp>
#include <gelfbridge/core/gelf/log_record.hpp>
#include <gelfbridge/core/storage/sql_value.hpp>

#include <string>
#include <vector>

namespace GelfBridge {

enum class FilterMode : int {
    JSON = 0,      // canonical JSON of the whole record
    RAW = 1,       // payload text exactly as received
    FIELD = 2,     // one named field
    FIELDS = 3     // ordered list of named fields
};

/**
 * @brief Parse a filter mode name
 * @throws ConfigError for unknown names
 */
FilterMode parseFilterMode(const std::string& name);
const char* toString(FilterMode mode);

// Values bound to the destination statement for one record
using FilteredPayload = SqlParams;

/**
 * @class FilterStage
 * @brief Pure LogRecord -> FilteredPayload transform selected by configuration.
 *
 * The mode is fixed at construction; apply() is const and thread-safe.
 */
class FilterStage {
public:
    /**
     * @brief Build from the filter configuration section
     * @throws ConfigError on unknown mode or a field mode without field names
     */
    static FilterStage fromConfig(const AppConfig::FilterConfig& config);

    FilterStage(FilterMode mode, std::vector<std::string> fields);

    FilteredPayload apply(const LogRecord& record) const;

    // Number of values apply() produces, i.e. the placeholders the statement needs
    size_t arity() const;

    FilterMode mode() const { return mode_; }

    // Scalar JSON -> bound value; absent or null -> NULL, booleans -> 0/1
    static SqlValue toSqlValue(const nlohmann::json* value);

private:
    FilterMode mode_;
    std::vector<std::string> fields_;
};

} // namespace GelfBridge
