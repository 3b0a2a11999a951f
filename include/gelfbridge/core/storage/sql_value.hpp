#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace GelfBridge {

/**
 * @brief One value bound to a statement placeholder
 */
using SqlValue = std::variant<std::monostate, std::string, int64_t, double>;

// Values bound to the statement, in placeholder order
using SqlParams = std::vector<SqlValue>;

inline bool isNull(const SqlValue& v) {
    return std::holds_alternative<std::monostate>(v);
}

// Text form used for logging and for text-protocol backends; NULL -> "NULL"
std::string toText(const SqlValue& v);

} // namespace GelfBridge
