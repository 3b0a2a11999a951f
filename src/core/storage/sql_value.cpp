#include <gelfbridge/core/storage/sql_value.hpp>
#include <sstream>
#include <iomanip>
#include <limits>

namespace GelfBridge {

std::string toText(const SqlValue& v) {
    if (auto s = std::get_if<std::string>(&v)) return *s;
    if (auto i = std::get_if<int64_t>(&v)) return std::to_string(*i);
    if (auto d = std::get_if<double>(&v)) {
        std::ostringstream os;
        os << std::setprecision(std::numeric_limits<double>::max_digits10) << *d;
        return os.str();
    }
    return "NULL";
}

} // namespace GelfBridge
