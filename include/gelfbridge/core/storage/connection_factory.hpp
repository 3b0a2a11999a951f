#pragma once

#include <gelfbridge/core/config/app_config.hpp>
#include <gelfbridge/core/storage/connection.hpp>
#include <string>

namespace GelfBridge {

enum class DatabaseBackend { SQLITE, POSTGRES };

/**
 * @brief Select a backend from the URL scheme
 *
 * sqlite://<path>, sqlite:<path>, postgres://..., postgresql://...
 * @throws ConfigError for any other scheme
 */
DatabaseBackend backendForUrl(const std::string& url);

/**
 * @brief File path of a sqlite URL ("sqlite://data/logs.db" -> "data/logs.db")
 * @throws ConfigError if the path is empty
 */
std::string sqlitePathFromUrl(const std::string& url);

// Factory opening connections for config.url with config.writeTimeoutMs applied
ConnectionFactory makeConnectionFactory(const AppConfig::DatabaseConfig& config);

} // namespace GelfBridge
