#include <gelfbridge/core/storage/connection_factory.hpp>
#include <gelfbridge/core/storage/postgres_connection.hpp>
#include <gelfbridge/core/storage/sqlite_connection.hpp>
#include <gelfbridge/core/errors.hpp>

namespace GelfBridge {

namespace {

bool startsWith(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

} // anonymous namespace

DatabaseBackend backendForUrl(const std::string& url) {
    if (startsWith(url, "sqlite:")) return DatabaseBackend::SQLITE;
    if (startsWith(url, "postgres://") || startsWith(url, "postgresql://")) return DatabaseBackend::POSTGRES;

    auto scheme = url.substr(0, url.find(':'));
    throw ConfigError("Unsupported database backend '" + scheme + "' in database.url");
}

std::string sqlitePathFromUrl(const std::string& url) {
    std::string path;
    if (startsWith(url, "sqlite://")) {
        path = url.substr(9);
    } else if (startsWith(url, "sqlite:")) {
        path = url.substr(7);
    } else {
        throw ConfigError("Not a sqlite URL: '" + url + "'");
    }

    auto query = path.find('?');
    if (query != std::string::npos) path.resize(query);

    if (path.empty()) {
        throw ConfigError("sqlite URL has no database path: '" + url + "'");
    }
    return path;
}

ConnectionFactory makeConnectionFactory(const AppConfig::DatabaseConfig& config) {
    const auto timeout = std::chrono::milliseconds(config.writeTimeoutMs);

    switch (backendForUrl(config.url)) {
        case DatabaseBackend::SQLITE: {
            std::string path = sqlitePathFromUrl(config.url);
            return [path, timeout]() -> ConnectionPtr {
                return std::make_unique<SqliteConnection>(path, timeout);
            };
        }
        case DatabaseBackend::POSTGRES: {
            std::string url = config.url;
            return [url, timeout]() -> ConnectionPtr {
                return std::make_unique<PostgresConnection>(url, timeout);
            };
        }
    }
    throw ConfigError("Unsupported database.url '" + config.url + "'");
}

} // namespace GelfBridge
