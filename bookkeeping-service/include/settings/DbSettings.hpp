// include/settings/DbSettings.hpp
#pragma once

#include <string>
#include <cstdlib>
#include <stdexcept>

namespace bookkeeping::settings
{

    /**
     * @brief Настройки подключения леджера к PostgreSQL
     *
     * LEDGER_DATABASE_URL             полная строка подключения libpq
     *                                 (если задана, остальные параметры не используются)
     * LEDGER_DB_HOST / LEDGER_DB_PORT / LEDGER_DB_NAME / LEDGER_DB_USER / LEDGER_DB_PASSWORD
     * LEDGER_DB_CONNECT_TIMEOUT       секунды, 0 = ждать бесконечно
     */
    class DbSettings
    {
    public:
        DbSettings()
        {
            url_ = getEnvOrDefault("LEDGER_DATABASE_URL", "");
            host_ = getEnvOrDefault("LEDGER_DB_HOST", "ledger-postgres");
            port_ = std::stoi(getEnvOrDefault("LEDGER_DB_PORT", "5432"));
            name_ = getEnvOrDefault("LEDGER_DB_NAME", "ledger_db");
            user_ = getEnvOrDefault("LEDGER_DB_USER", "ledger_user");
            password_ = getEnvOrDefault("LEDGER_DB_PASSWORD", "ledger_secret_password");

            connectTimeout_ = std::stoi(getEnvOrDefault("LEDGER_DB_CONNECT_TIMEOUT", "10"));
            if (connectTimeout_ < 0) {
                throw std::invalid_argument("LEDGER_DB_CONNECT_TIMEOUT must be >= 0");
            }
        }

        std::string getHost() const { return host_; }
        int getPort() const { return port_; }
        std::string getName() const { return name_; }
        std::string getUser() const { return user_; }
        int getConnectTimeout() const { return connectTimeout_; }

        /**
         * @brief Строка подключения для pqxx::connection
         */
        std::string getConnectionString() const
        {
            if (!url_.empty()) {
                return url_;
            }
            return "host=" + host_ + " port=" + std::to_string(port_) +
                   " dbname=" + name_ + " user=" + user_ + " password=" + password_ +
                   " connect_timeout=" + std::to_string(connectTimeout_);
        }

        /**
         * @brief То же без пароля, для логов
         */
        std::string describe() const
        {
            if (!url_.empty()) {
                return "LEDGER_DATABASE_URL";
            }
            return user_ + "@" + host_ + ":" + std::to_string(port_) + "/" + name_;
        }

    private:
        std::string url_;
        std::string host_;
        int port_;
        std::string name_;
        std::string user_;
        std::string password_;
        int connectTimeout_ = 10;

        static std::string getEnvOrDefault(const char *name, const char *defaultValue)
        {
            const char *value = std::getenv(name);
            return value ? std::string(value) : std::string(defaultValue);
        }
    };

} // namespace bookkeeping::settings
