/**
 * @file postgres_connection.hpp
 * @brief PostgreSQL connection and query interface
 */

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <libpq-fe.h>

namespace Armory {

struct DbConfig;

/// A bound parameter; std::nullopt binds SQL NULL.
using SqlParam = std::optional<std::string>;
using SqlParams = std::vector<SqlParam>;

/// One result row; std::nullopt marks a NULL column.
using SqlRow = std::vector<std::optional<std::string>>;

/**
 * @brief PostgreSQL connection wrapper
 *
 * Owns one libpq connection. All statements with user data go through
 * PQexecParams in text format.
 */
class PostgresConnection {
public:
    /**
     * @brief Connect using the PG* environment variables (see DbConfig)
     */
    PostgresConnection();

    explicit PostgresConnection(const DbConfig& config);

    /**
     * @brief Connect with explicit connection string
     */
    explicit PostgresConnection(const std::string& conninfo);

    ~PostgresConnection();

    // No copy
    PostgresConnection(const PostgresConnection&) = delete;
    PostgresConnection& operator=(const PostgresConnection&) = delete;

    // Move OK
    PostgresConnection(PostgresConnection&& other) noexcept;
    PostgresConnection& operator=(PostgresConnection&& other) noexcept;

    bool is_connected() const;

    /**
     * @brief Execute a statement without parameters (DDL, BEGIN, multi-statement scripts)
     */
    void execute(const std::string& sql);

    /**
     * @brief Execute a statement with parameters
     * @return Number of rows affected
     */
    long execute(const std::string& sql, const SqlParams& params);

    /**
     * @brief Execute query and return the first column of the first row
     *
     * Returns nullopt when there is no row or the value is NULL.
     */
    std::optional<std::string> query_single(const std::string& sql, const SqlParams& params = {});

    /**
     * @brief Execute query and iterate rows
     */
    void query(const std::string& sql, const SqlParams& params,
               const std::function<void(const SqlRow&)>& callback);

    void begin();
    void commit();
    void rollback();

    /**
     * @brief RAII transaction guard; rolls back unless committed
     */
    class Transaction {
    public:
        explicit Transaction(PostgresConnection& conn);
        ~Transaction();

        void commit();
        void rollback();

    private:
        PostgresConnection& conn_;
        bool committed_ = false;
        bool rolled_back_ = false;
    };

    std::string last_error() const;

private:
    void connect(const std::string& conninfo);
    void disconnect();
    void require_connected() const;
    PGresult* exec_params(const std::string& sql, const SqlParams& params);
    void check_result(PGresult* result);

    PGconn* conn_ = nullptr;
    std::string last_error_;
};

} // namespace Armory
