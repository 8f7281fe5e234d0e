#include "essay_anonymizer/runlog/run_log_sink.hpp"
#include "essay_anonymizer/common/constants.hpp"
#include "essay_anonymizer/common/logger.hpp"
#include "essay_anonymizer/core/error_codes.hpp"
#include <libpq-fe.h>
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <memory>
#include <utility>

namespace essay_anonymizer {
namespace runlog {

namespace {

using core::RedactError;
using core::RedactErrorCode;

struct PGConnDeleter {
    void operator()(PGconn* conn) const noexcept {
        if (conn) {
            PQfinish(conn);
        }
    }
};
using PGConnPtr = std::unique_ptr<PGconn, PGConnDeleter>;

struct PGResultDeleter {
    void operator()(PGresult* res) const noexcept {
        if (res) {
            PQclear(res);
        }
    }
};
using PGResultPtr = std::unique_ptr<PGresult, PGResultDeleter>;

std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

std::string lookupTrimmed(const EnvLookup& lookup, const std::string& key) {
    auto value = lookup(key);
    return value ? trim(*value) : "";
}

const std::string& schemaSql() {
    static const std::string sql =
        std::string("CREATE SCHEMA IF NOT EXISTS ") + constants::runlog::SCHEMA + ";\n"
        "CREATE TABLE IF NOT EXISTS " + constants::runlog::SCHEMA + "." + constants::runlog::TABLE + " (\n"
        "    id BIGSERIAL PRIMARY KEY,\n"
        "    created_at TIMESTAMPTZ NOT NULL DEFAULT NOW(),\n"
        "    generated_at TIMESTAMPTZ,\n"
        "    input_path TEXT NOT NULL,\n"
        "    output_path TEXT NOT NULL,\n"
        "    dry_run BOOLEAN NOT NULL,\n"
        "    file_count INTEGER NOT NULL,\n"
        "    total_redactions INTEGER NOT NULL,\n"
        "    by_pattern JSONB NOT NULL,\n"
        "    report_path TEXT NOT NULL,\n"
        "    report_csv_path TEXT\n"
        ");";
    return sql;
}

const std::string& insertSql() {
    static const std::string sql =
        std::string("INSERT INTO ") + constants::runlog::SCHEMA + "." + constants::runlog::TABLE + " (\n"
        "    generated_at, input_path, output_path, dry_run, file_count,\n"
        "    total_redactions, by_pattern, report_path, report_csv_path\n"
        ") VALUES ($1::timestamptz, $2, $3, $4::boolean, $5::integer, $6::integer, $7::jsonb, $8, $9)";
    return sql;
}

[[noreturn]] void fail(const std::string& what, PGconn* conn) {
    std::string detail = conn ? trim(PQerrorMessage(conn)) : "connection allocation failed";
    throw RedactError(RedactErrorCode::RUNLOG_FAILED, what + ": " + detail,
                      common::makeContext("RunLog").with("stage", what));
}

}

DbConfig loadDbConfig(const EnvLookup& lookup) {
    std::string dsn = lookupTrimmed(lookup, "GS_PG_DSN");
    if (!dsn.empty()) {
        return DbConfig{dsn};
    }

    std::string host = lookupTrimmed(lookup, "GS_PG_HOST");
    std::string user = lookupTrimmed(lookup, "GS_PG_USER");
    std::string password = lookup("GS_PG_PASSWORD").value_or("");
    std::string port = lookupTrimmed(lookup, "GS_PG_PORT");
    std::string database = lookupTrimmed(lookup, "GS_PG_DB");
    std::string sslmode = lookupTrimmed(lookup, "GS_PG_SSLMODE");

    if (host.empty() || user.empty() || password.empty()) {
        throw RedactError(RedactErrorCode::RUNLOG_CONFIG_MISSING,
                          "missing GS_PG_HOST, GS_PG_USER, or GS_PG_PASSWORD",
                          common::makeContext("RunLog"));
    }
    if (port.empty()) port = constants::runlog::DEFAULT_PORT;
    if (database.empty()) database = constants::runlog::DEFAULT_DATABASE;
    if (sslmode.empty()) sslmode = constants::runlog::DEFAULT_SSLMODE;

    return DbConfig{"postgres://" + percentEncode(user) + ":" + percentEncode(password) + "@" +
                    host + ":" + port + "/" + percentEncode(database) +
                    "?sslmode=" + percentEncode(sslmode)};
}

DbConfig loadDbConfig() {
    return loadDbConfig([](const std::string& key) -> std::optional<std::string> {
        const char* value = std::getenv(key.c_str());
        if (!value) {
            return std::nullopt;
        }
        return std::string(value);
    });
}

std::string percentEncode(const std::string& value) {
    static const char hex[] = "0123456789ABCDEF";

    std::string out;
    out.reserve(value.size());
    for (unsigned char c : value) {
        bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
                          c == '-' || c == '.' || c == '_' || c == '~';
        if (unreserved) {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0f];
        }
    }
    return out;
}

PgRunLogSink::PgRunLogSink(DbConfig config) : config_(std::move(config)) {}

void PgRunLogSink::record(const redact::RunAggregate& aggregate,
                          const std::string& report_path,
                          const std::optional<std::string>& report_csv_path) {
    const std::string timeout = std::to_string(constants::runlog::CONNECT_TIMEOUT_SECONDS);
    const char* keywords[] = {"dbname", "connect_timeout", nullptr};
    const char* values[] = {config_.dsn.c_str(), timeout.c_str(), nullptr};

    PGConnPtr conn(PQconnectdbParams(keywords, values, 1));
    if (!conn || PQstatus(conn.get()) != CONNECTION_OK) {
        fail("connect", conn.get());
    }

    PGResultPtr schema(PQexec(conn.get(), schemaSql().c_str()));
    if (!schema || PQresultStatus(schema.get()) != PGRES_COMMAND_OK) {
        fail("create schema", conn.get());
    }

    const std::string by_pattern = nlohmann::json(aggregate.by_label).dump();
    const std::string dry_run = aggregate.dry_run ? "true" : "false";
    const std::string file_count = std::to_string(aggregate.file_count);
    const std::string total = std::to_string(aggregate.total_redactions);

    std::optional<std::string> csv_path;
    if (report_csv_path && !trim(*report_csv_path).empty()) {
        csv_path = *report_csv_path;
    }

    const char* params[9] = {
        aggregate.generated_at.c_str(),
        aggregate.input_path.c_str(),
        aggregate.output_path.c_str(),
        dry_run.c_str(),
        file_count.c_str(),
        total.c_str(),
        by_pattern.c_str(),
        report_path.c_str(),
        csv_path ? csv_path->c_str() : nullptr
    };

    PGResultPtr insert(PQexecParams(conn.get(), insertSql().c_str(), 9,
                                    nullptr, params, nullptr, nullptr, 0));
    if (!insert || PQresultStatus(insert.get()) != PGRES_COMMAND_OK) {
        fail("insert run", conn.get());
    }

    common::Logger::instance().info("[RunLog] Run recorded | files={} | total={}",
                                    aggregate.file_count, aggregate.total_redactions);
}

}}
