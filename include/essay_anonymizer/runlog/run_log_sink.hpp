#pragma once

#include "../redact/aggregator.hpp"
#include <functional>
#include <optional>
#include <string>

namespace essay_anonymizer {
namespace runlog {

struct DbConfig {
    std::string dsn;
};

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// GS_PG_DSN wins; otherwise the DSN is assembled from GS_PG_HOST, GS_PG_USER
// and GS_PG_PASSWORD (required) plus GS_PG_PORT, GS_PG_DB and GS_PG_SSLMODE.
// Throws RedactError(RUNLOG_CONFIG_MISSING).
DbConfig loadDbConfig(const EnvLookup& lookup);
DbConfig loadDbConfig();

std::string percentEncode(const std::string& value);

class RunLogSink {
public:
    virtual ~RunLogSink() = default;

    virtual void record(const redact::RunAggregate& aggregate,
                        const std::string& report_path,
                        const std::optional<std::string>& report_csv_path) = 0;
};

class PgRunLogSink : public RunLogSink {
public:
    explicit PgRunLogSink(DbConfig config);

    // Throws RedactError(RUNLOG_FAILED).
    void record(const redact::RunAggregate& aggregate,
                const std::string& report_path,
                const std::optional<std::string>& report_csv_path) override;

private:
    DbConfig config_;
};

}}
