#include "tools/database.hpp"

#include <cerrno>
#include <cstdint>
#include <chrono>
#include <cstring>
#include <stdexcept>
#include <string>
#include <utility>

#include <poll.h>

#include <libpq-fe.h>

namespace rx_host::tools {

namespace {

// Built-in type OIDs from pg_type.
constexpr Oid kBoolOid = 16;
constexpr Oid kInt8Oid = 20;
constexpr Oid kInt2Oid = 21;
constexpr Oid kInt4Oid = 23;
constexpr Oid kOidOid = 26;
constexpr Oid kJsonOid = 114;
constexpr Oid kFloat4Oid = 700;
constexpr Oid kFloat8Oid = 701;
constexpr Oid kJsonbOid = 3802;

constexpr std::chrono::milliseconds kPollSlice{100};

std::string trim_message(const char* raw) {
  std::string message = raw != nullptr ? raw : "";
  while (!message.empty() && (message.back() == '\n' || message.back() == ' ' || message.back() == '\r')) {
    message.pop_back();
  }
  return message.empty() ? std::string("unknown error") : message;
}

mcp::ToolError query_failed(const std::string& detail) {
  return mcp::ToolError(mcp::ToolErrorKind::kQuery, "Query failed: " + detail);
}

nlohmann::json convert_cell(const char* text, const Oid type) {
  switch (type) {
    case kBoolOid:
      return text[0] == 't';
    case kInt2Oid:
    case kInt4Oid:
    case kInt8Oid:
    case kOidOid:
      try {
        return static_cast<std::int64_t>(std::stoll(text));
      } catch (const std::logic_error&) {
        return std::string(text);
      }
    case kFloat4Oid:
    case kFloat8Oid: {
      // NaN and Infinity have no JSON number form.
      const std::string value(text);
      if (value == "NaN" || value == "Infinity" || value == "-Infinity") {
        return value;
      }
      try {
        return std::stod(value);
      } catch (const std::logic_error&) {
        return value;
      }
    }
    case kJsonOid:
    case kJsonbOid: {
      auto parsed = nlohmann::json::parse(text, nullptr, false);
      if (parsed.is_discarded()) {
        return std::string(text);
      }
      return parsed;
    }
    default:
      return std::string(text);
  }
}

}  // namespace

void PgDatabase::ConnDeleter::operator()(pg_conn* conn) const {
  if (conn != nullptr) {
    PQfinish(conn);
  }
}

void PgDatabase::ResultDeleter::operator()(pg_result* result) const {
  if (result != nullptr) {
    PQclear(result);
  }
}

PgDatabase::PgDatabase(std::string conninfo) : conninfo_(std::move(conninfo)) {}

PgDatabase::~PgDatabase() = default;

std::string PgDatabase::ping() {
  std::lock_guard<std::mutex> lock(mutex_);
  try {
    ensure_connected();
  } catch (const mcp::ToolError& ex) {
    return ex.what();
  }
  return {};
}

QueryResult PgDatabase::execute(const std::string& sql, const core::CallContext& context) {
  std::lock_guard<std::mutex> lock(mutex_);
  context.check("Query failed");
  ensure_connected();

  ResultPtr result = context.has_deadline() ? execute_bounded(sql, context) : execute_blocking(sql);

  switch (PQresultStatus(result.get())) {
    case PGRES_TUPLES_OK:
    case PGRES_SINGLE_TUPLE:
    case PGRES_COMMAND_OK:
      return collect(result.get());
    case PGRES_EMPTY_QUERY:
      return QueryResult{};
    default:
      throw query_failed(trim_message(PQresultErrorMessage(result.get())));
  }
}

void PgDatabase::ensure_connected() {
  if (conn_ && PQstatus(conn_.get()) == CONNECTION_OK) {
    return;
  }

  if (conn_) {
    PQreset(conn_.get());
  } else {
    conn_.reset(PQconnectdb(conninfo_.c_str()));
  }

  if (!conn_) {
    throw query_failed("unable to allocate connection");
  }
  if (PQstatus(conn_.get()) != CONNECTION_OK) {
    const std::string message = trim_message(PQerrorMessage(conn_.get()));
    conn_.reset();
    throw query_failed(message);
  }
}

PgDatabase::ResultPtr PgDatabase::execute_blocking(const std::string& sql) {
  ResultPtr result(PQexec(conn_.get(), sql.c_str()));
  if (!result) {
    throw query_failed(trim_message(PQerrorMessage(conn_.get())));
  }
  return result;
}

PgDatabase::ResultPtr PgDatabase::execute_bounded(const std::string& sql, const core::CallContext& context) {
  if (PQsendQuery(conn_.get(), sql.c_str()) == 0) {
    throw query_failed(trim_message(PQerrorMessage(conn_.get())));
  }

  ResultPtr kept;
  while (true) {
    while (PQisBusy(conn_.get()) != 0) {
      if (context.expired()) {
        cancel_running_query();
        throw mcp::ToolError(mcp::ToolErrorKind::kCancelled,
                             context.cancelled() ? "Query failed: call cancelled"
                                                 : "Query failed: call deadline exceeded");
      }

      auto wait = kPollSlice;
      if (const auto remaining = context.remaining(); remaining.has_value() && *remaining < wait) {
        wait = *remaining;
      }

      pollfd descriptor{};
      descriptor.fd = PQsocket(conn_.get());
      descriptor.events = POLLIN;
      if (::poll(&descriptor, 1, static_cast<int>(wait.count())) < 0 && errno != EINTR) {
        throw query_failed(std::string("poll: ") + std::strerror(errno));
      }
      if (PQconsumeInput(conn_.get()) == 0) {
        throw query_failed(trim_message(PQerrorMessage(conn_.get())));
      }
    }

    PGresult* next = PQgetResult(conn_.get());
    if (next == nullptr) {
      break;
    }

    // The first failing statement decides the outcome.
    const bool kept_failed = kept && PQresultStatus(kept.get()) == PGRES_FATAL_ERROR;
    if (kept_failed) {
      PQclear(next);
    } else {
      kept.reset(next);
    }
  }

  if (!kept) {
    throw query_failed("no result returned");
  }
  return kept;
}

void PgDatabase::cancel_running_query() {
  PGcancel* cancel = PQgetCancel(conn_.get());
  char errbuf[256] = {};
  const bool sent = cancel != nullptr && PQcancel(cancel, errbuf, sizeof(errbuf)) != 0;
  if (cancel != nullptr) {
    PQfreeCancel(cancel);
  }

  if (!sent) {
    // The connection is in an unknown state; the next call reconnects.
    conn_.reset();
    return;
  }

  while (PGresult* pending = PQgetResult(conn_.get())) {
    PQclear(pending);
  }
}

QueryResult PgDatabase::collect(pg_result* result) const {
  QueryResult collected;
  const int field_count = PQnfields(result);
  const int row_count = PQntuples(result);

  collected.columns.reserve(static_cast<std::size_t>(field_count));
  for (int field = 0; field < field_count; ++field) {
    collected.columns.emplace_back(PQfname(result, field));
  }

  collected.rows.reserve(static_cast<std::size_t>(row_count));
  for (int row = 0; row < row_count; ++row) {
    std::vector<nlohmann::json> cells;
    cells.reserve(static_cast<std::size_t>(field_count));
    for (int field = 0; field < field_count; ++field) {
      if (PQgetisnull(result, row, field) != 0) {
        cells.emplace_back(nullptr);
      } else {
        cells.push_back(convert_cell(PQgetvalue(result, row, field), PQftype(result, field)));
      }
    }
    collected.rows.push_back(std::move(cells));
  }

  return collected;
}

void register_database_tools(mcp::ToolRegistry& registry, std::shared_ptr<PgDatabase> database) {
  if (database == nullptr) {
    throw std::invalid_argument("database tools require a database");
  }

  mcp::InputSchema schema;
  schema.required("sql", mcp::FieldType::kString, "SQL SELECT query to execute");

  registry.add(mcp::Tool{.name = "execute_query",
                         .description = "Execute SQL query on clinical trial database. Returns columns, rows, and count.",
                         .input_schema = std::move(schema),
                         .handler = [database](const mcp::Arguments& args, const core::CallContext& context) {
                           const auto result = database->execute(args.get_string("sql"), context);
                           return nlohmann::json{{"columns", result.columns},
                                                 {"rows", result.rows},
                                                 {"count", result.rows.size()}};
                         }});
}

}  // namespace rx_host::tools
