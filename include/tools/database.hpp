#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/call_context.hpp"
#include "mcp/tools.hpp"

struct pg_conn;
struct pg_result;

namespace rx_host::tools {

struct QueryResult {
  std::vector<std::string> columns{};
  // Cells are typed from the column type: null, boolean, integer, number,
  // parsed JSON, or text.
  std::vector<std::vector<nlohmann::json>> rows{};
};

// One PostgreSQL connection owned by the host and shared by the database
// tools. Calls are serialized on the connection.
class PgDatabase {
 public:
  explicit PgDatabase(std::string conninfo);
  ~PgDatabase();

  PgDatabase(const PgDatabase&) = delete;
  PgDatabase& operator=(const PgDatabase&) = delete;

  // Connects if needed. Returns an empty string when reachable, otherwise
  // the connection error.
  std::string ping();

  // Executes sql verbatim. Throws ToolError(kQuery) on connection or query
  // failure and ToolError(kCancelled) when the context expires first.
  QueryResult execute(const std::string& sql, const core::CallContext& context);

 private:
  struct ConnDeleter {
    void operator()(pg_conn* conn) const;
  };
  struct ResultDeleter {
    void operator()(pg_result* result) const;
  };
  using ResultPtr = std::unique_ptr<pg_result, ResultDeleter>;

  void ensure_connected();
  ResultPtr execute_blocking(const std::string& sql);
  ResultPtr execute_bounded(const std::string& sql, const core::CallContext& context);
  void cancel_running_query();
  QueryResult collect(pg_result* result) const;

  std::string conninfo_;
  std::unique_ptr<pg_conn, ConnDeleter> conn_;
  std::mutex mutex_;
};

// Registers execute_query. The statement is not sanitized: expose this tool
// to trusted operators only.
void register_database_tools(mcp::ToolRegistry& registry, std::shared_ptr<PgDatabase> database);

}  // namespace rx_host::tools
