#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "core/call_context.hpp"
#include "mcp/tools.hpp"

namespace rx_host::tools {

struct FileEntry {
  std::string path;
  std::string name;
  std::int64_t size{0};
  bool is_dir{false};
  std::string mod_time;
};

struct FileContent {
  std::string path;
  std::string content;
};

FileContent read_file(const std::string& path, const core::CallContext& context);

// Pre-order walk in lexical order, starting with the directory itself.
// Symlinks are reported, not followed. An empty pattern keeps everything;
// otherwise entries whose base name does not match the glob are skipped.
std::vector<FileEntry> list_files(const std::string& directory, const std::string& pattern,
                                  const core::CallContext& context);

void register_filesystem_tools(mcp::ToolRegistry& registry);

}  // namespace rx_host::tools
