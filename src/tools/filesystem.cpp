#include "tools/filesystem.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <fnmatch.h>
#include <sys/stat.h>
#include <unistd.h>

#include <nlohmann/json.hpp>

namespace rx_host::tools {

namespace {

mcp::ToolErrorKind kind_for_errno(const int error) {
  switch (error) {
    case ENOENT:
    case ENOTDIR:
      return mcp::ToolErrorKind::kNotFound;
    case EACCES:
    case EPERM:
      return mcp::ToolErrorKind::kPermissionDenied;
    default:
      return mcp::ToolErrorKind::kIo;
  }
}

mcp::ToolError errno_error(const char* prefix, const std::string& path, const int error) {
  return mcp::ToolError(kind_for_errno(error), std::string(prefix) + ": " + path + ": " + std::strerror(error));
}

struct FileDescriptor {
  explicit FileDescriptor(const int descriptor) : fd(descriptor) {}
  FileDescriptor(const FileDescriptor&) = delete;
  FileDescriptor& operator=(const FileDescriptor&) = delete;
  ~FileDescriptor() {
    if (fd >= 0) {
      ::close(fd);
    }
  }

  int fd{-1};
};

std::string format_mod_time(const struct stat& info) {
  std::tm local{};
  const std::time_t seconds = info.st_mtime;
  if (localtime_r(&seconds, &local) == nullptr) {
    return {};
  }
  std::array<char, 32> buffer{};
  const auto written = std::strftime(buffer.data(), buffer.size(), "%Y-%m-%d %H:%M:%S", &local);
  return std::string(buffer.data(), written);
}

std::string base_name(const std::string& path) {
  std::string trimmed = path;
  while (trimmed.size() > 1 && trimmed.back() == '/') {
    trimmed.pop_back();
  }
  const auto slash = trimmed.find_last_of('/');
  if (slash == std::string::npos || trimmed.size() == 1) {
    return trimmed;
  }
  return trimmed.substr(slash + 1);
}

bool matches(const std::string& pattern, const std::string& name) {
  if (pattern.empty()) {
    return true;
  }
  // A malformed pattern matches nothing.
  return ::fnmatch(pattern.c_str(), name.c_str(), 0) == 0;
}

std::vector<std::filesystem::path> sorted_children(const std::string& directory) {
  std::error_code error;
  std::filesystem::directory_iterator it(directory, error);
  if (error) {
    throw errno_error("Failed to list files", directory, error.value());
  }

  std::vector<std::filesystem::path> children;
  for (; it != std::filesystem::directory_iterator(); it.increment(error)) {
    children.push_back(it->path());
  }
  if (error) {
    throw errno_error("Failed to list files", directory, error.value());
  }

  std::sort(children.begin(), children.end(),
            [](const auto& lhs, const auto& rhs) { return lhs.filename().string() < rhs.filename().string(); });
  return children;
}

void walk(const std::string& path, const struct stat& info, const std::string& pattern,
          const core::CallContext& context, std::vector<FileEntry>& out) {
  context.check("Failed to list files");

  const bool is_dir = S_ISDIR(info.st_mode);
  const std::string name = base_name(path);
  if (matches(pattern, name)) {
    out.push_back(FileEntry{.path = path,
                            .name = name,
                            .size = static_cast<std::int64_t>(info.st_size),
                            .is_dir = is_dir,
                            .mod_time = format_mod_time(info)});
  }

  if (!is_dir) {
    return;
  }

  for (const auto& child : sorted_children(path)) {
    const std::string child_path = child.string();
    struct stat child_info {};
    if (::lstat(child_path.c_str(), &child_info) != 0) {
      throw errno_error("Failed to list files", child_path, errno);
    }
    walk(child_path, child_info, pattern, context, out);
  }
}

nlohmann::json to_json(const FileEntry& entry) {
  return nlohmann::json{{"path", entry.path},
                        {"name", entry.name},
                        {"size", entry.size},
                        {"is_dir", entry.is_dir},
                        {"mod_time", entry.mod_time}};
}

}  // namespace

FileContent read_file(const std::string& path, const core::CallContext& context) {
  context.check("Failed to read file");

  const FileDescriptor file_descriptor(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
  if (file_descriptor.fd < 0) {
    throw errno_error("Failed to read file", path, errno);
  }

  FileContent file{.path = path, .content = {}};
  std::array<char, 64 * 1024> buffer{};
  while (true) {
    context.check("Failed to read file");
    const ssize_t count = ::read(file_descriptor.fd, buffer.data(), buffer.size());
    if (count == 0) {
      break;
    }
    if (count < 0) {
      if (errno == EINTR) {
        continue;
      }
      const int error = errno;
      throw errno_error("Failed to read file", path, error);
    }
    file.content.append(buffer.data(), static_cast<std::size_t>(count));
  }

  return file;
}

std::vector<FileEntry> list_files(const std::string& directory, const std::string& pattern,
                                  const core::CallContext& context) {
  struct stat info {};
  if (::lstat(directory.c_str(), &info) != 0) {
    throw errno_error("Failed to list files", directory, errno);
  }

  std::vector<FileEntry> entries;
  walk(directory, info, pattern, context, entries);
  return entries;
}

void register_filesystem_tools(mcp::ToolRegistry& registry) {
  mcp::InputSchema read_schema;
  read_schema.required("path", mcp::FieldType::kString, "Path to the file to read");

  registry.add(mcp::Tool{.name = "read_file",
                         .description = "Read content of a clinical trial document or data file",
                         .input_schema = std::move(read_schema),
                         .handler = [](const mcp::Arguments& args, const core::CallContext& context) {
                           const auto file = read_file(args.get_string("path"), context);
                           return nlohmann::json{
                               {"path", file.path}, {"content", file.content}, {"size", file.content.size()}};
                         }});

  mcp::InputSchema list_schema;
  list_schema.required("directory", mcp::FieldType::kString, "Directory path to list")
      .optional("pattern", mcp::FieldType::kString, "Optional glob pattern to filter files (e.g., '*.csv', '*.pdf')");

  registry.add(mcp::Tool{.name = "list_files",
                         .description = "List files in a directory, optionally filtered by pattern",
                         .input_schema = std::move(list_schema),
                         .handler = [](const mcp::Arguments& args, const core::CallContext& context) {
                           const auto& directory = args.get_string("directory");
                           const auto entries = list_files(directory, args.get_string("pattern", ""), context);

                           nlohmann::json files = nlohmann::json::array();
                           for (const auto& entry : entries) {
                             files.push_back(to_json(entry));
                           }
                           return nlohmann::json{
                               {"directory", directory}, {"files", files}, {"count", entries.size()}};
                         }});
}

}  // namespace rx_host::tools
