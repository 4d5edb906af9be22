#pragma once

#include <string>
#include <core/types.hpp>

// Remote path handling. Always forward-slash (posix) semantics, never the
// host separator. Pure functions.
namespace path_resolver {

// Collapse "//", drop "." segments, resolve ".." where possible.
// Keeps one leading "/" for absolute paths; empty input yields ".".
std::string normalize(const std::string& path);

// posix join: b is appended even when absolute, then normalized.
std::string posix_join(const std::string& a, const std::string& b);

// Remove exactly one leading "/".
std::string strip_leading_slash(const std::string& name);

// Working directory for directory operations (default ".").
std::string resolve_directory(const std::string& workdir);

// Target path for single-file operations: the file name and the joined
// result each lose one leading "/", so the path is relative to the login
// directory. ("/uploads", "/a.txt") -> "uploads/a.txt".
Result<std::string> resolve_file(const std::string& workdir, const std::string& filename);

// "a/b/c.txt" -> "a/b", "c.txt" -> ".", "/c.txt" -> "/"
std::string parent_directory(const std::string& path);

// "a/b/c.txt" -> "c.txt"; trailing slashes ignored.
std::string base_name(const std::string& path);

// Legacy {filename, data} payloads name their own target.
std::string effective_filename(const std::string& configured, const Payload& payload);

} // namespace path_resolver
