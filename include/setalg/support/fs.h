/***
 * Name: setalg::support (fs)
 * Purpose: File system helpers for the tool's log files.
 * Inputs: Paths and string buffers
 * Outputs: Status booleans; an error message on failure
 * Theory of Operation: Errors are reported through `err` instead of
 *   exceptions so a logging failure never aborts an evaluation.
 */
#pragma once

#include <string>

namespace setalg {
namespace support {

/*** EnsureDirectory: Create `dir` and its parents when missing. Return true when it exists afterwards. */
bool EnsureDirectory(const std::string& dir, std::string& err);

/*** AppendFile: Append data to path, creating the file if needed. Return true on success. */
bool AppendFile(const std::string& path, const std::string& data, std::string& err);

}  // namespace support
}  // namespace setalg
