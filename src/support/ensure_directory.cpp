/***
 * Name: setalg::support::EnsureDirectory
 * Purpose: Make sure a log directory exists before files are appended to it.
 * Inputs:
 *   - dir: directory path, relative or absolute
 * Outputs:
 *   - err: reason on failure
 * Theory of Operation: create_directories with an error_code; a directory
 *   created concurrently by another process counts as success.
 */
#include "setalg/support/fs.h"

#include <filesystem>
#include <string>
#include <system_error>

namespace setalg {
namespace support {

bool EnsureDirectory(const std::string& dir, std::string& err) {
  namespace fs = std::filesystem;
  std::error_code errCode;
  if (fs::is_directory(dir, errCode)) { return true; }
  fs::create_directories(dir, errCode);
  if (fs::is_directory(dir)) { return true; }
  err = "failed to create directory '" + dir + "': " + errCode.message();
  return false;
}

}  // namespace support
}  // namespace setalg
