/***
 * Name: setalg::support::AppendFile
 * Purpose: Add `data` to the end of `path`, creating the file on first use.
 * Outputs: false with `err` naming the path when it cannot be opened or written.
 */
#include "setalg/support/fs.h"

#include <fstream>
#include <ios>
#include <string>

namespace setalg::support {

bool AppendFile(const std::string& path, const std::string& data, std::string& err) {
  std::ofstream log(path, std::ios::out | std::ios::app);
  if (!log.is_open()) {
    err = "cannot open '" + path + "' for append";
    return false;
  }
  log.write(data.data(), static_cast<std::streamsize>(data.size()));
  log.flush();
  if (!log) {
    err = "write to '" + path + "' failed";
    return false;
  }
  return true;
}

} // namespace setalg::support
