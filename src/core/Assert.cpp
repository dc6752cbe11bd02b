#include "cellforge/core/Assert.h"
#include "cellforge/core/Log.h"

#include <cstdlib>
#include <string>

namespace cellforge::core {

[[noreturn]] void panic(std::string_view message, const char* file, int line) {
  // Keep only the file name; full build paths make the line unreadable.
  std::string_view where(file ? file : "?");
  if (const auto slash = where.find_last_of("/\\"); slash != std::string_view::npos) {
    where.remove_prefix(slash + 1);
  }

  std::string text = "cellforge panic: ";
  text.append(message);
  text.append(" [");
  text.append(where);
  text.append(":");
  text.append(std::to_string(line));
  text.append("]");
  log(LogLevel::Error, text);
  std::abort();
}

} // namespace cellforge::core
