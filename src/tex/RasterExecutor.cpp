#include "cellforge/tex/RasterExecutor.h"

#include "cellforge/core/JobSystem.h"

namespace cellforge::tex {

void SerialExecutor::forEachRow(core::u32 rows, const std::function<void(core::u32 row)>& rowFn) {
  for (core::u32 y = 0; y < rows; ++y) rowFn(y);
}

void JobExecutor::forEachRow(core::u32 rows, const std::function<void(core::u32 row)>& rowFn) {
  // One row per block: rows are already coarse units of work.
  jobs_.parallelFor(static_cast<std::size_t>(rows), [&](std::size_t y) { rowFn(static_cast<core::u32>(y)); }, 1);
}

RasterExecutor& serialExecutor() {
  static SerialExecutor s;
  return s;
}

} // namespace cellforge::tex
