#pragma once

#include "cellforge/core/Assert.h"
#include "cellforge/core/Types.h"
#include "cellforge/tex/PixelBuffer.h"

#include <functional>

namespace cellforge::core {
class JobSystem;
}

namespace cellforge::tex {

// Execution backend for per-pixel kernels.
//
// Kernels are pure functions of (inputs, params, coordinate), so any backend
// that calls rowFn exactly once per row produces bit-identical output.
class RasterExecutor {
public:
  virtual ~RasterExecutor() = default;

  virtual void forEachRow(core::u32 rows, const std::function<void(core::u32 row)>& rowFn) = 0;

  virtual const char* name() const = 0;
};

// Rows in order on the calling thread.
class SerialExecutor final : public RasterExecutor {
public:
  void forEachRow(core::u32 rows, const std::function<void(core::u32 row)>& rowFn) override;
  const char* name() const override { return "serial"; }
};

// Rows spread over a JobSystem. The job system must outlive the executor.
class JobExecutor final : public RasterExecutor {
public:
  explicit JobExecutor(core::JobSystem& jobs) : jobs_(jobs) {}

  void forEachRow(core::u32 rows, const std::function<void(core::u32 row)>& rowFn) override;
  const char* name() const override { return "jobs"; }

private:
  core::JobSystem& jobs_;
};

// Process-wide serial executor used when a kernel is given none.
RasterExecutor& serialExecutor();

// Fill every pixel of `out` with shade(x, y), row by row through `exec`.
template <class ShadeFn>
void mapPixels(RasterExecutor& exec, PixelBuffer& out, ShadeFn&& shade) {
  CELLFORGE_ASSERT(out.consistent());
  exec.forEachRow(out.height, [&](core::u32 y) {
    PixelF32* row = out.pixels.data() + out.index(0, y);
    for (core::u32 x = 0; x < out.width; ++x) row[x] = shade(x, y);
  });
}

} // namespace cellforge::tex
