#include "cellforge/core/JobSystem.h"
#include "cellforge/tex/DifferentialExtractor.h"
#include "cellforge/tex/FieldGenerator.h"
#include "cellforge/tex/RasterExecutor.h"

#include "test_harness.h"

#include <atomic>
#include <string>
#include <vector>

int test_raster_executor() {
  int failures = 0;

  using namespace cellforge;
  using namespace cellforge::tex;

  // ---- Every row runs exactly once ----
  {
    core::JobSystem jobs(3);
    JobExecutor exec(jobs);
    CHECK(std::string(exec.name()) == "jobs");
    CHECK(std::string(serialExecutor().name()) == "serial");

    std::vector<std::atomic<int>> hits(257);
    exec.forEachRow(257, [&](core::u32 row) { hits[row].fetch_add(1, std::memory_order_relaxed); });
    bool once = true;
    for (const auto& h : hits) {
      if (h.load() != 1) once = false;
    }
    CHECK(once);

    int calls = 0;
    exec.forEachRow(0, [&](core::u32) { ++calls; });
    CHECK(calls == 0);
  }

  // ---- Serial and pooled renders are bit-identical ----
  {
    FieldParams fp;
    fp.width = 97;
    fp.height = 61;
    fp.seed = 31337;
    fp.cellSize = {13.0f, 9.0f, 2.0f};
    fp.wValue = 0.75f;
    fp.smoothness = 0.2f;
    fp.metric = DistanceMetric::minkowski(1.5f);

    PixelBuffer serial;
    CHECK(generateField(fp, serial));

    core::JobSystem jobs(4);
    JobExecutor exec(jobs);
    PixelBuffer pooled;
    CHECK(generateField(fp, pooled, nullptr, &exec));
    CHECK(signature(serial) == signature(pooled));

    DiffParams dp;
    dp.axis = DiffAxis::Magnitude;
    dp.edgeMode = EdgeMode::Mirror;
    dp.responseMode = ResponseMode::SoftClamp;
    dp.mapScale = 4.0f;

    PixelBuffer dSerial;
    PixelBuffer dPooled;
    CHECK(extractDifferential(serial, dp, dSerial));
    CHECK(extractDifferential(serial, dp, dPooled, nullptr, &exec));
    CHECK(signature(dSerial) == signature(dPooled));
  }

  return failures;
}
