#include "cellforge/core/Hash.h"
#include "cellforge/core/Random.h"

#include "test_harness.h"

#include <set>

int test_hash() {
  int failures = 0;

  using namespace cellforge::core;

  // ---- hashU32 / hash3 reference values ----
  static_assert(hashU32(0u) == 0u, "zero is a fixed point of the mix");
  CHECK(hashU32(1u) == 0x688990C0u);
  CHECK(hashU32(0xDEADBEEFu) == 0xE628C683u);

  CHECK(hash3(0, 0, 0, 0u) == 0x01FCE552u);
  CHECK(hash3(1, 2, 3, 42u) == 0xFCA869F4u);
  CHECK(hash3(-1, -1, -1, 7u) == 0x35304CBAu);

  // ---- hash3 separates axes and seeds ----
  {
    CHECK(hash3(1, 0, 0, 0u) != hash3(0, 1, 0, 0u));
    CHECK(hash3(0, 1, 0, 0u) != hash3(0, 0, 1, 0u));
    CHECK(hash3(5, 5, 5, 1u) != hash3(5, 5, 5, 2u));

    std::set<u32> seen;
    for (i32 y = -8; y < 8; ++y) {
      for (i32 x = -8; x < 8; ++x) seen.insert(hash3(x, y, 0, 1234u));
    }
    CHECK(seen.size() == 256u);
  }

  // ---- rand01 range ----
  {
    CHECK(rand01(0u) == 0.0f);
    CHECK(rand01(0xFFFFFFFFu) == 1.0f);

    SplitMix64 rng(99);
    bool inRange = true;
    for (int i = 0; i < 1000; ++i) {
      const float v = rand01(rng.nextU32());
      if (!(v >= 0.0f && v <= 1.0f)) inRange = false;
    }
    CHECK(inRange);
  }

  // ---- salted values are independent of each other ----
  {
    const u32 h = hash3(3, 4, 5, 6u);
    CHECK(saltedUnit(h, kSaltJitterX) != saltedUnit(h, kSaltJitterY));
    CHECK(saltedUnit(h, kSaltColorR) != saltedUnit(h, kSaltColorG));
    CHECK(saltedUnit(h, kSaltJitterX) == rand01(hashU32(h ^ kSaltJitterX)));
  }

  // ---- fnv1a64 / text seeds ----
  CHECK(fnv1a64("") == 0xCBF29CE484222325ull);
  CHECK(fnv1a64("a") == 0xAF63DC4C8601EC8Cull);
  CHECK(fnv1a64("granite") == 0xC6C9AF8FE0AD7269ull);
  CHECK(seedFromText("granite") == static_cast<u32>(0xC6C9AF8FE0AD7269ull ^ (0xC6C9AF8FE0AD7269ull >> 32)));
  CHECK(seedFromText("granite") != seedFromText("marble"));

  return failures;
}
