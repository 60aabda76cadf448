// D3.2 — AnimationScheduler: entrance + per-series visibility tracks (pure C++)

#include "qc/anim/AnimationScheduler.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

static void requireNear(double a, double b, double eps, const char* msg) {
  if (std::fabs(a - b) > eps) {
    std::fprintf(stderr, "ASSERT FAIL [%s]: %.8f != %.8f (eps=%.8f)\n",
                 msg, a, b, eps);
    std::exit(1);
  }
}

static qc::HiddenSetPtr hiddenSet(std::initializer_list<std::size_t> ids) {
  return std::make_shared<const qc::HiddenSeriesSet>(ids);
}

int main() {
  constexpr double EPS = 1e-9;

  // --- Test 1: entrance runs once and stops itself ---
  {
    qc::ManualFrameClock clock;
    qc::AnimationScheduler anim(clock);
    std::vector<double> progress;
    anim.setRenderFn([&](double p, const std::vector<double>&) { progress.push_back(p); });

    auto none = hiddenSet({});
    requireNear(anim.enterProgress(), 0.0, EPS, "starts at 0");
    anim.update(2, none, false);
    requireTrue(!anim.running(), "not ready, no loop");

    anim.update(2, none, true);
    requireTrue(anim.running(), "loop started on ready");
    requireTrue(clock.pending() == 1, "one frame requested");

    clock.advance(300);
    requireNear(anim.enterProgress(), 0.875, 1e-9, "eased midpoint");
    for (int i = 0; i < 40 && anim.running(); i++) clock.advance(16);
    requireTrue(!anim.running(), "loop stopped");
    requireNear(anim.enterProgress(), 1.0, EPS, "entered");
    requireTrue(clock.pending() == 0, "no frame left requested");
    for (size_t i = 1; i < progress.size(); i++) {
      requireTrue(progress[i] >= progress[i - 1], "progress monotone");
    }

    // Going not-ready then ready again does not replay the entrance.
    std::uint64_t renders = anim.renderCount();
    anim.update(2, none, false);
    anim.update(2, none, true);
    requireNear(anim.enterProgress(), 1.0, EPS, "stays entered");
    requireTrue(!anim.running(), "no new loop");
    requireTrue(anim.renderCount() == renders, "nothing rendered");
    std::printf("  Test 1 (entrance): PASS\n");
  }

  // --- Test 2: toggling one series of two ---
  {
    qc::ManualFrameClock clock;
    qc::AnimationScheduler anim(clock, qc::AnimationConfig{600.0, true});

    auto none = hiddenSet({});
    anim.update(2, none, true);
    for (int i = 0; i < 60 && anim.running(); i++) clock.advance(16);
    requireTrue(!anim.running(), "entrance done");

    auto first = hiddenSet({0});
    anim.update(2, first, true);
    requireTrue(anim.running(), "toggle starts loop");
    requireNear(anim.visibility()[0], 1.0, EPS, "series 0 not moved yet");
    requireNear(anim.visibility()[1], 1.0, EPS, "series 1 visible");

    clock.advance(150);
    double mid = anim.visibility()[0];
    requireTrue(mid > 0.0 && mid < 1.0, "series 0 in flight");
    requireNear(anim.visibility()[1], 1.0, EPS, "series 1 untouched");

    clock.advance(450);
    requireNear(anim.visibility()[0], 0.0, EPS, "series 0 hidden after duration");
    requireNear(anim.visibility()[1], 1.0, EPS, "series 1 still visible");
    requireTrue(!anim.running(), "loop ended");
    std::printf("  Test 2 (toggle): PASS\n");
  }

  // --- Test 3: toggles are detected by set identity ---
  {
    qc::ManualFrameClock clock;
    qc::AnimationScheduler anim(clock, qc::AnimationConfig{0.0, true});
    auto set = hiddenSet({});
    anim.update(3, set, true);
    clock.advance(16);
    requireTrue(!anim.running(), "instant entrance");

    std::uint64_t renders = anim.renderCount();
    anim.update(3, set, true);
    requireTrue(!anim.running() && anim.renderCount() == renders, "same pointer ignored");

    anim.update(3, hiddenSet({}), true);
    requireTrue(anim.running(), "new pointer with equal contents still restarts");
    clock.advance(16);
    requireTrue(!anim.running(), "converges in one tick");
    std::printf("  Test 3 (identity): PASS\n");
  }

  // --- Test 4: first hidden set is only the baseline ---
  {
    qc::ManualFrameClock clock;
    qc::AnimationScheduler anim(clock, qc::AnimationConfig{600.0, false});
    anim.update(2, hiddenSet({1}), true);
    requireNear(anim.enterProgress(), 1.0, EPS, "disabled entrance pinned to 1");
    requireNear(anim.visibility()[0], 1.0, EPS, "series 0 shown");
    requireNear(anim.visibility()[1], 0.0, EPS, "series 1 starts hidden");
    requireTrue(!anim.running(), "no loop");
    requireTrue(anim.renderCount() == 0, "baseline does not render");
    std::printf("  Test 4 (baseline): PASS\n");
  }

  // --- Test 5: disabled animation jumps and renders once ---
  {
    qc::ManualFrameClock clock;
    qc::AnimationScheduler anim(clock, qc::AnimationConfig{600.0, false});
    std::vector<double> last;
    anim.setRenderFn([&](double, const std::vector<double>& v) { last = v; });
    anim.update(2, hiddenSet({}), true);
    anim.update(2, hiddenSet({0}), true);
    requireTrue(anim.renderCount() == 1, "rendered once");
    requireTrue(last.size() == 2, "render saw both series");
    requireNear(last[0], 0.0, EPS, "jumped to hidden");
    requireNear(last[1], 1.0, EPS, "other visible");
    requireTrue(!anim.running() && clock.pending() == 0, "no frames requested");
    std::printf("  Test 5 (disabled): PASS\n");
  }

  // --- Test 6: series count change keeps current values ---
  {
    qc::ManualFrameClock clock;
    qc::AnimationScheduler anim(clock, qc::AnimationConfig{600.0, true});
    anim.update(3, hiddenSet({}), true);
    for (int i = 0; i < 60 && anim.running(); i++) clock.advance(16);

    auto toggled = hiddenSet({1, 3});
    anim.update(3, toggled, true);
    clock.advance(100);
    std::vector<double> before = anim.visibility();
    requireTrue(before[1] > 0.0 && before[1] < 1.0, "series 1 mid-flight");

    anim.update(5, toggled, true);
    const std::vector<double>& after = anim.visibility();
    requireTrue(after.size() == 5, "grown to 5");
    for (int i = 0; i < 3; i++) requireNear(after[i], before[i], EPS, "kept existing");
    requireNear(after[3], 0.0, EPS, "new hidden series starts at 0");
    requireNear(after[4], 1.0, EPS, "new visible series starts at 1");

    anim.update(2, toggled, true);
    requireTrue(anim.visibility().size() == 2, "shrunk to 2");
    requireNear(anim.visibility()[1], before[1], EPS, "shrink keeps prefix");
    std::printf("  Test 6 (resize): PASS\n");
  }

  // --- Test 7: one loop at a time ---
  {
    qc::ManualFrameClock clock;
    qc::AnimationScheduler anim(clock);
    anim.update(4, hiddenSet({}), true);
    anim.update(4, hiddenSet({0}), true);
    anim.update(4, hiddenSet({0, 1}), true);
    requireTrue(clock.pending() == 1, "single pending frame");
    std::uint64_t renders = anim.renderCount();
    clock.advance(16);
    requireTrue(anim.renderCount() == renders + 1, "one render per tick");
    std::printf("  Test 7 (single loop): PASS\n");
  }

  // --- Test 8: drawOnce renders without starting the loop ---
  {
    qc::ManualFrameClock clock;
    qc::AnimationScheduler anim(clock, qc::AnimationConfig{600.0, false});
    anim.update(1, hiddenSet({}), true);
    anim.drawOnce();
    anim.drawOnce();
    requireTrue(anim.renderCount() == 2, "two renders");
    requireTrue(!anim.running() && clock.pending() == 0, "no loop");
    std::printf("  Test 8 (drawOnce): PASS\n");
  }

  // --- Test 9: dispose cancels the pending frame ---
  {
    qc::ManualFrameClock clock;
    int calls = 0;
    {
      qc::AnimationScheduler anim(clock);
      anim.setRenderFn([&](double, const std::vector<double>&) { calls++; });
      anim.update(2, hiddenSet({}), true);
      clock.advance(16);
      requireTrue(calls == 1, "one tick before dispose");
      anim.dispose();
      requireTrue(anim.disposed() && !anim.running(), "disposed");
      requireTrue(clock.pending() == 0, "frame cancelled");
      anim.update(2, hiddenSet({1}), true);
      anim.drawOnce();
      anim.dispose();
    }
    clock.advance(16);
    requireTrue(calls == 1, "no render after dispose");

    // Destruction alone cancels too.
    {
      qc::AnimationScheduler anim(clock);
      anim.setRenderFn([&](double, const std::vector<double>&) { calls++; });
      anim.update(2, hiddenSet({}), true);
      requireTrue(clock.pending() == 1, "loop pending");
    }
    requireTrue(clock.pending() == 0, "destructor cancelled");
    clock.advance(16);
    requireTrue(calls == 1, "still no render");
    std::printf("  Test 9 (dispose): PASS\n");
  }

  // --- Test 10: render function may dispose ---
  {
    qc::ManualFrameClock clock;
    qc::AnimationScheduler anim(clock);
    anim.setRenderFn([&](double, const std::vector<double>&) { anim.dispose(); });
    anim.update(1, hiddenSet({}), true);
    clock.advance(16);
    requireTrue(anim.disposed(), "disposed from render");
    requireTrue(clock.pending() == 0, "no re-request");
    std::printf("  Test 10 (dispose in render): PASS\n");
  }

  // --- Test 11: replacing the render function mid-animation ---
  {
    qc::ManualFrameClock clock;
    qc::AnimationScheduler anim(clock, qc::AnimationConfig{600.0, true});
    int firstCalls = 0;
    int secondCalls = 0;
    anim.setRenderFn([&](double, const std::vector<double>&) { firstCalls++; });

    auto none = hiddenSet({});
    anim.update(2, none, true);
    clock.advance(16);
    requireTrue(firstCalls == 1 && secondCalls == 0, "first function drew frame 1");
    requireTrue(anim.running(), "entrance in flight");

    anim.setRenderFn([&](double, const std::vector<double>&) { secondCalls++; });
    requireTrue(clock.pending() == 1, "swap keeps the pending frame");
    clock.advance(16);
    requireTrue(firstCalls == 1, "old function not called after swap");
    requireTrue(secondCalls == 1, "new function drew the next frame");
    requireTrue(anim.running() && clock.pending() == 1, "loop continues");

    for (int i = 0; i < 60 && anim.running(); i++) clock.advance(16);
    requireTrue(!anim.running(), "loop ends normally");
    requireTrue(firstCalls == 1, "old function never called again");
    requireTrue(secondCalls > 1, "new function drew the rest");
    requireNear(anim.enterProgress(), 1.0, EPS, "entrance completes");
    std::printf("  Test 11 (render function swap): PASS\n");
  }

  std::printf("\nD3.2 animation scheduler PASS\n");
  return 0;
}
