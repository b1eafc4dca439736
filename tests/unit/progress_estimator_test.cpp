#include "internal/sweep/progress_estimator.hpp"

#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <sstream>
#include <vector>

#include "internal/sweep/progress_line.hpp"

namespace {

using rowsweep::sweep::ProgressEstimator;
using rowsweep::sweep::ProgressLine;
using rowsweep::sweep::ProgressSnapshot;
using Seconds = std::chrono::duration<double>;

bool Near(double a, double b) {
  return std::fabs(a - b) < 1e-9;
}

void TestStartsWithUnknownRemaining() {
  ProgressEstimator estimator(1000, 100);
  assert(!estimator.HasEstimate());
  assert(std::isinf(estimator.DisplayedRemaining()));
}

void TestFirstUpdateUsesPerPageTiming() {
  ProgressEstimator estimator(1000, 100);
  auto snapshot = estimator.Update(100, Seconds(2.0));

  assert(Near(snapshot.percent, 10.0));
  // 900 rows left = 9 pages at 2s each
  assert(Near(snapshot.remaining_seconds, 18.0));
  assert(estimator.HasEstimate());
}

void TestSlowerPageDoesNotRaiseDisplayedValue() {
  ProgressEstimator estimator(1000, 100);
  estimator.Update(100, Seconds(1.0));   // 9s
  auto slow = estimator.Update(200, Seconds(5.0));   // raw 40s

  assert(Near(slow.remaining_seconds, 9.0));
  assert(Near(slow.percent, 20.0));

  auto fast = estimator.Update(300, Seconds(0.5));   // raw 3.5s
  assert(Near(fast.remaining_seconds, 3.5));
}

void TestDisplayedRemainingNeverIncreases() {
  ProgressEstimator         estimator(10000, 100);
  const std::vector<double> timings = {0.9, 0.2, 3.0, 0.1, 0.15, 7.0, 0.05, 0.3, 0.01, 2.0};

  double previous = estimator.DisplayedRemaining();
  for (std::size_t i = 0; i < timings.size(); ++i) {
    auto snapshot = estimator.Update((i + 1) * 100, Seconds(timings[i]));
    assert(snapshot.remaining_seconds <= previous);
    previous = snapshot.remaining_seconds;
  }
}

void TestCompletionReachesHundredPercentAndZero() {
  ProgressEstimator estimator(250, 100);
  estimator.Update(100, Seconds(1.0));
  estimator.Update(200, Seconds(1.0));
  auto last = estimator.Update(250, Seconds(1.0));

  assert(Near(last.percent, 100.0));
  assert(Near(last.remaining_seconds, 0.0));
}

void TestResumedRunReportsOverallPercent() {
  ProgressEstimator estimator(1000, 100);
  auto snapshot = estimator.Update(400, Seconds(1.0));
  assert(Near(snapshot.percent, 40.0));
  assert(Near(snapshot.remaining_seconds, 6.0));
}

void TestLineFormat() {
  assert(ProgressLine::Format({12.345, 45.6}) == "Progress: 12.3% Remain: 46s");
  assert(ProgressLine::Format({100.0, 0.0}) == "Progress: 100.0% Remain: 0s");
  assert(ProgressLine::Format({0.0, ProgressEstimator::kUnknownRemaining}) == "Progress: 0.0% Remain: ?s");
}

void TestLineOverwritesAndFinishesOnce() {
  std::ostringstream out;
  ProgressLine       line(out);

  line.Render({10.0, 100.0});
  line.Render({20.0, 9.0});
  line.Finish();
  line.Finish();

  // second render is padded over the longer first one
  assert(out.str() == "\rProgress: 10.0% Remain: 100s\rProgress: 20.0% Remain: 9s  \n");
}

void TestDisabledLinePrintsNothing() {
  std::ostringstream out;
  ProgressLine       line(out, false);
  line.Render({10.0, 1.0});
  line.Finish();
  assert(out.str().empty());
}

} // namespace

int main() {
  TestStartsWithUnknownRemaining();
  TestFirstUpdateUsesPerPageTiming();
  TestSlowerPageDoesNotRaiseDisplayedValue();
  TestDisplayedRemainingNeverIncreases();
  TestCompletionReachesHundredPercentAndZero();
  TestResumedRunReportsOverallPercent();
  TestLineFormat();
  TestLineOverwritesAndFinishesOnce();
  TestDisabledLinePrintsNothing();

  std::cout << "rowsweep_unit_progress_estimator: pass\n";
  return 0;
}
