#include "LiteTest.hpp"

#include "core/ScalingCalculator.hpp"

using namespace osmprint;

static HeightStats Stats(double min_h, double max_h)
{
  HeightStats stats;
  stats.add(min_h);
  stats.add(max_h);
  return stats;
}

static void TestPlanUsesLongestSide()
{
  ScalingCalculator calculator;

  const ScalePlan wide = calculator.plan(1000.0, 500.0, 200.0);
  EXPECT_NEAR(wide.extent_m, 1000.0, 1e-12);
  EXPECT_NEAR(wide.horizontal_scale, 5.0, 1e-12);
  EXPECT_NEAR(wide.mm_per_meter(), 0.2, 1e-12);
  EXPECT_NEAR(wide.display_vertical_scale, 20.0, 1e-12);
  EXPECT_NEAR(wide.target_size_mm, 200.0, 1e-12);

  const ScalePlan tall = calculator.plan(500.0, 1000.0, 250.0);
  EXPECT_NEAR(tall.extent_m, 1000.0, 1e-12);
  EXPECT_NEAR(tall.horizontal_scale, 4.0, 1e-12);
}

static void TestPlanFor500MetersAt100Millimeters()
{
  ScalingCalculator calculator;
  const ScalePlan plan = calculator.plan(500.0, 320.0, 100.0);
  EXPECT_NEAR(plan.horizontal_scale, 5.0, 1e-12);
  EXPECT_NEAR(plan.display_vertical_scale, 10.0, 1e-12);
  EXPECT_TRUE(plan.explanation.find("Horizontal scale") != std::string::npos);
}

static void TestPlanRejectsBadInputs()
{
  ScalingCalculator calculator;
  EXPECT_THROW(calculator.plan(0.0, 100.0, 200.0), GeometryError);
  EXPECT_THROW(calculator.plan(100.0, -1.0, 200.0), GeometryError);
  EXPECT_THROW(calculator.plan(100.0, 100.0, 0.0), GeometryError);
  EXPECT_THROW(calculator.plan(100.0, 100.0, -50.0), GeometryError);
  EXPECT_THROW(calculator.plan(NAN, 100.0, 200.0), GeometryError);
  EXPECT_THROW(calculator.plan(100.0, 100.0, INFINITY), GeometryError);
}

static void TestHeightRangeEndpoints()
{
  const HeightStats stats = Stats(3.0, 30.0);
  EXPECT_NEAR(ScalingCalculator::print_height_mm(3.0, stats), kMinPrintHeightMm, 1e-12);
  EXPECT_NEAR(ScalingCalculator::print_height_mm(30.0, stats), kMaxPrintHeightMm, 1e-12);
  EXPECT_NEAR(ScalingCalculator::print_height_mm(16.5, stats), 4.4, 1e-12);
}

static void TestHeightClamped()
{
  const HeightStats stats = Stats(10.0, 20.0);
  EXPECT_NEAR(ScalingCalculator::print_height_mm(40.0, stats), kMaxPrintHeightMm, 1e-12);
  EXPECT_NEAR(ScalingCalculator::print_height_mm(0.0, stats), kMinPrintHeightMm, 1e-12);
}

static void TestHeightMappingMonotonic()
{
  const HeightStats stats = Stats(4.0, 60.0);

  double previous = 0.0;
  for (int step = 0; step <= 800; ++step) {
    const double real_height = step * 0.1;
    const double print_height = ScalingCalculator::print_height_mm(real_height, stats);
    EXPECT_TRUE(print_height >= kMinPrintHeightMm);
    EXPECT_TRUE(print_height <= kMaxPrintHeightMm);
    EXPECT_TRUE(print_height >= previous);
    previous = print_height;
  }
}

static void TestDegenerateRanges()
{
  // No qualifying building
  HeightStats empty;
  EXPECT_NEAR(ScalingCalculator::print_height_mm(12.0, empty), kMinPrintHeightMm, 1e-12);

  // A single height
  const HeightStats single = Stats(12.0, 12.0);
  EXPECT_FALSE(single.has_range());
  EXPECT_NEAR(ScalingCalculator::print_height_mm(12.0, single), kMinPrintHeightMm, 1e-12);
}

int main()
{
  QuietLogging();

  TestPlanUsesLongestSide();
  TestPlanFor500MetersAt100Millimeters();
  TestPlanRejectsBadInputs();
  TestHeightRangeEndpoints();
  TestHeightClamped();
  TestHeightMappingMonotonic();
  TestDegenerateRanges();

  return TestExit("osmprint_scaling_tests");
}
