#include <autoinspect/core/finding.hpp>
#include <autoinspect/core/status.hpp>
#include <gtest/gtest.h>

namespace ac = autoinspect::core;

TEST(Status, EmptyFindingSetPasses) {
  EXPECT_EQ(ac::classify({}), ac::VehicleStatus::Pass);
}

TEST(Status, SingleLowConfidenceFindingFails) {
  ac::FindingSet findings{{"dent", 0.06f, {1, 2, 3, 4}}};
  EXPECT_EQ(ac::classify(findings), ac::VehicleStatus::Fail);
}

TEST(Status, FailExactlyWhenFindingsPresent) {
  ac::FindingSet findings;
  for (int n = 0; n < 6; ++n) {
    const auto status = ac::classify(findings);
    EXPECT_EQ(status == ac::VehicleStatus::Fail, !findings.empty()) << "n=" << n;
    findings.push_back({n % 2 ? "scratch" : "unlisted_class", 0.5f, {0, 0, 10, 10}});
  }
}

TEST(Status, Labels) {
  EXPECT_EQ(ac::status_label(ac::VehicleStatus::Pass), "Non-Broken");
  EXPECT_EQ(ac::status_label(ac::VehicleStatus::Fail), "Broken");
  EXPECT_EQ(ac::parse_status_label("Broken"), ac::VehicleStatus::Fail);
  EXPECT_EQ(ac::parse_status_label("Non-Broken"), ac::VehicleStatus::Pass);
  EXPECT_FALSE(ac::parse_status_label("broken").has_value());
}
