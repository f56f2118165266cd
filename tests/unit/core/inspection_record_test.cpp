#include <autoinspect/core/inspection_record.hpp>
#include <gtest/gtest.h>

namespace ac = autoinspect::core;

TEST(InspectionRecord, FormatConfidence) {
  EXPECT_EQ(ac::format_confidence(0.42f), "42.00%");
  EXPECT_EQ(ac::format_confidence(0.125f), "12.50%");
  EXPECT_EQ(ac::format_confidence(1.0f, 0), "100%");
}

TEST(InspectionRecord, SummariesOfEmptySet) {
  EXPECT_EQ(ac::summarize_classes({}), "None");
  EXPECT_EQ(ac::summarize_confidences({}), "N/A");
}

TEST(InspectionRecord, SummariesKeepFindingOrder) {
  ac::FindingSet findings{
      {"scratch", 0.5f, {0, 0, 1, 1}},
      {"dent", 0.25f, {0, 0, 1, 1}},
      {"scratch", 0.75f, {0, 0, 1, 1}},
  };
  EXPECT_EQ(ac::summarize_classes(findings), "scratch, dent, scratch");
  EXPECT_EQ(ac::summarize_confidences(findings), "50.00%, 25.00%, 75.00%");
}

TEST(InspectionRecord, TimestampFormat) {
  const std::string ts = ac::format_timestamp(std::chrono::system_clock::now());
  ASSERT_EQ(ts.size(), 19u);
  EXPECT_EQ(ts[4], '-');
  EXPECT_EQ(ts[10], ' ');
  EXPECT_EQ(ts[13], ':');
}
