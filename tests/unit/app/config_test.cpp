#include <autoinspect/app/config.hpp>
#include <autoinspect/core/error.hpp>
#include <gtest/gtest.h>
#include <sstream>

namespace aa = autoinspect::app;
namespace ac = autoinspect::core;
namespace av = autoinspect::vision;

TEST(Config, Defaults) {
  const auto c = aa::default_config();
  EXPECT_EQ(c.database_path, "inspections.db");
  EXPECT_EQ(c.storage_root, "static");
  EXPECT_EQ(c.backend_type, aa::InferenceBackendType::Mock);
  EXPECT_FLOAT_EQ(c.confidence_threshold, 0.05f);
  EXPECT_EQ(c.detection_timeout_ms, 30000u);
  EXPECT_EQ(c.recent_limit, 5u);
  EXPECT_EQ(c.class_names, av::default_class_names());
  EXPECT_TRUE(c.styles.contains("dent"));
}

TEST(Config, ParsesKeysOverDefaults) {
  std::istringstream in(
      "# portal settings\n"
      "database_path = /var/lib/autoinspect/ledger.db\n"
      "\n"
      "backend_type=onnx\n"
      "model_path=models/vehicle.onnx\n"
      "class_names = dent, scratch ,rust\n"
      "confidence_threshold=0.25\n"
      "detection_timeout_ms=0\n"
      "recent_limit=10\n"
      "log_level=debug\n"
      "color.rust=0,64,128\n");
  auto c = aa::parse_config(in);
  ASSERT_TRUE(c.has_value());
  EXPECT_EQ(c->database_path, "/var/lib/autoinspect/ledger.db");
  EXPECT_EQ(c->storage_root, "static");
  EXPECT_EQ(c->backend_type, aa::InferenceBackendType::Onnx);
  EXPECT_EQ(c->model_path, "models/vehicle.onnx");
  ASSERT_EQ(c->class_names.size(), 3u);
  EXPECT_EQ(c->class_names[1], "scratch");
  EXPECT_EQ(c->class_names[2], "rust");
  EXPECT_FLOAT_EQ(c->confidence_threshold, 0.25f);
  EXPECT_EQ(c->detection_timeout_ms, 0u);
  EXPECT_EQ(c->recent_limit, 10u);
  EXPECT_EQ(c->log_level, "debug");
  EXPECT_EQ(c->styles.color_for("rust"), (av::Color{0, 64, 128}));
  EXPECT_TRUE(c->styles.contains("dent"));
}

TEST(Config, UnknownKeysAreIgnored) {
  std::istringstream in("frobnicate=yes\nrecent_limit=3\n");
  auto c = aa::parse_config(in);
  ASSERT_TRUE(c.has_value());
  EXPECT_EQ(c->recent_limit, 3u);
}

TEST(Config, InvalidValues) {
  for (const char* text : {"backend_type=tensorrt\n", "confidence_threshold=1.5\n",
                           "confidence_threshold=abc\n", "recent_limit=0\n",
                           "detection_timeout_ms=-1\n", "log_level=verbose\n",
                           "color.dent=0,0\n", "color.dent=0,0,300\n", "class_names= , \n"}) {
    std::istringstream in(text);
    auto c = aa::parse_config(in);
    ASSERT_FALSE(c.has_value()) << text;
    EXPECT_EQ(c.error(), ac::InspectionError::InvalidConfig) << text;
  }
}

TEST(Config, MissingFileGivesDefaults) {
  auto c = aa::load_config("/nonexistent_autoinspect_config_12345.conf");
  ASSERT_TRUE(c.has_value());
  EXPECT_EQ(c->database_path, "inspections.db");
}
