#include <autoinspect/core/error.hpp>
#include <autoinspect/storage/image_store.hpp>
#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <random>
#include <regex>
#include <string>
#include <vector>

namespace as = autoinspect::storage;
namespace ac = autoinspect::core;
namespace fs = std::filesystem;

namespace {

class ImageStoreTest : public ::testing::Test {
 protected:
  void SetUp() override {
    root_ = fs::temp_directory_path() /
            ("autoinspect_images_" + std::to_string(std::random_device{}()));
    fs::create_directories(root_);
  }
  void TearDown() override {
    std::error_code ec;
    fs::remove_all(root_, ec);
  }

  fs::path root_;
};

std::vector<std::byte> bytes_of(std::string_view s) {
  std::vector<std::byte> out;
  for (char c : s) out.push_back(static_cast<std::byte>(c));
  return out;
}

}  // namespace

TEST_F(ImageStoreTest, PutThenGet) {
  as::FileImageStore store(root_);
  const auto data = bytes_of("not really a jpeg");
  auto ref = store.put("uploads/alice_1.jpg", data);
  ASSERT_TRUE(ref.has_value());
  EXPECT_EQ(*ref, "uploads/alice_1.jpg");
  EXPECT_TRUE(fs::exists(root_ / "uploads" / "alice_1.jpg"));
  EXPECT_EQ(store.path_for(*ref), root_ / "uploads/alice_1.jpg");

  auto back = store.get(*ref);
  ASSERT_TRUE(back.has_value());
  EXPECT_EQ(*back, data);
}

TEST_F(ImageStoreTest, LeavesNoTemporaryFiles) {
  as::FileImageStore store(root_);
  ASSERT_TRUE(store.put("results/a.png", bytes_of("x")).has_value());
  std::size_t files = 0;
  for (const auto& entry : fs::directory_iterator(root_ / "results")) {
    (void)entry;
    ++files;
  }
  EXPECT_EQ(files, 1u);
}

TEST_F(ImageStoreTest, RefusesKeysOutsideRoot) {
  as::FileImageStore store(root_);
  auto escaped = store.put("../escape.jpg", bytes_of("x"));
  ASSERT_FALSE(escaped.has_value());
  EXPECT_EQ(escaped.error(), ac::InspectionError::Persistence);
  EXPECT_FALSE(store.put("/tmp/abs.jpg", bytes_of("x")).has_value());
  EXPECT_FALSE(store.put("", bytes_of("x")).has_value());
  EXPECT_FALSE(store.get("uploads/../../etc/passwd").has_value());
}

TEST_F(ImageStoreTest, MissingReference) {
  as::FileImageStore store(root_);
  auto missing = store.get("uploads/none.jpg");
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error(), ac::InspectionError::Persistence);
}

TEST(MakeImageName, Format) {
  const std::string name =
      as::make_image_name("alice", std::chrono::system_clock::now(), "jpg");
  EXPECT_TRUE(std::regex_match(name, std::regex(R"(alice_\d{8}_\d{6}_[0-9a-f]{8}\.jpg)")))
      << name;
}

TEST(MakeImageName, SanitizesOperatorName) {
  const auto now = std::chrono::system_clock::now();
  const std::string name = as::make_image_name("../Jane Doe", now, "png");
  EXPECT_EQ(name.rfind("___Jane_Doe_", 0), 0u) << name;
  EXPECT_EQ(name.find('/'), std::string::npos);
  EXPECT_EQ(as::make_image_name("", now, "png").rfind("operator_", 0), 0u);
}

TEST(MakeImageName, SameSecondNamesDiffer) {
  const auto now = std::chrono::system_clock::now();
  EXPECT_NE(as::make_image_name("alice", now, "jpg"), as::make_image_name("alice", now, "jpg"));
}
