#include <autoinspect/app/inspection_orchestrator.hpp>
#include <autoinspect/app/inspection_runner.hpp>
#include <autoinspect/core/error.hpp>
#include <autoinspect/core/status.hpp>
#include <autoinspect/storage/image_store.hpp>
#include <autoinspect/storage/inspection_ledger.hpp>
#include <autoinspect/vision/annotator.hpp>
#include <autoinspect/vision/detection_decoder.hpp>
#include <autoinspect/vision/detector.hpp>
#include <autoinspect/vision/image_codec.hpp>
#include <autoinspect/vision/mock_inference_backend.hpp>
#include <gtest/gtest.h>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <memory>
#include <mutex>
#include <random>
#include <set>
#include <vector>

namespace {

using namespace autoinspect::core;
using namespace autoinspect::vision;
using namespace autoinspect::storage;
using namespace autoinspect::app;
namespace fs = std::filesystem;

const OperatorRef kOperator{"op-42", "alice"};

std::vector<std::byte> encoded_car(const char* ext) {
  cv::Mat img(240, 320, CV_8UC3, cv::Scalar(120, 110, 100));
  cv::rectangle(img, cv::Point(40, 60), cv::Point(200, 180), cv::Scalar(30, 30, 30), cv::FILLED);
  std::vector<uchar> buf;
  cv::imencode(ext, img, buf);
  std::vector<std::byte> out(buf.size());
  std::memcpy(out.data(), buf.data(), buf.size());
  return out;
}

/// Ledger whose writes always fail; reads go to an in-memory ledger.
class UnwritableLedger : public IInspectionLedger {
 public:
  std::expected<InspectionRecord, InspectionError> create(const OperatorRef&,
                                                          const ImageRef&,
                                                          const ImageRef&,
                                                          VehicleStatus,
                                                          const FindingSet&) override {
    return std::unexpected(InspectionError::Persistence);
  }
  std::expected<std::vector<InspectionRecord>, InspectionError> recent(
      const OperatorRef& op, std::size_t limit) const override {
    return inner_.recent(op, limit);
  }
  std::expected<std::vector<InspectionRecord>, InspectionError> all(
      const OperatorRef& op) const override {
    return inner_.all(op);
  }
  std::expected<InspectionCounts, InspectionError> aggregate(
      const OperatorRef& op) const override {
    return inner_.aggregate(op);
  }
  std::expected<ClassCounts, InspectionError> defect_class_counts(
      const OperatorRef& op) const override {
    return inner_.defect_class_counts(op);
  }

 private:
  SqliteInspectionLedger inner_{":memory:"};
};

class InspectionFlowTest : public ::testing::Test {
 protected:
  void SetUp() override {
    root_ = fs::temp_directory_path() /
            ("autoinspect_flow_" + std::to_string(std::random_device{}()));
    images_ = std::make_unique<FileImageStore>(root_);
    ledger_ = std::make_unique<SqliteInspectionLedger>(":memory:");
    backend_ = std::make_shared<MockInferenceBackend>();
  }
  void TearDown() override {
    std::error_code ec;
    fs::remove_all(root_, ec);
  }

  std::shared_ptr<IDetector> detector(std::chrono::milliseconds timeout) {
    auto model = std::make_shared<ModelDetector>(
        backend_, DetectionDecoder(0.05f, default_class_names()));
    return std::make_shared<TimedDetector>(std::move(model), timeout);
  }

  InspectionOrchestrator orchestrator(std::chrono::milliseconds timeout =
                                          std::chrono::milliseconds(2000)) {
    return InspectionOrchestrator(detector(timeout), Annotator(StyleTable::defaults()), *images_,
                                  *ledger_);
  }

  InspectionCounts counts() {
    auto c = ledger_->aggregate(kOperator);
    EXPECT_TRUE(c.has_value());
    return c.value_or(InspectionCounts{});
  }

  fs::path root_;
  std::unique_ptr<FileImageStore> images_;
  std::unique_ptr<SqliteInspectionLedger> ledger_;
  std::shared_ptr<MockInferenceBackend> backend_;
};

}  // namespace

TEST_F(InspectionFlowTest, CleanVehiclePasses) {
  const auto orch = orchestrator();
  auto summary = orch.process(kOperator, encoded_car(".jpg"));
  ASSERT_TRUE(summary.has_value());
  EXPECT_EQ(summary->status, VehicleStatus::Pass);
  EXPECT_EQ(summary->finding_count, 0u);
  EXPECT_TRUE(summary->findings.empty());
  EXPECT_EQ(summary->source_image.rfind("uploads/alice_", 0), 0u);
  EXPECT_EQ(summary->annotated_image.rfind("results/alice_", 0), 0u);
  EXPECT_TRUE(fs::exists(images_->path_for(summary->source_image)));
  EXPECT_TRUE(fs::exists(images_->path_for(summary->annotated_image)));

  const auto c = counts();
  EXPECT_EQ(c.total, 1u);
  EXPECT_EQ(c.pass_count, 1u);

  auto records = ledger_->all(kOperator);
  ASSERT_TRUE(records.has_value());
  ASSERT_EQ(records->size(), 1u);
  EXPECT_EQ((*records)[0].defect_classes, "None");
  EXPECT_EQ((*records)[0].confidence_scores, "N/A");
}

TEST_F(InspectionFlowTest, LowConfidenceDentFailsVehicle) {
  backend_->set_detections({{0, 0.42f, 40.f, 60.f, 200.f, 180.f}});
  const auto before = counts();
  const auto orch = orchestrator();
  auto summary = orch.process(kOperator, encoded_car(".jpg"));
  ASSERT_TRUE(summary.has_value());
  EXPECT_EQ(summary->status, VehicleStatus::Fail);
  EXPECT_EQ(summary->finding_count, 1u);
  ASSERT_EQ(summary->findings.size(), 1u);
  EXPECT_EQ(summary->findings[0].class_name, "dent");
  EXPECT_EQ(summary->findings[0].confidence, "42.00%");

  const auto after = counts();
  EXPECT_EQ(after.fail_count, before.fail_count + 1);
  EXPECT_EQ(after.total, before.total + 1);

  auto annotated = images_->get(summary->annotated_image);
  ASSERT_TRUE(annotated.has_value());
  auto frame = decode_image(*annotated);
  ASSERT_TRUE(frame.has_value());
  EXPECT_EQ(frame->width(), 320u);
  EXPECT_EQ(frame->height(), 240u);
}

TEST_F(InspectionFlowTest, PngUploadKeepsFormat) {
  backend_->set_detections({{1, 0.9f, 10.f, 10.f, 100.f, 100.f}});
  const auto orch = orchestrator();
  auto summary = orch.process(kOperator, encoded_car(".png"));
  ASSERT_TRUE(summary.has_value());
  EXPECT_TRUE(summary->annotated_image.ends_with(".png"));
  auto annotated = images_->get(summary->annotated_image);
  ASSERT_TRUE(annotated.has_value());
  EXPECT_EQ(sniff_format(*annotated), ImageFormat::Png);
}

TEST_F(InspectionFlowTest, InvalidBytesRejected) {
  const auto orch = orchestrator();
  std::vector<std::byte> garbage(256, std::byte{0x11});
  auto summary = orch.process(kOperator, garbage);
  ASSERT_FALSE(summary.has_value());
  EXPECT_EQ(summary.error(), InspectionError::InvalidImage);

  // JPEG magic with a broken body.
  auto truncated = encoded_car(".jpg");
  truncated.resize(16);
  auto broken = orch.process(kOperator, truncated);
  ASSERT_FALSE(broken.has_value());
  EXPECT_EQ(broken.error(), InspectionError::InvalidImage);
  EXPECT_EQ(counts().total, 0u);
}

TEST_F(InspectionFlowTest, DetectionTimeoutLeavesLedgerUnchanged) {
  backend_->set_detections({{0, 0.9f, 40.f, 60.f, 200.f, 180.f}});
  backend_->set_delay(std::chrono::milliseconds(400));
  const auto orch = orchestrator(std::chrono::milliseconds(30));
  auto summary = orch.process(kOperator, encoded_car(".jpg"));
  ASSERT_FALSE(summary.has_value());
  EXPECT_EQ(summary.error(), InspectionError::DetectionUnavailable);
  EXPECT_EQ(counts().total, 0u);
  EXPECT_FALSE(fs::exists(root_ / "uploads"));
}

TEST_F(InspectionFlowTest, DetectorFailureNotRecorded) {
  backend_->fail_with(InspectionError::DetectionUnavailable);
  const auto orch = orchestrator();
  auto summary = orch.process(kOperator, encoded_car(".jpg"));
  ASSERT_FALSE(summary.has_value());
  EXPECT_EQ(summary.error(), InspectionError::DetectionUnavailable);
  EXPECT_EQ(counts().total, 0u);
}

TEST_F(InspectionFlowTest, MalformedDetectionNotRecorded) {
  backend_->set_detections({{0, 0.8f, 200.f, 60.f, 40.f, 180.f}});
  const auto orch = orchestrator();
  auto summary = orch.process(kOperator, encoded_car(".jpg"));
  ASSERT_FALSE(summary.has_value());
  EXPECT_EQ(summary.error(), InspectionError::MalformedDetection);
  EXPECT_EQ(counts().total, 0u);
}

TEST_F(InspectionFlowTest, LedgerFailureReportsPersistence) {
  UnwritableLedger ledger;
  InspectionOrchestrator orch(detector(std::chrono::milliseconds(2000)),
                              Annotator(StyleTable::defaults()), *images_, ledger);
  auto summary = orch.process(kOperator, encoded_car(".jpg"));
  ASSERT_FALSE(summary.has_value());
  EXPECT_EQ(summary.error(), InspectionError::Persistence);
  EXPECT_EQ(ledger.aggregate(kOperator)->total, 0u);
}

TEST_F(InspectionFlowTest, StageTimingReportedInOrder) {
  const auto orch = orchestrator();
  std::vector<InspectionStage> stages;
  StageTimingCallback cb = [&](InspectionStage stage, double ms) {
    EXPECT_GE(ms, 0.0);
    stages.push_back(stage);
  };
  ASSERT_TRUE(orch.process(kOperator, encoded_car(".jpg"), &cb).has_value());
  const std::vector<InspectionStage> expected{
      InspectionStage::Decode,   InspectionStage::Detect,      InspectionStage::Normalize,
      InspectionStage::Annotate, InspectionStage::Classify,    InspectionStage::StoreImages,
      InspectionStage::Persist};
  EXPECT_EQ(stages, expected);
  EXPECT_EQ(stage_name(InspectionStage::StoreImages), "store_images");
}

TEST_F(InspectionFlowTest, OperatorsSeeOnlyTheirOwnRecords) {
  backend_->set_detections({{2, 0.7f, 40.f, 60.f, 200.f, 180.f}});
  const auto orch = orchestrator();
  const OperatorRef other{"op-99", "bob"};
  ASSERT_TRUE(orch.process(kOperator, encoded_car(".jpg")).has_value());
  ASSERT_TRUE(orch.process(other, encoded_car(".jpg")).has_value());
  ASSERT_TRUE(orch.process(other, encoded_car(".jpg")).has_value());
  EXPECT_EQ(counts().total, 1u);
  EXPECT_EQ(ledger_->aggregate(other)->total, 2u);
  EXPECT_EQ(ledger_->defect_class_counts(other)->at("lamp_broken"), 2u);
}

TEST_F(InspectionFlowTest, SequentialBatchReportsEachRequest) {
  const auto orch = orchestrator();
  std::vector<InspectionRequest> requests{{kOperator, encoded_car(".jpg")},
                                          {kOperator, std::vector<std::byte>(8, std::byte{1})},
                                          {kOperator, encoded_car(".png")}};
  std::vector<std::size_t> order;
  std::vector<bool> ok;
  run_inspection_batch(orch, requests, [&](std::size_t index, const InspectionResult& result) {
    order.push_back(index);
    ok.push_back(result.has_value());
  });
  EXPECT_EQ(order, (std::vector<std::size_t>{0, 1, 2}));
  EXPECT_EQ(ok, (std::vector<bool>{true, false, true}));
  EXPECT_EQ(counts().total, 2u);
}

TEST_F(InspectionFlowTest, ParallelBatchCreatesDistinctRecords) {
  backend_->set_detections({{0, 0.42f, 40.f, 60.f, 200.f, 180.f}});
  const auto orch = orchestrator();
  std::vector<InspectionRequest> requests;
  for (int i = 0; i < 10; ++i) requests.push_back({kOperator, encoded_car(".jpg")});

  std::mutex mutex;
  std::set<std::int64_t> ids;
  std::set<std::string> images;
  std::size_t calls = 0;
  run_inspection_batch_parallel(
      orch, requests,
      [&](std::size_t, const InspectionResult& result) {
        std::lock_guard lock(mutex);
        ++calls;
        ASSERT_TRUE(result.has_value());
        ids.insert(result->record_id);
        images.insert(result->annotated_image);
      },
      4);

  EXPECT_EQ(calls, requests.size());
  EXPECT_EQ(ids.size(), requests.size());
  EXPECT_EQ(images.size(), requests.size());
  EXPECT_EQ(counts().fail_count, requests.size());
}
