/**
 * autoinspect-cli: Inspect vehicle images and browse an operator's inspection ledger.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/autoinspect_cli --operator-id ID [--config path] inspect <image>...
 *        ./build/autoinspect_cli --operator-id ID history | dashboard
 */

#include <autoinspect/app/config.hpp>
#include <autoinspect/app/dashboard.hpp>
#include <autoinspect/app/inspection_orchestrator.hpp>
#include <autoinspect/app/inspection_runner.hpp>
#include <autoinspect/core/error.hpp>
#include <autoinspect/core/inspection_record.hpp>
#include <autoinspect/storage/image_store.hpp>
#include <autoinspect/storage/inspection_ledger.hpp>
#include <autoinspect/vision/annotator.hpp>
#include <autoinspect/vision/detection_decoder.hpp>
#include <autoinspect/vision/detector.hpp>
#include <autoinspect/vision/image_codec.hpp>
#include <autoinspect/vision/mock_inference_backend.hpp>
#ifdef AUTOINSPECT_HAS_ONNX
#include <autoinspect/vision/onnx_inference_backend.hpp>
#endif

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstring>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

namespace ai = autoinspect;

std::shared_ptr<ai::vision::IDetector> build_detector(const ai::app::InspectionConfig& cfg) {
  using namespace ai::vision;

  DetectionDecoder decoder(cfg.confidence_threshold, cfg.class_names);

  std::shared_ptr<IInferenceBackend> backend;
  if (cfg.backend_type == ai::app::InferenceBackendType::Onnx) {
#ifdef AUTOINSPECT_HAS_ONNX
    if (cfg.model_path.empty()) {
      throw std::runtime_error("backend_type=onnx requires model_path to be set in config");
    }
    auto onnx = std::make_shared<OnnxInferenceBackend>(cfg.model_path);
    onnx->warmup();
    backend = std::move(onnx);
#else
    throw std::runtime_error("ONNX backend not available (build with -DAUTOINSPECT_USE_ONNX=ON)");
#endif
  } else {
    auto mock = std::make_shared<MockInferenceBackend>();
    mock->set_detections({{0, 0.42f, 40.f, 60.f, 200.f, 180.f}});
    backend = std::move(mock);
  }

  auto model = std::make_shared<ModelDetector>(std::move(backend), std::move(decoder));
  return std::make_shared<TimedDetector>(
      std::move(model), std::chrono::milliseconds(cfg.detection_timeout_ms));
}

bool read_file(const std::string& path, std::vector<std::byte>& out) {
  std::ifstream f(path, std::ios::binary);
  if (!f) return false;
  std::vector<char> raw((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
  out.resize(raw.size());
  std::memcpy(out.data(), raw.data(), raw.size());
  return true;
}

void print_usage() {
  std::cout << "Usage: autoinspect_cli [options] <command>\n"
            << "Commands:\n"
            << "  inspect <image>...  Inspect JPEG/PNG images and record the results\n"
            << "  history             List every inspection for the operator\n"
            << "  dashboard           Show counts and the most recent inspections\n"
            << "Options:\n"
            << "  --config <path>         Config file (key=value); default: built-in (mock)\n"
            << "  --operator-id <id>      Operator identity issued by the identity provider\n"
            << "  --operator-name <name>  Display name used in stored file names\n"
            << "  --backend <type>        Override backend: mock | onnx\n"
            << "  --model <path>          Override model path (required for --backend onnx)\n"
            << "  --db <path>             Override database path\n"
            << "  --storage <path>        Override image storage root\n"
            << "  --workers <n>           Parallel workers for inspect (default 1)\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string config_path;
  std::string backend_override;
  std::string model_override;
  std::string db_override;
  std::string storage_override;
  std::size_t workers = 1;
  ai::core::OperatorRef op;
  std::vector<std::string> positional;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--operator-id" && i + 1 < argc) {
      op.id = argv[++i];
    } else if (arg == "--operator-name" && i + 1 < argc) {
      op.display_name = argv[++i];
    } else if (arg == "--backend" && i + 1 < argc) {
      backend_override = argv[++i];
    } else if (arg == "--model" && i + 1 < argc) {
      model_override = argv[++i];
    } else if (arg == "--db" && i + 1 < argc) {
      db_override = argv[++i];
    } else if (arg == "--storage" && i + 1 < argc) {
      storage_override = argv[++i];
    } else if (arg == "--workers" && i + 1 < argc) {
      try {
        workers = static_cast<std::size_t>(std::stoul(argv[++i]));
      } catch (const std::exception&) {
        std::cerr << "--workers expects a number\n";
        return 1;
      }
    } else if (arg == "--help" || arg == "-h") {
      print_usage();
      return 0;
    } else {
      positional.push_back(arg);
    }
  }

  if (positional.empty() || op.id.empty()) {
    print_usage();
    return 1;
  }
  const std::string command = positional.front();

  ai::app::InspectionConfig cfg = ai::app::default_config();
  if (!config_path.empty()) {
    auto loaded = ai::app::load_config(config_path);
    if (!loaded) {
      std::cerr << "Invalid config " << config_path << "\n";
      return 1;
    }
    cfg = std::move(*loaded);
  }
  spdlog::set_level(spdlog::level::from_str(cfg.log_level));

  if (!backend_override.empty()) {
    if (backend_override == "mock") {
      cfg.backend_type = ai::app::InferenceBackendType::Mock;
    } else if (backend_override == "onnx") {
      cfg.backend_type = ai::app::InferenceBackendType::Onnx;
    } else {
      std::cerr << "Unknown --backend " << backend_override << " (use mock or onnx)\n";
      return 1;
    }
  }
  if (!model_override.empty()) cfg.model_path = model_override;
  if (!db_override.empty()) cfg.database_path = db_override;
  if (!storage_override.empty()) cfg.storage_root = storage_override;

  try {
    ai::storage::SqliteInspectionLedger ledger(cfg.database_path);

    if (command == "history") {
      auto rows = ai::app::build_history(ledger, op);
      if (!rows) {
        std::cerr << "History unavailable: " << ai::core::error_name(rows.error()) << "\n";
        return 1;
      }
      ai::app::print_history(std::cout, *rows);
      return 0;
    }
    if (command == "dashboard") {
      auto view = ai::app::build_dashboard(ledger, op, cfg.recent_limit);
      if (!view) {
        std::cerr << "Dashboard unavailable: " << ai::core::error_name(view.error()) << "\n";
        return 1;
      }
      ai::app::print_dashboard(std::cout, *view);
      return 0;
    }
    if (command != "inspect" || positional.size() < 2) {
      print_usage();
      return 1;
    }

    std::vector<ai::app::InspectionRequest> requests;
    std::vector<std::string> paths;
    for (std::size_t i = 1; i < positional.size(); ++i) {
      const std::string& path = positional[i];
      if (!ai::vision::format_from_extension(std::filesystem::path(path).extension().string())) {
        std::cerr << path << ": invalid file type, please upload JPG or PNG images only\n";
        continue;
      }
      ai::app::InspectionRequest req;
      req.op = op;
      if (!read_file(path, req.image)) {
        std::cerr << path << ": cannot read file\n";
        continue;
      }
      requests.push_back(std::move(req));
      paths.push_back(path);
    }

    ai::storage::FileImageStore images(cfg.storage_root);
    ai::app::InspectionOrchestrator orchestrator(build_detector(cfg),
                                                 ai::vision::Annotator(cfg.styles), images, ledger);

    bool all_ok = requests.size() + 1 == positional.size();
    std::mutex out_mutex;
    ai::app::run_inspection_batch_parallel(
        orchestrator, requests,
        [&](std::size_t index, const ai::app::InspectionResult& result) {
          std::lock_guard lock(out_mutex);
          std::cout << paths[index] << ": ";
          if (!result) {
            all_ok = false;
            std::cout << "failed (" << ai::core::error_name(result.error()) << ")\n";
            return;
          }
          ai::app::print_summary(std::cout, *result);
        },
        workers);
    return all_ok ? 0 : 1;
  } catch (const std::exception& e) {
    spdlog::critical("{}", e.what());
    return 1;
  }
}
