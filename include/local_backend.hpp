#pragma once
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <opencv2/dnn.hpp>

#include "backend_io.hpp"
#include "concurrency.hpp"
#include "hazard_mapper.hpp"
#include "types.hpp"

struct LocalBackendConfig {
  std::string name{"yolo-large"};
  Tier tier{Tier::LocalLarge};
  std::string model_path;   // ONNX artifact, digest-pinned in security.trusted_models
  std::string labels_path;  // one label per line; empty = COCO
  int input_size{640};
  int min_memory_mb{1024};
  bool needs_gpu{false};
  int accuracy{80};
  int max_latency_ms{10000};
  float detection_threshold{0.35f};
  float nms_threshold{0.45f};
  int max_detections{100};
  float empty_scene_confidence{0.7f};
};

// Runs a detector over a BGR image. Throws BackendError on inference failure.
using LocalDetector =
    std::function<std::vector<Detection>(const cv::Mat& image, const CancelToken& token)>;

// OpenCV DNN YOLO (v8/v11 ONNX export, [1, 4+C, N] output).
class DnnDetector {
public:
  explicit DnnDetector(LocalBackendConfig cfg);

  std::vector<Detection> detect(const cv::Mat& image);

  // Maps a [4+C, N] prediction matrix back to source-image pixels.
  std::vector<Detection> postprocess(const cv::Mat& predictions, const cv::Size& original) const;

  const std::vector<std::string>& class_names() const { return class_names_; }

private:
  void load();
  void load_class_names();

  LocalBackendConfig cfg_;
  std::mutex mu_;
  cv::dnn::Net net_;
  bool loaded_{false};
  std::vector<std::string> class_names_;
};

LocalDetector make_dnn_detector(const LocalBackendConfig& cfg);

class LocalBackend {
public:
  LocalBackend(LocalBackendConfig cfg, LocalDetector detector, HazardMapper mapper = HazardMapper());

  const BackendDescriptor& descriptor() const { return descriptor_; }
  const std::string& model_path() const { return cfg_.model_path; }

  BackendReply analyze(const BackendInput& input, const CancelToken& token) const;

private:
  LocalBackendConfig cfg_;
  LocalDetector detector_;
  HazardMapper mapper_;
  BackendDescriptor descriptor_;
};
