#include "local_backend.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <fstream>

#include "errors.hpp"
#include "image.hpp"

using namespace std::chrono;

DnnDetector::DnnDetector(LocalBackendConfig cfg) : cfg_(std::move(cfg)) { load_class_names(); }

void DnnDetector::load_class_names() {
  if (!cfg_.labels_path.empty()) {
    std::ifstream in(cfg_.labels_path);
    std::string line;
    while (std::getline(in, line)) {
      if (!line.empty() && line.back() == '\r') line.pop_back();
      if (!line.empty()) class_names_.push_back(line);
    }
    if (!class_names_.empty()) return;
    spdlog::warn("Labels file {} empty or unreadable, falling back to COCO", cfg_.labels_path);
  }
  // COCO class names for YOLO
  class_names_ = {"person",        "bicycle",      "car",
                  "motorcycle",    "airplane",     "bus",
                  "train",         "truck",        "boat",
                  "traffic light", "fire hydrant", "stop sign",
                  "parking meter", "bench",        "bird",
                  "cat",           "dog",          "horse",
                  "sheep",         "cow",          "elephant",
                  "bear",          "zebra",        "giraffe",
                  "backpack",      "umbrella",     "handbag",
                  "tie",           "suitcase",     "frisbee",
                  "skis",          "snowboard",    "sports ball",
                  "kite",          "baseball bat", "baseball glove",
                  "skateboard",    "surfboard",    "tennis racket",
                  "bottle",        "wine glass",   "cup",
                  "fork",          "knife",        "spoon",
                  "bowl",          "banana",       "apple",
                  "sandwich",      "orange",       "broccoli",
                  "carrot",        "hot dog",      "pizza",
                  "donut",         "cake",         "chair",
                  "couch",         "potted plant", "bed",
                  "dining table",  "toilet",       "tv",
                  "laptop",        "mouse",        "remote",
                  "keyboard",      "cell phone",   "microwave",
                  "oven",          "toaster",      "sink",
                  "refrigerator",  "book",         "clock",
                  "vase",          "scissors",     "teddy bear",
                  "hair drier",    "toothbrush"};
}

void DnnDetector::load() {
  if (loaded_) return;
  try {
    net_ = cv::dnn::readNetFromONNX(cfg_.model_path);
  } catch (const cv::Exception& e) {
    throw BackendError("failed to load " + cfg_.model_path + ": " + e.what());
  }
  if (net_.empty()) throw BackendError("empty network from " + cfg_.model_path);
  if (cfg_.needs_gpu) {
    net_.setPreferableBackend(cv::dnn::DNN_BACKEND_CUDA);
    net_.setPreferableTarget(cv::dnn::DNN_TARGET_CUDA);
  }
  loaded_ = true;
  spdlog::info("Loaded {} ({}x{} input, {} classes)", cfg_.model_path, cfg_.input_size,
               cfg_.input_size, class_names_.size());
}

std::vector<Detection> DnnDetector::detect(const cv::Mat& image) {
  // cv::dnn::Net is not reentrant.
  std::lock_guard<std::mutex> g(mu_);
  load();

  const cv::Size input(cfg_.input_size, cfg_.input_size);
  auto t0 = steady_clock::now();
  cv::Mat letterboxed = resize_keep_aspect_ratio(image, input);
  cv::Mat blob;
  cv::dnn::blobFromImage(letterboxed, blob, 1.0 / 255.0, input, cv::Scalar(), true, false);

  cv::Mat out;
  try {
    net_.setInput(blob);
    out = net_.forward();
  } catch (const cv::Exception& e) {
    throw BackendError(std::string("inference failed: ") + e.what());
  }
  auto t1 = steady_clock::now();

  if (out.dims != 3 || out.size[0] != 1) {
    throw BackendError("unexpected YOLO output rank " + std::to_string(out.dims));
  }
  cv::Mat predictions(out.size[1], out.size[2], CV_32F, out.ptr<float>());
  std::vector<Detection> dets = postprocess(predictions, image.size());

  spdlog::debug("YOLO {}: infer={:.2f}ms, post={:.2f}ms, {} detections", cfg_.name,
                duration<double, std::milli>(t1 - t0).count(),
                duration<double, std::milli>(steady_clock::now() - t1).count(), dets.size());
  return dets;
}

std::vector<Detection> DnnDetector::postprocess(const cv::Mat& predictions,
                                                const cv::Size& original) const {
  std::vector<Detection> detections;
  const int num_classes = predictions.rows - 4;
  if (num_classes <= 0 || original.width <= 0 || original.height <= 0) return detections;

  cv::Mat rows;
  cv::transpose(predictions, rows);  // N x (4+C)

  // Undo the letterbox from resize_keep_aspect_ratio.
  const float in = static_cast<float>(cfg_.input_size);
  const float scale = std::min(in / static_cast<float>(original.width),
                               in / static_cast<float>(original.height));
  const float pad_x = (in - static_cast<float>(static_cast<int>(original.width * scale))) / 2.0f;
  const float pad_y = (in - static_cast<float>(static_cast<int>(original.height * scale))) / 2.0f;

  std::vector<cv::Rect> boxes;
  std::vector<float> confidences;
  std::vector<int> class_ids;

  for (int i = 0; i < rows.rows; ++i) {
    const float* row = rows.ptr<float>(i);
    cv::Mat scores(1, num_classes, CV_32F, const_cast<float*>(row + 4));
    cv::Point best;
    double max_confidence = 0.0;
    cv::minMaxLoc(scores, nullptr, &max_confidence, nullptr, &best);
    if (max_confidence < cfg_.detection_threshold) continue;

    const float cx = (row[0] - pad_x) / scale;
    const float cy = (row[1] - pad_y) / scale;
    const float w = row[2] / scale;
    const float h = row[3] / scale;

    int bbox_x = static_cast<int>(cx - w / 2.0f);
    int bbox_y = static_cast<int>(cy - h / 2.0f);
    bbox_x = std::max(0, std::min(bbox_x, original.width - 1));
    bbox_y = std::max(0, std::min(bbox_y, original.height - 1));
    const int bbox_w = std::min(static_cast<int>(w), original.width - bbox_x);
    const int bbox_h = std::min(static_cast<int>(h), original.height - bbox_y);
    if (bbox_w <= 0 || bbox_h <= 0) continue;

    boxes.emplace_back(bbox_x, bbox_y, bbox_w, bbox_h);
    confidences.push_back(static_cast<float>(max_confidence));
    class_ids.push_back(best.x);
  }

  std::vector<int> nms_indices;
  cv::dnn::NMSBoxes(boxes, confidences, cfg_.detection_threshold, cfg_.nms_threshold,
                    nms_indices);

  for (int idx : nms_indices) {
    Detection det;
    det.bbox = boxes[idx];
    det.confidence = confidences[idx];
    det.class_id = class_ids[idx];
    det.label = det.class_id < static_cast<int>(class_names_.size()) ? class_names_[det.class_id]
                                                                     : "unknown";
    detections.push_back(det);
    if (static_cast<int>(detections.size()) >= cfg_.max_detections) break;
  }
  return detections;
}

LocalDetector make_dnn_detector(const LocalBackendConfig& cfg) {
  auto detector = std::make_shared<DnnDetector>(cfg);
  return [detector](const cv::Mat& image, const CancelToken&) { return detector->detect(image); };
}

LocalBackend::LocalBackend(LocalBackendConfig cfg, LocalDetector detector, HazardMapper mapper)
    : cfg_(std::move(cfg)), detector_(std::move(detector)), mapper_(std::move(mapper)) {
  if (!detector_) detector_ = make_dnn_detector(cfg_);

  descriptor_.name = cfg_.name;
  descriptor_.tier = cfg_.tier;
  descriptor_.accuracy_class = cfg_.accuracy;
  descriptor_.cost_per_call = 0.0;
  descriptor_.max_latency_ms = cfg_.max_latency_ms;
  descriptor_.resources.min_memory_mb = cfg_.min_memory_mb;
  descriptor_.resources.needs_gpu = cfg_.needs_gpu;
}

BackendReply LocalBackend::analyze(const BackendInput& input, const CancelToken& token) const {
  if (input.image.empty()) throw BackendError("no decoded image for local inference");
  std::vector<Detection> detections = detector_(input.image, token);
  if (token.cancelled()) throw AnalysisError(ErrorCode::Cancelled, "local attempt cancelled");

  BackendReply reply;
  reply.hazards = mapper_.map(detections, input.image.size(), input.request.work_type);
  reply.confidence = aggregate_confidence(reply.hazards, cfg_.empty_scene_confidence);
  reply.actual_cost = 0.0;
  return reply;
}
