#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "types.hpp"

enum class ImageEncoding { Unknown, Jpeg, Png, Webp };

std::string to_string(ImageEncoding e);

// Magic-byte sniffing; does not decode.
ImageEncoding sniff_encoding(const std::vector<uint8_t>& bytes);

// Width and height from the PNG IHDR, JPEG SOFn or WebP VP8/VP8L/VP8X header,
// without decoding pixels. nullopt when the header is missing or truncated.
std::optional<cv::Size> read_image_dimensions(const std::vector<uint8_t>& bytes);

// Decodes to BGR; returns an empty Mat when OpenCV cannot parse the payload.
cv::Mat decode_image(const std::vector<uint8_t>& bytes);

// Encodes BGR pixels as JPEG (quality 0-100).
std::vector<uint8_t> encode_jpeg(const cv::Mat& image, int quality = 90);

cv::Mat resize_keep_aspect_ratio(const cv::Mat& input, const cv::Size& target_size);

std::string sha256_hex(const uint8_t* data, size_t len);
std::string sha256_hex(const std::vector<uint8_t>& data);
// Throws std::runtime_error if the file cannot be read.
std::string sha256_file(const std::string& path);

std::string base64_encode(const std::vector<uint8_t>& data);

// Deterministic over encoded bytes, declared size and resize policy.
std::string compute_fingerprint(const std::vector<uint8_t>& bytes, int width, int height,
                                const FingerprintPolicy& policy);

// Builds an immutable request with a process-wide monotonic id.
AnalysisRequest make_request(std::vector<uint8_t> bytes, int width, int height,
                             WorkType work_type, std::string note = {},
                             const FingerprintPolicy& policy = FingerprintPolicy{});
