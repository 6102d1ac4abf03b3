#include "image.hpp"

#include <openssl/evp.h>
#include <openssl/sha.h>

#include <algorithm>
#include <atomic>
#include <fstream>
#include <iomanip>
#include <limits>
#include <memory>
#include <sstream>
#include <stdexcept>

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace {
std::atomic<uint64_t> g_next_request_id{1};
}  // namespace

std::string to_string(ImageEncoding e) {
  switch (e) {
    case ImageEncoding::Jpeg: return "jpeg";
    case ImageEncoding::Png: return "png";
    case ImageEncoding::Webp: return "webp";
    case ImageEncoding::Unknown: return "unknown";
  }
  return "unknown";
}

ImageEncoding sniff_encoding(const std::vector<uint8_t>& b) {
  if (b.size() >= 3 && b[0] == 0xFF && b[1] == 0xD8 && b[2] == 0xFF) return ImageEncoding::Jpeg;
  if (b.size() >= 8 && b[0] == 0x89 && b[1] == 'P' && b[2] == 'N' && b[3] == 'G' &&
      b[4] == 0x0D && b[5] == 0x0A && b[6] == 0x1A && b[7] == 0x0A) {
    return ImageEncoding::Png;
  }
  if (b.size() >= 12 && b[0] == 'R' && b[1] == 'I' && b[2] == 'F' && b[3] == 'F' &&
      b[8] == 'W' && b[9] == 'E' && b[10] == 'B' && b[11] == 'P') {
    return ImageEncoding::Webp;
  }
  return ImageEncoding::Unknown;
}

namespace {

uint32_t be16(const std::vector<uint8_t>& b, size_t i) {
  return (static_cast<uint32_t>(b[i]) << 8) | b[i + 1];
}

uint32_t be32(const std::vector<uint8_t>& b, size_t i) {
  return (be16(b, i) << 16) | be16(b, i + 2);
}

uint32_t le16(const std::vector<uint8_t>& b, size_t i) {
  return b[i] | (static_cast<uint32_t>(b[i + 1]) << 8);
}

uint32_t le24(const std::vector<uint8_t>& b, size_t i) {
  return le16(b, i) | (static_cast<uint32_t>(b[i + 2]) << 16);
}

std::optional<cv::Size> checked_size(uint32_t w, uint32_t h) {
  const uint32_t limit = static_cast<uint32_t>(std::numeric_limits<int>::max());
  if (w == 0 || h == 0 || w > limit || h > limit) return std::nullopt;
  return cv::Size(static_cast<int>(w), static_cast<int>(h));
}

std::optional<cv::Size> png_dimensions(const std::vector<uint8_t>& b) {
  // signature(8) length(4) "IHDR"(4) width(4) height(4)
  if (b.size() < 24 || b[12] != 'I' || b[13] != 'H' || b[14] != 'D' || b[15] != 'R') {
    return std::nullopt;
  }
  return checked_size(be32(b, 16), be32(b, 20));
}

std::optional<cv::Size> jpeg_dimensions(const std::vector<uint8_t>& b) {
  size_t i = 2;
  while (i + 1 < b.size()) {
    if (b[i] != 0xFF) return std::nullopt;
    const uint8_t marker = b[i + 1];
    if (marker == 0xFF) {  // fill byte
      ++i;
      continue;
    }
    if (marker == 0x01 || (marker >= 0xD0 && marker <= 0xD8)) {
      i += 2;
      continue;
    }
    if (marker == 0xD9 || marker == 0xDA) return std::nullopt;  // no frame header before scan
    if (i + 3 >= b.size()) return std::nullopt;
    const uint32_t length = be16(b, i + 2);
    if (length < 2) return std::nullopt;
    const bool sof = marker >= 0xC0 && marker <= 0xCF && marker != 0xC4 && marker != 0xC8 &&
                     marker != 0xCC;
    if (sof) {
      // length(2) precision(1) height(2) width(2)
      if (i + 8 >= b.size()) return std::nullopt;
      return checked_size(be16(b, i + 7), be16(b, i + 5));
    }
    i += 2 + length;
  }
  return std::nullopt;
}

std::optional<cv::Size> webp_dimensions(const std::vector<uint8_t>& b) {
  if (b.size() < 30) return std::nullopt;
  const std::string chunk(b.begin() + 12, b.begin() + 16);
  if (chunk == "VP8 ") {
    if (b[23] != 0x9D || b[24] != 0x01 || b[25] != 0x2A) return std::nullopt;
    return checked_size(le16(b, 26) & 0x3FFF, le16(b, 28) & 0x3FFF);
  }
  if (chunk == "VP8L") {
    if (b[20] != 0x2F) return std::nullopt;
    const uint32_t bits = b[21] | (static_cast<uint32_t>(b[22]) << 8) |
                          (static_cast<uint32_t>(b[23]) << 16) |
                          (static_cast<uint32_t>(b[24]) << 24);
    return checked_size((bits & 0x3FFF) + 1, ((bits >> 14) & 0x3FFF) + 1);
  }
  if (chunk == "VP8X") {
    return checked_size(le24(b, 24) + 1, le24(b, 27) + 1);
  }
  return std::nullopt;
}

}  // namespace

std::optional<cv::Size> read_image_dimensions(const std::vector<uint8_t>& bytes) {
  switch (sniff_encoding(bytes)) {
    case ImageEncoding::Png: return png_dimensions(bytes);
    case ImageEncoding::Jpeg: return jpeg_dimensions(bytes);
    case ImageEncoding::Webp: return webp_dimensions(bytes);
    case ImageEncoding::Unknown: break;
  }
  return std::nullopt;
}

cv::Mat decode_image(const std::vector<uint8_t>& bytes) {
  if (bytes.empty()) return {};
  try {
    return cv::imdecode(bytes, cv::IMREAD_COLOR);
  } catch (const cv::Exception&) {
    return {};
  }
}

std::vector<uint8_t> encode_jpeg(const cv::Mat& image, int quality) {
  std::vector<uint8_t> out;
  if (!cv::imencode(".jpg", image, out, {cv::IMWRITE_JPEG_QUALITY, quality})) {
    throw std::runtime_error("JPEG encoding failed");
  }
  return out;
}

cv::Mat resize_keep_aspect_ratio(const cv::Mat& input, const cv::Size& target_size) {
  cv::Mat output;
  float scale = std::min(static_cast<float>(target_size.width) / static_cast<float>(input.cols),
                         static_cast<float>(target_size.height) / static_cast<float>(input.rows));

  cv::Size new_size(std::max(1, static_cast<int>(static_cast<float>(input.cols) * scale)),
                    std::max(1, static_cast<int>(static_cast<float>(input.rows) * scale)));
  cv::resize(input, output, new_size);

  cv::Mat padded = cv::Mat::zeros(target_size, output.type());
  int x_offset = (target_size.width - new_size.width) / 2;
  int y_offset = (target_size.height - new_size.height) / 2;
  output.copyTo(padded(cv::Rect(x_offset, y_offset, new_size.width, new_size.height)));
  return padded;
}

namespace {

std::string hex_digest(const unsigned char* hash, size_t len) {
  std::ostringstream oss;
  for (size_t i = 0; i < len; ++i) {
    oss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(hash[i]);
  }
  return oss.str();
}

}  // namespace

std::string sha256_hex(const uint8_t* data, size_t len) {
  unsigned char hash[SHA256_DIGEST_LENGTH];
  SHA256(data, len, hash);
  return hex_digest(hash, SHA256_DIGEST_LENGTH);
}

std::string sha256_hex(const std::vector<uint8_t>& data) {
  return sha256_hex(data.data(), data.size());
}

std::string sha256_file(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) throw std::runtime_error("cannot open file for hashing: " + path);

  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
  if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("SHA-256 context setup failed");
  }

  // Model artifacts can be hundreds of MB; hash in fixed chunks.
  std::vector<char> chunk(64 * 1024);
  while (in) {
    in.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
    const std::streamsize n = in.gcount();
    if (n > 0 && EVP_DigestUpdate(ctx.get(), chunk.data(), static_cast<size_t>(n)) != 1) {
      throw std::runtime_error("SHA-256 update failed for " + path);
    }
  }
  if (in.bad()) throw std::runtime_error("read error while hashing " + path);

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(ctx.get(), hash, &len) != 1) {
    throw std::runtime_error("SHA-256 finalisation failed for " + path);
  }
  return hex_digest(hash, len);
}

std::string base64_encode(const std::vector<uint8_t>& data) {
  if (data.empty()) return {};
  std::string out(4 * ((data.size() + 2) / 3), '\0');
  int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), data.data(),
                          static_cast<int>(data.size()));
  out.resize(static_cast<size_t>(n));
  return out;
}

std::string compute_fingerprint(const std::vector<uint8_t>& bytes, int width, int height,
                                const FingerprintPolicy& policy) {
  std::ostringstream params;
  params << "fp/v1|" << width << 'x' << height << '|' << policy.resize_width << 'x'
         << policy.resize_height << '|' << (policy.letterbox ? "letterbox" : "stretch") << '|';
  const std::string header = params.str();

  std::vector<uint8_t> buf;
  buf.reserve(header.size() + bytes.size());
  buf.insert(buf.end(), header.begin(), header.end());
  buf.insert(buf.end(), bytes.begin(), bytes.end());
  return sha256_hex(buf);
}

AnalysisRequest make_request(std::vector<uint8_t> bytes, int width, int height,
                             WorkType work_type, std::string note,
                             const FingerprintPolicy& policy) {
  AnalysisRequest r;
  r.id = g_next_request_id.fetch_add(1, std::memory_order_relaxed);
  r.fingerprint = compute_fingerprint(bytes, width, height, policy);
  r.bytes = std::make_shared<const std::vector<uint8_t>>(std::move(bytes));
  r.width = width;
  r.height = height;
  r.work_type = work_type;
  r.note = std::move(note);
  r.created = Clock::now();
  return r;
}
