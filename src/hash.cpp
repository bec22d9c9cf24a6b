#include "conclave/hash.hpp"

// BLAKE3 is the sole hash primitive. Domain separation is by prefix, fed to the
// hasher before the payload.

#include <array>
#include <fstream>

extern "C" {
#include <blake3.h>
}

namespace conclave {
namespace {

constexpr char kHexChars[] = "0123456789abcdef";

std::string to_hex(const unsigned char* data, std::size_t len) {
  std::string out;
  out.resize(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out[i * 2] = kHexChars[data[i] >> 4];
    out[i * 2 + 1] = kHexChars[data[i] & 0x0f];
  }
  return out;
}

std::string finalize(const blake3_hasher& hasher) {
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

}  // namespace

std::string blake3_hex(std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  return finalize(hasher);
}

std::string hash_domain(std::string_view domain, std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, domain.data(), domain.size());
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  return finalize(hasher);
}

std::string diff_digest(std::string_view diff) { return hash_domain("diff:", diff); }

std::string hash_backend_version() {
  const char* v = blake3_version();
  return v ? std::string(v) : std::string("unknown");
}

struct Blake3Stream::State {
  blake3_hasher hasher;
};

Blake3Stream::Blake3Stream(std::string_view domain) : state_(std::make_unique<State>()) {
  blake3_hasher_init(&state_->hasher);
  if (!domain.empty()) blake3_hasher_update(&state_->hasher, domain.data(), domain.size());
}

Blake3Stream::~Blake3Stream() = default;

void Blake3Stream::update(std::string_view bytes) {
  blake3_hasher_update(&state_->hasher, bytes.data(), bytes.size());
}

bool Blake3Stream::update_file(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) return false;
  constexpr std::size_t kBufferSize = 65536;
  std::array<char, kBufferSize> buffer;
  while (file.good()) {
    file.read(buffer.data(), buffer.size());
    const std::streamsize count = file.gcount();
    if (count > 0) {
      blake3_hasher_update(&state_->hasher, buffer.data(), static_cast<size_t>(count));
    }
  }
  return !file.bad();
}

std::string Blake3Stream::finalize_hex() const { return finalize(state_->hasher); }

}  // namespace conclave
