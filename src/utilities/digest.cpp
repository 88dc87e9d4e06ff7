#include "utilities/digest.hpp"
#include "utilities/errors.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace chunkkeeper::utils {

ContentHasher::ContentHasher(HashAlgorithm algo) : algo_(algo) {
  // sodium_init() returns 1 when already initialised.
  if (sodium_init() < 0) {
    throw std::runtime_error("Failed to initialize libsodium");
  }
  if (algo_ == HashAlgorithm::SHA256) {
    crypto_hash_sha256_init(&sha_state_);
  } else {
    blake3_hasher_init(&blake3_state_);
  }
}

void ContentHasher::update(const std::byte *data, size_t size) {
  if (finalized_) {
    throw std::logic_error("Cannot update a finalized ContentHasher.");
  }
  if (!data || size == 0)
    return;
  if (algo_ == HashAlgorithm::SHA256) {
    crypto_hash_sha256_update(
        &sha_state_, reinterpret_cast<const unsigned char *>(data), size);
  } else {
    blake3_hasher_update(&blake3_state_, reinterpret_cast<const uint8_t *>(data),
                         size);
  }
}

void ContentHasher::update(const std::string &text) {
  update(reinterpret_cast<const std::byte *>(text.data()), text.size());
}

DigestArray ContentHasher::finalize() {
  if (finalized_) {
    throw std::logic_error("finalize() already called.");
  }
  DigestArray digest{};
  if (algo_ == HashAlgorithm::SHA256) {
    crypto_hash_sha256_final(&sha_state_, digest.data());
  } else {
    blake3_hasher_finalize(&blake3_state_, digest.data(), DIGEST_SIZE);
  }
  finalized_ = true;
  return digest;
}

std::string ContentHasher::finalizeHex() { return digestToHex(finalize()); }

std::string hashBytes(const std::vector<std::byte> &data, HashAlgorithm algo) {
  ContentHasher hasher(algo);
  hasher.update(data.data(), data.size());
  return hasher.finalizeHex();
}

std::string digestToHex(const DigestArray &digest) {
  char hex[HASH_HEX_LENGTH + 1];
  sodium_bin2hex(hex, sizeof(hex), digest.data(), digest.size());
  return std::string(hex, HASH_HEX_LENGTH);
}

DigestArray hexToDigest(const std::string &hex) {
  if (!isValidHash(hex)) {
    throw ValidationError("malformed chunk hash: '" + hex + "'");
  }
  DigestArray digest{};
  size_t binLen = 0;
  if (sodium_hex2bin(digest.data(), digest.size(), hex.data(), hex.size(),
                     nullptr, &binLen, nullptr) != 0 ||
      binLen != DIGEST_SIZE) {
    throw ValidationError("malformed chunk hash: '" + hex + "'");
  }
  return digest;
}

bool isValidHash(const std::string &hash) {
  if (hash.size() != HASH_HEX_LENGTH)
    return false;
  return std::all_of(hash.begin(), hash.end(), [](unsigned char c) {
    return std::isdigit(c) || (c >= 'a' && c <= 'f');
  });
}

HashAlgorithm hashAlgorithmFromString(const std::string &name) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (lower == "sha256" || lower == "sha-256")
    return HashAlgorithm::SHA256;
  if (lower == "blake3")
    return HashAlgorithm::BLAKE3;
  throw std::invalid_argument("unknown hash algorithm: " + name);
}

std::string hashAlgorithmName(HashAlgorithm algo) {
  return algo == HashAlgorithm::SHA256 ? "sha256" : "blake3";
}

std::string randomHex(size_t bytes) {
  if (sodium_init() < 0) {
    throw std::runtime_error("Failed to initialize libsodium");
  }
  std::vector<unsigned char> buf(bytes);
  randombytes_buf(buf.data(), buf.size());
  std::string hex(bytes * 2 + 1, '\0');
  sodium_bin2hex(hex.data(), hex.size(), buf.data(), buf.size());
  hex.resize(bytes * 2);
  return hex;
}

} // namespace chunkkeeper::utils
