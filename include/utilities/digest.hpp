#ifndef CHUNKKEEPER_DIGEST_HPP
#define CHUNKKEEPER_DIGEST_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "blake3.h"
#include <sodium.h>

namespace chunkkeeper::utils {

/// Supported hashing algorithms.
enum class HashAlgorithm { SHA256, BLAKE3 };

/// Digest size for supported algorithms (32 bytes).
inline constexpr size_t DIGEST_SIZE = 32;

/// Length of the lowercase hex form used as the chunk key.
inline constexpr size_t HASH_HEX_LENGTH = DIGEST_SIZE * 2;

using DigestArray = std::array<uint8_t, DIGEST_SIZE>;

/**
 * @brief Incremental content hasher.
 *
 * Feed bytes with update() and call finalize() exactly once.
 */
class ContentHasher {
public:
  explicit ContentHasher(HashAlgorithm algo = HashAlgorithm::BLAKE3);

  void update(const std::byte *data, size_t size);
  void update(const std::string &text);

  /// @throw std::logic_error if called twice.
  DigestArray finalize();
  std::string finalizeHex();

private:
  HashAlgorithm algo_;
  crypto_hash_sha256_state sha_state_;
  blake3_hasher blake3_state_;
  bool finalized_ = false;
};

/// Hex key of @p data under @p algo.
std::string hashBytes(const std::vector<std::byte> &data,
                      HashAlgorithm algo = HashAlgorithm::BLAKE3);

std::string digestToHex(const DigestArray &digest);

/// @throw chunkkeeper::ValidationError on malformed input.
DigestArray hexToDigest(const std::string &hex);

/// True for a 64 character lowercase hex string.
bool isValidHash(const std::string &hash);

HashAlgorithm hashAlgorithmFromString(const std::string &name);
std::string hashAlgorithmName(HashAlgorithm algo);

/// @p bytes of libsodium randomness as lowercase hex.
std::string randomHex(size_t bytes);

} // namespace chunkkeeper::utils

#endif // CHUNKKEEPER_DIGEST_HPP
