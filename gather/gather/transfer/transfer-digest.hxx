#pragma once

#include <string>
#include <memory>
#include <cstddef>
#include <optional>
#include <filesystem>

#include <openssl/evp.h>

namespace gather
{
  enum class digest_algorithm
  {
    md5,
    sha1,
    sha256,
    sha512
  };

  std::string
  to_string (digest_algorithm);

  // Algorithm and lower-case hex value a file is expected to hash to.
  //
  struct expected_digest
  {
    digest_algorithm algorithm;
    std::string value;
  };

  // Interpret a catalog checksum of the given type (MD5, SHA1, SHA256,
  // SHA512, or MULTIHASH, case-insensitive). A multihash is the hex encoding
  // of the function code (0x11 SHA1, 0x12 SHA256, 0x13 SHA512), the digest
  // length, and the digest.
  //
  // Return nullopt if the checksum is empty. Throw std::invalid_argument if
  // the type is unknown or the multihash is malformed.
  //
  std::optional<expected_digest>
  parse_checksum (const std::string& type, const std::string& checksum);

  // Incremental message digest.
  //
  class digest
  {
  public:
    explicit
    digest (digest_algorithm);

    digest (digest&&) noexcept = default;
    digest& operator= (digest&&) noexcept = default;

    void
    update (const void* data, std::size_t size);

    // Start over.
    //
    void
    reset ();

    // Hex value of the data so far. Does not disturb the running state.
    //
    std::string
    hex () const;

    digest_algorithm
    algorithm () const noexcept
    {
      return algorithm_;
    }

  private:
    struct deleter
    {
      void
      operator() (EVP_MD_CTX* c) const noexcept
      {
        EVP_MD_CTX_free (c);
      }
    };

    digest_algorithm algorithm_;
    std::unique_ptr<EVP_MD_CTX, deleter> ctx_;
  };

  // Hash a whole file.
  //
  std::string
  file_digest (const std::filesystem::path&, digest_algorithm);
}
