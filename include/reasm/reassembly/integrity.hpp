#pragma once

#include "reasm/core/result.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct evp_md_ctx_st;

namespace reasm::reassembly {

/**
 * @brief Incremental SHA-256, the content-addressing digest used for chunks
 *        and whole files
 */
class Sha256 {
public:
    Sha256();
    ~Sha256();

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;

    void update(const std::uint8_t* data, std::size_t size);
    void update(const std::vector<std::uint8_t>& data) { update(data.data(), data.size()); }

    /// Lowercase hex digest. The object must not be updated afterwards.
    std::string final_hex();

private:
    struct ContextDeleter {
        void operator()(evp_md_ctx_st* ctx) const noexcept;
    };

    std::unique_ptr<evp_md_ctx_st, ContextDeleter> ctx_;
};

std::string sha256_hex(const std::vector<std::uint8_t>& data);

/// Streams a file through SHA-256.
Result<std::string> sha256_file(const std::filesystem::path& path);

/**
 * @brief Canonical form of a digest string for comparison
 *
 * Trims whitespace, lowercases, drops a leading "sha256:" or "0x".
 */
std::string normalize_digest(const std::string& digest);

/**
 * @brief Accept or reject chunk bytes
 *
 * An absent or empty expected checksum accepts unconditionally.
 */
bool verify_chunk(const std::vector<std::uint8_t>& bytes,
                  const std::optional<std::string>& expected_checksum);

} // namespace reasm::reassembly
