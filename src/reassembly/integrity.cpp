#include "reasm/reassembly/integrity.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace reasm::reassembly {
namespace {

std::string to_hex(const unsigned char* data, unsigned int size) {
    std::ostringstream oss;
    for (unsigned int i = 0; i < size; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
    }
    return oss.str();
}

bool starts_with(const std::string& value, const std::string& prefix) {
    return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

void Sha256::ContextDeleter::operator()(evp_md_ctx_st* ctx) const noexcept {
    EVP_MD_CTX_free(ctx);
}

Sha256::Sha256() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_ || EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("Failed to initialise SHA-256 context");
    }
}

Sha256::~Sha256() = default;

void Sha256::update(const std::uint8_t* data, std::size_t size) {
    if (size == 0) {
        return;
    }
    if (EVP_DigestUpdate(ctx_.get(), data, size) != 1) {
        throw std::runtime_error("SHA-256 update failed");
    }
}

std::string Sha256::final_hex() {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), digest, &length) != 1) {
        throw std::runtime_error("SHA-256 finalisation failed");
    }
    return to_hex(digest, length);
}

std::string sha256_hex(const std::vector<std::uint8_t>& data) {
    Sha256 hasher;
    hasher.update(data);
    return hasher.final_hex();
}

Result<std::string> sha256_file(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<std::string>(ErrorCode::Io, "Failed to open file for hashing: " + path.string());
    }

    try {
        Sha256 hasher;
        std::vector<char> buffer(64 * 1024);
        while (input.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || input.gcount() > 0) {
            hasher.update(reinterpret_cast<const std::uint8_t*>(buffer.data()),
                          static_cast<std::size_t>(input.gcount()));
        }
        if (input.bad()) {
            return Err<std::string>(ErrorCode::Io, "Failed to read file for hashing: " + path.string());
        }
        return Ok(hasher.final_hex());
    } catch (const std::runtime_error& e) {
        return Err<std::string>(ErrorCode::Io, std::string("Hashing failed: ") + e.what());
    }
}

std::string normalize_digest(const std::string& digest) {
    auto begin = std::find_if_not(digest.begin(), digest.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(digest.rbegin(), digest.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();

    std::string normalized;
    if (begin < end) {
        normalized.assign(begin, end);
    }
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (starts_with(normalized, "sha256:")) {
        normalized.erase(0, 7);
    } else if (starts_with(normalized, "0x")) {
        normalized.erase(0, 2);
    }
    return normalized;
}

bool verify_chunk(const std::vector<std::uint8_t>& bytes,
                  const std::optional<std::string>& expected_checksum) {
    if (!expected_checksum || expected_checksum->empty()) {
        return true;
    }
    return sha256_hex(bytes) == normalize_digest(*expected_checksum);
}

} // namespace reasm::reassembly
