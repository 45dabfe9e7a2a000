#include "reasm/reassembly/manifest_codec.hpp"

#include <nlohmann/json.hpp>

namespace reasm::reassembly {
using json = nlohmann::json;

Result<void> validate_manifest(const Manifest& manifest) {
    for (std::size_t i = 0; i < manifest.chunks.size(); ++i) {
        const auto& chunk = manifest.chunks[i];
        if (chunk.index != i) {
            return Err<void>(ErrorCode::InvalidArgument,
                             "Manifest chunk at position " + std::to_string(i) +
                             " has index " + std::to_string(chunk.index));
        }
        if (chunk.encrypted_size == 0) {
            return Err<void>(ErrorCode::InvalidArgument,
                             "Manifest chunk " + std::to_string(i) + " has zero encryptedSize");
        }
    }
    return Ok();
}

Result<Manifest> parse_manifest(const std::string& json_text) {
    Manifest manifest;
    try {
        const json j = json::parse(json_text);
        manifest.file_size = j.value("fileSize", std::uint64_t{0});

        const auto& chunks = j.at("chunks");
        if (!chunks.is_array()) {
            return Err<Manifest>(ErrorCode::InvalidArgument, "Manifest 'chunks' must be an array");
        }
        manifest.chunks.reserve(chunks.size());
        for (const auto& entry : chunks) {
            ChunkDescriptor descriptor;
            descriptor.index = entry.at("index").get<std::uint32_t>();
            descriptor.encrypted_size = entry.at("encryptedSize").get<std::uint64_t>();
            if (entry.contains("checksum") && !entry.at("checksum").is_null()) {
                descriptor.checksum = entry.at("checksum").get<std::string>();
            }
            manifest.chunks.push_back(std::move(descriptor));
        }

        if (j.contains("merkleRoot") && !j.at("merkleRoot").is_null()) {
            manifest.merkle_root = j.at("merkleRoot").get<std::string>();
        }
    } catch (const json::exception& e) {
        return Err<Manifest>(ErrorCode::InvalidArgument, std::string("Invalid manifest: ") + e.what());
    }

    if (auto valid = validate_manifest(manifest); valid.is_error()) {
        return Err<Manifest>(valid.error());
    }
    return Ok(std::move(manifest));
}

std::string manifest_to_json(const Manifest& manifest) {
    json j;
    j["fileSize"] = manifest.file_size;
    j["chunks"] = json::array();
    for (const auto& chunk : manifest.chunks) {
        json entry;
        entry["index"] = chunk.index;
        entry["encryptedSize"] = chunk.encrypted_size;
        if (chunk.checksum) {
            entry["checksum"] = *chunk.checksum;
        }
        j["chunks"].push_back(std::move(entry));
    }
    if (manifest.merkle_root) {
        j["merkleRoot"] = *manifest.merkle_root;
    }
    return j.dump(2);
}

} // namespace reasm::reassembly
