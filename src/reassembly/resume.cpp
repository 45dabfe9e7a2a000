#include "reasm/reassembly/resume.hpp"
#include "reasm/reassembly/config.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace reasm::reassembly {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::string utc_timestamp() {
    const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &now);
#else
    gmtime_r(&now, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

} // namespace

fs::path bitmap_path(const fs::path& temp_root, const std::string& transfer_id) {
    return temp_root / (transfer_id + ".bitmap");
}

Result<void> save_chunk_bitmap(const fs::path& path,
                               const std::string& transfer_id,
                               const std::vector<std::uint32_t>& received_chunks,
                               std::uint32_t total_chunks) {
    std::error_code ec;
    if (!path.parent_path().empty()) {
        fs::create_directories(path.parent_path(), ec);
    }

    json j;
    j["transfer_id"] = transfer_id;
    j["total_chunks"] = total_chunks;
    j["received_chunks"] = received_chunks;
    j["saved_at"] = utc_timestamp();

    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        return Err<void>(ErrorCode::Io, "Failed to save bitmap: " + path.string());
    }
    out << j.dump();
    if (!out) {
        return Err<void>(ErrorCode::Io, "Failed to write bitmap: " + path.string());
    }

    spdlog::debug("Saved bitmap for transfer {} ({}/{} chunks)", transfer_id, received_chunks.size(), total_chunks);
    return Ok();
}

Result<std::optional<std::vector<std::uint32_t>>> load_chunk_bitmap(const fs::path& path) {
    using Loaded = std::optional<std::vector<std::uint32_t>>;

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Ok<Loaded>(std::nullopt);
    }

    std::ifstream input(path);
    if (!input) {
        return Err<Loaded>(ErrorCode::Io, "Failed to read bitmap: " + path.string());
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();

    try {
        const json j = json::parse(buffer.str());
        if (!j.contains("received_chunks") || !j.at("received_chunks").is_array()) {
            return Err<Loaded>(ErrorCode::Io, "Bitmap has no received_chunks list: " + path.string());
        }
        return Ok<Loaded>(j.at("received_chunks").get<std::vector<std::uint32_t>>());
    } catch (const json::exception& e) {
        return Err<Loaded>(ErrorCode::Io, std::string("Failed to parse bitmap: ") + e.what());
    }
}

Result<void> cleanup_transfer_temp(const fs::path& temp_root, const std::string& transfer_id) {
    std::vector<std::string> errors;
    for (const auto& path : {temp_file_path(temp_root, transfer_id), bitmap_path(temp_root, transfer_id)}) {
        std::error_code ec;
        fs::remove(path, ec);
        if (ec) {
            errors.push_back("Failed to remove " + path.string() + ": " + ec.message());
        }
    }

    if (!errors.empty()) {
        std::string joined;
        for (const auto& error : errors) {
            if (!joined.empty()) {
                joined += "; ";
            }
            joined += error;
        }
        return Err<void>(ErrorCode::Io, joined);
    }
    return Ok();
}

} // namespace reasm::reassembly
