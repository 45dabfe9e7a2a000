#include "reasm/reassembly/config.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>

namespace reasm::reassembly {
namespace fs = std::filesystem;
using json = nlohmann::json;

Result<void> validate_limits(const WriteLimits& limits) {
    if (limits.max_concurrent_writes == 0) {
        return Err<void>(ErrorCode::InvalidArgument, "max_concurrent_writes must be > 0");
    }
    if (limits.max_queue_length == 0) {
        return Err<void>(ErrorCode::InvalidArgument, "max_queue_length must be > 0");
    }
    return Ok();
}

Result<ReassemblyConfig> parse_config(const std::string& json_text) {
    ReassemblyConfig config;
    try {
        const json j = json::parse(json_text);
        if (!j.is_object()) {
            return Err<ReassemblyConfig>(ErrorCode::InvalidArgument, "Config must be a JSON object");
        }
        config.max_concurrent_writes = j.value("max_concurrent_writes", config.max_concurrent_writes);
        config.max_queue_length = j.value("max_queue_length", config.max_queue_length);
        config.fsync_writes = j.value("fsync_writes", config.fsync_writes);
        if (j.contains("temp_root")) {
            config.temp_root = j.at("temp_root").get<std::string>();
        }
    } catch (const json::exception& e) {
        return Err<ReassemblyConfig>(ErrorCode::InvalidArgument, std::string("Invalid config: ") + e.what());
    }

    if (auto valid = validate_limits(config.limits()); valid.is_error()) {
        return Err<ReassemblyConfig>(valid.error());
    }
    return Ok(std::move(config));
}

Result<ReassemblyConfig> load_config(const fs::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Err<ReassemblyConfig>(ErrorCode::Io, "Failed to open config file: " + path.string());
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();

    auto config = parse_config(buffer.str());
    if (config.is_ok()) {
        spdlog::info("Loaded config from {} (concurrency={}, queue={})", path.string(),
                     config.value().max_concurrent_writes, config.value().max_queue_length);
    }
    return config;
}

fs::path temp_file_path(const fs::path& temp_root, const std::string& transfer_id) {
    return temp_root / (transfer_id + ".tmp");
}

} // namespace reasm::reassembly
