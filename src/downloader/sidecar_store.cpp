/*
 * wildfetch/src/downloader/sidecar_store.cpp
 *
 * Persistent JSON sidecar next to each partial download:
 *   <outputDir>/.<filename>.meta
 * {
 *   "expected_total_size": 1048576,   // or null when the server did not report a size
 *   "url": "https://example.com/file_3.bin"
 * }
 *
 * - One file per target, so units never contend on a shared document
 * - Unreadable or corrupt sidecars load as absent
 */

#include <wildfetch/downloader/downloader.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <system_error>

namespace wildfetch::downloader {

namespace fs = std::filesystem;
using nlohmann::json;

class JsonSidecarStore final : public ISidecarStore {
public:
    JsonSidecarStore() = default;
    ~JsonSidecarStore() override = default;

    Expected<std::optional<SidecarMetadata>> load(const ExpandedTarget& target) override {
        const auto path = sidecarPathFor(target.localPath);
        std::error_code ec;
        if (!fs::exists(path, ec)) {
            return std::optional<SidecarMetadata>{std::nullopt};
        }
        std::ifstream in(path);
        if (!in) {
            return Error{ErrorCode::IoError, "Failed to open sidecar for read: " + path.string()};
        }

        json root;
        try {
            in >> root;
        } catch (const json::exception& e) {
            spdlog::debug("Ignoring corrupt sidecar {}: {}", path.string(), e.what());
            return std::optional<SidecarMetadata>{std::nullopt};
        }
        if (!root.is_object()) {
            return std::optional<SidecarMetadata>{std::nullopt};
        }

        SidecarMetadata meta;
        if (root.contains("expected_total_size") &&
            root["expected_total_size"].is_number_unsigned()) {
            meta.expectedTotalSize = root["expected_total_size"].get<std::uint64_t>();
        }
        if (root.contains("url") && root["url"].is_string()) {
            meta.url = root["url"].get<std::string>();
        }
        return std::optional<SidecarMetadata>{meta};
    }

    Expected<void> save(const ExpandedTarget& target, const SidecarMetadata& meta) override {
        const auto path = sidecarPathFor(target.localPath);

        json root = json::object();
        if (meta.expectedTotalSize) {
            root["expected_total_size"] = *meta.expectedTotalSize;
        } else {
            root["expected_total_size"] = nullptr;
        }
        root["url"] = meta.url;

        std::ofstream out(path, std::ios::trunc);
        if (!out) {
            return Error{ErrorCode::IoError, "Failed to open sidecar for write: " + path.string()};
        }
        out << root.dump(2);
        if (!out.good()) {
            return Error{ErrorCode::IoError, "Failed to write sidecar: " + path.string()};
        }
        return {};
    }

    void remove(const ExpandedTarget& target) noexcept override {
        std::error_code ec;
        fs::remove(sidecarPathFor(target.localPath), ec);
        if (ec) {
            spdlog::debug("Failed to remove sidecar for {}: {}", target.filename, ec.message());
        }
    }
};

std::unique_ptr<ISidecarStore> makeJsonSidecarStore() {
    return std::make_unique<JsonSidecarStore>();
}

} // namespace wildfetch::downloader
