#pragma once

#include <mcp_host/core/result.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_host {

struct ResourceDescriptor {
    std::string uri;
    std::string name;
    std::string description;
    std::string mime_type;
};

// Exactly one of text or blob (base64) is set.
struct ResourceContents {
    std::string uri;
    std::string mime_type;
    std::optional<std::string> text;
    std::optional<std::string> blob;
};

void to_json(nlohmann::json& j, const ResourceDescriptor& resource);
void to_json(nlohmann::json& j, const ResourceContents& contents);

class IResourceProvider {
public:
    virtual ~IResourceProvider() = default;

    [[nodiscard]] virtual bool CanHandle(const std::string& uri) const = 0;
    [[nodiscard]] virtual std::vector<ResourceDescriptor> ListResources() const = 0;
    [[nodiscard]] virtual Result<ResourceContents, Error> ReadResource(
        const std::string& uri) const = 0;
};

// ---------------------------------------------------------------------------
// FileSystemResourceProvider — files below configured root directories as
// file:// resources. Lists at most kMaxFilesPerRoot files per root and reads
// at most kMaxReadBytes; a path outside every root is refused.
// ---------------------------------------------------------------------------
class FileSystemResourceProvider : public IResourceProvider {
public:
    static constexpr std::size_t kMaxFilesPerRoot = 200;
    static constexpr std::uintmax_t kMaxReadBytes = 1024 * 1024;

    explicit FileSystemResourceProvider(std::vector<std::filesystem::path> roots);

    [[nodiscard]] bool CanHandle(const std::string& uri) const override;
    [[nodiscard]] std::vector<ResourceDescriptor> ListResources() const override;
    [[nodiscard]] Result<ResourceContents, Error> ReadResource(
        const std::string& uri) const override;

    static std::string PathToFileUri(const std::filesystem::path& path);
    static Result<std::filesystem::path, Error> FileUriToPath(const std::string& uri);
    static std::string MimeTypeFor(const std::filesystem::path& path);
    static bool IsTextMimeType(const std::string& mime_type);

private:
    [[nodiscard]] bool IsInsideRoot(const std::filesystem::path& path) const;

    std::vector<std::filesystem::path> roots_;
};

} // namespace mcp_host
