#include <mcp_host/mcp/resource_provider.hpp>

#include <mcp_host/core/base64.hpp>
#include <mcp_host/core/log.hpp>
#include <mcp_host/core/strings.hpp>

#include <cstdio>
#include <fstream>
#include <iterator>
#include <map>
#include <system_error>

namespace mcp_host {

namespace {

constexpr const char* kComponent = "resources";
constexpr const char* kFileScheme = "file://";

std::string FormatSize(std::uintmax_t bytes) {
    char buf[32];
    if (bytes < 1024) {
        std::snprintf(buf, sizeof(buf), "%ju B", bytes);
    } else if (bytes < 1024 * 1024) {
        std::snprintf(buf, sizeof(buf), "%.1f KB", static_cast<double>(bytes) / 1024.0);
    } else {
        std::snprintf(buf, sizeof(buf), "%.1f MB",
                      static_cast<double>(bytes) / (1024.0 * 1024.0));
    }
    return buf;
}

std::filesystem::path Normalize(const std::filesystem::path& path) {
    std::error_code ec;
    auto canonical = std::filesystem::weakly_canonical(path, ec);
    if (ec) {
        return std::filesystem::absolute(path, ec).lexically_normal();
    }
    return canonical;
}

Error MakeResourceError(const std::string& message, ErrorCategory category,
                        const std::string& uri) {
    return Error::Make("ReadResource", message, category, uri);
}

} // anonymous namespace

void to_json(nlohmann::json& j, const ResourceDescriptor& resource) {
    j = nlohmann::json{
        {"uri", resource.uri},
        {"name", resource.name},
        {"description", resource.description},
        {"mimeType", resource.mime_type},
    };
}

void to_json(nlohmann::json& j, const ResourceContents& contents) {
    j = nlohmann::json{{"uri", contents.uri}, {"mimeType", contents.mime_type}};
    if (contents.text) {
        j["text"] = *contents.text;
    }
    if (contents.blob) {
        j["blob"] = *contents.blob;
    }
}

FileSystemResourceProvider::FileSystemResourceProvider(
    std::vector<std::filesystem::path> roots)
    : roots_(std::move(roots)) {}

bool FileSystemResourceProvider::CanHandle(const std::string& uri) const {
    return uri.size() >= 7 && EqualsIgnoreCase(std::string_view(uri).substr(0, 7), kFileScheme);
}

std::vector<ResourceDescriptor> FileSystemResourceProvider::ListResources() const {
    std::vector<ResourceDescriptor> resources;
    for (const auto& root : roots_) {
        std::error_code ec;
        if (!std::filesystem::is_directory(root, ec)) {
            continue;
        }
        std::size_t listed = 0;
        const auto options = std::filesystem::directory_options::skip_permission_denied;
        for (std::filesystem::recursive_directory_iterator it(root, options, ec), end;
             !ec && it != end && listed < kMaxFilesPerRoot; it.increment(ec)) {
            std::error_code status_ec;
            if (!it->is_regular_file(status_ec)) {
                continue;
            }
            const auto& path = it->path();
            const auto size = it->file_size(status_ec);
            resources.push_back(ResourceDescriptor{
                PathToFileUri(path),
                path.filename().string(),
                path.lexically_relative(root).generic_string() + " (" +
                    FormatSize(status_ec ? 0 : size) + ")",
                MimeTypeFor(path),
            });
            ++listed;
        }
        if (ec) {
            LogWarn(kComponent, "Stopped listing " + root.string() + ": " + ec.message());
        }
    }
    return resources;
}

Result<ResourceContents, Error> FileSystemResourceProvider::ReadResource(
    const std::string& uri) const {
    using R = Result<ResourceContents, Error>;

    auto path_result = FileUriToPath(uri);
    if (path_result.IsErr()) {
        return R::Err(std::move(path_result).Error());
    }
    const auto path = Normalize(path_result.Value());

    if (!IsInsideRoot(path)) {
        return R::Err(MakeResourceError("Path is outside allowed directories",
                                        ErrorCategory::AccessDenied, uri));
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return R::Err(MakeResourceError("Resource not found: " + uri,
                                        ErrorCategory::NotFound, uri));
    }
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return R::Err(MakeResourceError("Cannot stat file: " + ec.message(),
                                        ErrorCategory::Io, uri));
    }
    if (size > kMaxReadBytes) {
        return R::Err(MakeResourceError(
            "File too large (" + std::to_string(size / 1024) + "KB). Maximum size is " +
                std::to_string(kMaxReadBytes / 1024) + "KB.",
            ErrorCategory::InvalidArgument, uri));
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return R::Err(MakeResourceError("Cannot open file", ErrorCategory::Io, uri));
    }
    std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    ResourceContents contents;
    contents.uri = uri;
    contents.mime_type = MimeTypeFor(path);
    if (IsTextMimeType(contents.mime_type)) {
        contents.text = std::move(bytes);
    } else {
        contents.blob = EncodeBase64(bytes);
    }
    return R::Ok(std::move(contents));
}

bool FileSystemResourceProvider::IsInsideRoot(const std::filesystem::path& path) const {
    for (const auto& root : roots_) {
        const auto normalized_root = Normalize(root);
        auto relative = path.lexically_relative(normalized_root);
        if (relative.empty()) {
            continue;
        }
        auto first = relative.begin();
        if (first != relative.end() && *first == "..") {
            continue;
        }
        return true;
    }
    return false;
}

std::string FileSystemResourceProvider::PathToFileUri(const std::filesystem::path& path) {
    std::error_code ec;
    auto uri_path = std::filesystem::absolute(path, ec).lexically_normal().generic_string();
    if (uri_path.empty() || uri_path.front() != '/') {
        uri_path.insert(uri_path.begin(), '/');
    }
    return kFileScheme + uri_path;
}

Result<std::filesystem::path, Error> FileSystemResourceProvider::FileUriToPath(
    const std::string& uri) {
    using R = Result<std::filesystem::path, Error>;
    if (uri.size() < 7 || !EqualsIgnoreCase(std::string_view(uri).substr(0, 7), kFileScheme)) {
        return R::Err(MakeResourceError("Not a file URI: " + uri,
                                        ErrorCategory::InvalidArgument, uri));
    }
    auto path = uri.substr(7);
    // file:///C:/... on Windows
    if (path.size() > 2 && path[0] == '/' && path[2] == ':') {
        path.erase(0, 1);
    }
    if (path.empty()) {
        return R::Err(MakeResourceError("Empty path in URI: " + uri,
                                        ErrorCategory::InvalidArgument, uri));
    }
    return R::Ok(std::filesystem::path(path));
}

std::string FileSystemResourceProvider::MimeTypeFor(const std::filesystem::path& path) {
    static const std::map<std::string, std::string> kMimeTypes = {
        {".txt", "text/plain"},          {".md", "text/markdown"},
        {".cpp", "text/x-c++"},          {".hpp", "text/x-c++"},
        {".h", "text/x-c"},              {".c", "text/x-c"},
        {".cs", "text/x-csharp"},        {".json", "application/json"},
        {".xml", "application/xml"},     {".html", "text/html"},
        {".htm", "text/html"},           {".css", "text/css"},
        {".js", "application/javascript"},
        {".ts", "application/typescript"},
        {".py", "text/x-python"},        {".yaml", "application/yaml"},
        {".yml", "application/yaml"},    {".csv", "text/csv"},
        {".log", "text/plain"},          {".sh", "text/x-shellscript"},
        {".sql", "application/sql"},     {".png", "image/png"},
        {".jpg", "image/jpeg"},          {".jpeg", "image/jpeg"},
        {".gif", "image/gif"},           {".pdf", "application/pdf"},
    };
    auto it = kMimeTypes.find(ToLower(path.extension().string()));
    return it != kMimeTypes.end() ? it->second : "application/octet-stream";
}

bool FileSystemResourceProvider::IsTextMimeType(const std::string& mime_type) {
    return mime_type.rfind("text/", 0) == 0 || mime_type == "application/json" ||
           mime_type == "application/xml" || mime_type == "application/yaml" ||
           mime_type == "application/sql" || mime_type == "application/javascript" ||
           mime_type == "application/typescript";
}

} // namespace mcp_host
