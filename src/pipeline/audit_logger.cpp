#include <mcp_host/pipeline/audit_logger.hpp>

#include <mcp_host/core/log.hpp>
#include <mcp_host/core/strings.hpp>

#include <array>
#include <cstdio>
#include <ctime>
#include <exception>
#include <system_error>

namespace mcp_host {

namespace {

constexpr const char* kComponent = "audit";
constexpr const char* kRedacted = "[REDACTED]";
constexpr const char* kFilePrefix = "audit-";
constexpr const char* kFileSuffix = ".jsonl";

constexpr std::array<const char*, 12> kSensitiveKeys = {
    "password", "pwd", "pass", "secret", "token", "key",
    "apikey", "api_key", "connectionstring", "connection_string",
    "authorization", "auth",
};

std::tm ToUtc(std::chrono::system_clock::time_point tp) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    return tm;
}

std::string FormatUtcDate(std::chrono::system_clock::time_point tp) {
    const auto tm = ToUtc(tp);
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", tm.tm_year + 1900,
                  tm.tm_mon + 1, tm.tm_mday);
    return buf;
}

// Days since 1970-01-01 for a proleptic Gregorian date.
long long DaysFromCivil(int y, unsigned m, unsigned d) {
    y -= m <= 2 ? 1 : 0;
    const int era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return static_cast<long long>(era) * 146097 + static_cast<long long>(doe) - 719468;
}

// Parses "audit-YYYY-MM-DD.jsonl" into a day number.
std::optional<long long> DayFromFileName(const std::string& name) {
    const std::string prefix = kFilePrefix;
    const std::string suffix = kFileSuffix;
    if (name.size() != prefix.size() + 10 + suffix.size() ||
        name.compare(0, prefix.size(), prefix) != 0 ||
        name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0) {
        return std::nullopt;
    }
    int y = 0;
    unsigned m = 0;
    unsigned d = 0;
    char tail = 0;
    const auto date = name.substr(prefix.size(), 10);
    if (std::sscanf(date.c_str(), "%4d-%2u-%2u%c", &y, &m, &d, &tail) != 3 ||
        m < 1 || m > 12 || d < 1 || d > 31) {
        return std::nullopt;
    }
    return DaysFromCivil(y, m, d);
}

long long DayOf(std::chrono::system_clock::time_point tp) {
    const auto tm = ToUtc(tp);
    return DaysFromCivil(tm.tm_year + 1900, static_cast<unsigned>(tm.tm_mon + 1),
                         static_cast<unsigned>(tm.tm_mday));
}

} // anonymous namespace

const char* AuditOutcomeName(AuditOutcome outcome) {
    switch (outcome) {
        case AuditOutcome::Success:      return "Success";
        case AuditOutcome::Failure:      return "Failure";
        case AuditOutcome::Timeout:      return "Timeout";
        case AuditOutcome::RateLimited:  return "RateLimited";
        case AuditOutcome::Unauthorized: return "Unauthorized";
        case AuditOutcome::CacheHit:     return "CacheHit";
    }
    return "Unknown";
}

std::string FormatUtcTimestamp(std::chrono::system_clock::time_point tp) {
    const auto tm = ToUtc(tp);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        tp.time_since_epoch()).count() % 1000;
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour,
                  tm.tm_min, tm.tm_sec, static_cast<int>(ms < 0 ? ms + 1000 : ms));
    return buf;
}

bool IsSensitiveKey(std::string_view key) {
    for (const auto* sensitive : kSensitiveKeys) {
        if (EqualsIgnoreCase(key, sensitive)) {
            return true;
        }
    }
    return false;
}

nlohmann::json SanitizeArguments(const nlohmann::json& arguments) {
    if (arguments.is_object()) {
        nlohmann::json sanitized = nlohmann::json::object();
        for (auto it = arguments.begin(); it != arguments.end(); ++it) {
            sanitized[it.key()] = IsSensitiveKey(it.key())
                                      ? nlohmann::json(kRedacted)
                                      : SanitizeArguments(it.value());
        }
        return sanitized;
    }
    if (arguments.is_array()) {
        nlohmann::json sanitized = nlohmann::json::array();
        for (const auto& item : arguments) {
            sanitized.push_back(SanitizeArguments(item));
        }
        return sanitized;
    }
    return arguments;
}

nlohmann::json ToJson(const AuditRecord& record) {
    nlohmann::json j;
    j["timestamp"] = FormatUtcTimestamp(record.timestamp);
    j["correlationId"] = record.correlation_id;
    j["toolName"] = record.tool_name;
    j["action"] = record.action ? nlohmann::json(*record.action) : nlohmann::json();
    j["identity"] = record.identity ? nlohmann::json(*record.identity) : nlohmann::json();
    j["arguments"] = SanitizeArguments(record.arguments);
    j["outcome"] = AuditOutcomeName(record.outcome);
    j["error"] = record.error ? nlohmann::json(*record.error) : nlohmann::json();
    j["durationMs"] = record.duration_ms;
    return j;
}

// ---------------------------------------------------------------------------
// FileAuditLogger
// ---------------------------------------------------------------------------
FileAuditLogger::FileAuditLogger(std::filesystem::path directory,
                                 int retention_days)
    : directory_(std::move(directory)), retention_days_(retention_days) {}

std::filesystem::path FileAuditLogger::FileFor(
    std::chrono::system_clock::time_point timestamp) const {
    return directory_ / (std::string(kFilePrefix) + FormatUtcDate(timestamp) + kFileSuffix);
}

void FileAuditLogger::Record(const AuditRecord& record) noexcept {
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        Append(record);
    } catch (const std::exception& e) {
        try {
            LogError(kComponent, std::string("Failed to write audit record: ") + e.what());
        } catch (const std::exception&) {
            // Nothing left to report to.
        }
    }
}

void FileAuditLogger::Append(const AuditRecord& record) {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        LogError(kComponent, "Cannot create audit directory " + directory_.string() +
                                 ": " + ec.message());
        return;
    }

    if (!purged_) {
        purged_ = true;
        PurgeExpired(std::chrono::system_clock::now());
    }

    const auto path = FileFor(record.timestamp);
    if (!current_.is_open() || path != current_path_) {
        if (current_.is_open()) {
            current_.close();
        }
        current_.clear();
        current_.open(path, std::ios::app);
        current_path_ = path;
        if (!current_.is_open()) {
            LogError(kComponent, "Cannot open audit file " + path.string());
            return;
        }
    }

    current_ << ToJson(record).dump() << '\n';
    current_.flush();
    if (!current_) {
        LogError(kComponent, "Write to audit file failed: " + path.string());
        current_.close();
    }
}

std::size_t FileAuditLogger::PurgeExpired(std::chrono::system_clock::time_point now) {
    if (retention_days_ <= 0) {
        return 0;
    }

    const long long cutoff = DayOf(now) - retention_days_;
    std::size_t removed = 0;
    std::error_code ec;
    for (std::filesystem::directory_iterator it(directory_, ec), end;
         !ec && it != end; it.increment(ec)) {
        const auto name = it->path().filename().string();
        auto day = DayFromFileName(name);
        if (!day || *day >= cutoff) {
            continue;
        }
        std::error_code remove_ec;
        if (std::filesystem::remove(it->path(), remove_ec)) {
            ++removed;
            LogDebug(kComponent, "Removed expired audit file " + name);
        } else if (remove_ec) {
            LogWarn(kComponent, "Cannot remove expired audit file " + name + ": " +
                                    remove_ec.message());
        }
    }
    return removed;
}

} // namespace mcp_host
