#include "app/config.hpp"

#include <QDir>
#include <QSettings>
#include <QStandardPaths>
#include <QtGlobal>

#include <algorithm>

namespace arbor::app {

namespace {

constexpr const char* kSettingsCommitDebounceMs = "engine/commit_debounce_ms";
constexpr const char* kSettingsPageCacheCapacity = "engine/page_cache_capacity";
constexpr const char* kSettingsPageCacheTtlMinutes = "engine/page_cache_ttl_minutes";
constexpr const char* kSettingsVerifyInvariants = "engine/verify_invariants";

constexpr int kDefaultCommitDebounceMs = 300;
constexpr int kMaxCommitDebounceMs = 10000;
constexpr int kDefaultPageCacheCapacity = 50;
constexpr int kMaxPageCacheCapacity = 1000;
constexpr int kDefaultPageCacheTtlMinutes = 30;
constexpr int kMaxPageCacheTtlMinutes = 24 * 60;

bool env_flag(const char* name, bool fallback) {
    if (!qEnvironmentVariableIsSet(name)) return fallback;
    const auto value = qEnvironmentVariable(name).trimmed().toLower();
    return value == QStringLiteral("1") || value == QStringLiteral("true") ||
           value == QStringLiteral("yes") || value == QStringLiteral("on");
}

} // namespace

int normalize_commit_debounce_ms(int ms) {
    return std::clamp(ms, 0, kMaxCommitDebounceMs);
}

int normalize_page_cache_capacity(int capacity) {
    return std::clamp(capacity, 1, kMaxPageCacheCapacity);
}

int normalize_page_cache_ttl_minutes(int minutes) {
    return std::clamp(minutes, 1, kMaxPageCacheTtlMinutes);
}

EngineSettings load_engine_settings() {
    QSettings settings;
    EngineSettings out;

    auto debounce = settings.value(QString::fromLatin1(kSettingsCommitDebounceMs),
                                   kDefaultCommitDebounceMs).toInt();
    if (qEnvironmentVariableIsSet("ARBOR_COMMIT_DEBOUNCE_MS")) {
        bool ok = false;
        const auto env = qEnvironmentVariableIntValue("ARBOR_COMMIT_DEBOUNCE_MS", &ok);
        if (ok) debounce = env;
    }
    out.commit_debounce = std::chrono::milliseconds(normalize_commit_debounce_ms(debounce));

    out.page_cache_capacity = normalize_page_cache_capacity(
        settings.value(QString::fromLatin1(kSettingsPageCacheCapacity),
                       kDefaultPageCacheCapacity).toInt());
    out.page_cache_ttl = std::chrono::minutes(normalize_page_cache_ttl_minutes(
        settings.value(QString::fromLatin1(kSettingsPageCacheTtlMinutes),
                       kDefaultPageCacheTtlMinutes).toInt()));

    out.verify_invariants = env_flag("ARBOR_VERIFY_INVARIANTS",
        settings.value(QString::fromLatin1(kSettingsVerifyInvariants), false).toBool());

    return out;
}

void save_engine_settings(const EngineSettings& s) {
    QSettings settings;
    settings.setValue(QString::fromLatin1(kSettingsCommitDebounceMs),
                      normalize_commit_debounce_ms(static_cast<int>(s.commit_debounce.count())));
    settings.setValue(QString::fromLatin1(kSettingsPageCacheCapacity),
                      normalize_page_cache_capacity(s.page_cache_capacity));
    settings.setValue(QString::fromLatin1(kSettingsPageCacheTtlMinutes),
                      normalize_page_cache_ttl_minutes(static_cast<int>(s.page_cache_ttl.count())));
    settings.setValue(QString::fromLatin1(kSettingsVerifyInvariants), s.verify_invariants);
}

QString resolve_database_path() {
    const auto overridePath = qEnvironmentVariable("ARBOR_DB_PATH");
    if (!overridePath.isEmpty()) {
        return overridePath;
    }

    const auto dataPath = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (!QDir().mkpath(dataPath)) {
        return QDir::current().filePath(QStringLiteral("arbor.db"));
    }
    return QDir(dataPath).filePath(QStringLiteral("arbor.db"));
}

} // namespace arbor::app
