#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

#include <QDate>
#include <QDateTime>
#include <QRegularExpression>
#include <QTime>
#include <QTimeZone>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace rewind {

// Whole seconds are written as 2024-05-01T10:00:00Z; a sub-second part is
// kept as microseconds.
inline std::string toIso8601Utc(std::chrono::system_clock::time_point timestamp)
{
    const auto seconds = std::chrono::time_point_cast<std::chrono::seconds>(timestamp);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(timestamp - seconds);
    std::time_t time = std::chrono::system_clock::to_time_t(seconds);
    if (micros.count() < 0) {
        micros += std::chrono::seconds(1);
        --time;
    }
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &time);
#else
    gmtime_r(&time, &tm);
#endif
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (micros.count() != 0) {
        out << '.' << std::setw(6) << std::setfill('0') << micros.count();
    }
    out << 'Z';
    return out.str();
}

// Accepts an optional fraction and an optional Z or +hh:mm offset. A value
// without an offset is local time. Unparseable input yields the epoch.
inline std::chrono::system_clock::time_point fromIso8601(const std::string &value)
{
    static const QRegularExpression pattern(QStringLiteral(
        "^(\\d{4}-\\d{2}-\\d{2})T(\\d{2}:\\d{2}:\\d{2})(?:\\.(\\d+))?"
        "(Z|[+-]\\d{2}:?\\d{2})?$"));
    const QRegularExpressionMatch match = pattern.match(QString::fromStdString(value).trimmed());
    if (!match.hasMatch()) {
        return std::chrono::system_clock::time_point{};
    }

    const QDate date = QDate::fromString(match.captured(1), Qt::ISODate);
    const QTime time = QTime::fromString(match.captured(2), QStringLiteral("HH:mm:ss"));
    if (!date.isValid() || !time.isValid()) {
        return std::chrono::system_clock::time_point{};
    }

    const QString zone = match.captured(4);
    QDateTime dateTime;
    if (zone.isEmpty()) {
        dateTime = QDateTime(date, time);
    } else if (zone == QStringLiteral("Z")) {
        dateTime = QDateTime(date, time, QTimeZone::utc());
    } else {
        const QString digits = QString(zone).remove(QLatin1Char(':'));
        const int offset = digits.mid(1, 2).toInt() * 3600 + digits.mid(3, 2).toInt() * 60;
        dateTime = QDateTime(date, time,
                             QTimeZone(digits.startsWith(QLatin1Char('-')) ? -offset : offset));
    }

    // Fraction scaled to microseconds; extra digits are dropped.
    const QString fraction = match.captured(3).left(6).leftJustified(6, QLatin1Char('0'));
    const qint64 micros = match.captured(3).isEmpty() ? 0 : fraction.toLongLong();

    return std::chrono::system_clock::time_point(std::chrono::seconds(dateTime.toSecsSinceEpoch()))
        + std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::microseconds(micros));
}

// Current time truncated to whole seconds, so new records carry no fraction.
inline std::chrono::system_clock::time_point nowSeconds()
{
    return std::chrono::time_point_cast<std::chrono::seconds>(
        std::chrono::system_clock::now());
}

inline std::string toSnapshotKindString(SnapshotKind kind)
{
    switch (kind) {
    case SnapshotKind::Plain:
        return "snapshot";
    case SnapshotKind::Restore:
        return "restore";
    case SnapshotKind::StashApply:
        return "stash_apply";
    }
    return "snapshot";
}

inline std::optional<SnapshotKind> parseSnapshotKindString(const std::string &value)
{
    if (value == "snapshot") {
        return SnapshotKind::Plain;
    }
    if (value == "restore") {
        return SnapshotKind::Restore;
    }
    if (value == "stash_apply") {
        return SnapshotKind::StashApply;
    }
    return std::nullopt;
}

inline void to_json(nlohmann::json &j, const Snapshot &snapshot)
{
    j = nlohmann::json{
        {"id", snapshot.id},
        {"message", snapshot.message},
        {"timestamp", toIso8601Utc(snapshot.timestamp)},
        {"auto", snapshot.automatic},
        {"branch", snapshot.branch},
        {"type", toSnapshotKindString(snapshot.kind())}
    };
    if (const auto *restore = snapshot.restore()) {
        j["restored_from"] = restore->restoredFrom;
        j["source_branch"] = restore->sourceBranch;
        if (restore->preRestoreSnapshot.has_value()) {
            j["pre_restore_snapshot"] = *restore->preRestoreSnapshot;
        } else {
            j["pre_restore_snapshot"] = nullptr;
        }
    } else if (const auto *apply = snapshot.stashApply()) {
        j["stash_applied"] = apply->stashApplied;
    }
}

inline void from_json(const nlohmann::json &j, Snapshot &snapshot)
{
    snapshot.id = j.value("id", "");
    snapshot.message = j.value("message", "");
    snapshot.timestamp = fromIso8601(j.value("timestamp", ""));
    snapshot.automatic = j.contains("auto") && j.at("auto").is_boolean()
        && j.at("auto").get<bool>();
    snapshot.branch = j.value("branch", "");

    // Older documents only tag stash applications; infer the rest.
    std::optional<SnapshotKind> kind;
    if (j.contains("type") && j.at("type").is_string()) {
        kind = parseSnapshotKindString(j.at("type").get<std::string>());
    }
    if (!kind.has_value()) {
        if (j.contains("restored_from")) {
            kind = SnapshotKind::Restore;
        } else if (j.contains("stash_applied")) {
            kind = SnapshotKind::StashApply;
        } else {
            kind = SnapshotKind::Plain;
        }
    }

    switch (*kind) {
    case SnapshotKind::Plain:
        snapshot.details = std::monostate{};
        break;
    case SnapshotKind::Restore: {
        RestoreDetails restore;
        restore.restoredFrom = j.value("restored_from", "");
        restore.sourceBranch = j.value("source_branch", "");
        if (j.contains("pre_restore_snapshot") && j.at("pre_restore_snapshot").is_string()) {
            restore.preRestoreSnapshot = j.at("pre_restore_snapshot").get<std::string>();
        }
        snapshot.details = restore;
        break;
    }
    case SnapshotKind::StashApply:
        snapshot.details = StashApplyDetails{j.value("stash_applied", "")};
        break;
    }
}

inline void to_json(nlohmann::json &j, const Stash &stash)
{
    j = nlohmann::json{
        {"id", stash.id},
        {"message", stash.message},
        {"timestamp", toIso8601Utc(stash.timestamp)},
        {"branch", stash.branch},
        {"type", "stash"}
    };
}

inline void from_json(const nlohmann::json &j, Stash &stash)
{
    stash.id = j.value("id", "");
    stash.message = j.value("message", "");
    stash.timestamp = fromIso8601(j.value("timestamp", ""));
    stash.branch = j.value("branch", "");
}

// The branch name is the key in the document, not a field.
inline void to_json(nlohmann::json &j, const Branch &branch)
{
    j = nlohmann::json{
        {"created", toIso8601Utc(branch.created)},
        {"description", branch.description},
        {"snapshots", branch.snapshots}
    };
    if (branch.parent.has_value()) {
        j["parent"] = *branch.parent;
    }
}

inline void from_json(const nlohmann::json &j, Branch &branch)
{
    branch.created = fromIso8601(j.value("created", ""));
    branch.description = j.value("description", "");
    if (j.contains("parent") && j.at("parent").is_string()) {
        branch.parent = j.at("parent").get<std::string>();
    } else {
        branch.parent.reset();
    }
    if (j.contains("snapshots") && j.at("snapshots").is_array()) {
        branch.snapshots = j.at("snapshots").get<std::vector<Snapshot>>();
    } else {
        branch.snapshots.clear();
    }
}

inline void to_json(nlohmann::json &j, const TimelineState &state)
{
    nlohmann::json branches = nlohmann::json::object();
    for (const auto &entry : state.branches) {
        branches[entry.first] = entry.second;
    }
    j = nlohmann::json{
        {"branches", branches},
        {"current_branch", state.currentBranch},
        {"stashes", state.stashes}
    };
}

inline void from_json(const nlohmann::json &j, TimelineState &state)
{
    state.branches.clear();
    for (const auto &item : j.at("branches").items()) {
        Branch branch = item.value().get<Branch>();
        branch.name = item.key();
        state.branches.emplace(item.key(), std::move(branch));
    }
    state.currentBranch = j.value("current_branch", "main");
    if (state.currentBranch.empty()) {
        state.currentBranch = "main";
    }
    if (j.contains("stashes") && j.at("stashes").is_array()) {
        state.stashes = j.at("stashes").get<std::vector<Stash>>();
    } else {
        state.stashes.clear();
    }
}

// A document we can decode needs an object root with an object of branches.
inline bool isTimelineDocument(const nlohmann::json &j)
{
    return j.is_object() && j.contains("branches") && j.at("branches").is_object();
}

inline void to_json(nlohmann::json &j, const BranchSummary &summary)
{
    j = nlohmann::json{
        {"name", summary.name},
        {"current", summary.isCurrent},
        {"created", toIso8601Utc(summary.created)},
        {"description", summary.description},
        {"snapshots", summary.snapshotCount}
    };
}

} // namespace rewind
