#pragma once

#include <QDateTime>
#include <QString>
#include <QVariantMap>

#include <map>
#include <vector>

namespace rinkguide {
namespace schedule {

struct EventRecord
{
    int surfaceId = 0;
    QDateTime start;
    QDateTime end;
    QString title;
    QString description;
    QString eventType;
    QVariantMap rawData; // provider fields, diagnostics only
};

struct ProgrammeBlock
{
    QDateTime start;
    QDateTime end;
    QString title;
};

inline bool operator==(const ProgrammeBlock &lhs, const ProgrammeBlock &rhs)
{
    return lhs.start == rhs.start && lhs.end == rhs.end && lhs.title == rhs.title;
}

using GroupedEvents = std::map<int, std::vector<EventRecord>>;

} // namespace schedule
} // namespace rinkguide
