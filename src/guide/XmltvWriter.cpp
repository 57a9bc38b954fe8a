#include "rinkguide/guide/XmltvWriter.hpp"

#include "rinkguide/core/Logging.hpp"
#include "rinkguide/guide/GuideText.hpp"
#include "rinkguide/schedule/ScheduleCache.hpp"
#include "rinkguide/schedule/TimelineBuilder.hpp"

#include <QXmlStreamWriter>

#include <cstdlib>

namespace rinkguide {
namespace guide {

using schedule::ProgrammeBlock;

namespace {

void writeTextElement(QXmlStreamWriter &writer, const QString &name, const QString &text)
{
    writer.writeStartElement(name);
    writer.writeAttribute(QStringLiteral("lang"), QStringLiteral("en"));
    writer.writeCharacters(xmlSafeText(text));
    writer.writeEndElement();
}

} // namespace

QString formatXmltvTime(const QDateTime &value)
{
    const int offset = value.offsetFromUtc();
    const int minutes = std::abs(offset) / 60;
    return QStringLiteral("%1 %2%3%4")
        .arg(value.toString(QStringLiteral("yyyyMMddhhmmss")))
        .arg(offset < 0 ? QStringLiteral("-") : QStringLiteral("+"))
        .arg(minutes / 60, 2, 10, QLatin1Char('0'))
        .arg(minutes % 60, 2, 10, QLatin1Char('0'));
}

std::vector<ProgrammeBlock> programmesFor(const catalog::SurfaceInfo &surface,
                                          const schedule::ScheduleSnapshot &snapshot,
                                          const GuideOptions &options)
{
    const auto &events = snapshot.eventsFor(surface.surfaceId);
    if (events.empty() && options.livePlaceholder) {
        return {{options.now.addSecs(-6 * 60 * 60), options.now.addSecs(18 * 60 * 60),
                 QStringLiteral("LIVE: %1").arg(channelTitle(surface))}};
    }

    QDateTime windowStart = snapshot.windowStart;
    QDateTime windowEnd = snapshot.windowEnd;
    if (!windowStart.isValid() || !windowEnd.isValid()) {
        const auto window = schedule::ScheduleCache::refreshWindow(options.now);
        windowStart = window.first;
        windowEnd = window.second;
    }
    return schedule::buildTimeline(events, windowStart, windowEnd);
}

QByteArray buildXmltv(const std::vector<catalog::SurfaceInfo> &favorites,
                      const schedule::ScheduleSnapshot &snapshot,
                      const GuideOptions &options)
{
    QByteArray output;
    QXmlStreamWriter writer(&output);
    writer.setAutoFormatting(true);
    writer.setAutoFormattingIndent(2);

    writer.writeStartDocument();
    writer.writeStartElement(QStringLiteral("tv"));
    writer.writeAttribute(QStringLiteral("generator-info-name"), QStringLiteral("Rink Guide"));
    if (!options.generatorUrl.isEmpty()) {
        writer.writeAttribute(QStringLiteral("generator-info-url"), options.generatorUrl);
    }

    for (const auto &surface : favorites) {
        writer.writeStartElement(QStringLiteral("channel"));
        writer.writeAttribute(QStringLiteral("id"), QString::number(surface.surfaceId));
        writer.writeTextElement(QStringLiteral("display-name"), channelTitle(surface));
        writer.writeEndElement();
    }

    int scheduled = 0;
    for (const auto &surface : favorites) {
        const QString channelId = QString::number(surface.surfaceId);
        const QString label = QStringLiteral("%1 - %2").arg(surface.venueName, surface.surfaceName);
        if (!snapshot.eventsFor(surface.surfaceId).empty()) {
            ++scheduled;
        }

        for (const ProgrammeBlock &block : programmesFor(surface, snapshot, options)) {
            const bool filler = schedule::isFillerBlock(block);

            writer.writeStartElement(QStringLiteral("programme"));
            writer.writeAttribute(QStringLiteral("start"), formatXmltvTime(block.start));
            writer.writeAttribute(QStringLiteral("stop"), formatXmltvTime(block.end));
            writer.writeAttribute(QStringLiteral("channel"), channelId);

            writeTextElement(writer, QStringLiteral("title"), block.title);
            writeTextElement(writer,
                             QStringLiteral("desc"),
                             filler ? QStringLiteral("Open practice time at %1").arg(label)
                                    : QStringLiteral("%1 at %2").arg(block.title, label));
            if (!filler) {
                writeTextElement(writer, QStringLiteral("category"), QStringLiteral("Sports"));
                writeTextElement(writer, QStringLiteral("category"), QStringLiteral("Ice Hockey"));
                writeTextElement(writer, QStringLiteral("category"), QStringLiteral("Livebarn"));
                writer.writeEmptyElement(QStringLiteral("live"));
            }
            writer.writeEndElement();
        }
    }

    writer.writeEndElement();
    writer.writeEndDocument();

    qCInfo(lcGuide) << "XMLTV guide built for" << favorites.size() << "channels," << scheduled << "with schedules";
    return output;
}

} // namespace guide
} // namespace rinkguide
