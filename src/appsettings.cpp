#include "appsettings.h"
#include <QSettings>
#include <QStandardPaths>
#include <QDir>

static QString roundingKey()   { return QStringLiteral("measure/rounding"); }
static QString continuousKey() { return QStringLiteral("measure/continuous"); }
static QString edgeSnapKey()   { return QStringLiteral("measure/edgeSnap"); }

RoundingMode AppSettings::roundingMode()
{
    QSettings s;
    const QString raw = s.value(roundingKey(), QStringLiteral("round")).toString();
    return raw == QLatin1String("ceil") ? RoundingMode::Ceil : RoundingMode::Round;
}

void AppSettings::setRoundingMode(RoundingMode mode)
{
    QSettings s;
    s.setValue(roundingKey(), roundingModeName(mode));
}

QString AppSettings::roundingModeName(RoundingMode mode)
{
    return mode == RoundingMode::Ceil ? QStringLiteral("ceil") : QStringLiteral("round");
}

QString AppSettings::roundingModeLabel(RoundingMode mode)
{
    return mode == RoundingMode::Ceil ? QStringLiteral("Round up") : QStringLiteral("Round half up");
}

bool AppSettings::continuousMeasure()
{
    QSettings s;
    return s.value(continuousKey(), false).toBool();
}

void AppSettings::setContinuousMeasure(bool on)
{
    QSettings s;
    s.setValue(continuousKey(), on);
}

bool AppSettings::edgeSnap()
{
    QSettings s;
    return s.value(edgeSnapKey(), false).toBool();
}

void AppSettings::setEdgeSnap(bool on)
{
    QSettings s;
    s.setValue(edgeSnapKey(), on);
}

QString AppSettings::autosavePath()
{
    const QString baseDir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    QDir().mkpath(baseDir);
    return baseDir + "/last-project." + projectExtension();
}

QString AppSettings::projectExtension()
{
    return QStringLiteral("sokucho");
}
