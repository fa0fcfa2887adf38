#include "projectdocument.h"
#include "appsettings.h"
#include <QJsonDocument>
#include <QJsonArray>
#include <QJsonParseError>
#include <QSaveFile>
#include <QFile>
#include <QFileInfo>
#include <QDir>
#include <QDebug>

namespace {
QJsonObject pointToJson(const QPointF& p)
{
    QJsonObject obj;
    obj["x"] = p.x();
    obj["y"] = p.y();
    return obj;
}

QPointF pointFromJson(const QJsonValue& v)
{
    const QJsonObject obj = v.toObject();
    return QPointF(obj["x"].toDouble(), obj["y"].toDouble());
}

QString timestampToString(const QDateTime& dt)
{
    return dt.toUTC().toString(Qt::ISODateWithMs);
}

QDateTime timestampFromString(const QString& s)
{
    QDateTime dt = QDateTime::fromString(s, Qt::ISODateWithMs);
    if (!dt.isValid()) dt = QDateTime::fromString(s, Qt::ISODate);
    return dt.isValid() ? dt.toUTC() : QDateTime();
}
}

ProjectDocument::ProjectDocument() {}

ProjectDocument::~ProjectDocument() {}

QJsonObject ProjectDocument::measurementToJson(const Measurement& m)
{
    QJsonObject obj;
    obj["id"] = m.id;
    obj["p1"] = pointToJson(m.p1);
    obj["p2"] = pointToJson(m.p2);
    obj["pixelLength"] = m.pixelLength;
    obj["createdAt"] = timestampToString(m.createdAt);
    return obj;
}

bool ProjectDocument::measurementFromJson(const QJsonObject& obj, Measurement& m)
{
    if (!obj.contains("id") || !obj.contains("p1") || !obj.contains("p2")) {
        return false;
    }
    m.id = obj["id"].toInt();
    if (m.id < 1 || m.id > kMaxResultId) return false;
    m.p1 = pointFromJson(obj["p1"]);
    m.p2 = pointFromJson(obj["p2"]);
    // Older files may lack the cached length
    if (obj.contains("pixelLength")) {
        m.pixelLength = obj["pixelLength"].toDouble();
    } else {
        const QPointF d = m.p2 - m.p1;
        m.pixelLength = qSqrt(d.x() * d.x() + d.y() * d.y());
    }
    m.createdAt = timestampFromString(obj["createdAt"].toString());
    return true;
}

QJsonObject ProjectDocument::sessionToJson(const ProjectSessionState& s)
{
    QJsonObject obj;
    obj["name"] = s.name;
    obj["imagePath"] = s.imagePath;
    if (s.calibration.isValid()) {
        QJsonObject cal;
        cal["unit"] = s.calibration.unit;
        cal["unitsPerPixel"] = s.calibration.unitsPerPixel;
        obj["calibration"] = cal;
    }

    QJsonObject transform;
    transform["scale"] = s.transform.scale;
    transform["tx"] = s.transform.tx;
    transform["ty"] = s.transform.ty;
    obj["transform"] = transform;
    obj["hasCustomTransform"] = s.hasCustomTransform;
    obj["nextResultID"] = s.nextResultID;

    QJsonArray resultsArray;
    for (const auto& m : s.results) {
        resultsArray.append(measurementToJson(m));
    }
    obj["results"] = resultsArray;
    return obj;
}

bool ProjectDocument::sessionFromJson(const QJsonObject& obj, ProjectSessionState& s)
{
    s.imagePath = obj["imagePath"].toString();
    if (s.imagePath.isEmpty()) return false;

    s.name = obj["name"].toString();
    if (s.name.isEmpty()) s.name = QFileInfo(s.imagePath).fileName();

    const QJsonObject cal = obj["calibration"].toObject();
    if (!cal.isEmpty()) {
        s.calibration.unit = cal["unit"].toString();
        s.calibration.unitsPerPixel = cal["unitsPerPixel"].toDouble();
        if (!s.calibration.isValid()) s.calibration = Calibration();
    }

    const QJsonObject transform = obj["transform"].toObject();
    s.transform.scale = transform["scale"].toDouble(1.0);
    s.transform.tx = transform["tx"].toDouble(0.0);
    s.transform.ty = transform["ty"].toDouble(0.0);
    if (!qIsFinite(s.transform.scale) || s.transform.scale <= 0.0) {
        s.transform.scale = 1.0;
    }
    s.transform.scale = qBound(kMinViewScale, s.transform.scale, kMaxViewScale);
    s.hasCustomTransform = obj["hasCustomTransform"].toBool(false);
    s.nextResultID = qBound(1, obj["nextResultID"].toInt(1), kMaxResultId);

    const QJsonArray resultsArray = obj["results"].toArray();
    for (const auto& val : resultsArray) {
        Measurement m;
        if (measurementFromJson(val.toObject(), m)) {
            s.results.append(m);
        }
    }
    return true;
}

QByteArray ProjectDocument::toJson(const ProjectData& data) const
{
    QJsonObject root;
    root["version"] = data.version;
    root["exportedAt"] = timestampToString(data.exportedAt.isValid()
                                           ? data.exportedAt
                                           : QDateTime::currentDateTimeUtc());
    root["activeIndex"] = data.activeIndex;

    QJsonArray sessionsArray;
    for (const auto& s : data.sessions) {
        sessionsArray.append(sessionToJson(s));
    }
    root["sessions"] = sessionsArray;

    QJsonDocument doc(root);
    return doc.toJson(QJsonDocument::Indented);
}

bool ProjectDocument::fromJson(const QByteArray& json, ProjectData& data)
{
    m_lastError.clear();

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);
    if (doc.isNull() || !doc.isObject()) {
        m_lastError = parseError.error != QJsonParseError::NoError
            ? QString("Invalid project file: %1").arg(parseError.errorString())
            : QString("Invalid project file: not a JSON object");
        return false;
    }

    const QJsonObject root = doc.object();
    if (!root.contains("sessions") || !root["sessions"].isArray()) {
        m_lastError = "Invalid project file: no sessions";
        return false;
    }

    ProjectData out;
    out.version = root["version"].toInt(kVersion);
    out.exportedAt = timestampFromString(root["exportedAt"].toString());
    out.activeIndex = root["activeIndex"].toInt(-1);

    const QJsonArray sessionsArray = root["sessions"].toArray();
    for (const auto& val : sessionsArray) {
        ProjectSessionState s;
        if (sessionFromJson(val.toObject(), s)) {
            out.sessions.append(s);
        }
    }

    data = out;
    return true;
}

bool ProjectDocument::write(const QString& filePath, const ProjectData& data)
{
    m_lastError.clear();

    const QFileInfo info(filePath);
    if (!QDir().mkpath(info.absolutePath())) {
        m_lastError = QString("Cannot create directory %1").arg(info.absolutePath());
        qWarning() << m_lastError;
        return false;
    }

    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        m_lastError = QString("Cannot write %1: %2").arg(filePath, file.errorString());
        qWarning() << m_lastError;
        return false;
    }
    const QByteArray json = toJson(data);
    if (file.write(json) != json.size()) {
        m_lastError = QString("Cannot write %1: %2").arg(filePath, file.errorString());
        file.cancelWriting();
        qWarning() << m_lastError;
        return false;
    }
    if (!file.commit()) {
        m_lastError = QString("Cannot write %1: %2").arg(filePath, file.errorString());
        qWarning() << m_lastError;
        return false;
    }

    qDebug() << "Project written:" << filePath << "sessions:" << data.sessions.size();
    return true;
}

bool ProjectDocument::read(const QString& filePath, ProjectData& data)
{
    m_lastError.clear();

    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        m_lastError = QString("Cannot open %1: %2").arg(filePath, file.errorString());
        return false;
    }
    const QByteArray json = file.readAll();
    file.close();

    return fromJson(json, data);
}

QString ProjectDocument::ensureProjectExtension(const QString& filePath)
{
    const QString ext = AppSettings::projectExtension();
    if (QFileInfo(filePath).suffix().compare(ext, Qt::CaseInsensitive) == 0) {
        return filePath;
    }
    return filePath + "." + ext;
}
