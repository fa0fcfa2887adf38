#ifndef PROJECTDOCUMENT_H
#define PROJECTDOCUMENT_H

#include <QString>
#include <QByteArray>
#include <QDateTime>
#include <QVector>
#include <QJsonObject>
#include "measurement.h"

// Persisted part of one image session
struct ProjectSessionState {
    QString name;
    QString imagePath;
    Calibration calibration;        // Omitted from the file when invalid
    ViewTransform transform;
    bool hasCustomTransform{false};
    int nextResultID{1};
    QVector<Measurement> results;   // Newest first
};

struct ProjectData {
    int version{1};
    QDateTime exportedAt;
    int activeIndex{-1};
    QVector<ProjectSessionState> sessions;
};

/**
 * @brief ProjectDocument - Reads and writes .sokucho project files
 *
 * The file is an indented JSON object. Unknown keys are ignored on read;
 * missing optional keys fall back to defaults.
 */
class ProjectDocument {
public:
    static constexpr int kVersion = 1;

    ProjectDocument();
    ~ProjectDocument();

    QByteArray toJson(const ProjectData& data) const;
    bool fromJson(const QByteArray& json, ProjectData& data);

    // Atomic write through QSaveFile
    bool write(const QString& filePath, const ProjectData& data);
    bool read(const QString& filePath, ProjectData& data);

    QString lastError() const { return m_lastError; }

    // Appends ".sokucho" unless the path already ends with it
    static QString ensureProjectExtension(const QString& filePath);

private:
    static QJsonObject measurementToJson(const Measurement& m);
    static bool measurementFromJson(const QJsonObject& obj, Measurement& m);
    static QJsonObject sessionToJson(const ProjectSessionState& s);
    static bool sessionFromJson(const QJsonObject& obj, ProjectSessionState& s);

    QString m_lastError;
};

#endif // PROJECTDOCUMENT_H
