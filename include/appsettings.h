#ifndef APPSETTINGS_H
#define APPSETTINGS_H

#include <QString>
#include "measurement.h"

class AppSettings {
public:
    // Length display
    static RoundingMode roundingMode();
    static void setRoundingMode(RoundingMode mode);
    static QString roundingModeName(RoundingMode mode);   // "round" / "ceil"
    static QString roundingModeLabel(RoundingMode mode);  // UI label

    // Picking behaviour
    static bool continuousMeasure();
    static void setContinuousMeasure(bool on);
    static bool edgeSnap();
    static void setEdgeSnap(bool on);

    // Autosave / recovery file
    static QString autosavePath();

    // Project files
    static QString projectExtension();
};

#endif // APPSETTINGS_H
