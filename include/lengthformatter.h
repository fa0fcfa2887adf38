#ifndef LENGTHFORMATTER_H
#define LENGTHFORMATTER_H

#include <QString>
#include "measurement.h"

/**
 * @brief LengthFormatter - Calibration maths and significant-digit output
 *
 * All lengths are shown with a fixed number of significant digits. The
 * rounding policy is a user preference (see AppSettings::roundingMode()).
 */
class LengthFormatter
{
public:
    static constexpr int kDisplayDigits = 4;

    static double roundToSignificant(double value, int digits, RoundingMode mode);

    // "123.5", "0.0000" for zero, empty for NaN/inf
    static QString formatSignificant(double value, RoundingMode mode,
                                     int digits = kDisplayDigits);

    // Pixel length in calibrated units (raw pixels when uncalibrated)
    static double calibratedLength(double pixelLength, const Calibration& calibration);
    static QString unitLabel(const Calibration& calibration);

    // "1.235 µm" or "123.5 px"
    static QString formattedLength(double pixelLength, const Calibration& calibration,
                                   RoundingMode mode, int digits = kDisplayDigits);

    // "0.01000 µm/px"
    static QString scaleText(const Calibration& calibration, RoundingMode mode);

    /**
     * @brief Build a calibration from the scale dialog input
     * @param unit Unit text, empty means the default unit
     * @param lengthText Real length; ',' is accepted as decimal separator
     * @param pixelDistance Distance between the two scale clicks
     * @param result Receives the calibration on success
     * @param errorMessage Receives a reason on failure (optional)
     */
    static bool calibrationFromInput(const QString& unit, const QString& lengthText,
                                     double pixelDistance, Calibration& result,
                                     QString* errorMessage = nullptr);

    static QString defaultUnit();
};

#endif // LENGTHFORMATTER_H
