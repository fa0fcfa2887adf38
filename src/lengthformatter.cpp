#include "lengthformatter.h"
#include <QtMath>
#include <cmath>

namespace {
double applyRounding(double value, RoundingMode mode)
{
    if (mode == RoundingMode::Ceil) {
        // Away from zero, so negative values grow in magnitude too
        return value < 0.0 ? std::floor(value) : std::ceil(value);
    }
    return std::round(value);
}
}

double LengthFormatter::roundToSignificant(double value, int digits, RoundingMode mode)
{
    if (!qIsFinite(value) || value == 0.0) return value;

    const double exponent = std::floor(std::log10(std::fabs(value)));
    const int shift = digits - static_cast<int>(exponent) - 1;

    if (shift >= 0) {
        const double factor = std::pow(10.0, shift);
        // Subnormal values cannot be scaled up; they are left as they are
        if (!qIsFinite(factor)) return value;
        return applyRounding(value * factor, mode) / factor;
    }
    const double factor = std::pow(10.0, -shift);
    return applyRounding(value / factor, mode) * factor;
}

QString LengthFormatter::formatSignificant(double value, RoundingMode mode, int digits)
{
    if (!qIsFinite(value)) return QString();

    const QString zero = QStringLiteral("0.") + QString(digits, QChar('0'));
    if (value == 0.0) return zero;

    const double rounded = roundToSignificant(value, digits, mode);
    if (!qIsFinite(rounded)) return QString();
    if (rounded == 0.0) return zero;

    const int exponent = static_cast<int>(std::floor(std::log10(std::fabs(rounded))));
    const int decimals = qMax(0, digits - exponent - 1);
    return QString::number(rounded, 'f', decimals);
}

double LengthFormatter::calibratedLength(double pixelLength, const Calibration& calibration)
{
    if (!calibration.isValid()) return pixelLength;
    return pixelLength * calibration.unitsPerPixel;
}

QString LengthFormatter::unitLabel(const Calibration& calibration)
{
    return calibration.isValid() ? calibration.unit : QStringLiteral("px");
}

QString LengthFormatter::formattedLength(double pixelLength, const Calibration& calibration,
                                         RoundingMode mode, int digits)
{
    return QString("%1 %2")
        .arg(formatSignificant(calibratedLength(pixelLength, calibration), mode, digits),
             unitLabel(calibration));
}

QString LengthFormatter::scaleText(const Calibration& calibration, RoundingMode mode)
{
    if (!calibration.isValid()) return QStringLiteral("Not set");
    return QString("%1 %2/px").arg(formatSignificant(calibration.unitsPerPixel, mode),
                                   calibration.unit);
}

bool LengthFormatter::calibrationFromInput(const QString& unit, const QString& lengthText,
                                           double pixelDistance, Calibration& result,
                                           QString* errorMessage)
{
    if (!qIsFinite(pixelDistance) || pixelDistance <= 0.0) {
        if (errorMessage) *errorMessage = QStringLiteral("No scale distance has been picked.");
        return false;
    }

    QString normalized = lengthText.trimmed();
    normalized.replace(',', '.');
    bool ok = false;
    const double realLength = normalized.toDouble(&ok);
    if (!ok || !qIsFinite(realLength) || realLength <= 0.0) {
        if (errorMessage) *errorMessage = QStringLiteral("Invalid scale length. Enter a positive number.");
        return false;
    }

    const double unitsPerPixel = realLength / pixelDistance;
    if (!qIsFinite(unitsPerPixel) || unitsPerPixel <= 0.0) {
        if (errorMessage) *errorMessage = QStringLiteral("Invalid scale length. Enter a positive number.");
        return false;
    }

    const QString trimmedUnit = unit.trimmed();
    result.unit = trimmedUnit.isEmpty() ? defaultUnit() : trimmedUnit;
    result.unitsPerPixel = unitsPerPixel;
    return true;
}

QString LengthFormatter::defaultUnit()
{
    return QString::fromUtf8("\xC2\xB5m");
}
