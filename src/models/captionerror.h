#ifndef CAPTIONERROR_H
#define CAPTIONERROR_H

#include <QString>

enum class CaptionErrorKind
{
    None,
    InputMalformed,             // transcript empty or not time-ordered
    ExternalStageFailed,        // extraction / ASR / alignment / render failed or left no artifact
    ConfigurationInvalid,       // unknown preset, font size out of bounds, unsupported mode
    InternalInvariantViolation  // smoother or builder broke an ordering guarantee
};

struct CaptionError
{
    CaptionErrorKind kind = CaptionErrorKind::None;
    QString message;
    QString diagnostics; // exit code, stderr tail, offending token...

    bool isError() const
    {
        return kind != CaptionErrorKind::None;
    }

    static CaptionError make(CaptionErrorKind kind, const QString& message, const QString& diagnostics = QString())
    {
        CaptionError error;
        error.kind = kind;
        error.message = message;
        error.diagnostics = diagnostics;
        return error;
    }
};

inline QString captionErrorKindToString(CaptionErrorKind kind)
{
    switch (kind)
    {
    case CaptionErrorKind::None:
        return "None";
    case CaptionErrorKind::InputMalformed:
        return "InputMalformed";
    case CaptionErrorKind::ExternalStageFailed:
        return "ExternalStageFailed";
    case CaptionErrorKind::ConfigurationInvalid:
        return "ConfigurationInvalid";
    case CaptionErrorKind::InternalInvariantViolation:
        return "InternalInvariantViolation";
    }
    return "None";
}

#endif // CAPTIONERROR_H
