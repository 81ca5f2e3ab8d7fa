#ifndef STYLERESOLVER_H
#define STYLERESOLVER_H

#include "captiontypes.h"
#include "stylepreset.h"

#include <QList>

// One row of the ASS [V4+ Styles] section
struct AssStyle
{
    QString name;
    QString fontName;
    int fontSize = 42;
    RgbaColor primaryColor;
    RgbaColor secondaryColor;
    RgbaColor outlineColor;
    RgbaColor backColor;
    bool bold = true;
    int borderStyle = 1; // 1 = outline + shadow, 3 = opaque box
    double outline = 0.0;
    double shadow = 0.0;
    int alignment = 2; // bottom center
    int marginV = 0;

    QString toAssLine() const;
};

struct ResolvedStyle
{
    QString styleId;
    bool isEmphasized = false;
};

/**
 * @brief Maps tokens to style ids and placement for one track
 *
 * Stateless lookups go through resolve(), the per-track slot counter lives in
 * nextSlot() and starts over for every resolver instance.
 */
class StyleResolver
{
public:
    static constexpr int EventsPerSlot = 8;

    StyleResolver(const StylePreset& preset, CaptionMode mode, int fontSizePx);

    static ResolvedStyle resolve(const StylePreset& preset, const WordToken& token, CaptionMode mode);
    ResolvedStyle resolve(const WordToken& token) const;

    // Slot for the next emitted event: primary for events 0..7, alternate for 8..15, ...
    VerticalSlot nextSlot();
    void reset();

    QList<AssStyle> styleSheet() const;

private:
    AssStyle baseStyle(const QString& name) const;

    const StylePreset& m_preset;
    CaptionMode m_mode;
    int m_fontSizePx;
    int m_emitted = 0;
};

#endif // STYLERESOLVER_H
