#include "styleresolver.h"

QString AssStyle::toAssLine() const
{
    // Name, Fontname, Fontsize, PrimaryColour, SecondaryColour, OutlineColour, BackColour,
    // Bold, Italic, Underline, StrikeOut, ScaleX, ScaleY, Spacing, Angle, BorderStyle,
    // Outline, Shadow, Alignment, MarginL, MarginR, MarginV, Encoding
    return QString("Style: %1,%2,%3,%4,%5,%6,%7,%8,0,0,0,100,100,0,0,%9,")
               .arg(name, fontName)
               .arg(fontSize)
               .arg(primaryColor.toAss(), secondaryColor.toAss(), outlineColor.toAss(), backColor.toAss())
               .arg(bold ? -1 : 0)
               .arg(borderStyle) +
           QString("%1,%2,%3,10,10,%4,1").arg(outline).arg(shadow).arg(alignment).arg(marginV);
}

StyleResolver::StyleResolver(const StylePreset& preset, CaptionMode mode, int fontSizePx)
    : m_preset(preset), m_mode(mode), m_fontSizePx(fontSizePx > 0 ? fontSizePx : preset.fontSizePx)
{
}

ResolvedStyle StyleResolver::resolve(const StylePreset& preset, const WordToken& token, CaptionMode mode)
{
    ResolvedStyle resolved;
    if (mode == CaptionMode::Sentences)
    {
        resolved.styleId = preset.id;
        resolved.isEmphasized = false;
    }
    else if (token.active)
    {
        resolved.styleId = preset.activeStyleId;
        resolved.isEmphasized = true;
    }
    else
    {
        resolved.styleId = preset.inactiveStyleId;
        resolved.isEmphasized = false;
    }
    return resolved;
}

ResolvedStyle StyleResolver::resolve(const WordToken& token) const
{
    return resolve(m_preset, token, m_mode);
}

VerticalSlot StyleResolver::nextSlot()
{
    const VerticalSlot slot = (m_emitted / EventsPerSlot) % 2 == 0 ? VerticalSlot::Primary : VerticalSlot::Alternate;
    ++m_emitted;
    return slot;
}

void StyleResolver::reset()
{
    m_emitted = 0;
}

AssStyle StyleResolver::baseStyle(const QString& name) const
{
    AssStyle style;
    style.name = name;
    style.fontName = m_preset.fontFamily;
    style.fontSize = m_fontSizePx;
    style.primaryColor = m_preset.fillColor;
    style.secondaryColor = m_preset.accentColor;
    style.outlineColor = m_preset.outlineColor;
    style.backColor = m_preset.backColor;
    style.bold = m_preset.bold;
    style.outline = m_preset.hasOutline ? m_preset.outlineWidth : 0.0;
    style.shadow = m_preset.shadow;

    // ASS has no gradient fill: a two-tone glow, outline in the first color, shadow in the second
    if (m_preset.gradient)
    {
        style.borderStyle = 1;
        style.outlineColor = m_preset.gradientFrom;
        style.backColor = m_preset.gradientTo;
        style.outline = qMax(style.outline, 3.0);
        style.shadow = qMax(style.shadow, 2.0);
        return style;
    }

    // No outline but a visible background: libass draws an opaque box in OutlineColour
    if (!m_preset.hasOutline && !m_preset.backColor.isTransparent())
    {
        style.borderStyle = 3;
        style.outlineColor = m_preset.backColor;
        style.outline = qMax(m_preset.outlineWidth, 4.0);
    }
    return style;
}

QList<AssStyle> StyleResolver::styleSheet() const
{
    QList<AssStyle> sheet;

    if (m_mode == CaptionMode::Sentences)
    {
        sheet << baseStyle(m_preset.id);
        return sheet;
    }

    // \k fills from SecondaryColour to PrimaryColour while the word is spoken
    AssStyle active = baseStyle(m_preset.activeStyleId);
    active.primaryColor = m_preset.accentColor;
    active.secondaryColor = m_preset.fillColor;
    if (active.borderStyle == 3)
    {
        // the accent is already the box color, keep the text readable on it
        active.primaryColor = m_preset.fillColor;
    }
    sheet << active;

    AssStyle inactive = baseStyle(m_preset.inactiveStyleId);
    inactive.primaryColor = m_preset.fillColor.withAlpha(m_preset.fillColor.a / 2);
    inactive.secondaryColor = inactive.primaryColor;
    inactive.shadow = 0.0;
    if (inactive.borderStyle == 3)
    {
        inactive.borderStyle = 1;
        inactive.outline = 0.0;
        inactive.outlineColor = m_preset.outlineColor;
    }
    sheet << inactive;

    return sheet;
}
