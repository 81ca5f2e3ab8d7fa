#include "commandoptions.h"

void addCaptionOptions(QCommandLineParser& parser)
{
    parser.addOption({"mode", "Caption mode: words or sentences.", "mode", "words"});
    parser.addOption({"show-filler", "Keep filler words on screen (dimmed)."});
    parser.addOption({"preset", "Style preset id.", "id"});
    parser.addOption({"font-size", "Font size in pixels (default: the preset's size).", "px"});
    parser.addOption({"precision", "Timing precision: mvp or enterprise.", "precision"});
    parser.addOption({"presets", "JSON file with style presets.", "file"});
    parser.addOption({"output-dir", "Directory for job results and capfuse.log.", "dir"});
    parser.addOption({"jobs", "Maximum number of parallel jobs.", "n"});
    parser.addOption({"clip-duration", "Clip length in seconds (caption command).", "seconds", "0"});
    parser.addOption({"alignment", "Forced aligner JSON to apply (caption command).", "file"});
    parser.addOption({"out", "Output .ass path (caption command).", "file", "captions.ass"});
}

bool readJobOptions(const QCommandLineParser& parser, const PresetTable& presets, JobOptions& options,
                    QString& error)
{
    bool ok = false;
    options.captionMode = captionModeFromString(parser.value("mode"), &ok);
    if (!ok)
    {
        error = "Unsupported caption mode: " + parser.value("mode");
        return false;
    }

    options.showFillerWords = parser.isSet("show-filler");

    if (parser.isSet("preset"))
    {
        options.presetId = parser.value("preset");
    }
    else if (!presets.find(options.presetId) && !presets.ids().isEmpty())
    {
        options.presetId = presets.ids().first();
    }

    if (parser.isSet("font-size"))
    {
        options.fontSizePx = parser.value("font-size").toInt(&ok);
        if (!ok)
        {
            error = "Font size is not a number: " + parser.value("font-size");
            return false;
        }
    }
    else if (const StylePreset* preset = presets.find(options.presetId))
    {
        options.fontSizePx = preset->fontSizePx;
    }

    if (parser.isSet("precision"))
    {
        options.precision = precisionFromString(parser.value("precision"), &ok);
        if (!ok)
        {
            error = "Unsupported precision: " + parser.value("precision");
            return false;
        }
    }
    else
    {
        options.precision = JobOptions::defaultPrecisionFor(options.captionMode);
    }
    return true;
}
