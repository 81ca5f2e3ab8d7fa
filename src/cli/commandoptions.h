#ifndef COMMANDOPTIONS_H
#define COMMANDOPTIONS_H

#include "jobrecord.h"
#include "stylepreset.h"

#include <QCommandLineParser>

void addCaptionOptions(QCommandLineParser& parser);

/**
 * @brief Fills JobOptions from the parsed command line
 *
 * Options that are not given keep the preset's own values: the preset's font
 * size, the default precision of the caption mode. When the default preset id
 * is missing from the table and --preset is not given, the first preset is used.
 */
bool readJobOptions(const QCommandLineParser& parser, const PresetTable& presets, JobOptions& options,
                    QString& error);

#endif // COMMANDOPTIONS_H
