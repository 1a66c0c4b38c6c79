#pragma once
#include "pipeline.h"
#include <string>

// <dir>/<stem>_nest_log.txt
std::string nestLogPath(const std::string& drawingPath);

// One run record: sheet size, gap, margin, sheets used, parts, placed area,
// fill per sheet and the output file.
std::string nestLogEntry(const NestReport& r);

// Appends a timestamped entry through an spdlog file sink.
// Throws spdlog::spdlog_ex when the file cannot be opened.
void appendNestLog(const std::string& logPath, const std::string& entry);
