#include "nest_log.h"
#include "geometry.h"
#include <filesystem>
#include <iomanip>
#include <memory>
#include <sstream>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>

namespace fs = std::filesystem;

// "0.###"
static std::string mm(double v) { return formatThickness(v); }

std::string nestLogPath(const std::string& drawingPath) {
    fs::path p(drawingPath);
    return (p.parent_path() / (p.stem().string() + "_nest_log.txt")).string();
}

std::string nestLogEntry(const NestReport& r) {
    const NestOptions& o = r.options;
    double placedArea = 0.0;
    for (const auto& s : r.layout.sheets) placedArea += s.usedArea;

    std::ostringstream ss;
    ss << "Nest run: " << fs::path(r.sourcePath).filename().string() << "\n";
    ss << "  Sheet: " << mm(o.sheetWidth) << " x " << mm(o.sheetHeight) << " mm\n";
    if (r.thicknessMm) ss << "  Thickness(mm): " << mm(*r.thicknessMm) << "\n";
    ss << "  Gap(mm): " << mm(o.partGap) << "\n";
    ss << "  Margin(mm): " << mm(o.sheetMargin) << "\n";
    ss << "  Sheets used: " << r.sheets << "\n";
    ss << "  Total parts: " << r.instances << "\n";
    ss << std::fixed << std::setprecision(3);
    ss << "  Placed area(m2): " << placedArea / 1e6 << "\n";
    ss << std::setprecision(1) << "  Fill:";
    for (size_t i = 0; i < r.layout.sheets.size(); ++i)
        ss << (i ? ", " : " ") << sheetFillPercent(r.layout.sheets[i]) << "%";
    ss << "\n";
    ss << "  Output: " << fs::path(r.outputPath).filename().string() << "\n";
    ss << std::string(70, '-');
    return ss.str();
}

void appendNestLog(const std::string& logPath, const std::string& entry) {
    auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logPath, false);
    spdlog::logger log("nest_log", sink);
    log.set_pattern("[%Y-%m-%d %H:%M:%S] %v");
    log.info("{}", entry);
    log.flush();
}
