#include "part_catalog.h"
#include "errors.h"
#include "file_util.h"
#include "geometry.h"
#include <algorithm>
#include <filesystem>
#include <sstream>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

std::string partKey(const std::string& fileName, double thicknessMm) {
    return toUpper(trim(fileName)) + "|" + formatThickness(thicknessMm);
}

bool lessIgnoreCase(const std::string& a, const std::string& b) {
    return toUpper(a) < toUpper(b);
}

std::optional<PartRecord> parseRecordRow(const std::string& line, const std::string& folderPath) {
    auto cols = splitCsv(line);
    if (cols.size() < 3) return std::nullopt;

    PartRecord r;
    r.fileName = trim(cols[0]);
    if (r.fileName.empty()) return std::nullopt;
    if (!parseDouble(cols[1], r.thicknessMm)) return std::nullopt;
    if (!parseInt(cols[2], r.quantity) || r.quantity < 0 || r.quantity > kMaxQuantity)
        return std::nullopt;

    fs::path folder(folderPath);
    r.sourceFolder = folder.filename().string();
    if (r.sourceFolder.empty())  // trailing separator
        r.sourceFolder = folder.parent_path().filename().string();
    r.sourcePath = (folder / r.fileName).string();
    return r;
}

void PartCatalogAggregator::addFolder(const std::string& folderPath) {
    fs::path csv = fs::path(folderPath) / kPartsFileName;
    std::error_code ec;
    if (!fs::is_regular_file(csv, ec)) {
        spdlog::debug("[CATALOG] {}: no {}", folderPath, kPartsFileName);
        ++foldersWithoutRecords_;
        return;
    }

    std::vector<std::string> lines;
    try {
        lines = readLines(csv.string());
    } catch (const std::exception& ex) {
        spdlog::warn("[CATALOG] {}", ex.what());
        ++foldersWithoutRecords_;
        return;
    }

    size_t dataRows = 0;
    for (size_t i = 1; i < lines.size(); ++i) {
        if (trim(lines[i]).empty()) continue;
        ++dataRows;
        ++rowsRead_;
        auto rec = parseRecordRow(lines[i], folderPath);
        if (!rec) {
            ++rowsSkipped_;
            spdlog::warn("[CATALOG] {}:{}: malformed row skipped: {}", csv.string(), i + 1, lines[i]);
            continue;
        }
        if (!addRecord(*rec)) {
            ++rowsSkipped_;
            spdlog::warn("[CATALOG] {}:{}: total for {} would exceed {}, row skipped",
                         csv.string(), i + 1, rec->fileName, kMaxQuantity);
        }
    }
    if (dataRows == 0) {
        spdlog::debug("[CATALOG] {}: header only", csv.string());
        ++foldersWithoutRecords_;
    }
}

bool PartCatalogAggregator::addRecord(const PartRecord& r) {
    if (r.quantity < 0 || r.quantity > kMaxQuantity) return false;
    std::string key = partKey(r.fileName, r.thicknessMm);
    auto it = index_.find(key);
    if (it == index_.end()) {
        UniquePart p;
        p.fileName = r.fileName;
        p.thicknessMm = r.thicknessMm;
        p.totalQuantity = r.quantity;
        p.representativeSourcePath = r.sourcePath;
        p.sourceFolder = r.sourceFolder;
        index_.emplace(std::move(key), parts_.size());
        parts_.push_back(std::move(p));
        return true;
    }
    long long& total = parts_[it->second].totalQuantity;
    if (r.quantity > kMaxQuantity - total) return false;
    total += r.quantity;
    return true;
}

std::vector<UniquePart> PartCatalogAggregator::catalog() const {
    std::vector<UniquePart> out = parts_;
    std::stable_sort(out.begin(), out.end(), [](const UniquePart& a, const UniquePart& b) {
        long long ta = thousandths(a.thicknessMm), tb = thousandths(b.thicknessMm);
        if (ta != tb) return ta < tb;
        return lessIgnoreCase(a.fileName, b.fileName);
    });
    return out;
}

std::string summaryText(const std::vector<UniquePart>& parts) {
    std::ostringstream ss;
    ss << kSummaryHeader << "\n";
    for (const auto& p : parts)
        ss << p.fileName << ',' << formatThickness(p.thicknessMm) << ','
           << p.totalQuantity << ',' << p.sourceFolder << "\n";
    return ss.str();
}

void writeSummary(const std::string& path, const std::vector<UniquePart>& parts) {
    writeFileAtomically(path, summaryText(parts));
}

std::vector<UniquePart> readSummary(const std::string& path, const std::string& baseDir) {
    auto lines = readLines(path);
    std::vector<UniquePart> out;
    for (size_t i = 1; i < lines.size(); ++i) {
        if (trim(lines[i]).empty()) continue;
        auto cols = splitCsv(lines[i]);
        UniquePart p;
        if (cols.size() < 4 || !parseDouble(cols[1], p.thicknessMm) ||
            !parseInt(cols[2], p.totalQuantity)) {
            spdlog::warn("[CATALOG] {}:{}: unreadable summary row", path, i + 1);
            continue;
        }
        p.fileName = trim(cols[0]);
        p.sourceFolder = trim(cols[3]);
        p.representativeSourcePath = (fs::path(baseDir) / p.sourceFolder / p.fileName).string();
        out.push_back(std::move(p));
    }
    return out;
}

std::vector<std::pair<double, std::vector<UniquePart>>>
groupByThickness(const std::vector<UniquePart>& catalog) {
    std::vector<std::pair<double, std::vector<UniquePart>>> groups;
    std::unordered_map<long long, size_t> slot;
    for (const auto& p : catalog) {
        long long t = thousandths(p.thicknessMm);
        auto it = slot.find(t);
        if (it == slot.end()) {
            slot.emplace(t, groups.size());
            groups.push_back({ p.thicknessMm, {} });
            it = slot.find(t);
        }
        groups[it->second].second.push_back(p);
    }
    return groups;
}
