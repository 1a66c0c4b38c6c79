#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

// One data row of a job folder's parts.csv.
struct PartRecord {
    std::string fileName;
    double thicknessMm = 0.0;
    long long quantity = 0;
    std::string sourceFolder;   // job folder name
    std::string sourcePath;     // <job folder>/<fileName>
};

// Deduplicated catalog entry. Identity and representative data come from the
// first record seen for the key.
struct UniquePart {
    std::string fileName;
    double thicknessMm = 0.0;
    long long totalQuantity = 0;
    std::string representativeSourcePath;
    std::string sourceFolder;
};

constexpr const char* kPartsFileName = "parts.csv";
constexpr const char* kSummaryFileName = "all_parts.csv";
constexpr const char* kSummaryHeader = "FileName,PlateThickness_mm,Quantity,Folder";

// Largest quantity accepted in a row and as a merged total.
constexpr long long kMaxQuantity = 1000000;

// Key of (file name, thickness): trimmed upper-case name plus "0.###" thickness.
std::string partKey(const std::string& fileName, double thicknessMm);

// Parses "fileName,thicknessMm,quantity[,...]". Returns nullopt for a
// malformed row, including a quantity above kMaxQuantity. `folderPath` is the job folder the row came from.
std::optional<PartRecord> parseRecordRow(const std::string& line, const std::string& folderPath);

// Case-insensitive ascending comparison, used for the catalog order.
bool lessIgnoreCase(const std::string& a, const std::string& b);

class PartCatalogAggregator {
public:
    // Reads <folder>/parts.csv if present. Never throws for bad content.
    void addFolder(const std::string& folderPath);
    // False, and nothing changes, when the merged total would pass kMaxQuantity.
    bool addRecord(const PartRecord& r);

    // Catalog sorted by thickness, then case-insensitive file name.
    std::vector<UniquePart> catalog() const;

    bool empty() const { return parts_.empty(); }
    size_t rowsRead() const { return rowsRead_; }
    size_t rowsSkipped() const { return rowsSkipped_; }
    size_t foldersWithoutRecords() const { return foldersWithoutRecords_; }

private:
    std::vector<UniquePart> parts_;                 // first-seen order
    std::unordered_map<std::string, size_t> index_; // key -> parts_ slot
    size_t rowsRead_ = 0;
    size_t rowsSkipped_ = 0;
    size_t foldersWithoutRecords_ = 0;
};

// Summary table text ("\n" line endings, header first).
std::string summaryText(const std::vector<UniquePart>& parts);
// Writes the summary atomically. Throws PersistenceError.
void writeSummary(const std::string& path, const std::vector<UniquePart>& parts);
// Reads a summary written by writeSummary back. Source paths are rebuilt as
// <baseDir>/<Folder>/<FileName>. Throws std::runtime_error if unreadable.
std::vector<UniquePart> readSummary(const std::string& path, const std::string& baseDir);

// Distinct thicknesses of a sorted catalog, with the parts of each.
std::vector<std::pair<double, std::vector<UniquePart>>>
groupByThickness(const std::vector<UniquePart>& catalog);
