#pragma once
#include <string>
#include <vector>

std::string trim(const std::string& s);
std::string toUpper(std::string s);
std::vector<std::string> splitCsv(const std::string& line);

// Strict numeric parsing: the whole (trimmed) field must be consumed.
bool parseDouble(const std::string& s, double& out);
bool parseInt(const std::string& s, long long& out);

// Reads all lines, stripping '\r'. Throws std::runtime_error if unreadable.
std::vector<std::string> readLines(const std::string& path);

// Writes `content` to a sibling temp file and renames it over `path`, so a
// reader never sees a half written file. Throws PersistenceError.
void writeFileAtomically(const std::string& path, const std::string& content);
