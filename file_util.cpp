#include "file_util.h"
#include "errors.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    size_t end = s.find_last_not_of(" \t\r\n");
    return (start == std::string::npos) ? "" : s.substr(start, end - start + 1);
}

std::string toUpper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

std::vector<std::string> splitCsv(const std::string& line) {
    std::vector<std::string> cols;
    size_t start = 0;
    while (true) {
        size_t pos = line.find(',', start);
        if (pos == std::string::npos) {
            cols.push_back(line.substr(start));
            break;
        }
        cols.push_back(line.substr(start, pos - start));
        start = pos + 1;
    }
    return cols;
}

bool parseDouble(const std::string& s, double& out) {
    std::string t = trim(s);
    if (t.empty()) return false;
    try {
        size_t used = 0;
        double v = std::stod(t, &used);
        if (used != t.size() || !std::isfinite(v)) return false;
        out = v;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parseInt(const std::string& s, long long& out) {
    std::string t = trim(s);
    if (t.empty()) return false;
    try {
        size_t used = 0;
        long long v = std::stoll(t, &used, 10);
        if (used != t.size()) return false;
        out = v;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

std::vector<std::string> readLines(const std::string& path) {
    std::ifstream fin(path, std::ios::binary);
    if (!fin)
        throw std::runtime_error("cannot open " + path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(fin, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(std::move(line));
    }
    if (fin.bad())
        throw std::runtime_error("read error on " + path);
    return lines;
}

void writeFileAtomically(const std::string& path, const std::string& content) {
    fs::path target(path);
    fs::path tmp = target;
    tmp += ".tmp";
    {
        std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
        if (!f)
            throw PersistenceError("cannot create " + tmp.string());
        f << content;
        f.flush();
        if (!f) {
            f.close();
            std::error_code ec;
            fs::remove(tmp, ec);
            throw PersistenceError("write failed for " + tmp.string());
        }
    }
    std::error_code ec;
    fs::rename(tmp, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw PersistenceError("cannot replace " + target.string() + ": " + ec.message());
    }
}
