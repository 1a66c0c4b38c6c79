#pragma once
#include <stdexcept>
#include <string>
#include <utility>

// Bad sheet size or layout constants. Fatal for the run.
struct ConfigurationError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// A plate larger than the usable sheet area. Raised before any placement.
struct FitError : std::runtime_error {
    FitError(const std::string& msg, std::string part, double w, double h,
             double usableW, double usableH)
        : std::runtime_error(msg), partName(std::move(part)), width(w), height(h),
          usableWidth(usableW), usableHeight(usableH) {}
    std::string partName;
    double width;
    double height;
    double usableWidth;
    double usableHeight;
};

struct DrawingOpenError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct PersistenceError : std::runtime_error {
    using std::runtime_error::runtime_error;
};
