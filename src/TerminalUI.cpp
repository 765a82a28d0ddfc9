#include "TerminalUI.h"
#include "CommonUtils.h"
#include <iomanip>
#include <sstream>

namespace {
// Restores the caller's float formatting on scope exit.
class StreamFormatGuard {
public:
    explicit StreamFormatGuard(std::ostream& os) : os_(os), flags_(os.flags()), precision_(os.precision()) {
        os_ << std::fixed << std::setprecision(4);
    }
    ~StreamFormatGuard() {
        os_.flags(flags_);
        os_.precision(precision_);
    }

private:
    std::ostream& os_;
    std::ios_base::fmtflags flags_;
    std::streamsize precision_;
};
} // namespace

std::string TerminalUI::formatDistance(double km) {
    std::ostringstream os;
    os << km << "km";
    return os.str();
}

void TerminalUI::printHeaders(const std::string& label, const Row& header, std::ostream& os) {
    os << label << " Headers: [" << CommonUtils::joinList(header) << "]\n";
}

void TerminalUI::printFilteredCount(const std::string& country, const std::string& label, size_t count, std::ostream& os) {
    os << "Filtered " << country << " Records in " << label << ": " << count << "\n";
}

void TerminalUI::printJoinSummary(size_t joined, size_t dangling, double maxDistanceKm, std::ostream& os) {
    const std::string within = formatDistance(maxDistanceKm);
    os << "Joined Records (within " << within << "): " << joined << "\n";
    os << "Dangling Records (no match within " << within << "): " << dangling << "\n";
}

void TerminalUI::printPreview(const std::string& targetLabel, const RegressionFit& fit, std::ostream& os) {
    if (fit.preview.empty()) return;
    os << "\nSample Normalized Data (First " << fit.preview.size() << " values):\n";
    StreamFormatGuard guard(os);
    for (size_t i = 0; i < fit.preview.size(); ++i) {
        os << "y[" << i << "] (" << targetLabel << "): " << fit.preview[i].first
           << ", x[" << i << "] (Normalized Predictor): " << fit.preview[i].second << "\n";
    }
}

void TerminalUI::printModel(const std::string& targetLabel, const RegressionFit& fit, std::ostream& os) {
    StreamFormatGuard guard(os);
    os << "\nRegression Model (Normalized): " << targetLabel << " = " << fit.result.alpha
       << " + " << fit.result.beta << " * Predictor\n";
    os << "R-squared (Normalized): " << fit.result.rSquared << "\n";
}
