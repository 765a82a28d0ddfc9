#include "TableLoader.h"
#include "CommonUtils.h"
#include "FlarejoinExceptions.h"

#include <cstdlib>
#include <ctime>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <functional>
#include <sstream>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

namespace {
// PATH entries are searched in order; empty entries are ignored.
std::filesystem::path resolveTool(const std::string& tool) {
    const char* pathEnv = std::getenv("PATH");
    if (tool.empty() || !pathEnv) return {};

    for (const auto& dir : CommonUtils::splitList(pathEnv, ':')) {
        std::filesystem::path candidate = std::filesystem::path(dir) / tool;
        std::error_code ec;
        if (std::filesystem::is_regular_file(candidate, ec) && ::access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
    }
    return {};
}

// Removes the converted CSV when the load finishes, successfully or not.
class TempFileGuard {
public:
    TempFileGuard() = default;
    TempFileGuard(const TempFileGuard&) = delete;
    TempFileGuard& operator=(const TempFileGuard&) = delete;
    ~TempFileGuard() {
        if (path_.empty()) return;
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }
    void track(std::string path) { path_ = std::move(path); }

private:
    std::string path_;
};

struct Conversion {
    std::string tool;
    std::vector<std::string> args;
};

bool conversionFor(const std::string& sourcePath, Conversion& out) {
    const std::string ext = CommonUtils::toLower(std::filesystem::path(sourcePath).extension().string());
    if (ext == ".xlsx") {
        out = {"xlsx2csv", {sourcePath}};
        return true;
    }
    if (ext == ".xls") {
        out = {"xls2csv", {sourcePath}};
        return true;
    }
    if (ext == ".gz") {
        out = {"gzip", {"-cd", sourcePath}};
        return true;
    }
    if (ext == ".zip") {
        out = {"unzip", {"-p", sourcePath}};
        return true;
    }
    return false;
}

// Runs the converter with stdout captured in a fresh temp CSV and returns its path.
std::string convertToTempCsv(const std::string& sourcePath, const Conversion& conversion) {
    const std::filesystem::path tool = resolveTool(conversion.tool);
    if (tool.empty()) {
        throw Flarejoin::IOException(conversion.tool + " is required to read " + sourcePath + " but was not found on PATH");
    }

    const auto stamp = std::hash<std::string>{}(sourcePath + std::to_string(std::time(nullptr)) +
                                                std::to_string(::getpid()));
    const std::string tmp = (std::filesystem::temp_directory_path() /
        ("flarejoin_input_" + std::to_string(static_cast<unsigned long long>(stamp)) + ".csv")).string();

    std::vector<std::string> argvStorage{tool.string()};
    argvStorage.insert(argvStorage.end(), conversion.args.begin(), conversion.args.end());
    std::vector<char*> argv;
    for (auto& arg : argvStorage) argv.push_back(arg.data());
    argv.push_back(nullptr);

    int exitCode = -1;
    const int outFd = ::open(tmp.c_str(), O_CREAT | O_WRONLY | O_TRUNC, 0600);
    if (outFd >= 0) {
        const pid_t child = ::fork();
        if (child == 0) {
            // Converter diagnostics are dropped; only the exit status is reported.
            const int devNull = ::open("/dev/null", O_WRONLY);
            if (devNull >= 0) ::dup2(devNull, STDERR_FILENO);
            if (::dup2(outFd, STDOUT_FILENO) < 0) _exit(127);
            ::execv(argv[0], argv.data());
            _exit(127);
        }
        ::close(outFd);

        int status = 0;
        if (child > 0 && ::waitpid(child, &status, 0) == child && WIFEXITED(status)) {
            exitCode = WEXITSTATUS(status);
        }
    }

    if (exitCode != 0) {
        std::error_code ec;
        std::filesystem::remove(tmp, ec);
        throw Flarejoin::IOException(conversion.tool + " failed to convert " + sourcePath +
                                     " (exit code " + std::to_string(exitCode) + ")");
    }
    return tmp;
}
} // namespace

Table TableLoader::loadCsv(std::istream& is, char delimiter, const std::string& sourceName,
                           CSVUtils::ReadSummary* summary) {
    auto rows = CSVUtils::readRecords(is, delimiter, summary);
    if (is.bad()) {
        throw Flarejoin::IOException("read failure in " + sourceName);
    }
    if (rows.empty()) {
        throw Flarejoin::DatasetException(sourceName + " contains no rows");
    }
    return Table(std::move(rows));
}

Table TableLoader::load(const std::string& path, char delimiter, LoadSummary* summary) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw Flarejoin::IOException("Could not open file: " + path);
    }

    LoadSummary local;
    local.sourcePath = path;
    local.parsedPath = path;

    TempFileGuard tempGuard;
    Conversion conversion;
    const bool converted = conversionFor(path, conversion);
    if (converted) {
        local.converter = conversion.tool;
        local.parsedPath = convertToTempCsv(path, conversion);
        tempGuard.track(local.parsedPath);
    }

    std::ifstream file(local.parsedPath, std::ios::binary);
    if (!file) {
        throw Flarejoin::IOException("Could not open file: " + local.parsedPath);
    }

    // Spreadsheet converters always emit comma-separated text.
    const bool fromSpreadsheet = conversion.tool == "xlsx2csv" || conversion.tool == "xls2csv";
    const char effectiveDelimiter = fromSpreadsheet ? ',' : delimiter;
    Table table;
    if (conversion.tool == "xls2csv") {
        // xls2csv separates worksheets with a form feed; keep the first sheet.
        std::ostringstream buffer;
        buffer << file.rdbuf();
        std::string text = buffer.str();
        const size_t sheetBreak = text.find('\f');
        if (sheetBreak != std::string::npos) text.erase(sheetBreak);
        std::istringstream firstSheet(text);
        table = loadCsv(firstSheet, effectiveDelimiter, path, &local.csv);
    } else {
        table = loadCsv(file, effectiveDelimiter, path, &local.csv);
    }

    if (summary) *summary = local;
    return table;
}
