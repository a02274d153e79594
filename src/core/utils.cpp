#include "gvpreview/core/utils.hpp"
#include "gvpreview/core/errors.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <random>
#include <regex>
#include <sstream>

namespace gvpreview::core {

std::string get_iso_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    gmtime_r(&time_t_now, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

std::string get_run_id() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    std::tm tm_buf;
    localtime_r(&time_t_now, &tm_buf);

    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y%m%d_%H%M%S") << '_';

    const char* hex = "0123456789abcdef";
    for (int i = 0; i < 8; ++i) {
        oss << hex[dis(gen)];
    }

    return oss.str();
}

namespace {

template <typename Iterator>
void collect_matches(Iterator it, const fs::path& root, const std::string& pattern,
                     std::vector<fs::path>& files) {
    std::error_code ec;
    for (; it != Iterator(); it.increment(ec)) {
        if (ec) {
            throw IOError("Cannot list directory: " + root.string() + ": " + ec.message());
        }
        if (!it->is_regular_file(ec)) {
            continue;
        }
        if (glob_match(pattern, it->path().filename().string())) {
            files.push_back(it->path());
        }
    }
    if (ec) {
        throw IOError("Cannot list directory: " + root.string() + ": " + ec.message());
    }
}

} // namespace

std::vector<fs::path> discover_files(const fs::path& root, const std::string& pattern,
                                     bool recursive) {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        throw IOError("Not a directory: " + root.string());
    }

    std::vector<fs::path> files;
    if (recursive) {
        fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            throw IOError("Cannot list directory: " + root.string() + ": " + ec.message());
        }
        collect_matches(it, root, pattern, files);
    } else {
        fs::directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            throw IOError("Cannot list directory: " + root.string() + ": " + ec.message());
        }
        collect_matches(it, root, pattern, files);
    }

    // Order by file name; the full path only breaks ties between subdirectories.
    std::sort(files.begin(), files.end(), [](const fs::path& a, const fs::path& b) {
        const std::string fa = a.filename().string();
        const std::string fb = b.filename().string();
        if (fa != fb) return fa < fb;
        return a < b;
    });
    return files;
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
        ++start;
    }
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }
    return s.substr(start, end - start);
}

bool glob_match(const std::string& pattern, const std::string& str) {
    std::string regex_pattern;
    for (char c : pattern) {
        switch (c) {
            case '*': regex_pattern += ".*"; break;
            case '?': regex_pattern += "."; break;
            case '[': regex_pattern += "["; break;
            case ']': regex_pattern += "]"; break;
            case '.': case '+': case '(': case ')': case '{': case '}':
            case '^': case '$': case '|': case '\\':
                regex_pattern += '\\';
                regex_pattern += c;
                break;
            default: regex_pattern += c; break;
        }
    }

    std::regex re(regex_pattern, std::regex::icase);
    return std::regex_match(str, re);
}

} // namespace gvpreview::core
