#include "path_selector.hpp"
#include <format>
#include <stdexcept>
#include <utility>

namespace {

constexpr char kSeparator = '/';

std::string stripLeadingSeparators(const std::string& path) {
    size_t start = path.find_first_not_of(kSeparator);
    return start == std::string::npos ? std::string() : path.substr(start);
}

}

PathSelector::PathSelector(Kind kind, std::string path) : kind_(kind), path_(std::move(path)) {}

PathSelector PathSelector::file(const std::string& path) {
    std::string relative = stripLeadingSeparators(path);
    if (relative.empty()) {
        throw std::invalid_argument(std::format("A file path must not be empty: '{}'", path));
    }
    if (relative.back() == kSeparator) {
        throw std::invalid_argument(std::format("A file path must not end with a directory separator: '{}'", path));
    }
    return PathSelector(Kind::File, relative);
}

PathSelector PathSelector::directory(const std::string& path) {
    if (path.empty() || path.back() != kSeparator) {
        throw std::invalid_argument(std::format("A directory path must end with a directory separator: '{}'", path));
    }
    std::string relative = stripLeadingSeparators(path);
    if (relative.empty()) {
        return PathSelector();
    }
    return PathSelector(Kind::Directory, relative);
}

PathSelector PathSelector::parse(const std::string& path) {
    if (path.empty()) {
        return PathSelector();
    }
    if (path.back() == kSeparator) {
        return directory(path);
    }
    return file(path);
}

PathSelector PathSelector::parentDirectory() const {
    if (kind_ != Kind::File) {
        throw std::logic_error("Only file selectors have a parent directory");
    }
    size_t slash = path_.rfind(kSeparator);
    if (slash == std::string::npos) {
        return PathSelector();
    }
    return directory(path_.substr(0, slash + 1));
}

std::string PathSelector::appendTo(const std::string& root) const {
    std::string base = root;
    while (base.size() > 1 && base.back() == kSeparator) {
        base.pop_back();
    }
    if (base == "/") {
        base.clear();
    }
    return base + kSeparator + path_;
}
