#include "router/walker.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "router/parser.hpp"
#include "router/registry.hpp"
#include <algorithm>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace Bext {

namespace {

bool isIndexName(const std::string &name) {
    return name.rfind("index.", 0) == 0;
}

} // namespace

auto readDirectory(const std::string &dir) -> std::vector<Dirent> {
    std::vector<Dirent> entries;
    for (const auto &entry : fs::directory_iterator(dir)) {
        std::error_code ec;
        const fs::file_status status = entry.symlink_status(ec);
        if (ec) {
            throw fs::filesystem_error("cannot stat directory entry", entry.path(), ec);
        }

        Dirent dirent;
        dirent.name = entry.path().filename().string();
        dirent.path = entry.path().string();
        dirent.is_symbolic_link = fs::is_symlink(status);
        dirent.is_file = fs::is_regular_file(status);
        dirent.is_directory = fs::is_directory(status);
        entries.push_back(std::move(dirent));
    }
    return entries;
}

void sortDirents(std::vector<Dirent> &entries) {
    std::sort(entries.begin(), entries.end(), [](const Dirent &a, const Dirent &b) {
        if (a.is_directory != b.is_directory) {
            return !a.is_directory;
        }
        if (!a.is_directory) {
            const bool a_index = isIndexName(a.name);
            const bool b_index = isIndexName(b.name);
            if (a_index != b_index) {
                return a_index;
            }
        }
        return a.name < b.name;
    });
}

void walk(const std::string &dir, const std::string &prefix, RouteMatcher &matcher) {
    std::vector<Dirent> entries;
    try {
        entries = readDirectory(dir);
    } catch (const fs::filesystem_error &e) {
        if (e.code() == std::errc::no_such_file_or_directory) {
            defaultLogger().debug("Routes directory not found, skipping: " + dir);
            return;
        }
        throw;
    }

    sortDirents(entries);

    for (const auto &entry : entries) {
        const std::string fullPath = (fs::path(dir) / entry.name).string();

        if (entry.is_directory) {
            const std::string nested = prefix.empty() ? entry.name : prefix + "/" + entry.name;
            walk(fullPath, nested, matcher);
        } else if (isRouteFile(entry.name)) {
            try {
                registerRouteFile(matcher, entry.name, fullPath, prefix);
            } catch (const std::exception &e) {
                defaultLogger().error("Failed to register route file " + fullPath + ": " +
                                      describeError(e));
                throw;
            }
        }
    }
}

} // namespace Bext
