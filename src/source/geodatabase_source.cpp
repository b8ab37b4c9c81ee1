#include "source/geodatabase_source.hpp"
#include "core/errors.hpp"
#include "io/gdal_utils.hpp"
#include <cpl_string.h>
#include <algorithm>
#include <sstream>

namespace geosplit {
namespace source {

namespace {

bool hasGdbSuffix(const std::string& segment) {
    return segment.size() > 4 && EQUAL(segment.c_str() + segment.size() - 4, ".gdb");
}

std::string lastSegment(const std::string& path) {
    size_t slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

} // namespace

GeodatabaseSource::GeodatabaseSource(const core::SourceDescriptor& descriptor, const SourceOptions& options)
    : VectorFileSource(descriptor, options,
                       geodatabasePath(descriptor.uri, options.gdb_name.empty() ? descriptor.locator : options.gdb_name),
                       {"OpenFileGDB", "FileGDB"}) {
}

std::vector<std::string> GeodatabaseSource::listMembers(const std::vector<std::string>& entries) {
    std::vector<std::string> members;
    for (const auto& entry : entries) {
        // First path segment ending in .gdb is the member directory
        std::string prefix;
        std::istringstream segments(entry);
        std::string segment;
        while (std::getline(segments, segment, '/')) {
            if (segment.empty()) {
                continue;
            }
            prefix = prefix.empty() ? segment : prefix + "/" + segment;
            if (hasGdbSuffix(segment)) {
                if (std::find(members.begin(), members.end(), prefix) == members.end()) {
                    members.push_back(prefix);
                }
                break;
            }
        }
    }
    std::sort(members.begin(), members.end());
    return members;
}

std::string GeodatabaseSource::resolveMember(const std::vector<std::string>& entries, const std::string& gdb_name) {
    std::vector<std::string> members = listMembers(entries);

    if (gdb_name.empty()) {
        if (members.size() == 1) {
            return members.front();
        }
        if (members.empty()) {
            throw core::ConfigurationError("Archive contains no .gdb directory");
        }
        std::ostringstream oss;
        oss << "Archive contains " << members.size() << " geodatabases, set gdb_name to one of:";
        for (const auto& member : members) {
            oss << " " << member;
        }
        throw core::ConfigurationError(oss.str());
    }

    const std::string wanted = hasGdbSuffix(gdb_name) ? gdb_name : gdb_name + ".gdb";
    for (const auto& member : members) {
        if (EQUAL(member.c_str(), wanted.c_str()) || EQUAL(lastSegment(member).c_str(), wanted.c_str())) {
            return member;
        }
    }
    throw core::ConfigurationError("Geodatabase " + wanted + " not found in archive");
}

std::string GeodatabaseSource::geodatabasePath(const std::string& uri, const std::string& gdb_name) {
    const std::string path = io::GDALUtils::toGdalPath(uri);
    std::string trimmed = path;
    while (!trimmed.empty() && trimmed.back() == '/') {
        trimmed.pop_back();
    }
    if (hasGdbSuffix(trimmed)) {
        return trimmed;
    }

    return path + "/" + resolveMember(io::GDALUtils::listRecursive(path), gdb_name);
}

} // namespace source
} // namespace geosplit
