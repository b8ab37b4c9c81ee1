#include "io/gdal_utils.hpp"
#include <gdal.h>
#include <cpl_conv.h>
#include <cpl_error.h>
#include <cpl_string.h>
#include <cpl_vsi.h>
#include <algorithm>
#include <iostream>
#include <mutex>
#include <cstring>

namespace geosplit {
namespace io {

namespace {

bool startsWith(const std::string& value, const std::string& prefix) {
    return value.compare(0, prefix.size(), prefix) == 0;
}

bool endsWithIgnoreCase(const std::string& value, const std::string& suffix) {
    if (value.size() < suffix.size()) {
        return false;
    }
    return EQUAL(value.c_str() + value.size() - suffix.size(), suffix.c_str());
}

} // namespace

void GDALUtils::registerDrivers() {
    static std::once_flag registered;
    std::call_once(registered, []() {
        GDALAllRegister();
    });
}

bool GDALUtils::isDriverAvailable(const std::string& driver_name) {
    registerDrivers();
    GDALDriver* driver = GetGDALDriverManager()->GetDriverByName(driver_name.c_str());
    return driver != nullptr;
}

std::string GDALUtils::toGdalPath(const std::string& uri, bool open_archives) {
    std::string path;

    if (startsWith(uri, "/vsi")) {
        path = uri;
    } else if (startsWith(uri, "gs://")) {
        path = "/vsigs/" + uri.substr(5);
    } else if (startsWith(uri, "s3://")) {
        path = "/vsis3/" + uri.substr(5);
    } else if (startsWith(uri, "http://") || startsWith(uri, "https://")) {
        path = "/vsicurl/" + uri;
    } else {
        path = uri;
    }

    if (open_archives && endsWithIgnoreCase(path, ".zip") && !startsWith(path, "/vsizip/")) {
        path = "/vsizip/" + path;
    }

    return path;
}

GDALDatasetUniquePtr GDALUtils::openDataset(const std::string& path, unsigned int open_flags,
                                            const std::vector<std::string>& allowed_drivers) {
    registerDrivers();

    std::vector<const char*> driver_list;
    for (const auto& name : allowed_drivers) {
        if (isDriverAvailable(name)) {
            driver_list.push_back(name.c_str());
        }
    }
    driver_list.push_back(nullptr);

    GDALDataset* dataset = GDALDataset::Open(path.c_str(), open_flags | GDAL_OF_READONLY,
                                             allowed_drivers.empty() ? nullptr : driver_list.data(),
                                             nullptr, nullptr);
    return GDALDatasetUniquePtr(dataset);
}

std::vector<std::string> GDALUtils::listRecursive(const std::string& path) {
    std::vector<std::string> entries;
    char** listing = VSIReadDirRecursive(path.c_str());
    if (!listing) {
        return entries;
    }

    for (int i = 0; listing[i] != nullptr; ++i) {
        entries.emplace_back(listing[i]);
    }
    CSLDestroy(listing);

    std::sort(entries.begin(), entries.end());
    return entries;
}

std::optional<int64_t> GDALUtils::storageSize(const std::string& path) {
    VSIStatBufL stat_buffer;
    if (VSIStatL(path.c_str(), &stat_buffer) != 0) {
        return std::nullopt;
    }

    if (!VSI_ISDIR(stat_buffer.st_mode)) {
        return static_cast<int64_t>(stat_buffer.st_size);
    }

    int64_t total = 0;
    for (const auto& entry : listRecursive(path)) {
        VSIStatBufL entry_stat;
        std::string entry_path = path + "/" + entry;
        if (VSIStatL(entry_path.c_str(), &entry_stat) == 0 && !VSI_ISDIR(entry_stat.st_mode)) {
            total += static_cast<int64_t>(entry_stat.st_size);
        }
    }
    return total;
}

std::string GDALUtils::lastErrorMessage() {
    const char* message = CPLGetLastErrorMsg();
    if (!message || strlen(message) == 0) {
        return "unknown GDAL error";
    }
    return std::string(message);
}

GDALDriver* GDALUtils::vectorMemoryDriver() {
    registerDrivers();

    // GDAL >= 3.11 serves in-memory layers from MEM; older releases use "Memory"
    GDALDriver* driver = GetGDALDriverManager()->GetDriverByName("Memory");
    if (driver) {
        return driver;
    }

    driver = GetGDALDriverManager()->GetDriverByName("MEM");
    if (driver && driver->GetMetadataItem(GDAL_DCAP_VECTOR)) {
        return driver;
    }

    std::cerr << "Warning: No in-memory vector driver is available" << std::endl;
    return nullptr;
}

} // namespace io
} // namespace geosplit
