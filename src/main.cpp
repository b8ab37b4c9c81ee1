#include <algorithm>
#include <atomic>
#include <deque>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "io/geojson_writer.hpp"
#include "source/source_factory.hpp"

using namespace geosplit;

namespace {

// Default desired bundle size: 64 MiB
constexpr int64_t kDefaultBundleBytes = 64LL * 1024 * 1024;

// Command line keys that are forwarded as source options
const std::vector<std::string> kOptionKeys = {
    "skip-reproject", "in-epsg", "in-proj", "out-epsg", "band-number", "include-nodata",
    "layer-name", "gdb-name", "page-size", "max-retries", "initial-backoff-ms"
};

/**
 * Ranges waiting for a worker plus the readers currently running, so that idle
 * workers can split work off a busy reader
 */
class WorkQueue {
public:
    explicit WorkQueue(const std::vector<core::OffsetRange>& ranges)
        : pending_(ranges.begin(), ranges.end()) {}

    /**
     * Next range to read: a queued one, or the tail split off the least advanced reader
     */
    bool next(core::OffsetRange& range) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!pending_.empty()) {
            range = pending_.front();
            pending_.pop_front();
            return true;
        }

        std::vector<std::shared_ptr<source::RangeReader>> candidates = active_;
        std::sort(candidates.begin(), candidates.end(),
                  [](const std::shared_ptr<source::RangeReader>& a, const std::shared_ptr<source::RangeReader>& b) {
                      return a->getProgress() < b->getProgress();
                  });
        for (const auto& reader : candidates) {
            auto residual = reader->trySplit(0.5);
            if (residual) {
                std::cout << "Split " << residual->toString() << " off range " << reader->range().toString()
                          << std::endl;
                range = *residual;
                return true;
            }
        }
        return false;
    }

    void activate(const std::shared_ptr<source::RangeReader>& reader) {
        std::lock_guard<std::mutex> lock(mutex_);
        active_.push_back(reader);
    }

    void deactivate(const std::shared_ptr<source::RangeReader>& reader) {
        std::lock_guard<std::mutex> lock(mutex_);
        active_.erase(std::remove(active_.begin(), active_.end(), reader), active_.end());
    }

private:
    std::mutex mutex_;
    std::deque<core::OffsetRange> pending_;
    std::vector<std::shared_ptr<source::RangeReader>> active_;
};

} // namespace

void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " --uri <uri> --kind <kind> --output <path> [options]\n"
              << "\nRequired arguments:\n"
              << "  --uri <uri>                  File path, .zip, gs://, s3://, http(s):// URI or feature service URL\n"
              << "  --kind <kind>                raster, raster-polygon, shapefile, geodatabase, geojson or esri-service\n"
              << "  --output <path>              Output file (newline-delimited GeoJSON)\n"
              << "\nOptional arguments:\n"
              << "  --locator <value>            Layer name, geodatabase member or service URL\n"
              << "  --desired-bundle-size <n>    Desired range size in bytes (default: 67108864)\n"
              << "  --workers <n>                Number of worker threads (default: hardware concurrency)\n"
              << "\nSource options:\n"
              << "  --skip-reproject             Keep coordinates in the source CRS\n"
              << "  --in-epsg <code>             Source CRS override as EPSG code\n"
              << "  --in-proj <definition>       Source CRS override as PROJ string or WKT\n"
              << "  --out-epsg <code>            Target CRS (default: 4326)\n"
              << "  --band-number <n>            Raster band (default: 1)\n"
              << "  --include-nodata             Emit nodata pixels\n"
              << "  --layer-name <name>          Vector layer\n"
              << "  --gdb-name <name>            Geodatabase inside a zip archive\n"
              << "  --page-size <n>              Feature service page size\n"
              << "  --max-retries <n>            Feature service retry budget (default: 5)\n"
              << "  --initial-backoff-ms <n>     First retry delay (default: 500)\n"
              << "\nExamples:\n"
              << "  " << programName << " --uri dem.tif --kind raster --output dem.geojsons --workers 8\n"
              << "  " << programName << " --uri parcels.zip --kind geodatabase --gdb-name parcels --layer-name lots --output lots.geojsons\n"
              << "\nUse --version to display version information.\n";
}

std::unordered_map<std::string, std::string> parseArgs(int argc, char* argv[]) {
    std::unordered_map<std::string, std::string> args;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg.substr(0, 2) == "--") {
            std::string key = arg.substr(2);

            // Check if this is a flag argument (no value) or a key-value argument
            if (i + 1 < argc && argv[i + 1][0] != '-') {
                args[key] = argv[i + 1];
                i++; // Skip the value in next iteration
            } else {
                args[key] = "true";
            }
        }
    }

    return args;
}

// Read one range to completion; returns false if the range failed
bool readRange(source::GeoSource& geo_source, const core::OffsetRange& range, WorkQueue& queue,
               io::GeoJSONSeqWriter& writer) {
    std::shared_ptr<source::RangeReader> reader = geo_source.createReader(range);
    queue.activate(reader);

    bool ok = true;
    try {
        for (bool available = reader->start(); available; available = reader->advance()) {
            if (!writer.write(reader->getCurrent())) {
                std::cerr << "Error: Failed to write output" << std::endl;
                ok = false;
                break;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: Range " << range.toString() << ": " << e.what() << std::endl;
        ok = false;
    }

    reader->close();
    queue.deactivate(reader);
    return ok;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    try {
        auto args = parseArgs(argc, argv);

        if (args.count("help") > 0 || args.count("h") > 0) {
            printUsage(argv[0]);
            return 0;
        }

        if (args.count("version") > 0 || args.count("v") > 0) {
            std::cout << "geosplit_dump v1.0.0\n";
            return 0;
        }

        for (const char* required : {"uri", "kind", "output"}) {
            if (args.count(required) == 0) {
                std::cerr << "Error: --" << required << " is required" << std::endl;
                printUsage(argv[0]);
                return 1;
            }
        }

        // Convert arguments to JSON options
        nlohmann::json options_json = nlohmann::json::object();
        for (const auto& key : kOptionKeys) {
            if (args.count(key)) {
                std::string option = key;
                std::replace(option.begin(), option.end(), '-', '_');
                options_json[option] = args.at(key);
            }
        }

        core::SourceDescriptor descriptor(args.at("uri"), core::sourceKindFromString(args.at("kind")),
                                          args.count("locator") ? args.at("locator") : "");
        source::SourceOptions options = source::parseSourceOptions(options_json);

        int64_t bundle_bytes = args.count("desired-bundle-size") ? std::stoll(args.at("desired-bundle-size"))
                                                                 : kDefaultBundleBytes;
        unsigned workers = args.count("workers") ? static_cast<unsigned>(std::stoul(args.at("workers")))
                                                 : std::max(1u, std::thread::hardware_concurrency());

        std::unique_ptr<source::GeoSource> geo_source = source::createSource(descriptor, options);

        auto estimate = geo_source->estimateSize();
        std::cout << "Source " << geo_source->name() << ", estimated size: "
                  << (estimate ? std::to_string(*estimate) + " bytes" : std::string("unknown")) << std::endl;

        std::vector<core::OffsetRange> ranges = geo_source->getInitialRanges(bundle_bytes);
        std::cout << "Reading " << ranges.size() << " range(s) with " << workers << " worker(s)" << std::endl;

        io::GeoJSONSeqWriter writer(args.at("output"));
        if (!writer.isOpen()) {
            std::cerr << "Error: Failed to open output file: " << args.at("output") << std::endl;
            return 1;
        }

        WorkQueue queue(ranges);
        std::atomic<int> failed_ranges{0};
        std::vector<std::thread> pool;
        for (unsigned i = 0; i < workers; ++i) {
            pool.emplace_back([&]() {
                core::OffsetRange range;
                while (queue.next(range)) {
                    if (!readRange(*geo_source, range, queue, writer)) {
                        failed_ranges++;
                    }
                }
            });
        }
        for (auto& thread : pool) {
            thread.join();
        }

        std::cout << "Wrote " << writer.count() << " features to " << args.at("output") << std::endl;
        std::cout << "Metrics: " << geo_source->metrics()->summary() << std::endl;

        if (failed_ranges > 0) {
            std::cerr << "Error: " << failed_ranges << " range(s) failed" << std::endl;
            return 1;
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
