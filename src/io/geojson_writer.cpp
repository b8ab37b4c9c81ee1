#include "io/geojson_writer.hpp"
#include "core/geometry_conversion.hpp"
#include <stdexcept>

namespace geosplit {
namespace io {

std::string GeoJSONWriter::last_error_ = "";

bool GeoJSONWriter::writeToFile(const std::vector<core::GeoRecord>& records, const std::string& filepath,
                                const std::string& crs) {
    try {
        std::string geojson_string = writeToString(records, crs);

        std::ofstream file(filepath);
        if (!file.is_open()) {
            setError("Failed to open file for writing: " + filepath);
            return false;
        }

        file << geojson_string;
        file.close();

        return true;

    } catch (const std::exception& e) {
        setError("Error writing file " + filepath + ": " + e.what());
        return false;
    }
}

std::string GeoJSONWriter::writeToString(const std::vector<core::GeoRecord>& records, const std::string& crs) {
    nlohmann::json geojson;
    geojson["type"] = "FeatureCollection";

    if (!crs.empty()) {
        setCRS(geojson, crs);
    }

    nlohmann::json features = nlohmann::json::array();
    for (const auto& record : records) {
        features.push_back(recordToFeature(record));
    }
    geojson["features"] = features;

    return geojson.dump(2);
}

nlohmann::json GeoJSONWriter::recordToFeature(const core::GeoRecord& record) {
    nlohmann::json feature_json;
    feature_json["type"] = "Feature";
    feature_json["geometry"] = core::geometryToGeoJSON(record.geometry);
    feature_json["properties"] = record.attributes.is_object() ? record.attributes : nlohmann::json::object();
    return feature_json;
}

void GeoJSONWriter::setCRS(nlohmann::json& geojson, const std::string& crs) {
    if (crs.empty()) {
        return;
    }

    // {"type": "name", "properties": {"name": "EPSG:4326"}}
    nlohmann::json crs_obj;
    crs_obj["type"] = "name";
    crs_obj["properties"]["name"] = crs;
    geojson["crs"] = crs_obj;
}

GeoJSONSeqWriter::GeoJSONSeqWriter(const std::string& filepath)
    : file_(filepath), count_(0) {
}

bool GeoJSONSeqWriter::isOpen() const {
    return file_.is_open();
}

bool GeoJSONSeqWriter::write(const core::GeoRecord& record) {
    std::string line = GeoJSONWriter::recordToFeature(record).dump();

    std::lock_guard<std::mutex> lock(mutex_);
    file_ << line << '\n';
    if (!file_) {
        return false;
    }
    count_++;
    return true;
}

size_t GeoJSONSeqWriter::count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return count_;
}

} // namespace io
} // namespace geosplit
