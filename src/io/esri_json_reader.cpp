#include "io/esri_json_reader.hpp"
#include <algorithm>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace geosplit {
namespace io {

namespace bg = boost::geometry;

namespace {

core::Point parsePosition(const nlohmann::json& position) {
    if (!position.is_array() || position.size() < 2) {
        throw std::runtime_error("Invalid coordinate array");
    }
    return core::Point(position[0].get<double>(), position[1].get<double>());
}

template <typename Range>
Range parsePositions(const nlohmann::json& positions) {
    Range range;
    if (!positions.is_array()) {
        throw std::runtime_error("Invalid coordinate list");
    }
    for (const auto& position : positions) {
        range.push_back(parsePosition(position));
    }
    return range;
}

std::string errorDescription(const nlohmann::json& error) {
    std::ostringstream oss;
    oss << "service error";
    if (error.contains("code")) {
        oss << " " << error["code"].dump();
    }
    if (error.contains("message") && error["message"].is_string()) {
        oss << ": " << error["message"].get<std::string>();
    }
    return oss.str();
}

} // namespace

std::optional<EsriPage> EsriJsonReader::parsePage(const std::string& body, std::string& error) {
    nlohmann::json document;
    try {
        document = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        error = std::string("malformed JSON: ") + e.what();
        return std::nullopt;
    }

    if (!document.is_object()) {
        error = "page is not a JSON object";
        return std::nullopt;
    }
    if (document.contains("error")) {
        error = errorDescription(document["error"]);
        return std::nullopt;
    }
    if (!document.contains("features") || !document["features"].is_array()) {
        error = "page has no features array";
        return std::nullopt;
    }

    EsriPage page;
    try {
        page.exceeded_transfer_limit = document.value("exceededTransferLimit", false);
        page.geometry_type = document.value("geometryType", "");
        if (document.contains("spatialReference")) {
            page.wkid = parseSpatialReference(document["spatialReference"]);
        }

        for (const auto& feature_json : document["features"]) {
            EsriFeature feature;
            feature.attributes = feature_json.value("attributes", nlohmann::json::object());
            if (!feature.attributes.is_object()) {
                feature.attributes = nlohmann::json::object();
            }
            if (feature_json.contains("geometry") && feature_json["geometry"].is_object()) {
                feature.geometry = parseGeometry(feature_json["geometry"]);
            }
            page.features.push_back(std::move(feature));
        }
    } catch (const std::exception& e) {
        error = std::string("invalid page content: ") + e.what();
        return std::nullopt;
    }

    return page;
}

std::optional<int64_t> EsriJsonReader::parseCount(const std::string& body) {
    try {
        nlohmann::json document = nlohmann::json::parse(body);
        if (document.is_object() && document.contains("count") && document["count"].is_number_integer()) {
            return document["count"].get<int64_t>();
        }
    } catch (const nlohmann::json::parse_error&) {
        return std::nullopt;
    }
    return std::nullopt;
}

std::optional<EsriServiceInfo> EsriJsonReader::parseServiceInfo(const std::string& body) {
    nlohmann::json document;
    try {
        document = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error&) {
        return std::nullopt;
    }
    if (!document.is_object() || document.contains("error")) {
        return std::nullopt;
    }

    EsriServiceInfo info;
    try {
        readServiceInfo(document, info);
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "Warning: Invalid layer metadata: " << e.what() << std::endl;
        return std::nullopt;
    }
    return info;
}

void EsriJsonReader::readServiceInfo(const nlohmann::json& document, EsriServiceInfo& info) {
    if (document.contains("maxRecordCount") && document["maxRecordCount"].is_number_integer()) {
        int max_record_count = document["maxRecordCount"].get<int>();
        if (max_record_count > 0) {
            info.max_record_count = max_record_count;
        }
    }
    info.object_id_field = document.value("objectIdField", "");

    // Older services only list the field type
    if (info.object_id_field.empty() && document.contains("fields") && document["fields"].is_array()) {
        for (const auto& field : document["fields"]) {
            if (field.value("type", "") == "esriFieldTypeOID") {
                info.object_id_field = field.value("name", "");
                break;
            }
        }
    }

    if (document.contains("extent") && document["extent"].contains("spatialReference")) {
        info.wkid = parseSpatialReference(document["extent"]["spatialReference"]);
    }
}

std::optional<core::Geometry> EsriJsonReader::parseGeometry(const nlohmann::json& geometry) {
    if (geometry.contains("x") && geometry.contains("y")) {
        if (geometry["x"].is_null() || geometry["y"].is_null()) {
            return std::nullopt;
        }
        return core::Geometry(core::Point(geometry["x"].get<double>(), geometry["y"].get<double>()));
    }

    if (geometry.contains("points")) {
        core::MultiPoint points = parsePositions<core::MultiPoint>(geometry["points"]);
        if (points.empty()) {
            return std::nullopt;
        }
        return core::Geometry(points);
    }

    if (geometry.contains("paths")) {
        core::MultiLineString lines;
        for (const auto& path : geometry["paths"]) {
            lines.push_back(parsePositions<core::LineString>(path));
        }
        if (lines.empty()) {
            return std::nullopt;
        }
        if (lines.size() == 1) {
            return core::Geometry(lines.front());
        }
        return core::Geometry(lines);
    }

    if (geometry.contains("rings")) {
        core::MultiPolygon polygons;
        std::vector<core::LinearRing> holes;

        for (const auto& ring_json : geometry["rings"]) {
            core::LinearRing ring = parsePositions<core::LinearRing>(ring_json);
            if (ring.size() < 3) {
                continue;
            }
            if (!bg::equals(ring.front(), ring.back())) {
                ring.push_back(ring.front());
            }

            // Clockwise rings have positive area in the Boost model and are exteriors
            if (bg::area(ring) >= 0.0) {
                core::Polygon polygon;
                polygon.outer() = ring;
                polygons.push_back(polygon);
            } else {
                holes.push_back(ring);
            }
        }

        for (auto& hole : holes) {
            core::Polygon* owner = nullptr;
            for (auto& polygon : polygons) {
                if (bg::covered_by(hole.front(), polygon.outer())) {
                    owner = &polygon;
                    break;
                }
            }
            if (!owner && !polygons.empty()) {
                owner = &polygons.back();
            }

            if (owner) {
                owner->inners().push_back(hole);
            } else {
                // A lone counter-clockwise ring is still an area
                std::reverse(hole.begin(), hole.end());
                core::Polygon polygon;
                polygon.outer() = hole;
                polygons.push_back(polygon);
            }
        }

        if (polygons.empty()) {
            return std::nullopt;
        }
        if (polygons.size() == 1) {
            return core::Geometry(polygons.front());
        }
        return core::Geometry(polygons);
    }

    return std::nullopt;
}

std::optional<int> EsriJsonReader::parseSpatialReference(const nlohmann::json& spatial_reference) {
    if (!spatial_reference.is_object()) {
        return std::nullopt;
    }
    for (const char* key : {"latestWkid", "wkid"}) {
        if (spatial_reference.contains(key) && spatial_reference[key].is_number_integer()) {
            return spatial_reference[key].get<int>();
        }
    }
    return std::nullopt;
}

std::string EsriJsonReader::baseUrl(const std::string& service_url) {
    std::string url = service_url;
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

std::string EsriJsonReader::countUrl(const std::string& service_url) {
    return baseUrl(service_url) + "/query?where=1%3D1&returnCountOnly=true&f=json";
}

std::string EsriJsonReader::infoUrl(const std::string& service_url) {
    return baseUrl(service_url) + "?f=json";
}

std::string EsriJsonReader::pageUrl(const std::string& service_url, int64_t offset, int64_t count,
                                    const std::string& object_id_field) {
    std::ostringstream oss;
    oss << baseUrl(service_url) << "/query?where=1%3D1&outFields=*"
        << "&resultOffset=" << offset
        << "&resultRecordCount=" << count;
    if (!object_id_field.empty()) {
        oss << "&orderByFields=" << object_id_field;
    }
    oss << "&f=json";
    return oss.str();
}

} // namespace io
} // namespace geosplit
