#include "io/vector_feature_index.hpp"
#include "io/gdal_utils.hpp"
#include "core/errors.hpp"
#include <cpl_conv.h>
#include <sstream>

namespace geosplit {
namespace io {

VectorFeatureIndex::VectorFeatureIndex(const std::string& path, const std::vector<std::string>& allowed_drivers,
                                       const std::string& layer_name)
    : path_(path), layer_(nullptr), next_index_(0) {

    dataset_ = GDALUtils::openDataset(path, GDAL_OF_VECTOR, allowed_drivers);
    if (!dataset_) {
        throw core::RangeFailure("Failed to open vector dataset: " + path + " (" +
                                 GDALUtils::lastErrorMessage() + ")");
    }

    const int layer_count = dataset_->GetLayerCount();
    if (layer_count == 0) {
        throw core::ConfigurationError("Vector dataset has no layers: " + path);
    }

    if (!layer_name.empty()) {
        layer_ = dataset_->GetLayerByName(layer_name.c_str());
        if (!layer_) {
            std::ostringstream oss;
            oss << "Layer '" << layer_name << "' not found in " << path << ", available layers:";
            for (const auto& name : layerNames(*dataset_)) {
                oss << " " << name;
            }
            throw core::ConfigurationError(oss.str());
        }
    } else if (layer_count > 1) {
        std::ostringstream oss;
        oss << path << " contains " << layer_count << " layers, set layer_name to one of:";
        for (const auto& name : layerNames(*dataset_)) {
            oss << " " << name;
        }
        throw core::ConfigurationError(oss.str());
    } else {
        layer_ = dataset_->GetLayer(0);
    }

    layer_name_ = layer_->GetName();
    layer_->ResetReading();
}

int64_t VectorFeatureIndex::featureCount() const {
    return static_cast<int64_t>(layer_->GetFeatureCount(TRUE));
}

std::string VectorFeatureIndex::crsWkt() const {
    const OGRSpatialReference* srs = layer_->GetSpatialRef();
    if (!srs) {
        return "";
    }

    char* wkt = nullptr;
    std::string result;
    if (srs->exportToWkt(&wkt) == OGRERR_NONE && wkt) {
        result = wkt;
    }
    CPLFree(wkt);
    return result;
}

bool VectorFeatureIndex::seek(int64_t index) {
    if (index == 0) {
        layer_->ResetReading();
        next_index_ = 0;
        return true;
    }
    if (layer_->SetNextByIndex(static_cast<GIntBig>(index)) != OGRERR_NONE) {
        return false;
    }
    next_index_ = index;
    return true;
}

OGRFeatureUniquePtr VectorFeatureIndex::next() {
    OGRFeatureUniquePtr feature(layer_->GetNextFeature());
    if (feature) {
        next_index_++;
    }
    return feature;
}

nlohmann::json VectorFeatureIndex::attributes(const OGRFeature& feature) {
    nlohmann::json attrs = nlohmann::json::object();
    const OGRFeatureDefn* defn = feature.GetDefnRef();

    for (int i = 0; i < feature.GetFieldCount(); ++i) {
        const OGRFieldDefn* field = defn->GetFieldDefn(i);
        const std::string name = field->GetNameRef();

        if (!feature.IsFieldSetAndNotNull(i)) {
            attrs[name] = nullptr;
            continue;
        }

        switch (field->GetType()) {
            case OFTInteger:
                if (field->GetSubType() == OFSTBoolean) {
                    attrs[name] = feature.GetFieldAsInteger(i) != 0;
                } else {
                    attrs[name] = feature.GetFieldAsInteger(i);
                }
                break;
            case OFTInteger64:
                attrs[name] = static_cast<int64_t>(feature.GetFieldAsInteger64(i));
                break;
            case OFTReal:
                attrs[name] = feature.GetFieldAsDouble(i);
                break;
            default:
                // Strings, dates and lists keep their OGR string form
                attrs[name] = std::string(feature.GetFieldAsString(i));
                break;
        }
    }

    return attrs;
}

std::vector<std::string> VectorFeatureIndex::layerNames(GDALDataset& dataset) {
    std::vector<std::string> names;
    for (int i = 0; i < dataset.GetLayerCount(); ++i) {
        names.push_back(dataset.GetLayer(i)->GetName());
    }
    return names;
}

} // namespace io
} // namespace geosplit
