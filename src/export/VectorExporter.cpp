/**
 * @file VectorExporter.cpp
 * @brief Implementation of vector export
 */

#include "VectorExporter.hpp"
#include "../core/Logger.hpp"
#include "../core/GeometryEngine.hpp"
#include <ogr_spatialref.h>
#include <cpl_conv.h>
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace cadgen {

namespace {

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

} // namespace

VectorExporter::VectorExporter()
    : options_() {
    GDALAllRegister();
}

VectorExporter::VectorExporter(const Options& options)
    : options_(options) {
    GDALAllRegister();
}

std::string VectorExporter::driver_for(const std::string& format_or_extension) {
    std::string key = lowercase(format_or_extension);
    if (!key.empty() && key.front() == '.') {
        key.erase(0, 1);
    }

    if (key == "gpkg" || key == "geopackage") return "GPKG";
    if (key == "shp" || key == "shapefile" || key == "esri shapefile") return "ESRI Shapefile";
    if (key == "geojson" || key == "json") return "GeoJSON";
    return "";
}

std::string VectorExporter::driver_for_path(const std::string& filename) {
    const std::string extension = std::filesystem::path(filename).extension().string();
    if (extension.empty()) {
        return "GPKG";
    }
    return driver_for(extension);
}

std::string VectorExporter::resolve_projection(const GenerationResult& result) const {
    if (!options_.projection_wkt.empty()) {
        return options_.projection_wkt;
    }

    // Re-express the frame as WKT so every driver gets a full definition
    OGRSpatialReference srs;
    if (result.frame.empty() || srs.SetFromUserInput(result.frame.c_str()) != OGRERR_NONE) {
        return "";
    }
    char* wkt = nullptr;
    if (srs.exportToWkt(&wkt) != OGRERR_NONE) {
        CPLFree(wkt);
        return "";
    }
    std::string projection(wkt ? wkt : "");
    CPLFree(wkt);
    return projection;
}

bool VectorExporter::export_result(const GenerationResult& result, const std::string& filename) {
    Logger logger("VectorExporter");

    const std::string driver_name = options_.driver_name.empty() ? driver_for_path(filename)
                                                                 : options_.driver_name;
    if (driver_name.empty()) {
        logger.error("Cannot infer an output format from '" + filename + "'");
        return false;
    }

    GDALDriver* driver = GetGDALDriverManager()->GetDriverByName(driver_name.c_str());
    if (!driver) {
        logger.error(driver_name + " driver not available");
        return false;
    }

    std::error_code ec;
    if (std::filesystem::exists(filename, ec)) {
        if (!options_.overwrite) {
            logger.error("Output exists and overwrite is disabled: " + filename);
            return false;
        }
        if (driver->Delete(filename.c_str()) != CE_None) {
            logger.error("Failed to replace existing output: " + filename);
            return false;
        }
    }

    GDALDatasetUniquePtr dataset(driver->Create(filename.c_str(), 0, 0, 0, GDT_Unknown, nullptr));
    if (!dataset) {
        logger.error("Failed to create dataset: " + filename);
        return false;
    }

    OGRSpatialReference srs;
    OGRSpatialReference* layer_srs = nullptr;
    const std::string wkt = resolve_projection(result);
    if (!wkt.empty() && srs.importFromWkt(wkt.c_str()) == OGRERR_NONE) {
        srs.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
        layer_srs = &srs;
    } else {
        logger.warning("Writing " + filename + " without a spatial reference");
    }

    const std::string layer_name = options_.layer_name.empty() ? output_layer_name(result.mode)
                                                               : options_.layer_name;
    OGRLayer* layer = dataset->CreateLayer(layer_name.c_str(), layer_srs, wkbPolygon, nullptr);
    if (!layer) {
        logger.error("Failed to create layer " + layer_name);
        return false;
    }

    const bool with_source = options_.add_source_field && result.mode == GenerationMode::CADASTRAL;
    create_attribute_fields(layer, with_source);

    const bool transactional = dataset->StartTransaction() == OGRERR_NONE;

    GeometryEngine engine;
    size_t written = 0;
    for (const auto& feature_data : result.features) {
        if (feature_data.geometry.empty()) {
            logger.warning("Skipping empty polygon " + std::to_string(feature_data.id));
            continue;
        }

        OGRFeatureUniquePtr feature(OGRFeature::CreateFeature(layer->GetLayerDefn()));
        feature->SetGeometryDirectly(engine.to_ogr(feature_data.geometry).release());
        feature->SetField("id", static_cast<GIntBig>(feature_data.id));
        feature->SetField("area", feature_data.area);
        if (with_source) {
            feature->SetField("source_id", static_cast<GIntBig>(feature_data.source_id));
        }

        if (layer->CreateFeature(feature.get()) != OGRERR_NONE) {
            logger.error("Failed to write feature " + std::to_string(feature_data.id));
            if (transactional) {
                dataset->RollbackTransaction();
            }
            return false;
        }
        ++written;
    }

    if (transactional && dataset->CommitTransaction() != OGRERR_NONE) {
        logger.error("Failed to commit features to " + filename);
        return false;
    }

    dataset.reset();

    logger.info("Exported " + std::to_string(written) + " feature(s) to " + filename +
                " [" + driver_name + ", layer " + layer_name + "]");
    return true;
}

void VectorExporter::create_attribute_fields(OGRLayer* layer, bool with_source) const {
    Logger logger("VectorExporter");

    OGRFieldDefn id_field("id", OFTInteger64);
    if (layer->CreateField(&id_field) != OGRERR_NONE) {
        logger.warning("Failed to create field id");
    }

    OGRFieldDefn area_field("area", OFTReal);
    area_field.SetWidth(16);
    area_field.SetPrecision(4);
    if (layer->CreateField(&area_field) != OGRERR_NONE) {
        logger.warning("Failed to create field area");
    }

    if (with_source) {
        OGRFieldDefn source_field("source_id", OFTInteger64);
        if (layer->CreateField(&source_field) != OGRERR_NONE) {
            logger.warning("Failed to create field source_id");
        }
    }
}

} // namespace cadgen
