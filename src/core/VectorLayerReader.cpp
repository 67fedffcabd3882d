/**
 * @file VectorLayerReader.cpp
 * @brief Implementation of vector layer loading
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "VectorLayerReader.hpp"
#include "GeneratorErrors.hpp"
#include <ogr_spatialref.h>
#include <cpl_conv.h>

namespace cadgen {

namespace {

void append_line(const OGRLineString* line, std::vector<LineString2D>& out) {
    LineString2D vertices;
    vertices.reserve(static_cast<size_t>(line->getNumPoints()));
    for (int i = 0; i < line->getNumPoints(); ++i) {
        vertices.emplace_back(line->getX(i), line->getY(i));
    }
    if (!vertices.empty()) {
        out.push_back(std::move(vertices));
    }
}

} // namespace

VectorLayerReader::VectorLayerReader()
    : logger_("VectorLayerReader") {
    GDALAllRegister();
}

GDALDatasetUniquePtr VectorLayerReader::open(const std::string& path) const {
    GDALDatasetUniquePtr dataset(GDALDataset::Open(path.c_str(), GDAL_OF_VECTOR | GDAL_OF_READONLY,
                                                   nullptr, nullptr, nullptr));
    if (!dataset) {
        throw DatasetError("cannot open vector dataset '" + path + "'");
    }
    return dataset;
}

std::vector<std::string> VectorLayerReader::list_layers(const std::string& path) const {
    GDALDatasetUniquePtr dataset = open(path);
    std::vector<std::string> names;
    for (int i = 0; i < dataset->GetLayerCount(); ++i) {
        names.emplace_back(dataset->GetLayer(i)->GetName());
    }
    return names;
}

OGRLayer* VectorLayerReader::select_layer(GDALDataset& dataset, const std::string& path,
                                          const std::string& layer_name) const {
    if (dataset.GetLayerCount() == 0) {
        throw DatasetError("dataset '" + path + "' contains no layers");
    }

    if (layer_name.empty()) {
        if (dataset.GetLayerCount() > 1) {
            logger_.warning("Dataset '" + path + "' has " + std::to_string(dataset.GetLayerCount()) +
                            " layers, reading the first (" + dataset.GetLayer(0)->GetName() + ")");
        }
        return dataset.GetLayer(0);
    }

    OGRLayer* layer = dataset.GetLayerByName(layer_name.c_str());
    if (!layer) {
        std::string available;
        for (int i = 0; i < dataset.GetLayerCount(); ++i) {
            if (!available.empty()) available += ", ";
            available += dataset.GetLayer(i)->GetName();
        }
        throw DatasetError("layer '" + layer_name + "' not found in '" + path +
                           "' (available: " + available + ")");
    }
    return layer;
}

std::string VectorLayerReader::frame_of(OGRLayer& layer) {
    const OGRSpatialReference* srs = layer.GetSpatialRef();
    if (!srs) {
        return "";
    }

    char* wkt = nullptr;
    if (srs->exportToWkt(&wkt) != OGRERR_NONE) {
        CPLFree(wkt);
        return "";
    }
    std::string frame(wkt ? wkt : "");
    CPLFree(wkt);
    return frame;
}

LineLayer VectorLayerReader::read_lines(const std::string& path, const std::string& layer_name) const {
    GDALDatasetUniquePtr dataset = open(path);
    OGRLayer* layer = select_layer(*dataset, path, layer_name);

    LineLayer result;
    result.name = layer->GetName();
    result.frame = frame_of(*layer);

    size_t skipped = 0;
    layer->ResetReading();
    for (auto& feature : *layer) {
        const OGRGeometry* geometry = feature->GetGeometryRef();
        if (!geometry || geometry->IsEmpty()) {
            ++skipped;
            continue;
        }

        const OGRwkbGeometryType type = wkbFlatten(geometry->getGeometryType());
        if (type == wkbLineString) {
            append_line(geometry->toLineString(), result.lines);
        } else if (type == wkbMultiLineString) {
            for (const OGRLineString* part : *geometry->toMultiLineString()) {
                append_line(part, result.lines);
            }
        } else {
            ++skipped;
        }
    }

    if (skipped > 0) {
        logger_.warning("Skipped " + std::to_string(skipped) + " non-line feature(s) in layer '" +
                        result.name + "'");
    }
    logger_.info("Read " + std::to_string(result.lines.size()) + " line(s) from " + path +
                 " [" + result.name + "]");
    return result;
}

PointLayer VectorLayerReader::read_points(const std::string& path, const std::string& layer_name) const {
    GDALDatasetUniquePtr dataset = open(path);
    OGRLayer* layer = select_layer(*dataset, path, layer_name);

    PointLayer result;
    result.name = layer->GetName();
    result.frame = frame_of(*layer);

    size_t skipped = 0;
    layer->ResetReading();
    for (auto& feature : *layer) {
        const OGRGeometry* geometry = feature->GetGeometryRef();
        if (!geometry || geometry->IsEmpty()) {
            ++skipped;
            continue;
        }

        const OGRwkbGeometryType type = wkbFlatten(geometry->getGeometryType());
        if (type == wkbPoint) {
            const OGRPoint* point = geometry->toPoint();
            result.points.emplace_back(point->getX(), point->getY());
        } else if (type == wkbMultiPoint) {
            for (const OGRPoint* point : *geometry->toMultiPoint()) {
                result.points.emplace_back(point->getX(), point->getY());
            }
        } else {
            ++skipped;
        }
    }

    if (skipped > 0) {
        logger_.warning("Skipped " + std::to_string(skipped) + " non-point feature(s) in layer '" +
                        result.name + "'");
    }
    logger_.info("Read " + std::to_string(result.points.size()) + " point(s) from " + path +
                 " [" + result.name + "]");
    return result;
}

} // namespace cadgen
