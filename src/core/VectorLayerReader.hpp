/**
 * @file VectorLayerReader.hpp
 * @brief Loading of road and building layers from OGR vector datasets
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "cadastral_generator.hpp"
#include "Logger.hpp"
#include <gdal_priv.h>
#include <ogrsf_frmts.h>
#include <string>
#include <vector>

namespace cadgen {

/**
 * @brief Reads point and line layers from any OGR-readable dataset
 *
 * The layer's spatial reference (as WKT) becomes the layer frame; layers
 * without one get an empty frame. Features of the wrong geometry kind are
 * skipped with a warning.
 */
class VectorLayerReader {
public:
    VectorLayerReader();

    /**
     * @brief Read LineString / MultiLineString features
     * @param layer_name Layer to read; the first layer when empty
     * @throws DatasetError if the dataset or layer cannot be opened
     */
    LineLayer read_lines(const std::string& path, const std::string& layer_name = "") const;

    /**
     * @brief Read Point / MultiPoint features
     * @throws DatasetError if the dataset or layer cannot be opened
     */
    PointLayer read_points(const std::string& path, const std::string& layer_name = "") const;

    /**
     * @brief Names of all layers in a dataset
     */
    std::vector<std::string> list_layers(const std::string& path) const;

private:
    GDALDatasetUniquePtr open(const std::string& path) const;
    OGRLayer* select_layer(GDALDataset& dataset, const std::string& path, const std::string& layer_name) const;
    static std::string frame_of(OGRLayer& layer);

    Logger logger_;
};

} // namespace cadgen
