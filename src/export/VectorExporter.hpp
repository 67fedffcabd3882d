/**
 * @file VectorExporter.hpp
 * @brief GeoPackage / Shapefile / GeoJSON export of generated features
 *
 * Writes cadastral or block polygons with id, area and (cadastral mode)
 * source_id attributes through GDAL/OGR.
 */

#pragma once

#include "cadastral_generator.hpp"
#include <gdal_priv.h>
#include <ogrsf_frmts.h>
#include <ogr_geometry.h>
#include <string>
#include <vector>

namespace cadgen {

/**
 * @brief Exports generation results as a single polygon layer
 */
class VectorExporter {
public:
    struct Options {
        std::string driver_name;      ///< OGR driver; inferred from the file extension when empty
        std::string layer_name;       ///< Defaults to output_layer_name(mode)
        std::string projection_wkt;   ///< Layer SRS; the result frame is used when empty
        bool add_source_field;        ///< Write source_id (only meaningful in cadastral mode)
        bool overwrite;

        Options()
            : driver_name(""),
              layer_name(""),
              projection_wkt(""),
              add_source_field(true),
              overwrite(true) {}
    };

    VectorExporter();
    explicit VectorExporter(const Options& options);

    /**
     * @brief Write all features of a result
     * @return true if export succeeded
     */
    bool export_result(const GenerationResult& result, const std::string& filename);

    /**
     * @brief OGR driver name for a user-facing format name or file extension
     *
     * Accepts "gpkg", "shp"/"shapefile" and "geojson"/"json" (case-insensitive).
     * @return Empty string when unknown
     */
    static std::string driver_for(const std::string& format_or_extension);

    /**
     * @brief Driver implied by a file name's extension, GPKG when there is none
     */
    static std::string driver_for_path(const std::string& filename);

private:
    Options options_;

    void create_attribute_fields(OGRLayer* layer, bool with_source) const;
    std::string resolve_projection(const GenerationResult& result) const;
};

} // namespace cadgen
