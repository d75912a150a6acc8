#include "geo_mosaic/io/raster_io.hpp"
#include "geo_mosaic/core/errors.hpp"

#include <gdal_priv.h>
#include <cpl_error.h>

#include <iostream>
#include <memory>
#include <mutex>

namespace geo_mosaic::io {

namespace {

struct DatasetCloser {
    void operator()(GDALDataset* ds) const {
        if (ds) GDALClose(GDALDataset::ToHandle(ds));
    }
};

using DatasetPtr = std::unique_ptr<GDALDataset, DatasetCloser>;

void ensure_drivers_registered() {
    static std::once_flag flag;
    std::call_once(flag, [] { GDALAllRegister(); });
}

std::string last_gdal_message() {
    const char* msg = CPLGetLastErrorMsg();
    if (msg == nullptr || *msg == '\0') return "";
    return std::string(" (") + msg + ")";
}

DatasetPtr open_readonly(const fs::path& path) {
    ensure_drivers_registered();

    if (!fs::exists(path)) {
        throw RasterDecodeError("File not found: " + path.string());
    }

    CPLErrorReset();
    DatasetPtr ds(GDALDataset::FromHandle(GDALOpen(path.string().c_str(), GA_ReadOnly)));
    if (!ds) {
        throw RasterDecodeError("Cannot open raster: " + path.string() + last_gdal_message());
    }
    return ds;
}

RasterInfo info_from_dataset(GDALDataset& ds, const fs::path& path) {
    RasterInfo info;
    info.width = ds.GetRasterXSize();
    info.height = ds.GetRasterYSize();
    info.band_count = ds.GetRasterCount();
    if (GDALDriver* drv = ds.GetDriver()) {
        info.driver = drv->GetDescription();
    }

    if (info.band_count < 1) {
        throw RasterDecodeError("Raster has no bands: " + path.string());
    }
    if (info.width < 1 || info.height < 1) {
        throw RasterDecodeError("Raster has invalid dimensions: " + path.string());
    }

    double gt[6] = {0.0, 0.0, 0.0, 0.0, 0.0, 0.0};
    if (ds.GetGeoTransform(gt) != CE_None) {
        throw RasterDecodeError("Raster has no geotransform: " + path.string());
    }
    for (int i = 0; i < 6; ++i) {
        info.geotransform[i] = gt[i];
    }
    if (gt[2] != 0.0 || gt[4] != 0.0) {
        std::cerr << "[RASTER] Rotated geotransform in " << path.filename().string()
                  << ", drawn as its bounding box" << std::endl;
    }
    return info;
}

} // namespace

RasterInfo read_raster_info(const fs::path& path) {
    DatasetPtr ds = open_readonly(path);
    return info_from_dataset(*ds, path);
}

RasterTile load_raster(const fs::path& path) {
    DatasetPtr ds = open_readonly(path);
    RasterInfo info = info_from_dataset(*ds, path);

    RasterTile tile;
    tile.path = path;
    tile.band_count = info.band_count;
    tile.width = info.width;
    tile.height = info.height;
    tile.geotransform = info.geotransform;
    tile.bands.reserve(static_cast<size_t>(info.band_count));

    for (int b = 1; b <= info.band_count; ++b) {
        GDALRasterBand* band = ds->GetRasterBand(b);
        if (band == nullptr) {
            throw RasterDecodeError("Cannot access band " + std::to_string(b) + ": " + path.string());
        }
        if (band->GetXSize() != info.width || band->GetYSize() != info.height) {
            throw RasterDecodeError("Band " + std::to_string(b) +
                                    " dimensions differ from dataset: " + path.string());
        }

        Matrix2Df data(info.height, info.width);
        CPLErr err = band->RasterIO(GF_Read, 0, 0, info.width, info.height,
                                    data.data(), info.width, info.height,
                                    GDT_Float32, 0, 0, nullptr);
        if (err != CE_None) {
            throw RasterDecodeError("Cannot read pixel data of band " + std::to_string(b) +
                                    ": " + path.string() + last_gdal_message());
        }
        tile.bands.push_back(std::move(data));
    }

    return tile;
}

void write_raster_float(const fs::path& path, const std::vector<Matrix2Df>& bands,
                        const GeoTransform& geotransform) {
    ensure_drivers_registered();

    if (bands.empty()) {
        throw IOError("Cannot write raster without bands: " + path.string());
    }
    const int height = static_cast<int>(bands.front().rows());
    const int width = static_cast<int>(bands.front().cols());
    for (const auto& b : bands) {
        if (b.rows() != height || b.cols() != width) {
            throw IOError("Band dimensions differ, cannot write raster: " + path.string());
        }
    }

    GDALDriver* driver = GetGDALDriverManager()->GetDriverByName("GTiff");
    if (driver == nullptr) {
        throw IOError("GDAL GTiff driver not available");
    }

    CPLErrorReset();
    DatasetPtr ds(driver->Create(path.string().c_str(), width, height,
                                 static_cast<int>(bands.size()), GDT_Float32, nullptr));
    if (!ds) {
        throw IOError("Cannot create raster: " + path.string() + last_gdal_message());
    }

    GeoTransform gt = geotransform;
    if (ds->SetGeoTransform(gt.data()) != CE_None) {
        throw IOError("Cannot set geotransform: " + path.string() + last_gdal_message());
    }

    for (size_t i = 0; i < bands.size(); ++i) {
        GDALRasterBand* band = ds->GetRasterBand(static_cast<int>(i) + 1);
        CPLErr err = band->RasterIO(GF_Write, 0, 0, width, height,
                                    const_cast<float*>(bands[i].data()), width, height,
                                    GDT_Float32, 0, 0, nullptr);
        if (err != CE_None) {
            throw IOError("Cannot write pixel data: " + path.string() + last_gdal_message());
        }
    }
}

} // namespace geo_mosaic::io
