#pragma once

/// @file npy_reader.hpp
/// @brief Reader for NumPy .npy arrays (forecast grids and lookup tables).

#include "core/types.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace darksky::grid
{
    /// @brief Element types accepted in .npy files.
    enum class DType
    {
        Float32,
        Float64,
        Int8,
        Int16,
        Int32,
        Int64,
        UInt8,
        UInt16,
        UInt32,
        UInt64,
        Bool,
    };

    /// @brief Parsed .npy header.
    struct NpyHeader
    {
        DType dtype;
        u32 item_size;                  ///< Bytes per element
        std::vector<u64> shape;         ///< Empty for a 0-d array
        u64 data_offset;                ///< Byte offset of the first element

        /// @brief Number of elements (1 for a 0-d array).
        [[nodiscard]] u64 element_count() const;
    };

    /// @brief Dense C-order array with values widened to double.
    struct NdArray
    {
        std::vector<u64> shape;
        std::vector<f64> data;

        [[nodiscard]] std::size_t rank() const { return shape.size(); }
        [[nodiscard]] std::size_t size() const { return data.size(); }

        /// @brief Element of a 2-D array (bounds-checked).
        [[nodiscard]] f64 at(u64 row, u64 col) const { return data.at(row * shape.at(1) + col); }

        /// @brief Element of a 3-D array (bounds-checked).
        [[nodiscard]] f64 at(u64 i, u64 j, u64 k) const
        {
            return data.at((i * shape.at(1) + j) * shape.at(2) + k);
        }
    };

    /// @brief Variable name and forecast hour encoded in a grid filename.
    struct ForecastFile
    {
        std::string variable;   ///< e.g. "cloud"
        i32 hour;               ///< Forecast hour, e.g. 7 for "f007"
    };

    /// @brief Static utility class for reading .npy files.
    ///
    /// Supports format versions 1.0, 2.0 and 3.0, C order, little-endian or
    /// byte-order-neutral dtypes f4, f8, i1..i8, u1..u8 and b1. Fortran-order
    /// and big-endian arrays are rejected. Failures are logged and reported as
    /// std::nullopt.
    class NpyReader
    {
    public:
        NpyReader() = delete;

        /// @brief Read and validate only the header.
        [[nodiscard]] static std::optional<NpyHeader> read_header(const std::filesystem::path& path);

        /// @brief Load the whole array.
        [[nodiscard]] static std::optional<NdArray> load(const std::filesystem::path& path);

        /// @brief Read a single element of a 2-D array by seeking to it.
        [[nodiscard]] static std::optional<f64> read_element(
            const std::filesystem::path& path, u64 row, u64 col);

        /// @brief Split "<variable>.f<HHH>.npy" into its parts.
        /// @return std::nullopt for any other shape of name.
        [[nodiscard]] static std::optional<ForecastFile> parse_forecast_filename(std::string_view filename);

        /// @brief Canonical filename for a variable and forecast hour ("cloud.f007.npy").
        [[nodiscard]] static std::string forecast_filename(std::string_view variable, i32 hour);

    private:
        /// @brief Parse the Python dict literal of the header.
        [[nodiscard]] static std::optional<NpyHeader> parse_header_dict(
            std::string_view dict, const std::filesystem::path& path);

        /// @brief Parse a dtype descriptor such as "<f4" or "|u1".
        [[nodiscard]] static bool parse_descr(std::string_view descr, DType& dtype, u32& item_size);

        /// @brief Decode one little-endian element.
        [[nodiscard]] static f64 decode(const std::byte* bytes, DType dtype);
    };

} // namespace darksky::grid
