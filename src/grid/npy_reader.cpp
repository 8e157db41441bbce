/// @file npy_reader.cpp
/// @brief NumPy .npy header parsing and element decoding.

#include "grid/npy_reader.hpp"

#include "core/logger.hpp"

#include <spdlog/fmt/fmt.h>

#include <array>
#include <charconv>
#include <cstring>
#include <fstream>

namespace darksky::grid
{

namespace
{

constexpr std::array<char, 6> kMagic{'\x93', 'N', 'U', 'M', 'P', 'Y'};
constexpr std::size_t kPreambleSize = 8;    // magic + major + minor

std::string_view trim(std::string_view sv)
{
    while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t' || sv.front() == '\n'))
    {
        sv.remove_prefix(1);
    }
    while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\n'))
    {
        sv.remove_suffix(1);
    }
    return sv;
}

/// Text following "'key':" in the header dict, or empty if absent.
std::string_view find_value(std::string_view dict, std::string_view key)
{
    const std::string quoted = fmt::format("'{}'", key);
    const std::size_t pos = dict.find(quoted);
    if (pos == std::string_view::npos)
    {
        return {};
    }
    const std::size_t colon = dict.find(':', pos + quoted.size());
    if (colon == std::string_view::npos)
    {
        return {};
    }
    return trim(dict.substr(colon + 1));
}

template <typename T>
f64 load_as(const std::byte* bytes)
{
    T value{};
    std::memcpy(&value, bytes, sizeof(T));
    return static_cast<f64>(value);
}

} // namespace

u64 NpyHeader::element_count() const
{
    u64 count = 1;
    for (const u64 dim : shape)
    {
        count *= dim;
    }
    return count;
}

// -----------------------------------------------------------------
// Header
//
// \x93NUMPY <major:u8> <minor:u8> <len:u16 (v1) | u32 (v2, v3)> <dict>
// dict: {'descr': '<f4', 'fortran_order': False, 'shape': (721, 1440), }
// -----------------------------------------------------------------

std::optional<NpyHeader> NpyReader::read_header(const std::filesystem::path& path)
{
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open())
    {
        DSK_CORE_ERROR("Failed to open array file: {}", path.string());
        return std::nullopt;
    }

    std::array<char, kPreambleSize> preamble{};
    if (!file.read(preamble.data(), static_cast<std::streamsize>(preamble.size())))
    {
        DSK_CORE_ERROR("Array file too short: {}", path.string());
        return std::nullopt;
    }
    if (std::memcmp(preamble.data(), kMagic.data(), kMagic.size()) != 0)
    {
        DSK_CORE_ERROR("Not a .npy file (bad magic): {}", path.string());
        return std::nullopt;
    }

    const auto major = static_cast<u8>(preamble[6]);
    u64 header_len = 0;
    u64 prefix_size = 0;
    if (major == 1)
    {
        std::array<unsigned char, 2> len{};
        if (!file.read(reinterpret_cast<char*>(len.data()), 2))
        {
            DSK_CORE_ERROR("Truncated .npy header: {}", path.string());
            return std::nullopt;
        }
        header_len = static_cast<u64>(len[0]) | (static_cast<u64>(len[1]) << 8);
        prefix_size = kPreambleSize + 2;
    }
    else if (major == 2 || major == 3)
    {
        std::array<unsigned char, 4> len{};
        if (!file.read(reinterpret_cast<char*>(len.data()), 4))
        {
            DSK_CORE_ERROR("Truncated .npy header: {}", path.string());
            return std::nullopt;
        }
        header_len = static_cast<u64>(len[0]) | (static_cast<u64>(len[1]) << 8)
                   | (static_cast<u64>(len[2]) << 16) | (static_cast<u64>(len[3]) << 24);
        prefix_size = kPreambleSize + 4;
    }
    else
    {
        DSK_CORE_ERROR("Unsupported .npy format version {}: {}", major, path.string());
        return std::nullopt;
    }

    std::string dict(header_len, '\0');
    if (!file.read(dict.data(), static_cast<std::streamsize>(header_len)))
    {
        DSK_CORE_ERROR("Truncated .npy header: {}", path.string());
        return std::nullopt;
    }

    auto header = parse_header_dict(dict, path);
    if (!header)
    {
        return std::nullopt;
    }
    header->data_offset = prefix_size + header_len;
    return header;
}

std::optional<NpyHeader> NpyReader::parse_header_dict(std::string_view dict, const std::filesystem::path& path)
{
    NpyHeader header{};

    // descr
    const std::string_view descr_value = find_value(dict, "descr");
    if (descr_value.size() < 2 || descr_value.front() != '\'')
    {
        DSK_CORE_ERROR("Missing dtype descriptor in {}", path.string());
        return std::nullopt;
    }
    const std::size_t descr_end = descr_value.find('\'', 1);
    if (descr_end == std::string_view::npos
        || !parse_descr(descr_value.substr(1, descr_end - 1), header.dtype, header.item_size))
    {
        DSK_CORE_ERROR("Unsupported dtype '{}' in {}", descr_value.substr(0, descr_end), path.string());
        return std::nullopt;
    }

    // fortran_order
    const std::string_view order_value = find_value(dict, "fortran_order");
    if (order_value.substr(0, 5) != "False")
    {
        DSK_CORE_ERROR("Only C-order arrays are supported: {}", path.string());
        return std::nullopt;
    }

    // shape
    const std::string_view shape_value = find_value(dict, "shape");
    if (shape_value.empty() || shape_value.front() != '(')
    {
        DSK_CORE_ERROR("Missing shape in {}", path.string());
        return std::nullopt;
    }
    const std::size_t close = shape_value.find(')');
    if (close == std::string_view::npos)
    {
        DSK_CORE_ERROR("Malformed shape in {}", path.string());
        return std::nullopt;
    }

    std::string_view dims = shape_value.substr(1, close - 1);
    while (!dims.empty())
    {
        const std::size_t comma = dims.find(',');
        const std::string_view token = trim(dims.substr(0, comma));
        if (!token.empty())
        {
            u64 dim = 0;
            const auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), dim);
            if (ec != std::errc{} || ptr != token.data() + token.size())
            {
                DSK_CORE_ERROR("Malformed shape dimension '{}' in {}", token, path.string());
                return std::nullopt;
            }
            header.shape.push_back(dim);
        }
        if (comma == std::string_view::npos)
        {
            break;
        }
        dims.remove_prefix(comma + 1);
    }

    return header;
}

bool NpyReader::parse_descr(std::string_view descr, DType& dtype, u32& item_size)
{
    if (descr.size() < 3)
    {
        return false;
    }

    const char order = descr[0];
    const char kind = descr[1];
    u32 size = 0;
    const auto [ptr, ec] = std::from_chars(descr.data() + 2, descr.data() + descr.size(), size);
    if (ec != std::errc{} || ptr != descr.data() + descr.size())
    {
        return false;
    }

    // Big-endian data is only acceptable for single-byte types
    if (order == '>' && size > 1)
    {
        return false;
    }
    if (order != '<' && order != '|' && order != '=' && order != '>')
    {
        return false;
    }

    switch (kind)
    {
        case 'f':
            if (size == 4) { dtype = DType::Float32; break; }
            if (size == 8) { dtype = DType::Float64; break; }
            return false;
        case 'i':
            if (size == 1) { dtype = DType::Int8; break; }
            if (size == 2) { dtype = DType::Int16; break; }
            if (size == 4) { dtype = DType::Int32; break; }
            if (size == 8) { dtype = DType::Int64; break; }
            return false;
        case 'u':
            if (size == 1) { dtype = DType::UInt8; break; }
            if (size == 2) { dtype = DType::UInt16; break; }
            if (size == 4) { dtype = DType::UInt32; break; }
            if (size == 8) { dtype = DType::UInt64; break; }
            return false;
        case 'b':
            if (size == 1) { dtype = DType::Bool; break; }
            return false;
        default:
            return false;
    }

    item_size = size;
    return true;
}

// Host byte order is assumed little-endian, like every platform the data is produced on
f64 NpyReader::decode(const std::byte* bytes, DType dtype)
{
    switch (dtype)
    {
        case DType::Float32: return load_as<f32>(bytes);
        case DType::Float64: return load_as<f64>(bytes);
        case DType::Int8:    return load_as<int8_t>(bytes);
        case DType::Int16:   return load_as<int16_t>(bytes);
        case DType::Int32:   return load_as<i32>(bytes);
        case DType::Int64:   return load_as<i64>(bytes);
        case DType::UInt8:   return load_as<u8>(bytes);
        case DType::UInt16:  return load_as<u16>(bytes);
        case DType::UInt32:  return load_as<u32>(bytes);
        case DType::UInt64:  return load_as<u64>(bytes);
        case DType::Bool:    return std::to_integer<u8>(bytes[0]) != 0 ? 1.0 : 0.0;
    }
    return 0.0;
}

// -----------------------------------------------------------------
// Data
// -----------------------------------------------------------------

std::optional<NdArray> NpyReader::load(const std::filesystem::path& path)
{
    const auto header = read_header(path);
    if (!header)
    {
        return std::nullopt;
    }

    const u64 count = header->element_count();
    std::vector<std::byte> raw(count * header->item_size);

    std::ifstream file(path, std::ios::binary);
    file.seekg(static_cast<std::streamoff>(header->data_offset));
    if (!file.read(reinterpret_cast<char*>(raw.data()), static_cast<std::streamsize>(raw.size())))
    {
        DSK_CORE_ERROR("Array data truncated in {} (expected {} elements)", path.string(), count);
        return std::nullopt;
    }

    NdArray array;
    array.shape = header->shape;
    array.data.reserve(count);
    for (u64 i = 0; i < count; ++i)
    {
        array.data.push_back(decode(raw.data() + i * header->item_size, header->dtype));
    }

    DSK_CORE_TRACE("Loaded {} ({} elements)", path.string(), count);
    return array;
}

std::optional<f64> NpyReader::read_element(const std::filesystem::path& path, u64 row, u64 col)
{
    const auto header = read_header(path);
    if (!header)
    {
        return std::nullopt;
    }
    if (header->shape.size() != 2)
    {
        DSK_CORE_ERROR("Expected a 2-D grid in {}, found rank {}", path.string(), header->shape.size());
        return std::nullopt;
    }
    if (row >= header->shape[0] || col >= header->shape[1])
    {
        DSK_CORE_ERROR("Element ({}, {}) outside grid {}x{} in {}",
                       row, col, header->shape[0], header->shape[1], path.string());
        return std::nullopt;
    }

    const u64 offset = header->data_offset + (row * header->shape[1] + col) * header->item_size;

    std::ifstream file(path, std::ios::binary);
    file.seekg(static_cast<std::streamoff>(offset));
    std::array<std::byte, 8> raw{};
    if (!file.read(reinterpret_cast<char*>(raw.data()), static_cast<std::streamsize>(header->item_size)))
    {
        DSK_CORE_ERROR("Array data truncated in {}", path.string());
        return std::nullopt;
    }
    return decode(raw.data(), header->dtype);
}

// -----------------------------------------------------------------
// Filenames: <variable>.f<HHH>.npy
// -----------------------------------------------------------------

std::optional<ForecastFile> NpyReader::parse_forecast_filename(std::string_view filename)
{
    const std::size_t first_dot = filename.find('.');
    if (first_dot == std::string_view::npos || first_dot == 0)
    {
        return std::nullopt;
    }
    const std::size_t second_dot = filename.find('.', first_dot + 1);
    if (second_dot == std::string_view::npos || filename.substr(second_dot) != ".npy")
    {
        return std::nullopt;
    }

    const std::string_view hour_part = filename.substr(first_dot + 1, second_dot - first_dot - 1);
    if (hour_part.size() < 2 || hour_part.front() != 'f')
    {
        return std::nullopt;
    }

    i32 hour = 0;
    const auto [ptr, ec] = std::from_chars(hour_part.data() + 1, hour_part.data() + hour_part.size(), hour);
    if (ec != std::errc{} || ptr != hour_part.data() + hour_part.size() || hour < 0)
    {
        return std::nullopt;
    }

    return ForecastFile{
        .variable = std::string(filename.substr(0, first_dot)),
        .hour     = hour,
    };
}

std::string NpyReader::forecast_filename(std::string_view variable, i32 hour)
{
    return fmt::format("{}.f{:03d}.npy", variable, hour);
}

} // namespace darksky::grid
