#include "ExecutableInspector.hpp"

#include <array>
#include <fstream>

#include <plog/Log.h>

namespace fxprobe::platform
{

namespace
{

constexpr std::array<unsigned char, 4> kElfMagic = { 0x7F, 'E', 'L', 'F' };
constexpr std::streamoff kElfClassOffset = 4;
constexpr unsigned char kElfClass32 = 1;
constexpr unsigned char kElfClass64 = 2;

} // namespace

std::optional<Bitness> ExecutableInspector::DetectBitness(const std::filesystem::path& file)
{
    std::ifstream in(file, std::ios::binary);
    if (!in.is_open())
    {
        PLOG_DEBUG << "Cannot open " << file.string() << " for header inspection";
        return std::nullopt;
    }

    std::array<unsigned char, 4> lead{};
    if (!in.read(reinterpret_cast<char*>(lead.data()), static_cast<std::streamsize>(lead.size())))
    {
        PLOG_DEBUG << "Header of " << file.string() << " is truncated";
        return std::nullopt;
    }
    in.seekg(0);

    std::optional<Bitness> bitness;
    if (lead == kElfMagic)
        bitness = ReadElfBitness(in);
    else
        bitness = ReadPeBitness(in);

    if (!bitness)
        PLOG_DEBUG << "Unrecognized executable header in " << file.string();

    return bitness;
}

std::optional<Bitness> ExecutableInspector::ReadPeBitness(std::istream& in)
{
    auto dosMagic = ReadUInt16(in);
    if (!dosMagic || *dosMagic != kDosMagic)
        return std::nullopt;

    if (!in.seekg(kPeHeaderPointer))
        return std::nullopt;
    auto peOffset = ReadUInt32(in);
    if (!peOffset)
        return std::nullopt;

    if (!in.seekg(static_cast<std::streamoff>(*peOffset)))
        return std::nullopt;
    auto signature = ReadUInt32(in);
    if (!signature || *signature != kPeSignature)
        return std::nullopt;

    if (!in.seekg(kFileHeaderSize, std::ios::cur))
        return std::nullopt;
    auto magic = ReadUInt16(in);
    if (!magic)
        return std::nullopt;

    if (*magic == kPe32Magic)
        return Bitness::Bits32;
    if (*magic == kPe32PlusMagic)
        return Bitness::Bits64;
    return std::nullopt;
}

std::optional<Bitness> ExecutableInspector::ReadElfBitness(std::istream& in)
{
    std::array<unsigned char, 4> magic{};
    if (!in.read(reinterpret_cast<char*>(magic.data()), static_cast<std::streamsize>(magic.size())))
        return std::nullopt;
    if (magic != kElfMagic)
        return std::nullopt;

    if (!in.seekg(kElfClassOffset))
        return std::nullopt;
    char elfClass = 0;
    if (!in.get(elfClass))
        return std::nullopt;

    switch (static_cast<unsigned char>(elfClass))
    {
    case kElfClass32:
        return Bitness::Bits32;
    case kElfClass64:
        return Bitness::Bits64;
    default:
        return std::nullopt;
    }
}

// Header fields are little-endian regardless of host byte order
std::optional<std::uint16_t> ExecutableInspector::ReadUInt16(std::istream& in)
{
    std::array<unsigned char, 2> bytes{};
    if (!in.read(reinterpret_cast<char*>(bytes.data()), static_cast<std::streamsize>(bytes.size())))
        return std::nullopt;
    return static_cast<std::uint16_t>(bytes[0] | (bytes[1] << 8));
}

std::optional<std::uint32_t> ExecutableInspector::ReadUInt32(std::istream& in)
{
    std::array<unsigned char, 4> bytes{};
    if (!in.read(reinterpret_cast<char*>(bytes.data()), static_cast<std::streamsize>(bytes.size())))
        return std::nullopt;
    return static_cast<std::uint32_t>(bytes[0]) | (static_cast<std::uint32_t>(bytes[1]) << 8) |
           (static_cast<std::uint32_t>(bytes[2]) << 16) | (static_cast<std::uint32_t>(bytes[3]) << 24);
}

} // namespace fxprobe::platform
