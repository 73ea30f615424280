#pragma once

#include "../runtime/Bitness.hpp"

#include <cstdint>
#include <filesystem>
#include <istream>
#include <optional>

namespace fxprobe::platform
{

// Reads executable headers to find the bitness of a launcher binary.
// The file is only read, never loaded or executed.
class ExecutableInspector
{
public:
    static constexpr std::uint16_t kDosMagic = 0x5A4D;      // "MZ"
    static constexpr std::uint32_t kPeHeaderPointer = 0x3C; // e_lfanew
    static constexpr std::uint32_t kPeSignature = 0x00004550; // "PE\0\0"
    static constexpr std::uint32_t kFileHeaderSize = 0x14;
    static constexpr std::uint16_t kPe32Magic = 0x10B;
    static constexpr std::uint16_t kPe32PlusMagic = 0x20B;

    // Returns 32 or 64 for a PE (or ELF) executable, nullopt when the header
    // cannot be read or is not recognized
    static std::optional<Bitness> DetectBitness(const std::filesystem::path& file);

    // PE image: MZ stub -> PE signature -> optional header magic
    static std::optional<Bitness> ReadPeBitness(std::istream& in);

    // ELF image: EI_CLASS byte of e_ident
    static std::optional<Bitness> ReadElfBitness(std::istream& in);

private:
    static std::optional<std::uint16_t> ReadUInt16(std::istream& in);
    static std::optional<std::uint32_t> ReadUInt32(std::istream& in);
};

} // namespace fxprobe::platform
