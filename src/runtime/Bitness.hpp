#pragma once

#include <optional>
#include <string>

namespace fxprobe
{

// Processor word width of an installed runtime build
enum class Bitness : int
{
    Bits32 = 32,
    Bits64 = 64
};

inline Bitness OtherBitness(Bitness bitness)
{
    return bitness == Bitness::Bits32 ? Bitness::Bits64 : Bitness::Bits32;
}

inline int ToInt(Bitness bitness) { return static_cast<int>(bitness); }

inline std::string ToString(Bitness bitness) { return std::to_string(ToInt(bitness)); }

inline std::optional<Bitness> BitnessFromInt(int value)
{
    if (value == 32)
        return Bitness::Bits32;
    if (value == 64)
        return Bitness::Bits64;
    return std::nullopt;
}

// Bitness of the running process, used as the default request
inline Bitness HostBitness()
{
    return sizeof(void*) == 8 ? Bitness::Bits64 : Bitness::Bits32;
}

} // namespace fxprobe
