#include "install_fixture.hpp"

#include <atomic>
#include <chrono>
#include <fstream>
#include <system_error>
#include <utility>

namespace test_utils {

namespace {

void put16(std::string& image, size_t offset, std::uint16_t value) {
    image[offset] = static_cast<char>(value & 0xFF);
    image[offset + 1] = static_cast<char>((value >> 8) & 0xFF);
}

void put32(std::string& image, size_t offset, std::uint32_t value) {
    for (size_t i = 0; i < 4; ++i)
        image[offset + i] = static_cast<char>((value >> (8 * i)) & 0xFF);
}

}  // namespace

std::string ExecutableImages::pe(std::uint16_t magic) {
    constexpr size_t pe_offset = 0x80;
    std::string image(0x100, '\0');
    put16(image, 0, 0x5A4D);
    put32(image, 0x3C, pe_offset);
    put32(image, pe_offset, 0x00004550);
    // IMAGE_FILE_HEADER is 0x14 bytes, the optional header magic follows
    put16(image, pe_offset + 4 + 0x14, magic);
    return image;
}

std::string ExecutableImages::pe(fxprobe::Bitness bitness) {
    return pe(static_cast<std::uint16_t>(bitness == fxprobe::Bitness::Bits64 ? 0x20B : 0x10B));
}

std::string ExecutableImages::elf(unsigned char elf_class) {
    std::string image(0x40, '\0');
    image[0] = 0x7F;
    image[1] = 'E';
    image[2] = 'L';
    image[3] = 'F';
    image[4] = static_cast<char>(elf_class);
    image[5] = 1;  // little endian
    image[6] = 1;  // EV_CURRENT
    return image;
}

TempInstallTree::TempInstallTree() {
    static std::atomic<unsigned> counter{0};
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    root_ = std::filesystem::temp_directory_path() /
            ("fxprobe_test_" + std::to_string(stamp) + "_" + std::to_string(counter++));
    std::filesystem::create_directories(root_);
}

TempInstallTree::~TempInstallTree() {
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
}

std::filesystem::path TempInstallTree::makeDirectory(const std::string& relative) const {
    auto dir = root_ / relative;
    std::filesystem::create_directories(dir);
    return dir;
}

std::filesystem::path TempInstallTree::writeFile(const std::string& relative, const std::string& content) const {
    auto file = root_ / relative;
    std::filesystem::create_directories(file.parent_path());
    std::ofstream out(file, std::ios::binary | std::ios::trunc);
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    return file;
}

std::filesystem::path TempInstallTree::addInstall(const std::string& relative, fxprobe::Bitness bitness,
                                                  const std::string& launcher) const {
    auto dir = makeDirectory(relative);
    writeFile(relative + "/" + launcher, ExecutableImages::pe(bitness));
    return dir;
}

std::filesystem::path TempInstallTree::addFramework(const std::string& install, const std::string& family,
                                                    const std::string& version) const {
    return makeDirectory(install + "/shared/" + family + "/" + version);
}

LockedDirectory::LockedDirectory(std::filesystem::path dir) : dir_(std::move(dir)) {
    std::filesystem::permissions(dir_, std::filesystem::perms::none);
}

LockedDirectory::~LockedDirectory() {
    std::error_code ec;
    std::filesystem::permissions(dir_, std::filesystem::perms::owner_all, ec);
}

bool LockedDirectory::listingDenied() const {
    std::error_code ec;
    std::filesystem::directory_iterator it(dir_, ec);
    return static_cast<bool>(ec);
}

}  // namespace test_utils
