// File header example for BITENDIAN
//
// Demonstrates run-time byte order selection: a TIFF-style header starts
// with "II" (little-endian) or "MM" (big-endian), and every following field
// is read in the order it announces.

#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include <bitendian.hpp>

namespace {

struct Header {
    bitendian::Endian order;
    uint16_t magic;
    uint32_t first_offset;
};

void write_header(const std::filesystem::path& path, bitendian::Endian order) {
    std::ofstream out(path, std::ios::binary);
    if (!out) {
        throw std::runtime_error("Failed to create " + path.string());
    }

    out.write(order == bitendian::Endian::Little ? "II" : "MM", 2);
    bitendian::write_ne<uint16_t>(out, 42, order);
    bitendian::write_ne<uint32_t>(out, 8, order);
}

Header read_header(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Failed to open " + path.string());
    }

    char tag[2] = {};
    in.read(tag, 2);
    if (in.gcount() != 2 || tag[0] != tag[1] || (tag[0] != 'I' && tag[0] != 'M')) {
        throw std::runtime_error("Not a TIFF header");
    }

    Header header{};
    header.order = tag[0] == 'I' ? bitendian::Endian::Little : bitendian::Endian::Big;
    header.magic = bitendian::read_ne<uint16_t>(in, header.order);
    header.first_offset = bitendian::read_ne<uint32_t>(in, header.order);
    return header;
}

} // namespace

int main() {
    std::cout << "BITENDIAN - File Header Example\n";
    std::cout << "===================================\n\n";

    auto dir = std::filesystem::temp_directory_path() / "bitendian_file_header_example";
    std::filesystem::create_directories(dir);

    try {
        for (auto order : {bitendian::Endian::Little, bitendian::Endian::Big}) {
            auto path = dir / (std::string("header_") + bitendian::endian_string(order) + ".tif");
            write_header(path, order);

            Header header = read_header(path);
            std::cout << "  " << path.filename().string()
                      << ": order=" << bitendian::endian_string(header.order)
                      << " magic=" << header.magic << " first IFD at " << header.first_offset
                      << "\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        std::filesystem::remove_all(dir);
        return 1;
    }

    std::filesystem::remove_all(dir);
    std::cout << "\nAll examples completed!\n";
    return 0;
}
