// Basic usage example for BITENDIAN

#include <array>
#include <iomanip>
#include <iostream>
#include <sstream>

#include <bitendian.hpp>

template <size_t N>
static void print_bytes(const std::array<uint8_t, N>& bytes) {
    for (uint8_t b : bytes) {
        std::cout << " " << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);
    }
    std::cout << std::dec << "\n";
}

int main() {
    std::cout << "BITENDIAN " << bitendian::version_string << " - Basic Usage Example\n";
    std::cout << "===================================\n\n";

    // Example 1: Fixed byte order conversions
    {
        std::cout << "Example 1: Converting values to bytes\n";

        std::cout << "  256u16 big-endian:   ";
        print_bytes(bitendian::to_be_bytes<uint16_t>(256));
        std::cout << "  256u16 little-endian:";
        print_bytes(bitendian::to_le_bytes<uint16_t>(256));
        std::cout << "  -1i32 big-endian:    ";
        print_bytes(bitendian::to_be_bytes<int32_t>(-1));
        std::cout << "  1.0f big-endian:     ";
        print_bytes(bitendian::to_be_bytes(1.0f));

        std::array<uint8_t, 4> wire{0xDE, 0xAD, 0xBE, 0xEF};
        std::cout << "  DE AD BE EF as u32 BE: 0x" << std::hex
                  << bitendian::from_be_bytes<uint32_t>(wire) << std::dec << "\n\n";
    }

    // Example 2: Byte order chosen at compile time or at run time
    {
        std::cout << "Example 2: Selecting byte order\n";

        auto network = bitendian::to_bytes<bitendian::NetworkEndian>(uint16_t{8080});
        auto runtime = bitendian::to_bytes(uint16_t{8080}, bitendian::Endian::Big);
        std::cout << "  Marker and run-time order agree: " << (network == runtime ? "yes" : "no")
                  << "\n\n";
    }

    // Example 3: Streams
    {
        std::cout << "Example 3: Reading and writing streams\n";

        std::stringstream stream;
        bitendian::write_be<uint32_t>(stream, 0xCAFEBABE);
        bitendian::write_le(stream, -2.5);

        std::cout << "  u32 BE: 0x" << std::hex << bitendian::read_be<uint32_t>(stream) << std::dec
                  << "\n";
        std::cout << "  f64 LE: " << bitendian::read_le<double>(stream) << "\n";

        boost::system::error_code ec;
        bitendian::read_be<uint16_t>(stream, ec);
        std::cout << "  Reading past the end: " << ec.message() << "\n\n";
    }

    std::cout << "All examples completed!\n";
    return 0;
}
