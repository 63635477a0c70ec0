// Boost.Asio example for BITENDIAN
//
// Sends a length-prefixed record over a connected socket pair: the blocking
// API writes, the asynchronous API reads.

#include <functional>
#include <iostream>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/local/connect_pair.hpp>
#include <boost/asio/local/stream_protocol.hpp>

#include <bitendian/bitendian_asio.hpp>

using boost::asio::local::stream_protocol;

int main() {
    std::cout << "BITENDIAN - Boost.Asio Example\n";
    std::cout << "===================================\n\n";

    boost::asio::io_context io;
    stream_protocol::socket sender(io);
    stream_protocol::socket receiver(io);

    try {
        boost::asio::local::connect_pair(sender, receiver);

        // Record: u16 BE count, then count x f32 LE samples
        const std::vector<float> samples = {0.25f, -1.0f, 3.5f};
        bitendian::write_be(sender, static_cast<uint16_t>(samples.size()));
        for (float s : samples) {
            bitendian::write_le(sender, s);
        }
        sender.shutdown(stream_protocol::socket::shutdown_send);
    } catch (const boost::system::system_error& e) {
        std::cerr << "Send failed: " << e.what() << "\n";
        return 1;
    }

    std::vector<float> received;
    uint16_t expected = 0;
    bool ok = true;

    // Read samples one after another until the declared count is reached
    std::function<void()> read_sample = [&]() {
        if (received.size() == expected) {
            return;
        }
        bitendian::async_read_le<float>(receiver, [&](boost::system::error_code ec, float value) {
            if (ec) {
                std::cerr << "Sample read failed: " << ec.message() << "\n";
                ok = false;
                return;
            }
            received.push_back(value);
            read_sample();
        });
    };

    bitendian::async_read_be<uint16_t>(receiver, [&](boost::system::error_code ec, uint16_t count) {
        if (ec) {
            std::cerr << "Header read failed: " << ec.message() << "\n";
            ok = false;
            return;
        }
        std::cout << "  Record announces " << count << " samples\n";
        expected = count;
        read_sample();
    });

    io.run();

    for (float s : received) {
        std::cout << "  sample: " << s << "\n";
    }

    // The sender closed its side: one more read reports unexpected_eof
    boost::system::error_code ec;
    bitendian::read_be<uint32_t>(receiver, ec);
    std::cout << "  Trailing read: " << ec.message() << "\n";

    if (!ok) {
        return 1;
    }
    std::cout << "\nAll examples completed!\n";
    return 0;
}
