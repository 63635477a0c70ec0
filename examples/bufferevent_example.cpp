// libevent example for BITENDIAN
//
// Reads a little-endian u32 sequence number and a big-endian f64 from a
// bufferevent, with the writes issued on the peer of a socket pair.

#include <iostream>

#include <sys/socket.h>

#include <event2/bufferevent.h>
#include <event2/event.h>
#include <event2/util.h>

#include <bitendian/bitendian_libevent.hpp>

int main() {
    std::cout << "BITENDIAN - libevent Example\n";
    std::cout << "===================================\n\n";

    event_base* base = event_base_new();
    if (!base) {
        std::cerr << "Failed to create event base\n";
        return 1;
    }

    evutil_socket_t fds[2];
    if (evutil_socketpair(AF_UNIX, SOCK_STREAM, 0, fds) != 0) {
        std::cerr << "Failed to create socket pair\n";
        event_base_free(base);
        return 1;
    }
    evutil_make_socket_nonblocking(fds[0]);
    evutil_make_socket_nonblocking(fds[1]);

    bufferevent* client = bufferevent_socket_new(base, fds[0], BEV_OPT_CLOSE_ON_FREE);
    bufferevent* server = bufferevent_socket_new(base, fds[1], BEV_OPT_CLOSE_ON_FREE);
    if (!client || !server) {
        std::cerr << "Failed to create bufferevents\n";
        if (client) {
            bufferevent_free(client);
        }
        if (server) {
            bufferevent_free(server);
        }
        event_base_free(base);
        return 1;
    }

    int status = 0;
    {
        auto send_seq = bitendian::libevent::write_le<uint32_t>(client, 1001);
        auto send_value = bitendian::libevent::write_be(client, 6.02e23);
        auto recv_seq = bitendian::libevent::read_le<uint32_t>(server);
        auto recv_value = bitendian::libevent::read_be<double>(server);

        // One write per bufferevent at a time: chain the writes
        send_seq.start([&](boost::system::error_code ec) {
            if (ec) {
                std::cerr << "Write failed: " << ec.message() << "\n";
                status = 1;
                event_base_loopbreak(base);
                return;
            }
            send_value.start([](boost::system::error_code) {});
        });

        recv_seq.start([&](boost::system::error_code ec, uint32_t seq) {
            if (ec) {
                std::cerr << "Read failed: " << ec.message() << "\n";
                status = 1;
                event_base_loopbreak(base);
                return;
            }
            std::cout << "  Sequence number: " << seq << "\n";

            recv_value.start([&](boost::system::error_code ec2, double value) {
                if (ec2) {
                    std::cerr << "Read failed: " << ec2.message() << "\n";
                    status = 1;
                } else {
                    std::cout << "  Value: " << value << "\n";
                }
                event_base_loopbreak(base);
            });
        });

        event_base_dispatch(base);
    }

    bufferevent_free(client);
    bufferevent_free(server);
    event_base_free(base);

    if (status == 0) {
        std::cout << "\nAll examples completed!\n";
    }
    return status;
}
