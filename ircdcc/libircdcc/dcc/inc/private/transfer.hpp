#ifndef IRCDCC_DCC_TRANSFER_HPP_
#define IRCDCC_DCC_TRANSFER_HPP_

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <mutex>
#include <string>

#include <boost/asio.hpp>

#include "checksumverification.hpp"
#include "listenerbinder.hpp"
#include "transferinfo.hpp"
#include "transferstatus.hpp"

namespace ircdcc::crypto
{
// Forward declarations
class ChecksumCalculator;
}  // namespace ircdcc::crypto

namespace ircdcc::dcc
{
// Forward declarations
class TransferObserver;

// One file movement. The transfer exclusively owns its sockets and file handle. Connection
// setup and data movement happen in run(), which is meant to be executed on a thread of its own.
class Transfer
{
public:
    using Clock    = std::chrono::steady_clock;
    using Duration = Clock::duration;

    struct Parameters
    {
        std::string               id;
        std::string               peer;
        std::string               filename;
        uint64_t                  file_size = 0;
        std::string               local_path;
        uint64_t                  resume_offset = 0;
        bool                      passive       = false;
        std::string               token;
        std::chrono::milliseconds timeout {300000};
        uint64_t                  bandwidth_limit = 0;  // Bytes per second, 0 means unlimited
        size_t                    buffer_size     = 8192;
        bool                      checksum_verify = false;
        std::string               checksum_algorithm;
    };

    Transfer(Parameters params, std::shared_ptr<crypto::ChecksumCalculator> checksum_calculator,
        std::shared_ptr<TransferObserver> observer);
    virtual ~Transfer();

    Transfer(const Transfer &) = delete;
    Transfer &operator=(const Transfer &) = delete;

    [[nodiscard]] virtual Direction direction() const = 0;

    [[nodiscard]] const std::string &id() const;
    [[nodiscard]] const std::string &peer() const;
    [[nodiscard]] const std::string &filename() const;
    [[nodiscard]] const std::string &local_path() const;
    [[nodiscard]] const std::string &token() const;
    [[nodiscard]] uint64_t           file_size() const;
    [[nodiscard]] uint64_t           resume_offset() const;
    [[nodiscard]] bool               passive() const;
    [[nodiscard]] unsigned short     listen_port() const;
    [[nodiscard]] TransferStatus     status() const;
    [[nodiscard]] uint64_t           bytes_transferred() const;
    [[nodiscard]] Clock::time_point  status_changed_at() const;
    [[nodiscard]] TransferInfo       info() const;

    // Binds the listening socket the peer is going to connect to
    bool listen(network::PortRange port_range, unsigned short &port);
    bool set_peer_endpoint(const std::string &ip, unsigned short port);

    // Fails when the transfer is already terminal
    bool set_status(TransferStatus status, const std::string &error = {});

    // Changes the status only if the current one is among the expected ones
    bool transition(std::initializer_list<TransferStatus> expected, TransferStatus status);

    // Records the byte count reached so far. Reports are rate limited unless forced.
    void update_progress(uint64_t bytes_transferred, bool force_report = false);

    // Connects to the peer, moves the data and releases every resource on exit
    void run();

    // Cancelling a terminal transfer does nothing
    bool cancel();

    // Moves a transfer still waiting for its peer (PENDING_ACCEPT or NEGOTIATING) to TIMED_OUT
    // and closes everything. Fails once the transfer moved on.
    bool expire(const std::string &reason);

    // Fails the transfer from outside the mover, for instance when its offer cannot be sent
    bool abort(const std::string &error);

    [[nodiscard]] bool mover_running() const;
    bool               wait_for_mover(std::chrono::milliseconds timeout) const;

    // The sender's value; compared once the local checksum is known
    void set_expected_checksum(const std::string &algorithm, const std::string &value);

protected:
    virtual void move_data() = 0;

    [[nodiscard]] bool is_cancelled() const;
    void               fail(const std::string &error);

    // Blocking socket helpers bounded by the transfer timeout. A timeout is reported as
    // boost::asio::error::timed_out.
    boost::system::error_code read_some(uint8_t *data, size_t size, size_t &bytes_read);
    boost::system::error_code write_all(const uint8_t *data, size_t size);

    // Sleeps so the average throughput stays under the bandwidth limit. Wakes up on cancel.
    void throttle(Clock::time_point &chunk_start, size_t chunk_size);

    [[nodiscard]] bool checksum_enabled() const;

    // Hashes the local file and compares the result with the sender's value
    void compute_local_checksum();

    const Parameters                                  params_;
    const std::shared_ptr<crypto::ChecksumCalculator> checksum_calculator_;
    boost::asio::io_context                           io_ctx_;
    boost::asio::ip::tcp::socket                      socket_;

private:
    bool establish_connection();
    bool accept_connection();
    bool connect_to_peer();
    // An empty expected list allows any non-terminal status
    bool change_status(std::initializer_list<TransferStatus> expected, TransferStatus status,
        const std::string &error);
    bool stop(TransferStatus status, const std::string &error,
        std::initializer_list<TransferStatus> expected = {});
    bool run_io(Duration timeout);
    void close_sockets();
    void notify_checksum_updated();

    boost::asio::ip::tcp::acceptor           acceptor_;
    const std::shared_ptr<TransferObserver>  observer_;
    boost::asio::ip::tcp::endpoint           peer_endpoint_;
    bool                                     has_peer_endpoint_;
    unsigned short                           listen_port_;
    TransferStatus                           status_;
    std::string                              error_;
    Clock::time_point                        status_changed_at_;
    uint64_t                                 bytes_transferred_;
    double                                   rate_;
    double                                   eta_seconds_;
    uint64_t                                 rate_sample_bytes_;
    Clock::time_point                        rate_sample_time_;
    Clock::time_point                        last_report_time_;
    ChecksumVerification                     checksum_;
    bool                                     mover_running_;
    mutable std::mutex                       mutex_;
    std::mutex                               notify_mutex_;
    mutable std::condition_variable          cv_;
};
}  // namespace ircdcc::dcc

#endif  // IRCDCC_DCC_TRANSFER_HPP_
