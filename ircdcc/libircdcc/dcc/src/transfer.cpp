#include "transfer.hpp"

#include <algorithm>
#include <sstream>

#include <glog/logging.h>

#include "checksumcalculator.hpp"
#include "defer.hpp"
#include "transferobserver.hpp"

namespace ircdcc::dcc
{
namespace
{
constexpr auto rate_window     = std::chrono::milliseconds {500};
constexpr auto report_interval = std::chrono::milliseconds {250};

std::string seconds_string(std::chrono::milliseconds duration)
{
    auto seconds = std::chrono::duration<double>(duration).count();
    std::ostringstream ss;
    ss << seconds << "s";
    return ss.str();
}
}  // namespace

Transfer::Transfer(Parameters params,
    std::shared_ptr<crypto::ChecksumCalculator> checksum_calculator,
    std::shared_ptr<TransferObserver>           observer)
    : params_ {std::move(params)}
    , checksum_calculator_ {std::move(checksum_calculator)}
    , socket_ {io_ctx_}
    , acceptor_ {io_ctx_}
    , observer_ {std::move(observer)}
    , has_peer_endpoint_ {false}
    , listen_port_ {0}
    , status_ {TransferStatus::QUEUED}
    , status_changed_at_ {Clock::now()}
    , bytes_transferred_ {params_.resume_offset}
    , rate_ {0}
    , eta_seconds_ {-1}
    , rate_sample_bytes_ {params_.resume_offset}
    , rate_sample_time_ {Clock::now()}
    , last_report_time_ {}
    , checksum_ {params_.checksum_verify, params_.checksum_algorithm}
    , mover_running_ {false}
{}

Transfer::~Transfer()
{
    close_sockets();
}

const std::string &Transfer::id() const
{
    return params_.id;
}

const std::string &Transfer::peer() const
{
    return params_.peer;
}

const std::string &Transfer::filename() const
{
    return params_.filename;
}

const std::string &Transfer::local_path() const
{
    return params_.local_path;
}

const std::string &Transfer::token() const
{
    return params_.token;
}

uint64_t Transfer::file_size() const
{
    return params_.file_size;
}

uint64_t Transfer::resume_offset() const
{
    return params_.resume_offset;
}

bool Transfer::passive() const
{
    return params_.passive;
}

unsigned short Transfer::listen_port() const
{
    std::lock_guard lock {mutex_};
    return listen_port_;
}

TransferStatus Transfer::status() const
{
    std::lock_guard lock {mutex_};
    return status_;
}

uint64_t Transfer::bytes_transferred() const
{
    std::lock_guard lock {mutex_};
    return bytes_transferred_;
}

Transfer::Clock::time_point Transfer::status_changed_at() const
{
    std::lock_guard lock {mutex_};
    return status_changed_at_;
}

TransferInfo Transfer::info() const
{
    TransferInfo info;
    info.id            = params_.id;
    info.direction     = direction();
    info.peer          = params_.peer;
    info.filename      = params_.filename;
    info.local_path    = params_.local_path;
    info.file_size     = params_.file_size;
    info.resume_offset = params_.resume_offset;
    info.passive       = params_.passive;
    info.token         = params_.token;

    std::lock_guard lock {mutex_};
    if (has_peer_endpoint_)
    {
        info.peer_ip   = peer_endpoint_.address().to_string();
        info.peer_port = peer_endpoint_.port();
    }
    info.listen_port        = listen_port_;
    info.status             = status_;
    info.error              = error_;
    info.bytes_transferred  = bytes_transferred_;
    info.rate               = rate_;
    info.eta_seconds        = eta_seconds_;
    info.checksum_status    = info.direction == Direction::SEND ? ChecksumStatus::NOT_CHECKED :
                                                                  checksum_.status();
    info.checksum_algorithm = checksum_.algorithm();
    info.expected_checksum  = checksum_.expected();
    info.local_checksum     = checksum_.local();
    return info;
}

bool Transfer::listen(network::PortRange port_range, unsigned short &port)
{
    std::lock_guard lock {mutex_};
    if (is_terminal(status_))
    {
        return false;
    }
    if (!network::bind_listener(acceptor_, port_range, port))
    {
        return false;
    }
    listen_port_ = port;
    return true;
}

bool Transfer::set_peer_endpoint(const std::string &ip, unsigned short port)
{
    boost::system::error_code ec;
    auto                      address = boost::asio::ip::make_address_v4(ip, ec);
    if (ec || port == 0)
    {
        LOG(WARNING) << "Transfer " << params_.id << ": invalid peer endpoint " << ip << ":"
                     << port;
        return false;
    }

    std::lock_guard lock {mutex_};
    peer_endpoint_     = {address, port};
    has_peer_endpoint_ = true;
    return true;
}

bool Transfer::set_status(TransferStatus status, const std::string &error)
{
    return change_status({}, status, error);
}

bool Transfer::change_status(std::initializer_list<TransferStatus> expected,
    TransferStatus status, const std::string &error)
{
    std::lock_guard notify_lock {notify_mutex_};
    {
        std::lock_guard lock {mutex_};
        if (is_terminal(status_) ||
            (expected.size() != 0 &&
                std::find(expected.begin(), expected.end(), status_) == expected.end()))
        {
            return false;
        }
        if (status_ == status)
        {
            return true;
        }
        status_            = status;
        error_             = error;
        status_changed_at_ = Clock::now();
        if (is_terminal(status_))
        {
            rate_        = 0;
            eta_seconds_ = -1;
            cv_.notify_all();
        }
    }

    LOG(INFO) << "Transfer " << params_.id << " (" << params_.filename << ", " << params_.peer
              << ") is now " << to_string(status) << (error.empty() ? "" : ": ") << error;
    observer_->on_status_changed(params_.id, status, error);
    return true;
}

bool Transfer::transition(std::initializer_list<TransferStatus> expected, TransferStatus status)
{
    std::lock_guard notify_lock {notify_mutex_};
    {
        std::lock_guard lock {mutex_};
        if (std::find(expected.begin(), expected.end(), status_) == expected.end())
        {
            return false;
        }
        if (status_ == status)
        {
            return true;
        }
        status_            = status;
        status_changed_at_ = Clock::now();
    }

    LOG(INFO) << "Transfer " << params_.id << " is now " << to_string(status);
    observer_->on_status_changed(params_.id, status, {});
    return true;
}

void Transfer::update_progress(uint64_t bytes_transferred, bool force_report)
{
    auto now = Clock::now();
    {
        std::lock_guard lock {mutex_};
        bytes_transferred_ = std::min(bytes_transferred, params_.file_size);

        auto since_sample = now - rate_sample_time_;
        if (since_sample >= rate_window)
        {
            auto moved = bytes_transferred_ >= rate_sample_bytes_ ?
                             bytes_transferred_ - rate_sample_bytes_ :
                             0;
            rate_      = double(moved) / std::chrono::duration<double>(since_sample).count();
            rate_sample_bytes_ = bytes_transferred_;
            rate_sample_time_  = now;
            eta_seconds_ =
                rate_ > 0 ? double(params_.file_size - bytes_transferred_) / rate_ : -1;
        }

        if (!force_report && now - last_report_time_ < report_interval)
        {
            return;
        }
        last_report_time_ = now;
    }

    std::lock_guard notify_lock {notify_mutex_};
    uint64_t        bytes;
    double          rate;
    double          eta;
    {
        std::lock_guard lock {mutex_};
        if (is_terminal(status_))
        {
            return;
        }
        bytes = bytes_transferred_;
        rate  = rate_;
        eta   = eta_seconds_;
    }
    observer_->on_progress_changed(params_.id, bytes, rate, eta);
}

void Transfer::run()
{
    {
        std::lock_guard lock {mutex_};
        if (is_terminal(status_))
        {
            close_sockets();
            return;
        }
        mover_running_ = true;
    }

    DEFER({
        close_sockets();
        std::lock_guard lock {mutex_};
        mover_running_ = false;
        cv_.notify_all();
    });

    if (!establish_connection())
    {
        return;
    }

    if (!transition({TransferStatus::CONNECTING}, TransferStatus::IN_PROGRESS))
    {
        return;
    }

    LOG(INFO) << "Transfer " << params_.id << " connected, moving data from offset "
              << params_.resume_offset;
    move_data();
}

bool Transfer::cancel()
{
    return stop(TransferStatus::CANCELLED, "Cancelled by user");
}

bool Transfer::expire(const std::string &reason)
{
    return stop(TransferStatus::TIMED_OUT, reason,
        {TransferStatus::PENDING_ACCEPT, TransferStatus::NEGOTIATING});
}

bool Transfer::abort(const std::string &error)
{
    LOG(ERROR) << "Transfer " << params_.id << " (" << params_.filename << ", " << params_.peer
               << ") aborted: " << error;
    return stop(TransferStatus::FAILED, error);
}

bool Transfer::stop(TransferStatus status, const std::string &error,
    std::initializer_list<TransferStatus> expected)
{
    if (!change_status(expected, status, error))
    {
        return false;
    }

    std::lock_guard lock {mutex_};
    if (mover_running_)
    {
        // Sockets belong to the mover thread, the close runs there
        boost::asio::post(io_ctx_, [this] { close_sockets(); });
    }
    else
    {
        close_sockets();
    }
    return true;
}

bool Transfer::mover_running() const
{
    std::lock_guard lock {mutex_};
    return mover_running_;
}

bool Transfer::wait_for_mover(std::chrono::milliseconds timeout) const
{
    std::unique_lock lock {mutex_};
    return cv_.wait_for(lock, timeout, [this] { return !mover_running_; });
}

void Transfer::set_expected_checksum(const std::string &algorithm, const std::string &value)
{
    {
        std::lock_guard lock {mutex_};
        checksum_.set_expected(algorithm, value);
    }
    notify_checksum_updated();
}

bool Transfer::is_cancelled() const
{
    std::lock_guard lock {mutex_};
    return is_terminal(status_);
}

void Transfer::fail(const std::string &error)
{
    LOG(ERROR) << "Transfer " << params_.id << " (" << params_.filename << ", " << params_.peer
               << ") failed: " << error;
    set_status(TransferStatus::FAILED, error);
}

bool Transfer::checksum_enabled() const
{
    std::lock_guard lock {mutex_};
    return checksum_.enabled();
}

void Transfer::compute_local_checksum()
{
    const auto &algorithm = params_.checksum_algorithm;
    std::string hex_digest;
    std::string error;

    if (!checksum_calculator_ || !checksum_calculator_->is_supported(algorithm))
    {
        error = "Unsupported checksum algorithm " + algorithm;
    }
    else if (!checksum_calculator_->hash_file(algorithm, params_.local_path, hex_digest))
    {
        error = "Cannot read " + params_.local_path + " for hashing";
    }

    {
        std::lock_guard lock {mutex_};
        if (error.empty())
        {
            checksum_.set_local(hex_digest);
        }
        else
        {
            checksum_.set_local_error(error);
        }
    }

    if (!error.empty())
    {
        LOG(WARNING) << "Transfer " << params_.id << ": " << error;
    }
    notify_checksum_updated();
}

void Transfer::notify_checksum_updated()
{
    std::lock_guard notify_lock {notify_mutex_};
    observer_->on_checksum_updated(params_.id);
}

boost::system::error_code Transfer::read_some(uint8_t *data, size_t size, size_t &bytes_read)
{
    boost::system::error_code ec;
    bytes_read = 0;
    socket_.async_read_some(boost::asio::buffer(data, size),
        [&](const boost::system::error_code &error, size_t n) {
            ec         = error;
            bytes_read = n;
        });

    if (!run_io(params_.timeout))
    {
        return boost::asio::error::timed_out;
    }
    return ec;
}

boost::system::error_code Transfer::write_all(const uint8_t *data, size_t size)
{
    boost::system::error_code ec;
    boost::asio::async_write(socket_, boost::asio::buffer(data, size),
        [&](const boost::system::error_code &error, size_t /*n*/) { ec = error; });

    if (!run_io(params_.timeout))
    {
        return boost::asio::error::timed_out;
    }
    return ec;
}

void Transfer::throttle(Clock::time_point &chunk_start, size_t chunk_size)
{
    if (params_.bandwidth_limit != 0)
    {
        auto expected = std::chrono::duration_cast<Duration>(std::chrono::duration<double>(
            double(chunk_size) / double(params_.bandwidth_limit)));
        auto elapsed = Clock::now() - chunk_start;
        if (expected > elapsed)
        {
            std::unique_lock lock {mutex_};
            cv_.wait_for(lock, expected - elapsed, [this] { return is_terminal(status_); });
        }
    }
    chunk_start = Clock::now();
}

bool Transfer::establish_connection()
{
    bool listening;
    bool dialing;
    {
        std::lock_guard lock {mutex_};
        listening = acceptor_.is_open();
        dialing   = has_peer_endpoint_;
    }

    if (listening)
    {
        return accept_connection();
    }
    if (dialing)
    {
        return connect_to_peer();
    }

    fail("No peer endpoint to connect to");
    return false;
}

bool Transfer::accept_connection()
{
    boost::system::error_code ec;
    acceptor_.async_accept(socket_, [&](const boost::system::error_code &error) { ec = error; });

    if (!run_io(params_.timeout))
    {
        set_status(TransferStatus::TIMED_OUT,
            "Peer did not connect within " + seconds_string(params_.timeout));
        return false;
    }
    if (is_cancelled())
    {
        return false;
    }
    if (ec)
    {
        fail("Accepting the peer connection failed: " + ec.message());
        return false;
    }

    // The listening socket is consumed by the single inbound connection
    boost::system::error_code ignored;
    acceptor_.close(ignored);

    auto remote = socket_.remote_endpoint(ignored);
    if (!ignored)
    {
        std::lock_guard lock {mutex_};
        peer_endpoint_     = remote;
        has_peer_endpoint_ = true;
    }

    transition({TransferStatus::NEGOTIATING, TransferStatus::PENDING_RESUME},
        TransferStatus::CONNECTING);
    return true;
}

bool Transfer::connect_to_peer()
{
    transition({TransferStatus::NEGOTIATING, TransferStatus::PENDING_ACCEPT},
        TransferStatus::CONNECTING);

    boost::asio::ip::tcp::endpoint endpoint;
    {
        std::lock_guard lock {mutex_};
        endpoint = peer_endpoint_;
    }

    boost::system::error_code ec;
    socket_.async_connect(endpoint, [&](const boost::system::error_code &error) { ec = error; });

    if (!run_io(params_.timeout))
    {
        set_status(TransferStatus::TIMED_OUT,
            "Cannot connect to " + endpoint.address().to_string() + ":" +
                std::to_string(endpoint.port()) +
                                                  " within " + seconds_string(params_.timeout));
        return false;
    }
    if (is_cancelled())
    {
        return false;
    }
    if (ec)
    {
        fail("Cannot connect to " + endpoint.address().to_string() + ":" +
             std::to_string(endpoint.port()) + ": " + ec.message());
        return false;
    }
    return true;
}

bool Transfer::run_io(Duration timeout)
{
    io_ctx_.restart();
    io_ctx_.run_for(timeout);

    // Pending operations are aborted by closing the sockets, then run to completion
    if (!io_ctx_.stopped())
    {
        close_sockets();
        io_ctx_.run();
        return false;
    }
    return true;
}

void Transfer::close_sockets()
{
    boost::system::error_code ec;
    if (socket_.is_open())
    {
        socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }
    if (acceptor_.is_open())
    {
        acceptor_.close(ec);
    }
}
}  // namespace ircdcc::dcc
