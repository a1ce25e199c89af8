#include "shard_stream.hpp"
#include "chunked_record_processor.hpp"
#include "stream_errors.hpp"
#include <iostream>
#include <random>
#include <sstream>
#include <iomanip>

const char* toString(StreamState state) {
    switch (state) {
        case StreamState::Created: return "created";
        case StreamState::Running: return "running";
        case StreamState::Stopping: return "stopping";
        case StreamState::Stopped: return "stopped";
    }
    return "unknown";
}

static size_t validatedBufferSize(const ConsumerSettings& settings) {
    settings.validate();
    return settings.buffer_size;
}

ShardStream::ShardStream(const ConsumerSettings& settings, CoordinatorFactory coordinator_factory)
    : settings_(settings)
    , coordinator_factory_(std::move(coordinator_factory))
    , worker_id_(generateWorkerId())
    , buffer_(validatedBufferSize(settings))
    , state_(StreamState::Created)
    , failed_(false)
    , records_read_(0) {
    if (!coordinator_factory_) {
        throw std::invalid_argument("coordinator factory must be set");
    }
}

ShardStream::~ShardStream() {
    stop();
}

std::string ShardStream::generateWorkerId() {
    static thread_local std::mt19937_64 gen(std::random_device{}());
    std::uniform_int_distribution<uint64_t> dist;

    uint64_t high = dist(gen);
    uint64_t low = dist(gen);

    // Version 4, RFC 4122 variant
    high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::ostringstream id;
    id << std::hex << std::setfill('0')
       << std::setw(8) << (high >> 32) << '-'
       << std::setw(4) << ((high >> 16) & 0xFFFF) << '-'
       << std::setw(4) << (high & 0xFFFF) << '-'
       << std::setw(4) << (low >> 48) << '-'
       << std::setw(12) << (low & 0xFFFFFFFFFFFFULL);
    return id.str();
}

bool ShardStream::next(Chunk& out) {
    if (state_.load() == StreamState::Created) {
        start();
    }

    if (state_.load() != StreamState::Running) {
        if (failed_) {
            throw BufferClosedError("ShardStream " + worker_id_ + ": Stream already terminated by an error");
        }
        return false;
    }

    bool received = false;
    try {
        received = buffer_.dequeue(out);
    } catch (const std::exception& e) {
        std::cerr << "ShardStream " << worker_id_ << ": Terminating stream: " << e.what() << std::endl;
        failed_ = true;
        stop();
        throw;
    }

    if (!received) {
        stop();
        return false;
    }

    records_read_ += out.size();
    return true;
}

void ShardStream::cancel() {
    std::cout << "ShardStream " << worker_id_ << ": Cancel requested" << std::endl;
    stop();
}

void ShardStream::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);

    if (state_.load() != StreamState::Created) {
        return;
    }

    try {
        coordinator_ = coordinator_factory_(settings_, worker_id_, [this]() {
            return createProcessor();
        });
    } catch (const std::exception& e) {
        state_ = StreamState::Stopped;
        failed_ = true;
        buffer_.close();
        throw CoordinatorError("ShardStream " + worker_id_ +
                               ": Failed to create coordinator: " + e.what());
    }

    if (!coordinator_) {
        state_ = StreamState::Stopped;
        failed_ = true;
        buffer_.close();
        throw CoordinatorError("ShardStream " + worker_id_ + ": Coordinator factory returned null");
    }

    state_ = StreamState::Running;
    coordinator_thread_ = std::thread(&ShardStream::runCoordinator, this);

    std::cout << "ShardStream " << worker_id_ << ": Started on stream " << settings_.stream_name
              << " for application " << settings_.app_name
              << " (buffer: " << settings_.buffer_size << " chunks)" << std::endl;
}

void ShardStream::runCoordinator() {
    std::string reason;
    try {
        coordinator_->run();
        reason = "Coordinator exited";
    } catch (const std::exception& e) {
        reason = std::string("Coordinator failed: ") + e.what();
    }

    if (state_.load() != StreamState::Running) {
        std::cout << "ShardStream " << worker_id_ << ": Coordinator stopped" << std::endl;
        return;
    }

    // The stream is infinite, so any exit while running is abnormal
    std::cerr << "ShardStream " << worker_id_ << ": " << reason << std::endl;
    buffer_.fail(std::make_exception_ptr(
        CoordinatorError("ShardStream " + worker_id_ + ": " + reason)));
}

void ShardStream::stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);

    StreamState state = state_.load();
    if (state == StreamState::Stopped || state == StreamState::Stopping) {
        return;
    }

    if (state == StreamState::Created) {
        state_ = StreamState::Stopped;
        buffer_.close();
        return;
    }

    state_ = StreamState::Stopping;
    std::cout << "ShardStream " << worker_id_ << ": Stopping..." << std::endl;

    // Release shard threads blocked on a full buffer before the coordinator
    // waits for them
    buffer_.close();

    try {
        coordinator_->shutdown();
    } catch (const std::exception& e) {
        std::cerr << "ShardStream " << worker_id_ << ": Error during coordinator shutdown: "
                  << e.what() << std::endl;
    }

    if (coordinator_thread_.joinable()) {
        coordinator_thread_.join();
    }
    coordinator_.reset();

    state_ = StreamState::Stopped;
    std::cout << "ShardStream " << worker_id_ << ": Stopped after "
              << records_read_.load() << " records" << std::endl;
}

std::unique_ptr<ShardRecordProcessor> ShardStream::createProcessor() {
    return std::make_unique<ChunkedRecordProcessor>([this](Chunk chunk) {
        return buffer_.enqueue(std::move(chunk));
    });
}

RecordStream::RecordStream(const ConsumerSettings& settings, CoordinatorFactory coordinator_factory)
    : chunks_(std::make_unique<ShardStream>(settings, std::move(coordinator_factory)))
    , position_(0)
    , cancelled_(false) {
}

RecordStream::RecordStream(std::unique_ptr<ShardStream> chunks)
    : chunks_(std::move(chunks))
    , position_(0)
    , cancelled_(false) {
    if (!chunks_) {
        throw std::invalid_argument("chunk stream must be set");
    }
}

bool RecordStream::next(CommittableRecord& out) {
    if (cancelled_) {
        return false;
    }

    while (position_ >= current_.size()) {
        current_.clear();
        position_ = 0;
        if (!chunks_->next(current_) || cancelled_) {
            return false;
        }
    }

    out = std::move(current_[position_]);
    ++position_;
    return true;
}

void RecordStream::cancel() {
    cancelled_ = true;
    chunks_->cancel();
}

std::unique_ptr<ShardStream> readChunkedFromStream(const ConsumerSettings& settings,
                                                   CoordinatorFactory coordinator_factory) {
    return std::make_unique<ShardStream>(settings, std::move(coordinator_factory));
}

std::unique_ptr<RecordStream> readFromStream(const ConsumerSettings& settings,
                                             CoordinatorFactory coordinator_factory) {
    return std::make_unique<RecordStream>(settings, std::move(coordinator_factory));
}
