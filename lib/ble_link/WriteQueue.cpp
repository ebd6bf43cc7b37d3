/**
 * @file WriteQueue.cpp
 * @brief Pacing write queue implementation
 */

#include "WriteQueue.h"
#include "Log.h"

#include <cstdio>
#include <memory>
#include <vector>

namespace Tapir { namespace BLE {

WriteQueue::WriteQueue(FrameWriter writer, uint8_t category)
    : _writer(writer), _codec(Fragment::MAX_CHUNK_SIZE, category) {
    _codec.setMTU(MTU::MINIMUM);
}

WriteQueue::~WriteQueue() {
    stop();
}

std::future<OperationResult> WriteQueue::enqueue(const Bytes& payload) {
    std::shared_ptr<std::promise<OperationResult>> promise =
        std::make_shared<std::promise<OperationResult>>();
    std::future<OperationResult> future = promise->get_future();

    enqueue(payload, [promise](OperationResult result) {
        promise->set_value(result);
    });

    return future;
}

void WriteQueue::enqueue(const Bytes& payload, Completion completion) {
    PendingWrite item;
    item.payload = payload;
    item.enqueued_at = RNS::Utilities::OS::time();
    item.completion = completion;

    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (!_stopping) {
            _stats.enqueued++;
            _queue.push_back(std::move(item));
            startWorkerLocked();
            _cv.notify_all();

            TRACE("WriteQueue: Enqueued " + std::to_string(payload.size()) +
                  " bytes, queue depth: " + std::to_string(_queue.size()));
            return;
        }
    }

    WARNING("WriteQueue: Enqueue after stop, cancelling");
    finish(item, OperationResult::CANCELLED);
}

void WriteQueue::startWorkerLocked() {
    // One persistent worker; later enqueues rely on it reaching them
    if (_worker_started) {
        return;
    }
    _worker_started = true;
    _worker = std::thread(&WriteQueue::workerLoop, this);
    DEBUG("WriteQueue: Worker started");
}

void WriteQueue::workerLoop() {
    std::unique_lock<std::mutex> lock(_mutex);

    while (true) {
        _cv.wait(lock, [this] { return _stopping || !_queue.empty(); });
        if (_stopping) {
            break;
        }

        PendingWrite item = std::move(_queue.front());
        _queue.pop_front();
        _busy = true;

        // Snapshot sizing so a concurrent MTU change never splits one payload
        FrameCodec codec = _codec;
        uint32_t timeout_ms = _timeout_ms;
        lock.unlock();

        OperationResult result;
        double waited = RNS::Utilities::OS::time() - item.enqueued_at;
        if (waited * 1000.0 > timeout_ms) {
            WARNING("WriteQueue: Item timed out after " +
                    std::to_string(static_cast<int>(waited * 1000)) + "ms in backlog");
            result = OperationResult::TIMEOUT;
        } else {
            result = service(item, codec);
        }

        finish(item, result);

        lock.lock();
        _busy = false;
    }

    DEBUG("WriteQueue: Worker stopped");
}

OperationResult WriteQueue::service(const PendingWrite& item, const FrameCodec& codec) {
    std::vector<Bytes> frames = codec.encode(item.payload);
    if (frames.empty()) {
        ERROR("WriteQueue: Payload could not be framed");
        return OperationResult::INVALID_ARGUMENT;
    }

    for (size_t i = 0; i < frames.size(); i++) {
        OperationResult result = _writer ? _writer(frames[i]) : OperationResult::NOT_SUPPORTED;
        if (result != OperationResult::SUCCESS) {
            char buf[96];
            snprintf(buf, sizeof(buf), "WriteQueue: Frame %zu/%zu write failed: %s",
                     i + 1, frames.size(), resultToString(result));
            ERROR(buf);
            return result;
        }

        std::lock_guard<std::mutex> lock(_mutex);
        _stats.frames_written++;
    }

    {
        char buf[80];
        snprintf(buf, sizeof(buf), "WriteQueue: Wrote %zu bytes in %zu frames",
                 item.payload.size(), frames.size());
        TRACE(buf);
    }

    return OperationResult::SUCCESS;
}

void WriteQueue::finish(const PendingWrite& item, OperationResult result) {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        switch (result) {
            case OperationResult::SUCCESS:
                _stats.completed++;
                break;
            case OperationResult::TIMEOUT:
                _stats.timed_out++;
                break;
            case OperationResult::CANCELLED:
            case OperationResult::DISCONNECTED:
                _stats.cancelled++;
                break;
            default:
                _stats.failed++;
                break;
        }
    }

    if (item.completion) {
        item.completion(result);
    }
}

void WriteQueue::clear(OperationResult reason) {
    std::deque<PendingWrite> cancelled;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        cancelled.swap(_queue);
    }

    for (const PendingWrite& item : cancelled) {
        finish(item, reason);
    }

    if (!cancelled.empty()) {
        DEBUG("WriteQueue: Cleared " + std::to_string(cancelled.size()) +
              " queued items (" + resultToString(reason) + ")");
    }
}

void WriteQueue::stop() {
    std::deque<PendingWrite> cancelled;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _stopping = true;
        cancelled.swap(_queue);
    }
    _cv.notify_all();

    if (_worker.joinable() && _worker.get_id() != std::this_thread::get_id()) {
        _worker.join();
    }

    for (const PendingWrite& item : cancelled) {
        finish(item, OperationResult::CANCELLED);
    }
}

void WriteQueue::setTimeout(uint32_t timeout_ms) {
    std::lock_guard<std::mutex> lock(_mutex);
    _timeout_ms = timeout_ms;
}

uint32_t WriteQueue::getTimeout() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _timeout_ms;
}

void WriteQueue::setMTU(uint16_t mtu) {
    std::lock_guard<std::mutex> lock(_mutex);
    _codec.setMTU(mtu);
}

void WriteQueue::setMaxChunkSize(size_t max_chunk_size) {
    std::lock_guard<std::mutex> lock(_mutex);
    _codec.setMaxChunkSize(max_chunk_size);
}

size_t WriteQueue::getMaxChunkSize() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _codec.getMaxChunkSize();
}

size_t WriteQueue::depth() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _queue.size();
}

bool WriteQueue::isBusy() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _busy;
}

WriteQueue::Stats WriteQueue::stats() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _stats;
}

}} // namespace Tapir::BLE
