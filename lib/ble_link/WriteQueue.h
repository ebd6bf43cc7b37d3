/**
 * @file WriteQueue.h
 * @brief Pacing write queue for serializing outbound frames
 *
 * Constrained peripherals do not queue GATT writes internally - issuing a
 * second write while one is in flight leads to "busy" failures or dropped
 * data. This queue accepts whole application payloads from any number of
 * producers and writes their frames one at a time, in submission order,
 * from a single worker thread.
 *
 * Guarantees:
 *   - strict FIFO across enqueue calls
 *   - all frames of one payload are written before the next payload starts
 *   - an item that waited in the backlog longer than the timeout is failed
 *     with TIMEOUT at dequeue time and never written
 *   - the first failing frame write fails the whole item
 */
#pragma once

#include "LinkTypes.h"
#include "FrameCodec.h"
#include "Bytes.h"
#include "Utilities/OS.h"

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <thread>

namespace Tapir { namespace BLE {

class WriteQueue {
public:
    /**
     * @brief Transport write primitive for a single raw frame
     */
    using FrameWriter = std::function<OperationResult(const Bytes& frame)>;

    using Completion = Callbacks::OnCompletion;

    struct Stats {
        uint32_t enqueued = 0;
        uint32_t completed = 0;
        uint32_t failed = 0;
        uint32_t timed_out = 0;
        uint32_t cancelled = 0;
        uint32_t frames_written = 0;
    };

public:
    /**
     * @param writer Transport write primitive (the only writer to the transport)
     * @param category Frame category byte
     */
    explicit WriteQueue(FrameWriter writer, uint8_t category = Fragment::CATEGORY);
    ~WriteQueue();

    WriteQueue(const WriteQueue&) = delete;
    WriteQueue& operator=(const WriteQueue&) = delete;

    /**
     * @brief Queue a payload and get a future for its outcome
     *
     * @param payload Complete (unfragmented) application message
     * @return Resolves once every frame was written, or with the failure
     */
    std::future<OperationResult> enqueue(const Bytes& payload);

    /**
     * @brief Queue a payload with a completion callback
     *
     * The completion is invoked from the worker thread (or from the calling
     * thread of clear()/stop() for cancelled items).
     */
    void enqueue(const Bytes& payload, Completion completion);

    /**
     * @brief Fail every queued item with the given result
     *
     * The item currently being written (if any) finishes normally.
     */
    void clear(OperationResult reason = OperationResult::CANCELLED);

    /**
     * @brief Stop the worker, cancelling everything still queued
     */
    void stop();

    /**
     * @brief Set backlog timeout
     * @param timeout_ms Maximum wait before an item is serviced
     */
    void setTimeout(uint32_t timeout_ms);
    uint32_t getTimeout() const;

    /**
     * @brief Update frame sizing from a negotiated MTU
     */
    void setMTU(uint16_t mtu);
    void setMaxChunkSize(size_t max_chunk_size);
    size_t getMaxChunkSize() const;

    /**
     * @brief Get queue depth (items waiting, excluding the one in flight)
     */
    size_t depth() const;

    /**
     * @brief Check if an item is being written
     */
    bool isBusy() const;

    Stats stats() const;

private:
    /**
     * @brief One queued outbound message
     */
    struct PendingWrite {
        Bytes payload;
        double enqueued_at = 0;
        Completion completion;
    };

    void startWorkerLocked();
    void workerLoop();
    OperationResult service(const PendingWrite& item, const FrameCodec& codec);
    void finish(const PendingWrite& item, OperationResult result);

    FrameWriter _writer;
    FrameCodec _codec;

    std::deque<PendingWrite> _queue;
    mutable std::mutex _mutex;
    std::condition_variable _cv;
    std::thread _worker;
    bool _worker_started = false;
    bool _stopping = false;
    bool _busy = false;

    uint32_t _timeout_ms = Timing::WRITE_TIMEOUT_MS;
    Stats _stats;
};

}} // namespace Tapir::BLE
