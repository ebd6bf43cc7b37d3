/**
 * @file test_write_queue.cpp
 * @brief Ordering, pacing and failure handling of the write queue
 */

#include <gtest/gtest.h>

#include "WriteQueue.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <vector>

using namespace Tapir::BLE;

namespace {

/**
 * @brief Frame sink that records writes and can hold the writer
 */
class RecordingWriter {
public:
    OperationResult write(const Bytes& frame) {
        std::unique_lock<std::mutex> lock(_mutex);
        _cv.wait(lock, [this] { return !_held; });

        _in_flight++;
        if (_in_flight > _max_in_flight) _max_in_flight = _in_flight;
        lock.unlock();

        std::this_thread::sleep_for(std::chrono::microseconds(200));

        lock.lock();
        _in_flight--;
        if (_fail_after >= 0 && static_cast<int>(_frames.size()) >= _fail_after) {
            return OperationResult::ERROR;
        }
        _frames.push_back(frame);
        return OperationResult::SUCCESS;
    }

    void hold() {
        std::lock_guard<std::mutex> lock(_mutex);
        _held = true;
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _held = false;
        }
        _cv.notify_all();
    }

    void failAfter(int frames) {
        std::lock_guard<std::mutex> lock(_mutex);
        _fail_after = frames;
    }

    std::vector<Bytes> frames() {
        std::lock_guard<std::mutex> lock(_mutex);
        return _frames;
    }

    int maxInFlight() {
        std::lock_guard<std::mutex> lock(_mutex);
        return _max_in_flight;
    }

    WriteQueue::FrameWriter writer() {
        return [this](const Bytes& frame) { return write(frame); };
    }

private:
    std::mutex _mutex;
    std::condition_variable _cv;
    std::vector<Bytes> _frames;
    bool _held = false;
    int _fail_after = -1;
    int _in_flight = 0;
    int _max_in_flight = 0;
};

Bytes filled(size_t size, uint8_t value) {
    Bytes data(size);
    for (size_t i = 0; i < size; i++) {
        data.append(value);
    }
    return data;
}

Fragment::Flag flagOf(const Bytes& frame) {
    return static_cast<Fragment::Flag>(frame.data()[1]);
}

// The id a payload was filled with; Continue/Last carry it right after the short header
uint8_t idOf(const Bytes& frame) {
    Fragment::Flag flag = flagOf(frame);
    bool long_header = (flag == Fragment::COMPLETE || flag == Fragment::FIRST);
    return frame.data()[long_header ? Fragment::COMPLETE_HEADER_SIZE : Fragment::SHORT_HEADER_SIZE];
}

} // namespace

TEST(WriteQueue, FragmentedWriteProducesFirstContinueLast) {
    RecordingWriter sink;
    WriteQueue queue(sink.writer());
    size_t max_chunk = queue.getMaxChunkSize();
    ASSERT_EQ(16u, max_chunk);

    EXPECT_EQ(OperationResult::SUCCESS, queue.enqueue(filled(2 * max_chunk + 10, 0x55)).get());

    std::vector<Bytes> frames = sink.frames();
    ASSERT_EQ(3u, frames.size());
    EXPECT_EQ(Fragment::FIRST, flagOf(frames[0]));
    EXPECT_EQ(Fragment::CONTINUE, flagOf(frames[1]));
    EXPECT_EQ(Fragment::LAST, flagOf(frames[2]));
    EXPECT_EQ(4u + 16u, frames[0].size());
    EXPECT_EQ(2u + 16u, frames[1].size());
    EXPECT_EQ(2u + 10u, frames[2].size());
}

TEST(WriteQueue, ChunkSizeFollowsMtu) {
    RecordingWriter sink;
    WriteQueue queue(sink.writer());
    queue.setMTU(185);
    EXPECT_EQ(178u, queue.getMaxChunkSize());

    EXPECT_EQ(OperationResult::SUCCESS, queue.enqueue(filled(178, 1)).get());
    ASSERT_EQ(1u, sink.frames().size());
    EXPECT_EQ(Fragment::COMPLETE, flagOf(sink.frames()[0]));
}

TEST(WriteQueue, SubmissionOrderIsPreserved) {
    RecordingWriter sink;
    WriteQueue queue(sink.writer());

    sink.hold();
    std::vector<std::future<OperationResult>> results;
    for (uint8_t id = 1; id <= 20; id++) {
        results.push_back(queue.enqueue(filled(40, id)));
    }
    sink.release();

    for (auto& result : results) {
        EXPECT_EQ(OperationResult::SUCCESS, result.get());
    }

    std::vector<Bytes> frames = sink.frames();
    ASSERT_EQ(60u, frames.size());
    for (size_t i = 0; i < frames.size(); i++) {
        EXPECT_EQ(static_cast<uint8_t>(i / 3 + 1), idOf(frames[i])) << "frame " << i;
    }
}

TEST(WriteQueue, ConcurrentProducersNeverInterleave) {
    RecordingWriter sink;
    WriteQueue queue(sink.writer());

    const int producers = 4;
    const int per_producer = 10;
    std::vector<std::thread> threads;
    std::atomic<int> failures(0);

    for (int p = 0; p < producers; p++) {
        threads.emplace_back([&queue, &failures, p] {
            for (int i = 0; i < per_producer; i++) {
                uint8_t id = static_cast<uint8_t>(p * per_producer + i + 1);
                if (queue.enqueue(filled(40, id)).get() != OperationResult::SUCCESS) {
                    failures++;
                }
            }
        });
    }
    for (std::thread& t : threads) {
        t.join();
    }
    EXPECT_EQ(0, failures.load());
    EXPECT_EQ(1, sink.maxInFlight());

    // Each payload is three consecutive frames: First, Continue, Last
    std::vector<Bytes> frames = sink.frames();
    ASSERT_EQ(static_cast<size_t>(producers * per_producer * 3), frames.size());
    for (size_t i = 0; i < frames.size(); i += 3) {
        EXPECT_EQ(Fragment::FIRST, flagOf(frames[i]));
        EXPECT_EQ(Fragment::CONTINUE, flagOf(frames[i + 1]));
        EXPECT_EQ(Fragment::LAST, flagOf(frames[i + 2]));
        EXPECT_EQ(idOf(frames[i]), idOf(frames[i + 1]));
        EXPECT_EQ(idOf(frames[i]), idOf(frames[i + 2]));
    }
}

TEST(WriteQueue, StaleItemTimesOutWithoutBeingWritten) {
    RecordingWriter sink;
    WriteQueue queue(sink.writer());
    queue.setTimeout(50);

    sink.hold();
    std::future<OperationResult> blocked = queue.enqueue(filled(4, 1));
    std::future<OperationResult> stale = queue.enqueue(filled(4, 2));

    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    sink.release();

    EXPECT_EQ(OperationResult::SUCCESS, blocked.get());
    EXPECT_EQ(OperationResult::TIMEOUT, stale.get());

    // A fresh item after the backlog drains is fine
    EXPECT_EQ(OperationResult::SUCCESS, queue.enqueue(filled(4, 3)).get());

    std::vector<Bytes> frames = sink.frames();
    ASSERT_EQ(2u, frames.size());
    EXPECT_EQ(1, idOf(frames[0]));
    EXPECT_EQ(3, idOf(frames[1]));
    EXPECT_EQ(1u, queue.stats().timed_out);
}

TEST(WriteQueue, FrameFailureFailsOnlyThatItem) {
    RecordingWriter sink;
    WriteQueue queue(sink.writer());

    sink.failAfter(1);
    EXPECT_EQ(OperationResult::ERROR, queue.enqueue(filled(40, 1)).get());

    sink.failAfter(-1);
    EXPECT_EQ(OperationResult::SUCCESS, queue.enqueue(filled(4, 2)).get());

    WriteQueue::Stats stats = queue.stats();
    EXPECT_EQ(1u, stats.failed);
    EXPECT_EQ(1u, stats.completed);
}

TEST(WriteQueue, CompletionCallbackVariant) {
    RecordingWriter sink;
    WriteQueue queue(sink.writer());

    std::promise<OperationResult> done;
    queue.enqueue(filled(4, 1), [&done](OperationResult result) {
        done.set_value(result);
    });
    EXPECT_EQ(OperationResult::SUCCESS, done.get_future().get());
}

TEST(WriteQueue, ClearFailsQueuedItemsWithReason) {
    RecordingWriter sink;
    WriteQueue queue(sink.writer());

    sink.hold();
    std::future<OperationResult> in_flight = queue.enqueue(filled(4, 1));
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    std::future<OperationResult> queued_a = queue.enqueue(filled(4, 2));
    std::future<OperationResult> queued_b = queue.enqueue(filled(4, 3));

    queue.clear(OperationResult::DISCONNECTED);
    EXPECT_EQ(OperationResult::DISCONNECTED, queued_a.get());
    EXPECT_EQ(OperationResult::DISCONNECTED, queued_b.get());

    sink.release();
    EXPECT_EQ(OperationResult::SUCCESS, in_flight.get());
    EXPECT_EQ(0u, queue.depth());
    EXPECT_EQ(2u, queue.stats().cancelled);
}

TEST(WriteQueue, EnqueueAfterStopIsCancelled) {
    RecordingWriter sink;
    WriteQueue queue(sink.writer());
    queue.stop();
    EXPECT_EQ(OperationResult::CANCELLED, queue.enqueue(filled(4, 1)).get());
    EXPECT_TRUE(sink.frames().empty());
}

TEST(WriteQueue, OversizedPayloadIsRejected) {
    RecordingWriter sink;
    WriteQueue queue(sink.writer());
    EXPECT_EQ(OperationResult::INVALID_ARGUMENT,
              queue.enqueue(filled(Fragment::MAX_PAYLOAD_SIZE + 1, 0)).get());
}
