#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace loopah {

/// One chunk of finished, pitch-corrected audio waiting for the device.
struct OutputBlock {
    std::vector<float> samples;   // Interleaved, sized blockFrames * maxChannels
    int frames = 0;               // Valid frames
    int channels = 0;

    // Source position of the first frame as heard and
    // the source frames covered per output frame. Used for the playhead.
    double sourcePosition = 0.0;
    double sourceStep = 1.0;
    int64_t loopStart = 0;        // Active loop while rendering (start == end: none)
    int64_t loopEnd = 0;

    uint64_t generation = 0;
};

/// Bounded single-producer single-consumer queue of OutputBlocks.
///
/// The render thread fills preallocated blocks in place (beginWrite/commitWrite)
/// and the device callback drains them with read(). The consumer side never
/// blocks, allocates or locks.
///
/// flush() bumps the generation counter; the consumer drops any block
/// committed under an older generation, so a seek is heard immediately
/// rather than after the queued audio drains.
class OutputQueue {
public:
    /// @param blockFrames Frames per block
    /// @param capacityBlocks Maximum queued blocks
    /// @param maxChannels Channels reserved per block
    OutputQueue(int blockFrames, int capacityBlocks, int maxChannels);

    OutputQueue(const OutputQueue&) = delete;
    OutputQueue& operator=(const OutputQueue&) = delete;

    // --- Producer (render thread) ---

    /// Next free block, or nullptr if the queue is full.
    /// The block's samples are preallocated; fill them and call commitWrite().
    OutputBlock* beginWrite();

    /// Publish the block returned by beginWrite()
    void commitWrite();

    /// Invalidate everything queued so far
    void flush();

    /// Set the reported playhead directly (after a flush nothing has played yet)
    void setPlayhead(double sourceFrame) { playhead_.store(sourceFrame, std::memory_order_relaxed); }

    /// Whether an empty queue counts as an underrun (true while playing)
    void setExpectingAudio(bool expecting) { expectingAudio_.store(expecting, std::memory_order_relaxed); }

    // --- Consumer (real-time callback) ---

    /// Fill numFrames of planar device output. Missing frames are silence.
    /// outputs[c] may be nullptr for channels the device does not want.
    /// Returns the number of frames that came from queued audio.
    int read(float* const* outputs, int numOutputChannels, int numFrames);

    // --- Queries (any thread) ---

    /// Source frame of the audio most recently handed to the device
    double playhead() const { return playhead_.load(std::memory_order_relaxed); }

    int64_t underrunCount() const { return underruns_.load(std::memory_order_relaxed); }

    /// Number of committed blocks not yet fully consumed
    int queuedBlocks() const;

    /// Approximate frames queued ahead of the device
    int bufferedFrames() const { return queuedBlocks() * blockFrames_; }

    bool full() const;

    int blockFrames() const { return blockFrames_; }
    int capacity() const { return capacity_; }
    int maxChannels() const { return maxChannels_; }
    uint64_t generation() const { return generation_.load(std::memory_order_acquire); }

private:
    size_t next(size_t index) const { return (index + 1) % blocks_.size(); }

    /// Copy frames [offset, offset + count) of a block to the device buffers
    static void copyOut(const OutputBlock& block, int offset, int count,
                        float* const* outputs, int numOutputChannels, int destOffset);

    static double playheadFor(const OutputBlock& block, int offset);

    const int blockFrames_;
    const int capacity_;
    const int maxChannels_;

    std::vector<OutputBlock> blocks_;   // capacity + 1 slots
    std::atomic<size_t> head_{0};       // Written by producer
    std::atomic<size_t> tail_{0};       // Written by consumer
    int readOffset_ = 0;                // Consumer only: frames used of the tail block

    std::atomic<uint64_t> generation_{0};
    std::atomic<double> playhead_{0.0};
    std::atomic<int64_t> underruns_{0};
    std::atomic<bool> expectingAudio_{false};
};

} // namespace loopah
