#include "core/OutputQueue.h"

#include <algorithm>
#include <cmath>
#include <cstring>

namespace loopah {

OutputQueue::OutputQueue(int blockFrames, int capacityBlocks, int maxChannels)
    : blockFrames_(std::max(blockFrames, 1))
    , capacity_(std::max(capacityBlocks, 1))
    , maxChannels_(std::max(maxChannels, 1))
    , blocks_(static_cast<size_t>(capacity_ + 1))
{
    for (auto& block : blocks_) {
        block.samples.assign(static_cast<size_t>(blockFrames_ * maxChannels_), 0.0f);
    }
}

OutputBlock* OutputQueue::beginWrite() {
    const size_t head = head_.load(std::memory_order_relaxed);
    if (next(head) == tail_.load(std::memory_order_acquire))
        return nullptr; // full
    OutputBlock& block = blocks_[head];
    block.frames = 0;
    block.channels = 0;
    return &block;
}

void OutputQueue::commitWrite() {
    const size_t head = head_.load(std::memory_order_relaxed);
    blocks_[head].generation = generation_.load(std::memory_order_relaxed);
    head_.store(next(head), std::memory_order_release);
}

void OutputQueue::flush() {
    generation_.fetch_add(1, std::memory_order_acq_rel);
}

int OutputQueue::read(float* const* outputs, int numOutputChannels, int numFrames) {
    if (numFrames <= 0) return 0;
    if (outputs == nullptr) numOutputChannels = 0;

    int filled = 0;

    while (filled < numFrames) {
        const size_t tail = tail_.load(std::memory_order_relaxed);
        if (tail == head_.load(std::memory_order_acquire))
            break; // empty

        // Reloaded per block: a flush and a fresh commit can land mid-read
        const uint64_t generation = generation_.load(std::memory_order_acquire);
        const OutputBlock& block = blocks_[tail];
        if (block.generation < generation || block.frames <= 0 || block.channels <= 0) {
            // Rendered before a discontinuity
            readOffset_ = 0;
            tail_.store(next(tail), std::memory_order_release);
            continue;
        }

        const int count = std::min(block.frames - readOffset_, numFrames - filled);
        copyOut(block, readOffset_, count, outputs, numOutputChannels, filled);
        readOffset_ += count;
        filled += count;
        playhead_.store(playheadFor(block, readOffset_), std::memory_order_relaxed);

        if (readOffset_ >= block.frames) {
            readOffset_ = 0;
            tail_.store(next(tail), std::memory_order_release);
        }
    }

    if (filled < numFrames) {
        for (int ch = 0; ch < numOutputChannels; ++ch) {
            if (outputs[ch] == nullptr) continue;
            std::memset(outputs[ch] + filled, 0,
                        sizeof(float) * static_cast<size_t>(numFrames - filled));
        }
        if (expectingAudio_.load(std::memory_order_relaxed)) {
            underruns_.fetch_add(1, std::memory_order_relaxed);
        }
    }
    return filled;
}

int OutputQueue::queuedBlocks() const {
    const size_t head = head_.load(std::memory_order_acquire);
    const size_t tail = tail_.load(std::memory_order_acquire);
    const size_t slots = blocks_.size();
    return static_cast<int>((head + slots - tail) % slots);
}

bool OutputQueue::full() const {
    return next(head_.load(std::memory_order_acquire)) == tail_.load(std::memory_order_acquire);
}

void OutputQueue::copyOut(const OutputBlock& block, int offset, int count,
                          float* const* outputs, int numOutputChannels, int destOffset) {
    const int channels = block.channels;
    const float* src = block.samples.data() + static_cast<size_t>(offset * channels);

    for (int ch = 0; ch < numOutputChannels; ++ch) {
        float* dest = outputs[ch];
        if (dest == nullptr) continue;
        dest += destOffset;

        if (channels == 1) {
            // Mono asset feeds every device channel
            std::memcpy(dest, src, sizeof(float) * static_cast<size_t>(count));
        } else if (ch < channels) {
            for (int i = 0; i < count; ++i) {
                dest[i] = src[i * channels + ch];
            }
        } else {
            std::memset(dest, 0, sizeof(float) * static_cast<size_t>(count));
        }
    }
}

double OutputQueue::playheadFor(const OutputBlock& block, int offset) {
    double position = block.sourcePosition + static_cast<double>(offset) * block.sourceStep;
    if (block.loopEnd > block.loopStart && position >= static_cast<double>(block.loopEnd)) {
        const double start = static_cast<double>(block.loopStart);
        position = start + std::fmod(position - start,
                                     static_cast<double>(block.loopEnd - block.loopStart));
    }
    return position;
}

} // namespace loopah
