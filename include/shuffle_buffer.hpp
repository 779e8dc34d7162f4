/*
    Bounded-window shuffle.

    Holds at most queue_size items.  After the initial fill, each output is a
    uniformly random slot which is immediately refilled from upstream.  Once
    upstream runs dry the remaining slots drain in random order.

    This is not a global shuffle: an item can only move about queue_size
    positions from where it entered, and memory is proportional to
    queue_size rather than to the stream length.
*/

#pragma once

#include "record_source.hpp"
#include "tools.hpp"

#include <cstdint>
#include <functional>
#include <random>
#include <utility>
#include <vector>


//------------------------------------------------------------------------------
// ShuffleBuffer

template<typename T>
class ShuffleBuffer {
public:
    using PullFn = std::function<SourceStatus(T& item)>;

    ShuffleBuffer(size_t queue_size, uint64_t seed)
        : queue_size_(queue_size > 0 ? queue_size : 1)
        , rng_(seed)
    {
        buffer_.reserve(queue_size_);
    }

    /*
        Ok: item_out holds the next item.
        Exhausted: upstream is done and the buffer is drained.
        Error: upstream failed.  Buffered items are kept and the next call
        pulls from upstream again.
    */
    SourceStatus Next(const PullFn& pull, T& item_out)
    {
        if (!filled_) {
            while (buffer_.size() < queue_size_) {
                T item;
                SourceStatus status = pull(item);
                if (status == SourceStatus::Error) {
                    return status;
                }
                if (status == SourceStatus::Exhausted) {
                    upstream_done_ = true;
                    underfilled_ = true;
                    LOG_WARN() << "Number of elements in the stream is less than the queue size (N="
                        << queue_size_ << "): shuffling " << buffer_.size() << " elements";
                    break;
                }
                buffer_.push_back(std::move(item));
            }
            filled_ = true;
        }

        if (buffer_.empty()) {
            return SourceStatus::Exhausted;
        }

        std::uniform_int_distribution<size_t> pick(0, buffer_.size() - 1);
        const size_t index = pick(rng_);

        if (!upstream_done_) {
            T incoming;
            SourceStatus status = pull(incoming);
            if (status == SourceStatus::Error) {
                return status;
            }
            if (status == SourceStatus::Ok) {
                item_out = std::move(buffer_[index]);
                buffer_[index] = std::move(incoming);
                return SourceStatus::Ok;
            }
            upstream_done_ = true;
        }

        // Draining: order among the remaining slots is already random
        item_out = std::move(buffer_[index]);
        if (index != buffer_.size() - 1) {
            buffer_[index] = std::move(buffer_.back());
        }
        buffer_.pop_back();
        return SourceStatus::Ok;
    }

    size_t GetQueueSize() const { return queue_size_; }
    size_t GetBufferedCount() const { return buffer_.size(); }

    // True if upstream ran out before the buffer first filled
    bool WasUnderfilled() const { return underfilled_; }

private:
    size_t queue_size_ = 1;
    std::vector<T> buffer_;
    std::mt19937_64 rng_;

    bool filled_ = false;
    bool upstream_done_ = false;
    bool underfilled_ = false;
};


//------------------------------------------------------------------------------
// ShuffledRecordSource

class ShuffledRecordSource : public RecordSource {
public:
    ShuffledRecordSource(std::unique_ptr<RecordSource> upstream, size_t queue_size, uint64_t seed)
        : upstream_(std::move(upstream))
        , buffer_(queue_size, seed)
    {
    }

    SourceStatus Next(DecodedRecord& record_out) override {
        RecordSource* upstream = upstream_.get();
        return buffer_.Next([upstream](DecodedRecord& record) {
            return upstream->Next(record);
        }, record_out);
    }

    bool WasUnderfilled() const { return buffer_.WasUnderfilled(); }

private:
    std::unique_ptr<RecordSource> upstream_;
    ShuffleBuffer<DecodedRecord> buffer_;
};
