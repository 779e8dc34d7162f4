/*
    Weighted interleaving of several record streams.

    Each pull draws one source with probability proportional to its weight
    and returns that source's next record.

    Infinite mode: an exhausted source is reopened through its factory, so the
    mixture ratio never changes and the stream never ends.  This is the mode
    for continuous training.

    Finite mode: an exhausted source is dropped and the remaining weights are
    renormalized before the next draw (within the same pull).  The stream
    ends when every source is exhausted, so each underlying record is yielded
    exactly once.
*/

#pragma once

#include "record_source.hpp"

#include <cstdint>
#include <random>
#include <string>
#include <vector>


//------------------------------------------------------------------------------
// MultiSourceSampler

// This is not thread-safe so do not call methods from multiple threads.
class MultiSourceSampler : public RecordSource {
public:
    explicit MultiSourceSampler(bool infinite = true, uint64_t seed = 0);

    // Weight must be positive and finite.  Sources are opened lazily.
    bool AddSource(const std::string& name, RecordSourceFactory factory, double weight);

    /*
        A source that fails (cannot be opened, or reports an error) is removed
        and Error is returned for that pull.  Later pulls continue with the
        remaining sources.
    */
    SourceStatus Next(DecodedRecord& record_out) override;

    size_t GetActiveSourceCount() const { return sources_.size(); }

    // Records yielded so far from the named source, across removals
    uint64_t GetYieldCount(const std::string& name) const;

private:
    struct SourceState {
        std::string Name;
        RecordSourceFactory Factory;
        double Weight = 0.0;

        std::unique_ptr<RecordSource> Stream;

        // Records yielded by the current Stream
        uint64_t StreamYield = 0;
    };

    bool infinite_ = true;
    std::mt19937_64 rng_;

    std::vector<SourceState> sources_;
    std::discrete_distribution<size_t> distribution_;

    std::vector<std::pair<std::string, uint64_t>> yield_counts_;

    void RebuildDistribution();
    void RemoveSource(size_t source_index);
    void CountYield(const std::string& name);
    bool OpenStream(SourceState& source);
};
