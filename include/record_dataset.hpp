/*
    Ready-made pipelines for training loops.

    RecordDataset:       one container -> decoder -> [shuffle] -> [transform]
    MultiRecordDataset:  split table -> weighted sampler -> [shuffle] -> [transform]

    Each data loading worker builds its own dataset with its WorkerInfo.
    Nothing is shared between workers.
*/

#pragma once

#include "dataset_config.hpp"
#include "record_source.hpp"
#include "sampler.hpp"

#include <cstdint>
#include <memory>


//------------------------------------------------------------------------------
// WorkerInfo

struct WorkerInfo {
    uint32_t WorkerIndex = 0;
    uint32_t WorkerCount = 1;
};


//------------------------------------------------------------------------------
// RecordDataset

// This is not thread-safe so do not call methods from multiple threads.
class RecordDataset {
public:
    /*
        With an index and WorkerCount > 1 each worker reads its own shard of
        the file.  Without an index every worker reads the whole file.

        The reader seed is replaced by DeriveSeed(seed, data path, worker).
        shuffle_queue_size = 0 disables shuffling.
    */
    bool Start(
        const FileSourceConfig& config,
        uint32_t shuffle_queue_size = 0,
        uint64_t seed = 0,
        const WorkerInfo& worker = WorkerInfo(),
        RecordTransform transform = nullptr);

    void Stop();

    SourceStatus Next(DecodedRecord& record_out);

    // Records this worker will yield in one pass, or 0 if unknown (no index)
    uint64_t GetRecordCount() const { return record_count_; }

private:
    std::unique_ptr<RecordSource> pipeline_;
    uint64_t record_count_ = 0;
};


//------------------------------------------------------------------------------
// MultiRecordDataset

// This is not thread-safe so do not call methods from multiple threads.
class MultiRecordDataset {
public:
    bool Start(
        const DatasetConfig& config,
        const WorkerInfo& worker = WorkerInfo(),
        RecordTransform transform = nullptr);

    void Stop();

    SourceStatus Next(DecodedRecord& record_out);

    // nullptr before Start()
    const MultiSourceSampler* GetSampler() const { return sampler_; }

private:
    std::unique_ptr<RecordSource> pipeline_;

    // Owned by pipeline_
    MultiSourceSampler* sampler_ = nullptr;
};
