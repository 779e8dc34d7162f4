#include "record_dataset.hpp"

#include "shuffle_buffer.hpp"
#include "tools.hpp"

#include <unistd.h>


//------------------------------------------------------------------------------
// Tools

static std::unique_ptr<RecordSource> WrapPipeline(
    std::unique_ptr<RecordSource> source,
    uint32_t shuffle_queue_size,
    uint64_t shuffle_seed,
    RecordTransform transform)
{
    if (shuffle_queue_size > 0) {
        source.reset(new ShuffledRecordSource(std::move(source), shuffle_queue_size, shuffle_seed));
    }
    if (transform) {
        source.reset(new TransformSource(std::move(source), std::move(transform)));
    }
    return source;
}

static bool CheckWorkerInfo(const WorkerInfo& worker)
{
    if (worker.WorkerCount == 0 || worker.WorkerIndex >= worker.WorkerCount) {
        LOG_ERROR() << "Invalid worker " << worker.WorkerIndex << " of " << worker.WorkerCount;
        return false;
    }
    return true;
}


//------------------------------------------------------------------------------
// RecordDataset

bool RecordDataset::Start(
    const FileSourceConfig& config,
    uint32_t shuffle_queue_size,
    uint64_t seed,
    const WorkerInfo& worker,
    RecordTransform transform)
{
    Stop();

    if (!CheckWorkerInfo(worker)) {
        return false;
    }

    FileSourceConfig worker_config = config;
    worker_config.Reader.Seed = DeriveSeed(seed, config.Reader.DataPath, worker.WorkerIndex);

    if (worker.WorkerCount > 1) {
        if (!config.Reader.IndexPath.empty()) {
            worker_config.Reader.ShardIndex = worker.WorkerIndex;
            worker_config.Reader.ShardCount = worker.WorkerCount;
        } else {
            LOG_WARN() << "No index for " << config.Reader.DataPath
                << ": each of " << worker.WorkerCount << " workers reads the whole file";
        }
    }

    std::unique_ptr<FileRecordSource> file_source(new FileRecordSource);
    if (!file_source->Open(worker_config)) {
        LOG_ERROR() << "RecordDataset: Failed to open " << config.Reader.DataPath;
        return false;
    }
    record_count_ = file_source->GetReader().GetPassRecordCount();

    const uint64_t shuffle_seed = DeriveSeed(seed ^ 1, config.Reader.DataPath, worker.WorkerIndex);
    pipeline_ = WrapPipeline(std::move(file_source), shuffle_queue_size, shuffle_seed, std::move(transform));
    return true;
}

void RecordDataset::Stop()
{
    pipeline_.reset();
    record_count_ = 0;
}

SourceStatus RecordDataset::Next(DecodedRecord& record_out)
{
    if (!pipeline_) {
        LOG_ERROR() << "RecordDataset::Next called before Start";
        return SourceStatus::Error;
    }
    return pipeline_->Next(record_out);
}


//------------------------------------------------------------------------------
// MultiRecordDataset

bool MultiRecordDataset::Start(
    const DatasetConfig& config,
    const WorkerInfo& worker,
    RecordTransform transform)
{
    Stop();

    if (!CheckWorkerInfo(worker)) {
        return false;
    }

    const uint64_t sampler_seed = DeriveSeed(config.seed_, config.data_pattern_, worker.WorkerIndex);
    std::unique_ptr<MultiSourceSampler> sampler(new MultiSourceSampler(config.infinite_, sampler_seed));

    for (const auto& split : config.splits_) {
        FileSourceConfig source_config;
        source_config.Reader.DataPath = FormatSplitPath(config.data_pattern_, split.first);
        if (!config.index_pattern_.empty()) {
            source_config.Reader.IndexPath = FormatSplitPath(config.index_pattern_, split.first);
        }
        source_config.Reader.Compression = config.compression_;
        source_config.Reader.Seed = DeriveSeed(config.seed_, source_config.Reader.DataPath, worker.WorkerIndex);
        source_config.Sequence = config.sequence_;
        source_config.Description = config.description_;
        source_config.SequenceDescription = config.sequence_description_;

        if (access(source_config.Reader.DataPath.c_str(), R_OK) != 0) {
            LOG_ERROR() << "Split '" << split.first << "' has no readable file at " << source_config.Reader.DataPath;
            return false;
        }

        if (!sampler->AddSource(split.first, MakeFileSourceFactory(source_config), split.second)) {
            return false;
        }
    }

    sampler_ = sampler.get();

    const uint64_t shuffle_seed = DeriveSeed(config.seed_ ^ 1, config.data_pattern_, worker.WorkerIndex);
    pipeline_ = WrapPipeline(std::move(sampler), config.shuffle_queue_size_, shuffle_seed, std::move(transform));

    LOG_INFO() << "MultiRecordDataset: Started " << config.splits_.size() << " splits from "
        << config.data_pattern_ << " (worker " << worker.WorkerIndex << "/" << worker.WorkerCount << ")";
    return true;
}

void MultiRecordDataset::Stop()
{
    pipeline_.reset();
    sampler_ = nullptr;
}

SourceStatus MultiRecordDataset::Next(DecodedRecord& record_out)
{
    if (!pipeline_) {
        LOG_ERROR() << "MultiRecordDataset::Next called before Start";
        return SourceStatus::Error;
    }
    return pipeline_->Next(record_out);
}
