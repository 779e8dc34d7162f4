#include "sampler.hpp"

#include "tools.hpp"

#include <cmath>


//------------------------------------------------------------------------------
// MultiSourceSampler

MultiSourceSampler::MultiSourceSampler(bool infinite, uint64_t seed)
    : infinite_(infinite)
    , rng_(seed)
{
}

bool MultiSourceSampler::AddSource(const std::string& name, RecordSourceFactory factory, double weight)
{
    if (!factory) {
        LOG_ERROR() << "MultiSourceSampler: Source '" << name << "' has no stream factory";
        return false;
    }
    if (!(weight > 0.0) || !std::isfinite(weight)) {
        LOG_ERROR() << "MultiSourceSampler: Source '" << name << "' has invalid weight " << weight
            << ": weights must be positive";
        return false;
    }

    SourceState source;
    source.Name = name;
    source.Factory = std::move(factory);
    source.Weight = weight;
    sources_.push_back(std::move(source));

    RebuildDistribution();
    return true;
}

void MultiSourceSampler::RebuildDistribution()
{
    // discrete_distribution normalizes the weights itself
    std::vector<double> weights;
    weights.reserve(sources_.size());
    for (const auto& source : sources_) {
        weights.push_back(source.Weight);
    }
    distribution_ = std::discrete_distribution<size_t>(weights.begin(), weights.end());
}

void MultiSourceSampler::RemoveSource(size_t source_index)
{
    sources_.erase(sources_.begin() + source_index);
    RebuildDistribution();
}

void MultiSourceSampler::CountYield(const std::string& name)
{
    for (auto& count : yield_counts_) {
        if (count.first == name) {
            count.second++;
            return;
        }
    }
    yield_counts_.emplace_back(name, 1);
}

uint64_t MultiSourceSampler::GetYieldCount(const std::string& name) const
{
    for (const auto& count : yield_counts_) {
        if (count.first == name) {
            return count.second;
        }
    }
    return 0;
}

bool MultiSourceSampler::OpenStream(SourceState& source)
{
    source.Stream = source.Factory();
    source.StreamYield = 0;
    if (!source.Stream) {
        LOG_ERROR() << "MultiSourceSampler: Failed to open source '" << source.Name << "'";
        return false;
    }
    return true;
}

SourceStatus MultiSourceSampler::Next(DecodedRecord& record_out)
{
    while (!sources_.empty()) {
        const size_t source_index = distribution_(rng_);
        SourceState& source = sources_[source_index];

        if (!source.Stream && !OpenStream(source)) {
            RemoveSource(source_index);
            return SourceStatus::Error;
        }

        SourceStatus status = source.Stream->Next(record_out);

        if (status == SourceStatus::Exhausted && infinite_ && source.StreamYield > 0) {
            // Cycle: start the source over and pull again
            LOG_DEBUG() << "MultiSourceSampler: Restarting source '" << source.Name
                << "' after " << source.StreamYield << " records";
            if (!OpenStream(source)) {
                RemoveSource(source_index);
                return SourceStatus::Error;
            }
            status = source.Stream->Next(record_out);
        }

        if (status == SourceStatus::Ok) {
            source.StreamYield++;
            CountYield(source.Name);
            return SourceStatus::Ok;
        }

        if (status == SourceStatus::Error) {
            LOG_ERROR() << "MultiSourceSampler: Removing source '" << source.Name << "' after a stream error";
            RemoveSource(source_index);
            return SourceStatus::Error;
        }

        // Exhausted.  In infinite mode this only happens for a source with no
        // records at all, which could never contribute anything.
        if (infinite_) {
            LOG_WARN() << "MultiSourceSampler: Source '" << source.Name << "' is empty; removing it";
        } else {
            LOG_DEBUG() << "MultiSourceSampler: Source '" << source.Name << "' exhausted after "
                << source.StreamYield << " records";
        }
        RemoveSource(source_index);
    }

    return SourceStatus::Exhausted;
}
