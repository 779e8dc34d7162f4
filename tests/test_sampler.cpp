#include "sampler.hpp"

#include "tools.hpp"

#include <cmath>
#include <limits>
#include <set>
#include <string>
#include <vector>

// Yields records {"id": [base + i]} for i in [0, count)
class CountingSource : public RecordSource {
public:
    CountingSource(int64_t base, int64_t count, bool fail_at_end = false)
        : base_(base)
        , count_(count)
        , fail_at_end_(fail_at_end)
    {
    }

    SourceStatus Next(DecodedRecord& record_out) override {
        if (next_ >= count_) {
            return fail_at_end_ ? SourceStatus::Error : SourceStatus::Exhausted;
        }
        record_out.Clear();
        record_out.Features["id"] = FeatureValue::FromInts({base_ + next_});
        ++next_;
        return SourceStatus::Ok;
    }

private:
    int64_t base_ = 0;
    int64_t count_ = 0;
    int64_t next_ = 0;
    bool fail_at_end_ = false;
};

static RecordSourceFactory MakeCountingFactory(int64_t base, int64_t count, bool fail_at_end = false)
{
    return [base, count, fail_at_end]() -> std::unique_ptr<RecordSource> {
        return std::unique_ptr<RecordSource>(new CountingSource(base, count, fail_at_end));
    };
}

bool TestRejectsBadWeights() {
    MultiSourceSampler sampler;

    const double bad_weights[] = {
        0.0, -1.0,
        std::numeric_limits<double>::quiet_NaN(),
        std::numeric_limits<double>::infinity()
    };
    for (double weight : bad_weights) {
        if (sampler.AddSource("bad", MakeCountingFactory(0, 1), weight)) {
            LOG_ERROR() << "TestRejectsBadWeights: Accepted weight " << weight;
            return false;
        }
    }
    if (sampler.AddSource("no_factory", RecordSourceFactory(), 1.0)) {
        LOG_ERROR() << "TestRejectsBadWeights: Accepted a missing factory";
        return false;
    }
    if (sampler.GetActiveSourceCount() != 0) {
        LOG_ERROR() << "TestRejectsBadWeights: Rejected sources were kept";
        return false;
    }

    LOG_INFO() << "TestRejectsBadWeights: Passed";
    return true;
}

bool TestFiniteYieldsEachRecordOnce() {
    MultiSourceSampler sampler(false, 42);
    sampler.AddSource("a", MakeCountingFactory(0, 1000), 0.8);
    sampler.AddSource("b", MakeCountingFactory(1000, 1000), 0.2);

    std::set<int64_t> seen;
    DecodedRecord record;
    for (;;) {
        SourceStatus status = sampler.Next(record);
        if (status == SourceStatus::Exhausted) {
            break;
        }
        if (status != SourceStatus::Ok) {
            LOG_ERROR() << "TestFiniteYieldsEachRecordOnce: Unexpected " << SourceStatusToString(status);
            return false;
        }
        if (!seen.insert(record.Features["id"].Ints[0]).second) {
            LOG_ERROR() << "TestFiniteYieldsEachRecordOnce: Record yielded twice";
            return false;
        }
    }

    if (seen.size() != 2000 || *seen.begin() != 0 || *seen.rbegin() != 1999) {
        LOG_ERROR() << "TestFiniteYieldsEachRecordOnce: Expected 2000 distinct records, got " << seen.size();
        return false;
    }
    if (sampler.GetYieldCount("a") != 1000 || sampler.GetYieldCount("b") != 1000) {
        LOG_ERROR() << "TestFiniteYieldsEachRecordOnce: Wrong per-source yield counts";
        return false;
    }
    if (sampler.Next(record) != SourceStatus::Exhausted || sampler.GetActiveSourceCount() != 0) {
        LOG_ERROR() << "TestFiniteYieldsEachRecordOnce: Stream should stay exhausted";
        return false;
    }

    LOG_INFO() << "TestFiniteYieldsEachRecordOnce: Passed";
    return true;
}

bool TestInfiniteRatio() {
    MultiSourceSampler sampler(true, 7);
    sampler.AddSource("a", MakeCountingFactory(0, 100), 0.8);
    sampler.AddSource("b", MakeCountingFactory(1000, 100), 0.2);

    const int pulls = 10000;
    int from_a = 0;
    DecodedRecord record;
    for (int i = 0; i < pulls; ++i) {
        if (sampler.Next(record) != SourceStatus::Ok) {
            LOG_ERROR() << "TestInfiniteRatio: Infinite stream ended at pull " << i;
            return false;
        }
        if (record.Features["id"].Ints[0] < 1000) {
            ++from_a;
        }
    }

    const double ratio = from_a / (double)pulls;
    if (std::fabs(ratio - 0.8) > 0.03) {
        LOG_ERROR() << "TestInfiniteRatio: Source a ratio " << ratio << " is far from 0.8";
        return false;
    }
    if (sampler.GetActiveSourceCount() != 2) {
        LOG_ERROR() << "TestInfiniteRatio: A cycling source was dropped";
        return false;
    }

    LOG_INFO() << "TestInfiniteRatio: Passed (ratio " << ratio << ")";
    return true;
}

bool TestInfiniteDropsEmptySource() {
    MultiSourceSampler sampler(true, 3);
    sampler.AddSource("empty", MakeCountingFactory(0, 0), 1.0);
    sampler.AddSource("full", MakeCountingFactory(0, 5), 1.0);

    DecodedRecord record;
    for (int i = 0; i < 50; ++i) {
        if (sampler.Next(record) != SourceStatus::Ok) {
            LOG_ERROR() << "TestInfiniteDropsEmptySource: Pull " << i << " failed";
            return false;
        }
    }
    if (sampler.GetActiveSourceCount() != 1 || sampler.GetYieldCount("full") != 50) {
        LOG_ERROR() << "TestInfiniteDropsEmptySource: Empty source was not removed";
        return false;
    }

    LOG_INFO() << "TestInfiniteDropsEmptySource: Passed";
    return true;
}

bool TestFailingSourceIsRemoved() {
    MultiSourceSampler sampler(false, 11);
    sampler.AddSource("unopenable", []() { return std::unique_ptr<RecordSource>(); }, 1.0);
    sampler.AddSource("corrupt", MakeCountingFactory(100, 3, true), 1.0);
    sampler.AddSource("good", MakeCountingFactory(0, 20), 1.0);

    int ok_count = 0, error_count = 0;
    DecodedRecord record;
    for (;;) {
        SourceStatus status = sampler.Next(record);
        if (status == SourceStatus::Exhausted) {
            break;
        }
        if (status == SourceStatus::Error) {
            ++error_count;
        } else {
            ++ok_count;
        }
        if (ok_count + error_count > 1000) {
            LOG_ERROR() << "TestFailingSourceIsRemoved: Stream never ended";
            return false;
        }
    }

    if (error_count != 2) {
        LOG_ERROR() << "TestFailingSourceIsRemoved: Expected 2 errors, got " << error_count;
        return false;
    }
    if (sampler.GetYieldCount("good") != 20) {
        LOG_ERROR() << "TestFailingSourceIsRemoved: Good source did not finish";
        return false;
    }
    if (ok_count != 20 + (int)sampler.GetYieldCount("corrupt")) {
        LOG_ERROR() << "TestFailingSourceIsRemoved: Yield accounting mismatch";
        return false;
    }

    LOG_INFO() << "TestFailingSourceIsRemoved: Passed";
    return true;
}

bool TestSeedIsDeterministic() {
    std::vector<int64_t> runs[2];
    for (int run = 0; run < 2; ++run) {
        MultiSourceSampler sampler(true, 1234);
        sampler.AddSource("a", MakeCountingFactory(0, 10), 1.0);
        sampler.AddSource("b", MakeCountingFactory(100, 10), 3.0);

        DecodedRecord record;
        for (int i = 0; i < 200; ++i) {
            sampler.Next(record);
            runs[run].push_back(record.Features["id"].Ints[0]);
        }
    }
    if (runs[0] != runs[1]) {
        LOG_ERROR() << "TestSeedIsDeterministic: Same seed gave different streams";
        return false;
    }

    LOG_INFO() << "TestSeedIsDeterministic: Passed";
    return true;
}

int main() {
    if (!TestRejectsBadWeights()) {
        return -1;
    }
    if (!TestFiniteYieldsEachRecordOnce()) {
        return -1;
    }
    if (!TestInfiniteRatio()) {
        return -1;
    }
    if (!TestInfiniteDropsEmptySource()) {
        return -1;
    }
    if (!TestFailingSourceIsRemoved()) {
        return -1;
    }
    if (!TestSeedIsDeterministic()) {
        return -1;
    }

    LOG_INFO() << "All tests passed";
    return 0;
}
