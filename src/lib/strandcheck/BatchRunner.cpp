#include "BatchRunner.hpp"

#include "common/Timer.hpp"

#include <boost/bind/bind.hpp>
#include <boost/format.hpp>
#include <boost/thread/thread.hpp>

#include <algorithm>
#include <exception>
#include <memory>

using boost::format;

BEGIN_NAMESPACE(strandcheck)

namespace {
    struct CollectUntil {
        CollectUntil(
                  std::vector<CountSnapshot>& out
                , BatchRunner::StopPredicate const& stop)
            : out(out)
            , stop(stop)
        {}

        bool operator()(CountSnapshot const& snap) const {
            out.push_back(snap);
            return !(stop && stop(snap));
        }

        std::vector<CountSnapshot>& out;
        BatchRunner::StopPredicate const& stop;
    };
}

BatchRunner::BatchRunner(
          AlignmentCountExtractor const& extractor
        , SourceOpener const& open
        , std::size_t n_threads
        , bool incremental // = false
        , std::ostream* log // = 0
        )
    : extractor_(extractor)
    , open_(open)
    , n_threads_(std::max<std::size_t>(n_threads, 1))
    , incremental_(incremental)
    , log_(log)
    , next_(0)
{
}

void BatchRunner::set_stop_predicate(StopPredicate const& stop) {
    stop_ = stop;
}

std::vector<BatchResult> BatchRunner::run(std::vector<std::string> const& paths) {
    std::vector<BatchResult> results(paths.size());
    next_ = 0;

    std::size_t n_workers = std::min(n_threads_, paths.size());
    if (n_workers <= 1) {
        worker(paths, results);
        return results;
    }

    boost::thread_group threads;
    for (std::size_t i = 0; i < n_workers; ++i) {
        threads.create_thread(boost::bind(
            &BatchRunner::worker, this, boost::cref(paths), boost::ref(results)));
    }
    threads.join_all();

    return results;
}

bool BatchRunner::claim(std::size_t& idx, std::size_t n) {
    boost::mutex::scoped_lock lock(claim_mutex_);
    if (next_ >= n)
        return false;
    idx = next_++;
    return true;
}

void BatchRunner::worker(
          std::vector<std::string> const& paths
        , std::vector<BatchResult>& results
        )
{
    std::size_t idx = 0;
    while (claim(idx, paths.size())) {
        BatchResult& result = results[idx];
        result.path = paths[idx];
        try {
            process(paths[idx], result);
        }
        catch (std::exception const& e) {
            result.failed = true;
            result.error = e.what();
        }
    }
}

void BatchRunner::process(std::string const& path, BatchResult& result) {
    log(str(format("Processing %1%\n") % path));
    SteadyTimer timer;

    std::unique_ptr<IAlignmentRecordSource> src(open_(path));
    if (incremental_) {
        extractor_.count_blocks(*src, CollectUntil(result.snapshots, stop_));
    }
    else {
        result.snapshots.push_back(extractor_.count_all(*src));
    }

    result.seconds = timer.seconds();

    if (!result.snapshots.empty()) {
        CountSnapshot const& last = result.snapshots.back();
        log(str(format("%1%: %2% reads (%3% forward, %4% reverse) in %5$.2fs\n")
            % path % last.total % last.fwd % last.rev % result.seconds));
        if (last.informative() == 0) {
            log(str(format("Warning: %1% has no primary alignments passing "
                "the quality filter\n") % path));
        }
    }
}

void BatchRunner::log(std::string const& msg) {
    if (!log_)
        return;
    boost::mutex::scoped_lock lock(log_mutex_);
    *log_ << msg << std::flush;
}

END_NAMESPACE(strandcheck)
