#pragma once

#include "AlignmentCountExtractor.hpp"
#include "CountSnapshot.hpp"

#include "common/IAlignmentRecordSource.hpp"
#include "common/namespace.hpp"

#include <boost/function.hpp>
#include <boost/thread/mutex.hpp>

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

BEGIN_NAMESPACE(strandcheck)

struct BatchResult {
    BatchResult()
        : failed(false)
        , seconds(0.0)
    {}

    std::string path;
    std::vector<CountSnapshot> snapshots;
    bool failed;
    std::string error;
    double seconds;
};

// Runs one extraction pass per input on a fixed pool of worker threads.
// Each input writes only its own result slot, so results need no locking.
class BatchRunner {
public:
    // Returns a newly allocated source; the runner takes ownership.
    typedef boost::function<IAlignmentRecordSource* (std::string const&)> SourceOpener;
    // Returns true when incremental extraction can stop after snap.
    typedef boost::function<bool (CountSnapshot const&)> StopPredicate;

    BatchRunner(
          AlignmentCountExtractor const& extractor
        , SourceOpener const& open
        , std::size_t n_threads
        , bool incremental = false
        , std::ostream* log = 0
        );

    void set_stop_predicate(StopPredicate const& stop);

    std::vector<BatchResult> run(std::vector<std::string> const& paths);

private:
    void process(std::string const& path, BatchResult& result);
    void worker(std::vector<std::string> const& paths, std::vector<BatchResult>& results);
    bool claim(std::size_t& idx, std::size_t n);
    void log(std::string const& msg);

private:
    AlignmentCountExtractor const& extractor_;
    SourceOpener open_;
    std::size_t n_threads_;
    bool incremental_;
    std::ostream* log_;
    StopPredicate stop_;

    boost::mutex claim_mutex_;
    boost::mutex log_mutex_;
    std::size_t next_;
};

END_NAMESPACE(strandcheck)
