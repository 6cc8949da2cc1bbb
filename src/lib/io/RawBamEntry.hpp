#pragma once

#include "common/namespace.hpp"

#include <boost/noncopyable.hpp>

#include <bam.h>

BEGIN_NAMESPACE(strandcheck)

// Owns one bam1_t buffer for the lifetime of a reader. Converts to bam1_t*
// so it can be handed straight to samread().
class RawBamEntry : private boost::noncopyable {
public:
    RawBamEntry();
    ~RawBamEntry();

    operator bam1_t const*() const;
    operator bam1_t*();

    bam1_t const* operator->() const;
    bam1_t* operator->();

private:
    bam1_t* entry;
};

inline
RawBamEntry::RawBamEntry()
    : entry(bam_init1())
{
}

inline
RawBamEntry::~RawBamEntry() {
    bam_destroy1(entry);
    entry = 0;
}

inline
RawBamEntry::operator bam1_t const*() const {
    return entry;
}

inline
RawBamEntry::operator bam1_t*() {
    return entry;
}

inline
bam1_t* RawBamEntry::operator->() {
    return entry;
}

inline
bam1_t const* RawBamEntry::operator->() const {
    return entry;
}

END_NAMESPACE(strandcheck)
