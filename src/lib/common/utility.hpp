#pragma once

#include <boost/format.hpp>

#include <istream>
#include <string>
#include <utility>
#include <vector>

inline
std::vector<std::string> read_lines(std::istream& s) {
    std::vector<std::string> rv;
    std::string line;
    while (std::getline(s, line))
        rv.push_back(std::move(line));
    return rv;
}

inline
bool ends_with(std::string const& s, std::string const& suffix) {
    return s.size() >= suffix.size()
        && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Render a read count the way block labels are written: 2000000 -> "2M",
// 250000 -> "250K", anything not a whole multiple of 1000 as is.
template<typename T>
std::string compact_count(T n) {
    if (n != 0 && n % 1000000 == 0)
        return str(boost::format("%1%M") % (n / 1000000));
    if (n != 0 && n % 1000 == 0)
        return str(boost::format("%1%K") % (n / 1000));
    return str(boost::format("%1%") % n);
}
