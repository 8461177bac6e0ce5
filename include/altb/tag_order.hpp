#pragma once

/**
 * @file tag_order.hpp
 * @brief Natural, version-aware ordering of tags
 *
 * Tags are compared the way users read version numbers: "2.7" < "3.8" < "10.0".
 * A tag is read as a sequence of tokens compared left to right:
 *
 *   '-'  <  end of tag  <  digit run (by value)  <  any other byte (by value)
 *
 * so pre-releases sort before their release ("1.0.0-rc.1" < "1.0.0"), a
 * prefix sorts before its extensions ("3.8" < "3.8.1") and numbers sort
 * before words ("1" < "a"). Tags equal under this key ("01" and "1") fall
 * back to byte order, which makes the order total.
 */

#include <string>
#include <vector>

namespace altb {

/// Three-way natural comparison: negative, zero or positive
int compare_tags(const std::string& a, const std::string& b);

/// Strict weak ordering for std::sort
struct TagLess {
    bool operator()(const std::string& a, const std::string& b) const {
        return compare_tags(a, b) < 0;
    }
};

/// Sort tags in place with TagLess
void sort_tags(std::vector<std::string>& tags);

} // namespace altb
