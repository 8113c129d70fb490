#pragma once

#include "snapbucket/compute/volume_control.hpp"

#include <chrono>
#include <string>

namespace snapbucket {

/// Names of the objects holding one snapshot archive:
///   snap/<name>/<snapshot-id>-<created>-<timestamp>{.tar | -partN.tar}[.gz]
struct ObjectKey {
    std::string base;
    bool gzip = false;

    std::string single() const;
    std::string part(int number) const;
    std::string content_type() const;
};

/// `unit_start` is taken once per transfer unit so every split object of
/// the unit shares the same base.
ObjectKey make_object_key(const Snapshot& snapshot,
                          std::chrono::system_clock::time_point unit_start, bool gzip);

// "2024-05-01T12:00:00+00:00"
std::string format_utc_offset(std::chrono::system_clock::time_point tp);
// "2024-05-01T12:00:00"
std::string format_utc_seconds(std::chrono::system_clock::time_point tp);

// N of a "...-partN.tar[.gz]" key, 0 when the key has no split suffix
int split_part_number(const std::string& key);

bool is_gzip_key(const std::string& key);

}  // namespace snapbucket
