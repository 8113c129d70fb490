#include "snapbucket/transfer/object_key.hpp"

#include <cctype>
#include <ctime>
#include <stdexcept>

namespace snapbucket {

namespace {

std::string format_utc(std::chrono::system_clock::time_point tp, const char* fmt) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[64];
    size_t n = std::strftime(buf, sizeof(buf), fmt, &tm);
    return std::string(buf, n);
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

std::string format_utc_offset(std::chrono::system_clock::time_point tp) {
    return format_utc(tp, "%Y-%m-%dT%H:%M:%S+00:00");
}

std::string format_utc_seconds(std::chrono::system_clock::time_point tp) {
    return format_utc(tp, "%Y-%m-%dT%H:%M:%S");
}

std::string ObjectKey::single() const {
    return base + (gzip ? ".tar.gz" : ".tar");
}

std::string ObjectKey::part(int number) const {
    return base + "-part" + std::to_string(number) + (gzip ? ".tar.gz" : ".tar");
}

std::string ObjectKey::content_type() const {
    return gzip ? "application/gzip" : "application/x-tar";
}

ObjectKey make_object_key(const Snapshot& snapshot,
                          std::chrono::system_clock::time_point unit_start, bool gzip) {
    std::string name = snapshot.name;
    for (auto& c : name) {
        if (c == ' ') c = '+';
        else if (c == '/') c = '_';
    }

    ObjectKey key;
    key.base = "snap/" + name + "/" + snapshot.id + "-" + format_utc_offset(snapshot.created) +
               "-" + format_utc_seconds(unit_start);
    key.gzip = gzip;
    return key;
}

bool is_gzip_key(const std::string& key) {
    return ends_with(key, ".tar.gz");
}

int split_part_number(const std::string& key) {
    std::string stem;
    if (ends_with(key, ".tar.gz")) stem = key.substr(0, key.size() - 7);
    else if (ends_with(key, ".tar")) stem = key.substr(0, key.size() - 4);
    else return 0;

    size_t digits = stem.size();
    while (digits > 0 && std::isdigit(static_cast<unsigned char>(stem[digits - 1]))) --digits;
    if (digits == stem.size() || digits < 5 || stem.compare(digits - 5, 5, "-part") != 0) {
        return 0;
    }
    try {
        return std::stoi(stem.substr(digits));
    } catch (const std::exception&) {
        return 0;
    }
}

}  // namespace snapbucket
