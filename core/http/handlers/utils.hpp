#pragma once

#include <httplib.h>

#include <cstdint>
#include <stdexcept>
#include <string>

namespace greenhouse {
namespace http {

// Helper: Parse the plant id from the first regex capture
// Fails for ids that do not fit in int64 (treated as not found by callers).
inline bool parse_plant_id(const httplib::Request &req, int64_t &id) {
    if (req.matches.size() < 2) {
        return false;
    }
    try {
        id = std::stoll(req.matches[1].str());
    } catch (const std::out_of_range &) {
        return false;
    } catch (const std::invalid_argument &) {
        return false;
    }
    return true;
}

}  // namespace http
}  // namespace greenhouse
