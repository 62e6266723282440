#pragma once
// Query: request-target decoding for the banner endpoint
//
//   /?category=sport&category=news  ->  path "/", categories {sport, news}
//
// Keys "category" and "category[]" both collect values. Other keys are
// ignored, as are empty values.

#include <string>
#include <vector>

namespace rotator {

struct BannerQuery {
    std::string path;
    std::vector<std::string> categories;
};

// Percent-decoding; '+' becomes a space. Bad escapes are kept literally.
std::string url_decode(const std::string& in);

BannerQuery parse_target(const std::string& target);

} // namespace rotator
