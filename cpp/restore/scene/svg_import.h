#pragma once

#include "restore/core/types.h"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace restore {

// One drawable element of an imported SVG document.
struct SvgShape {
    std::string element;        // "path", "rect", "circle", ...
    std::string id;
    std::string pathData;       // "d" for paths, "points" for polygons/polylines
    BoundingBox bounds;         // in SVG user units
    std::optional<Color> fill;
    std::optional<Color> stroke;
    std::optional<float> strokeWidth;
    bool fillNone = false;      // fill="none"
    bool strokeNone = false;    // stroke="none"
};

struct SvgImage {
    float width;
    float height;
    std::vector<SvgShape> shapes; // document order, groups flattened
};

// Parses vector markup with libxml2. Returns nullopt when the markup is not
// well-formed XML or its root element is not <svg>.
std::optional<SvgImage> parseSvgMarkup(std::string_view markup);

// "#rgb" / "#rrggbb" colors; "none" and anything else yield nullopt.
std::optional<Color> parseSvgColor(std::string_view value);

} // namespace restore
