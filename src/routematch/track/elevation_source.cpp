#include <routematch/track/elevation_source.hpp>

namespace routematch::track {

elevation_source::~elevation_source() = default;

}  // namespace routematch::track
