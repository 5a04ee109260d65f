//
//  chapter_marker.hpp
//  Chaptify
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <string>

namespace chaptify {

/// One navigable segment of the container timeline, in milliseconds.
struct ChapterMarker {
    uint32_t index = 0;    ///< Zero-based chapter position
    std::string title;     ///< UTF-8 title
    int64_t start_ms = 0;  ///< Absolute start time in ms
    int64_t end_ms = 0;    ///< Absolute end time in ms (exclusive, > start_ms)
};

}  // namespace chaptify
