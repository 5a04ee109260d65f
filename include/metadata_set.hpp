//
//  metadata_set.hpp
//  Chaptify
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>

namespace chaptify {

/**
 * @brief Embedded tag fields read from the input container's ilst.
 *
 * Fields are UTF-8 and empty when absent.
 */
struct MetadataSet {
    std::string title;         ///< ©nam
    std::string artist;        ///< ©ART (author)
    std::string album_artist;  ///< aART
    std::string album;         ///< ©alb

    /// Author as used for identity: artist, falling back to album artist.
    const std::string &author() const { return artist.empty() ? album_artist : artist; }
};

}  // namespace chaptify
